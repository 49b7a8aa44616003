#pragma once

#include <envdebug/env/environment.h>
#include <string>
#include <string_view>

/**
 * @file redactor.h
 * @brief Masking of sensitive environment values.
 */

namespace envdebug::redact
{

/** @brief Character written in place of every masked letter or digit. */
inline constexpr char kMaskChar = '*';

/**
 * @brief Replace every ASCII letter and digit in `value` with `kMaskChar`.
 *
 * All other bytes keep their position, so the result has the same length.
 */
[[nodiscard]] std::string redact_value(std::string_view value);

/**
 * @brief Build a copy of `env` where values of sensitive names are masked.
 *
 * The key set is preserved and `env` is left untouched.
 */
[[nodiscard]] env::EnvMap build_debug_view(const env::EnvMap& env);

/** @brief Same as above, over a fresh snapshot of the process environment. */
[[nodiscard]] env::EnvMap build_debug_view();

} // namespace envdebug::redact
