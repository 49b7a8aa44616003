#pragma once

#include <string_view>

/**
 * @file classifier.h
 * @brief Decides from a variable name alone whether its value should be masked.
 */

namespace envdebug::redact
{

/**
 * @brief Right-hand boundary policy for a sensitive token.
 *
 * Every token must start at the beginning of the name or right after `_`.
 */
enum class RightBoundary
{
    None,     // token may continue into a longer word (CREDENTIALS)
    Required, // token must be followed by `_` or the end of the name (DB_PASS)
};

/** @brief One entry of the compiled-in sensitivity table. */
struct SensitiveToken
{
    std::string_view token; // upper-case ASCII
    RightBoundary right = RightBoundary::None;
};

/**
 * @brief Return true if `name` contains a sensitive token at a word boundary.
 *
 * Matching is ASCII case-insensitive and words are separated by `_`. Total over
 * any input, including empty and non-ASCII names.
 */
[[nodiscard]] bool is_sensitive(std::string_view name);

} // namespace envdebug::redact
