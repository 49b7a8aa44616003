#pragma once

#include <map>
#include <string>

/**
 * @file environment.h
 * @brief Point-in-time copies of a process environment.
 */

namespace envdebug::env
{

/** @brief Environment variables keyed by name; names are unique. */
using EnvMap = std::map<std::string, std::string>;

/**
 * @brief Convert an `envp`-style, null-terminated array of `NAME=VALUE` strings.
 *
 * Splits each entry at the first `=`. Entries without `=` are skipped and the
 * first occurrence of a repeated name wins, matching `getenv`. A null `envp`
 * yields an empty map.
 */
[[nodiscard]] EnvMap parse_environ_block(const char* const* envp);

/** @brief Copy the live environment of the current process. Never cached. */
[[nodiscard]] EnvMap snapshot_environment();

} // namespace envdebug::env
