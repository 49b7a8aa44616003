#pragma once

#include <string_view>

/**
 * @file cli.h
 * @brief Command-line entry point for the env-debug-mcp binary.
 */

namespace envdebug::cli
{

/** @brief Version string reported by `--version` and the MCP handshake. */
[[nodiscard]] std::string_view version();

/** @brief Run the CLI using argc/argv; returns process exit code. */
int run(int argc, char** argv);

} // namespace envdebug::cli
