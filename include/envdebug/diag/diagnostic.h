#pragma once

#include <string>
#include <vector>

/**
 * @file diagnostic.h
 * @brief Types for diagnostics (errors, warnings, notes and debug traces) written to stderr.
 */

namespace envdebug::diag
{

/** @brief Severity level for a diagnostic. */
enum class Severity
{
    Error,
    Warning,
    Note,
    Debug,
};

/**
 * @brief A diagnostic message with optional trailing notes.
 *
 * stdout carries the protocol, so every human-readable message goes through a
 * Diagnostic rendered to stderr.
 */
struct Diagnostic
{
    Severity severity = Severity::Error;
    std::string message;
    std::vector<std::string> notes;
};

} // namespace envdebug::diag
