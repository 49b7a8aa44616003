#pragma once

#include <envdebug/diag/diagnostic.h>
#include <ostream>
#include <string>
#include <string_view>

namespace envdebug::diag
{

/** @brief Render as `<program>: <severity>: <message>` followed by one `note:` line per note. */
[[nodiscard]] std::string render(const Diagnostic& diagnostic, std::string_view program);

/**
 * @brief Writes rendered diagnostics to a stream, dropping Debug ones unless enabled.
 */
class Reporter
{
  public:
    Reporter(std::ostream& out, std::string program, bool debug);

    void report(const Diagnostic& diagnostic) const;
    void debug(std::string message) const;

  private:
    std::ostream* out_;
    std::string program_;
    bool debug_ = false;
};

} // namespace envdebug::diag
