#include <envdebug/diag/render.h>
#include <sstream>
#include <utility>

namespace envdebug::diag
{
namespace
{

constexpr std::string_view severity_string(Severity s)
{
    switch (s)
    {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Note:
        return "note";
    case Severity::Debug:
        return "debug";
    }
    return "error";
}

} // namespace

std::string render(const Diagnostic& diagnostic, std::string_view program)
{
    std::ostringstream out;
    out << program << ": " << severity_string(diagnostic.severity) << ": " << diagnostic.message
        << "\n";
    for (const auto& note : diagnostic.notes)
    {
        out << "note: " << note << "\n";
    }
    return out.str();
}

Reporter::Reporter(std::ostream& out, std::string program, bool debug)
    : out_(&out), program_(std::move(program)), debug_(debug)
{
}

void Reporter::report(const Diagnostic& diagnostic) const
{
    if (diagnostic.severity == Severity::Debug && !debug_)
    {
        return;
    }
    *out_ << render(diagnostic, program_);
    out_->flush();
}

void Reporter::debug(std::string message) const
{
    report(Diagnostic{.severity = Severity::Debug, .message = std::move(message), .notes = {}});
}

} // namespace envdebug::diag
