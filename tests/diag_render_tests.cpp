#include <cstdlib>
#include <envdebug/diag/diagnostic.h>
#include <envdebug/diag/render.h>
#include <iostream>
#include <sstream>
#include <string>

static void expect_contains(const std::string& got, const std::string& needle, const char* what)
{
    if (got.find(needle) == std::string::npos)
    {
        std::cerr << "FAIL: " << what << ": expected output to contain: '" << needle << "'\n";
        std::cerr << "Got:\n" << got << "\n";
        std::exit(1);
    }
}

static void expect_empty(const std::string& got, const char* what)
{
    if (!got.empty())
    {
        std::cerr << "FAIL: " << what << ": expected no output, got:\n" << got << "\n";
        std::exit(1);
    }
}

int main()
{
    using namespace envdebug::diag;

    {
        Diagnostic diag;
        diag.severity = Severity::Warning;
        diag.message = "something happened";
        diag.notes.push_back("note 1");

        const std::string out = render(diag, "env-debug-mcp");
        expect_contains(out, "env-debug-mcp: warning: something happened\n", "header");
        expect_contains(out, "note: note 1\n", "note");
    }

    {
        const Diagnostic diag{.severity = Severity::Error, .message = "bad", .notes = {}};
        expect_contains(render(diag, "prog"), "prog: error: bad", "error severity");
    }

    // Debug diagnostics are dropped unless the reporter has debug enabled.
    {
        std::ostringstream quiet_out;
        const Reporter quiet(quiet_out, "prog", false);
        quiet.debug("hidden");
        expect_empty(quiet_out.str(), "debug suppressed");

        quiet.report(Diagnostic{.severity = Severity::Error, .message = "shown", .notes = {}});
        expect_contains(quiet_out.str(), "prog: error: shown", "errors always reported");

        std::ostringstream loud_out;
        const Reporter loud(loud_out, "prog", true);
        loud.debug("visible");
        expect_contains(loud_out.str(), "prog: debug: visible", "debug enabled");
    }

    std::cout << "OK\n";
    return 0;
}
