#include <cstdlib>
#include <envdebug/cli/cli.h>
#include <envdebug/diag/render.h>
#include <envdebug/mcp/json.h>
#include <envdebug/mcp/server.h>
#include <envdebug/redact/redactor.h>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#ifndef ENVDEBUG_VERSION
#define ENVDEBUG_VERSION "0.0.0"
#endif

namespace envdebug::cli
{

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

constexpr std::string_view kProgram = "env-debug-mcp";

void print_usage(std::ostream& out)
{
    out << "env-debug-mcp: MCP server exposing a redacted view of the environment\n\n";
    out << "usage:\n";
    out << "  env-debug-mcp [--verbose] [serve]   run the MCP server on stdio\n";
    out << "  env-debug-mcp [--verbose] dump      print the redacted environment as JSON\n";
    out << "  env-debug-mcp --help\n";
    out << "  env-debug-mcp --version\n";
    out << "\nenvironment:\n";
    out << "  ENVDEBUG_DEBUG   when set, same as --verbose\n";
}

bool is_help_flag(std::string_view arg)
{
    return arg == "--help" || arg == "-h" || arg == "help";
}

int usage_error(std::string_view message)
{
    std::cerr << kProgram << ": error: " << message << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
}

int cmd_serve(const diag::Reporter& reporter)
{
    mcp::Server server(mcp::ServerConfig{.name = std::string(kProgram),
                                         .version = std::string(version())},
                       {}, reporter);
    return server.serve(std::cin, std::cout);
}

int cmd_dump(const diag::Reporter& reporter)
{
    const auto view = redact::build_debug_view();
    reporter.debug("dumping " + std::to_string(view.size()) + " variables");

    std::cout << mcp::json_serialize(mcp::env_to_json(view)) << "\n";
    std::cout.flush();
    if (!std::cout)
    {
        reporter.report(diag::Diagnostic{
            .severity = diag::Severity::Error, .message = "failed to write output", .notes = {}});
        return kExitError;
    }
    return kExitOk;
}

} // namespace

std::string_view version()
{
    return ENVDEBUG_VERSION;
}

int run(int argc, char** argv)
{
    bool verbose = std::getenv("ENVDEBUG_DEBUG") != nullptr;
    std::vector<std::string_view> positional;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (is_help_flag(arg))
        {
            print_usage(std::cout);
            return kExitOk;
        }
        if (arg == "--version")
        {
            std::cout << kProgram << " " << version() << "\n";
            return kExitOk;
        }
        if (arg == "--verbose" || arg == "-v")
        {
            verbose = true;
            continue;
        }
        if (arg.starts_with('-'))
        {
            return usage_error("unknown option '" + std::string(arg) + "'");
        }
        positional.push_back(arg);
    }

    if (positional.size() > 1)
    {
        return usage_error("expected at most one command");
    }

    const diag::Reporter reporter(std::cerr, std::string(kProgram), verbose);
    const std::string_view cmd = positional.empty() ? "serve" : positional.front();
    if (cmd == "serve")
    {
        return cmd_serve(reporter);
    }
    if (cmd == "dump")
    {
        return cmd_dump(reporter);
    }

    return usage_error("unknown command '" + std::string(cmd) + "'");
}

} // namespace envdebug::cli
