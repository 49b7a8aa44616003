#include <cstdlib>
#include <envdebug/cli/cli.h>
#include <envdebug/mcp/json.h>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

struct RunResult
{
    int exit_code = -1;
    std::string out;
    std::string err;
};

static RunResult run_cli(std::vector<std::string> argv_storage, const std::string& stdin_text = "")
{
    argv_storage.insert(argv_storage.begin(), "env-debug-mcp");
    std::vector<char*> argv;
    argv.reserve(argv_storage.size());
    for (auto& s : argv_storage)
    {
        argv.push_back(s.data());
    }

    std::istringstream in(stdin_text);
    std::ostringstream out;
    std::ostringstream err;
    auto* old_in = std::cin.rdbuf(in.rdbuf());
    auto* old_out = std::cout.rdbuf(out.rdbuf());
    auto* old_err = std::cerr.rdbuf(err.rdbuf());
    const int rc = envdebug::cli::run(static_cast<int>(argv.size()), argv.data());
    std::cin.rdbuf(old_in);
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);

    return RunResult{.exit_code = rc, .out = out.str(), .err = err.str()};
}

static void expect_contains(const std::string& haystack, const std::string& needle,
                            const char* what)
{
    if (haystack.find(needle) == std::string::npos)
    {
        fail(std::string(what) + ": expected to contain '" + needle + "', got: " + haystack);
    }
}

int main()
{
    (void)unsetenv("ENVDEBUG_DEBUG");

    {
        const auto r = run_cli({"--version"});
        if (r.exit_code != 0)
        {
            fail("expected --version to exit 0");
        }
        if (r.out != "env-debug-mcp " + std::string(envdebug::cli::version()) + "\n")
        {
            fail("unexpected --version output: " + r.out);
        }
    }

    for (const char* flag : {"--help", "-h", "help"})
    {
        const auto r = run_cli({flag});
        if (r.exit_code != 0)
        {
            fail(std::string("expected ") + flag + " to exit 0");
        }
        expect_contains(r.out, "usage:", "help output");
    }

    {
        const auto r = run_cli({"--bogus"});
        if (r.exit_code != 2)
        {
            fail("expected unknown option to exit 2");
        }
        expect_contains(r.err, "unknown option '--bogus'", "bad option");
        if (!r.out.empty())
        {
            fail("usage errors must not write to stdout");
        }
    }

    {
        const auto r = run_cli({"frobnicate"});
        if (r.exit_code != 2)
        {
            fail("expected unknown command to exit 2");
        }
        expect_contains(r.err, "unknown command 'frobnicate'", "bad command");
    }

    {
        const auto r = run_cli({"dump", "serve"});
        if (r.exit_code != 2)
        {
            fail("expected two commands to exit 2");
        }
    }

    // dump prints the redacted environment as a single JSON object line.
    {
        (void)setenv("ENVDEBUG_CLI_SECRET", "s3cr3t!", 1);
        (void)setenv("ENVDEBUG_CLI_PLAIN", "visible", 1);
        const auto r = run_cli({"dump"});
        (void)unsetenv("ENVDEBUG_CLI_SECRET");
        (void)unsetenv("ENVDEBUG_CLI_PLAIN");

        if (r.exit_code != 0)
        {
            fail("expected dump to exit 0");
        }
        if (r.out.empty() || r.out.back() != '\n' || r.out.find('\n') != r.out.size() - 1)
        {
            fail("expected exactly one newline-terminated line");
        }
        const auto parsed = envdebug::mcp::parse_json(r.out);
        if (!parsed.has_value() || !parsed->is_object())
        {
            fail("dump output is not a JSON object");
        }
        const auto& obj = *parsed->as_object();
        if (envdebug::mcp::json_get_string(obj, "ENVDEBUG_CLI_SECRET").value_or("") != "******!")
        {
            fail("secret not masked in dump");
        }
        if (envdebug::mcp::json_get_string(obj, "ENVDEBUG_CLI_PLAIN").value_or("") != "visible")
        {
            fail("plain variable altered in dump");
        }
        if (!r.err.empty())
        {
            fail("dump without --verbose should be quiet on stderr");
        }
    }

    // serve is the default command and speaks newline-delimited JSON-RPC on stdio.
    {
        const auto r = run_cli({"--verbose"},
                               "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\","
                               "\"params\":{}}\n"
                               "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
        if (r.exit_code != 0)
        {
            fail("expected serve to exit 0 at end of input");
        }
        expect_contains(r.out, "\"serverInfo\":{\"name\":\"env-debug-mcp\"", "server info");
        expect_contains(r.out, "\"name\":\"debug_env\"", "tool listed");
        expect_contains(r.err, "env-debug-mcp: debug: request: initialize", "verbose trace");
    }

    std::cout << "OK\n";
    return 0;
}
