#include <envdebug/env/environment.h>
#include <string_view>
#include <unistd.h>

extern char** environ;

namespace envdebug::env
{

EnvMap parse_environ_block(const char* const* envp)
{
    EnvMap out;
    if (envp == nullptr)
    {
        return out;
    }

    for (const char* const* it = envp; *it != nullptr; ++it)
    {
        const std::string_view entry(*it);
        const std::size_t eq = entry.find('=');
        if (eq == std::string_view::npos)
        {
            continue;
        }
        out.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    }
    return out;
}

EnvMap snapshot_environment()
{
    return parse_environ_block(environ);
}

} // namespace envdebug::env
