#include <envdebug/redact/classifier.h>
#include <envdebug/redact/redactor.h>

namespace envdebug::redact
{

namespace
{

constexpr bool is_ascii_alnum(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

} // namespace

std::string redact_value(std::string_view value)
{
    std::string out(value);
    for (char& c : out)
    {
        if (is_ascii_alnum(c))
        {
            c = kMaskChar;
        }
    }
    return out;
}

env::EnvMap build_debug_view(const env::EnvMap& env)
{
    env::EnvMap out;
    for (const auto& [name, value] : env)
    {
        out.emplace_hint(out.end(), name, is_sensitive(name) ? redact_value(value) : value);
    }
    return out;
}

env::EnvMap build_debug_view()
{
    return build_debug_view(env::snapshot_environment());
}

} // namespace envdebug::redact
