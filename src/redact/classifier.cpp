#include <algorithm>
#include <array>
#include <cstddef>
#include <envdebug/redact/classifier.h>

namespace envdebug::redact
{

namespace
{

constexpr std::array<SensitiveToken, 8> kSensitiveTokens = {{
    {.token = "KEY", .right = RightBoundary::None},
    {.token = "TOKEN", .right = RightBoundary::None},
    {.token = "CRED", .right = RightBoundary::None},
    {.token = "SECRET", .right = RightBoundary::None},
    {.token = "AUTH", .right = RightBoundary::None},
    {.token = "PASSWORD", .right = RightBoundary::None},
    {.token = "PASSPHRASE", .right = RightBoundary::None},
    // PASSPORT must not match, so bare PASS needs both boundaries.
    {.token = "PASS", .right = RightBoundary::Required},
}};

constexpr char ascii_upper(char c)
{
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

bool starts_with_ci(std::string_view word, std::string_view upper_token)
{
    if (word.size() < upper_token.size())
    {
        return false;
    }
    return std::equal(upper_token.begin(), upper_token.end(), word.begin(),
                      [](char t, char w) { return t == ascii_upper(w); });
}

bool segment_matches(std::string_view segment, const SensitiveToken& rule)
{
    if (!starts_with_ci(segment, rule.token))
    {
        return false;
    }
    return rule.right == RightBoundary::None || segment.size() == rule.token.size();
}

} // namespace

bool is_sensitive(std::string_view name)
{
    // Segments are the runs between underscores; a token always begins a segment.
    std::size_t start = 0;
    while (start <= name.size())
    {
        std::size_t end = name.find('_', start);
        if (end == std::string_view::npos)
        {
            end = name.size();
        }

        const std::string_view segment = name.substr(start, end - start);
        for (const auto& rule : kSensitiveTokens)
        {
            if (segment_matches(segment, rule))
            {
                return true;
            }
        }

        start = end + 1;
    }
    return false;
}

} // namespace envdebug::redact
