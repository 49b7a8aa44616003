#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <envdebug/mcp/json.h>
#include <iomanip>
#include <sstream>

namespace envdebug::mcp
{

namespace
{

// Integral doubles below this magnitude are written without exponent or fraction.
constexpr double kMaxPlainInteger = 9007199254740992.0; // 2^53

// Arrays and objects nested deeper than this are rejected.
constexpr std::size_t kMaxDepth = 256;

int hex_digit_value(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

bool is_continuation(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed UTF-8 sequence starting at `i`, or 0 if there is none.
std::size_t utf8_sequence_length(std::string_view s, std::size_t i)
{
    const auto at = [&](std::size_t k) -> unsigned char
    { return i + k < s.size() ? static_cast<unsigned char>(s[i + k]) : 0; };

    const unsigned char lead = at(0);
    if (lead < 0x80)
    {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF)
    {
        return is_continuation(at(1)) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF)
    {
        // Exclude overlong forms (E0) and UTF-16 surrogates (ED).
        const unsigned char lo = lead == 0xE0 ? 0xA0 : 0x80;
        const unsigned char hi = lead == 0xED ? 0x9F : 0xBF;
        return (at(1) >= lo && at(1) <= hi && is_continuation(at(2))) ? 3 : 0;
    }
    if (lead >= 0xF0 && lead <= 0xF4)
    {
        // Exclude overlong forms (F0) and code points above U+10FFFF (F4).
        const unsigned char lo = lead == 0xF0 ? 0x90 : 0x80;
        const unsigned char hi = lead == 0xF4 ? 0x8F : 0xBF;
        return (at(1) >= lo && at(1) <= hi && is_continuation(at(2)) && is_continuation(at(3)))
                   ? 4
                   : 0;
    }
    return 0;
}

void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

struct JsonParser
{
    std::string_view input;
    std::size_t pos = 0;
    std::size_t depth = 0;

    [[nodiscard]] bool eof() const { return pos >= input.size(); }

    void skip_ws()
    {
        while (!eof() && std::isspace(static_cast<unsigned char>(input[pos])))
        {
            ++pos;
        }
    }

    bool consume(char expected)
    {
        skip_ws();
        if (eof() || input[pos] != expected)
        {
            return false;
        }
        ++pos;
        return true;
    }

    std::optional<Json> parse_value()
    {
        skip_ws();
        if (eof())
        {
            return std::nullopt;
        }
        const char c = input[pos];
        if (c == 'n')
        {
            return parse_literal("null", Json{std::nullptr_t{}});
        }
        if (c == 't')
        {
            return parse_literal("true", Json{true});
        }
        if (c == 'f')
        {
            return parse_literal("false", Json{false});
        }
        if (c == '"')
        {
            return parse_string();
        }
        if (c == '{' || c == '[')
        {
            if (depth >= kMaxDepth)
            {
                return std::nullopt;
            }
            ++depth;
            auto nested = c == '{' ? parse_object() : parse_array();
            --depth;
            return nested;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
        {
            return parse_number();
        }
        return std::nullopt;
    }

    std::optional<Json> parse_literal(std::string_view word, Json value)
    {
        if (input.substr(pos, word.size()) != word)
        {
            return std::nullopt;
        }
        pos += word.size();
        return value;
    }

    std::optional<std::uint32_t> parse_hex4()
    {
        if (input.size() - pos < 4)
        {
            return std::nullopt;
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i)
        {
            const int digit = hex_digit_value(input[pos++]);
            if (digit < 0)
            {
                return std::nullopt;
            }
            value = (value << 4) | static_cast<std::uint32_t>(digit);
        }
        return value;
    }

    bool parse_unicode_escape(std::string& out)
    {
        const auto first = parse_hex4();
        if (!first.has_value())
        {
            return false;
        }
        std::uint32_t cp = *first;
        if (cp >= 0xDC00 && cp <= 0xDFFF)
        {
            return false; // lone low surrogate
        }
        if (cp >= 0xD800 && cp <= 0xDBFF)
        {
            if (input.substr(pos, 2) != "\\u")
            {
                return false;
            }
            pos += 2;
            const auto second = parse_hex4();
            if (!second.has_value() || *second < 0xDC00 || *second > 0xDFFF)
            {
                return false;
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (*second - 0xDC00);
        }
        append_utf8(out, cp);
        return true;
    }

    std::optional<Json> parse_string()
    {
        if (!consume('"'))
        {
            return std::nullopt;
        }
        std::string out;
        while (!eof())
        {
            const char c = input[pos++];
            if (c == '"')
            {
                return Json{out};
            }
            if (static_cast<unsigned char>(c) < 0x20)
            {
                return std::nullopt;
            }
            if (c != '\\')
            {
                const std::size_t len = utf8_sequence_length(input, pos - 1);
                if (len == 0)
                {
                    return std::nullopt;
                }
                out.append(input.substr(pos - 1, len));
                pos += len - 1;
                continue;
            }
            if (eof())
            {
                return std::nullopt;
            }
            const char esc = input[pos++];
            switch (esc)
            {
            case '"':
                out.push_back('"');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '/':
                out.push_back('/');
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u':
                if (!parse_unicode_escape(out))
                {
                    return std::nullopt;
                }
                break;
            default:
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<Json> parse_number()
    {
        skip_ws();
        const std::size_t start = pos;
        if (input[pos] == '-')
        {
            ++pos;
        }
        // Integer part: a single 0 or a non-zero digit followed by more digits.
        if (!eof() && input[pos] == '0')
        {
            ++pos;
        }
        else if (skip_digits() == 0)
        {
            return std::nullopt;
        }
        if (!eof() && input[pos] == '.')
        {
            ++pos;
            if (skip_digits() == 0)
            {
                return std::nullopt;
            }
        }
        if (!eof() && (input[pos] == 'e' || input[pos] == 'E'))
        {
            ++pos;
            if (!eof() && (input[pos] == '+' || input[pos] == '-'))
            {
                ++pos;
            }
            if (skip_digits() == 0)
            {
                return std::nullopt;
            }
        }
        if (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
        {
            return std::nullopt; // leading zero, as in 01
        }
        const std::string num(input.substr(start, pos - start));
        char* end_ptr = nullptr;
        const double value = std::strtod(num.c_str(), &end_ptr);
        if (end_ptr != num.c_str() + num.size())
        {
            return std::nullopt;
        }
        return Json{value};
    }

    std::size_t skip_digits()
    {
        const std::size_t start = pos;
        while (!eof() && std::isdigit(static_cast<unsigned char>(input[pos])))
        {
            ++pos;
        }
        return pos - start;
    }

    std::optional<Json> parse_array()
    {
        if (!consume('['))
        {
            return std::nullopt;
        }
        Json::Array items;
        if (consume(']'))
        {
            return Json{items};
        }
        while (true)
        {
            auto value = parse_value();
            if (!value.has_value())
            {
                return std::nullopt;
            }
            items.push_back(std::move(*value));
            if (consume(']'))
            {
                break;
            }
            if (!consume(','))
            {
                return std::nullopt;
            }
        }
        return Json{items};
    }

    std::optional<Json> parse_object()
    {
        if (!consume('{'))
        {
            return std::nullopt;
        }
        Json::Object obj;
        if (consume('}'))
        {
            return Json{obj};
        }
        while (true)
        {
            skip_ws();
            auto key_val = parse_string();
            if (!key_val.has_value())
            {
                return std::nullopt;
            }
            if (!consume(':'))
            {
                return std::nullopt;
            }
            auto val = parse_value();
            if (!val.has_value())
            {
                return std::nullopt;
            }
            obj.insert_or_assign(*key_val->as_string(), std::move(*val));
            if (consume('}'))
            {
                break;
            }
            if (!consume(','))
            {
                return std::nullopt;
            }
        }
        return Json{obj};
    }
};

std::string serialize_number(double x)
{
    if (!std::isfinite(x))
    {
        return "null";
    }
    std::ostringstream oss;
    if (std::floor(x) == x && std::fabs(x) < kMaxPlainInteger)
    {
        oss << static_cast<std::int64_t>(x);
    }
    else
    {
        oss << std::setprecision(17) << x;
    }
    return oss.str();
}

} // namespace

std::optional<Json> parse_json(std::string_view input)
{
    JsonParser parser{input};
    auto result = parser.parse_value();
    if (!result.has_value())
    {
        return std::nullopt;
    }
    parser.skip_ws();
    if (!parser.eof())
    {
        return std::nullopt;
    }
    return result;
}

std::string json_escape(std::string_view input)
{
    static constexpr char kHex[] = "0123456789abcdef";

    std::string out;
    out.reserve(input.size() + 8);
    for (std::size_t i = 0; i < input.size(); ++i)
    {
        const char c = input[i];
        if (static_cast<unsigned char>(c) >= 0x80)
        {
            // JSON text must be UTF-8: keep well-formed sequences, replace stray bytes.
            const std::size_t len = utf8_sequence_length(input, i);
            if (len == 0)
            {
                out += "\\ufffd";
            }
            else
            {
                out.append(input.substr(i, len));
                i += len - 1;
            }
            continue;
        }
        switch (c)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
        {
            const auto u = static_cast<unsigned char>(c);
            if (u < 0x20)
            {
                out += "\\u00";
                out.push_back(kHex[u >> 4]);
                out.push_back(kHex[u & 0x0F]);
            }
            else
            {
                out.push_back(c);
            }
            break;
        }
        }
    }
    return out;
}

std::string json_serialize(const Json& value)
{
    if (value.is_null())
    {
        return "null";
    }
    if (value.is_bool())
    {
        return std::get<bool>(value.value) ? "true" : "false";
    }
    if (value.is_number())
    {
        return serialize_number(*value.as_number());
    }
    if (value.is_string())
    {
        return "\"" + json_escape(*value.as_string()) + "\"";
    }
    if (value.is_array())
    {
        const auto& arr = *value.as_array();
        std::string out = "[";
        for (std::size_t i = 0; i < arr.size(); ++i)
        {
            if (i > 0)
            {
                out += ',';
            }
            out += json_serialize(arr[i]);
        }
        out += "]";
        return out;
    }
    const auto& obj = *value.as_object();
    std::string out = "{";
    bool first = true;
    for (const auto& [key, val] : obj)
    {
        if (!first)
        {
            out += ',';
        }
        first = false;
        out += "\"" + json_escape(key) + "\":" + json_serialize(val);
    }
    out += "}";
    return out;
}

std::optional<std::string> json_get_string(const Json::Object& obj, const std::string& key)
{
    const auto it = obj.find(key);
    if (it == obj.end() || !it->second.is_string())
    {
        return std::nullopt;
    }
    return *it->second.as_string();
}

std::optional<Json> json_get_object(const Json::Object& obj, const std::string& key)
{
    const auto it = obj.find(key);
    if (it == obj.end() || !it->second.is_object())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace envdebug::mcp
