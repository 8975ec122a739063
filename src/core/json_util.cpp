#include "core/json_util.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <system_error>

namespace motionline::json
{

namespace
{

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

size_t skip_space(std::string_view json, size_t pos)
{
    while (pos < json.size() && is_space(json[pos]))
        ++pos;
    return pos;
}

// pos points at an opening quote; returns the index just past the closing one.
size_t skip_string(std::string_view json, size_t pos)
{
    ++pos;
    while (pos < json.size())
    {
        if (json[pos] == '\\')
        {
            pos += 2;
            continue;
        }
        if (json[pos] == '"')
            return pos + 1;
        ++pos;
    }
    return json.size();
}

// Position of the value stored under key (first non-space after ':'), or npos.
size_t find_value(std::string_view json, std::string_view key)
{
    std::string search = "\"" + std::string(key) + "\"";
    size_t      pos    = json.find(search);
    while (pos != std::string_view::npos)
    {
        size_t after = skip_space(json, pos + search.size());
        if (after < json.size() && json[after] == ':')
            return skip_space(json, after + 1);
        pos = json.find(search, pos + 1);
    }
    return std::string_view::npos;
}

// pos points at '[' or '{'; returns the index of the matching closer, or npos.
size_t match_bracket(std::string_view json, size_t pos)
{
    int depth = 0;
    for (size_t i = pos; i < json.size();)
    {
        char c = json[i];
        if (c == '"')
        {
            i = skip_string(json, i);
            continue;
        }
        if (c == '[' || c == '{')
            ++depth;
        else if (c == ']' || c == '}')
        {
            --depth;
            if (depth == 0)
                return i;
        }
        ++i;
    }
    return std::string_view::npos;
}

void append_utf8(std::string& out, unsigned code)
{
    if (code < 0x80)
    {
        out += static_cast<char>(code);
    }
    else if (code < 0x800)
    {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

std::string unescape(std::string_view raw)
{
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i)
    {
        char c = raw[i];
        if (c != '\\' || i + 1 >= raw.size())
        {
            out += c;
            continue;
        }
        char e = raw[++i];
        switch (e)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'u':
                if (i + 4 < raw.size())
                {
                    unsigned code = 0;
                    auto     hex  = raw.substr(i + 1, 4);
                    auto [p, ec]  = std::from_chars(hex.data(), hex.data() + hex.size(), code, 16);
                    if (ec == std::errc() && p == hex.data() + hex.size())
                    {
                        append_utf8(out, code);
                        i += 4;
                        break;
                    }
                }
                out += 'u';
                break;
            default:   // '"', '\\', '/'
                out += e;
                break;
        }
    }
    return out;
}

}   // anonymous namespace

std::string escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
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
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string format_number(double value)
{
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc())
        return "0";
    return std::string(buf, end);
}

std::optional<std::string> read_string(std::string_view json, std::string_view key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string_view::npos || pos >= json.size() || json[pos] != '"')
        return std::nullopt;
    size_t end = skip_string(json, pos);
    if (end > json.size() || json[end - 1] != '"' || end - pos < 2)
        return std::nullopt;
    return unescape(json.substr(pos + 1, end - pos - 2));
}

std::optional<double> read_number(std::string_view json, std::string_view key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string_view::npos || pos >= json.size())
        return std::nullopt;

    std::string text(json.substr(pos, 40));
    char*       end   = nullptr;
    double      value = std::strtod(text.c_str(), &end);
    if (end == text.c_str())
        return std::nullopt;
    return value;
}

std::optional<bool> read_bool(std::string_view json, std::string_view key)
{
    size_t pos = find_value(json, key);
    if (pos == std::string_view::npos)
        return std::nullopt;
    auto rest = json.substr(pos);
    if (rest.substr(0, 4) == "true")
        return true;
    if (rest.substr(0, 5) == "false")
        return false;
    return std::nullopt;
}

std::vector<std::string> read_object_array(std::string_view json, std::string_view key)
{
    std::vector<std::string> objects;
    size_t                   pos = find_value(json, key);
    if (pos == std::string_view::npos || pos >= json.size() || json[pos] != '[')
        return objects;

    size_t close = match_bracket(json, pos);
    if (close == std::string_view::npos)
        return objects;

    for (size_t i = pos + 1; i < close;)
    {
        if (json[i] == '{')
        {
            size_t obj_end = match_bracket(json, i);
            if (obj_end == std::string_view::npos || obj_end > close)
                break;
            objects.emplace_back(json.substr(i, obj_end - i + 1));
            i = obj_end + 1;
            continue;
        }
        ++i;
    }
    return objects;
}

std::vector<std::string> read_string_array(std::string_view json, std::string_view key)
{
    std::vector<std::string> values;
    size_t                   pos = find_value(json, key);
    if (pos == std::string_view::npos || pos >= json.size() || json[pos] != '[')
        return values;

    size_t close = match_bracket(json, pos);
    if (close == std::string_view::npos)
        return values;

    for (size_t i = pos + 1; i < close;)
    {
        if (json[i] == '"')
        {
            size_t end = skip_string(json, i);
            values.push_back(unescape(json.substr(i + 1, end - i - 2)));
            i = end;
            continue;
        }
        ++i;
    }
    return values;
}

std::string without_array(std::string_view json, std::string_view key)
{
    std::string result(json);
    size_t      pos = find_value(json, key);
    if (pos == std::string_view::npos || pos >= json.size() || json[pos] != '[')
        return result;

    size_t close = match_bracket(json, pos);
    if (close == std::string_view::npos)
        return result;

    for (size_t i = pos + 1; i < close; ++i)
        result[i] = ' ';
    return result;
}

}   // namespace motionline::json
