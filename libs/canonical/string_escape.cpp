/**
 * @file string_escape.cpp
 * @brief Canonical string escaping
 */

#include "canonjson/string_escape.hpp"

#include "utf8.hpp"

#include <string>
#include <string_view>

namespace canonjson::canonical {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";

void append_unicode_escape(char16_t unit, std::string& out)
{
    out += "\\u";
    out.push_back(kHexDigits[(unit >> 12U) & 0x0FU]);
    out.push_back(kHexDigits[(unit >> 8U) & 0x0FU]);
    out.push_back(kHexDigits[(unit >> 4U) & 0x0FU]);
    out.push_back(kHexDigits[unit & 0x0FU]);
}

void append_unit(char16_t unit, std::string& out)
{
    switch (unit) {
        case u'"':
            out += "\\\"";
            return;
        case u'\\':
            out += "\\\\";
            return;
        case u'\b':
            out += "\\b";
            return;
        case u'\f':
            out += "\\f";
            return;
        case u'\n':
            out += "\\n";
            return;
        case u'\r':
            out += "\\r";
            return;
        case u'\t':
            out += "\\t";
            return;
        default:
            break;
    }
    if (unit < 0x20 || unit >= 0x7F) {
        append_unicode_escape(unit, out);
    } else {
        out.push_back(static_cast<char>(unit));
    }
}

}  // namespace

VoidResult append_escaped_string(std::string_view utf8, std::string& out)
{
    auto units = detail::to_utf16(utf8);
    if (!units) {
        return std::unexpected(units.error());
    }
    out.reserve(out.size() + units->size() + 2);
    out.push_back('"');
    for (char16_t unit : *units) {
        append_unit(unit, out);
    }
    out.push_back('"');
    return {};
}

Result<std::string> escape_string(std::string_view utf8)
{
    std::string out;
    if (auto result = append_escaped_string(utf8, out); !result) {
        return std::unexpected(result.error());
    }
    return out;
}

}  // namespace canonjson::canonical
