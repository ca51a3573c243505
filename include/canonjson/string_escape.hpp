#pragma once

/**
 * @file string_escape.hpp
 * @brief Canonical string escaping (quoted, ASCII-only output)
 */

#include "canonjson/common.hpp"

#include <string>
#include <string_view>

namespace canonjson::canonical {

/**
 * Render a UTF-8 string as a canonical JSON string literal
 *
 * - '"' and '\' are backslash-escaped
 * - \b \f \n \r \t use their short escapes
 * - other code points below U+0020 and everything from U+007F up become
 *   \uxxxx (lowercase hex), one escape per UTF-16 code unit
 * - the remaining printable ASCII is copied as is
 *
 * @param utf8 String bytes
 * @return Quoted literal, or InvalidSurrogate / InvalidUtf8
 */
[[nodiscard]] Result<std::string> escape_string(std::string_view utf8);

/**
 * Append the quoted literal to an output buffer
 *
 * On error nothing is appended.
 */
[[nodiscard]] VoidResult append_escaped_string(std::string_view utf8, std::string& out);

}  // namespace canonjson::canonical
