#pragma once

/**
 * @file utf8.hpp
 * @brief UTF-8 to UTF-16 decomposition shared by the string escaper and key orderer
 */

#include "canonjson/common.hpp"

#include <string>
#include <string_view>

namespace canonjson::canonical::detail {

/**
 * Decompose UTF-8 bytes into UTF-16 code units
 *
 * Surrogate code points are accepted in their 3-byte form (as produced by
 * CESU-8 / WTF-8 writers); a high surrogate directly followed by a low one
 * forms a pair and yields the same units as the equivalent 4-byte sequence.
 *
 * @param utf8 Input bytes
 * @return Code units, InvalidSurrogate for an unpaired surrogate, or
 *         InvalidUtf8 for bytes that are not UTF-8
 */
[[nodiscard]] Result<std::u16string> to_utf16(std::string_view utf8);

}  // namespace canonjson::canonical::detail
