/**
 * @file utf8.cpp
 * @brief Generalized UTF-8 decoding into UTF-16 code units
 */

#include "utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <string>

namespace canonjson::canonical::detail {

namespace {

constexpr char32_t kHighSurrogateFirst = 0xD800;
constexpr char32_t kLowSurrogateFirst = 0xDC00;
constexpr char32_t kLowSurrogateLast = 0xDFFF;
constexpr char32_t kMaxCodePoint = 0x10FFFF;

[[nodiscard]] constexpr bool is_high_surrogate(char32_t cp) noexcept
{
    return cp >= kHighSurrogateFirst && cp < kLowSurrogateFirst;
}

[[nodiscard]] constexpr bool is_low_surrogate(char32_t cp) noexcept
{
    return cp >= kLowSurrogateFirst && cp <= kLowSurrogateLast;
}

[[nodiscard]] Error invalid_utf8(std::size_t offset)
{
    return Error::make("InvalidUtf8",
                       std::format("Invalid UTF-8 sequence at byte offset {}", offset));
}

[[nodiscard]] Error lone_surrogate(std::size_t offset)
{
    return Error::make("InvalidSurrogate",
                       std::format("Unpaired surrogate code point at byte offset {}", offset));
}

struct Decoded
{
    char32_t code_point;
    std::size_t length;
};

/**
 * @brief Decode one code point starting at offset; surrogates pass through
 */
[[nodiscard]] Result<Decoded> decode_one(std::string_view bytes, std::size_t offset)
{
    const auto lead = static_cast<std::uint8_t>(bytes[offset]);
    if (lead < 0x80) {
        return Decoded{.code_point = lead, .length = 1};
    }

    std::size_t length = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        cp = lead & 0x1FU;
        min_cp = 0x80;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        cp = lead & 0x0FU;
        min_cp = 0x800;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        cp = lead & 0x07U;
        min_cp = 0x10000;
    } else {
        return std::unexpected(invalid_utf8(offset));
    }

    if (bytes.size() - offset < length) {
        return std::unexpected(invalid_utf8(offset));
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto cont = static_cast<std::uint8_t>(bytes[offset + i]);
        if ((cont & 0xC0U) != 0x80U) {
            return std::unexpected(invalid_utf8(offset));
        }
        cp = (cp << 6U) | (cont & 0x3FU);
    }
    if (cp < min_cp || cp > kMaxCodePoint) {
        return std::unexpected(invalid_utf8(offset));
    }
    return Decoded{.code_point = cp, .length = length};
}

}  // namespace

Result<std::u16string> to_utf16(std::string_view utf8)
{
    std::u16string units;
    units.reserve(utf8.size());

    // Byte offset of a high surrogate still waiting for its low half
    std::size_t pending_high_offset = std::string_view::npos;

    std::size_t offset = 0;
    while (offset < utf8.size()) {
        auto decoded = decode_one(utf8, offset);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        const char32_t cp = decoded->code_point;

        if (pending_high_offset != std::string_view::npos && !is_low_surrogate(cp)) {
            return std::unexpected(lone_surrogate(pending_high_offset));
        }

        if (is_high_surrogate(cp)) {
            pending_high_offset = offset;
            units.push_back(static_cast<char16_t>(cp));
        } else if (is_low_surrogate(cp)) {
            if (pending_high_offset == std::string_view::npos) {
                return std::unexpected(lone_surrogate(offset));
            }
            pending_high_offset = std::string_view::npos;
            units.push_back(static_cast<char16_t>(cp));
        } else if (cp >= 0x10000) {
            const char32_t v = cp - 0x10000;
            units.push_back(static_cast<char16_t>(kHighSurrogateFirst + (v >> 10U)));
            units.push_back(static_cast<char16_t>(kLowSurrogateFirst + (v & 0x3FFU)));
        } else {
            units.push_back(static_cast<char16_t>(cp));
        }
        offset += decoded->length;
    }

    if (pending_high_offset != std::string_view::npos) {
        return std::unexpected(lone_surrogate(pending_high_offset));
    }
    return units;
}

}  // namespace canonjson::canonical::detail
