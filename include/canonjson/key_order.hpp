#pragma once

/**
 * @file key_order.hpp
 * @brief Canonical ordering of object members
 */

#include "canonjson/common.hpp"

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace canonjson::canonical {

/**
 * Order object keys by their UTF-16 code units
 *
 * Keys are compared unit by unit, a strict prefix first. Code points above
 * U+FFFF compare by their high surrogate, so they sort before U+E000..U+FFFF.
 *
 * @param keys UTF-8 keys, unique
 * @return Indices into keys in canonical order, or the decoding error of
 *         the first key that is not valid UTF-8 / has a lone surrogate
 */
[[nodiscard]] Result<std::vector<std::size_t>> canonical_key_order(
    std::span<const std::string_view> keys);

}  // namespace canonjson::canonical
