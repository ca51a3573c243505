/**
 * @file key_order.cpp
 * @brief Canonical object key ordering (UTF-16 code unit order)
 */

#include "canonjson/key_order.hpp"

#include "utf8.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

namespace canonjson::canonical {

Result<std::vector<std::size_t>> canonical_key_order(std::span<const std::string_view> keys)
{
    std::vector<std::u16string> units;
    units.reserve(keys.size());
    for (auto key : keys) {
        auto decoded = detail::to_utf16(key);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }
        units.push_back(std::move(*decoded));
    }

    std::vector<std::size_t> order(keys.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    // char16_t is unsigned, so u16string comparison is code unit order
    std::ranges::stable_sort(order, [&units](std::size_t lhs, std::size_t rhs) {
        return units[lhs] < units[rhs];
    });
    return order;
}

}  // namespace canonjson::canonical
