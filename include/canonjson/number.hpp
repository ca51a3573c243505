#pragma once

/**
 * @file number.hpp
 * @brief Canonical number text (ECMAScript Number::toString layout)
 */

#include "canonjson/common.hpp"

#include <cstdint>
#include <string>

namespace canonjson::canonical {

/**
 * @brief Shortest round-trip decimal expansion of a positive double
 *
 * The value equals 0.<digits> x 10^exponent, where digits has no leading
 * zero and no shorter digit string parses back to the same double.
 */
struct DecimalDigits
{
    std::string digits;
    int exponent = 0;
};

/**
 * Compute the shortest round-trip digits of |value|
 * @param value Finite non-zero double (sign is ignored)
 * @return Digits and exponent, or NonFiniteNumber
 */
[[nodiscard]] Result<DecimalDigits> shortest_decimal(double value);

/**
 * Render a double as canonical JSON number text
 *
 * Negative zero renders as "0". Magnitudes in [1e-6, 1e21) use plain
 * notation, everything else exponential ("1e+21", "1e-7").
 *
 * @param value Double to render
 * @return Canonical text, or NonFiniteNumber for NaN / infinity
 */
[[nodiscard]] Result<std::string> format_number(double value);

/**
 * Bring a parser integer into the double domain
 *
 * Rounds to the nearest double (ties to even), exactly as a decimal literal
 * of the same value would parse, so "9007199254740993" and
 * "9007199254740993.0" canonicalize alike.
 */
[[nodiscard]] double integer_to_double(std::int64_t value) noexcept;

/// @copydoc integer_to_double(std::int64_t)
[[nodiscard]] double integer_to_double(std::uint64_t value) noexcept;

}  // namespace canonjson::canonical
