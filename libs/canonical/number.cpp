/**
 * @file number.cpp
 * @brief Canonical number rendering (ECMAScript Number::toString layout)
 *
 * The digit string comes from std::to_chars shortest round-trip formatting;
 * the layout rules below pick plain or exponential notation from the digit
 * count k and the decimal exponent n (value = 0.d1..dk x 10^n).
 */

#include "canonjson/number.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace canonjson::canonical {

namespace {

/// Largest n rendered without an exponent (1e21 is the first exponential integer)
constexpr int kMaxPlainExponent = 21;
/// Smallest n rendered as 0.000...digits (1e-7 is the first exponential fraction)
constexpr int kMinFixedExponent = -5;

[[nodiscard]] Error non_finite_error(double value)
{
    return Error::make("NonFiniteNumber",
                       std::isnan(value) ? "NaN cannot be represented in canonical JSON"
                                         : "Infinity cannot be represented in canonical JSON");
}

void append_exponent(int exponent, std::string& out)
{
    out += std::format("e{}{}", exponent < 0 ? '-' : '+', std::abs(exponent));
}

}  // namespace

Result<DecimalDigits> shortest_decimal(double value)
{
    if (!std::isfinite(value)) {
        return std::unexpected(non_finite_error(value));
    }
    const double magnitude = std::fabs(value);
    if (magnitude == 0.0) {
        return DecimalDigits{.digits = "0", .exponent = 1};
    }

    // Shortest round-trip scientific form: d[.ddd]e(+|-)XX
    std::array<char, 32> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(),
                                   buffer.data() + buffer.size(),
                                   magnitude,
                                   std::chars_format::scientific);
    if (ec != std::errc{}) {
        return std::unexpected(Error::make("NumberOutOfRange",
                                           "Failed to format number: "
                                               + std::make_error_code(ec).message()));
    }
    const std::string_view text(buffer.data(), static_cast<std::size_t>(end - buffer.data()));
    const std::size_t e_pos = text.find('e');
    if (e_pos == std::string_view::npos) {
        return std::unexpected(
            Error::make("NumberOutOfRange", "Unexpected number format: " + std::string(text)));
    }

    DecimalDigits result;
    for (char c : text.substr(0, e_pos)) {
        if (c != '.') {
            result.digits.push_back(c);
        }
    }
    while (result.digits.size() > 1 && result.digits.back() == '0') {
        result.digits.pop_back();
    }

    std::string_view exponent_text = text.substr(e_pos + 1);
    if (!exponent_text.empty() && exponent_text.front() == '+') {
        exponent_text.remove_prefix(1);
    }
    int scientific_exponent = 0;
    auto [ptr, parse_ec] = std::from_chars(exponent_text.data(),
                                           exponent_text.data() + exponent_text.size(),
                                           scientific_exponent);
    if (parse_ec != std::errc{} || ptr != exponent_text.data() + exponent_text.size()) {
        return std::unexpected(
            Error::make("NumberOutOfRange", "Unexpected number format: " + std::string(text)));
    }
    // d.ddd x 10^e == 0.dddd x 10^(e+1)
    result.exponent = scientific_exponent + 1;
    return result;
}

Result<std::string> format_number(double value)
{
    if (!std::isfinite(value)) {
        return std::unexpected(non_finite_error(value));
    }
    // Covers negative zero as well
    if (value == 0.0) {
        return std::string("0");
    }

    auto decimal = shortest_decimal(value);
    if (!decimal) {
        return std::unexpected(decimal.error());
    }
    const std::string& digits = decimal->digits;
    const int k = static_cast<int>(digits.size());
    const int n = decimal->exponent;

    std::string out;
    out.reserve(digits.size() + 8);
    if (value < 0.0) {
        out.push_back('-');
    }

    if (k <= n && n <= kMaxPlainExponent) {
        // Integer: digits followed by n - k zeros
        out += digits;
        out.append(static_cast<std::size_t>(n - k), '0');
    } else if (0 < n && n <= kMaxPlainExponent) {
        // Decimal point inside the digits
        out.append(digits, 0, static_cast<std::size_t>(n));
        out.push_back('.');
        out.append(digits, static_cast<std::size_t>(n));
    } else if (kMinFixedExponent <= n && n <= 0) {
        out += "0.";
        out.append(static_cast<std::size_t>(-n), '0');
        out += digits;
    } else {
        out.push_back(digits.front());
        if (k > 1) {
            out.push_back('.');
            out.append(digits, 1);
        }
        append_exponent(n - 1, out);
    }
    return out;
}

double integer_to_double(std::int64_t value) noexcept
{
    return static_cast<double>(value);
}

double integer_to_double(std::uint64_t value) noexcept
{
    return static_cast<double>(value);
}

}  // namespace canonjson::canonical
