#pragma once

/**
 * @file common.hpp
 * @brief Common types: Result/Error, SHA-256 digest of canonical bytes
 */

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace canonjson {

/**
 * @brief Error information for Result types
 *
 * Codes raised by the library:
 *   NonFiniteNumber, NumberOutOfRange, InvalidSurrogate, InvalidUtf8,
 *   DepthLimitExceeded, UnsupportedValue, ParseError
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace canonjson

namespace canonjson::common {

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 lowercase characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

}  // namespace canonjson::common
