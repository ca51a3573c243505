#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic hashing
 *
 * Rules:
 * - Object keys in UTF-16 code unit order
 * - No whitespace (minimal representation)
 * - ASCII-only output: everything from U+007F up is \u-escaped
 * - Numbers as the shortest round-trip decimal in ECMAScript layout
 * - NaN / Infinity rejected, never coerced
 */

#include "canonjson/common.hpp"
#include "canonjson/value.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace canonjson::canonical {

/**
 * Serialization limits
 */
struct SerializeOptions
{
    /// Maximum container nesting depth; 0 disables the limit
    std::size_t max_depth = 0;
};

/**
 * Serialize a value tree to canonical form
 *
 * The walk keeps its own stack of open containers, so nesting depth does
 * not consume call stack. The first error aborts the walk and no partial
 * output is returned.
 *
 * @param root Root of the tree
 * @param options Serialization limits
 * @return Canonical text or error (NonFiniteNumber, NumberOutOfRange,
 *         InvalidSurrogate, InvalidUtf8, DepthLimitExceeded, UnsupportedValue)
 */
[[nodiscard]] Result<std::string> serialize(const value::ValueView& root,
                                            const SerializeOptions& options = {});

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] Result<std::string> canonicalize(const nlohmann::json& j,
                                               const SerializeOptions& options = {});

/// @copydoc canonicalize(const nlohmann::json&, const SerializeOptions&)
[[nodiscard]] Result<std::string> canonicalize(const nlohmann::ordered_json& j,
                                               const SerializeOptions& options = {});

/**
 * Parse JSON text and serialize it to canonical form
 * @param text UTF-8 JSON text
 * @return Canonical text, ParseError, or a serialization error
 */
[[nodiscard]] Result<std::string> canonicalize_text(std::string_view text,
                                                    const SerializeOptions& options = {});

/**
 * Compute SHA-256 hash of canonical JSON
 * @param j JSON value
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] Result<std::string> hash_canonical(const nlohmann::json& j);

/// @copydoc hash_canonical(const nlohmann::json&)
[[nodiscard]] Result<std::string> hash_canonical(const nlohmann::ordered_json& j);

/**
 * Check whether JSON text is byte-identical to its own canonical form
 * @param text UTF-8 JSON text
 * @return true / false, or the parse / serialization error
 */
[[nodiscard]] Result<bool> is_canonical(std::string_view text);

}  // namespace canonjson::canonical
