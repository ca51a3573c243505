#pragma once

/**
 * @file value.hpp
 * @brief Read-only value tree interface consumed by the canonical emitter
 *
 * The emitter never sees a parser's concrete node type. A tree-producing
 * library is plugged in by writing a ValueView adapter for its nodes
 * (see json_view.hpp for nlohmann::json).
 */

#include "canonjson/common.hpp"

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace canonjson::value {

/**
 * Variant tag of a value node
 *
 * kUnsupported covers adapter node types outside the JSON data model
 * (e.g. nlohmann binary or discarded values).
 */
enum class ValueKind {
    kNull,
    kBoolean,
    kNumber,
    kString,
    kArray,
    kObject,
    kUnsupported
};

class ValueView;

/**
 * @brief One object member as exposed by a ValueView
 *
 * The key view borrows from the underlying tree and stays valid as long as
 * the tree does.
 */
struct Member
{
    std::string_view key;
    std::unique_ptr<const ValueView> value;
};

/**
 * @brief Borrowed, read-only view of one node in an externally owned tree
 *
 * Accessors other than kind() are only called when kind() reports the
 * matching variant.
 */
class ValueView
{
public:
    ValueView() = default;
    virtual ~ValueView() = default;

    ValueView(const ValueView&) = delete;
    ValueView& operator=(const ValueView&) = delete;
    ValueView(ValueView&&) = delete;
    ValueView& operator=(ValueView&&) = delete;

    [[nodiscard]] virtual ValueKind kind() const = 0;

    [[nodiscard]] virtual bool boolean() const = 0;

    /**
     * Numeric value in the double domain
     * @return Finite or non-finite double, or NumberOutOfRange when the
     *         node's number cannot be represented exactly as a double
     */
    [[nodiscard]] virtual Result<double> number() const = 0;

    /// UTF-8 bytes of a string node
    [[nodiscard]] virtual std::string_view string() const = 0;

    /// Element count of an array node
    [[nodiscard]] virtual std::size_t size() const = 0;

    [[nodiscard]] virtual std::unique_ptr<const ValueView> element(std::size_t index) const = 0;

    /// Members of an object node, in the tree's own (insignificant) order
    [[nodiscard]] virtual std::vector<Member> members() const = 0;
};

}  // namespace canonjson::value
