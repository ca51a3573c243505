#pragma once

/**
 * @file json_view.hpp
 * @brief ValueView adapter over nlohmann::json trees
 */

#include "canonjson/common.hpp"
#include "canonjson/number.hpp"
#include "canonjson/value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace canonjson::value {

/**
 * @brief Borrowing ValueView over a nlohmann::basic_json node
 * @tparam BasicJson nlohmann::json or nlohmann::ordered_json
 *
 * The adapted node must outlive the view and every view derived from it.
 */
template <typename BasicJson>
class BasicJsonView final : public ValueView
{
public:
    explicit BasicJsonView(const BasicJson& node)
        : m_node(node)
    {}

    [[nodiscard]] ValueKind kind() const override
    {
        using nlohmann::detail::value_t;
        switch (m_node.type()) {
            case value_t::null:
                return ValueKind::kNull;
            case value_t::boolean:
                return ValueKind::kBoolean;
            case value_t::number_integer:
            case value_t::number_unsigned:
            case value_t::number_float:
                return ValueKind::kNumber;
            case value_t::string:
                return ValueKind::kString;
            case value_t::array:
                return ValueKind::kArray;
            case value_t::object:
                return ValueKind::kObject;
            case value_t::binary:
            case value_t::discarded:
                break;
        }
        return ValueKind::kUnsupported;
    }

    [[nodiscard]] bool boolean() const override { return m_node.template get<bool>(); }

    [[nodiscard]] Result<double> number() const override
    {
        if (m_node.is_number_unsigned()) {
            return canonical::integer_to_double(m_node.template get<std::uint64_t>());
        }
        if (m_node.is_number_integer()) {
            return canonical::integer_to_double(m_node.template get<std::int64_t>());
        }
        return m_node.template get<double>();
    }

    [[nodiscard]] std::string_view string() const override
    {
        return m_node.template get_ref<const typename BasicJson::string_t&>();
    }

    [[nodiscard]] std::size_t size() const override { return m_node.size(); }

    [[nodiscard]] std::unique_ptr<const ValueView> element(std::size_t index) const override
    {
        return std::make_unique<BasicJsonView>(m_node[index]);
    }

    [[nodiscard]] std::vector<Member> members() const override
    {
        std::vector<Member> result;
        result.reserve(m_node.size());
        for (auto it = m_node.cbegin(); it != m_node.cend(); ++it) {
            result.push_back(Member{.key = it.key(), .value = std::make_unique<BasicJsonView>(*it)});
        }
        return result;
    }

private:
    const BasicJson& m_node;
};

using JsonView = BasicJsonView<nlohmann::json>;
using OrderedJsonView = BasicJsonView<nlohmann::ordered_json>;

/**
 * Parse JSON text, keeping object members in document order
 * @param text UTF-8 JSON text
 * @return Parsed tree, NumberOutOfRange for a number literal beyond the
 *         double range, or ParseError
 */
[[nodiscard]] Result<nlohmann::ordered_json> parse_json(std::string_view text);

}  // namespace canonjson::value
