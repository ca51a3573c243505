/**
 * @file canonical_json.cpp
 * @brief Canonical JSON emitter
 */

#include "canonjson/canonical_json.hpp"

#include "canonjson/common.hpp"
#include "canonjson/json_view.hpp"
#include "canonjson/key_order.hpp"
#include "canonjson/number.hpp"
#include "canonjson/string_escape.hpp"

#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace canonjson::canonical {

namespace {

using value::Member;
using value::ValueKind;
using value::ValueView;

/**
 * @brief An open array or object on the emitter's work stack
 */
struct Frame
{
    std::unique_ptr<const ValueView> owner;  ///< Null for the borrowed root
    const ValueView* node = nullptr;
    bool is_object = false;
    std::size_t count = 0;
    std::size_t next = 0;          ///< Index of the next child to emit
    std::vector<Member> members;   ///< Objects only, in canonical order
};

class Emitter
{
public:
    explicit Emitter(const SerializeOptions& options)
        : m_options(options)
    {}

    [[nodiscard]] Result<std::string> run(const ValueView& root)
    {
        if (auto result = visit(nullptr, root); !result) {
            return std::unexpected(result.error());
        }

        while (!m_stack.empty()) {
            Frame& top = m_stack.back();
            if (top.next == top.count) {
                m_out.push_back(top.is_object ? '}' : ']');
                m_stack.pop_back();
                continue;
            }
            if (top.next > 0) {
                m_out.push_back(',');
            }
            const std::size_t index = top.next++;

            std::unique_ptr<const ValueView> child;
            if (top.is_object) {
                Member& member = top.members[index];
                if (auto result = append_escaped_string(member.key, m_out); !result) {
                    return std::unexpected(with_path(result.error()));
                }
                m_out.push_back(':');
                child = std::move(member.value);
            } else {
                child = top.node->element(index);
            }

            // top may dangle once visit() pushes a frame
            const ValueView& child_ref = *child;
            if (auto result = visit(std::move(child), child_ref); !result) {
                return std::unexpected(result.error());
            }
        }
        return std::move(m_out);
    }

private:
    [[nodiscard]] VoidResult visit(std::unique_ptr<const ValueView> owner, const ValueView& node)
    {
        switch (node.kind()) {
            case ValueKind::kNull:
                m_out += "null";
                return {};
            case ValueKind::kBoolean:
                m_out += node.boolean() ? "true" : "false";
                return {};
            case ValueKind::kNumber: {
                auto number = node.number();
                if (!number) {
                    return std::unexpected(with_path(number.error()));
                }
                auto text = format_number(*number);
                if (!text) {
                    return std::unexpected(with_path(text.error()));
                }
                m_out += *text;
                return {};
            }
            case ValueKind::kString:
                if (auto result = append_escaped_string(node.string(), m_out); !result) {
                    return std::unexpected(with_path(result.error()));
                }
                return {};
            case ValueKind::kArray:
                return open_container(std::move(owner), node, false);
            case ValueKind::kObject:
                return open_container(std::move(owner), node, true);
            case ValueKind::kUnsupported:
                break;
        }
        return std::unexpected(with_path(
            Error::make("UnsupportedValue", "Value has no JSON representation")));
    }

    [[nodiscard]] VoidResult open_container(std::unique_ptr<const ValueView> owner,
                                            const ValueView& node,
                                            bool is_object)
    {
        if (m_options.max_depth != 0 && m_stack.size() >= m_options.max_depth) {
            return std::unexpected(with_path(Error::make(
                "DepthLimitExceeded",
                std::format("Nesting deeper than {} levels", m_options.max_depth))));
        }

        Frame frame;
        frame.owner = std::move(owner);
        frame.node = &node;
        frame.is_object = is_object;
        if (is_object) {
            auto members = node.members();
            std::vector<std::string_view> keys;
            keys.reserve(members.size());
            for (const auto& member : members) {
                keys.push_back(member.key);
            }
            auto order = canonical_key_order(keys);
            if (!order) {
                return std::unexpected(with_path(order.error()));
            }
            frame.members.reserve(members.size());
            for (std::size_t idx : *order) {
                frame.members.push_back(std::move(members[idx]));
            }
            frame.count = frame.members.size();
        } else {
            frame.count = node.size();
        }

        m_out.push_back(is_object ? '{' : '[');
        m_stack.push_back(std::move(frame));
        return {};
    }

    /// JSONPath-like location of the value being visited, e.g. $.a[2]
    [[nodiscard]] std::string current_path() const
    {
        std::string path = "$";
        for (const auto& frame : m_stack) {
            if (frame.next == 0) {
                continue;
            }
            if (frame.is_object) {
                path += ".";
                path += frame.members[frame.next - 1].key;
            } else {
                path += std::format("[{}]", frame.next - 1);
            }
        }
        return path;
    }

    [[nodiscard]] Error with_path(Error error) const
    {
        error.message += std::format(" at: {}", current_path());
        return error;
    }

    const SerializeOptions& m_options;
    std::vector<Frame> m_stack;
    std::string m_out;
};

}  // namespace

Result<std::string> serialize(const ValueView& root, const SerializeOptions& options)
{
    Emitter emitter(options);
    return emitter.run(root);
}

Result<std::string> canonicalize(const nlohmann::json& j, const SerializeOptions& options)
{
    const value::JsonView view(j);
    return serialize(view, options);
}

Result<std::string> canonicalize(const nlohmann::ordered_json& j, const SerializeOptions& options)
{
    const value::OrderedJsonView view(j);
    return serialize(view, options);
}

Result<std::string> canonicalize_text(std::string_view text, const SerializeOptions& options)
{
    auto parsed = value::parse_json(text);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return canonicalize(*parsed, options);
}

Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

Result<std::string> hash_canonical(const nlohmann::ordered_json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

Result<bool> is_canonical(std::string_view text)
{
    auto canonical = canonicalize_text(text);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return *canonical == text;
}

}  // namespace canonjson::canonical
