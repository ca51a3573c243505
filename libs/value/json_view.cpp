/**
 * @file json_view.cpp
 * @brief nlohmann::json parsing entry point
 */

#include "canonjson/json_view.hpp"

#include <format>
#include <string>

namespace canonjson::value {

namespace {

/// nlohmann out_of_range id for a number literal beyond the double range
constexpr int kNumberOverflowId = 406;

}  // namespace

Result<nlohmann::ordered_json> parse_json(std::string_view text)
{
    try {
        return nlohmann::ordered_json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::out_of_range& ex) {
        if (ex.id == kNumberOverflowId) {
            return std::unexpected(Error::make(
                "NumberOutOfRange", std::format("Number literal exceeds the double range: {}", ex.what())));
        }
        return std::unexpected(
            Error::make("ParseError", std::string("Failed to parse JSON: ") + ex.what()));
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::string("Failed to parse JSON: ") + ex.what()));
    }
}

}  // namespace canonjson::value
