#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ragloop::agent {

enum class ActionType { Retrieve, DirectResponse, Clarify };

inline constexpr const char* actionTypeToString(ActionType action) noexcept {
    switch (action) {
        case ActionType::Retrieve:
            return "retrieve";
        case ActionType::DirectResponse:
            return "direct_response";
        case ActionType::Clarify:
            return "clarify";
    }
    return "retrieve";
}

inline std::optional<ActionType> parseActionType(std::string_view s) noexcept {
    if (s == "retrieve")
        return ActionType::Retrieve;
    if (s == "direct_response")
        return ActionType::DirectResponse;
    if (s == "clarify")
        return ActionType::Clarify;
    return std::nullopt;
}

/**
 * @brief Whether and how to retrieve for a query; decided once per request
 */
struct Plan {
    bool needsRetrieval = true;
    ActionType action = ActionType::Retrieve;
    std::string reasoning;
    std::optional<std::string> suggestedResponse;
};

} // namespace ragloop::agent
