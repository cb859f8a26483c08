#include <ragloop/llm/chat_model.h>

#include <string>

namespace ragloop::llm {

namespace {

std::optional<nlohmann::json> tryParseObject(std::string_view text) {
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace

Result<nlohmann::json> extractJsonObject(std::string_view content) {
    if (auto whole = tryParseObject(content)) {
        return *whole;
    }

    // ```json ... ``` fenced block
    if (auto fence = content.find("```"); fence != std::string_view::npos) {
        auto bodyStart = content.find('\n', fence);
        auto fenceEnd = bodyStart == std::string_view::npos
                            ? std::string_view::npos
                            : content.find("```", bodyStart);
        if (fenceEnd != std::string_view::npos) {
            if (auto fenced = tryParseObject(content.substr(bodyStart, fenceEnd - bodyStart))) {
                return *fenced;
            }
        }
    }

    // Outermost braces within surrounding prose
    auto open = content.find('{');
    auto close = content.rfind('}');
    if (open != std::string_view::npos && close != std::string_view::npos && close > open) {
        if (auto braced = tryParseObject(content.substr(open, close - open + 1))) {
            return *braced;
        }
    }

    return Error{ErrorCode::InvalidData, "model output contains no JSON object"};
}

std::optional<std::string> stringField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<double> numberField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

std::optional<bool> boolField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_boolean()) {
        return std::nullopt;
    }
    return it->get<bool>();
}

} // namespace ragloop::llm
