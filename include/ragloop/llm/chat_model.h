#pragma once

#include <ragloop/core/types.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace ragloop::llm {

/**
 * @brief One structured-output chat request
 *
 * `schema` is a JSON Schema object describing the expected reply; `schemaName` identifies the
 * request kind (providers that support named schemas receive it verbatim).
 */
struct StructuredPrompt {
    std::string system;
    std::string user;
    std::string schemaName;
    nlohmann::json schema = nlohmann::json::object();
    double temperature = 0.0;
    int maxTokens = 1000;
};

/**
 * @brief Chat model that answers with a JSON object conforming to a schema
 */
class IChatModel {
public:
    virtual ~IChatModel() = default;

    virtual Result<nlohmann::json> completeStructured(const StructuredPrompt& prompt,
                                                      std::stop_token stop) = 0;

    virtual std::string modelName() const = 0;
};

// Locate and parse the first JSON object in model output, tolerating code fences and prose
Result<nlohmann::json> extractJsonObject(std::string_view content);

// Typed field accessors for model replies; nullopt when missing or of the wrong type
std::optional<std::string> stringField(const nlohmann::json& obj, const char* key);
std::optional<double> numberField(const nlohmann::json& obj, const char* key);
std::optional<bool> boolField(const nlohmann::json& obj, const char* key);

} // namespace ragloop::llm
