#include <ragloop/core/text_utils.h>
#include <ragloop/llm/openai_client.h>

#include <spdlog/spdlog.h>

namespace ragloop::llm {

namespace {

std::string trimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

net::HeaderList authHeaders(const OpenAiConfig& config) {
    net::HeaderList headers;
    if (!config.apiKey.empty()) {
        headers.emplace_back("Authorization", "Bearer " + config.apiKey);
    }
    return headers;
}

} // namespace

nlohmann::json buildChatRequest(const StructuredPrompt& prompt, const std::string& model) {
    nlohmann::json body;
    body["model"] = model;
    body["temperature"] = prompt.temperature;
    body["max_tokens"] = prompt.maxTokens;
    body["messages"] = nlohmann::json::array({
        {{"role", "system"}, {"content", text::sanitizeUtf8(prompt.system)}},
        {{"role", "user"}, {"content", text::sanitizeUtf8(prompt.user)}},
    });
    body["response_format"] = {
        {"type", "json_schema"},
        {"json_schema",
         {{"name", prompt.schemaName.empty() ? "response" : prompt.schemaName},
          {"schema", prompt.schema}}}};
    return body;
}

Result<nlohmann::json> parseChatCompletion(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("choices") ||
        !response["choices"].is_array() || response["choices"].empty()) {
        return Error{ErrorCode::InvalidData, "chat completion has no choices"};
    }
    const auto& message = response["choices"][0].value("message", nlohmann::json::object());
    if (auto refusal = stringField(message, "refusal")) {
        return Error{ErrorCode::InvalidData, "model refused: " + *refusal};
    }
    auto content = stringField(message, "content");
    if (!content) {
        return Error{ErrorCode::InvalidData, "chat completion has no message content"};
    }
    return extractJsonObject(*content);
}

Result<search::Embedding> parseEmbeddingResponse(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("data") || !response["data"].is_array() ||
        response["data"].empty()) {
        return Error{ErrorCode::InvalidData, "embedding response has no data"};
    }
    const auto& first = response["data"][0];
    if (!first.is_object() || !first.contains("embedding") || !first["embedding"].is_array()) {
        return Error{ErrorCode::InvalidData, "embedding response has no embedding vector"};
    }
    search::Embedding out;
    out.reserve(first["embedding"].size());
    for (const auto& v : first["embedding"]) {
        if (!v.is_number()) {
            return Error{ErrorCode::InvalidData, "embedding contains a non-numeric value"};
        }
        out.push_back(v.get<float>());
    }
    if (out.empty()) {
        return Error{ErrorCode::InvalidData, "embedding vector is empty"};
    }
    return out;
}

OpenAiChatModel::OpenAiChatModel(OpenAiConfig config, std::shared_ptr<net::JsonHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    config_.baseUrl = trimTrailingSlash(config_.baseUrl);
}

Result<nlohmann::json> OpenAiChatModel::completeStructured(const StructuredPrompt& prompt,
                                                           std::stop_token stop) {
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "OpenAiChatModel has no HTTP client"};
    }
    auto resp = http_->postJson(config_.baseUrl + "/chat/completions",
                                buildChatRequest(prompt, config_.chatModel), authHeaders(config_),
                                config_.requestTimeout, stop);
    if (!resp) {
        spdlog::debug("[OpenAI] {} request failed: {}", prompt.schemaName, resp.error().message);
        return resp.error();
    }
    return parseChatCompletion(resp.value());
}

OpenAiEmbedder::OpenAiEmbedder(OpenAiConfig config, std::shared_ptr<net::JsonHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    config_.baseUrl = trimTrailingSlash(config_.baseUrl);
}

Result<search::Embedding> OpenAiEmbedder::embedQuery(const std::string& text,
                                                     std::stop_token stop) {
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "OpenAiEmbedder has no HTTP client"};
    }
    nlohmann::json body;
    body["model"] = config_.embeddingModel;
    body["input"] = nlohmann::json::array({text::sanitizeUtf8(text)});

    auto resp = http_->postJson(config_.baseUrl + "/embeddings", body, authHeaders(config_),
                                config_.requestTimeout, stop);
    if (!resp) {
        return resp.error();
    }
    return parseEmbeddingResponse(resp.value());
}

} // namespace ragloop::llm
