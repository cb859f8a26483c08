#pragma once

#include <ragloop/llm/chat_model.h>
#include <ragloop/net/http_client.h>
#include <ragloop/search/retrieval_backends.h>

#include <chrono>
#include <memory>
#include <string>

namespace ragloop::llm {

/**
 * @brief Connection settings for an OpenAI-compatible endpoint
 */
struct OpenAiConfig {
    std::string baseUrl = "https://api.openai.com/v1";
    std::string apiKey;
    std::string chatModel = "gpt-4o-mini";
    std::string embeddingModel = "text-embedding-3-small";
    std::chrono::milliseconds requestTimeout{20000};
};

// Request body for /chat/completions with a json_schema response format
nlohmann::json buildChatRequest(const StructuredPrompt& prompt, const std::string& model);

// choices[0].message.content parsed as a JSON object
Result<nlohmann::json> parseChatCompletion(const nlohmann::json& response);

// data[0].embedding
Result<search::Embedding> parseEmbeddingResponse(const nlohmann::json& response);

class OpenAiChatModel : public IChatModel {
public:
    OpenAiChatModel(OpenAiConfig config, std::shared_ptr<net::JsonHttpClient> http);

    Result<nlohmann::json> completeStructured(const StructuredPrompt& prompt,
                                              std::stop_token stop) override;

    std::string modelName() const override { return config_.chatModel; }

private:
    OpenAiConfig config_;
    std::shared_ptr<net::JsonHttpClient> http_;
};

class OpenAiEmbedder : public search::IEmbedder {
public:
    OpenAiEmbedder(OpenAiConfig config, std::shared_ptr<net::JsonHttpClient> http);

    Result<search::Embedding> embedQuery(const std::string& text, std::stop_token stop) override;

    std::string modelName() const override { return config_.embeddingModel; }

private:
    OpenAiConfig config_;
    std::shared_ptr<net::JsonHttpClient> http_;
};

} // namespace ragloop::llm
