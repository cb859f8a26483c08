// Catch2 tests for OpenAI-compatible request building and response parsing

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <ragloop/llm/openai_client.h>

using namespace ragloop;
using namespace ragloop::llm;
using Catch::Approx;
using nlohmann::json;

TEST_CASE("buildChatRequest", "[llm][openai][catch2]") {
    StructuredPrompt prompt;
    prompt.system = "You route questions.";
    prompt.user = "Query: hello";
    prompt.schemaName = "intent_plan";
    prompt.schema = {{"type", "object"}};
    prompt.temperature = 0.3;
    prompt.maxTokens = 250;

    auto body = buildChatRequest(prompt, "gpt-4o-mini");

    CHECK(body["model"] == "gpt-4o-mini");
    CHECK(body["temperature"].get<double>() == Approx(0.3));
    CHECK(body["max_tokens"] == 250);
    REQUIRE(body["messages"].size() == 2);
    CHECK(body["messages"][0]["role"] == "system");
    CHECK(body["messages"][1]["content"] == "Query: hello");
    CHECK(body["response_format"]["type"] == "json_schema");
    CHECK(body["response_format"]["json_schema"]["name"] == "intent_plan");
    CHECK(body["response_format"]["json_schema"]["schema"]["type"] == "object");
}

TEST_CASE("buildChatRequest replaces invalid UTF-8", "[llm][openai][catch2]") {
    StructuredPrompt prompt;
    prompt.user = std::string("bad \xff byte");
    auto body = buildChatRequest(prompt, "m");
    CHECK(body["messages"][1]["content"] == "bad ? byte");
    CHECK_NOTHROW(body.dump());
}

TEST_CASE("parseChatCompletion", "[llm][openai][catch2]") {
    SECTION("content holding JSON") {
        auto response = json::parse(R"({"choices": [{"message": {
            "role": "assistant",
            "content": "{\"needs_retrieval\": true, \"action\": \"retrieve\"}"}}]})");
        auto r = parseChatCompletion(response);
        REQUIRE(r);
        CHECK(r.value()["action"] == "retrieve");
    }

    SECTION("refusal") {
        auto r = parseChatCompletion(
            json::parse(R"({"choices": [{"message": {"refusal": "cannot help"}}]})"));
        REQUIRE_FALSE(r);
        CHECK(r.error().message.find("cannot help") != std::string::npos);
    }

    SECTION("no choices") {
        auto r = parseChatCompletion(json::parse(R"({"choices": []})"));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidData);
    }

    SECTION("content that is not JSON") {
        auto r = parseChatCompletion(
            json::parse(R"({"choices": [{"message": {"content": "Sure thing!"}}]})"));
        CHECK_FALSE(r);
    }
}

TEST_CASE("parseEmbeddingResponse", "[llm][openai][catch2]") {
    SECTION("first vector") {
        auto r = parseEmbeddingResponse(
            json::parse(R"({"data": [{"embedding": [0.5, -0.25, 1]}], "model": "m"})"));
        REQUIRE(r);
        REQUIRE(r.value().size() == 3);
        CHECK(r.value()[1] == Approx(-0.25f));
    }

    SECTION("malformed") {
        CHECK_FALSE(parseEmbeddingResponse(json::parse(R"({"data": []})")));
        CHECK_FALSE(parseEmbeddingResponse(json::parse(R"({"data": [{"embedding": []}]})")));
        CHECK_FALSE(
            parseEmbeddingResponse(json::parse(R"({"data": [{"embedding": [1, "x"]}]})")));
    }
}

TEST_CASE("OpenAI clients without HTTP", "[llm][openai][catch2]") {
    OpenAiChatModel chat(OpenAiConfig{}, nullptr);
    OpenAiEmbedder embedder(OpenAiConfig{}, nullptr);

    CHECK(chat.modelName() == "gpt-4o-mini");
    CHECK(embedder.modelName() == "text-embedding-3-small");
    auto c = chat.completeStructured(StructuredPrompt{}, {});
    REQUIRE_FALSE(c);
    CHECK(c.error().code == ErrorCode::NotInitialized);
    CHECK_FALSE(embedder.embedQuery("q", {}));
}
