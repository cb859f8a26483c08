#include <ragloop/agent/query_expander.h>
#include <ragloop/core/text_utils.h>

#include <spdlog/spdlog.h>

#include <array>
#include <sstream>
#include <unordered_set>

namespace ragloop::agent {

namespace {

const nlohmann::json& expansionSchema() {
    static const nlohmann::json schema = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "expanded_queries": {"type": "array", "items": {"type": "string"}},
            "reasoning": {"type": "string"}
        },
        "required": ["expanded_queries", "reasoning"]
    })");
    return schema;
}

const nlohmann::json& decompositionSchema() {
    static const nlohmann::json schema = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "sub_queries": {"type": "array", "items": {"type": "string"}},
            "synthesis_strategy": {"type": "string"}
        },
        "required": ["sub_queries", "synthesis_strategy"]
    })");
    return schema;
}

constexpr const char* kExpandPrompt =
    "You are an expert at query expansion for information retrieval.\n\n"
    "Generate 3-5 alternative phrasings of the query that:\n"
    "1. Use synonyms and related terms\n"
    "2. Add specificity or context\n"
    "3. Rephrase from different angles\n"
    "4. Cover variations in how the information might appear in documents\n\n"
    "Keep the core intent but vary the expression.";

constexpr const char* kDecomposePrompt =
    "You are an expert at breaking down complex questions.\n\n"
    "Identify whether the query contains multiple questions or aspects, break it into 2-4 "
    "simpler, focused sub-queries, and explain how to synthesize the answers.\n\n"
    "If the query is already simple, return it as a single sub-query.";

} // namespace

QueryExpander::QueryExpander(std::shared_ptr<llm::IChatModel> chat, QueryExpanderConfig config)
    : chat_(std::move(chat)), config_(config) {}

QueryExpansion QueryExpander::fallbackExpansion(const std::string& query,
                                                const std::string& reason) {
    return QueryExpansion{query, {query}, "Fallback: " + reason, true};
}

QueryDecomposition QueryExpander::fallbackDecomposition(const std::string& query,
                                                        const std::string& reason) {
    return QueryDecomposition{query, {query}, "Fallback: " + reason, true};
}

std::vector<std::string> QueryExpander::cleanAlternatives(const nlohmann::json& list,
                                                          const std::string& original,
                                                          std::size_t limit) {
    std::vector<std::string> out;
    if (!list.is_array()) {
        return out;
    }
    std::unordered_set<std::string> seen{text::toLower(text::trimCopy(original))};
    for (const auto& entry : list) {
        if (out.size() >= limit) {
            break;
        }
        if (!entry.is_string()) {
            continue;
        }
        auto candidate = text::trimCopy(entry.get<std::string>());
        if (candidate.empty()) {
            continue;
        }
        if (!seen.insert(text::toLower(candidate)).second) {
            continue;
        }
        out.push_back(std::move(candidate));
    }
    return out;
}

QueryExpansion QueryExpander::expand(const std::string& query, std::stop_token stop) const {
    if (!chat_) {
        return fallbackExpansion(query, "no chat model configured");
    }

    llm::StructuredPrompt prompt;
    prompt.system = kExpandPrompt;
    prompt.user = "Expand this query: \"" + query + "\"";
    prompt.schemaName = "query_expansion";
    prompt.schema = expansionSchema();
    prompt.temperature = config_.expansionTemperature;
    prompt.maxTokens = config_.maxTokens;

    auto reply = chat_->completeStructured(prompt, stop);
    if (!reply) {
        spdlog::warn("[Expander] expansion failed: {}", reply.error().message);
        return fallbackExpansion(query, reply.error().message);
    }
    const auto& obj = reply.value();
    auto alternatives = cleanAlternatives(obj.is_object() && obj.contains("expanded_queries")
                                              ? obj["expanded_queries"]
                                              : nlohmann::json(),
                                          query, config_.maxAlternatives);
    if (alternatives.empty()) {
        spdlog::warn("[Expander] expansion reply held no usable alternatives");
        return fallbackExpansion(query, "no usable alternatives in reply");
    }
    spdlog::debug("[Expander] generated {} alternatives", alternatives.size());
    return QueryExpansion{query, std::move(alternatives),
                          llm::stringField(obj, "reasoning").value_or(""), false};
}

QueryDecomposition QueryExpander::decompose(const std::string& query, std::stop_token stop) const {
    if (!chat_) {
        return fallbackDecomposition(query, "no chat model configured");
    }

    llm::StructuredPrompt prompt;
    prompt.system = kDecomposePrompt;
    prompt.user = "Decompose this query: \"" + query + "\"";
    prompt.schemaName = "query_decomposition";
    prompt.schema = decompositionSchema();
    prompt.temperature = config_.decompositionTemperature;
    prompt.maxTokens = config_.maxTokens;

    auto reply = chat_->completeStructured(prompt, stop);
    if (!reply) {
        spdlog::warn("[Expander] decomposition failed: {}", reply.error().message);
        return fallbackDecomposition(query, reply.error().message);
    }
    const auto& obj = reply.value();
    // A simple query may legitimately come back as itself, so the original is not excluded
    auto subQueries = cleanAlternatives(
        obj.is_object() && obj.contains("sub_queries") ? obj["sub_queries"] : nlohmann::json(),
        std::string{}, config_.maxSubQueries);
    if (subQueries.empty()) {
        return fallbackDecomposition(query, "no usable sub-queries in reply");
    }
    spdlog::debug("[Expander] decomposed into {} sub-queries", subQueries.size());
    return QueryDecomposition{query, std::move(subQueries),
                              llm::stringField(obj, "synthesis_strategy").value_or(""), false};
}

bool QueryExpander::looksComplex(const std::string& query) {
    static constexpr std::array<const char*, 5> kWordMarkers = {"and", "or", "also",
                                                                "additionally", "furthermore"};
    std::istringstream words(text::toLower(query));
    std::unordered_set<std::string> present;
    std::size_t wordCount = 0;
    for (std::string w; words >> w;) {
        ++wordCount;
        while (!w.empty() && std::ispunct(static_cast<unsigned char>(w.back()))) {
            w.pop_back();
        }
        present.insert(w);
    }

    std::size_t markers = query.find('?') != std::string::npos ? 1 : 0;
    for (const char* m : kWordMarkers) {
        if (present.count(m)) {
            ++markers;
        }
    }
    return markers >= 2 || wordCount > 15;
}

} // namespace ragloop::agent
