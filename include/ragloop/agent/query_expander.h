#pragma once

#include <ragloop/llm/chat_model.h>

#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace ragloop::agent {

/**
 * @brief Alternative phrasings of a query
 *
 * `alternatives` is never empty; on failure it holds just the original query.
 */
struct QueryExpansion {
    std::string originalQuery;
    std::vector<std::string> alternatives;
    std::string reasoning;
    bool fallback = false;
};

/**
 * @brief A complex query split into focused sub-queries
 */
struct QueryDecomposition {
    std::string originalQuery;
    std::vector<std::string> subQueries;
    std::string synthesisStrategy;
    bool fallback = false;
};

struct QueryExpanderConfig {
    std::size_t maxAlternatives = 5;
    std::size_t maxSubQueries = 4;
    double expansionTemperature = 0.5;
    double decompositionTemperature = 0.3;
    int maxTokens = 500;
};

class QueryExpander {
public:
    explicit QueryExpander(std::shared_ptr<llm::IChatModel> chat, QueryExpanderConfig config = {});

    QueryExpansion expand(const std::string& query, std::stop_token stop) const;

    QueryDecomposition decompose(const std::string& query, std::stop_token stop) const;

    static QueryExpansion fallbackExpansion(const std::string& query, const std::string& reason);
    static QueryDecomposition fallbackDecomposition(const std::string& query,
                                                    const std::string& reason);

    // Trimmed, non-empty, case-insensitively unique entries different from `original`
    static std::vector<std::string> cleanAlternatives(const nlohmann::json& list,
                                                      const std::string& original,
                                                      std::size_t limit);

    // Two or more conjunction/question markers, or more than 15 words
    static bool looksComplex(const std::string& query);

private:
    std::shared_ptr<llm::IChatModel> chat_;
    QueryExpanderConfig config_;
};

} // namespace ragloop::agent
