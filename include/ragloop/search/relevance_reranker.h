#pragma once

#include <ragloop/llm/chat_model.h>
#include <ragloop/search/ranked_result.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace ragloop::search {

struct RerankerConfig {
    std::size_t previewChars = 500; // passage bytes shown to the judge
    int maxTokens = 1000;
    double temperature = 0.0;
};

/**
 * @brief Result of one reranking pass
 *
 * `origin` is Reranked when the judge's scores were applied, Fused when the fusion order was
 * kept (judge unavailable, malformed reply, or nothing to reorder). `items` always holds every
 * input candidate exactly once.
 */
struct RerankOutcome {
    RankOrigin origin = RankOrigin::Fused;
    std::vector<RankedResult> items;
    std::size_t scoredCount = 0;
    std::string failureReason; // non-empty when the judge call degraded

    bool degraded() const noexcept { return !failureReason.empty(); }
};

struct JudgeScore {
    double score = 0.0;
    std::string reasoning;
};

/**
 * @brief LLM relevance judge over the top of a fused candidate set
 *
 * Scores the first `cap` candidates in a single batched call and reorders them by score
 * (ties keep fusion order). Candidates past the cap are appended unchanged.
 */
class RelevanceReranker {
public:
    explicit RelevanceReranker(std::shared_ptr<llm::IChatModel> chat, RerankerConfig config = {});

    RerankOutcome rerank(const std::string& query, const FusedCandidateSet& candidates,
                         std::size_t cap, std::stop_token stop) const;

    // Fusion order, unchanged
    static RerankOutcome fallback(const FusedCandidateSet& candidates, std::string reason);

    llm::StructuredPrompt buildPrompt(const std::string& query,
                                      const std::vector<RankedResult>& candidates,
                                      std::size_t count) const;

    // One slot per candidate; nullopt where the judge gave no usable score
    static Result<std::vector<std::optional<JudgeScore>>> parseRankings(const nlohmann::json& reply,
                                                                        std::size_t count);

private:
    std::shared_ptr<llm::IChatModel> chat_;
    RerankerConfig config_;
};

} // namespace ragloop::search
