#pragma once

#include <ragloop/llm/chat_model.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace ragloop::agent {

enum class SuggestedAction { Proceed, Reformulate, Expand, Decompose, Clarify };

inline constexpr const char* suggestedActionToString(SuggestedAction action) noexcept {
    switch (action) {
        case SuggestedAction::Proceed:
            return "proceed";
        case SuggestedAction::Reformulate:
            return "reformulate";
        case SuggestedAction::Expand:
            return "expand";
        case SuggestedAction::Decompose:
            return "decompose";
        case SuggestedAction::Clarify:
            return "clarify";
    }
    return "proceed";
}

// Unknown strings map to Proceed
SuggestedAction parseSuggestedAction(std::string_view s) noexcept;

struct QualityEvaluation {
    double score = 1.0;
    bool isAdequate = true;
    SuggestedAction suggestedAction = SuggestedAction::Proceed;
    std::string reasoning;
    bool degraded = false; // judge unavailable; values are the fail-open defaults
};

struct QualityEvaluatorConfig {
    std::size_t maxPassages = 5;
    std::size_t passageChars = 500;
    int maxTokens = 500;
    double temperature = 0.0;
};

/**
 * @brief Judges whether retrieved passages can answer the query
 *
 * Fails open: an unavailable judge reports the results as adequate.
 */
class QualityEvaluator {
public:
    explicit QualityEvaluator(std::shared_ptr<llm::IChatModel> chat,
                              QualityEvaluatorConfig config = {});

    QualityEvaluation evaluate(const std::string& query, const std::vector<std::string>& passages,
                               int attempt, std::stop_token stop) const;

    static QualityEvaluation failOpen(const std::string& reason);

    static Result<QualityEvaluation> parseEvaluation(const nlohmann::json& reply);

private:
    std::shared_ptr<llm::IChatModel> chat_;
    QualityEvaluatorConfig config_;
};

} // namespace ragloop::agent
