#include <ragloop/core/text_utils.h>
#include <ragloop/search/relevance_reranker.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace ragloop::search {

namespace {

const nlohmann::json& rankingsSchema() {
    static const nlohmann::json schema = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "rankings": {
                "type": "array",
                "items": {
                    "type": "object",
                    "properties": {
                        "passage_index": {"type": "integer"},
                        "score": {"type": "number"},
                        "reasoning": {"type": "string"}
                    },
                    "required": ["passage_index", "score", "reasoning"]
                }
            }
        },
        "required": ["rankings"]
    })");
    return schema;
}

constexpr const char* kSystemPrompt =
    "You are a relevance judge for a document retrieval system. Score each passage for how well "
    "it answers the user's query on a scale from 0.0 (irrelevant) to 1.0 (directly answers it). "
    "Consider semantic relevance, not just keyword overlap. Reply with JSON only.";

} // namespace

RelevanceReranker::RelevanceReranker(std::shared_ptr<llm::IChatModel> chat, RerankerConfig config)
    : chat_(std::move(chat)), config_(config) {}

llm::StructuredPrompt RelevanceReranker::buildPrompt(const std::string& query,
                                                     const std::vector<RankedResult>& candidates,
                                                     std::size_t count) const {
    std::ostringstream user;
    user << "Query: " << query << "\n\nPassages:\n";
    for (std::size_t i = 0; i < count && i < candidates.size(); ++i) {
        user << "\n[" << i << "] " << text::truncateUtf8(candidates[i].text, config_.previewChars)
             << "\n";
    }
    user << "\nReturn {\"rankings\": [{\"passage_index\": <index>, \"score\": <0.0-1.0>, "
            "\"reasoning\": <one sentence>}]} with one entry per passage.";

    llm::StructuredPrompt prompt;
    prompt.system = kSystemPrompt;
    prompt.user = user.str();
    prompt.schemaName = "relevance_rankings";
    prompt.schema = rankingsSchema();
    prompt.temperature = config_.temperature;
    prompt.maxTokens = config_.maxTokens;
    return prompt;
}

Result<std::vector<std::optional<JudgeScore>>>
RelevanceReranker::parseRankings(const nlohmann::json& reply, std::size_t count) {
    if (!reply.is_object() || !reply.contains("rankings") || !reply["rankings"].is_array()) {
        return Error{ErrorCode::InvalidData, "judge reply has no rankings array"};
    }
    std::vector<std::optional<JudgeScore>> scores(count);
    std::size_t usable = 0;
    for (const auto& entry : reply["rankings"]) {
        if (!entry.is_object()) {
            continue;
        }
        auto idx = entry.find("passage_index");
        auto score = llm::numberField(entry, "score");
        if (idx == entry.end() || !idx->is_number_integer() || !score) {
            continue;
        }
        const auto index = idx->get<long long>();
        if (index < 0 || static_cast<std::size_t>(index) >= count) {
            continue;
        }
        auto& slot = scores[static_cast<std::size_t>(index)];
        if (slot) {
            continue; // first score for a passage wins
        }
        slot = JudgeScore{std::clamp(*score, 0.0, 1.0),
                          llm::stringField(entry, "reasoning").value_or("")};
        ++usable;
    }
    if (usable == 0) {
        return Error{ErrorCode::InvalidData, "judge reply scored no candidate"};
    }
    return scores;
}

RerankOutcome RelevanceReranker::fallback(const FusedCandidateSet& candidates, std::string reason) {
    RerankOutcome outcome;
    outcome.origin = RankOrigin::Fused;
    outcome.items = candidates.items;
    for (auto& item : outcome.items) {
        item.origin = RankOrigin::Fused;
    }
    outcome.failureReason = std::move(reason);
    return outcome;
}

RerankOutcome RelevanceReranker::rerank(const std::string& query,
                                        const FusedCandidateSet& candidates, std::size_t cap,
                                        std::stop_token stop) const {
    const std::size_t count = std::min(std::max<std::size_t>(cap, 1), candidates.size());
    if (count < 2) {
        return fallback(candidates, "");
    }
    if (!chat_) {
        return fallback(candidates, "no chat model configured");
    }

    auto reply = chat_->completeStructured(buildPrompt(query, candidates.items, count), stop);
    if (!reply) {
        spdlog::warn("[Reranker] judge call failed, keeping fusion order: {}",
                     reply.error().message);
        return fallback(candidates, reply.error().message);
    }
    auto parsed = parseRankings(reply.value(), count);
    if (!parsed) {
        spdlog::warn("[Reranker] malformed judge reply, keeping fusion order: {}",
                     parsed.error().message);
        return fallback(candidates, parsed.error().message);
    }
    const auto& scores = parsed.value();

    std::vector<std::size_t> scored;
    std::vector<std::size_t> unscored;
    for (std::size_t i = 0; i < count; ++i) {
        (scores[i] ? scored : unscored).push_back(i);
    }
    std::stable_sort(scored.begin(), scored.end(), [&](std::size_t a, std::size_t b) {
        return scores[a]->score > scores[b]->score;
    });

    RerankOutcome outcome;
    outcome.origin = RankOrigin::Reranked;
    outcome.scoredCount = scored.size();
    outcome.items.reserve(candidates.size());
    for (auto i : scored) {
        RankedResult r = candidates.items[i];
        r.score = scores[i]->score;
        r.origin = RankOrigin::Reranked;
        r.rationale = scores[i]->reasoning;
        outcome.items.push_back(std::move(r));
    }
    for (auto i : unscored) {
        outcome.items.push_back(candidates.items[i]);
    }
    for (std::size_t i = count; i < candidates.size(); ++i) {
        outcome.items.push_back(candidates.items[i]);
    }

    spdlog::debug("[Reranker] judged {} of {} candidates ({} scored)", count, candidates.size(),
                  scored.size());
    return outcome;
}

} // namespace ragloop::search
