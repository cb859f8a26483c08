#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ragloop::search {

/**
 * @brief Which stage produced the ordering (and score) of a result
 */
enum class RankOrigin { Dense, Sparse, Fused, Reranked };

inline constexpr const char* rankOriginToString(RankOrigin origin) noexcept {
    switch (origin) {
        case RankOrigin::Dense:
            return "dense";
        case RankOrigin::Sparse:
            return "sparse";
        case RankOrigin::Fused:
            return "fused";
        case RankOrigin::Reranked:
            return "reranked";
    }
    return "unknown";
}

/**
 * @brief Provenance of a passage within the indexed corpus
 */
struct SourceMetadata {
    std::string documentId;
    std::string sourcePath;
    std::optional<int> page;
    std::optional<std::string> section;
};

/**
 * @brief A retrieved passage with its score and the stage that ranked it
 *
 * `id` identifies the passage across retrieval paths; fusion deduplicates on it.
 * `score` is comparable only among results that share the same origin.
 */
struct RankedResult {
    std::string id;
    std::string text;
    SourceMetadata source;
    double score = 0.0;
    RankOrigin origin = RankOrigin::Fused;
    std::string rationale; // judge justification, set when origin == Reranked
};

/**
 * @brief Output of reciprocal-rank fusion: deduplicated, sorted by fused score
 */
struct FusedCandidateSet {
    std::vector<RankedResult> items;
    std::size_t denseOnly = 0;
    std::size_t sparseOnly = 0;
    std::size_t overlap = 0;

    bool empty() const noexcept { return items.empty(); }
    std::size_t size() const noexcept { return items.size(); }
};

nlohmann::json toJson(const RankedResult& result);
nlohmann::json toJson(const std::vector<RankedResult>& results);

} // namespace ragloop::search
