#pragma once

#include <ragloop/search/ranked_result.h>

#include <cstddef>
#include <vector>

namespace ragloop::search {

inline constexpr double kDefaultRrfK = 60.0;

/**
 * @brief Reciprocal-rank fusion of a dense and a sparse ranked list
 *
 * Each identity receives 1 / (k + rank + 1) per list it appears in (rank is 0-based) and the
 * partial scores are summed. Ties are broken by earliest discovery: dense positions first, then
 * sparse positions. Only the first occurrence of an identity within one list contributes.
 *
 * Stateless; safe to call concurrently.
 */
class RankFusion {
public:
    explicit RankFusion(double k = kDefaultRrfK) : k_(k > 0.0 ? k : kDefaultRrfK) {}

    FusedCandidateSet fuse(const std::vector<RankedResult>& dense,
                           const std::vector<RankedResult>& sparse) const;

    double k() const noexcept { return k_; }

    static double partialScore(std::size_t rank, double k = kDefaultRrfK) noexcept {
        return 1.0 / (k + static_cast<double>(rank) + 1.0);
    }

private:
    double k_;
};

} // namespace ragloop::search
