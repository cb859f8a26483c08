#include <ragloop/search/rank_fusion.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <unordered_map>

namespace ragloop::search {

namespace {

struct FusionEntry {
    RankedResult result;
    double score = 0.0;
    std::size_t discovery = 0; // position in dense-then-sparse discovery order
    bool inDense = false;
    bool inSparse = false;
};

} // namespace

FusedCandidateSet RankFusion::fuse(const std::vector<RankedResult>& dense,
                                   const std::vector<RankedResult>& sparse) const {
    std::vector<FusionEntry> entries;
    entries.reserve(dense.size() + sparse.size());
    std::unordered_map<std::string, std::size_t> index;

    auto accumulate = [&](const std::vector<RankedResult>& list, bool isDense) {
        for (std::size_t rank = 0; rank < list.size(); ++rank) {
            const auto& item = list[rank];
            const double partial = partialScore(rank, k_);
            auto it = index.find(item.id);
            if (it == index.end()) {
                FusionEntry entry;
                entry.result = item;
                entry.score = partial;
                entry.discovery = entries.size();
                entry.inDense = isDense;
                entry.inSparse = !isDense;
                index.emplace(item.id, entries.size());
                entries.push_back(std::move(entry));
                continue;
            }
            auto& entry = entries[it->second];
            if (isDense ? entry.inDense : entry.inSparse) {
                continue; // duplicate within the same list
            }
            entry.score += partial;
            (isDense ? entry.inDense : entry.inSparse) = true;
        }
    };

    accumulate(dense, true);
    accumulate(sparse, false);

    std::sort(entries.begin(), entries.end(), [](const FusionEntry& a, const FusionEntry& b) {
        if (a.score != b.score)
            return a.score > b.score;
        return a.discovery < b.discovery;
    });

    FusedCandidateSet out;
    out.items.reserve(entries.size());
    for (auto& entry : entries) {
        if (entry.inDense && entry.inSparse) {
            ++out.overlap;
        } else if (entry.inDense) {
            ++out.denseOnly;
        } else {
            ++out.sparseOnly;
        }
        entry.result.score = entry.score;
        entry.result.origin = RankOrigin::Fused;
        entry.result.rationale.clear();
        out.items.push_back(std::move(entry.result));
    }

    spdlog::debug("[RankFusion] {} dense + {} sparse -> {} fused ({} overlap, k={})",
                  dense.size(), sparse.size(), out.items.size(), out.overlap, k_);
    return out;
}

} // namespace ragloop::search
