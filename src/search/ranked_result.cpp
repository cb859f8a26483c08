#include <ragloop/core/text_utils.h>
#include <ragloop/search/ranked_result.h>

namespace ragloop::search {

nlohmann::json toJson(const RankedResult& result) {
    nlohmann::json j;
    j["id"] = text::sanitizeUtf8(result.id);
    j["text"] = text::sanitizeUtf8(result.text);
    j["score"] = result.score;
    j["rank_origin"] = rankOriginToString(result.origin);

    nlohmann::json source;
    source["document_id"] = text::sanitizeUtf8(result.source.documentId);
    source["source"] = text::sanitizeUtf8(result.source.sourcePath);
    source["page"] = result.source.page ? nlohmann::json(*result.source.page) : nlohmann::json();
    source["section"] = result.source.section
                            ? nlohmann::json(text::sanitizeUtf8(*result.source.section))
                            : nlohmann::json();
    j["source"] = std::move(source);

    if (!result.rationale.empty()) {
        j["rationale"] = text::sanitizeUtf8(result.rationale);
    }
    return j;
}

nlohmann::json toJson(const std::vector<RankedResult>& results) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : results) {
        arr.push_back(toJson(r));
    }
    return arr;
}

} // namespace ragloop::search
