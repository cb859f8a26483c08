#include <ragloop/core/text_utils.h>
#include <ragloop/search/elastic_sparse_search.h>
#include <ragloop/search/passage_payload.h>

#include <spdlog/spdlog.h>

namespace ragloop::search {

ElasticSparseSearch::ElasticSparseSearch(ElasticConfig config,
                                         std::shared_ptr<net::JsonHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    while (!config_.url.empty() && config_.url.back() == '/') {
        config_.url.pop_back();
    }
}

nlohmann::json ElasticSparseSearch::buildQuery(const std::string& text, std::size_t topK) const {
    nlohmann::json body;
    body["size"] = topK;
    body["query"]["match"][config_.textField]["query"] = text::sanitizeUtf8(text);
    return body;
}

Result<std::vector<RankedResult>> ElasticSparseSearch::search(const std::string& text,
                                                              std::size_t topK,
                                                              std::stop_token stop) {
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "ElasticSparseSearch has no HTTP client"};
    }

    net::HeaderList headers;
    if (!config_.apiKey.empty()) {
        headers.emplace_back("Authorization", "ApiKey " + config_.apiKey);
    }

    auto resp = http_->postJson(config_.url + "/" + config_.index + "/_search",
                                buildQuery(text, topK), headers, config_.requestTimeout, stop);
    if (!resp) {
        return resp.error();
    }
    auto parsed = parseSearchResponse(resp.value(), config_.textField);
    if (parsed) {
        spdlog::debug("[Elastic] {} hits from '{}'", parsed.value().size(), config_.index);
    }
    return parsed;
}

Result<std::vector<RankedResult>>
ElasticSparseSearch::parseSearchResponse(const nlohmann::json& response,
                                         const std::string& textField) {
    if (!response.is_object() || !response.contains("hits") || !response["hits"].is_object() ||
        !response["hits"].contains("hits") || !response["hits"]["hits"].is_array()) {
        return Error{ErrorCode::InvalidData, "search response has no hits array"};
    }
    std::vector<RankedResult> out;
    for (const auto& hit : response["hits"]["hits"]) {
        if (!hit.is_object()) {
            continue;
        }
        // Passages sharing no term with the query score zero; they are not matches
        const double score = hit.contains("_score") && hit["_score"].is_number()
                                 ? hit["_score"].get<double>()
                                 : 0.0;
        if (score <= 0.0) {
            continue;
        }
        RankedResult r;
        readPassagePayload(hit.value("_source", nlohmann::json::object()), textField,
                           idToString(hit.value("_id", nlohmann::json())), r);
        if (r.id.empty()) {
            continue;
        }
        r.score = score;
        r.origin = RankOrigin::Sparse;
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace ragloop::search
