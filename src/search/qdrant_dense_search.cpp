#include <ragloop/search/passage_payload.h>
#include <ragloop/search/qdrant_dense_search.h>

#include <spdlog/spdlog.h>

namespace ragloop::search {

QdrantDenseSearch::QdrantDenseSearch(QdrantConfig config, std::shared_ptr<net::JsonHttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {
    while (!config_.url.empty() && config_.url.back() == '/') {
        config_.url.pop_back();
    }
}

Result<std::vector<RankedResult>> QdrantDenseSearch::search(const Embedding& embedding,
                                                            std::size_t topK,
                                                            std::stop_token stop) {
    if (!http_) {
        return Error{ErrorCode::NotInitialized, "QdrantDenseSearch has no HTTP client"};
    }
    if (embedding.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty query embedding"};
    }

    nlohmann::json body;
    body["vector"] = embedding;
    body["limit"] = topK;
    body["with_payload"] = true;

    net::HeaderList headers;
    if (!config_.apiKey.empty()) {
        headers.emplace_back("api-key", config_.apiKey);
    }

    auto resp =
        http_->postJson(config_.url + "/collections/" + config_.collection + "/points/search",
                        body, headers, config_.requestTimeout, stop);
    if (!resp) {
        return resp.error();
    }
    auto parsed = parseSearchResponse(resp.value());
    if (parsed) {
        spdlog::debug("[Qdrant] {} hits from '{}'", parsed.value().size(), config_.collection);
    }
    return parsed;
}

Result<std::vector<RankedResult>>
QdrantDenseSearch::parseSearchResponse(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("result") || !response["result"].is_array()) {
        return Error{ErrorCode::InvalidData, "Qdrant response has no result array"};
    }
    std::vector<RankedResult> out;
    out.reserve(response["result"].size());
    for (const auto& point : response["result"]) {
        if (!point.is_object()) {
            continue;
        }
        RankedResult r;
        readPassagePayload(point.value("payload", nlohmann::json::object()), "text",
                           idToString(point.value("id", nlohmann::json())), r);
        if (r.id.empty()) {
            continue;
        }
        if (auto it = point.find("score"); it != point.end() && it->is_number()) {
            r.score = it->get<double>();
        }
        r.origin = RankOrigin::Dense;
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace ragloop::search
