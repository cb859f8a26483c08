#pragma once

#include <ragloop/net/http_client.h>
#include <ragloop/search/retrieval_backends.h>

#include <chrono>
#include <memory>
#include <string>

namespace ragloop::search {

struct QdrantConfig {
    std::string url = "http://localhost:6333";
    std::string collection = "documents";
    std::string apiKey;
    std::chrono::milliseconds requestTimeout{10000};
};

/**
 * @brief Dense retrieval against a Qdrant collection over its REST API
 *
 * Points are expected to carry the passage in their payload: `text`, `document_id`, `source`,
 * and optionally `chunk_id`, `page_number`, `section_title`.
 */
class QdrantDenseSearch : public IDenseSearch {
public:
    QdrantDenseSearch(QdrantConfig config, std::shared_ptr<net::JsonHttpClient> http);

    Result<std::vector<RankedResult>> search(const Embedding& embedding, std::size_t topK,
                                             std::stop_token stop) override;

    static Result<std::vector<RankedResult>> parseSearchResponse(const nlohmann::json& response);

private:
    QdrantConfig config_;
    std::shared_ptr<net::JsonHttpClient> http_;
};

} // namespace ragloop::search
