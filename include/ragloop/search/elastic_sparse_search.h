#pragma once

#include <ragloop/net/http_client.h>
#include <ragloop/search/retrieval_backends.h>

#include <chrono>
#include <memory>
#include <string>

namespace ragloop::search {

struct ElasticConfig {
    std::string url = "http://localhost:9200";
    std::string index = "documents";
    std::string textField = "text";
    std::string apiKey;
    std::chrono::milliseconds requestTimeout{10000};
};

/**
 * @brief BM25 retrieval through an Elasticsearch/OpenSearch `match` query
 */
class ElasticSparseSearch : public ISparseSearch {
public:
    ElasticSparseSearch(ElasticConfig config, std::shared_ptr<net::JsonHttpClient> http);

    Result<std::vector<RankedResult>> search(const std::string& text, std::size_t topK,
                                             std::stop_token stop) override;

    nlohmann::json buildQuery(const std::string& text, std::size_t topK) const;

    static Result<std::vector<RankedResult>> parseSearchResponse(const nlohmann::json& response,
                                                                 const std::string& textField);

private:
    ElasticConfig config_;
    std::shared_ptr<net::JsonHttpClient> http_;
};

} // namespace ragloop::search
