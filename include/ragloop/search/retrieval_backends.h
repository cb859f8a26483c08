#pragma once

#include <ragloop/core/types.h>
#include <ragloop/search/ranked_result.h>

#include <cstddef>
#include <stop_token>
#include <string>
#include <vector>

namespace ragloop::search {

using Embedding = std::vector<float>;

/**
 * @brief Turns query text into a vector for dense search
 */
class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    virtual Result<Embedding> embedQuery(const std::string& text, std::stop_token stop) = 0;

    virtual std::string modelName() const = 0;
};

/**
 * @brief Nearest-neighbour search over passage embeddings
 *
 * Returns at most topK results ordered best-first with origin == Dense.
 */
class IDenseSearch {
public:
    virtual ~IDenseSearch() = default;

    virtual Result<std::vector<RankedResult>> search(const Embedding& embedding, std::size_t topK,
                                                     std::stop_token stop) = 0;
};

/**
 * @brief Lexical (BM25-style) search over passage text
 *
 * Returns at most topK results ordered best-first with origin == Sparse. Passages that share no
 * term with the query are not returned.
 */
class ISparseSearch {
public:
    virtual ~ISparseSearch() = default;

    virtual Result<std::vector<RankedResult>> search(const std::string& text, std::size_t topK,
                                                     std::stop_token stop) = 0;
};

} // namespace ragloop::search
