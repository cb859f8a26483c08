#pragma once

#include <ragloop/core/types.h>

#include <cstddef>
#include <string>

namespace ragloop::agent {

struct QueryLimits {
    std::size_t maxQueryChars = 4000;
    std::size_t maxTopK = 20;
};

/**
 * @brief A validated user query; immutable once created
 */
class Query {
public:
    static Result<Query> create(std::string text, std::size_t topK, const QueryLimits& limits = {});

    const std::string& text() const noexcept { return text_; }
    std::size_t topK() const noexcept { return topK_; }

private:
    Query(std::string text, std::size_t topK) : text_(std::move(text)), topK_(topK) {}

    std::string text_;
    std::size_t topK_;
};

} // namespace ragloop::agent
