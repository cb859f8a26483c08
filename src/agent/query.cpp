#include <ragloop/agent/query.h>
#include <ragloop/core/text_utils.h>

namespace ragloop::agent {

Result<Query> Query::create(std::string text, std::size_t topK, const QueryLimits& limits) {
    std::string trimmed = text::trimCopy(text);
    if (trimmed.empty()) {
        return Error{ErrorCode::InvalidArgument, "query text is empty"};
    }
    if (!text::isValidUtf8(trimmed)) {
        return Error{ErrorCode::InvalidArgument, "query text is not valid UTF-8"};
    }
    if (trimmed.size() > limits.maxQueryChars) {
        return Error{ErrorCode::InvalidArgument,
                     "query text is " + std::to_string(trimmed.size()) +
                         " bytes; limit is " + std::to_string(limits.maxQueryChars)};
    }
    if (topK < 1 || topK > limits.maxTopK) {
        return Error{ErrorCode::InvalidArgument, "top_k must be between 1 and " +
                                                     std::to_string(limits.maxTopK) + ", got " +
                                                     std::to_string(topK)};
    }
    return Query(std::move(trimmed), topK);
}

} // namespace ragloop::agent
