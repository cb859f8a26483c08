// Scripted stand-ins for the external collaborators (chat model, embedder, searches)

#pragma once

#include <ragloop/core/types.h>
#include <ragloop/llm/chat_model.h>
#include <ragloop/search/ranked_result.h>
#include <ragloop/search/retrieval_backends.h>

#include <chrono>
#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace ragloop::test {

// Sleep up to `delay`, returning false as soon as `stop` is requested
inline bool sleepUnlessStopped(std::chrono::milliseconds delay, std::stop_token stop) {
    const auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (stop.stop_requested()) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return !stop.stop_requested();
}

inline search::RankedResult makeResult(const std::string& id, search::RankOrigin origin,
                                       double score = 0.0, std::string text = {}) {
    search::RankedResult r;
    r.id = id;
    r.text = text.empty() ? "passage " + id : std::move(text);
    r.source.documentId = "doc-" + id;
    r.source.sourcePath = "/docs/" + id + ".pdf";
    r.score = score;
    r.origin = origin;
    return r;
}

inline std::vector<search::RankedResult> makeResults(std::initializer_list<const char*> ids,
                                                     search::RankOrigin origin) {
    std::vector<search::RankedResult> out;
    double score = 1.0;
    for (const char* id : ids) {
        out.push_back(makeResult(id, origin, score));
        score -= 0.05;
    }
    return out;
}

inline std::vector<std::string> idsOf(const std::vector<search::RankedResult>& results) {
    std::vector<std::string> ids;
    ids.reserve(results.size());
    for (const auto& r : results) {
        ids.push_back(r.id);
    }
    return ids;
}

/**
 * @brief Chat model scripted per schema name
 *
 * Each schema has a queue of replies (consumed in order; the last one repeats) and an optional
 * delay. Unscripted schemas fail with NotFound.
 */
class FakeChatModel : public llm::IChatModel {
public:
    using Reply = Result<nlohmann::json>;

    void respond(const std::string& schema, nlohmann::json reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_[schema].push_back(Reply(std::move(reply)));
    }

    void fail(const std::string& schema, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_[schema].push_back(Reply(std::move(error)));
    }

    void setDelay(const std::string& schema, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_[schema] = delay;
    }

    Result<nlohmann::json> completeStructured(const llm::StructuredPrompt& prompt,
                                              std::stop_token stop) override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prompts_[prompt.schemaName].push_back(prompt);
            if (auto it = delays_.find(prompt.schemaName); it != delays_.end()) {
                delay = it->second;
            }
        }
        if (delay.count() > 0 && !sleepUnlessStopped(delay, stop)) {
            return Error{ErrorCode::OperationCancelled, "fake chat call stopped"};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = replies_.find(prompt.schemaName);
        if (it == replies_.end() || it->second.empty()) {
            return Error{ErrorCode::NotFound, "no scripted reply for " + prompt.schemaName};
        }
        Reply reply = it->second.front();
        if (it->second.size() > 1) {
            it->second.pop_front();
        }
        return reply;
    }

    std::string modelName() const override { return "fake-chat"; }

    std::size_t callCount(const std::string& schema) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = prompts_.find(schema);
        return it == prompts_.end() ? 0 : it->second.size();
    }

    std::vector<llm::StructuredPrompt> prompts(const std::string& schema) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = prompts_.find(schema);
        return it == prompts_.end() ? std::vector<llm::StructuredPrompt>{} : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Reply>> replies_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::map<std::string, std::vector<llm::StructuredPrompt>> prompts_;
};

class FakeEmbedder : public search::IEmbedder {
public:
    void setFailure(std::optional<Error> error) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = std::move(error);
    }

    Result<search::Embedding> embedQuery(const std::string& text, std::stop_token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        texts_.push_back(text);
        if (failure_) {
            return *failure_;
        }
        return search::Embedding{static_cast<float>(text.size()), 0.5f, 0.25f};
    }

    std::string modelName() const override { return "fake-embedding"; }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<Error> failure_;
    std::vector<std::string> texts_;
};

/**
 * @brief Shared scripting for the two fake search paths: replies are consumed per call (the
 * last one repeats); an optional delay honours the stop token.
 */
class ScriptedSearch {
public:
    using Reply = Result<std::vector<search::RankedResult>>;

    void respond(std::vector<search::RankedResult> results) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(Reply(std::move(results)));
    }

    void fail(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(Reply(std::move(error)));
    }

    void setDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    std::size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    bool sawStop() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sawStop_;
    }

protected:
    Reply next(std::stop_token stop) {
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_;
            delay = delay_;
        }
        if (delay.count() > 0 && !sleepUnlessStopped(delay, stop)) {
            std::lock_guard<std::mutex> lock(mutex_);
            sawStop_ = true;
            return Error{ErrorCode::OperationCancelled, "fake search stopped"};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (replies_.empty()) {
            return std::vector<search::RankedResult>{};
        }
        Reply reply = replies_.front();
        if (replies_.size() > 1) {
            replies_.pop_front();
        }
        return reply;
    }

    mutable std::mutex mutex_;

private:
    std::deque<Reply> replies_;
    std::chrono::milliseconds delay_{0};
    std::size_t calls_ = 0;
    bool sawStop_ = false;
};

class FakeDenseSearch : public search::IDenseSearch, public ScriptedSearch {
public:
    Result<std::vector<search::RankedResult>> search(const search::Embedding&, std::size_t topK,
                                                     std::stop_token stop) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastTopK_ = topK;
        }
        return next(stop);
    }

    std::size_t lastTopK() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastTopK_;
    }

private:
    std::size_t lastTopK_ = 0;
};

class FakeSparseSearch : public search::ISparseSearch, public ScriptedSearch {
public:
    Result<std::vector<search::RankedResult>> search(const std::string& text, std::size_t,
                                                     std::stop_token stop) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queries_.push_back(text);
        }
        return next(stop);
    }

    std::vector<std::string> queries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queries_;
    }

private:
    std::vector<std::string> queries_;
};

} // namespace ragloop::test
