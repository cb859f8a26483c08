#pragma once

#include <ragloop/search/retrieval_backends.h>

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ragloop::search {

/**
 * @brief Thread-safe LRU cache of query embeddings, keyed by query text
 */
class EmbeddingCache {
public:
    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
    };

    explicit EmbeddingCache(size_t maxEntries = 1024);

    std::optional<Embedding> get(const std::string& key);
    void put(const std::string& key, Embedding embedding);
    void clear();

    size_t size() const;
    Stats getStats() const;

private:
    void moveToFront(std::list<std::string>::iterator it);

    mutable std::mutex mutex_;
    size_t maxEntries_;
    std::list<std::string> lruList_; ///< most recent first
    struct Entry {
        Embedding embedding;
        std::list<std::string>::iterator position;
    };
    std::unordered_map<std::string, Entry> entries_;
    Stats stats_;
};

/**
 * @brief IEmbedder decorator that serves repeated queries from an EmbeddingCache
 *
 * Failed embeddings are not cached.
 */
class CachingEmbedder : public IEmbedder {
public:
    CachingEmbedder(std::shared_ptr<IEmbedder> inner, size_t maxEntries = 1024);

    Result<Embedding> embedQuery(const std::string& text, std::stop_token stop) override;

    std::string modelName() const override;

    EmbeddingCache::Stats cacheStats() const { return cache_.getStats(); }

private:
    std::shared_ptr<IEmbedder> inner_;
    EmbeddingCache cache_;
};

} // namespace ragloop::search
