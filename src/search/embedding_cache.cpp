#include <ragloop/search/embedding_cache.h>

#include <spdlog/spdlog.h>

namespace ragloop::search {

EmbeddingCache::EmbeddingCache(size_t maxEntries) : maxEntries_(maxEntries) {}

std::optional<Embedding> EmbeddingCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }
    ++stats_.hits;
    moveToFront(it->second.position);
    return it->second.embedding;
}

void EmbeddingCache::put(const std::string& key, Embedding embedding) {
    if (maxEntries_ == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        it->second.embedding = std::move(embedding);
        moveToFront(it->second.position);
        return;
    }
    while (entries_.size() >= maxEntries_ && !lruList_.empty()) {
        entries_.erase(lruList_.back());
        lruList_.pop_back();
        ++stats_.evictions;
    }
    lruList_.push_front(key);
    entries_.emplace(key, Entry{std::move(embedding), lruList_.begin()});
}

void EmbeddingCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lruList_.clear();
}

size_t EmbeddingCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

EmbeddingCache::Stats EmbeddingCache::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void EmbeddingCache::moveToFront(std::list<std::string>::iterator it) {
    lruList_.splice(lruList_.begin(), lruList_, it);
}

CachingEmbedder::CachingEmbedder(std::shared_ptr<IEmbedder> inner, size_t maxEntries)
    : inner_(std::move(inner)), cache_(maxEntries) {}

Result<Embedding> CachingEmbedder::embedQuery(const std::string& text, std::stop_token stop) {
    if (!inner_) {
        return Error{ErrorCode::NotInitialized, "CachingEmbedder has no inner embedder"};
    }
    if (auto cached = cache_.get(text)) {
        spdlog::debug("[EmbeddingCache] hit for query ({} chars)", text.size());
        return *cached;
    }
    auto result = inner_->embedQuery(text, stop);
    if (result) {
        cache_.put(text, result.value());
    }
    return result;
}

std::string CachingEmbedder::modelName() const {
    return inner_ ? inner_->modelName() : std::string{};
}

} // namespace ragloop::search
