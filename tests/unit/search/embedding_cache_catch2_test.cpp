// Catch2 tests for the query embedding cache

#include <catch2/catch_test_macros.hpp>

#include <ragloop/search/embedding_cache.h>

#include "common/fake_collaborators.h"

#include <memory>
#include <thread>
#include <vector>

using namespace ragloop;
using namespace ragloop::search;
using ragloop::test::FakeEmbedder;

TEST_CASE("EmbeddingCache basic operations", "[search][cache][catch2]") {
    EmbeddingCache cache(4);

    SECTION("miss then hit") {
        CHECK_FALSE(cache.get("sky").has_value());
        cache.put("sky", {1.0f, 2.0f});
        auto hit = cache.get("sky");
        REQUIRE(hit.has_value());
        CHECK(*hit == Embedding{1.0f, 2.0f});

        auto stats = cache.getStats();
        CHECK(stats.hits == 1);
        CHECK(stats.misses == 1);
    }

    SECTION("put replaces an existing entry") {
        cache.put("sky", {1.0f});
        cache.put("sky", {3.0f});
        CHECK(cache.size() == 1);
        CHECK(*cache.get("sky") == Embedding{3.0f});
    }

    SECTION("clear empties the cache") {
        cache.put("a", {1.0f});
        cache.put("b", {2.0f});
        cache.clear();
        CHECK(cache.size() == 0);
        CHECK_FALSE(cache.get("a").has_value());
    }
}

TEST_CASE("EmbeddingCache evicts least recently used", "[search][cache][catch2]") {
    EmbeddingCache cache(2);
    cache.put("a", {1.0f});
    cache.put("b", {2.0f});
    REQUIRE(cache.get("a").has_value()); // a is now most recent
    cache.put("c", {3.0f});

    CHECK(cache.size() == 2);
    CHECK(cache.get("a").has_value());
    CHECK_FALSE(cache.get("b").has_value());
    CHECK(cache.get("c").has_value());
    CHECK(cache.getStats().evictions == 1);
}

TEST_CASE("EmbeddingCache with zero capacity stores nothing", "[search][cache][catch2]") {
    EmbeddingCache cache(0);
    cache.put("a", {1.0f});
    CHECK(cache.size() == 0);
    CHECK_FALSE(cache.get("a").has_value());
}

TEST_CASE("EmbeddingCache is safe under concurrent access", "[search][cache][catch2]") {
    EmbeddingCache cache(16);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 200; ++i) {
                const auto key = "q" + std::to_string((i + t) % 32);
                if (!cache.get(key)) {
                    cache.put(key, {static_cast<float>(i)});
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    CHECK(cache.size() <= 16);
    auto stats = cache.getStats();
    CHECK(stats.hits + stats.misses == 800);
}

TEST_CASE("CachingEmbedder serves repeated queries from cache", "[search][cache][catch2]") {
    auto inner = std::make_shared<FakeEmbedder>();
    CachingEmbedder embedder(inner, 8);

    auto first = embedder.embedQuery("why is the sky blue", {});
    auto second = embedder.embedQuery("why is the sky blue", {});
    REQUIRE(first);
    REQUIRE(second);
    CHECK(first.value() == second.value());
    CHECK(inner->texts().size() == 1);
    CHECK(embedder.cacheStats().hits == 1);
    CHECK(embedder.modelName() == "fake-embedding");
}

TEST_CASE("CachingEmbedder does not cache failures", "[search][cache][catch2]") {
    auto inner = std::make_shared<FakeEmbedder>();
    inner->setFailure(Error{ErrorCode::NetworkError, "embedding service down"});
    CachingEmbedder embedder(inner, 8);

    auto failed = embedder.embedQuery("q", {});
    REQUIRE_FALSE(failed);
    CHECK(failed.error().code == ErrorCode::NetworkError);

    inner->setFailure(std::nullopt);
    auto ok = embedder.embedQuery("q", {});
    CHECK(ok);
    CHECK(inner->texts().size() == 2);
}

TEST_CASE("CachingEmbedder without an inner embedder", "[search][cache][catch2]") {
    CachingEmbedder embedder(nullptr);
    auto r = embedder.embedQuery("q", {});
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::NotInitialized);
}
