// Catch2 tests for the LLM relevance reranker

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <ragloop/search/rank_fusion.h>
#include <ragloop/search/relevance_reranker.h>

#include "common/fake_collaborators.h"

#include <memory>
#include <set>

using namespace ragloop;
using namespace ragloop::search;
using ragloop::test::FakeChatModel;
using ragloop::test::idsOf;
using ragloop::test::makeResults;
using Catch::Approx;

namespace {

constexpr const char* kSchema = "relevance_rankings";

FusedCandidateSet candidates(std::initializer_list<const char*> ids) {
    return RankFusion().fuse(makeResults(ids, RankOrigin::Dense), {});
}

nlohmann::json ranking(int index, double score, const std::string& reasoning = "relevant") {
    return {{"passage_index", index}, {"score", score}, {"reasoning", reasoning}};
}

} // namespace

TEST_CASE("RelevanceReranker orders by judge score", "[search][reranker][catch2]") {
    auto chat = std::make_shared<FakeChatModel>();
    chat->respond(kSchema, {{"rankings",
                             {ranking(0, 0.2), ranking(1, 0.9, "names the cause"),
                              ranking(2, 0.5)}}});
    RelevanceReranker reranker(chat);

    auto outcome = reranker.rerank("why is the sky blue", candidates({"A", "B", "C"}), 10, {});

    CHECK(outcome.origin == RankOrigin::Reranked);
    CHECK_FALSE(outcome.degraded());
    CHECK(outcome.scoredCount == 3);
    REQUIRE(idsOf(outcome.items) == std::vector<std::string>{"B", "C", "A"});
    CHECK(outcome.items[0].score == Approx(0.9));
    CHECK(outcome.items[0].origin == RankOrigin::Reranked);
    CHECK(outcome.items[0].rationale == "names the cause");
    CHECK(chat->callCount(kSchema) == 1);
}

TEST_CASE("RelevanceReranker appends candidates past the cap", "[search][reranker][catch2]") {
    auto chat = std::make_shared<FakeChatModel>();
    chat->respond(kSchema, {{"rankings", {ranking(0, 0.1), ranking(1, 0.8)}}});
    RelevanceReranker reranker(chat);

    auto outcome = reranker.rerank("q", candidates({"A", "B", "C", "D"}), 2, {});

    REQUIRE(idsOf(outcome.items) == std::vector<std::string>{"B", "A", "C", "D"});
    CHECK(outcome.items[2].origin == RankOrigin::Fused);
    CHECK(outcome.items[3].origin == RankOrigin::Fused);

    auto prompts = chat->prompts(kSchema);
    REQUIRE(prompts.size() == 1);
    CHECK(prompts[0].user.find("[1]") != std::string::npos);
    CHECK(prompts[0].user.find("[2]") == std::string::npos);
}

TEST_CASE("RelevanceReranker keeps fusion order when the judge fails",
          "[search][reranker][catch2]") {
    auto chat = std::make_shared<FakeChatModel>();
    RelevanceReranker reranker(chat);
    auto input = candidates({"A", "B", "C"});

    SECTION("call error") {
        chat->fail(kSchema, Error{ErrorCode::NetworkError, "connection refused"});
        auto outcome = reranker.rerank("q", input, 10, {});
        CHECK(outcome.origin == RankOrigin::Fused);
        CHECK(outcome.degraded());
        CHECK(outcome.failureReason == "connection refused");
        CHECK(idsOf(outcome.items) == idsOf(input.items));
    }

    SECTION("reply without rankings") {
        chat->respond(kSchema, {{"scores", nlohmann::json::array()}});
        auto outcome = reranker.rerank("q", input, 10, {});
        CHECK(outcome.origin == RankOrigin::Fused);
        CHECK(outcome.degraded());
        CHECK(idsOf(outcome.items) == idsOf(input.items));
    }

    SECTION("no usable entries") {
        chat->respond(kSchema, {{"rankings", {ranking(7, 0.9), {{"passage_index", "x"}}}}});
        auto outcome = reranker.rerank("q", input, 10, {});
        CHECK(outcome.origin == RankOrigin::Fused);
        CHECK(idsOf(outcome.items) == idsOf(input.items));
    }
}

TEST_CASE("RelevanceReranker skips the call for fewer than two candidates",
          "[search][reranker][catch2]") {
    auto chat = std::make_shared<FakeChatModel>();
    RelevanceReranker reranker(chat);

    auto single = reranker.rerank("q", candidates({"A"}), 10, {});
    CHECK(idsOf(single.items) == std::vector<std::string>{"A"});
    CHECK_FALSE(single.degraded());

    auto none = reranker.rerank("q", FusedCandidateSet{}, 10, {});
    CHECK(none.items.empty());

    CHECK(chat->callCount(kSchema) == 0);
}

TEST_CASE("RelevanceReranker without a chat model degrades", "[search][reranker][catch2]") {
    RelevanceReranker reranker(nullptr);
    auto outcome = reranker.rerank("q", candidates({"A", "B"}), 10, {});
    CHECK(outcome.degraded());
    CHECK(idsOf(outcome.items) == std::vector<std::string>{"A", "B"});
}

TEST_CASE("RelevanceReranker handles partial judge replies", "[search][reranker][catch2]") {
    auto chat = std::make_shared<FakeChatModel>();
    // Index 2 scored twice (first wins), index 1 missing, score out of range clamped
    chat->respond(kSchema, {{"rankings",
                             {ranking(2, 0.4), ranking(2, 0.95), ranking(0, 1.7),
                              ranking(-1, 0.5)}}});
    RelevanceReranker reranker(chat);

    auto outcome = reranker.rerank("q", candidates({"A", "B", "C", "D"}), 3, {});

    CHECK(outcome.origin == RankOrigin::Reranked);
    CHECK(outcome.scoredCount == 2);
    REQUIRE(idsOf(outcome.items) == std::vector<std::string>{"A", "C", "B", "D"});
    CHECK(outcome.items[0].score == Approx(1.0));
    CHECK(outcome.items[1].score == Approx(0.4));
    CHECK(outcome.items[2].origin == RankOrigin::Fused);
}

TEST_CASE("RelevanceReranker output is a permutation of its input",
          "[search][reranker][catch2]") {
    auto chat = std::make_shared<FakeChatModel>();
    chat->respond(kSchema, {{"rankings", {ranking(4, 0.9), ranking(1, 0.3), ranking(3, 0.3)}}});
    RelevanceReranker reranker(chat);
    auto input = candidates({"A", "B", "C", "D", "E", "F"});

    auto outcome = reranker.rerank("q", input, 5, {});

    REQUIRE(outcome.items.size() == input.size());
    auto ids = idsOf(outcome.items);
    CHECK(std::set<std::string>(ids.begin(), ids.end()) ==
          std::set<std::string>{"A", "B", "C", "D", "E", "F"});
    // Equal judge scores keep fusion order
    CHECK(ids == std::vector<std::string>{"E", "B", "D", "A", "C", "F"});
}

TEST_CASE("RelevanceReranker prompt truncates long passages", "[search][reranker][catch2]") {
    RelevanceReranker reranker(nullptr, RerankerConfig{20, 1000, 0.0});
    std::vector<RankedResult> items = {
        ragloop::test::makeResult("A", RankOrigin::Fused, 0.0, std::string(100, 'x')),
        ragloop::test::makeResult("B", RankOrigin::Fused, 0.0, "short passage")};

    auto prompt = reranker.buildPrompt("what is x", items, 2);

    CHECK(prompt.schemaName == kSchema);
    CHECK(prompt.user.find("Query: what is x") != std::string::npos);
    CHECK(prompt.user.find(std::string(20, 'x')) != std::string::npos);
    CHECK(prompt.user.find(std::string(21, 'x')) == std::string::npos);
    CHECK(prompt.user.find("short passage") != std::string::npos);
    CHECK(prompt.schema["required"][0] == "rankings");
}
