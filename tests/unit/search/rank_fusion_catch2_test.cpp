// Catch2 tests for reciprocal-rank fusion

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <ragloop/search/rank_fusion.h>

#include "common/fake_collaborators.h"

#include <map>
#include <set>

using namespace ragloop::search;
using ragloop::test::idsOf;
using ragloop::test::makeResult;
using ragloop::test::makeResults;
using Catch::Approx;

namespace {

std::map<std::string, double> scoresById(const FusedCandidateSet& set) {
    std::map<std::string, double> out;
    for (const auto& item : set.items) {
        out[item.id] = item.score;
    }
    return out;
}

} // namespace

TEST_CASE("RankFusion partial score", "[search][fusion][catch2]") {
    CHECK(RankFusion::partialScore(0) == Approx(1.0 / 61.0));
    CHECK(RankFusion::partialScore(1) == Approx(1.0 / 62.0));
    CHECK(RankFusion::partialScore(0, 10.0) == Approx(1.0 / 11.0));
}

TEST_CASE("RankFusion rejects non-positive k", "[search][fusion][catch2]") {
    CHECK(RankFusion(0.0).k() == Approx(kDefaultRrfK));
    CHECK(RankFusion(-5.0).k() == Approx(kDefaultRrfK));
    CHECK(RankFusion(20.0).k() == Approx(20.0));
}

TEST_CASE("RankFusion orders overlapping lists", "[search][fusion][catch2]") {
    RankFusion fusion;
    auto dense = makeResults({"A", "B", "C"}, RankOrigin::Dense);
    auto sparse = makeResults({"B", "D"}, RankOrigin::Sparse);

    auto fused = fusion.fuse(dense, sparse);

    REQUIRE(fused.size() == 4);
    CHECK(idsOf(fused.items) == std::vector<std::string>{"B", "A", "D", "C"});
    CHECK(fused.items[0].score == Approx(1.0 / 62.0 + 1.0 / 61.0));
    CHECK(fused.items[1].score == Approx(1.0 / 61.0));
    CHECK(fused.items[2].score == Approx(1.0 / 62.0));
    CHECK(fused.items[3].score == Approx(1.0 / 63.0));
    CHECK(fused.overlap == 1);
    CHECK(fused.denseOnly == 2);
    CHECK(fused.sparseOnly == 1);

    for (const auto& item : fused.items) {
        CHECK(item.origin == RankOrigin::Fused);
    }
}

TEST_CASE("RankFusion ties break by discovery order", "[search][fusion][catch2]") {
    RankFusion fusion;

    SECTION("dense before sparse at equal rank") {
        auto fused = fusion.fuse(makeResults({"X"}, RankOrigin::Dense),
                                 makeResults({"Y"}, RankOrigin::Sparse));
        CHECK(idsOf(fused.items) == std::vector<std::string>{"X", "Y"});
        CHECK(fused.items[0].score == Approx(fused.items[1].score));
    }

    SECTION("interleaved equal scores") {
        auto fused = fusion.fuse(makeResults({"A", "B"}, RankOrigin::Dense),
                                 makeResults({"C", "D"}, RankOrigin::Sparse));
        CHECK(idsOf(fused.items) == std::vector<std::string>{"A", "C", "B", "D"});
    }
}

TEST_CASE("RankFusion handles empty inputs", "[search][fusion][catch2]") {
    RankFusion fusion;

    SECTION("both empty") {
        auto fused = fusion.fuse({}, {});
        CHECK(fused.empty());
        CHECK(fused.overlap == 0);
    }

    SECTION("only dense") {
        auto fused = fusion.fuse(makeResults({"A", "B"}, RankOrigin::Dense), {});
        CHECK(idsOf(fused.items) == std::vector<std::string>{"A", "B"});
        CHECK(fused.denseOnly == 2);
    }

    SECTION("only sparse") {
        auto fused = fusion.fuse({}, makeResults({"S1", "S2", "S3"}, RankOrigin::Sparse));
        CHECK(idsOf(fused.items) == std::vector<std::string>{"S1", "S2", "S3"});
        CHECK(fused.sparseOnly == 3);
    }
}

TEST_CASE("RankFusion deduplicates identities", "[search][fusion][catch2]") {
    RankFusion fusion;
    auto dense = makeResults({"A", "B", "C", "D"}, RankOrigin::Dense);
    auto sparse = makeResults({"D", "C", "E"}, RankOrigin::Sparse);

    auto fused = fusion.fuse(dense, sparse);

    std::set<std::string> unique;
    for (const auto& item : fused.items) {
        CHECK(unique.insert(item.id).second);
    }
    CHECK(unique == std::set<std::string>{"A", "B", "C", "D", "E"});
    CHECK(fused.size() == 5);
}

TEST_CASE("RankFusion counts only the first occurrence within a list",
          "[search][fusion][catch2]") {
    RankFusion fusion;
    std::vector<RankedResult> dense = {makeResult("A", RankOrigin::Dense),
                                       makeResult("A", RankOrigin::Dense),
                                       makeResult("B", RankOrigin::Dense)};

    auto fused = fusion.fuse(dense, {});

    REQUIRE(fused.size() == 2);
    CHECK(fused.items[0].id == "A");
    CHECK(fused.items[0].score == Approx(1.0 / 61.0));
    CHECK(fused.items[1].score == Approx(1.0 / 63.0));
}

TEST_CASE("RankFusion is commutative in scores", "[search][fusion][catch2]") {
    RankFusion fusion;
    auto a = makeResults({"A", "B", "C"}, RankOrigin::Dense);
    auto b = makeResults({"C", "D", "A", "E"}, RankOrigin::Sparse);

    auto ab = fusion.fuse(a, b);
    auto ba = fusion.fuse(b, a);

    auto left = scoresById(ab);
    auto right = scoresById(ba);
    REQUIRE(left.size() == right.size());
    for (const auto& [id, score] : left) {
        REQUIRE(right.count(id) == 1);
        CHECK(score == Approx(right[id]));
    }
    REQUIRE(ab.size() == ba.size());
    for (std::size_t i = 0; i < ab.size(); ++i) {
        CHECK(ab.items[i].score == Approx(ba.items[i].score));
    }
}

TEST_CASE("RankFusion scores are monotone in rank", "[search][fusion][catch2]") {
    RankFusion fusion;
    auto fused = fusion.fuse(makeResults({"A", "B", "C", "D", "E"}, RankOrigin::Dense), {});
    for (std::size_t i = 1; i < fused.size(); ++i) {
        CHECK(fused.items[i - 1].score > fused.items[i].score);
    }
}

TEST_CASE("RankFusion keeps passage payload", "[search][fusion][catch2]") {
    RankFusion fusion;
    auto dense = std::vector<RankedResult>{
        makeResult("A", RankOrigin::Dense, 0.9, "Rayleigh scattering explains the blue sky")};
    dense[0].source.page = 4;
    dense[0].source.section = "Optics";

    auto fused = fusion.fuse(dense, {});

    REQUIRE(fused.size() == 1);
    CHECK(fused.items[0].text == "Rayleigh scattering explains the blue sky");
    CHECK(fused.items[0].source.documentId == "doc-A");
    CHECK(fused.items[0].source.page == 4);
    CHECK(fused.items[0].source.section == std::optional<std::string>("Optics"));
}

TEST_CASE("RankFusion larger k narrows the gap between ranks", "[search][fusion][catch2]") {
    double previousGap = 1.0;
    for (double k : {1.0, 10.0, 60.0, 200.0}) {
        auto fused =
            RankFusion(k).fuse(makeResults({"A", "B", "C"}, RankOrigin::Dense), {});
        const double gap = fused.items[0].score - fused.items[1].score;
        CHECK(gap > 0.0);
        CHECK(gap < previousGap);
        previousGap = gap;
    }
}

TEST_CASE("RankFusion rewards appearing in both lists", "[search][fusion][catch2]") {
    RankFusion fusion;
    auto single = fusion.fuse(makeResults({"X", "A"}, RankOrigin::Dense), {});
    auto both = fusion.fuse(makeResults({"X", "A"}, RankOrigin::Dense),
                            makeResults({"Y", "Z", "A"}, RankOrigin::Sparse));

    auto singleScores = scoresById(single);
    auto bothScores = scoresById(both);
    CHECK(bothScores["A"] >= singleScores["A"]);
    CHECK(bothScores["A"] == Approx(1.0 / 62.0 + 1.0 / 63.0));
}

TEST_CASE("RankFusion is deterministic", "[search][fusion][catch2]") {
    RankFusion fusion;
    auto dense = makeResults({"A", "B", "C", "D"}, RankOrigin::Dense);
    auto sparse = makeResults({"E", "C", "F"}, RankOrigin::Sparse);
    auto first = fusion.fuse(dense, sparse);
    auto second = fusion.fuse(dense, sparse);
    CHECK(idsOf(first.items) == idsOf(second.items));
}
