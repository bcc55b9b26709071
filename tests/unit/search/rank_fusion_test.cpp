#include <gtest/gtest.h>

#include <engram/search/rank_fusion.h>
#include <engram/search/reranker.h>

using namespace engram;
using namespace engram::search;
using metadata::UnitStats;

namespace {

std::unordered_map<std::string, UnitStats> statsFor(
    std::initializer_list<std::tuple<std::string, int64_t, double>> rows) {
    std::unordered_map<std::string, UnitStats> out;
    for (const auto& [id, mentionedMs, confidence] : rows) {
        UnitStats s;
        s.id = id;
        s.mentionedAt = fromEpochMillis(mentionedMs);
        s.confidence = confidence;
        out.emplace(id, s);
    }
    return out;
}

std::vector<std::string> idsOf(const std::vector<FusedCandidate>& fused) {
    std::vector<std::string> ids;
    for (const auto& c : fused)
        ids.push_back(c.id);
    return ids;
}

} // namespace

TEST(RankFusionTest, SumsReciprocalRanksAcrossStrategies) {
    auto stats = statsFor({{"a", 1000, 1.0}, {"b", 1000, 1.0}, {"c", 1000, 1.0}});
    auto fused = fuseRankings({{"a", "b"}, {"b", "c"}}, stats, 60);

    ASSERT_EQ(fused.size(), 3u);
    EXPECT_EQ(fused[0].id, "b");
    EXPECT_DOUBLE_EQ(fused[0].rrfScore, 1.0 / 62 + 1.0 / 61);
    EXPECT_EQ(fused[1].id, "a");
    EXPECT_DOUBLE_EQ(fused[1].rrfScore, 1.0 / 61);
    EXPECT_EQ(fused[2].id, "c");
    EXPECT_DOUBLE_EQ(fused[2].rrfScore, 1.0 / 62);
}

TEST(RankFusionTest, DuplicatesWithinOneRankingCountOnce) {
    auto stats = statsFor({{"a", 0, 1.0}, {"b", 0, 1.0}});
    auto fused = fuseRankings({{"a", "a", "b"}}, stats, 60);
    ASSERT_EQ(fused.size(), 2u);
    EXPECT_DOUBLE_EQ(fused[0].rrfScore, 1.0 / 61);
    EXPECT_DOUBLE_EQ(fused[1].rrfScore, 1.0 / 62);
}

TEST(RankFusionTest, TiesBreakOnRecencyThenConfidenceThenId) {
    auto stats = statsFor({{"old", 1000, 1.0},
                           {"new", 5000, 0.1},
                           {"sure", 1000, 1.0},
                           {"unsure", 1000, 0.5}});
    // Every id is first in its own ranking, so all scores tie
    auto fused = fuseRankings({{"old"}, {"new"}, {"sure"}, {"unsure"}}, stats, 60);
    EXPECT_EQ(idsOf(fused), (std::vector<std::string>{"new", "old", "sure", "unsure"}));
}

TEST(RankFusionTest, DropsIdsWithoutStats) {
    auto stats = statsFor({{"a", 0, 1.0}});
    auto fused = fuseRankings({{"ghost", "a"}}, stats, 60);
    ASSERT_EQ(fused.size(), 1u);
    EXPECT_EQ(fused[0].id, "a");
    EXPECT_DOUBLE_EQ(fused[0].rrfScore, 1.0 / 62);
    EXPECT_TRUE(fuseRankings({}, stats, 60).empty());
}

TEST(BlendWithRerankerTest, NoScoresKeepsFusedOrderWithNormalisedWeights) {
    std::vector<FusedCandidate> fused = {{"a", 0.04, {}, 1.0}, {"b", 0.02, {}, 1.0}};
    auto ranked = blendWithReranker(fused, {}, 0.8);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].id, "a");
    EXPECT_DOUBLE_EQ(ranked[0].weight, 1.0);
    EXPECT_DOUBLE_EQ(ranked[1].weight, 0.5);
}

TEST(BlendWithRerankerTest, RerankerReordersWindowOnly) {
    std::vector<FusedCandidate> fused = {
        {"a", 0.04, {}, 1.0}, {"b", 0.03, {}, 1.0}, {"c", 0.02, {}, 1.0}};
    auto ranked = blendWithReranker(fused, {0.1f, 0.9f}, 0.8);

    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].id, "b");
    EXPECT_NEAR(ranked[0].weight, 0.8 * 1.0 + 0.2 * 0.75, 1e-9);
    EXPECT_EQ(ranked[1].id, "a");
    EXPECT_NEAR(ranked[1].weight, 0.2 * 1.0, 1e-9);
    EXPECT_EQ(ranked[2].id, "c");
    EXPECT_NEAR(ranked[2].weight, 0.2 * 0.5, 1e-9);
}

TEST(BlendWithRerankerTest, EqualRerankScoresPreserveFusedOrder) {
    std::vector<FusedCandidate> fused = {{"a", 0.04, {}, 1.0}, {"b", 0.02, {}, 1.0}};
    auto ranked = blendWithReranker(fused, {0.5f, 0.5f}, 0.8);
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0].id, "a");
    EXPECT_NEAR(ranked[0].weight, 1.0, 1e-9);
    EXPECT_EQ(ranked[1].id, "b");
    EXPECT_NEAR(ranked[1].weight, 0.8 + 0.2 * 0.5, 1e-9);
    EXPECT_TRUE(blendWithReranker({}, {0.5f}, 0.8).empty());
}

TEST(LexicalOverlapRerankerTest, ScoresTermAndBigramOverlap) {
    LexicalOverlapReranker reranker;
    EXPECT_TRUE(reranker.isReady());

    auto scores = reranker.scoreDocuments(
        "hiking trips", {"Alice loves hiking trips", "Alice loves trips", "cooking pasta"});
    ASSERT_TRUE(scores.has_value());
    ASSERT_EQ(scores.value().size(), 3u);
    EXPECT_FLOAT_EQ(scores.value()[0], 1.0f);
    EXPECT_FLOAT_EQ(scores.value()[1], static_cast<float>(0.5 / 1.5));
    EXPECT_FLOAT_EQ(scores.value()[2], 0.0f);
}

TEST(LexicalOverlapRerankerTest, StopWordOnlyQueryScoresZero) {
    LexicalOverlapReranker reranker;
    auto scores = reranker.scoreDocuments("the and of", {"the cat and the hat"});
    ASSERT_TRUE(scores.has_value());
    ASSERT_EQ(scores.value().size(), 1u);
    EXPECT_FLOAT_EQ(scores.value()[0], 0.0f);
}
