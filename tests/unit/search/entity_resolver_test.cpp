#include <gtest/gtest.h>

#include <memory>
#include <engram/metadata/memory_repository.h>
#include <engram/search/entity_resolver.h>

#include "../../common/test_helpers.h"

using namespace engram;
using namespace engram::search;
using metadata::Entity;
using metadata::MemorySession;

namespace {

Entity entity(const std::string& id, const std::string& name, const std::string& type = "") {
    Entity e;
    e.id = id;
    e.bankId = "alpha";
    e.name = name;
    e.type = type;
    e.canonicalName = CanonicalNameStrategy::normalizeName(name);
    return e;
}

} // namespace

TEST(CanonicalNameStrategyTest, NormalizesCasePunctuationAndPlurals) {
    EXPECT_EQ(CanonicalNameStrategy::normalizeName("  Google   Inc. "), "google inc");
    EXPECT_EQ(CanonicalNameStrategy::normalizeName("Tech Companies"), "tech company");
    EXPECT_EQ(CanonicalNameStrategy::normalizeName("cats"), "cat");
    EXPECT_EQ(CanonicalNameStrategy::normalizeName("Alice's"), "alice");
    EXPECT_EQ(CanonicalNameStrategy::normalizeName("Boss"), "boss");
    EXPECT_EQ(CanonicalNameStrategy::normalizeName("..."), "");
}

TEST(CanonicalNameStrategyTest, SimilarityMeasures) {
    EXPECT_DOUBLE_EQ(CanonicalNameStrategy::levenshteinSimilarity("google", "google"), 1.0);
    EXPECT_NEAR(CanonicalNameStrategy::levenshteinSimilarity("microsof", "microsoft"), 1.0 - 1.0 / 9,
                1e-9);
    EXPECT_DOUBLE_EQ(CanonicalNameStrategy::tokenJaccard("new york city", "new york"), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(CanonicalNameStrategy::tokenJaccard("a b", "c d"), 0.0);
}

TEST(CanonicalNameStrategyTest, ResolvesExactThenFuzzyWithTypePenalty) {
    CanonicalNameStrategy strategy;
    std::vector<Entity> candidates = {entity("ent-g", "Google", "org"),
                                      entity("ent-m", "Microsoft", "org")};

    auto exact = strategy.resolve({"GOOGLE", "person"}, candidates);
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->entityId, "ent-g");
    EXPECT_DOUBLE_EQ(exact->score, 1.0);

    auto fuzzy = strategy.resolve({"Microsof", "org"}, candidates);
    ASSERT_TRUE(fuzzy.has_value());
    EXPECT_EQ(fuzzy->entityId, "ent-m");

    // Same typo, conflicting type: drops below the threshold
    EXPECT_FALSE(strategy.resolve({"Microsof", "person"}, candidates).has_value());
    EXPECT_FALSE(strategy.resolve({"Amazon", ""}, candidates).has_value());
    EXPECT_FALSE(strategy.resolve({"!!", ""}, candidates).has_value());
}

class EntityResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        dbPath_ = test::tempDbPath("engram_entities");
        auto repo = metadata::MemoryRepository::create(dbPath_.string());
        ASSERT_TRUE(repo.has_value());
        repo_ = std::move(repo).value();
        ASSERT_TRUE(repo_->transact([](MemorySession& s) { return s.ensureBank("alpha"); })
                        .has_value());
        ASSERT_TRUE(repo_->transact([](MemorySession& s) { return s.ensureBank("beta"); })
                        .has_value());
    }

    void TearDown() override {
        repo_.reset();
        test::removeDbFiles(dbPath_);
    }

    Result<std::vector<std::string>> resolve(const std::string& bank,
                                             const std::vector<EntityMention>& mentions) {
        return repo_->transact(
            [&](MemorySession& s) { return resolver_.resolveAll(s, bank, mentions); });
    }

    std::filesystem::path dbPath_;
    std::unique_ptr<metadata::MemoryRepository> repo_;
    EntityResolver resolver_{std::make_shared<CanonicalNameStrategy>()};
};

TEST_F(EntityResolverTest, CreatesOnceAndReusesCanonicalIdentity) {
    auto first = resolve("alpha", {{"Alice", "person"}, {"Google", "org"}, {"alice", ""}});
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first.value().size(), 2u);

    auto second = resolve("alpha", {{"ALICE", ""}});
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(second.value().size(), 1u);
    EXPECT_EQ(second.value()[0], first.value()[0]);

    auto entities = repo_->read([](MemorySession& s) { return s.listEntities("alpha"); });
    ASSERT_TRUE(entities.has_value());
    EXPECT_EQ(entities.value().size(), 2u);
}

TEST_F(EntityResolverTest, BanksHaveSeparateIdentities) {
    auto a = resolve("alpha", {{"Alice", ""}});
    auto b = resolve("beta", {{"Alice", ""}});
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a.value()[0], b.value()[0]);
}

TEST_F(EntityResolverTest, EmptyMentionsAreSkipped) {
    auto r = resolve("alpha", {{"...", ""}});
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r.value().empty());
}

TEST_F(EntityResolverTest, LinkTextPrefersLongestPhrase) {
    std::vector<Entity> entities = {entity("ent-nyc", "New York City"), entity("ent-york", "York"),
                                    entity("ent-alice", "Alice")};
    auto linked = resolver_.linkText("Did Alice move to New York City?", entities);
    ASSERT_EQ(linked.size(), 2u);
    EXPECT_EQ(linked[0], "ent-nyc");
    EXPECT_EQ(linked[1], "ent-alice");

    auto york = resolver_.linkText("Alice visited York twice", entities);
    ASSERT_EQ(york.size(), 2u);
    EXPECT_EQ(york[0], "ent-alice");
    EXPECT_EQ(york[1], "ent-york");
}

TEST_F(EntityResolverTest, LinkTextFallsBackToFuzzyMatches) {
    std::vector<Entity> entities = {entity("ent-m", "Microsoft")};
    auto linked = resolver_.linkText("Does she still work for microsof", entities);
    ASSERT_EQ(linked.size(), 1u);
    EXPECT_EQ(linked[0], "ent-m");

    EXPECT_TRUE(resolver_.linkText("nothing relevant", entities).empty());
    EXPECT_TRUE(resolver_.linkText("Alice", {}).empty());
}

TEST_F(EntityResolverTest, LinkTextMatchesAccentedNames) {
    std::vector<Entity> entities = {entity("ent-jose", "José"), entity("ent-muller", "Müller")};
    auto linked = resolver_.linkText("what did josé buy at MÜLLER", entities);
    ASSERT_EQ(linked.size(), 2u);
    EXPECT_EQ(linked[0], "ent-jose");
    EXPECT_EQ(linked[1], "ent-muller");
}

TEST_F(EntityResolverTest, LinkQueryReadsBankEntities) {
    ASSERT_TRUE(resolve("alpha", {{"Google", "org"}}).has_value());
    auto linked = repo_->read(
        [&](MemorySession& s) { return resolver_.linkQuery(s, "alpha", "Who works at Google?"); });
    ASSERT_TRUE(linked.has_value());
    EXPECT_EQ(linked.value().size(), 1u);

    auto other = repo_->read(
        [&](MemorySession& s) { return resolver_.linkQuery(s, "beta", "Who works at Google?"); });
    ASSERT_TRUE(other.has_value());
    EXPECT_TRUE(other.value().empty());
}
