#include <gtest/gtest.h>

#include <engram/reflect/disposition_policy.h>

using namespace engram;
using namespace engram::reflect;
using metadata::DispositionTraits;

namespace {

OpinionCandidate candidate(std::string text, double confidence, std::vector<std::string> evidence,
                           int distance = 0, bool aboutPeople = false) {
    OpinionCandidate c;
    c.text = std::move(text);
    c.confidence = confidence;
    c.evidence = std::move(evidence);
    c.inferentialDistance = distance;
    c.aboutPeople = aboutPeople;
    return c;
}

DispositionTraits traits(int skepticism, int literalism, int empathy) {
    DispositionTraits t;
    t.skepticism = skepticism;
    t.literalism = literalism;
    t.empathy = empathy;
    return t;
}

const std::unordered_set<std::string> kRetrieved = {"mu-1", "mu-2", "mu-3"};

} // namespace

TEST(LinearDispositionPolicyTest, TraitMappings) {
    EXPECT_EQ(LinearDispositionPolicy::requiredEvidence(1), 1);
    EXPECT_EQ(LinearDispositionPolicy::requiredEvidence(3), 2);
    EXPECT_EQ(LinearDispositionPolicy::requiredEvidence(5), 3);
    EXPECT_EQ(LinearDispositionPolicy::requiredEvidence(9), 3);

    EXPECT_EQ(LinearDispositionPolicy::maxInferentialDistance(1), 4);
    EXPECT_EQ(LinearDispositionPolicy::maxInferentialDistance(5), 0);

    EXPECT_DOUBLE_EQ(LinearDispositionPolicy::adjustConfidence(0.8, 1), 0.8);
    EXPECT_NEAR(LinearDispositionPolicy::adjustConfidence(0.8, 5), 0.8 * 0.4, 1e-9);
    EXPECT_DOUBLE_EQ(LinearDispositionPolicy::adjustConfidence(1.7, 1), 1.0);

    EXPECT_DOUBLE_EQ(LinearDispositionPolicy::priority(0.5, false, 5), 0.5);
    EXPECT_NEAR(LinearDispositionPolicy::priority(0.5, true, 5), 0.5 * 1.4, 1e-9);
}

TEST(LinearDispositionPolicyTest, SkepticismRaisesTheEvidenceBar) {
    LinearDispositionPolicy policy;
    std::vector<OpinionCandidate> candidates = {candidate("one source", 0.9, {"mu-1"}),
                                                candidate("two sources", 0.9, {"mu-1", "mu-2"})};

    auto trusting = policy.apply(candidates, kRetrieved, traits(1, 3, 3), 5);
    EXPECT_EQ(trusting.size(), 2u);

    auto skeptical = policy.apply(candidates, kRetrieved, traits(4, 3, 3), 5);
    ASSERT_EQ(skeptical.size(), 1u);
    EXPECT_EQ(skeptical[0].candidate.text, "two sources");
}

TEST(LinearDispositionPolicyTest, EvidenceMustHaveBeenRetrieved) {
    LinearDispositionPolicy policy;
    // Unknown and repeated ids do not count
    std::vector<OpinionCandidate> candidates = {
        candidate("made up", 0.9, {"mu-404", "mu-405"}),
        candidate("repeated", 0.9, {"mu-1", "mu-1"})};
    EXPECT_TRUE(policy.apply(candidates, kRetrieved, traits(3, 3, 3), 5).empty());
}

TEST(LinearDispositionPolicyTest, LiteralismLimitsExtrapolation) {
    LinearDispositionPolicy policy;
    std::vector<OpinionCandidate> candidates = {candidate("restated", 0.6, {"mu-1"}, 0),
                                                candidate("leap", 0.9, {"mu-1"}, 3)};

    auto literal = policy.apply(candidates, kRetrieved, traits(1, 5, 3), 5);
    ASSERT_EQ(literal.size(), 1u);
    EXPECT_EQ(literal[0].candidate.text, "restated");

    auto loose = policy.apply(candidates, kRetrieved, traits(1, 1, 3), 5);
    ASSERT_EQ(loose.size(), 2u);
    EXPECT_EQ(loose[0].candidate.text, "leap");
}

TEST(LinearDispositionPolicyTest, EmpathyPrioritisesOpinionsAboutPeople) {
    LinearDispositionPolicy policy;
    std::vector<OpinionCandidate> candidates = {
        candidate("the city is loud", 0.8, {"mu-1"}),
        candidate("Bob is kind", 0.75, {"mu-2"}, 0, true)};

    auto cold = policy.apply(candidates, kRetrieved, traits(1, 3, 1), 1);
    ASSERT_EQ(cold.size(), 1u);
    EXPECT_EQ(cold[0].candidate.text, "the city is loud");

    auto warm = policy.apply(candidates, kRetrieved, traits(1, 3, 5), 1);
    ASSERT_EQ(warm.size(), 1u);
    EXPECT_EQ(warm[0].candidate.text, "Bob is kind");
    EXPECT_DOUBLE_EQ(warm[0].confidence, 0.75);
}

TEST(LinearDispositionPolicyTest, MoreSkepticismNeverRaisesConfidence) {
    LinearDispositionPolicy policy;
    std::vector<OpinionCandidate> candidates = {
        candidate("well supported", 0.7, {"mu-1", "mu-2", "mu-3"})};
    double previous = 1.0;
    for (int s = 1; s <= 5; ++s) {
        auto accepted = policy.apply(candidates, kRetrieved, traits(s, 3, 3), 5);
        ASSERT_EQ(accepted.size(), 1u) << "skepticism " << s;
        EXPECT_LE(accepted[0].confidence, previous);
        previous = accepted[0].confidence;
    }
}

TEST(LinearDispositionPolicyTest, TiesBreakByTextAndBudgetCaps) {
    LinearDispositionPolicy policy;
    std::vector<OpinionCandidate> candidates = {candidate("b", 0.5, {"mu-1"}),
                                                candidate("a", 0.5, {"mu-1"}),
                                                candidate("", 0.9, {"mu-1"})};
    auto accepted = policy.apply(candidates, kRetrieved, traits(1, 3, 3), 5);
    ASSERT_EQ(accepted.size(), 2u);
    EXPECT_EQ(accepted[0].candidate.text, "a");
    EXPECT_EQ(accepted[1].candidate.text, "b");

    EXPECT_TRUE(policy.apply(candidates, kRetrieved, traits(1, 3, 3), 0).empty());
}
