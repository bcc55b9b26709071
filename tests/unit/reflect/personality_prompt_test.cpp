#include <gtest/gtest.h>

#include <engram/reflect/personality_prompt.h>

using namespace engram;
using namespace engram::reflect;

namespace {

search::RecallHit hit(const std::string& id, const std::string& text) {
    search::RecallHit h;
    h.unit.id = id;
    h.unit.text = text;
    h.unit.confidence = 0.7;
    return h;
}

} // namespace

TEST(PersonalityPromptTest, DescribesTraitsInWords) {
    metadata::PersonalityTraits t;
    t.openness = 0.9;
    t.neuroticism = 0.1;
    const auto text = describePersonality(t);
    EXPECT_NE(text.find("very open"), std::string::npos);
    EXPECT_NE(text.find("not at all prone to worry"), std::string::npos);
    EXPECT_NE(text.find("moderately agreeable"), std::string::npos);
}

TEST(PersonalityPromptTest, ReflectPromptListsFactsByTypeWithIds) {
    metadata::Bank bank;
    bank.id = "alpha";
    bank.name = "Ada";
    bank.background = "I grew up in Lisbon.";
    bank.personality.biasStrength = 0.9;

    ReflectContext facts;
    facts.world = {hit("mu-w", "Lisbon is hilly.")};
    facts.opinions = {hit("mu-o", "Trams are charming.")};

    auto prompt = buildReflectPrompt(bank, "Should I visit Lisbon?", "planning a trip", facts);
    EXPECT_NE(prompt.system.find("You are Ada."), std::string::npos);
    EXPECT_NE(prompt.system.find("I grew up in Lisbon."), std::string::npos);
    EXPECT_NE(prompt.system.find("colour your answer strongly"), std::string::npos);
    EXPECT_NE(prompt.user.find("Question: Should I visit Lisbon?"), std::string::npos);
    EXPECT_NE(prompt.user.find("Additional context: planning a trip"), std::string::npos);
    EXPECT_NE(prompt.user.find("- [mu-w] Lisbon is hilly."), std::string::npos);
    EXPECT_NE(prompt.user.find("- [mu-o] Trams are charming. (confidence 0.70)"),
              std::string::npos);
    EXPECT_NE(prompt.user.find("- (none)"), std::string::npos);
}

TEST(PersonalityPromptTest, ParsesStructuredReply) {
    const std::string raw = R"(Sure! ```json
{"answer": "Yes, go in spring.",
 "opinions": [
   {"text": " Lisbon suits walkers ", "confidence": 1.4, "evidence": ["mu-w", 7],
    "inferential_distance": 2, "entities": ["Lisbon", {"name": "Ada", "type": "person"}],
    "about_people": false},
   {"confidence": 0.3},
   {"text": "   "}
 ]}
```)";
    auto parsed = parseReflectResponse(raw);
    EXPECT_TRUE(parsed.structured);
    EXPECT_EQ(parsed.answer, "Yes, go in spring.");
    ASSERT_EQ(parsed.opinions.size(), 1u);
    const auto& o = parsed.opinions[0];
    EXPECT_EQ(o.text, "Lisbon suits walkers");
    EXPECT_DOUBLE_EQ(o.confidence, 1.0);
    EXPECT_EQ(o.evidence, std::vector<std::string>{"mu-w"});
    EXPECT_EQ(o.inferentialDistance, 2);
    ASSERT_EQ(o.entities.size(), 2u);
    EXPECT_EQ(o.entities[1].type, "person");
}

TEST(PersonalityPromptTest, UnstructuredReplyBecomesTheAnswer) {
    auto parsed = parseReflectResponse("  Probably yes.\n");
    EXPECT_FALSE(parsed.structured);
    EXPECT_EQ(parsed.answer, "Probably yes.");
    EXPECT_TRUE(parsed.opinions.empty());
}

TEST(PersonalityPromptTest, TraitInferenceIsClampedAndDefaulted) {
    auto traits = parseTraitInference(R"({"openness": 1.5, "neuroticism": -0.2})");
    ASSERT_TRUE(traits.has_value());
    EXPECT_DOUBLE_EQ(traits->openness, 1.0);
    EXPECT_DOUBLE_EQ(traits->neuroticism, 0.0);
    EXPECT_DOUBLE_EQ(traits->agreeableness, 0.5);

    EXPECT_FALSE(parseTraitInference("no idea").has_value());
    EXPECT_FALSE(parseTraitInference(R"({"mood": 0.2})").has_value());
}

TEST(PersonalityPromptTest, MergePromptFavoursNewInformation) {
    auto prompt = buildBackgroundMergePrompt("", "I moved to Porto.");
    EXPECT_NE(prompt.system.find("new information wins"), std::string::npos);
    EXPECT_NE(prompt.user.find("(empty)"), std::string::npos);
    EXPECT_NE(prompt.user.find("I moved to Porto."), std::string::npos);

    auto infer = buildTraitInferencePrompt("I moved to Porto.");
    EXPECT_NE(infer.user.find("bias_strength"), std::string::npos);
}
