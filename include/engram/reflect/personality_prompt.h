#pragma once

#include <optional>
#include <string>
#include <vector>
#include <engram/metadata/memory_types.h>
#include <engram/ml/reasoner.h>
#include <engram/reflect/disposition_policy.h>
#include <engram/search/recall_engine.h>

namespace engram::reflect {

// Facts assembled for one reflection, grouped by fact type
struct ReflectContext {
    std::vector<search::RecallHit> world;
    std::vector<search::RecallHit> agent;
    std::vector<search::RecallHit> opinions;
};

struct ParsedReflection {
    std::string answer;
    std::vector<OpinionCandidate> opinions;
    bool structured = false; ///< False when the reply was not the requested JSON
};

// "highly open to new experiences, moderately organised, ..."
std::string describePersonality(const metadata::PersonalityTraits& traits);

/**
 * @brief Prompt for answering @p query from the bank's memories.
 *
 * Personality and bias strength shape only the tone of the answer; the reply format is
 * the same for every bank.
 */
ml::ReasoningPrompt buildReflectPrompt(const metadata::Bank& bank, const std::string& query,
                                       const std::string& extraContext,
                                       const ReflectContext& facts);

ParsedReflection parseReflectResponse(const std::string& raw);

ml::ReasoningPrompt buildBackgroundMergePrompt(const std::string& current,
                                               const std::string& addition);

ml::ReasoningPrompt buildTraitInferencePrompt(const std::string& background);

// Traits from a reasoner reply, clamped to [0,1]; empty when the reply is not usable
std::optional<metadata::PersonalityTraits> parseTraitInference(const std::string& raw);

} // namespace engram::reflect
