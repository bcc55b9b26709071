#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include <engram/metadata/memory_types.h>
#include <engram/search/entity_resolver.h>

namespace engram::reflect {

// Opinion proposed by the reasoner, before disposition is applied
struct OpinionCandidate {
    std::string text;
    double confidence = 0.5;
    std::vector<std::string> evidence; ///< Cited memory unit ids
    int inferentialDistance = 0;       ///< 0 = restates a fact, higher = further extrapolation
    std::vector<search::EntityMention> entities;
    bool aboutPeople = false;
};

struct AcceptedOpinion {
    OpinionCandidate candidate;
    double confidence = 0.0; ///< After disposition adjustment
    double priority = 0.0;
};

/**
 * @brief Decides which candidate opinions a bank adopts, and with what confidence.
 *
 * Contract: for fixed candidates, raising skepticism never raises the confidence of an
 * accepted opinion.
 */
class IDispositionPolicy {
public:
    virtual ~IDispositionPolicy() = default;

    /**
     * @param retrievedIds ids of the units that were actually put in front of the reasoner;
     *        evidence citing anything else does not count
     * @param budget maximum number of opinions to accept
     * @return accepted opinions, highest priority first
     */
    virtual std::vector<AcceptedOpinion>
    apply(const std::vector<OpinionCandidate>& candidates,
          const std::unordered_set<std::string>& retrievedIds,
          const metadata::DispositionTraits& traits, size_t budget) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Linear mapping from traits to thresholds and scaling.
 *
 * - skepticism s: needs at least 1 + (s - 1) / 2 retrieved evidence ids; confidence is
 *   scaled by 1 - 0.15 * (s - 1)
 * - literalism l: inferential distance must not exceed 5 - l
 * - empathy e: opinions about people get priority confidence * (1 + 0.1 * (e - 1))
 *
 * Ties in priority are broken by text.
 */
class LinearDispositionPolicy : public IDispositionPolicy {
public:
    std::vector<AcceptedOpinion> apply(const std::vector<OpinionCandidate>& candidates,
                                       const std::unordered_set<std::string>& retrievedIds,
                                       const metadata::DispositionTraits& traits,
                                       size_t budget) const override;

    std::string name() const override { return "linear"; }

    static int requiredEvidence(int skepticism);
    static int maxInferentialDistance(int literalism);
    static double adjustConfidence(double raw, int skepticism);
    static double priority(double confidence, bool aboutPeople, int empathy);
};

} // namespace engram::reflect
