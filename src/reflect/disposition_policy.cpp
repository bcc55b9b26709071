#include <spdlog/spdlog.h>

#include <algorithm>
#include <engram/reflect/disposition_policy.h>

namespace engram::reflect {

int LinearDispositionPolicy::requiredEvidence(int skepticism) {
    return 1 + (std::clamp(skepticism, 1, 5) - 1) / 2;
}

int LinearDispositionPolicy::maxInferentialDistance(int literalism) {
    return 5 - std::clamp(literalism, 1, 5);
}

double LinearDispositionPolicy::adjustConfidence(double raw, int skepticism) {
    const double factor = 1.0 - 0.15 * (std::clamp(skepticism, 1, 5) - 1);
    return std::clamp(std::clamp(raw, 0.0, 1.0) * factor, 0.0, 1.0);
}

double LinearDispositionPolicy::priority(double confidence, bool aboutPeople, int empathy) {
    if (!aboutPeople)
        return confidence;
    return confidence * (1.0 + 0.1 * (std::clamp(empathy, 1, 5) - 1));
}

std::vector<AcceptedOpinion>
LinearDispositionPolicy::apply(const std::vector<OpinionCandidate>& candidates,
                               const std::unordered_set<std::string>& retrievedIds,
                               const metadata::DispositionTraits& traits, size_t budget) const {
    const int needed = requiredEvidence(traits.skepticism);
    const int maxDistance = maxInferentialDistance(traits.literalism);

    std::vector<AcceptedOpinion> accepted;
    for (const auto& c : candidates) {
        if (c.text.empty())
            continue;

        std::unordered_set<std::string> cited;
        for (const auto& id : c.evidence) {
            if (retrievedIds.count(id))
                cited.insert(id);
        }
        if (static_cast<int>(cited.size()) < needed) {
            spdlog::debug("[Reflect] Rejected opinion (evidence {} < {}): {}", cited.size(),
                          needed, c.text);
            continue;
        }
        if (c.inferentialDistance > maxDistance) {
            spdlog::debug("[Reflect] Rejected opinion (distance {} > {}): {}",
                          c.inferentialDistance, maxDistance, c.text);
            continue;
        }

        AcceptedOpinion a;
        a.candidate = c;
        a.confidence = adjustConfidence(c.confidence, traits.skepticism);
        a.priority = priority(a.confidence, c.aboutPeople, traits.empathy);
        accepted.push_back(std::move(a));
    }

    std::sort(accepted.begin(), accepted.end(),
              [](const AcceptedOpinion& a, const AcceptedOpinion& b) {
                  if (a.priority != b.priority)
                      return a.priority > b.priority;
                  return a.candidate.text < b.candidate.text;
              });
    if (accepted.size() > budget)
        accepted.resize(budget);
    return accepted;
}

} // namespace engram::reflect
