#include <algorithm>
#include <unordered_set>
#include <engram/search/rank_fusion.h>

namespace engram::search {

std::vector<FusedCandidate>
fuseRankings(const std::vector<std::vector<std::string>>& rankings,
             const std::unordered_map<std::string, metadata::UnitStats>& stats, int k) {
    std::unordered_map<std::string, double> scores;
    for (const auto& ranking : rankings) {
        std::unordered_set<std::string> seen;
        size_t rank = 0;
        for (const auto& id : ranking) {
            if (!seen.insert(id).second)
                continue;
            ++rank;
            scores[id] += 1.0 / (static_cast<double>(k) + static_cast<double>(rank));
        }
    }

    std::vector<FusedCandidate> fused;
    fused.reserve(scores.size());
    for (const auto& [id, score] : scores) {
        auto it = stats.find(id);
        if (it == stats.end())
            continue;
        fused.push_back(FusedCandidate{id, score, it->second.mentionedAt, it->second.confidence});
    }

    std::sort(fused.begin(), fused.end(), [](const FusedCandidate& a, const FusedCandidate& b) {
        if (a.rrfScore != b.rrfScore)
            return a.rrfScore > b.rrfScore;
        if (a.mentionedAt != b.mentionedAt)
            return a.mentionedAt > b.mentionedAt;
        if (a.confidence != b.confidence)
            return a.confidence > b.confidence;
        return a.id < b.id;
    });
    return fused;
}

std::vector<RankedCandidate> blendWithReranker(const std::vector<FusedCandidate>& fused,
                                               const std::vector<float>& rerankScores,
                                               double rerankWeight) {
    std::vector<RankedCandidate> out;
    if (fused.empty())
        return out;
    out.reserve(fused.size());

    double maxRrf = 0.0;
    for (const auto& c : fused)
        maxRrf = std::max(maxRrf, c.rrfScore);
    auto fNorm = [&](const FusedCandidate& c) { return maxRrf > 0.0 ? c.rrfScore / maxRrf : 0.0; };

    if (rerankScores.empty()) {
        for (const auto& c : fused)
            out.push_back({c.id, fNorm(c)});
        return out;
    }

    const size_t window = std::min(rerankScores.size(), fused.size());
    const auto [minIt, maxIt] = std::minmax_element(rerankScores.begin(),
                                                    rerankScores.begin() + window);
    const double lo = *minIt;
    const double hi = *maxIt;

    struct Scored {
        size_t fusedIndex;
        double weight;
    };
    std::vector<Scored> head;
    head.reserve(window);
    for (size_t i = 0; i < window; ++i) {
        const double rNorm = hi > lo ? (rerankScores[i] - lo) / (hi - lo) : 1.0;
        head.push_back({i, rerankWeight * rNorm + (1.0 - rerankWeight) * fNorm(fused[i])});
    }
    std::stable_sort(head.begin(), head.end(),
                     [](const Scored& a, const Scored& b) { return a.weight > b.weight; });

    for (const auto& s : head)
        out.push_back({fused[s.fusedIndex].id, s.weight});
    for (size_t i = window; i < fused.size(); ++i)
        out.push_back({fused[i].id, (1.0 - rerankWeight) * fNorm(fused[i])});
    return out;
}

} // namespace engram::search
