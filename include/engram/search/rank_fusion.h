#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <engram/core/types.h>
#include <engram/metadata/memory_types.h>

namespace engram::search {

struct FusedCandidate {
    std::string id;
    double rrfScore = 0.0;
    TimePoint mentionedAt;
    double confidence = 0.0;
};

struct RankedCandidate {
    std::string id;
    double weight = 0.0;
};

/**
 * @brief Reciprocal rank fusion.
 *
 * score(u) = sum over rankings of 1 / (k + rank), ranks 1-based, a unit absent from a
 * ranking adds nothing and repeated ids within one ranking count once. Ties: newer
 * mentioned_at, then higher confidence, then smaller id. Ids without stats are dropped.
 */
std::vector<FusedCandidate>
fuseRankings(const std::vector<std::vector<std::string>>& rankings,
             const std::unordered_map<std::string, metadata::UnitStats>& stats, int k);

/**
 * @brief Final weights from fused order and reranker scores.
 *
 * @p rerankScores holds one score for each of the first rerankScores.size() fused
 * candidates. With r_norm the min-max normalised reranker score over that window (1.0
 * when all are equal) and f_norm = rrf / max_rrf:
 * - window: w = rerankWeight * r_norm + (1 - rerankWeight) * f_norm, ordered by w,
 *   ties in fused order
 * - beyond the window: w = (1 - rerankWeight) * f_norm, fused order
 * With no scores at all every candidate gets w = f_norm.
 */
std::vector<RankedCandidate> blendWithReranker(const std::vector<FusedCandidate>& fused,
                                               const std::vector<float>& rerankScores,
                                               double rerankWeight);

} // namespace engram::search
