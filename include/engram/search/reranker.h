#pragma once

#include <string>
#include <vector>
#include <engram/core/types.h>

namespace engram::search {

/**
 * @brief Cross-encoder style relevance scoring of (query, candidate) pairs
 */
class IReranker {
public:
    virtual ~IReranker() = default;

    /**
     * @brief Score documents against a query
     *
     * @param query The search query
     * @param documents Candidate texts
     * @return One relevance score per document, in input order, or error
     */
    virtual Result<std::vector<float>> scoreDocuments(const std::string& query,
                                                      const std::vector<std::string>& documents) = 0;

    /**
     * @brief Check if the reranker is ready to accept requests
     */
    virtual bool isReady() const = 0;
};

/**
 * @brief Deterministic local reranker.
 *
 * Score = fraction of distinct query terms present in the candidate, plus 0.5 times
 * the fraction of query bigrams present, divided by 1.5. Stop words are ignored.
 */
class LexicalOverlapReranker : public IReranker {
public:
    Result<std::vector<float>> scoreDocuments(const std::string& query,
                                              const std::vector<std::string>& documents) override;

    bool isReady() const override { return true; }
};

} // namespace engram::search
