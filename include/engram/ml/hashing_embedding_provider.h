#pragma once

#include <atomic>
#include <engram/ml/provider.h>

namespace engram::ml {

/**
 * Deterministic local embedding provider.
 *
 * Signed feature hashing of lowercase word unigrams and bigrams into D buckets,
 * L2-normalised. Identical text always yields an identical vector and texts sharing
 * words have positive cosine similarity, which is all retain and recall need when no
 * model-backed provider is configured.
 */
class HashingEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension = 384);
    ~HashingEmbeddingProvider() override;

    Result<std::vector<float>> generateEmbedding(const std::string& text) override;
    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override;

    bool isAvailable() const override { return initialized_.load(); }
    std::string getProviderName() const override { return "Hashing"; }
    size_t getEmbeddingDimension() const override { return dimension_; }

    Result<void> initialize() override;
    void shutdown() override;

private:
    size_t dimension_;
    std::atomic<bool> initialized_{false};
};

} // namespace engram::ml
