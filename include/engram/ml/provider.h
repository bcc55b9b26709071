#pragma once

#include <memory>
#include <string>
#include <vector>
#include <engram/core/types.h>

namespace engram::ml {

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 * Every vector a provider returns for one store must have the same dimension D.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Generate embedding for a single text
     * @param text Input text to embed
     * @return Vector of float embeddings or error
     */
    virtual Result<std::vector<float>> generateEmbedding(const std::string& text) = 0;

    /**
     * Generate embeddings for a batch of texts, one vector per input in order
     */
    virtual Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    virtual bool isAvailable() const = 0;

    /**
     * Get the name of this provider (e.g., "Hashing")
     */
    virtual std::string getProviderName() const = 0;

    virtual size_t getEmbeddingDimension() const = 0;

    virtual Result<void> initialize() = 0;
    virtual void shutdown() = 0;
};

} // namespace engram::ml
