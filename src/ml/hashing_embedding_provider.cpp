#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <string_view>
#include <engram/core/text_tokens.h>
#include <engram/ml/hashing_embedding_provider.h>

namespace engram::ml {

namespace {

// FNV-1a, stable across platforms and runs (std::hash is not)
uint64_t fnv1a(std::string_view s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

void addFeature(std::vector<float>& vec, std::string_view feature, float weight) {
    const uint64_t h = fnv1a(feature);
    const size_t bucket = static_cast<size_t>(h % vec.size());
    const float sign = ((h >> 63) & 1u) ? -1.0f : 1.0f;
    vec[bucket] += sign * weight;
}

} // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension) : dimension_(dimension) {
    spdlog::debug("HashingEmbeddingProvider created with dimension {}", dimension);
}

HashingEmbeddingProvider::~HashingEmbeddingProvider() {
    if (initialized_) {
        shutdown();
    }
}

Result<void> HashingEmbeddingProvider::initialize() {
    if (dimension_ == 0) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension must be positive"};
    }
    initialized_ = true;
    return {};
}

void HashingEmbeddingProvider::shutdown() {
    initialized_ = false;
}

Result<std::vector<float>> HashingEmbeddingProvider::generateEmbedding(const std::string& text) {
    if (!initialized_) {
        return Error{ErrorCode::NotInitialized, "Hashing provider not initialized"};
    }

    std::vector<float> embedding(dimension_, 0.0f);
    const auto tokens = core::tokenizeWords(text);
    for (size_t i = 0; i < tokens.size(); ++i) {
        addFeature(embedding, tokens[i], 1.0f);
        if (i + 1 < tokens.size()) {
            addFeature(embedding, tokens[i] + ' ' + tokens[i + 1], 0.5f);
        }
    }

    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    } else {
        // Texts without any word still need a valid unit vector
        embedding[0] = 1.0f;
    }
    return embedding;
}

Result<std::vector<std::vector<float>>>
HashingEmbeddingProvider::generateBatchEmbeddings(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(texts.size());

    for (const auto& text : texts) {
        auto result = generateEmbedding(text);
        if (!result) {
            return result.error();
        }
        embeddings.push_back(std::move(result).value());
    }

    return embeddings;
}

} // namespace engram::ml
