#include <cmath>
#include <cstring>
#include <engram/metadata/memory_types.h>

namespace engram::metadata {

const char* factTypeToString(FactType type) {
    switch (type) {
        case FactType::World:
            return "world";
        case FactType::Agent:
            return "agent";
        case FactType::Opinion:
            return "opinion";
    }
    return "world";
}

std::optional<FactType> factTypeFromString(std::string_view s) {
    if (s == "world")
        return FactType::World;
    if (s == "agent" || s == "bank")
        return FactType::Agent;
    if (s == "opinion")
        return FactType::Opinion;
    return std::nullopt;
}

const char* linkKindToString(LinkKind kind) {
    switch (kind) {
        case LinkKind::TemporalSequence:
            return "temporal-sequence";
        case LinkKind::SemanticSimilarity:
            return "semantic-similarity";
    }
    return "semantic-similarity";
}

std::optional<LinkKind> linkKindFromString(std::string_view s) {
    if (s == "temporal-sequence")
        return LinkKind::TemporalSequence;
    if (s == "semantic-similarity")
        return LinkKind::SemanticSimilarity;
    return std::nullopt;
}

const char* operationStateToString(OperationState state) {
    switch (state) {
        case OperationState::Pending:
            return "pending";
        case OperationState::Processing:
            return "processing";
        case OperationState::Completed:
            return "completed";
        case OperationState::Failed:
            return "failed";
        case OperationState::Cancelled:
            return "cancelled";
    }
    return "pending";
}

std::optional<OperationState> operationStateFromString(std::string_view s) {
    if (s == "pending")
        return OperationState::Pending;
    if (s == "processing")
        return OperationState::Processing;
    if (s == "completed")
        return OperationState::Completed;
    if (s == "failed")
        return OperationState::Failed;
    if (s == "cancelled")
        return OperationState::Cancelled;
    return std::nullopt;
}

bool PersonalityTraits::isValid() const {
    auto in01 = [](double v) { return v >= 0.0 && v <= 1.0; };
    return in01(openness) && in01(conscientiousness) && in01(extraversion) &&
           in01(agreeableness) && in01(neuroticism) && in01(biasStrength);
}

bool DispositionTraits::isValid() const {
    auto in15 = [](int v) { return v >= 1 && v <= 5; };
    return in15(skepticism) && in15(literalism) && in15(empathy);
}

std::vector<std::byte> encodeEmbedding(const Embedding& embedding) {
    std::vector<std::byte> blob(embedding.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), embedding.data(), blob.size());
    }
    return blob;
}

Embedding decodeEmbedding(const std::vector<std::byte>& blob) {
    Embedding embedding(blob.size() / sizeof(float));
    if (!embedding.empty()) {
        std::memcpy(embedding.data(), blob.data(), embedding.size() * sizeof(float));
    }
    return embedding;
}

double cosineSimilarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

} // namespace engram::metadata
