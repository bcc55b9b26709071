#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <engram/core/types.h>

namespace engram::metadata {

enum class FactType { World, Agent, Opinion };

const char* factTypeToString(FactType type);
std::optional<FactType> factTypeFromString(std::string_view s);

/**
 * @brief Big-Five traits plus bias strength, all in [0,1]. Shape only answer style.
 */
struct PersonalityTraits {
    double openness = 0.5;
    double conscientiousness = 0.5;
    double extraversion = 0.5;
    double agreeableness = 0.5;
    double neuroticism = 0.5;
    double biasStrength = 0.5;

    bool isValid() const;
};

/**
 * @brief Disposition traits in [1,5]. Consulted only when forming opinions.
 */
struct DispositionTraits {
    int skepticism = 3;
    int literalism = 3;
    int empathy = 3;

    bool isValid() const;
};

struct Bank {
    std::string id;
    std::string name;
    std::string background;
    PersonalityTraits personality;
    DispositionTraits disposition;
    TimePoint createdAt;
    TimePoint updatedAt;
};

struct MemoryUnit {
    std::string id;
    std::string bankId;
    std::string text;
    FactType factType = FactType::World;
    double confidence = 0.0;
    Embedding embedding;
    std::optional<TimePoint> occurredStart;
    std::optional<TimePoint> occurredEnd;
    TimePoint mentionedAt;
    std::string context;
    std::optional<std::string> documentId;
    std::vector<std::string> entityIds;
};

// Columns needed for ranking, without text or embedding
struct UnitStats {
    std::string id;
    FactType factType = FactType::World;
    double confidence = 0.0;
    TimePoint mentionedAt;
    std::optional<TimePoint> occurredStart;
    std::optional<TimePoint> occurredEnd;
};

struct Document {
    std::string id;
    std::string bankId;
    std::string content;
    std::map<std::string, std::string> metadata;
    TimePoint createdAt;
    TimePoint updatedAt;
    int64_t unitCount = 0;
};

struct Entity {
    std::string id;
    std::string bankId;
    std::string name;
    std::string type;
    std::string canonicalName;
};

enum class LinkKind { TemporalSequence, SemanticSimilarity };

const char* linkKindToString(LinkKind kind);
std::optional<LinkKind> linkKindFromString(std::string_view s);

struct MemoryLink {
    std::string fromUnitId;
    std::string toUnitId;
    LinkKind kind = LinkKind::SemanticSimilarity;
    double weight = 0.0;
};

enum class OperationState { Pending, Processing, Completed, Failed, Cancelled };

const char* operationStateToString(OperationState state);
std::optional<OperationState> operationStateFromString(std::string_view s);

struct AsyncOperation {
    std::string id;
    std::string bankId;
    std::string kind;
    OperationState state = OperationState::Pending;
    std::string payload;
    std::optional<std::string> result;
    std::optional<std::string> error;
    TimePoint createdAt;
    TimePoint updatedAt;
};

// Closed time interval [start, end]
struct TimeRange {
    TimePoint start;
    TimePoint end;

    bool intersects(TimePoint otherStart, TimePoint otherEnd) const {
        return otherStart <= end && start <= otherEnd;
    }
};

// Interval used for temporal filtering when occurrence bounds are partly unknown
inline TimeRange effectiveOccurrence(const std::optional<TimePoint>& occurredStart,
                                     const std::optional<TimePoint>& occurredEnd,
                                     TimePoint mentionedAt) {
    TimePoint start = occurredStart ? *occurredStart : (occurredEnd ? *occurredEnd : mentionedAt);
    TimePoint end = occurredEnd ? *occurredEnd : (occurredStart ? *occurredStart : mentionedAt);
    return TimeRange{start, end};
}

struct BankStats {
    std::string bankId;
    std::map<std::string, int64_t> unitsByFactType;
    int64_t totalUnits = 0;
    int64_t documents = 0;
    int64_t entities = 0;
    std::map<std::string, int64_t> linksByKind;
    std::map<std::string, int64_t> operationsByState;
};

// Listing queries shared by units and documents
struct ListQuery {
    std::optional<FactType> factType;
    std::optional<std::string> q;
    int limit = 100;
    int offset = 0;
};

template <typename T> struct Page {
    std::vector<T> items;
    int64_t total = 0;
    int limit = 0;
    int offset = 0;
};

struct GraphEdge {
    std::string source;
    std::string target;
    std::string kind; // link kind or "entity"
    double weight = 1.0;
};

struct GraphData {
    std::vector<MemoryUnit> units;
    std::vector<Entity> entities;
    std::vector<GraphEdge> edges;
};

// Embedding BLOB codec (float32, host byte order)
std::vector<std::byte> encodeEmbedding(const Embedding& embedding);
Embedding decodeEmbedding(const std::vector<std::byte>& blob);

// Cosine similarity; 0 when either vector is zero or the sizes differ
double cosineSimilarity(const Embedding& a, const Embedding& b);

} // namespace engram::metadata
