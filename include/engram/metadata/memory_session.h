#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <engram/metadata/database.h>
#include <engram/metadata/memory_types.h>

namespace engram::metadata {

struct ScoredUnitId {
    std::string id;
    double score = 0.0;
};

/**
 * @brief Admission filter applied by every search primitive before ranking
 */
struct UnitFilter {
    std::vector<FactType> factTypes; ///< Empty admits every type
    std::optional<TimeRange> timeRange;
};

struct DocumentDeletion {
    bool existed = false;
    int64_t unitsDeleted = 0;
};

// Unit near a new unit in time, or sharing its document
struct TemporalCandidate {
    UnitStats stats;
    std::optional<std::string> documentId;
};

/**
 * @brief All memory-store SQL, bound to one connection.
 *
 * Every method is scoped by bank id. A session does not own its connection and does
 * not open transactions; MemoryRepository decides whether the calls run inside one.
 */
class MemorySession {
public:
    explicit MemorySession(Database& db) : db_(db) {}

    // Banks
    Result<Bank> ensureBank(const std::string& bankId);
    Result<std::optional<Bank>> getBank(const std::string& bankId);
    Result<void> updateBank(const Bank& bank);
    Result<std::vector<Bank>> listBanks();
    Result<BankStats> bankStats(const std::string& bankId);

    // Documents
    Result<std::optional<Document>> getDocument(const std::string& bankId,
                                                const std::string& documentId);
    Result<void> insertDocument(const Document& document);
    Result<DocumentDeletion> deleteDocumentCascade(const std::string& bankId,
                                                   const std::string& documentId);
    Result<Page<Document>> listDocuments(const std::string& bankId, const ListQuery& query);

    // Memory units
    Result<void> insertUnit(const MemoryUnit& unit);
    Result<void> addUnitSource(const std::string& bankId, const std::string& unitId,
                               const std::string& documentId);
    Result<void> updateConfidence(const std::string& bankId, const std::string& unitId,
                                  double confidence);
    // Marks a unit as asserted outside any document; document deletion never removes it
    Result<void> markRetainedDirectly(const std::string& bankId, const std::string& unitId);
    Result<std::optional<MemoryUnit>> getUnit(const std::string& bankId, const std::string& unitId);
    Result<std::vector<MemoryUnit>> getUnits(const std::string& bankId,
                                             const std::vector<std::string>& unitIds);
    Result<std::vector<UnitStats>> getUnitStats(const std::string& bankId,
                                                const std::vector<std::string>& unitIds);
    Result<Page<MemoryUnit>> listUnits(const std::string& bankId, const ListQuery& query);
    Result<bool> deleteUnit(const std::string& bankId, const std::string& unitId);
    Result<int64_t> deleteUnits(const std::string& bankId, std::optional<FactType> factType);

    // Search primitives
    Result<std::vector<ScoredUnitId>> nearestUnits(const std::string& bankId,
                                                   const Embedding& query, size_t limit,
                                                   double minSimilarity, const UnitFilter& filter);
    Result<std::vector<ScoredUnitId>> lexicalSearch(const std::string& bankId,
                                                    const std::string& text, size_t limit,
                                                    const UnitFilter& filter);
    Result<std::vector<UnitStats>> unitsInRange(const std::string& bankId, const UnitFilter& filter,
                                                size_t limit);
    Result<std::vector<TemporalCandidate>>
    temporalCandidates(const std::string& bankId, const TimeRange& window,
                       const std::optional<std::string>& documentId, size_t limit);

    // Entities
    Result<std::vector<Entity>> listEntities(const std::string& bankId);
    Result<void> insertEntity(const Entity& entity);
    Result<void> linkUnitEntity(const std::string& bankId, const std::string& unitId,
                                const std::string& entityId);
    Result<std::vector<std::pair<std::string, std::string>>>
    unitEntityPairsForEntities(const std::string& bankId,
                               const std::vector<std::string>& entityIds);
    Result<std::vector<std::pair<std::string, std::string>>>
    unitEntityPairsForUnits(const std::string& bankId, const std::vector<std::string>& unitIds);

    // Links
    Result<void> insertLink(const std::string& bankId, const MemoryLink& link);
    Result<std::vector<MemoryLink>> linksForUnits(const std::string& bankId,
                                                  const std::vector<std::string>& unitIds);

    // Async operations
    Result<void> insertOperation(const AsyncOperation& op);
    Result<std::optional<AsyncOperation>> getOperation(const std::string& bankId,
                                                       const std::string& operationId);
    Result<std::vector<AsyncOperation>> listOperations(const std::string& bankId,
                                                       std::optional<OperationState> state);
    Result<std::vector<AsyncOperation>> operationsInState(OperationState state);

    /**
     * @brief Conditional transition; false when the operation is not in @p from
     */
    Result<bool> transitionOperation(const std::string& operationId, OperationState from,
                                     OperationState to,
                                     const std::optional<std::string>& result = std::nullopt,
                                     const std::optional<std::string>& error = std::nullopt);

    Result<bool> hasFullTextIndex();

private:
    Database& db_;
    std::optional<bool> ftsAvailable_;

    Result<std::vector<ScoredUnitId>> lexicalSearchFallback(const std::string& bankId,
                                                            const std::string& text,
                                                            size_t limit,
                                                            const UnitFilter& filter);
};

} // namespace engram::metadata
