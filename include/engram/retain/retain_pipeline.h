#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <engram/extraction/fact_extractor.h>
#include <engram/metadata/memory_repository.h>
#include <engram/ml/capability_invoker.h>
#include <engram/ml/provider.h>
#include <engram/retain/bank_write_locks.h>
#include <engram/search/entity_resolver.h>

namespace engram::retain {

struct RetainConfig {
    double dedupThreshold = 0.95;
    double semanticLinkThreshold = 0.70;
    size_t semanticLinkLimit = 5;
    std::chrono::hours temporalLinkWindow{24};
    size_t temporalLinkLimit = 10;
    double mergeBoost = 0.2;
    double defaultConfidence = 0.8;
    size_t maxBankIdLength = 128;
    size_t maxContentLength = 1 << 20;
};

struct RetainItem {
    std::string content;
    std::optional<std::string> documentId;
    std::string context;
    std::optional<metadata::TimeRange> occurredHint;
    std::map<std::string, std::string> metadata;
};

struct RetainOutcome {
    size_t index = 0;
    bool success = false;
    std::vector<std::string> createdUnitIds;
    std::vector<std::string> mergedUnitIds;
    std::optional<std::string> documentId;
    std::optional<Error> error;
};

struct RetainBatchResult {
    std::vector<RetainOutcome> items;

    [[nodiscard]] size_t succeeded() const;
    [[nodiscard]] size_t failed() const { return items.size() - succeeded(); }
};

// Opinion produced by reflection, ready to be stored
struct OpinionDraft {
    std::string text;
    double confidence = 0.5;
    std::vector<search::EntityMention> entities;
};

/**
 * @brief Turns raw content into stored memory units.
 *
 * Per item: extraction and embedding run first, without any lock. The store write then
 * happens under the bank's writer lock in a single transaction:
 * - a document id replaces the previous document of that id (cascade-deleting units it
 *   alone supported)
 * - a fact whose embedding is within the dedup threshold of an existing unit of the same
 *   bank and type merges into it (confidence boost plus provenance) instead of creating
 *   a unit
 * - new units get entity links, temporal links and semantic links
 *
 * An item that fails leaves no trace; the other items of the batch are unaffected.
 */
class RetainPipeline {
public:
    RetainPipeline(std::shared_ptr<metadata::MemoryRepository> repository,
                   std::shared_ptr<extraction::IFactExtractor> extractor,
                   std::shared_ptr<ml::IEmbeddingProvider> embedder,
                   std::shared_ptr<search::EntityResolver> entityResolver,
                   std::shared_ptr<BankWriteLocks> locks, ml::CapabilityInvoker invoker,
                   RetainConfig config = {});

    /**
     * @brief Retain every item in order. The outer Result fails only for a bad bank id.
     */
    Result<RetainBatchResult> retainBatch(const std::string& bankId,
                                          const std::vector<RetainItem>& items) const;

    /**
     * @brief Store opinions formed by reflection; near-duplicates of existing opinions
     * are skipped. Returns the units created.
     */
    Result<std::vector<metadata::MemoryUnit>>
    persistOpinions(const std::string& bankId, const std::vector<OpinionDraft>& opinions) const;

    Result<void> validateBankId(const std::string& bankId) const;

    [[nodiscard]] const RetainConfig& config() const noexcept { return config_; }

private:
    struct PreparedFact {
        extraction::ExtractedFact fact;
        Embedding embedding;
    };

    Result<RetainOutcome> retainItem(const std::string& bankId, const RetainItem& item) const;

    Result<std::vector<Embedding>> embedAll(const std::vector<std::string>& texts) const;

    // Inside a write transaction: entity, temporal and semantic links of a new unit
    Result<void> linkNewUnit(metadata::MemorySession& session, const metadata::MemoryUnit& unit,
                             const std::vector<search::EntityMention>& mentions) const;

    std::shared_ptr<metadata::MemoryRepository> repository_;
    std::shared_ptr<extraction::IFactExtractor> extractor_;
    std::shared_ptr<ml::IEmbeddingProvider> embedder_;
    std::shared_ptr<search::EntityResolver> entityResolver_;
    std::shared_ptr<BankWriteLocks> locks_;
    ml::CapabilityInvoker invoker_;
    RetainConfig config_;
};

} // namespace engram::retain
