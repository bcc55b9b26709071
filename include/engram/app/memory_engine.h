#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <engram/config/engine_config.h>
#include <engram/daemon/components/OperationQueue.h>
#include <engram/daemon/components/WorkCoordinator.h>
#include <engram/extraction/fact_extractor.h>
#include <engram/metadata/memory_repository.h>
#include <engram/ml/provider.h>
#include <engram/ml/reasoner.h>
#include <engram/reflect/reflect_engine.h>
#include <engram/retain/retain_pipeline.h>
#include <engram/search/recall_engine.h>

namespace engram::app {

/**
 * @brief External capabilities plugged into the engine. Empty slots get the local
 * defaults, except the reasoner, which has none.
 */
struct EngineCapabilities {
    std::shared_ptr<ml::IEmbeddingProvider> embedder;
    std::shared_ptr<extraction::IFactExtractor> extractor;
    std::shared_ptr<search::IReranker> reranker;
    std::shared_ptr<search::ITemporalParser> temporalParser;
    std::shared_ptr<ml::IReasoner> reasoner;
    std::shared_ptr<search::IEntityResolutionStrategy> entityStrategy;
    std::shared_ptr<reflect::IDispositionPolicy> dispositionPolicy;
};

struct BankProfileUpdate {
    std::optional<std::string> name;
    std::optional<std::string> background;
    std::optional<metadata::PersonalityTraits> personality;
    std::optional<metadata::DispositionTraits> disposition;
};

struct BackgroundMergeResult {
    std::string background;
    std::optional<metadata::PersonalityTraits> personality; ///< Set when traits were inferred
};

/**
 * @brief The memory engine: retain, recall and reflect over isolated banks, plus bank
 * profiles, browsing and asynchronous retain.
 *
 * Owns the store, three worker pools (capability calls, recall strategies, async
 * operations) and the engines built on them. Banks are created on first write or
 * profile access; reads of an unknown bank see an empty bank.
 */
class MemoryEngine {
public:
    static Result<std::unique_ptr<MemoryEngine>> create(const config::EngineConfig& config,
                                                        EngineCapabilities capabilities = {});

    ~MemoryEngine();

    MemoryEngine(const MemoryEngine&) = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;

    /**
     * @brief Stop the worker pools and close the store. Idempotent.
     */
    void shutdown();

    // Core pipeline
    Result<retain::RetainBatchResult> retain(const std::string& bankId,
                                             const std::vector<retain::RetainItem>& items);
    Result<search::RecallSequence> recall(const search::RecallQuery& query) const;
    Result<reflect::ReflectResult> reflect(const reflect::ReflectRequest& request);

    // Bank profile
    Result<metadata::Bank> getBank(const std::string& bankId);
    Result<metadata::Bank> putBank(const std::string& bankId, const BankProfileUpdate& update);
    Result<metadata::Bank> updatePersonality(const std::string& bankId,
                                             const metadata::PersonalityTraits& traits);
    Result<metadata::Bank> updateDisposition(const std::string& bankId,
                                             const metadata::DispositionTraits& traits);
    Result<std::vector<metadata::Bank>> listBanks() const;
    Result<metadata::BankStats> bankStats(const std::string& bankId) const;

    /**
     * @brief Merge @p text into the bank's background. With a reasoner the merge resolves
     * conflicts in favour of the new text and may re-infer personality; without one the
     * new sentences are appended and personality is left alone.
     */
    Result<BackgroundMergeResult> mergeBackground(const std::string& bankId,
                                                  const std::string& text,
                                                  bool updatePersonality);

    // Browsing
    Result<metadata::Page<metadata::MemoryUnit>> listMemories(const std::string& bankId,
                                                              const metadata::ListQuery& query) const;
    Result<void> deleteMemory(const std::string& bankId, const std::string& unitId);
    Result<int64_t> clearMemories(const std::string& bankId,
                                  std::optional<metadata::FactType> factType);
    Result<metadata::Page<metadata::Document>> listDocuments(const std::string& bankId,
                                                             const metadata::ListQuery& query) const;
    Result<metadata::Document> getDocument(const std::string& bankId,
                                           const std::string& documentId) const;
    Result<metadata::DocumentDeletion> deleteDocument(const std::string& bankId,
                                                      const std::string& documentId);
    Result<metadata::GraphData> graph(const std::string& bankId,
                                      std::optional<metadata::FactType> factType,
                                      size_t limit) const;

    // Asynchronous retain
    Result<metadata::AsyncOperation> retainAsync(const std::string& bankId,
                                                 const std::vector<retain::RetainItem>& items);
    Result<std::vector<metadata::AsyncOperation>>
    listOperations(const std::string& bankId, std::optional<metadata::OperationState> state) const;
    Result<metadata::AsyncOperation> getOperation(const std::string& bankId,
                                                  const std::string& operationId) const;
    Result<daemon::CancelOutcome> cancelOperation(const std::string& bankId,
                                                  const std::string& operationId);

    [[nodiscard]] const config::EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<metadata::MemoryRepository>& repository() const noexcept {
        return repository_;
    }

    static constexpr const char* kRetainBatchKind = "retain_batch";

private:
    MemoryEngine(config::EngineConfig config, std::shared_ptr<metadata::MemoryRepository> repository);

    Result<void> wire(EngineCapabilities capabilities);
    Result<metadata::Bank> modifyBank(const std::string& bankId,
                                      const std::function<void(metadata::Bank&)>& change);
    Result<std::string> runRetainOperation(const metadata::AsyncOperation& op) const;

    config::EngineConfig config_;
    std::shared_ptr<metadata::MemoryRepository> repository_;
    std::shared_ptr<retain::BankWriteLocks> locks_;

    std::unique_ptr<daemon::WorkCoordinator> capabilityPool_;
    std::unique_ptr<daemon::WorkCoordinator> searchPool_;
    std::unique_ptr<daemon::WorkCoordinator> queuePool_;

    std::shared_ptr<ml::IReasoner> reasoner_;
    std::unique_ptr<ml::CapabilityInvoker> invoker_;
    std::shared_ptr<retain::RetainPipeline> retain_;
    std::shared_ptr<search::RecallEngine> recall_;
    std::shared_ptr<reflect::ReflectEngine> reflect_;
    std::shared_ptr<daemon::OperationQueue> queue_;
    bool shutdown_ = false;
};

} // namespace engram::app
