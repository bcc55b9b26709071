#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>
#include <engram/app/memory_engine.h>
#include <engram/core/logging.h>
#include <engram/extraction/fact_extractor.h>
#include <engram/ml/hashing_embedding_provider.h>
#include <engram/retain/retain_codec.h>

namespace engram::app {

using metadata::Bank;
using metadata::MemorySession;

namespace {

constexpr size_t kSearchThreads = 4;

std::string trimmed(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Sentences of @p addition not already present in @p current, appended in order
std::string appendSentences(const std::string& current, const std::string& addition) {
    std::string merged = trimmed(current);
    for (const auto& sentence : extraction::SentenceFactExtractor::splitSentences(addition)) {
        if (merged.find(sentence) != std::string::npos)
            continue;
        if (!merged.empty())
            merged.push_back(' ');
        merged += sentence;
        const char last = sentence.back();
        if (last != '.' && last != '!' && last != '?')
            merged.push_back('.');
    }
    return merged;
}

} // namespace

Result<std::unique_ptr<MemoryEngine>> MemoryEngine::create(const config::EngineConfig& config,
                                                           EngineCapabilities capabilities) {
    auto valid = config.validate();
    if (!valid)
        return valid.error();
    core::initLogging(config.logLevel);

    metadata::ConnectionPoolConfig poolConfig;
    poolConfig.minConnections = config.storage.minConnections;
    poolConfig.maxConnections = config.storage.maxConnections;
    poolConfig.busyTimeout = config.storage.busyTimeout;
    auto repo = metadata::MemoryRepository::create(config.storage.dbPath.string(), poolConfig);
    if (!repo)
        return repo.error();

    std::unique_ptr<MemoryEngine> engine(
        new MemoryEngine(config, std::shared_ptr<metadata::MemoryRepository>(std::move(repo).value())));
    auto wired = engine->wire(std::move(capabilities));
    if (!wired)
        return wired.error();
    return engine;
}

MemoryEngine::MemoryEngine(config::EngineConfig config,
                           std::shared_ptr<metadata::MemoryRepository> repository)
    : config_(std::move(config)),
      repository_(std::move(repository)),
      locks_(std::make_shared<retain::BankWriteLocks>()) {}

MemoryEngine::~MemoryEngine() {
    shutdown();
}

Result<void> MemoryEngine::wire(EngineCapabilities caps) {
    if (!caps.embedder)
        caps.embedder = std::make_shared<ml::HashingEmbeddingProvider>(config_.embedding.dimension);
    if (!caps.embedder->isAvailable()) {
        auto init = caps.embedder->initialize();
        if (!init)
            return init.error();
    }
    if (caps.embedder->getEmbeddingDimension() != config_.embedding.dimension) {
        return Error{ErrorCode::InvalidArgument,
                     "embedding provider dimension " +
                         std::to_string(caps.embedder->getEmbeddingDimension()) +
                         " does not match configured " +
                         std::to_string(config_.embedding.dimension)};
    }
    if (!caps.temporalParser)
        caps.temporalParser = std::make_shared<search::HeuristicTemporalParser>();
    if (!caps.extractor)
        caps.extractor = std::make_shared<extraction::SentenceFactExtractor>(caps.temporalParser);
    if (!caps.reranker)
        caps.reranker = std::make_shared<search::LexicalOverlapReranker>();
    if (!caps.entityStrategy)
        caps.entityStrategy = std::make_shared<search::CanonicalNameStrategy>();
    if (!caps.dispositionPolicy)
        caps.dispositionPolicy = std::make_shared<reflect::LinearDispositionPolicy>();
    reasoner_ = caps.reasoner;

    capabilityPool_ = std::make_unique<daemon::WorkCoordinator>("capability");
    searchPool_ = std::make_unique<daemon::WorkCoordinator>("search");
    queuePool_ = std::make_unique<daemon::WorkCoordinator>("queue");
    try {
        capabilityPool_->start(config_.capabilities.poolThreads);
        searchPool_->start(kSearchThreads);
        queuePool_->start(config_.queue.maxConcurrent);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    ml::CapabilityPolicy policy;
    policy.timeout = config_.capabilities.timeout;
    policy.retry.maxAttempts = config_.capabilities.maxAttempts;
    policy.retry.initialBackoff = config_.capabilities.initialBackoff;
    policy.retry.maxBackoff = config_.capabilities.maxBackoff;
    invoker_ = std::make_unique<ml::CapabilityInvoker>(capabilityPool_->getExecutor(), policy);

    auto resolver = std::make_shared<search::EntityResolver>(caps.entityStrategy);

    retain::RetainConfig rc;
    rc.dedupThreshold = config_.retain.dedupThreshold;
    rc.semanticLinkThreshold = config_.retain.semanticLinkThreshold;
    rc.semanticLinkLimit = config_.retain.semanticLinkLimit;
    rc.temporalLinkWindow = config_.retain.temporalWindow;
    rc.temporalLinkLimit = config_.retain.temporalLinkLimit;
    rc.mergeBoost = config_.retain.mergeBoost;
    rc.defaultConfidence = config_.retain.defaultConfidence;
    retain_ = std::make_shared<retain::RetainPipeline>(repository_, caps.extractor, caps.embedder,
                                                       resolver, locks_, *invoker_, rc);

    search::RecallConfig sc;
    sc.rrfK = config_.recall.rrfK;
    sc.perStrategyLimit = config_.recall.perStrategyLimit;
    sc.strategyTimeout = config_.recall.strategyTimeout;
    sc.rerankTopN = config_.recall.rerankTopN;
    sc.rerankWeight = config_.recall.rerankWeight;
    sc.graphMaxHops = config_.recall.graphMaxHops;
    sc.graphHopDecay = config_.recall.graphHopDecay;
    sc.graphNodeBudget = config_.recall.graphNodeBudget;
    sc.defaultBudget = config_.recall.defaultBudget;
    sc.inferTimeFromQuery = config_.recall.inferTimeFromQuery;
    recall_ = std::make_shared<search::RecallEngine>(repository_, caps.embedder, caps.reranker,
                                                     caps.temporalParser, resolver, *invoker_,
                                                     searchPool_->getExecutor(), sc);

    reflect::ReflectConfig fc;
    fc.contextPerType = config_.reflect.contextPerType;
    fc.opinionBudget = config_.reflect.opinionBudget;
    reflect_ = std::make_shared<reflect::ReflectEngine>(repository_, recall_, retain_, reasoner_,
                                                        caps.dispositionPolicy, *invoker_, fc);

    queue_ = daemon::OperationQueue::create(repository_, queuePool_->getExecutor(),
                                            {config_.queue.maxConcurrent});
    queue_->registerHandler(kRetainBatchKind, [this](const metadata::AsyncOperation& op) {
        return runRetainOperation(op);
    });
    auto recovered = queue_->recover();
    if (!recovered)
        return recovered.error();

    spdlog::info("[MemoryEngine] Ready (embedder {}, reasoner {}, {} operations resumed)",
                 caps.embedder->getProviderName(), reasoner_ ? reasoner_->name() : "none",
                 recovered.value());
    return {};
}

void MemoryEngine::shutdown() {
    if (shutdown_)
        return;
    shutdown_ = true;
    if (queue_)
        queue_->shutdown();
    for (auto* pool : {queuePool_.get(), searchPool_.get(), capabilityPool_.get()}) {
        if (pool) {
            pool->stop();
            pool->join();
        }
    }
    if (repository_)
        repository_->shutdown();
    spdlog::debug("[MemoryEngine] Shut down");
}

// ---------------------------------------------------------------------------
// Core pipeline
// ---------------------------------------------------------------------------

Result<retain::RetainBatchResult> MemoryEngine::retain(const std::string& bankId,
                                                       const std::vector<retain::RetainItem>& items) {
    return retain_->retainBatch(bankId, items);
}

Result<search::RecallSequence> MemoryEngine::recall(const search::RecallQuery& query) const {
    return recall_->recall(query);
}

Result<reflect::ReflectResult> MemoryEngine::reflect(const reflect::ReflectRequest& request) {
    auto valid = retain_->validateBankId(request.bankId);
    if (!valid)
        return valid.error();
    return reflect_->reflect(request);
}

// ---------------------------------------------------------------------------
// Bank profile
// ---------------------------------------------------------------------------

Result<Bank> MemoryEngine::getBank(const std::string& bankId) {
    auto valid = retain_->validateBankId(bankId);
    if (!valid)
        return valid.error();
    return repository_->transact(
        [&](MemorySession& session) { return session.ensureBank(bankId); });
}

Result<Bank> MemoryEngine::modifyBank(const std::string& bankId,
                                      const std::function<void(Bank&)>& change) {
    auto valid = retain_->validateBankId(bankId);
    if (!valid)
        return valid.error();
    return repository_->transact([&](MemorySession& session) -> Result<Bank> {
        auto bank = session.ensureBank(bankId);
        if (!bank)
            return bank.error();
        Bank updated = bank.value();
        change(updated);
        auto saved = session.updateBank(updated);
        if (!saved)
            return saved.error();
        auto reread = session.getBank(bankId);
        if (!reread)
            return reread.error();
        if (!reread.value())
            return Error{ErrorCode::NotFound, "bank '" + bankId + "' not found"};
        return std::move(*reread.value());
    });
}

Result<Bank> MemoryEngine::putBank(const std::string& bankId, const BankProfileUpdate& update) {
    return modifyBank(bankId, [&](Bank& bank) {
        if (update.name)
            bank.name = *update.name;
        if (update.background)
            bank.background = *update.background;
        if (update.personality)
            bank.personality = *update.personality;
        if (update.disposition)
            bank.disposition = *update.disposition;
    });
}

Result<Bank> MemoryEngine::updatePersonality(const std::string& bankId,
                                             const metadata::PersonalityTraits& traits) {
    return modifyBank(bankId, [&](Bank& bank) { bank.personality = traits; });
}

Result<Bank> MemoryEngine::updateDisposition(const std::string& bankId,
                                             const metadata::DispositionTraits& traits) {
    return modifyBank(bankId, [&](Bank& bank) { bank.disposition = traits; });
}

Result<std::vector<Bank>> MemoryEngine::listBanks() const {
    return repository_->read([](MemorySession& session) { return session.listBanks(); });
}

Result<metadata::BankStats> MemoryEngine::bankStats(const std::string& bankId) const {
    return repository_->read([&](MemorySession& session) { return session.bankStats(bankId); });
}

Result<BackgroundMergeResult> MemoryEngine::mergeBackground(const std::string& bankId,
                                                            const std::string& text,
                                                            bool updatePersonality) {
    if (trimmed(text).empty())
        return Error{ErrorCode::ValidationError, "background text is empty"};
    auto bank = getBank(bankId);
    if (!bank)
        return bank.error();

    BackgroundMergeResult result;
    if (!reasoner_) {
        result.background = appendSentences(bank.value().background, text);
        if (updatePersonality)
            spdlog::info("[MemoryEngine] No reasoner configured; personality left unchanged");
    } else {
        auto reasoner = reasoner_;
        auto mergePrompt = reflect::buildBackgroundMergePrompt(bank.value().background, text);
        auto merged = invoker_->invoke("merge background", ErrorCode::ReasoningFailure,
                                       [reasoner, mergePrompt]() {
                                           return reasoner->complete(mergePrompt);
                                       });
        if (!merged)
            return merged.error();
        result.background = trimmed(merged.value());
        if (result.background.empty())
            return Error{ErrorCode::ReasoningFailure, "reasoner returned an empty background"};

        if (updatePersonality) {
            auto traitPrompt = reflect::buildTraitInferencePrompt(result.background);
            auto inferred = invoker_->invoke("infer personality", ErrorCode::ReasoningFailure,
                                             [reasoner, traitPrompt]() {
                                                 return reasoner->complete(traitPrompt);
                                             });
            if (!inferred)
                return inferred.error();
            result.personality = reflect::parseTraitInference(inferred.value());
            if (!result.personality)
                spdlog::warn("[MemoryEngine] Personality inference reply was not usable");
        }
    }

    auto saved = modifyBank(bankId, [&](Bank& b) {
        b.background = result.background;
        if (result.personality)
            b.personality = *result.personality;
    });
    if (!saved)
        return saved.error();
    return result;
}

// ---------------------------------------------------------------------------
// Browsing
// ---------------------------------------------------------------------------

Result<metadata::Page<metadata::MemoryUnit>>
MemoryEngine::listMemories(const std::string& bankId, const metadata::ListQuery& query) const {
    if (query.limit <= 0 || query.offset < 0)
        return Error{ErrorCode::ValidationError, "limit must be positive and offset non-negative"};
    return repository_->read([&](MemorySession& session) { return session.listUnits(bankId, query); });
}

Result<void> MemoryEngine::deleteMemory(const std::string& bankId, const std::string& unitId) {
    auto lock = locks_->lockFor(bankId);
    std::lock_guard<std::mutex> guard(*lock);
    auto deleted = repository_->transact(
        [&](MemorySession& session) { return session.deleteUnit(bankId, unitId); });
    if (!deleted)
        return deleted.error();
    if (!deleted.value())
        return Error{ErrorCode::NotFound, "memory unit '" + unitId + "' not found"};
    return {};
}

Result<int64_t> MemoryEngine::clearMemories(const std::string& bankId,
                                            std::optional<metadata::FactType> factType) {
    auto lock = locks_->lockFor(bankId);
    std::lock_guard<std::mutex> guard(*lock);
    auto cleared = repository_->transact(
        [&](MemorySession& session) { return session.deleteUnits(bankId, factType); });
    if (cleared) {
        spdlog::info("[MemoryEngine] Cleared {} {} units from bank '{}'", cleared.value(),
                     factType ? metadata::factTypeToString(*factType) : "all", bankId);
    }
    return cleared;
}

Result<metadata::Page<metadata::Document>>
MemoryEngine::listDocuments(const std::string& bankId, const metadata::ListQuery& query) const {
    if (query.limit <= 0 || query.offset < 0)
        return Error{ErrorCode::ValidationError, "limit must be positive and offset non-negative"};
    return repository_->read(
        [&](MemorySession& session) { return session.listDocuments(bankId, query); });
}

Result<metadata::Document> MemoryEngine::getDocument(const std::string& bankId,
                                                     const std::string& documentId) const {
    auto doc = repository_->read(
        [&](MemorySession& session) { return session.getDocument(bankId, documentId); });
    if (!doc)
        return doc.error();
    if (!doc.value())
        return Error{ErrorCode::NotFound, "document '" + documentId + "' not found"};
    return std::move(*doc.value());
}

Result<metadata::DocumentDeletion> MemoryEngine::deleteDocument(const std::string& bankId,
                                                                const std::string& documentId) {
    auto lock = locks_->lockFor(bankId);
    std::lock_guard<std::mutex> guard(*lock);
    auto deleted = repository_->transact(
        [&](MemorySession& session) { return session.deleteDocumentCascade(bankId, documentId); });
    if (!deleted)
        return deleted.error();
    if (!deleted.value().existed)
        return Error{ErrorCode::NotFound, "document '" + documentId + "' not found"};
    return deleted;
}

Result<metadata::GraphData> MemoryEngine::graph(const std::string& bankId,
                                                std::optional<metadata::FactType> factType,
                                                size_t limit) const {
    if (limit == 0)
        return Error{ErrorCode::ValidationError, "limit must be positive"};
    return repository_->read([&](MemorySession& session) -> Result<metadata::GraphData> {
        metadata::ListQuery q;
        q.factType = factType;
        q.limit = static_cast<int>(std::min<size_t>(limit, 100000));
        auto page = session.listUnits(bankId, q);
        if (!page)
            return page.error();

        metadata::GraphData data;
        data.units = std::move(page.value().items);
        std::vector<std::string> ids;
        std::unordered_set<std::string> idSet;
        for (auto& u : data.units) {
            u.embedding.clear();
            ids.push_back(u.id);
            idSet.insert(u.id);
        }
        if (ids.empty())
            return data;

        auto links = session.linksForUnits(bankId, ids);
        if (!links)
            return links.error();
        for (const auto& l : links.value()) {
            if (idSet.count(l.fromUnitId) && idSet.count(l.toUnitId)) {
                data.edges.push_back(
                    {l.fromUnitId, l.toUnitId, metadata::linkKindToString(l.kind), l.weight});
            }
        }

        auto pairs = session.unitEntityPairsForUnits(bankId, ids);
        if (!pairs)
            return pairs.error();
        std::unordered_set<std::string> entityIds;
        for (const auto& [unitId, entityId] : pairs.value()) {
            data.edges.push_back({unitId, entityId, "entity", 1.0});
            entityIds.insert(entityId);
        }

        auto entities = session.listEntities(bankId);
        if (!entities)
            return entities.error();
        for (auto& e : entities.value()) {
            if (entityIds.count(e.id))
                data.entities.push_back(std::move(e));
        }
        return data;
    });
}

// ---------------------------------------------------------------------------
// Asynchronous retain
// ---------------------------------------------------------------------------

Result<metadata::AsyncOperation>
MemoryEngine::retainAsync(const std::string& bankId, const std::vector<retain::RetainItem>& items) {
    auto valid = retain_->validateBankId(bankId);
    if (!valid)
        return valid.error();
    if (items.empty())
        return Error{ErrorCode::ValidationError, "no items to retain"};
    return queue_->submit(bankId, kRetainBatchKind, retain::encodeRetainItems(items));
}

Result<std::string> MemoryEngine::runRetainOperation(const metadata::AsyncOperation& op) const {
    auto items = retain::decodeRetainItems(op.payload);
    if (!items)
        return items.error();
    auto batch = retain_->retainBatch(op.bankId, items.value());
    if (!batch)
        return batch.error();

    const auto& result = batch.value();
    if (!result.items.empty() && result.succeeded() == 0) {
        std::string combined;
        for (const auto& o : result.items) {
            if (!combined.empty())
                combined += "; ";
            combined += "item " + std::to_string(o.index) + ": " +
                        (o.error ? o.error->message : std::string("unknown error"));
        }
        return Error{result.items.front().error ? result.items.front().error->code
                                                : ErrorCode::InternalError,
                     combined};
    }
    return retain::encodeBatchResult(result);
}

Result<std::vector<metadata::AsyncOperation>>
MemoryEngine::listOperations(const std::string& bankId,
                             std::optional<metadata::OperationState> state) const {
    return queue_->list(bankId, state);
}

Result<metadata::AsyncOperation> MemoryEngine::getOperation(const std::string& bankId,
                                                            const std::string& operationId) const {
    return queue_->get(bankId, operationId);
}

Result<daemon::CancelOutcome> MemoryEngine::cancelOperation(const std::string& bankId,
                                                            const std::string& operationId) {
    return queue_->cancel(bankId, operationId);
}

} // namespace engram::app
