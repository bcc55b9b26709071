#include <spdlog/spdlog.h>

#include <algorithm>
#include <engram/core/uuid.h>
#include <engram/retain/retain_pipeline.h>

namespace engram::retain {

using metadata::FactType;
using metadata::MemorySession;
using metadata::MemoryUnit;

namespace {

double clampConfidence(double value) {
    return std::clamp(value, 0.0, 1.0);
}

// Distance between two closed intervals; 0 when they overlap
std::chrono::milliseconds intervalGap(const metadata::TimeRange& a, const metadata::TimeRange& b) {
    if (a.intersects(b.start, b.end))
        return std::chrono::milliseconds{0};
    auto gap = b.start > a.end ? b.start - a.end : a.start - b.end;
    return std::chrono::duration_cast<std::chrono::milliseconds>(gap);
}

void appendUnique(std::vector<std::string>& ids, const std::string& id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end())
        ids.push_back(id);
}

} // namespace

size_t RetainBatchResult::succeeded() const {
    return static_cast<size_t>(
        std::count_if(items.begin(), items.end(), [](const RetainOutcome& o) { return o.success; }));
}

RetainPipeline::RetainPipeline(std::shared_ptr<metadata::MemoryRepository> repository,
                               std::shared_ptr<extraction::IFactExtractor> extractor,
                               std::shared_ptr<ml::IEmbeddingProvider> embedder,
                               std::shared_ptr<search::EntityResolver> entityResolver,
                               std::shared_ptr<BankWriteLocks> locks, ml::CapabilityInvoker invoker,
                               RetainConfig config)
    : repository_(std::move(repository)),
      extractor_(std::move(extractor)),
      embedder_(std::move(embedder)),
      entityResolver_(std::move(entityResolver)),
      locks_(std::move(locks)),
      invoker_(std::move(invoker)),
      config_(config) {
    if (!locks_)
        locks_ = std::make_shared<BankWriteLocks>();
}

Result<void> RetainPipeline::validateBankId(const std::string& bankId) const {
    if (bankId.empty())
        return Error{ErrorCode::ValidationError, "bank id is required"};
    if (bankId.size() > config_.maxBankIdLength) {
        return Error{ErrorCode::ValidationError,
                     "bank id exceeds " + std::to_string(config_.maxBankIdLength) + " characters"};
    }
    return {};
}

Result<RetainBatchResult> RetainPipeline::retainBatch(const std::string& bankId,
                                                      const std::vector<RetainItem>& items) const {
    auto valid = validateBankId(bankId);
    if (!valid)
        return valid.error();

    RetainBatchResult batch;
    batch.items.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        auto outcome = retainItem(bankId, items[i]);
        if (outcome) {
            auto value = std::move(outcome).value();
            value.index = i;
            batch.items.push_back(std::move(value));
        } else {
            spdlog::warn("[Retain] Item {} of bank '{}' failed: {}", i, bankId,
                         outcome.error().message);
            RetainOutcome failed;
            failed.index = i;
            failed.documentId = items[i].documentId;
            failed.error = outcome.error();
            batch.items.push_back(std::move(failed));
        }
    }
    spdlog::info("[Retain] Bank '{}': {}/{} items retained", bankId, batch.succeeded(),
                 items.size());
    return batch;
}

Result<std::vector<Embedding>> RetainPipeline::embedAll(const std::vector<std::string>& texts) const {
    if (texts.empty())
        return std::vector<Embedding>{};
    if (!embedder_)
        return Error{ErrorCode::EmbeddingFailure, "no embedding provider configured"};

    auto embedder = embedder_;
    auto embeddings = invoker_.invoke("embed facts", ErrorCode::EmbeddingFailure,
                                      [embedder, texts]() {
                                          return embedder->generateBatchEmbeddings(texts);
                                      });
    if (!embeddings)
        return embeddings.error();
    if (embeddings.value().size() != texts.size()) {
        return Error{ErrorCode::EmbeddingFailure,
                     "embedding provider returned " + std::to_string(embeddings.value().size()) +
                         " vectors for " + std::to_string(texts.size()) + " texts"};
    }
    const size_t dim = embedder_->getEmbeddingDimension();
    for (const auto& e : embeddings.value()) {
        if (e.empty() || (dim != 0 && e.size() != dim)) {
            return Error{ErrorCode::EmbeddingFailure,
                         "embedding dimension " + std::to_string(e.size()) + ", expected " +
                             std::to_string(dim)};
        }
    }
    return embeddings;
}

Result<RetainOutcome> RetainPipeline::retainItem(const std::string& bankId,
                                                 const RetainItem& item) const {
    if (item.content.empty())
        return Error{ErrorCode::ValidationError, "content is empty"};
    if (item.content.size() > config_.maxContentLength) {
        return Error{ErrorCode::ValidationError,
                     "content exceeds " + std::to_string(config_.maxContentLength) + " bytes"};
    }
    if (item.documentId && item.documentId->empty())
        return Error{ErrorCode::ValidationError, "document id must not be empty"};
    if (!extractor_)
        return Error{ErrorCode::ExtractionFailure, "no fact extractor configured"};

    const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());

    extraction::ExtractionRequest request{item.content, item.context, item.occurredHint, now};
    auto extractor = extractor_;
    auto extracted = invoker_.invoke("extract facts", ErrorCode::ExtractionFailure,
                                     [extractor, request]() { return extractor->extract(request); });
    if (!extracted)
        return extracted.error();

    std::vector<PreparedFact> facts;
    std::vector<std::string> texts;
    for (auto& fact : extracted.value()) {
        if (fact.text.empty())
            continue;
        if (fact.occurredStart && fact.occurredEnd && *fact.occurredStart > *fact.occurredEnd)
            std::swap(fact.occurredStart, fact.occurredEnd);
        texts.push_back(fact.text);
        facts.push_back(PreparedFact{std::move(fact), {}});
    }

    auto embeddings = embedAll(texts);
    if (!embeddings)
        return embeddings.error();
    for (size_t i = 0; i < facts.size(); ++i)
        facts[i].embedding = std::move(embeddings.value()[i]);

    auto bankLock = locks_->lockFor(bankId);
    std::lock_guard<std::mutex> guard(*bankLock);

    return repository_->transact([&](MemorySession& session) -> Result<RetainOutcome> {
        auto bank = session.ensureBank(bankId);
        if (!bank)
            return bank.error();

        RetainOutcome outcome;
        outcome.success = true;
        outcome.documentId = item.documentId;

        if (item.documentId) {
            auto removed = session.deleteDocumentCascade(bankId, *item.documentId);
            if (!removed)
                return removed.error();
            if (removed.value().existed) {
                spdlog::info("[Retain] Replacing document '{}' in bank '{}' ({} units removed)",
                             *item.documentId, bankId, removed.value().unitsDeleted);
            }
            metadata::Document doc;
            doc.id = *item.documentId;
            doc.bankId = bankId;
            doc.content = item.content;
            doc.metadata = item.metadata;
            doc.createdAt = now;
            doc.updatedAt = now;
            auto inserted = session.insertDocument(doc);
            if (!inserted)
                return inserted.error();
        }

        for (const auto& prepared : facts) {
            const auto& fact = prepared.fact;
            const double confidence = clampConfidence(fact.confidence.value_or(config_.defaultConfidence));

            metadata::UnitFilter sameType;
            sameType.factTypes = {fact.factType};
            auto nearest = session.nearestUnits(bankId, prepared.embedding, 1,
                                                config_.dedupThreshold, sameType);
            if (!nearest)
                return nearest.error();

            if (!nearest.value().empty()) {
                const auto& existingId = nearest.value().front().id;
                auto stats = session.getUnitStats(bankId, {existingId});
                if (!stats)
                    return stats.error();
                const double prior = stats.value().empty() ? 0.0 : stats.value().front().confidence;
                const double base = std::max(prior, confidence);
                auto updated = session.updateConfidence(
                    bankId, existingId, std::min(1.0, base + config_.mergeBoost * (1.0 - base)));
                if (!updated)
                    return updated.error();
                if (item.documentId) {
                    auto source = session.addUnitSource(bankId, existingId, *item.documentId);
                    if (!source)
                        return source.error();
                } else {
                    auto direct = session.markRetainedDirectly(bankId, existingId);
                    if (!direct)
                        return direct.error();
                }
                if (entityResolver_) {
                    auto entityIds = entityResolver_->resolveAll(session, bankId, fact.entities);
                    if (!entityIds)
                        return entityIds.error();
                    for (const auto& entityId : entityIds.value()) {
                        auto linked = session.linkUnitEntity(bankId, existingId, entityId);
                        if (!linked)
                            return linked.error();
                    }
                }
                spdlog::debug("[Retain] Merged fact into {} (similarity {:.3f})", existingId,
                              nearest.value().front().score);
                appendUnique(outcome.mergedUnitIds, existingId);
                continue;
            }

            MemoryUnit unit;
            unit.id = core::generateId("mu");
            unit.bankId = bankId;
            unit.text = fact.text;
            unit.factType = fact.factType;
            unit.confidence = confidence;
            unit.embedding = prepared.embedding;
            unit.occurredStart = fact.occurredStart;
            unit.occurredEnd = fact.occurredEnd;
            unit.mentionedAt = now;
            unit.context = item.context;
            unit.documentId = item.documentId;

            auto inserted = session.insertUnit(unit);
            if (!inserted)
                return inserted.error();
            auto linked = linkNewUnit(session, unit, fact.entities);
            if (!linked)
                return linked.error();
            outcome.createdUnitIds.push_back(unit.id);
        }
        return outcome;
    });
}

Result<void> RetainPipeline::linkNewUnit(MemorySession& session, const MemoryUnit& unit,
                                         const std::vector<search::EntityMention>& mentions) const {
    if (entityResolver_ && !mentions.empty()) {
        auto entityIds = entityResolver_->resolveAll(session, unit.bankId, mentions);
        if (!entityIds)
            return entityIds.error();
        for (const auto& entityId : entityIds.value()) {
            auto linked = session.linkUnitEntity(unit.bankId, unit.id, entityId);
            if (!linked)
                return linked.error();
        }
    }

    // Temporal: same document, or occurrence within the window
    const auto occurrence =
        metadata::effectiveOccurrence(unit.occurredStart, unit.occurredEnd, unit.mentionedAt);
    const auto window = std::chrono::duration_cast<std::chrono::milliseconds>(
        config_.temporalLinkWindow);
    metadata::TimeRange searchWindow{occurrence.start - window, occurrence.end + window};
    auto candidates = session.temporalCandidates(unit.bankId, searchWindow, unit.documentId,
                                                 config_.temporalLinkLimit * 5 + 1);
    if (!candidates)
        return candidates.error();

    struct Weighted {
        std::string id;
        double weight;
        TimePoint mentionedAt;
    };
    std::vector<Weighted> temporal;
    for (const auto& c : candidates.value()) {
        if (c.stats.id == unit.id)
            continue;
        double weight = 1.0;
        const bool sameDocument = unit.documentId && c.documentId && *unit.documentId == *c.documentId;
        if (!sameDocument && window.count() > 0) {
            auto other = metadata::effectiveOccurrence(c.stats.occurredStart, c.stats.occurredEnd,
                                                       c.stats.mentionedAt);
            weight = 1.0 - static_cast<double>(intervalGap(occurrence, other).count()) /
                               static_cast<double>(window.count());
        }
        if (weight <= 0.0)
            continue;
        temporal.push_back({c.stats.id, weight, c.stats.mentionedAt});
    }
    std::sort(temporal.begin(), temporal.end(), [](const Weighted& a, const Weighted& b) {
        if (a.weight != b.weight)
            return a.weight > b.weight;
        if (a.mentionedAt != b.mentionedAt)
            return a.mentionedAt > b.mentionedAt;
        return a.id < b.id;
    });
    if (temporal.size() > config_.temporalLinkLimit)
        temporal.resize(config_.temporalLinkLimit);
    for (const auto& t : temporal) {
        auto r = session.insertLink(
            unit.bankId, metadata::MemoryLink{unit.id, t.id, metadata::LinkKind::TemporalSequence,
                                              t.weight});
        if (!r)
            return r.error();
    }

    // Semantic: similar enough to relate, not similar enough to have merged
    auto similar = session.nearestUnits(unit.bankId, unit.embedding,
                                        config_.semanticLinkLimit * 4 + 1,
                                        config_.semanticLinkThreshold, metadata::UnitFilter{});
    if (!similar)
        return similar.error();
    size_t added = 0;
    for (const auto& s : similar.value()) {
        if (added >= config_.semanticLinkLimit)
            break;
        if (s.id == unit.id || s.score >= config_.dedupThreshold)
            continue;
        auto r = session.insertLink(
            unit.bankId,
            metadata::MemoryLink{unit.id, s.id, metadata::LinkKind::SemanticSimilarity, s.score});
        if (!r)
            return r.error();
        ++added;
    }
    return {};
}

Result<std::vector<MemoryUnit>>
RetainPipeline::persistOpinions(const std::string& bankId,
                                const std::vector<OpinionDraft>& opinions) const {
    auto valid = validateBankId(bankId);
    if (!valid)
        return valid.error();

    std::vector<OpinionDraft> drafts;
    std::vector<std::string> texts;
    for (const auto& o : opinions) {
        if (o.text.empty())
            continue;
        drafts.push_back(o);
        texts.push_back(o.text);
    }
    if (drafts.empty())
        return std::vector<MemoryUnit>{};

    auto embeddings = embedAll(texts);
    if (!embeddings)
        return embeddings.error();

    const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());

    auto bankLock = locks_->lockFor(bankId);
    std::lock_guard<std::mutex> guard(*bankLock);

    return repository_->transact([&](MemorySession& session) -> Result<std::vector<MemoryUnit>> {
        auto bank = session.ensureBank(bankId);
        if (!bank)
            return bank.error();

        metadata::UnitFilter opinionsOnly;
        opinionsOnly.factTypes = {FactType::Opinion};

        std::vector<MemoryUnit> created;
        for (size_t i = 0; i < drafts.size(); ++i) {
            auto nearest = session.nearestUnits(bankId, embeddings.value()[i], 1,
                                                config_.dedupThreshold, opinionsOnly);
            if (!nearest)
                return nearest.error();
            if (!nearest.value().empty()) {
                spdlog::debug("[Retain] Opinion already held as {}", nearest.value().front().id);
                continue;
            }

            MemoryUnit unit;
            unit.id = core::generateId("mu");
            unit.bankId = bankId;
            unit.text = drafts[i].text;
            unit.factType = FactType::Opinion;
            unit.confidence = clampConfidence(drafts[i].confidence);
            unit.embedding = embeddings.value()[i];
            unit.mentionedAt = now;
            unit.context = "reflection";

            auto inserted = session.insertUnit(unit);
            if (!inserted)
                return inserted.error();
            auto linked = linkNewUnit(session, unit, drafts[i].entities);
            if (!linked)
                return linked.error();
            created.push_back(std::move(unit));
        }
        spdlog::info("[Retain] Bank '{}': {} new opinions", bankId, created.size());
        return created;
    });
}

} // namespace engram::retain
