#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <iterator>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <engram/core/async_call.h>
#include <engram/search/recall_engine.h>

namespace engram::search {

using metadata::MemorySession;
using metadata::ScoredUnitId;
using metadata::UnitStats;

namespace {

std::vector<std::string> idsOf(const std::vector<ScoredUnitId>& scored) {
    std::vector<std::string> ids;
    ids.reserve(scored.size());
    for (const auto& s : scored)
        ids.push_back(s.id);
    return ids;
}

bool admitted(const UnitStats& stats, const metadata::UnitFilter& filter) {
    if (!filter.factTypes.empty() &&
        std::find(filter.factTypes.begin(), filter.factTypes.end(), stats.factType) ==
            filter.factTypes.end()) {
        return false;
    }
    if (filter.timeRange) {
        auto eff = metadata::effectiveOccurrence(stats.occurredStart, stats.occurredEnd,
                                                 stats.mentionedAt);
        if (!filter.timeRange->intersects(eff.start, eff.end))
            return false;
    }
    return true;
}

const char* statusName(StrategyReport::Status status) {
    switch (status) {
        case StrategyReport::Status::Ok:
            return "ok";
        case StrategyReport::Status::Skipped:
            return "skipped";
        case StrategyReport::Status::Failed:
            return "failed";
        case StrategyReport::Status::TimedOut:
            return "timed out";
    }
    return "unknown";
}

size_t approxTokens(const std::string& text) {
    return (text.size() + 3) / 4;
}

} // namespace

// ============================================================================
// RecallSequence
// ============================================================================

RecallSequence::RecallSequence(std::shared_ptr<metadata::MemoryRepository> repository,
                               std::string bankId, std::vector<RankedCandidate> ranking,
                               size_t pageSize, std::optional<size_t> maxTokens)
    : state_(std::make_shared<const State>(State{std::move(repository), std::move(bankId),
                                                 std::move(ranking),
                                                 std::max<size_t>(1, pageSize), maxTokens})) {}

const std::vector<RankedCandidate>& RecallSequence::ranking() const noexcept {
    static const std::vector<RankedCandidate> kNone;
    return state_ ? state_->ranking : kNone;
}

Result<void> RecallSequence::Cursor::fillPage() {
    const auto& ranking = state_->ranking;
    while (page_.empty() && position_ < ranking.size()) {
        const size_t end = std::min(ranking.size(), position_ + state_->pageSize);
        std::vector<std::string> ids;
        ids.reserve(end - position_);
        for (size_t i = position_; i < end; ++i)
            ids.push_back(ranking[i].id);

        auto units = state_->repository->read(
            [&](MemorySession& s) { return s.getUnits(state_->bankId, ids); });
        if (!units)
            return units.error();

        std::unordered_map<std::string, metadata::MemoryUnit> byId;
        for (auto& u : units.value())
            byId.emplace(u.id, std::move(u));

        for (size_t i = position_; i < end; ++i) {
            auto it = byId.find(ranking[i].id);
            if (it == byId.end())
                continue; // deleted since the query ran
            page_.push_back(RecallHit{std::move(it->second), ranking[i].weight});
        }
        position_ = end;
    }
    return {};
}

Result<std::optional<RecallHit>> RecallSequence::Cursor::next() {
    if (exhausted_ || !state_ || !state_->repository)
        return std::optional<RecallHit>{};

    auto filled = fillPage();
    if (!filled)
        return filled.error();
    if (page_.empty()) {
        exhausted_ = true;
        return std::optional<RecallHit>{};
    }

    RecallHit hit = std::move(page_.front());
    page_.pop_front();
    if (state_->maxTokens) {
        const size_t tokens = approxTokens(hit.unit.text);
        if (tokensUsed_ + tokens > *state_->maxTokens) {
            exhausted_ = true;
            page_.clear();
            return std::optional<RecallHit>{};
        }
        tokensUsed_ += tokens;
    }
    return std::optional<RecallHit>{std::move(hit)};
}

Result<std::vector<RecallHit>> RecallSequence::collect() const {
    std::vector<RecallHit> hits;
    auto c = cursor();
    while (true) {
        auto next = c.next();
        if (!next)
            return next.error();
        if (!next.value())
            break;
        hits.push_back(std::move(*next.value()));
    }
    return hits;
}

// ============================================================================
// RecallEngine
// ============================================================================

RecallEngine::RecallEngine(std::shared_ptr<metadata::MemoryRepository> repository,
                           std::shared_ptr<ml::IEmbeddingProvider> embedder,
                           std::shared_ptr<IReranker> reranker,
                           std::shared_ptr<ITemporalParser> temporalParser,
                           std::shared_ptr<EntityResolver> entityResolver,
                           ml::CapabilityInvoker invoker,
                           boost::asio::any_io_executor searchExecutor, RecallConfig config)
    : repository_(std::move(repository)),
      embedder_(std::move(embedder)),
      reranker_(std::move(reranker)),
      temporalParser_(std::move(temporalParser)),
      entityResolver_(std::move(entityResolver)),
      invoker_(std::move(invoker)),
      searchExecutor_(std::move(searchExecutor)),
      config_(config) {}

Result<std::optional<metadata::TimeRange>>
RecallEngine::resolveTimeRange(const RecallQuery& query) const {
    if (!temporalParser_)
        return std::optional<metadata::TimeRange>{};

    const TimePoint reference = query.referenceTime.value_or(std::chrono::system_clock::now());
    auto parser = temporalParser_;
    if (query.timeExpression && !query.timeExpression->empty()) {
        auto expression = *query.timeExpression;
        return invoker_.invoke("temporal parse", ErrorCode::InternalError,
                               [parser, expression, reference]() {
                                   return parser->parse(expression, reference);
                               });
    }
    if (config_.inferTimeFromQuery && !query.text.empty()) {
        auto text = query.text;
        return invoker_.invoke("temporal parse", ErrorCode::InternalError,
                               [parser, text, reference]() {
                                   return parser->findInText(text, reference);
                               });
    }
    return std::optional<metadata::TimeRange>{};
}

Result<RecallSequence> RecallEngine::recall(const RecallQuery& query) const {
    if (query.bankId.empty())
        return Error{ErrorCode::ValidationError, "bank id is required"};
    if (query.text.empty() && !query.timeExpression)
        return Error{ErrorCode::ValidationError, "query text or time expression is required"};

    const size_t budget = query.budget.value_or(config_.defaultBudget);
    auto prepared = std::make_shared<PreparedQuery>();
    prepared->bankId = query.bankId;
    prepared->text = query.text;
    prepared->filter.factTypes = query.factTypes;

    // Query preparation runs before the fan-out so no strategy waits on a capability
    auto range = resolveTimeRange(query);
    if (range) {
        prepared->filter.timeRange = range.value();
    } else {
        spdlog::warn("[Recall] Temporal parsing failed, continuing without a time range: {}",
                     range.error().message);
    }

    if (embedder_ && !query.text.empty()) {
        auto embedder = embedder_;
        auto text = query.text;
        auto embedding = invoker_.invoke("embed query", ErrorCode::EmbeddingFailure,
                                         [embedder, text]() {
                                             return embedder->generateEmbedding(text);
                                         });
        if (embedding) {
            prepared->embedding = std::move(embedding).value();
        } else {
            spdlog::warn("[Recall] Query embedding failed, semantic strategy skipped: {}",
                         embedding.error().message);
        }
    }

    if (entityResolver_ && !query.text.empty()) {
        auto linked = repository_->read([&](MemorySession& s) {
            return entityResolver_->linkQuery(s, query.bankId, query.text);
        });
        if (linked) {
            prepared->entityIds = std::move(linked).value();
        } else {
            spdlog::warn("[Recall] Query entity linking failed: {}", linked.error().message);
        }
    }

    // Fan-out
    using StrategyFn = Result<std::vector<std::string>> (RecallEngine::*)(const PreparedQuery&)
        const;
    struct Launch {
        const char* name;
        StrategyFn fn;
        bool enabled;
    };
    const Launch launches[] = {
        {"semantic", &RecallEngine::semanticStrategy, prepared->embedding.has_value()},
        {"lexical", &RecallEngine::lexicalStrategy, !prepared->text.empty()},
        {"graph", &RecallEngine::graphStrategy, !prepared->entityIds.empty()},
        {"temporal", &RecallEngine::temporalStrategy, prepared->filter.timeRange.has_value()},
    };

    const auto deadline = std::chrono::steady_clock::now() + config_.strategyTimeout;
    std::vector<std::future<Result<std::vector<std::string>>>> futures;
    futures.reserve(std::size(launches));
    for (const auto& launch : launches) {
        if (!launch.enabled) {
            futures.emplace_back();
            continue;
        }
        auto fn = launch.fn;
        futures.push_back(core::postWithFuture(
            searchExecutor_,
            [self = shared_from_this(), fn, prepared]() { return ((*self).*fn)(*prepared); }));
    }

    std::vector<std::vector<std::string>> rankings;
    std::vector<StrategyReport> reports;
    for (size_t i = 0; i < std::size(launches); ++i) {
        StrategyReport report;
        report.name = launches[i].name;
        if (!futures[i].valid()) {
            report.status = StrategyReport::Status::Skipped;
            reports.push_back(report);
            continue;
        }
        auto result = core::awaitResult(futures[i], deadline,
                                        std::string(launches[i].name) + " strategy");
        if (!result) {
            report.status = result.error().code == ErrorCode::Timeout
                                ? StrategyReport::Status::TimedOut
                                : StrategyReport::Status::Failed;
            spdlog::warn("[Recall] {} strategy {} after {} ms: {}", launches[i].name,
                         statusName(report.status), config_.strategyTimeout.count(),
                         result.error().message);
            reports.push_back(report);
            continue;
        }
        report.candidates = result.value().size();
        reports.push_back(report);
        rankings.push_back(std::move(result).value());
    }

    // Fusion
    std::vector<std::string> candidateIds;
    {
        std::unordered_set<std::string> seen;
        for (const auto& ranking : rankings) {
            for (const auto& id : ranking) {
                if (seen.insert(id).second)
                    candidateIds.push_back(id);
            }
        }
    }
    auto stats = repository_->read(
        [&](MemorySession& s) { return s.getUnitStats(query.bankId, candidateIds); });
    if (!stats)
        return stats.error();
    std::unordered_map<std::string, UnitStats> statsById;
    for (auto& st : stats.value())
        statsById.emplace(st.id, std::move(st));

    auto fused = fuseRankings(rankings, statsById, config_.rrfK);

    // Rerank
    std::vector<float> rerankScores;
    if (reranker_ && !fused.empty() && config_.rerankTopN > 0 && !query.text.empty()) {
        if (!reranker_->isReady()) {
            spdlog::warn("[Recall] Reranker not ready, using fused order");
        } else {
            const size_t window = std::min(config_.rerankTopN, fused.size());
            std::vector<FusedCandidate> head(fused.begin(), fused.begin() + window);
            auto scores = rerank(query.bankId, query.text, head);
            if (!scores)
                return scores.error();
            rerankScores = std::move(scores).value();
        }
    }

    auto ranked = blendWithReranker(fused, rerankScores, config_.rerankWeight);
    if (ranked.size() > budget)
        ranked.resize(budget);

    spdlog::debug("[Recall] bank='{}' fused={} returned={} range={}", query.bankId, fused.size(),
                  ranked.size(), prepared->filter.timeRange.has_value());

    RecallSequence sequence(repository_, query.bankId, std::move(ranked), config_.pageSize,
                            query.maxTokens);
    sequence.timeRange = prepared->filter.timeRange;
    sequence.strategies = std::move(reports);
    return sequence;
}

Result<std::vector<float>> RecallEngine::rerank(const std::string& bankId,
                                                const std::string& query,
                                                const std::vector<FusedCandidate>& window) const {
    std::vector<std::string> ids;
    ids.reserve(window.size());
    for (const auto& c : window)
        ids.push_back(c.id);

    auto units = repository_->read([&](MemorySession& s) { return s.getUnits(bankId, ids); });
    if (!units)
        return units.error();
    std::unordered_map<std::string, std::string> textById;
    for (const auto& u : units.value())
        textById.emplace(u.id, u.text);

    std::vector<std::string> texts;
    texts.reserve(window.size());
    for (const auto& id : ids) {
        auto it = textById.find(id);
        texts.push_back(it != textById.end() ? it->second : std::string());
    }

    auto reranker = reranker_;
    auto q = query;
    auto scores = invoker_.invoke("rerank", ErrorCode::RerankFailure,
                                  [reranker, q, texts]() {
                                      return reranker->scoreDocuments(q, texts);
                                  });
    if (!scores)
        return scores.error();
    if (scores.value().size() != texts.size()) {
        return Error{ErrorCode::RerankFailure,
                     "reranker returned " + std::to_string(scores.value().size()) +
                         " scores for " + std::to_string(texts.size()) + " candidates"};
    }
    return scores;
}

// ----------------------------------------------------------------------------
// Strategies
// ----------------------------------------------------------------------------

Result<std::vector<std::string>> RecallEngine::semanticStrategy(const PreparedQuery& q) const {
    auto scored = repository_->read([&](MemorySession& s) {
        return s.nearestUnits(q.bankId, *q.embedding, config_.perStrategyLimit, 0.0, q.filter);
    });
    if (!scored)
        return scored.error();
    return idsOf(scored.value());
}

Result<std::vector<std::string>> RecallEngine::lexicalStrategy(const PreparedQuery& q) const {
    auto scored = repository_->read([&](MemorySession& s) {
        return s.lexicalSearch(q.bankId, q.text, config_.perStrategyLimit, q.filter);
    });
    if (!scored)
        return scored.error();
    return idsOf(scored.value());
}

Result<std::vector<std::string>> RecallEngine::temporalStrategy(const PreparedQuery& q) const {
    auto stats = repository_->read([&](MemorySession& s) {
        return s.unitsInRange(q.bankId, q.filter, config_.perStrategyLimit);
    });
    if (!stats)
        return stats.error();
    std::vector<std::string> ids;
    ids.reserve(stats.value().size());
    for (const auto& st : stats.value())
        ids.push_back(st.id);
    return ids;
}

// Spreading activation from units that mention the query entities
Result<std::vector<std::string>> RecallEngine::graphStrategy(const PreparedQuery& q) const {
    return repository_->read([&](MemorySession& s) -> Result<std::vector<std::string>> {
        auto seeds = s.unitEntityPairsForEntities(q.bankId, q.entityIds);
        if (!seeds)
            return seeds.error();

        std::unordered_map<std::string, double> activation;
        std::unordered_map<std::string, double> frontier;
        for (const auto& [unitId, _] : seeds.value()) {
            if (activation.size() >= config_.graphNodeBudget && !activation.count(unitId))
                break;
            if (!activation.count(unitId)) {
                activation[unitId] = 1.0;
                frontier[unitId] = 1.0;
            }
        }

        for (int hop = 1; hop <= config_.graphMaxHops && !frontier.empty(); ++hop) {
            std::vector<std::string> frontierIds;
            frontierIds.reserve(frontier.size());
            for (const auto& [id, _] : frontier)
                frontierIds.push_back(id);
            std::sort(frontierIds.begin(), frontierIds.end());

            // neighbour -> (source, edge weight)
            std::vector<std::tuple<std::string, std::string, double>> edges;

            auto links = s.linksForUnits(q.bankId, frontierIds);
            if (!links)
                return links.error();
            for (const auto& link : links.value()) {
                if (frontier.count(link.fromUnitId))
                    edges.emplace_back(link.fromUnitId, link.toUnitId, link.weight);
                if (frontier.count(link.toUnitId))
                    edges.emplace_back(link.toUnitId, link.fromUnitId, link.weight);
            }

            auto unitEntities = s.unitEntityPairsForUnits(q.bankId, frontierIds);
            if (!unitEntities)
                return unitEntities.error();
            std::unordered_map<std::string, std::vector<std::string>> unitsByEntity;
            std::vector<std::string> entityIds;
            for (const auto& [unitId, entityId] : unitEntities.value()) {
                if (unitsByEntity[entityId].empty())
                    entityIds.push_back(entityId);
                unitsByEntity[entityId].push_back(unitId);
            }
            auto coMembers = s.unitEntityPairsForEntities(q.bankId, entityIds);
            if (!coMembers)
                return coMembers.error();
            for (const auto& [memberId, entityId] : coMembers.value()) {
                for (const auto& sourceId : unitsByEntity[entityId]) {
                    if (sourceId != memberId)
                        edges.emplace_back(sourceId, memberId, 1.0);
                }
            }

            std::unordered_map<std::string, double> next;
            for (const auto& [source, target, weight] : edges) {
                if (!activation.count(target) && activation.size() >= config_.graphNodeBudget)
                    continue;
                const double contribution = frontier[source] * config_.graphHopDecay * weight;
                if (contribution <= 0.0)
                    continue;
                const bool firstVisit = !activation.count(target);
                activation[target] += contribution;
                if (firstVisit)
                    next[target] += contribution;
                else if (next.count(target))
                    next[target] += contribution;
            }
            frontier = std::move(next);
        }

        // Admission happens before ranking; traversal may pass through filtered units
        std::vector<std::string> reached;
        reached.reserve(activation.size());
        for (const auto& [id, _] : activation)
            reached.push_back(id);
        auto stats = s.getUnitStats(q.bankId, reached);
        if (!stats)
            return stats.error();

        std::vector<ScoredUnitId> scored;
        for (const auto& st : stats.value()) {
            if (admitted(st, q.filter))
                scored.push_back({st.id, activation[st.id]});
        }
        std::sort(scored.begin(), scored.end(), [](const ScoredUnitId& a, const ScoredUnitId& b) {
            if (a.score != b.score)
                return a.score > b.score;
            return a.id < b.id;
        });
        if (scored.size() > config_.perStrategyLimit)
            scored.resize(config_.perStrategyLimit);
        return idsOf(scored);
    });
}

} // namespace engram::search
