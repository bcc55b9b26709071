#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <engram/metadata/memory_repository.h>
#include <engram/ml/capability_invoker.h>
#include <engram/ml/provider.h>
#include <engram/search/entity_resolver.h>
#include <engram/search/rank_fusion.h>
#include <engram/search/reranker.h>
#include <engram/search/temporal_parser.h>

namespace engram::search {

struct RecallConfig {
    int rrfK = 60;
    size_t perStrategyLimit = 50;
    std::chrono::milliseconds strategyTimeout{2000};
    size_t rerankTopN = 30;
    double rerankWeight = 0.8;
    int graphMaxHops = 2;
    double graphHopDecay = 0.5;
    size_t graphNodeBudget = 200;
    size_t defaultBudget = 10;
    bool inferTimeFromQuery = true;
    size_t pageSize = 16; ///< Units hydrated per page while iterating a RecallSequence
};

struct RecallQuery {
    std::string bankId;
    std::string text;
    std::vector<metadata::FactType> factTypes; ///< Empty admits every type
    std::optional<std::string> timeExpression;
    std::optional<TimePoint> referenceTime;
    std::optional<size_t> budget;
    std::optional<size_t> maxTokens;
};

struct RecallHit {
    metadata::MemoryUnit unit;
    double weight = 0.0;
};

struct StrategyReport {
    enum class Status { Ok, Skipped, Failed, TimedOut };

    std::string name;
    Status status = Status::Ok;
    size_t candidates = 0;
};

/**
 * @brief Ranked recall result.
 *
 * The ranking (ids and weights) is fixed when the query runs. Units are read from the
 * store lazily, one page at a time, as a cursor advances; every cursor starts from the
 * top again, and units deleted since the query ran are skipped. Cursors share ownership of
 * the ranking, so they stay valid after the sequence is moved or destroyed. When a token budget is
 * set, iteration stops before the first unit whose text (about 4 characters per token)
 * would exceed it.
 */
class RecallSequence {
    struct State {
        std::shared_ptr<metadata::MemoryRepository> repository;
        std::string bankId;
        std::vector<RankedCandidate> ranking;
        size_t pageSize = 16;
        std::optional<size_t> maxTokens;
    };

public:
    class Cursor {
    public:
        /**
         * @brief Next hit, or an empty optional at the end of the sequence
         */
        Result<std::optional<RecallHit>> next();

    private:
        friend class RecallSequence;
        explicit Cursor(std::shared_ptr<const State> state) : state_(std::move(state)) {}

        Result<void> fillPage();

        std::shared_ptr<const State> state_;
        size_t position_ = 0;
        size_t tokensUsed_ = 0;
        bool exhausted_ = false;
        std::deque<RecallHit> page_;
    };

    RecallSequence() = default;
    RecallSequence(std::shared_ptr<metadata::MemoryRepository> repository, std::string bankId,
                   std::vector<RankedCandidate> ranking, size_t pageSize,
                   std::optional<size_t> maxTokens);

    [[nodiscard]] Cursor cursor() const { return Cursor(state_); }

    /**
     * @brief Iterate a fresh cursor to the end
     */
    Result<std::vector<RecallHit>> collect() const;

    [[nodiscard]] const std::vector<RankedCandidate>& ranking() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return ranking().empty(); }

    std::optional<metadata::TimeRange> timeRange;
    std::vector<StrategyReport> strategies;

private:
    std::shared_ptr<const State> state_;
};

/**
 * @brief Four-strategy retrieval (semantic, lexical, graph, temporal) fused by RRF and
 * reranked.
 *
 * Query preparation (time range, query embedding, query entities) happens before the
 * fan-out. Each strategy then runs on the search executor under its own timeout; a
 * strategy that fails or times out contributes an empty list. Fact-type and time-range
 * admission happens inside every strategy, before it ranks. The engine must be owned by a
 * shared_ptr; strategy tasks keep it alive until they finish, even past a timeout.
 */
class RecallEngine : public std::enable_shared_from_this<RecallEngine> {
public:
    RecallEngine(std::shared_ptr<metadata::MemoryRepository> repository,
                 std::shared_ptr<ml::IEmbeddingProvider> embedder,
                 std::shared_ptr<IReranker> reranker,
                 std::shared_ptr<ITemporalParser> temporalParser,
                 std::shared_ptr<EntityResolver> entityResolver, ml::CapabilityInvoker invoker,
                 boost::asio::any_io_executor searchExecutor, RecallConfig config = {});

    Result<RecallSequence> recall(const RecallQuery& query) const;

    [[nodiscard]] const RecallConfig& config() const noexcept { return config_; }

private:
    struct PreparedQuery {
        std::string bankId;
        std::string text;
        metadata::UnitFilter filter;
        std::optional<Embedding> embedding;
        std::vector<std::string> entityIds;
    };

    Result<std::optional<metadata::TimeRange>> resolveTimeRange(const RecallQuery& query) const;

    Result<std::vector<std::string>> semanticStrategy(const PreparedQuery& q) const;
    Result<std::vector<std::string>> lexicalStrategy(const PreparedQuery& q) const;
    Result<std::vector<std::string>> graphStrategy(const PreparedQuery& q) const;
    Result<std::vector<std::string>> temporalStrategy(const PreparedQuery& q) const;

    Result<std::vector<float>> rerank(const std::string& bankId, const std::string& query,
                                      const std::vector<FusedCandidate>& window) const;

    std::shared_ptr<metadata::MemoryRepository> repository_;
    std::shared_ptr<ml::IEmbeddingProvider> embedder_;
    std::shared_ptr<IReranker> reranker_;
    std::shared_ptr<ITemporalParser> temporalParser_;
    std::shared_ptr<EntityResolver> entityResolver_;
    ml::CapabilityInvoker invoker_;
    boost::asio::any_io_executor searchExecutor_;
    RecallConfig config_;
};

} // namespace engram::search
