#include <spdlog/spdlog.h>

#include <map>
#include <engram/config/config_helpers.h>
#include <engram/config/engine_config.h>

namespace engram::config {

namespace {

using Flat = std::map<std::string, std::string>;

Error invalid(const std::string& key, const std::string& value) {
    return Error{ErrorCode::ValidationError, "invalid value '" + value + "' for " + key};
}

Result<void> readDouble(const Flat& kv, const std::string& key, double& out) {
    auto it = kv.find(key);
    if (it == kv.end())
        return {};
    auto v = parse_double(it->second);
    if (!v)
        return invalid(key, it->second);
    out = *v;
    return {};
}

template <typename Int> Result<void> readInt(const Flat& kv, const std::string& key, Int& out) {
    auto it = kv.find(key);
    if (it == kv.end())
        return {};
    auto v = parse_int(it->second);
    if (!v || *v < 0)
        return invalid(key, it->second);
    out = static_cast<Int>(*v);
    return {};
}

template <typename Rep, typename Period>
Result<void> readDuration(const Flat& kv, const std::string& key,
                          std::chrono::duration<Rep, Period>& out) {
    auto it = kv.find(key);
    if (it == kv.end())
        return {};
    auto v = parse_int(it->second);
    if (!v || *v < 0)
        return invalid(key, it->second);
    out = std::chrono::duration<Rep, Period>(static_cast<Rep>(*v));
    return {};
}

Result<void> readBool(const Flat& kv, const std::string& key, bool& out) {
    auto it = kv.find(key);
    if (it == kv.end())
        return {};
    auto v = parse_bool(it->second);
    if (!v)
        return invalid(key, it->second);
    out = *v;
    return {};
}

void readString(const Flat& kv, const std::string& key, std::string& out) {
    auto it = kv.find(key);
    if (it != kv.end() && !it->second.empty())
        out = it->second;
}

Result<void> applyFile(const Flat& kv, EngineConfig& c) {
    std::string dbPath;
    readString(kv, "storage.db_path", dbPath);
    if (!dbPath.empty())
        c.storage.dbPath = expand_tilde(dbPath);

    Result<void> steps[] = {
        readInt(kv, "storage.min_connections", c.storage.minConnections),
        readInt(kv, "storage.max_connections", c.storage.maxConnections),
        readDuration(kv, "storage.busy_timeout_ms", c.storage.busyTimeout),
        readInt(kv, "embedding.dimension", c.embedding.dimension),
        readDouble(kv, "retain.dedup_threshold", c.retain.dedupThreshold),
        readDouble(kv, "retain.semantic_link_threshold", c.retain.semanticLinkThreshold),
        readInt(kv, "retain.semantic_link_limit", c.retain.semanticLinkLimit),
        readDuration(kv, "retain.temporal_window_hours", c.retain.temporalWindow),
        readInt(kv, "retain.temporal_link_limit", c.retain.temporalLinkLimit),
        readDouble(kv, "retain.merge_boost", c.retain.mergeBoost),
        readDouble(kv, "retain.default_confidence", c.retain.defaultConfidence),
        readInt(kv, "recall.rrf_k", c.recall.rrfK),
        readInt(kv, "recall.per_strategy_limit", c.recall.perStrategyLimit),
        readDuration(kv, "recall.strategy_timeout_ms", c.recall.strategyTimeout),
        readInt(kv, "recall.rerank_top_n", c.recall.rerankTopN),
        readDouble(kv, "recall.rerank_weight", c.recall.rerankWeight),
        readInt(kv, "recall.graph_max_hops", c.recall.graphMaxHops),
        readDouble(kv, "recall.graph_hop_decay", c.recall.graphHopDecay),
        readInt(kv, "recall.graph_node_budget", c.recall.graphNodeBudget),
        readInt(kv, "recall.default_budget", c.recall.defaultBudget),
        readBool(kv, "recall.infer_time_from_query", c.recall.inferTimeFromQuery),
        readInt(kv, "reflect.context_per_type", c.reflect.contextPerType),
        readInt(kv, "reflect.opinion_budget", c.reflect.opinionBudget),
        readDuration(kv, "capabilities.timeout_ms", c.capabilities.timeout),
        readInt(kv, "capabilities.max_attempts", c.capabilities.maxAttempts),
        readDuration(kv, "capabilities.initial_backoff_ms", c.capabilities.initialBackoff),
        readDuration(kv, "capabilities.max_backoff_ms", c.capabilities.maxBackoff),
        readInt(kv, "capabilities.pool_threads", c.capabilities.poolThreads),
        readInt(kv, "queue.max_concurrent", c.queue.maxConcurrent),
    };
    for (auto& step : steps) {
        if (!step)
            return step;
    }
    readString(kv, "logging.level", c.logLevel);
    readString(kv, "bank.default_bank_id", c.defaultBankId);
    return {};
}

Result<void> applyEnvironment(EngineConfig& c) {
    if (auto v = env_value("ENGRAM_DB_PATH"))
        c.storage.dbPath = expand_tilde(*v);
    if (auto v = env_value("ENGRAM_LOG_LEVEL"))
        c.logLevel = *v;
    if (auto v = env_value("ENGRAM_BANK_ID"))
        c.defaultBankId = *v;
    if (auto v = env_value("ENGRAM_EMBEDDING_DIM")) {
        auto n = parse_int(*v);
        if (!n || *n <= 0)
            return invalid("ENGRAM_EMBEDDING_DIM", *v);
        c.embedding.dimension = static_cast<size_t>(*n);
    }
    if (auto v = env_value("ENGRAM_QUEUE_CONCURRENCY")) {
        auto n = parse_int(*v);
        if (!n || *n <= 0)
            return invalid("ENGRAM_QUEUE_CONCURRENCY", *v);
        c.queue.maxConcurrent = static_cast<size_t>(*n);
    }
    return {};
}

bool inUnitInterval(double v) {
    return v >= 0.0 && v <= 1.0;
}

} // namespace

Result<void> EngineConfig::validate() const {
    auto fail = [](const std::string& msg) { return Error{ErrorCode::ValidationError, msg}; };

    if (storage.dbPath.empty())
        return fail("storage.db_path is empty");
    if (storage.minConnections == 0 || storage.maxConnections < storage.minConnections)
        return fail("storage connections must satisfy 0 < min_connections <= max_connections");
    if (embedding.dimension == 0)
        return fail("embedding.dimension must be positive");
    if (!inUnitInterval(retain.dedupThreshold) || !inUnitInterval(retain.semanticLinkThreshold))
        return fail("retain thresholds must be within [0,1]");
    if (retain.semanticLinkThreshold >= retain.dedupThreshold)
        return fail("retain.semantic_link_threshold must be below retain.dedup_threshold");
    if (!inUnitInterval(retain.mergeBoost) || !inUnitInterval(retain.defaultConfidence))
        return fail("retain.merge_boost and retain.default_confidence must be within [0,1]");
    if (recall.rrfK <= 0)
        return fail("recall.rrf_k must be positive");
    if (recall.perStrategyLimit == 0 || recall.defaultBudget == 0)
        return fail("recall limits must be positive");
    if (recall.strategyTimeout.count() <= 0)
        return fail("recall.strategy_timeout_ms must be positive");
    if (!inUnitInterval(recall.rerankWeight))
        return fail("recall.rerank_weight must be within [0,1]");
    if (!inUnitInterval(recall.graphHopDecay))
        return fail("recall.graph_hop_decay must be within [0,1]");
    if (recall.graphMaxHops < 0 || recall.graphNodeBudget == 0)
        return fail("recall graph limits are out of range");
    if (capabilities.timeout.count() <= 0 || capabilities.maxAttempts <= 0)
        return fail("capabilities.timeout_ms and capabilities.max_attempts must be positive");
    if (capabilities.maxBackoff < capabilities.initialBackoff)
        return fail("capabilities.max_backoff_ms must not be below initial_backoff_ms");
    if (capabilities.poolThreads == 0 || queue.maxConcurrent == 0)
        return fail("thread and queue counts must be positive");
    if (defaultBankId.empty())
        return fail("bank.default_bank_id is empty");
    return {};
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    EngineConfig config;
    config.storage.dbPath = get_data_dir() / "engram.db";

    const auto file = get_config_path(path.string());
    if (!file.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(file, ec)) {
            auto applied = applyFile(parse_config_flat(file), config);
            if (!applied)
                return applied.error();
            spdlog::debug("[Config] Loaded {}", file.string());
        } else if (!path.empty()) {
            spdlog::warn("[Config] {} not found; using defaults", file.string());
        }
    }

    auto env = applyEnvironment(config);
    if (!env)
        return env.error();

    auto valid = config.validate();
    if (!valid)
        return valid.error();
    return config;
}

} // namespace engram::config
