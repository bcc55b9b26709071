#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <engram/core/types.h>

namespace engram::config {

/**
 * @brief Engine configuration.
 *
 * Resolution order: built-in defaults, then the TOML file, then environment
 * variables. Sections mirror the file layout:
 *
 * ```toml
 * [storage]
 * db_path = "~/.local/share/engram/engram.db"
 *
 * [recall]
 * rrf_k = 60
 * rerank_weight = 0.8
 * ```
 */
struct EngineConfig {
    struct Storage {
        std::filesystem::path dbPath;
        size_t minConnections = 2;
        size_t maxConnections = 8;
        std::chrono::milliseconds busyTimeout{2000};
    } storage;

    struct Embedding {
        size_t dimension = 384;
    } embedding;

    struct Retain {
        double dedupThreshold = 0.95;
        double semanticLinkThreshold = 0.70;
        size_t semanticLinkLimit = 5;
        std::chrono::hours temporalWindow{24};
        size_t temporalLinkLimit = 10;
        double mergeBoost = 0.2;
        double defaultConfidence = 0.8;
    } retain;

    struct Recall {
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
    } recall;

    struct Reflect {
        size_t contextPerType = 10;
        size_t opinionBudget = 3;
    } reflect;

    struct Capabilities {
        std::chrono::milliseconds timeout{10000};
        int maxAttempts = 3;
        std::chrono::milliseconds initialBackoff{100};
        std::chrono::milliseconds maxBackoff{2000};
        size_t poolThreads = 4;
    } capabilities;

    struct Queue {
        size_t maxConcurrent = 4;
    } queue;

    std::string logLevel = "info";
    std::string defaultBankId = "default";

    /**
     * @brief Range and consistency checks; the first violation is a ValidationError
     */
    Result<void> validate() const;
};

/**
 * @brief Defaults, overlaid with @p path (or the resolved config file when empty) and
 * the ENGRAM_* environment. A missing file is not an error; malformed values are.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path = {});

} // namespace engram::config
