// Shared helpers for engram unit tests
#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <unistd.h>

#include <engram/config/engine_config.h>
#include <engram/core/types.h>

namespace engram::test {

// Root for scratch files; ENGRAM_TEST_TMPDIR overrides the system temp directory
inline std::filesystem::path testTempRoot() {
    if (const char* env = std::getenv("ENGRAM_TEST_TMPDIR"); env && *env)
        return std::filesystem::path(env);
    return std::filesystem::temp_directory_path();
}

inline std::filesystem::path makeTempDir(const std::string& prefix = "engram_test_") {
    static std::atomic<int> counter{0};
    auto base = testTempRoot();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" +
                         std::to_string(counter.fetch_add(1)));
        std::error_code ec;
        if (std::filesystem::create_directories(p, ec))
            return p;
    }
    return base;
}

inline std::filesystem::path writeFile(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

// A database path that no other test in this process uses
inline std::filesystem::path tempDbPath(const std::string& prefix) {
    return makeTempDir(prefix + "_") / "engram.db";
}

inline void removeDbFiles(const std::filesystem::path& dbPath) {
    std::error_code ec;
    std::filesystem::remove_all(dbPath.parent_path(), ec);
}

/**
 * @brief Sets (or unsets) an environment variable for the lifetime of the object
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(std::string name, std::optional<std::string> value) : name_(std::move(name)) {
        if (const char* prev = std::getenv(name_.c_str()))
            previous_ = prev;
        if (value)
            ::setenv(name_.c_str(), value->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }

    ~ScopedEnvVar() {
        if (previous_)
            ::setenv(name_.c_str(), previous_->c_str(), 1);
        else
            ::unsetenv(name_.c_str());
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

// Engine configuration with short timeouts and backoff, suitable for unit tests
inline config::EngineConfig testEngineConfig(const std::filesystem::path& dbPath) {
    config::EngineConfig c;
    c.storage.dbPath = dbPath;
    c.embedding.dimension = 256;
    c.capabilities.timeout = std::chrono::milliseconds(2000);
    c.capabilities.maxAttempts = 2;
    c.capabilities.initialBackoff = std::chrono::milliseconds(1);
    c.capabilities.maxBackoff = std::chrono::milliseconds(5);
    c.capabilities.poolThreads = 4;
    c.recall.strategyTimeout = std::chrono::milliseconds(2000);
    c.queue.maxConcurrent = 2;
    c.logLevel = "warn";
    return c;
}

// Fixed reference instant: 2024-06-15T12:00:00Z
inline TimePoint referenceNoon() {
    return fromEpochMillis(1718452800000LL);
}

} // namespace engram::test
