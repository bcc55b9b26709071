#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <type_traits>
#include <engram/metadata/database.h>

namespace engram::metadata {

/**
 * @brief Configuration for connection pool
 */
struct ConnectionPoolConfig {
    size_t minConnections = 2;                      ///< Minimum connections to maintain
    size_t maxConnections = 8;                      ///< Maximum connections allowed
    std::chrono::milliseconds busyTimeout{2000};    ///< SQLite busy timeout
    std::chrono::milliseconds acquireTimeout{30000}; ///< Wait for a free connection
    bool enableWAL = true;                          ///< Enable WAL mode
    bool enableForeignKeys = true;                  ///< Enable foreign key constraints
};

/**
 * @brief Database connection handed out by the pool; returns itself on destruction
 */
class PooledConnection {
public:
    explicit PooledConnection(std::unique_ptr<Database> db,
                              std::function<void(PooledConnection*)> returnFunc);
    ~PooledConnection();

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Database* operator->() { return db_.get(); }
    const Database* operator->() const { return db_.get(); }
    Database& operator*() { return *db_; }
    const Database& operator*() const { return *db_; }

    [[nodiscard]] bool isValid() const { return db_ != nullptr; }

private:
    friend class ConnectionPool;

    std::unique_ptr<Database> db_;
    std::function<void(PooledConnection*)> returnFunc_;
    bool returned_ = false;
};

/**
 * @brief Thread-safe database connection pool
 */
class ConnectionPool {
public:
    explicit ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    Result<void> initialize();
    void shutdown();

    /**
     * @brief Acquire a connection, waiting up to @p timeout for one to be returned
     */
    Result<std::unique_ptr<PooledConnection>> acquire(std::chrono::milliseconds timeout);
    Result<std::unique_ptr<PooledConnection>> acquire() { return acquire(config_.acquireTimeout); }

    /**
     * @brief Execute a function with a connection
     */
    template <typename Func>
    auto withConnection(Func&& func) -> std::invoke_result_t<Func, Database&> {
        auto connResult = acquire();
        if (!connResult) {
            return connResult.error();
        }

        auto conn = std::move(connResult).value();
        try {
            return func(**conn);
        } catch (const std::exception& e) {
            return Error{ErrorCode::DatabaseError, e.what()};
        }
    }

    struct Stats {
        size_t totalConnections;
        size_t availableConnections;
        size_t activeConnections;
        size_t totalAcquired;
        size_t failedAcquisitions;
    };

    [[nodiscard]] Stats getStats() const;

private:
    std::string dbPath_;
    ConnectionPoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::unique_ptr<PooledConnection>> available_;
    size_t totalConnections_{0};
    size_t activeConnections_{0};
    size_t totalAcquired_{0};
    size_t failedAcquisitions_{0};
    bool shutdown_{false};

    Result<std::unique_ptr<Database>> createConnection();
    Result<void> configureConnection(Database& db);
    std::unique_ptr<PooledConnection> wrap(std::unique_ptr<Database> db);
    void returnConnection(PooledConnection* conn);
    bool isConnectionValid(Database& db) const;
};

} // namespace engram::metadata
