#include <spdlog/spdlog.h>
#include <cstdlib>
#include <string>
#include <engram/metadata/connection_pool.h>

namespace engram::metadata {

// PooledConnection implementation
PooledConnection::PooledConnection(std::unique_ptr<Database> db,
                                   std::function<void(PooledConnection*)> returnFunc)
    : db_(std::move(db)), returnFunc_(std::move(returnFunc)) {}

PooledConnection::~PooledConnection() {
    if (db_ && returnFunc_ && !returned_) {
        returnFunc_(this);
    }
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const std::string& dbPath, const ConnectionPoolConfig& config)
    : dbPath_(dbPath), config_(config) {}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

Result<void> ConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    for (size_t i = 0; i < config_.minConnections; ++i) {
        auto connResult = createConnection();
        if (!connResult) {
            while (!available_.empty()) {
                available_.front()->returned_ = true;
                available_.pop();
            }
            totalConnections_ = 0;
            return connResult.error();
        }
        available_.push(wrap(std::move(connResult).value()));
        totalConnections_++;
    }

    spdlog::debug("Connection pool initialized with {} connections for {}",
                  config_.minConnections, dbPath_);
    return {};
}

void ConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }

    shutdown_ = true;
    cv_.notify_all();

    while (!available_.empty()) {
        auto conn = std::move(available_.front());
        available_.pop();
        // Mark connection as returned to prevent callback
        conn->returned_ = true;
    }

    totalConnections_ = 0;
    activeConnections_ = 0;
}

Result<std::unique_ptr<PooledConnection>>
ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (shutdown_) {
        return Error{ErrorCode::InvalidState, "Pool is shut down"};
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (available_.empty()) {
        if (totalConnections_ < config_.maxConnections) {
            totalConnections_++;
            lock.unlock();
            auto connResult = createConnection();
            lock.lock();

            if (!connResult) {
                totalConnections_--;
                failedAcquisitions_++;
                return connResult.error();
            }
            activeConnections_++;
            totalAcquired_++;
            return wrap(std::move(connResult).value());
        }

        if (!cv_.wait_until(lock, deadline, [this] { return !available_.empty() || shutdown_; })) {
            failedAcquisitions_++;
            return Error{ErrorCode::ResourceExhausted, "Timeout acquiring database connection"};
        }
        if (shutdown_) {
            failedAcquisitions_++;
            return Error{ErrorCode::InvalidState, "Pool is shut down"};
        }
    }

    auto conn = std::move(available_.front());
    available_.pop();
    activeConnections_++;
    totalAcquired_++;
    return conn;
}

ConnectionPool::Stats ConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {totalConnections_, available_.size(), activeConnections_, totalAcquired_,
            failedAcquisitions_};
}

Result<std::unique_ptr<Database>> ConnectionPool::createConnection() {
    auto db = std::make_unique<Database>();

    auto openResult = db->open(dbPath_, ConnectionMode::Create);
    if (!openResult) {
        return openResult.error();
    }

    auto configResult = configureConnection(*db);
    if (!configResult) {
        return configResult.error();
    }

    return db;
}

Result<void> ConnectionPool::configureConnection(Database& db) {
    auto timeoutResult = db.setBusyTimeout(config_.busyTimeout);
    if (!timeoutResult) {
        return timeoutResult.error();
    }

    if (config_.enableWAL) {
        auto walResult = db.enableWAL();
        if (!walResult) {
            spdlog::warn("WAL enable failed: {}", walResult.error().message);
        }
    }

    if (config_.enableForeignKeys) {
        auto fkResult = db.execute("PRAGMA foreign_keys = ON");
        if (!fkResult) {
            return fkResult.error();
        }
    }

    // Relaxed durability when running tests
    auto syncResult = std::getenv("ENGRAM_TEST_TMPDIR") ? db.execute("PRAGMA synchronous = OFF")
                                                        : db.execute("PRAGMA synchronous = NORMAL");
    if (!syncResult) {
        spdlog::debug("Setting synchronous pragma failed: {}", syncResult.error().message);
    }
    if (auto tempResult = db.execute("PRAGMA temp_store = MEMORY"); !tempResult) {
        spdlog::debug("Setting temp_store pragma failed: {}", tempResult.error().message);
    }

    return {};
}

std::unique_ptr<PooledConnection> ConnectionPool::wrap(std::unique_ptr<Database> db) {
    return std::make_unique<PooledConnection>(
        std::move(db), [this](PooledConnection* c) { returnConnection(c); });
}

void ConnectionPool::returnConnection(PooledConnection* conn) {
    if (!conn || !conn->db_)
        return;

    // A connection must never go back with an open transaction
    if (conn->db_->inTransaction()) {
        auto rb = conn->db_->rollback();
        if (!rb) {
            spdlog::warn("Rollback on returned connection failed: {}", rb.error().message);
        }
    }

    bool valid = isConnectionValid(*conn->db_);

    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        spdlog::debug("Discarding connection during shutdown");
        return;
    }

    activeConnections_--;
    if (!valid) {
        totalConnections_--;
        spdlog::warn("Returned connection is invalid, discarding");
        cv_.notify_one();
        return;
    }

    available_.push(wrap(std::move(conn->db_)));
    cv_.notify_one();
}

bool ConnectionPool::isConnectionValid(Database& db) const {
    if (!db.isOpen()) {
        return false;
    }

    auto stmtResult = db.prepare("SELECT 1");
    if (!stmtResult)
        return false;

    Statement stmt = std::move(stmtResult).value();
    auto result = stmt.step();
    return result.has_value() && result.value();
}

} // namespace engram::metadata
