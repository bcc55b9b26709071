#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <engram/core/types.h>
#include <engram/metadata/memory_repository.h>

namespace engram::daemon {

struct CancelOutcome {
    bool cancelled = false;
    metadata::OperationState state = metadata::OperationState::Pending;
};

/**
 * @brief Persistent queue of asynchronous operations.
 *
 * Every operation lives in the async_operations table and moves through
 * pending -> processing -> completed | failed, or pending -> cancelled. Transitions are
 * conditional updates, so a cancel racing a start resolves to exactly one of them.
 *
 * ## Scheduling
 * - At most `maxConcurrent` operations run at once, at most one per bank
 * - Operations of one bank start in submission order
 *
 * Handlers run on the executor passed at construction and return a JSON result
 * document; an error fails the operation with its message.
 *
 * ## Usage
 * ```cpp
 * auto queue = OperationQueue::create(repo, coordinator.getExecutor(), {});
 * queue->registerHandler("retain_batch", handler);
 * queue->recover();
 * auto op = queue->submit("bank-1", "retain_batch", payloadJson);
 * ```
 */
class OperationQueue : public std::enable_shared_from_this<OperationQueue> {
public:
    struct Config {
        std::size_t maxConcurrent = 4;
    };

    using Handler = std::function<Result<std::string>(const metadata::AsyncOperation&)>;

    static std::shared_ptr<OperationQueue>
    create(std::shared_ptr<metadata::MemoryRepository> repository,
           boost::asio::any_io_executor executor, Config config);

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    void registerHandler(const std::string& kind, Handler handler);

    Result<metadata::AsyncOperation> submit(const std::string& bankId, const std::string& kind,
                                            std::string payload);

    /**
     * @brief Cancel a pending operation. Operations past pending are left alone and their
     * current state is reported. Unknown ids (or ids of another bank) are NotFound.
     */
    Result<CancelOutcome> cancel(const std::string& bankId, const std::string& operationId);

    Result<metadata::AsyncOperation> get(const std::string& bankId,
                                         const std::string& operationId) const;

    Result<std::vector<metadata::AsyncOperation>>
    list(const std::string& bankId, std::optional<metadata::OperationState> state) const;

    /**
     * @brief Startup recovery: fail operations a previous process left in processing and
     * re-queue pending ones. Returns the number re-queued.
     */
    Result<std::size_t> recover();

    /**
     * @brief Stop starting operations. Running handlers finish; queued ones stay pending.
     */
    void shutdown();

    [[nodiscard]] std::size_t runningCount() const;
    [[nodiscard]] std::size_t queuedCount() const;

private:
    struct Entry {
        std::string operationId;
        std::string bankId;
    };

    OperationQueue(std::shared_ptr<metadata::MemoryRepository> repository,
                   boost::asio::any_io_executor executor, Config config);

    // Caller holds mutex_
    void dispatchLocked();
    void run(const Entry& entry);
    void finish(const Entry& entry);

    std::shared_ptr<metadata::MemoryRepository> repository_;
    boost::asio::any_io_executor executor_;
    Config config_;

    mutable std::mutex mutex_;
    std::deque<Entry> queued_;
    std::unordered_set<std::string> runningBanks_;
    std::unordered_map<std::string, Handler> handlers_;
    bool stopping_ = false;
};

} // namespace engram::daemon
