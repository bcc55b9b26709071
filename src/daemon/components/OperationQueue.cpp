#include "engram/daemon/components/OperationQueue.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/post.hpp>
#include <engram/core/uuid.h>

namespace engram::daemon {

using metadata::AsyncOperation;
using metadata::MemorySession;
using metadata::OperationState;

std::shared_ptr<OperationQueue>
OperationQueue::create(std::shared_ptr<metadata::MemoryRepository> repository,
                       boost::asio::any_io_executor executor, Config config) {
    return std::shared_ptr<OperationQueue>(
        new OperationQueue(std::move(repository), std::move(executor), config));
}

OperationQueue::OperationQueue(std::shared_ptr<metadata::MemoryRepository> repository,
                               boost::asio::any_io_executor executor, Config config)
    : repository_(std::move(repository)), executor_(std::move(executor)), config_(config) {
    if (config_.maxConcurrent == 0)
        config_.maxConcurrent = 1;
}

void OperationQueue::registerHandler(const std::string& kind, Handler handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    handlers_[kind] = std::move(handler);
}

Result<AsyncOperation> OperationQueue::submit(const std::string& bankId, const std::string& kind,
                                              std::string payload) {
    if (bankId.empty())
        return Error{ErrorCode::ValidationError, "bank id is required"};
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (handlers_.find(kind) == handlers_.end())
            return Error{ErrorCode::ValidationError, "unknown operation kind '" + kind + "'"};
        if (stopping_)
            return Error{ErrorCode::InvalidState, "operation queue is shutting down"};
    }

    AsyncOperation op;
    op.id = core::generateId("op");
    op.bankId = bankId;
    op.kind = kind;
    op.state = OperationState::Pending;
    op.payload = std::move(payload);
    op.createdAt = std::chrono::system_clock::now();
    op.updatedAt = op.createdAt;

    auto stored = repository_->transact([&](MemorySession& session) -> Result<void> {
        auto bank = session.ensureBank(bankId);
        if (!bank)
            return bank.error();
        return session.insertOperation(op);
    });
    if (!stored)
        return stored.error();

    {
        std::lock_guard<std::mutex> lk(mutex_);
        queued_.push_back(Entry{op.id, bankId});
        dispatchLocked();
    }
    spdlog::info("[OperationQueue] Submitted {} '{}' for bank '{}'", kind, op.id, bankId);
    return op;
}

Result<CancelOutcome> OperationQueue::cancel(const std::string& bankId,
                                             const std::string& operationId) {
    auto existing = get(bankId, operationId);
    if (!existing)
        return existing.error();

    auto transitioned = repository_->read([&](MemorySession& session) {
        return session.transitionOperation(operationId, OperationState::Pending,
                                           OperationState::Cancelled);
    });
    if (!transitioned)
        return transitioned.error();

    if (transitioned.value()) {
        std::lock_guard<std::mutex> lk(mutex_);
        queued_.erase(std::remove_if(queued_.begin(), queued_.end(),
                                     [&](const Entry& e) { return e.operationId == operationId; }),
                      queued_.end());
        spdlog::info("[OperationQueue] Cancelled '{}'", operationId);
        return CancelOutcome{true, OperationState::Cancelled};
    }

    auto current = get(bankId, operationId);
    if (!current)
        return current.error();
    spdlog::debug("[OperationQueue] Cancel of '{}' refused in state {}", operationId,
                  metadata::operationStateToString(current.value().state));
    return CancelOutcome{false, current.value().state};
}

Result<AsyncOperation> OperationQueue::get(const std::string& bankId,
                                           const std::string& operationId) const {
    auto op = repository_->read(
        [&](MemorySession& session) { return session.getOperation(bankId, operationId); });
    if (!op)
        return op.error();
    if (!op.value())
        return Error{ErrorCode::NotFound, "operation '" + operationId + "' not found"};
    return std::move(*op.value());
}

Result<std::vector<AsyncOperation>>
OperationQueue::list(const std::string& bankId, std::optional<OperationState> state) const {
    return repository_->read(
        [&](MemorySession& session) { return session.listOperations(bankId, state); });
}

Result<std::size_t> OperationQueue::recover() {
    auto interrupted = repository_->read(
        [](MemorySession& session) { return session.operationsInState(OperationState::Processing); });
    if (!interrupted)
        return interrupted.error();
    for (const auto& op : interrupted.value()) {
        auto r = repository_->read([&](MemorySession& session) {
            return session.transitionOperation(op.id, OperationState::Processing,
                                               OperationState::Failed, std::nullopt,
                                               std::string("interrupted"));
        });
        if (!r)
            return r.error();
        spdlog::warn("[OperationQueue] Operation '{}' was interrupted by shutdown", op.id);
    }

    auto pending = repository_->read(
        [](MemorySession& session) { return session.operationsInState(OperationState::Pending); });
    if (!pending)
        return pending.error();

    std::lock_guard<std::mutex> lk(mutex_);
    std::size_t requeued = 0;
    for (const auto& op : pending.value()) {
        const bool known = std::any_of(queued_.begin(), queued_.end(),
                                       [&](const Entry& e) { return e.operationId == op.id; });
        if (known)
            continue;
        queued_.push_back(Entry{op.id, op.bankId});
        ++requeued;
    }
    if (requeued > 0 || !interrupted.value().empty()) {
        spdlog::info("[OperationQueue] Recovery: {} re-queued, {} marked failed", requeued,
                     interrupted.value().size());
    }
    dispatchLocked();
    return requeued;
}

void OperationQueue::shutdown() {
    std::lock_guard<std::mutex> lk(mutex_);
    stopping_ = true;
}

std::size_t OperationQueue::runningCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return runningBanks_.size();
}

std::size_t OperationQueue::queuedCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return queued_.size();
}

void OperationQueue::dispatchLocked() {
    if (stopping_)
        return;
    for (auto it = queued_.begin();
         it != queued_.end() && runningBanks_.size() < config_.maxConcurrent;) {
        if (runningBanks_.count(it->bankId)) {
            ++it;
            continue;
        }
        Entry entry = *it;
        it = queued_.erase(it);
        runningBanks_.insert(entry.bankId);
        boost::asio::post(executor_, [self = shared_from_this(), entry]() { self->run(entry); });
    }
}

void OperationQueue::run(const Entry& entry) {
    auto started = repository_->read([&](MemorySession& session) {
        return session.transitionOperation(entry.operationId, OperationState::Pending,
                                           OperationState::Processing);
    });
    if (!started) {
        spdlog::error("[OperationQueue] Could not start '{}': {}", entry.operationId,
                      started.error().message);
        finish(entry);
        return;
    }
    if (!started.value()) {
        spdlog::debug("[OperationQueue] '{}' is no longer pending; skipped", entry.operationId);
        finish(entry);
        return;
    }

    auto op = get(entry.bankId, entry.operationId);
    Handler handler;
    if (op) {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = handlers_.find(op.value().kind);
        if (it != handlers_.end())
            handler = it->second;
    }

    Result<std::string> outcome = Error{ErrorCode::InternalError, "operation could not be loaded"};
    if (!op) {
        outcome = op.error();
    } else if (!handler) {
        outcome = Error{ErrorCode::NotSupported, "no handler for '" + op.value().kind + "'"};
    } else {
        try {
            outcome = handler(op.value());
        } catch (const std::exception& e) {
            outcome = Error{ErrorCode::InternalError, e.what()};
        }
    }

    auto stored = repository_->read([&](MemorySession& session) {
        if (outcome) {
            return session.transitionOperation(entry.operationId, OperationState::Processing,
                                               OperationState::Completed, outcome.value());
        }
        return session.transitionOperation(entry.operationId, OperationState::Processing,
                                           OperationState::Failed, std::nullopt,
                                           outcome.error().message);
    });
    if (!stored) {
        spdlog::error("[OperationQueue] Could not record outcome of '{}': {}", entry.operationId,
                      stored.error().message);
    } else if (outcome) {
        spdlog::info("[OperationQueue] '{}' completed", entry.operationId);
    } else {
        spdlog::warn("[OperationQueue] '{}' failed: {}", entry.operationId,
                     outcome.error().message);
    }
    finish(entry);
}

void OperationQueue::finish(const Entry& entry) {
    std::lock_guard<std::mutex> lk(mutex_);
    runningBanks_.erase(entry.bankId);
    dispatchLocked();
}

} // namespace engram::daemon
