#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace engram::retain {

/**
 * @brief One writer mutex per bank, created on first use and never removed.
 *
 * Retain commits and opinion persistence for the same bank serialize on it; writes to
 * different banks proceed in parallel.
 */
class BankWriteLocks {
public:
    std::shared_ptr<std::mutex> lockFor(const std::string& bankId) {
        std::lock_guard<std::mutex> lk(mapMutex_);
        auto& slot = locks_[bankId];
        if (!slot)
            slot = std::make_shared<std::mutex>();
        return slot;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lk(mapMutex_);
        return locks_.size();
    }

private:
    mutable std::mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace engram::retain
