#pragma once

#include <algorithm>
#include <chrono>
#include <string_view>
#include <thread>
#include <type_traits>

#include <spdlog/spdlog.h>
#include <engram/core/types.h>

namespace engram::core {

struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{100};
    std::chrono::milliseconds maxBackoff{2000};
};

// Errors worth another attempt: throttling, timeouts and transport hiccups.
inline bool isTransient(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout:
        case ErrorCode::RateLimited:
        case ErrorCode::NetworkError:
        case ErrorCode::ResourceExhausted:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Run @p fn until it succeeds, fails with a non-transient error, or the policy's
 * attempt budget is spent. The last result is returned unchanged.
 */
template <typename Fn>
auto retryWithBackoff(const RetryPolicy& policy, std::string_view what, Fn&& fn)
    -> std::invoke_result_t<Fn&> {
    const int maxAttempts = std::max(1, policy.maxAttempts);
    auto backoff = policy.initialBackoff;
    for (int attempt = 1;; ++attempt) {
        auto result = fn();
        if (result || !isTransient(result.error().code) || attempt >= maxAttempts) {
            if (!result && attempt > 1) {
                spdlog::warn("[Retry] {} failed after {} attempt(s): {}", what, attempt,
                             result.error().message);
            }
            return result;
        }
        spdlog::debug("[Retry] {} retrying after {} ms (attempt {}/{}): {}", what,
                      backoff.count(), attempt, maxAttempts, result.error().message);
        std::this_thread::sleep_for(backoff);
        backoff = std::min<std::chrono::milliseconds>(backoff * 2, policy.maxBackoff);
    }
}

} // namespace engram::core
