#pragma once

#include <chrono>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <engram/core/async_call.h>
#include <engram/core/retry.h>
#include <engram/core/types.h>

namespace engram::ml {

struct CapabilityPolicy {
    std::chrono::milliseconds timeout{10000};
    core::RetryPolicy retry;
};

/**
 * @brief Runs external capability calls with a per-attempt timeout and bounded retry.
 *
 * Calls execute on the capability pool. A call that exhausts its retries comes back as
 * @p failureCode (ExtractionFailure, EmbeddingFailure, ...) with the last cause in the
 * message. The callable must own what it captures: a timed-out attempt keeps running
 * after invoke() has returned.
 */
class CapabilityInvoker {
public:
    CapabilityInvoker(boost::asio::any_io_executor executor, CapabilityPolicy policy)
        : executor_(std::move(executor)), policy_(policy) {}

    template <typename Fn>
    auto invoke(const std::string& what, ErrorCode failureCode, Fn fn) const
        -> std::invoke_result_t<Fn&> {
        auto result = core::retryWithBackoff(policy_.retry, what, [&]() {
            return core::callWithTimeout(executor_, policy_.timeout, fn, what);
        });
        if (!result && result.error().code != failureCode) {
            return Error{failureCode, what + ": " + result.error().message};
        }
        return result;
    }

    [[nodiscard]] const CapabilityPolicy& policy() const noexcept { return policy_; }

private:
    boost::asio::any_io_executor executor_;
    CapabilityPolicy policy_;
};

} // namespace engram::ml
