#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <type_traits>

#include <boost/asio/post.hpp>
#include <engram/core/types.h>

namespace engram::core {

/**
 * @brief Post @p fn to @p executor and return a future for its result.
 *
 * The task owns everything it captures, so the caller may stop waiting at any time.
 */
template <typename Executor, typename Fn>
auto postWithFuture(const Executor& executor, Fn fn) -> std::future<std::invoke_result_t<Fn&>> {
    using ResultT = std::invoke_result_t<Fn&>;
    auto task = std::make_shared<std::packaged_task<ResultT()>>(std::move(fn));
    auto future = task->get_future();
    boost::asio::post(executor, [task]() { (*task)(); });
    return future;
}

/**
 * @brief Wait for a Result-valued future until @p deadline.
 *
 * Expiry yields ErrorCode::Timeout; exceptions stored in the future become
 * ErrorCode::InternalError.
 */
template <typename ResultT>
ResultT awaitResult(std::future<ResultT>& future, std::chrono::steady_clock::time_point deadline,
                    const std::string& what) {
    if (future.wait_until(deadline) != std::future_status::ready) {
        return Error{ErrorCode::Timeout, what + " timed out"};
    }
    try {
        return future.get();
    } catch (const std::future_error& e) {
        return Error{ErrorCode::InternalError, what + " abandoned: " + e.what()};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, what + " threw: " + e.what()};
    }
}

/**
 * @brief Post @p fn to @p executor and wait at most @p timeout for its Result.
 *
 * When the wait expires the caller gets ErrorCode::Timeout and the task finishes (or
 * is discarded) on its own.
 */
template <typename Executor, typename Fn>
auto callWithTimeout(const Executor& executor, std::chrono::milliseconds timeout, Fn fn,
                     const std::string& what) -> std::invoke_result_t<Fn&> {
    auto future = postWithFuture(executor, std::move(fn));
    auto result = awaitResult(future, std::chrono::steady_clock::now() + timeout, what);
    if (!result && result.error().code == ErrorCode::Timeout) {
        return Error{ErrorCode::Timeout,
                     what + " timed out after " + std::to_string(timeout.count()) + " ms"};
    }
    return result;
}

} // namespace engram::core
