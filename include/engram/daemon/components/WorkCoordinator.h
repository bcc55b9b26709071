// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2024-2025 YAMS Project Contributors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

namespace engram::daemon {

/**
 * @brief Owns an io_context and the worker threads that run it.
 *
 * The engine keeps separate coordinators for capability calls, recall strategies and
 * the async operation queue so that work blocked on one pool never starves another.
 *
 * - `stop()`: Resets the work guard and stops the io_context; queued work is dropped.
 * - `join()`: Blocks until all workers complete (safe for destruction).
 */
class WorkCoordinator {
public:
    explicit WorkCoordinator(std::string name = "work");
    ~WorkCoordinator();

    WorkCoordinator(const WorkCoordinator&) = delete;
    WorkCoordinator& operator=(const WorkCoordinator&) = delete;
    WorkCoordinator(WorkCoordinator&&) = delete;
    WorkCoordinator& operator=(WorkCoordinator&&) = delete;

    /**
     * @brief Start the worker thread pool.
     *
     * @param numThreads Optional thread count override (default: hardware_concurrency)
     * @throws std::runtime_error if already started or thread creation fails
     */
    void start(std::optional<std::size_t> numThreads = std::nullopt);

    /**
     * @brief Stop accepting new work. Idempotent; does not block.
     */
    void stop();

    /**
     * @brief Wait for all worker threads to finish. Idempotent.
     */
    void join();

    [[nodiscard]] boost::asio::io_context::executor_type getExecutor() const noexcept;

    template <typename Fn> void post(Fn&& fn) const {
        boost::asio::post(ioContext_->get_executor(), std::forward<Fn>(fn));
    }

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] std::size_t getWorkerCount() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::vector<std::thread> workers_;
    bool started_ = false;
};

} // namespace engram::daemon
