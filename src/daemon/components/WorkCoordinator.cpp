// SPDX-License-Identifier: Apache-2.0
// Copyright (c) 2024-2025 YAMS Project Contributors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "engram/daemon/components/WorkCoordinator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

#include <boost/asio/detail/concurrency_hint.hpp>

namespace engram::daemon {

WorkCoordinator::WorkCoordinator(std::string name)
    : name_(std::move(name)),
      ioContext_(std::make_shared<boost::asio::io_context>(BOOST_ASIO_CONCURRENCY_HINT_SAFE)),
      started_(false) {
    spdlog::debug("[WorkCoordinator:{}] Constructed (io_context created, not started)", name_);
}

WorkCoordinator::~WorkCoordinator() {
    if (started_) {
        spdlog::debug("[WorkCoordinator:{}] Destructor called with active threads, stopping...",
                      name_);
        stop();
        join();
    }
}

void WorkCoordinator::start(std::optional<std::size_t> numThreads) {
    if (started_) {
        throw std::runtime_error("WorkCoordinator already started");
    }

    workGuard_.emplace(boost::asio::make_work_guard(*ioContext_));

    const std::size_t workerCount =
        numThreads.value_or(std::max<std::size_t>(1, std::thread::hardware_concurrency()));

    workers_.reserve(workerCount);
    try {
        for (std::size_t i = 0; i < workerCount; ++i) {
            workers_.emplace_back([this, i]() {
                spdlog::trace("[WorkCoordinator:{}] Worker {} starting io_context.run()", name_, i);
                ioContext_->run();
                spdlog::trace("[WorkCoordinator:{}] Worker {} exited io_context.run()", name_, i);
            });
        }
        started_ = true;
        spdlog::debug("[WorkCoordinator:{}] Started with {} worker threads", name_, workerCount);
    } catch (const std::exception& e) {
        spdlog::error("[WorkCoordinator:{}] Failed to spawn worker thread: {}", name_, e.what());
        ioContext_->stop();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        workGuard_.reset();
        throw std::runtime_error(std::string("Failed to start WorkCoordinator: ") + e.what());
    }
}

void WorkCoordinator::stop() {
    if (!started_) {
        return;
    }
    workGuard_.reset();
    ioContext_->stop();
    spdlog::debug("[WorkCoordinator:{}] Work guard reset and io_context stopped", name_);
}

void WorkCoordinator::join() {
    if (workers_.empty()) {
        return;
    }

    spdlog::debug("[WorkCoordinator:{}] Joining {} worker threads...", name_, workers_.size());
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            try {
                worker.join();
            } catch (const std::exception& e) {
                spdlog::warn("[WorkCoordinator:{}] Exception during worker join: {}", name_,
                             e.what());
            }
        }
    }
    workers_.clear();
    started_ = false;
}

boost::asio::io_context::executor_type WorkCoordinator::getExecutor() const noexcept {
    return ioContext_->get_executor();
}

bool WorkCoordinator::isRunning() const noexcept {
    return started_ && !workers_.empty();
}

std::size_t WorkCoordinator::getWorkerCount() const noexcept {
    return workers_.size();
}

} // namespace engram::daemon
