/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file concurrency_limiter.cpp
 * @brief Concurrency limiter implementation
 */

#include <algorithm>   // for sort, find_if, remove_if
#include <atomic>      // for atomic
#include <cstddef>     // for size_t
#include <cstdint>     // for uint32_t
#include <functional>  // for function
#include <memory>      // for make_shared, shared_ptr
#include <mutex>       // for lock_guard, unique_lock
#include <optional>    // for optional, nullopt
#include <stdexcept>   // for invalid_argument
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move
#include <vector>      // for vector

#include "log/log_macros.hpp"
#include "sched/concurrency_limiter.hpp"
#include "sched/sched_log.hpp"
#include "sched/task.hpp"
#include "sched/time.hpp"

namespace conductor::sched {

ConcurrencyLimiter::ConcurrencyLimiter(
        const std::size_t max_concurrent, std::function<void()> on_event)
        : max_concurrent_{max_concurrent}, on_event_{std::move(on_event)} {
    if (max_concurrent_ == 0) {
        log_and_throw<std::invalid_argument>(
                SchedLog::Limiter, "max_concurrent must be at least 1");
    }
    in_flight_.reserve(max_concurrent_);
}

ConcurrencyLimiter::~ConcurrencyLimiter() { stop(); }

void ConcurrencyLimiter::start(Executor executor) {
    if (running_) {
        CD_LOGC_WARN(SchedLog::Limiter, "Workers already started, ignoring call");
        return;
    }
    if (!executor) {
        log_and_throw<std::invalid_argument>(SchedLog::Limiter, "Executor must not be empty");
    }

    executor_ = std::move(executor);
    stop_flag_.store(false, std::memory_order_release);

    CD_LOGC_DEBUG(SchedLog::Limiter, "Starting {} worker threads", max_concurrent_);
    workers_.reserve(max_concurrent_);
    for (std::size_t i = 0; i < max_concurrent_; ++i) {
        spawn_worker();
    }
    running_ = true;
}

void ConcurrencyLimiter::stop() {
    if (!running_) {
        return;
    }

    signal_all();

    {
        const std::lock_guard<std::mutex> lock(jobs_mutex_);
        if (!jobs_.empty()) {
            CD_LOGC_DEBUG(SchedLog::Limiter, "Dropping {} queued attempts", jobs_.size());
        }
        jobs_.clear();
        stop_flag_.store(true, std::memory_order_release);
    }
    jobs_cv_.notify_all();

    for (auto &worker : workers_) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    // Reset state for potential restart
    workers_.clear();
    in_flight_.clear();
    {
        const std::lock_guard<std::mutex> lock(completions_mutex_);
        completions_.clear();
    }
    stop_flag_.store(false, std::memory_order_release);
    running_ = false;

    CD_LOGC_DEBUG(SchedLog::Limiter, "All worker threads joined");
}

bool ConcurrencyLimiter::dispatch(DispatchRequest request, const Nanos now) {
    if (!running_) {
        CD_LOGC_WARN(
                SchedLog::Limiter, "Dispatch of '{}' ignored, workers not started", request.task_id);
        return false;
    }
    if (available() == 0 || in_flight_.contains(request.task_id)) {
        return false;
    }

    auto token = std::make_shared<CancellationToken>();
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    const Nanos deadline = request.timeout > Nanos{0} ? now + request.timeout : Nanos{0};

    in_flight_.emplace(
            request.task_id,
            Slot{.attempt = request.attempt,
                 .token = token,
                 .abandoned = abandoned,
                 .deadline = deadline});

    Job job{.context =
                    ExecutionContext{
                            .task_id = std::move(request.task_id),
                            .attempt = request.attempt,
                            .payload = std::move(request.payload),
                            .cancellation_token = std::move(token),
                            .deadline = deadline},
            .abandoned = std::move(abandoned)};

    CD_LOGC_TRACE_L1(
            SchedLog::Limiter,
            "Dispatching '{}' attempt {} ({} of {} slots in use)",
            job.context.task_id,
            job.context.attempt,
            in_flight_.size(),
            max_concurrent_);

    {
        const std::lock_guard<std::mutex> lock(jobs_mutex_);
        jobs_.push_back(std::move(job));
    }
    jobs_cv_.notify_one();
    return true;
}

std::vector<Completion> ConcurrencyLimiter::drain_completions() {
    std::vector<Completion> arrived{};
    {
        const std::lock_guard<std::mutex> lock(completions_mutex_);
        arrived.swap(completions_);
    }

    std::vector<Completion> accepted{};
    accepted.reserve(arrived.size());
    for (auto &completion : arrived) {
        const auto it = in_flight_.find(completion.task_id);
        if (it == in_flight_.end() || it->second.attempt != completion.attempt) {
            CD_LOGC_DEBUG(
                    SchedLog::Limiter,
                    "Discarding late result of '{}' attempt {}",
                    completion.task_id,
                    completion.attempt);
            continue;
        }
        in_flight_.erase(it);
        accepted.push_back(std::move(completion));
    }
    return accepted;
}

std::vector<Expiry> ConcurrencyLimiter::expire_deadlines(const Nanos now) {
    std::vector<Expiry> expired{};
    for (const auto &[task_id, slot] : in_flight_) {
        if (slot.deadline != Nanos{0} && slot.deadline <= now) {
            expired.push_back(
                    Expiry{.task_id = task_id, .attempt = slot.attempt, .deadline = slot.deadline});
        }
    }

    std::sort(expired.begin(), expired.end(), [](const Expiry &a, const Expiry &b) {
        return a.deadline < b.deadline;
    });

    for (const auto &expiry : expired) {
        CD_LOGC_WARN(
                SchedLog::Limiter,
                "Task '{}' attempt {} exceeded its deadline, abandoning",
                expiry.task_id,
                expiry.attempt);
        abandon(expiry.task_id);
    }
    return expired;
}

bool ConcurrencyLimiter::cancel(const std::string_view task_id) {
    const auto it = in_flight_.find(std::string{task_id});
    if (it == in_flight_.end()) {
        return false;
    }
    CD_LOGC_DEBUG(SchedLog::Limiter, "Cancelling in-flight task '{}'", task_id);
    abandon(std::string{task_id});
    return true;
}

void ConcurrencyLimiter::signal_all() {
    for (const auto &[task_id, slot] : in_flight_) {
        slot.token->cancel();
    }
}

std::optional<Nanos> ConcurrencyLimiter::next_deadline() const {
    std::optional<Nanos> earliest{};
    for (const auto &[task_id, slot] : in_flight_) {
        if (slot.deadline == Nanos{0}) {
            continue;
        }
        if (!earliest.has_value() || slot.deadline < earliest.value()) {
            earliest = slot.deadline;
        }
    }
    return earliest;
}

bool ConcurrencyLimiter::is_in_flight(const std::string_view task_id) const {
    return in_flight_.contains(std::string{task_id});
}

void ConcurrencyLimiter::abandon(const std::string &task_id) {
    const auto it = in_flight_.find(task_id);
    if (it == in_flight_.end()) {
        return;
    }
    const AbandonFlag abandoned = it->second.abandoned;
    it->second.token->cancel();
    in_flight_.erase(it);

    bool still_queued = false;
    {
        const std::lock_guard<std::mutex> lock(jobs_mutex_);
        abandoned->store(true, std::memory_order_release);
        const auto queued = std::find_if(jobs_.begin(), jobs_.end(), [&abandoned](const Job &job) {
            return job.abandoned == abandoned;
        });
        if (queued != jobs_.end()) {
            jobs_.erase(queued);
            still_queued = true;
        }
    }

    // A worker is stuck in the executor only if the job was already picked up
    if (!still_queued) {
        spawn_worker();
    }
}

void ConcurrencyLimiter::spawn_worker() {
    reap_workers();
    const std::size_t index = next_worker_index_++;
    auto finished = std::make_shared<std::atomic<bool>>(false);
    live_workers_.fetch_add(1, std::memory_order_acq_rel);
    workers_.push_back(Worker{
            .thread = std::thread(&ConcurrencyLimiter::worker_function, this, index, finished),
            .finished = finished});
}

void ConcurrencyLimiter::reap_workers() {
    const auto retired =
            std::remove_if(workers_.begin(), workers_.end(), [](Worker &worker) {
                if (!worker.finished->load(std::memory_order_acquire)) {
                    return false;
                }
                if (worker.thread.joinable()) {
                    worker.thread.join();
                }
                return true;
            });
    workers_.erase(retired, workers_.end());
}

void ConcurrencyLimiter::worker_function(
        const std::size_t worker_index, const std::shared_ptr<std::atomic<bool>> finished) {
    CD_LOGC_TRACE_L1(SchedLog::Limiter, "Worker {} starting", worker_index);

    while (true) {
        Job job{};
        {
            std::unique_lock<std::mutex> lock(jobs_mutex_);
            jobs_cv_.wait(lock, [this] {
                return stop_flag_.load(std::memory_order_acquire) || !jobs_.empty();
            });
            if (stop_flag_.load(std::memory_order_acquire)) {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        // A replacement was spawned for this job's slot, so this worker retires
        if (job.abandoned->load(std::memory_order_acquire)) {
            CD_LOGC_TRACE_L1(
                    SchedLog::Limiter,
                    "Worker {} retiring, '{}' abandoned before start",
                    worker_index,
                    job.context.task_id);
            break;
        }

        Completion completion{
                .task_id = job.context.task_id,
                .attempt = job.context.attempt,
                .result = {},
                .started_at = Time::now_ns(),
                .finished_at = Nanos{0}};
        completion.result = invoke_executor(executor_, job.context);
        completion.finished_at = Time::now_ns();

        if (job.abandoned->load(std::memory_order_acquire)) {
            CD_LOGC_TRACE_L1(
                    SchedLog::Limiter,
                    "Worker {} retiring after abandoned '{}' attempt {}",
                    worker_index,
                    job.context.task_id,
                    job.context.attempt);
            break;
        }

        {
            const std::lock_guard<std::mutex> lock(completions_mutex_);
            completions_.push_back(std::move(completion));
        }
        if (on_event_) {
            on_event_();
        }
    }

    live_workers_.fetch_sub(1, std::memory_order_acq_rel);
    finished->store(true, std::memory_order_release);
    CD_LOGC_TRACE_L1(SchedLog::Limiter, "Worker {} stopping", worker_index);
}

} // namespace conductor::sched
