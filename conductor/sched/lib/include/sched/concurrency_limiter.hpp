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
 * @file concurrency_limiter.hpp
 * @brief Slot accounting and worker threads for task attempts
 */

#ifndef CONDUCTOR_SCHED_CONCURRENCY_LIMITER_HPP
#define CONDUCTOR_SCHED_CONCURRENCY_LIMITER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <parallel_hashmap/phmap.h>

#include "sched/task.hpp"
#include "sched/time.hpp"

namespace conductor::sched {

/**
 * Request to run one attempt of a task
 */
struct DispatchRequest final {
    std::string task_id;                        //!< Task to run
    std::uint32_t attempt{1};                   //!< 1-based attempt number
    std::shared_ptr<const TaskPayload> payload; //!< Payload handed to the executor
    Nanos timeout{0};                           //!< Per attempt timeout, zero for none
};

/**
 * Finished attempt reported by a worker
 */
struct Completion final {
    std::string task_id;
    std::uint32_t attempt{0};
    ExecutionResult result;
    Nanos started_at{0};
    Nanos finished_at{0};
};

/**
 * Attempt abandoned because its deadline passed
 */
struct Expiry final {
    std::string task_id;
    std::uint32_t attempt{0};
    Nanos deadline{0};
};

/**
 * Bounded executor slots backed by a pool of worker threads
 *
 * The coordinating loop is the only caller of the slot accounting methods
 * (dispatch, drain_completions, expire_deadlines, cancel). Workers only touch
 * the job and completion queues.
 *
 * When an attempt is abandoned (timeout or cancel) its slot is released at
 * once. A job still waiting in the queue is dropped; a job already picked up
 * keeps its worker, so a replacement worker is spawned. Only the worker holding
 * the abandoned job retires, after its executor returns, and its late
 * completion is discarded. Retired threads are joined on the next spawn.
 */
class ConcurrencyLimiter final {
public:
    /**
     * Create limiter
     *
     * @param[in] max_concurrent Number of slots, must be at least one
     * @param[in] on_event Called by workers after queueing a completion
     * @throws std::invalid_argument if max_concurrent is zero
     */
    ConcurrencyLimiter(std::size_t max_concurrent, std::function<void()> on_event);

    ~ConcurrencyLimiter();

    ConcurrencyLimiter(const ConcurrencyLimiter &) = delete;
    ConcurrencyLimiter &operator=(const ConcurrencyLimiter &) = delete;
    ConcurrencyLimiter(ConcurrencyLimiter &&) = delete;
    ConcurrencyLimiter &operator=(ConcurrencyLimiter &&) = delete;

    /**
     * Start worker threads
     *
     * @param[in] executor Executor run by every worker
     * @throws std::invalid_argument if executor is empty
     */
    void start(Executor executor);

    /**
     * Signal every in-flight attempt, stop and join all workers
     *
     * Blocks until executors that ignore cancellation return. The limiter can
     * be started again afterwards.
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_; }

    /**
     * Hand an attempt to the workers
     *
     * @param[in] request Attempt to run
     * @param[in] now Start timestamp used for the deadline
     * @return false if all slots are taken or the task is already in flight
     */
    bool dispatch(DispatchRequest request, Nanos now);

    /**
     * Collect finished attempts and release their slots
     *
     * Completions of abandoned attempts are dropped.
     *
     * @return Accepted completions in arrival order
     */
    [[nodiscard]] std::vector<Completion> drain_completions();

    /**
     * Abandon attempts whose deadline has passed
     *
     * @param[in] now Current time
     * @return Abandoned attempts
     */
    [[nodiscard]] std::vector<Expiry> expire_deadlines(Nanos now);

    /**
     * Signal cancellation of an in-flight task and release its slot
     *
     * @param[in] task_id Task to cancel
     * @return true if the task was in flight
     */
    bool cancel(std::string_view task_id);

    /**
     * Signal every in-flight attempt without releasing slots
     *
     * Executors that honour the token return promptly.
     */
    void signal_all();

    /**
     * Get the earliest deadline among in-flight attempts
     *
     * @return Earliest deadline, or nullopt if no attempt has a timeout
     */
    [[nodiscard]] std::optional<Nanos> next_deadline() const;

    [[nodiscard]] bool is_in_flight(std::string_view task_id) const;
    [[nodiscard]] std::size_t in_flight() const noexcept { return in_flight_.size(); }
    [[nodiscard]] std::size_t max_concurrent() const noexcept { return max_concurrent_; }

    [[nodiscard]] std::size_t available() const noexcept {
        return in_flight_.size() < max_concurrent_ ? max_concurrent_ - in_flight_.size() : 0;
    }

    /// Number of worker threads currently alive, including abandoned ones
    [[nodiscard]] std::size_t live_workers() const noexcept {
        return live_workers_.load(std::memory_order_acquire);
    }

    /// Number of thread handles held, retired threads not yet joined included
    [[nodiscard]] std::size_t thread_handles() const noexcept { return workers_.size(); }

private:
    using AbandonFlag = std::shared_ptr<std::atomic<bool>>;

    struct Job final {
        ExecutionContext context;
        AbandonFlag abandoned; //!< Set when the slot was released without a result
    };

    struct Slot final {
        std::uint32_t attempt{0};
        std::shared_ptr<CancellationToken> token;
        AbandonFlag abandoned;
        Nanos deadline{0};
    };

    struct Worker final {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void worker_function(std::size_t worker_index, std::shared_ptr<std::atomic<bool>> finished);
    void spawn_worker();

    /// Join threads of retired workers
    void reap_workers();

    /// Release the slot of an attempt that is still running and replace its worker
    void abandon(const std::string &task_id);

    std::size_t max_concurrent_{1};  //!< Slot budget
    std::function<void()> on_event_; //!< Completion notifier
    Executor executor_;              //!< Executor run by workers
    bool running_{false};            //!< Workers started

    phmap::flat_hash_map<std::string, Slot> in_flight_; //!< Occupied slots by task id

    std::mutex jobs_mutex_;
    std::condition_variable jobs_cv_;
    std::deque<Job> jobs_;

    std::mutex completions_mutex_;
    std::vector<Completion> completions_;

    std::vector<Worker> workers_;
    std::size_t next_worker_index_{0};
    std::atomic<std::size_t> live_workers_{0};
    std::atomic<bool> stop_flag_{false};
};

} // namespace conductor::sched

#endif // CONDUCTOR_SCHED_CONCURRENCY_LIMITER_HPP
