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
 * @file workflow.hpp
 * @brief Workflow orchestrator: dispatch loop, lifecycle control and queries
 */

#ifndef CONDUCTOR_SCHED_WORKFLOW_HPP
#define CONDUCTOR_SCHED_WORKFLOW_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include "log/log_macros.hpp"
#include "sched/concurrency_limiter.hpp"
#include "sched/dependency_graph.hpp"
#include "sched/ready_queue.hpp"
#include "sched/retry_controller.hpp"
#include "sched/snapshot.hpp"
#include "sched/task.hpp"
#include "sched/time.hpp"
#include "sched/workflow_config.hpp"

namespace conductor::sched {

/**
 * Task counts per status
 */
struct QueueStats final {
    std::size_t total{0};
    std::size_t pending{0};
    std::size_t ready{0};
    std::size_t running{0};
    std::size_t retry_pending{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t blocked{0};
    std::size_t cancelled{0};
    std::size_t queue_size{0};     //!< Tasks queued for dispatch
    std::size_t max_concurrent{0}; //!< Slot budget of the workflow
};

/**
 * Result of processing a workflow
 */
struct WorkflowSummary final {
    std::string workflow_id;
    WorkflowStatus status{WorkflowStatus::Pending};
    QueueStats stats;
    std::vector<std::string> root_cause_ids; //!< Failed tasks and the upstream causes of blocks
    std::vector<std::string> blocked_ids;
    std::vector<std::string> cancelled_ids;
    Nanos elapsed{0}; //!< Time spent in the last process_queue call

    /**
     * One line human readable description
     *
     * @return Summary message
     */
    [[nodiscard]] std::string message() const;
};

class Workflow;

/**
 * Fluent builder for Workflow
 *
 * Values start from the WorkflowConfig defaults; build() validates them.
 */
class WorkflowBuilder final {
public:
    explicit WorkflowBuilder(std::string workflow_id);

    /**
     * Replace every setting with a loaded configuration
     *
     * The workflow id given to Workflow::create() wins over the one in the
     * configuration unless it is empty.
     *
     * @param[in] config Configuration to apply
     * @return Reference to this builder for chaining
     */
    WorkflowBuilder &config(WorkflowConfig config);

    WorkflowBuilder &strategy(WorkflowStrategy strategy);
    WorkflowBuilder &max_concurrent(std::size_t max_concurrent);
    WorkflowBuilder &continue_on_failure(bool enabled = true);
    WorkflowBuilder &retry_policy(RetryPolicy policy);
    WorkflowBuilder &max_attempts(std::uint32_t attempts);

    /**
     * Set exponential backoff parameters
     *
     * @param[in] base Delay after the first failure
     * @param[in] multiplier Growth factor per attempt
     * @param[in] max_backoff Upper bound for any delay
     * @return Reference to this builder for chaining
     */
    template <typename Rep1, typename Period1, typename Rep2, typename Period2>
    WorkflowBuilder &backoff(
            std::chrono::duration<Rep1, Period1> base,
            const double multiplier,
            std::chrono::duration<Rep2, Period2> max_backoff) {
        config_.retry.backoff_base = std::chrono::duration_cast<Nanos>(base);
        config_.retry.backoff_multiplier = multiplier;
        config_.retry.max_backoff = std::chrono::duration_cast<Nanos>(max_backoff);
        return *this;
    }

    template <typename Rep, typename Period>
    WorkflowBuilder &default_timeout(std::chrono::duration<Rep, Period> timeout) {
        config_.default_timeout = std::chrono::duration_cast<Nanos>(timeout);
        return *this;
    }

    WorkflowBuilder &snapshot_path(std::filesystem::path path);

    template <typename Rep, typename Period>
    WorkflowBuilder &snapshot_interval(std::chrono::duration<Rep, Period> interval) {
        config_.snapshot_interval = std::chrono::duration_cast<Nanos>(interval);
        return *this;
    }

    template <typename Rep, typename Period>
    WorkflowBuilder &idle_poll(std::chrono::duration<Rep, Period> interval) {
        config_.idle_poll = std::chrono::duration_cast<Nanos>(interval);
        return *this;
    }

    WorkflowBuilder &adaptive_counts_degraded_tasks(bool enabled);

    /**
     * Build the workflow
     *
     * @return Workflow in Pending status
     * @throws std::invalid_argument if the configuration is invalid
     */
    [[nodiscard]] std::unique_ptr<Workflow> build() const;

private:
    WorkflowConfig config_;
};

/**
 * Dependency aware task queue with bounded parallel execution
 *
 * process_queue() turns the calling thread into the coordinating loop: it is
 * the only writer of task status, the ready queue and slot accounting while
 * it runs. Submissions, cancellation, pause and queries may come from any
 * thread; they take the state lock briefly and wake the loop.
 *
 * Callbacks run on the loop thread without the state lock held.
 */
class Workflow final {
public:
    using TaskCallback = std::function<void(const TaskRecord &)>;

    /**
     * Start building a workflow
     *
     * @param[in] workflow_id Workflow identifier
     * @return Builder for chaining
     */
    [[nodiscard]] static WorkflowBuilder create(std::string workflow_id);

    /**
     * Create workflow from validated settings
     *
     * @param[in] config Workflow settings
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit Workflow(WorkflowConfig config);

    ~Workflow();

    Workflow(const Workflow &) = delete;
    Workflow &operator=(const Workflow &) = delete;
    Workflow(Workflow &&) = delete;
    Workflow &operator=(Workflow &&) = delete;

    /**
     * Submit a task
     *
     * @param[in] descriptor Task description
     * @return Empty code if accepted, otherwise WorkflowTerminal or the
     * validation error from the dependency graph
     */
    [[nodiscard]] std::error_code add_task(TaskDescriptor descriptor);

    /**
     * Submit several tasks atomically
     *
     * @param[in] batch Task descriptions, may depend on each other
     * @return Empty code if every task was accepted, otherwise the first
     * rejection reason and no task is added
     */
    [[nodiscard]] std::error_code add_tasks(std::vector<TaskDescriptor> batch);

    /**
     * Cancel a single task
     *
     * Waiting tasks are cancelled at once. A running task has its token
     * signalled and its slot released by the loop.
     *
     * @param[in] task_id Task to cancel
     * @return Empty code on success, TaskNotFound or InvalidTransition otherwise
     */
    [[nodiscard]] std::error_code cancel_task(std::string_view task_id);

    /**
     * Run the coordinating loop on the calling thread
     *
     * Returns when every task is terminal, when the workflow is cancelled, or
     * when it is paused and in-flight attempts have drained. Calling it again
     * after resume() continues the workflow.
     *
     * @param[in] executor Executor run by the worker threads
     * @return Summary of the workflow state on return
     * @throws std::invalid_argument if executor is empty
     * @throws std::logic_error if the loop is already running
     */
    WorkflowSummary process_queue(Executor executor);

    template <typename Func>
        requires ValidExecutor<Func> && (!std::is_same_v<std::decay_t<Func>, Executor>)
    WorkflowSummary process_queue(Func &&func) {
        return process_queue(make_executor(std::forward<Func>(func)));
    }

    /**
     * Stop dequeuing new tasks, running tasks finish
     *
     * @return Empty code on success, WorkflowTerminal or InvalidTransition otherwise
     */
    [[nodiscard]] std::error_code pause();

    /**
     * Resume dequeuing after pause()
     *
     * @return Empty code on success, WorkflowTerminal or InvalidTransition otherwise
     */
    [[nodiscard]] std::error_code resume();

    /**
     * Cancel the workflow
     *
     * Waiting tasks become Cancelled at once; running tasks are signalled and
     * cancelled by the loop. Terminal.
     *
     * @return Empty code on success, WorkflowTerminal if already finished
     */
    [[nodiscard]] std::error_code cancel();

    [[nodiscard]] std::optional<TaskStatus> get_task_status(std::string_view task_id) const;
    [[nodiscard]] std::optional<TaskRecord> get_task(std::string_view task_id) const;
    [[nodiscard]] QueueStats get_queue_stats() const;
    [[nodiscard]] WorkflowStatus get_workflow_status() const;
    [[nodiscard]] WorkflowSummary get_summary() const;

    [[nodiscard]] std::vector<TaskRecord> get_tasks_by_status(TaskStatus status) const;
    [[nodiscard]] std::vector<TaskRecord> get_tasks_by_tag(std::string_view tag) const;

    /**
     * Get the retry history of a task
     *
     * @param[in] task_id Task to summarize
     * @return Summary, or nullopt if the task is unknown
     */
    [[nodiscard]] std::optional<RetrySummary> get_retry_summary(std::string_view task_id) const;

    /**
     * Group tasks by dependency generation
     *
     * @return Task ids that could run in parallel, one group per generation
     */
    [[nodiscard]] std::vector<std::vector<std::string>> parallel_groups() const;

    [[nodiscard]] std::vector<std::string> topological_order() const;

    /**
     * Remove succeeded tasks that no unfinished task depends on
     *
     * @return Number of tasks removed
     */
    std::size_t clear_completed();

    void on_task_complete(TaskCallback callback);
    void on_task_failed(TaskCallback callback);

    /**
     * Capture the current state
     *
     * @return Snapshot of every task and the workflow status
     */
    [[nodiscard]] QueueSnapshot snapshot() const;

    /**
     * Replace the workflow state with a snapshot
     *
     * Running and Ready tasks come back as Pending, with the interrupted
     * attempt not counted. A Running workflow comes back as Pending, Paused
     * and terminal workflows keep their status.
     *
     * @param[in] snapshot Snapshot of this workflow
     * @return Empty code on success, InvalidParameter for another workflow id
     * or while processing, SnapshotParseFailed for an inconsistent task graph
     */
    [[nodiscard]] std::error_code restore(QueueSnapshot snapshot);

    /**
     * Write a snapshot to the configured path
     *
     * @return Empty code on success, InvalidParameter when no path is configured,
     * otherwise the file error
     */
    [[nodiscard]] std::error_code save_snapshot() const;

    /**
     * Restore from the configured snapshot path
     *
     * @return Empty code on success, InvalidParameter when no path is configured,
     * FileOpenFailed when the file does not exist, otherwise the restore error
     */
    [[nodiscard]] std::error_code restore_from_snapshot_file();

    [[nodiscard]] const WorkflowConfig &config() const noexcept { return config_; }
    [[nodiscard]] const std::string &id() const noexcept { return config_.workflow_id; }

private:
    /// Callback to fire once the state lock is released
    struct Notification final {
        bool failed{false};
        TaskRecord record;
    };

    /// Work collected during one loop tick
    struct TickOutput final {
        std::vector<Notification> notifications;
        std::optional<QueueSnapshot> snapshot;
        bool exit{false};
        Nanos wake_at{0};
    };

    void run_loop(Nanos loop_start);
    TickOutput tick(Nanos now);

    // Tick steps, called with the state lock held exclusively
    void apply_cancellations(Nanos now);
    void harvest_completions(Nanos now, std::vector<Notification> &notifications);
    void expire_attempts(Nanos now, std::vector<Notification> &notifications);
    void block_dependents(Nanos now, std::vector<Notification> &notifications);
    void promote_ready(Nanos now);
    void dispatch_ready(Nanos now);
    [[nodiscard]] bool evaluate_outcome();
    [[nodiscard]] Nanos next_wake(Nanos now) const;

    /// Mark a running task cancelled after its slot was released
    void mark_cancelled(TaskRecord &record, Nanos now);

    [[nodiscard]] std::size_t effective_concurrency() const;
    void set_status(WorkflowStatus status);

    [[nodiscard]] QueueStats compute_stats() const;
    [[nodiscard]] WorkflowSummary build_summary() const;
    [[nodiscard]] QueueSnapshot build_snapshot() const;
    [[nodiscard]] TaskDefaults task_defaults() const;

    /// Snapshot of an unpersisted lifecycle change while no loop runs, caller holds state_mutex_
    [[nodiscard]] std::optional<QueueSnapshot> take_idle_snapshot();
    void persist_snapshot(const QueueSnapshot &snapshot) const;

    void notify();
    void fire(const std::vector<Notification> &notifications) const;

    WorkflowConfig config_;         //!< Validated settings
    RetryController retry_;         //!< Retry policy
    DependencyGraph graph_;         //!< Task registry
    ReadyQueue ready_queue_;        //!< Tasks ready for dispatch
    ConcurrencyLimiter limiter_;    //!< Slots and workers

    mutable std::shared_mutex state_mutex_; //!< Guards all task and workflow state
    WorkflowStatus status_{WorkflowStatus::Pending};
    bool loop_active_{false};
    bool status_changed_{false};             //!< Lifecycle change not yet persisted
    std::vector<std::string> cancel_requests_; //!< Running tasks to cancel
    Nanos last_elapsed_{0};
    Nanos last_snapshot_at_{0};

    mutable std::mutex snapshot_write_mutex_; //!< Serializes snapshot file writes

    TaskCallback on_complete_;
    TaskCallback on_failed_;

    std::mutex event_mutex_;
    std::condition_variable event_cv_;
    bool event_pending_{false};

    std::atomic<bool> cancel_requested_{false};
};

} // namespace conductor::sched

CD_LOGGABLE_DEFERRED_FORMAT(
        conductor::sched::QueueStats,
        "total: {}, pending: {}, ready: {}, running: {}, retry_pending: {}, succeeded: {}, "
        "failed: {}, blocked: {}, cancelled: {}",
        obj.total,
        obj.pending,
        obj.ready,
        obj.running,
        obj.retry_pending,
        obj.succeeded,
        obj.failed,
        obj.blocked,
        obj.cancelled)

#endif // CONDUCTOR_SCHED_WORKFLOW_HPP
