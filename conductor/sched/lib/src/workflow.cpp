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
 * @file workflow.cpp
 * @brief Workflow orchestrator implementation
 */

#include <algorithm>    // for min, max, find
#include <chrono>       // for duration_cast, milliseconds
#include <cstddef>      // for size_t
#include <cstdint>      // for uint32_t
#include <exception>    // for exception
#include <filesystem>   // for path, exists
#include <format>       // for format
#include <memory>       // for make_unique, make_shared, unique_ptr
#include <mutex>        // for unique_lock, lock_guard
#include <optional>     // for optional, nullopt
#include <shared_mutex> // for shared_lock
#include <stdexcept>    // for invalid_argument, logic_error
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move
#include <vector>       // for vector

#include <parallel_hashmap/phmap.h> // for flat_hash_set

#include <wise_enum.h> // for to_string

#include "log/log_macros.hpp"
#include "sched/sched_errors.hpp"
#include "sched/sched_log.hpp"
#include "sched/snapshot.hpp"
#include "sched/task.hpp"
#include "sched/time.hpp"
#include "sched/workflow.hpp"
#include "sched/workflow_config.hpp"

namespace conductor::sched {

namespace {

WorkflowConfig validated(WorkflowConfig config) {
    config.validate();
    return config;
}

std::int64_t to_millis(const Nanos duration) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

} // namespace

std::string WorkflowSummary::message() const {
    return std::format(
            "Workflow '{}' {}: {}/{} succeeded, {} failed, {} blocked, {} cancelled in {} ms",
            workflow_id,
            ::wise_enum::to_string(status),
            stats.succeeded,
            stats.total,
            stats.failed,
            stats.blocked,
            stats.cancelled,
            to_millis(elapsed));
}

WorkflowBuilder::WorkflowBuilder(std::string workflow_id) {
    config_.workflow_id = std::move(workflow_id);
}

WorkflowBuilder &WorkflowBuilder::config(WorkflowConfig config) {
    std::string workflow_id = std::move(config_.workflow_id);
    config_ = std::move(config);
    if (!workflow_id.empty()) {
        config_.workflow_id = std::move(workflow_id);
    }
    return *this;
}

WorkflowBuilder &WorkflowBuilder::strategy(const WorkflowStrategy strategy) {
    config_.strategy = strategy;
    return *this;
}

WorkflowBuilder &WorkflowBuilder::max_concurrent(const std::size_t max_concurrent) {
    config_.max_concurrent = max_concurrent;
    return *this;
}

WorkflowBuilder &WorkflowBuilder::continue_on_failure(const bool enabled) {
    config_.continue_on_failure = enabled;
    return *this;
}

WorkflowBuilder &WorkflowBuilder::retry_policy(RetryPolicy policy) {
    config_.retry = std::move(policy);
    return *this;
}

WorkflowBuilder &WorkflowBuilder::max_attempts(const std::uint32_t attempts) {
    config_.retry.max_attempts = attempts;
    return *this;
}

WorkflowBuilder &WorkflowBuilder::snapshot_path(std::filesystem::path path) {
    config_.snapshot_path = std::move(path);
    return *this;
}

WorkflowBuilder &WorkflowBuilder::adaptive_counts_degraded_tasks(const bool enabled) {
    config_.adaptive_counts_degraded_tasks = enabled;
    return *this;
}

std::unique_ptr<Workflow> WorkflowBuilder::build() const {
    return std::make_unique<Workflow>(config_);
}

WorkflowBuilder Workflow::create(std::string workflow_id) {
    return WorkflowBuilder{std::move(workflow_id)};
}

Workflow::Workflow(WorkflowConfig config)
        : config_{validated(std::move(config))}, retry_{config_.retry},
          limiter_{config_.max_concurrent, [this] { notify(); }} {
    CD_LOGC_INFO(
            SchedLog::Workflow,
            "Created workflow '{}' strategy={} max_concurrent={} continue_on_failure={}",
            config_.workflow_id,
            ::wise_enum::to_string(config_.strategy),
            config_.max_concurrent,
            config_.continue_on_failure);
}

Workflow::~Workflow() = default;

std::error_code Workflow::add_task(TaskDescriptor descriptor) {
    std::error_code result{};
    {
        const std::unique_lock lock(state_mutex_);
        if (is_terminal(status_)) {
            CD_LOGC_WARN(
                    SchedLog::Workflow,
                    "Rejected task '{}': workflow '{}' is {}",
                    descriptor.id,
                    config_.workflow_id,
                    ::wise_enum::to_string(status_));
            return SchedErrc::WorkflowTerminal;
        }
        result = graph_.add_task(std::move(descriptor), task_defaults(), Time::now_ns());
    }
    if (!result) {
        notify();
    }
    return result;
}

std::error_code Workflow::add_tasks(std::vector<TaskDescriptor> batch) {
    std::error_code result{};
    {
        const std::unique_lock lock(state_mutex_);
        if (is_terminal(status_)) {
            CD_LOGC_WARN(
                    SchedLog::Workflow,
                    "Rejected batch of {} tasks: workflow '{}' is {}",
                    batch.size(),
                    config_.workflow_id,
                    ::wise_enum::to_string(status_));
            return SchedErrc::WorkflowTerminal;
        }
        result = graph_.add_tasks(std::move(batch), task_defaults(), Time::now_ns());
    }
    if (!result) {
        notify();
    }
    return result;
}

std::error_code Workflow::cancel_task(const std::string_view task_id) {
    {
        const std::unique_lock lock(state_mutex_);
        if (is_terminal(status_)) {
            return SchedErrc::WorkflowTerminal;
        }
        TaskRecord *record = graph_.find(task_id);
        if (record == nullptr) {
            return SchedErrc::TaskNotFound;
        }

        if (record->status == TaskStatus::Running) {
            if (std::find(cancel_requests_.begin(), cancel_requests_.end(), task_id) ==
                cancel_requests_.end()) {
                cancel_requests_.emplace_back(task_id);
            }
        } else {
            const bool was_ready = record->status == TaskStatus::Ready;
            if (const auto ec = graph_.transition(task_id, TaskStatus::Cancelled); ec) {
                return ec;
            }
            record->failure_kind = FailureKind::Cancellation;
            record->error = "Cancelled by request";
            record->wake_at = Nanos{0};
            record->finished_at = Time::now_ns();
            if (was_ready) {
                ready_queue_.erase(task_id);
            }
        }
        CD_LOGC_INFO(SchedLog::Workflow, "Cancel requested for task '{}'", task_id);
    }
    notify();
    return {};
}

WorkflowSummary Workflow::process_queue(Executor executor) {
    if (!executor) {
        log_and_throw<std::invalid_argument>(SchedLog::Workflow, "Executor must not be empty");
    }

    const Nanos loop_start = Time::now_ns();
    {
        const std::unique_lock lock(state_mutex_);
        if (loop_active_) {
            log_and_throw<std::logic_error>(
                    SchedLog::Workflow,
                    "Workflow '{}' is already being processed",
                    config_.workflow_id);
        }
        if (is_terminal(status_)) {
            CD_LOGC_INFO(
                    SchedLog::Workflow,
                    "Workflow '{}' already {}, nothing to process",
                    config_.workflow_id,
                    ::wise_enum::to_string(status_));
            return build_summary();
        }
        if (status_ == WorkflowStatus::Pending) {
            set_status(WorkflowStatus::Running);
        }
        loop_active_ = true;
        last_snapshot_at_ = loop_start;
    }

    try {
        limiter_.start(std::move(executor));
        run_loop(loop_start);
    } catch (const std::exception &e) {
        CD_LOGC_ERROR(
                SchedLog::Workflow,
                "Workflow '{}' loop aborted: {}",
                config_.workflow_id,
                e.what());
        limiter_.stop();
        const std::unique_lock lock(state_mutex_);
        loop_active_ = false;
        throw;
    }
    limiter_.stop();

    WorkflowSummary summary{};
    std::optional<QueueSnapshot> late_change;
    {
        const std::unique_lock lock(state_mutex_);
        loop_active_ = false;
        last_elapsed_ = Time::now_ns() - loop_start;
        // A lifecycle call that raced the final tick is persisted here
        late_change = take_idle_snapshot();
        summary = build_summary();
    }
    if (late_change.has_value()) {
        persist_snapshot(late_change.value());
    }
    CD_LOGC_INFO(SchedLog::Workflow, "{}", summary.message());
    return summary;
}

void Workflow::run_loop(const Nanos loop_start) {
    CD_LOGC_DEBUG(
            SchedLog::Workflow,
            "Workflow '{}' loop started at {}",
            config_.workflow_id,
            Time::to_iso8601(loop_start));

    while (true) {
        const TickOutput output = tick(Time::now_ns());

        fire(output.notifications);

        if (output.snapshot.has_value()) {
            persist_snapshot(output.snapshot.value());
        }

        if (output.exit) {
            break;
        }

        std::unique_lock<std::mutex> event_lock(event_mutex_);
        const Nanos now = Time::now_ns();
        if (output.wake_at > now) {
            event_cv_.wait_for(event_lock, output.wake_at - now, [this] { return event_pending_; });
        }
        event_pending_ = false;
    }
}

Workflow::TickOutput Workflow::tick(const Nanos now) {
    TickOutput output{};
    const std::unique_lock lock(state_mutex_);

    apply_cancellations(now);
    harvest_completions(now, output.notifications);
    expire_attempts(now, output.notifications);
    if (!config_.continue_on_failure) {
        block_dependents(now, output.notifications);
    }
    promote_ready(now);
    if (status_ == WorkflowStatus::Running) {
        dispatch_ready(now);
    }

    output.exit = evaluate_outcome();
    output.wake_at = next_wake(now);

    if (!config_.snapshot_path.empty() &&
        (status_changed_ || output.exit || now - last_snapshot_at_ >= config_.snapshot_interval)) {
        output.snapshot = build_snapshot();
        status_changed_ = false;
        last_snapshot_at_ = now;
    }
    return output;
}

void Workflow::apply_cancellations(const Nanos now) {
    if (cancel_requested_.exchange(false, std::memory_order_acq_rel)) {
        graph_.update_each([this, now](TaskRecord &record) {
            if (record.status == TaskStatus::Running) {
                limiter_.cancel(record.id);
                mark_cancelled(record, now);
            }
        });
    }

    for (const auto &task_id : cancel_requests_) {
        TaskRecord *record = graph_.find(task_id);
        if (record == nullptr || record->status != TaskStatus::Running) {
            continue;
        }
        limiter_.cancel(task_id);
        mark_cancelled(*record, now);
    }
    cancel_requests_.clear();
}

void Workflow::mark_cancelled(TaskRecord &record, const Nanos now) {
    if (const auto ec = graph_.transition(record.id, TaskStatus::Cancelled); ec) {
        CD_LOGC_WARN(
                SchedLog::Workflow,
                "Task '{}' not cancelled: {}",
                record.id,
                get_error_name(ec));
        return;
    }
    record.failure_kind = FailureKind::Cancellation;
    record.error = status_ == WorkflowStatus::Cancelled ? "Workflow cancelled"
                                                        : "Cancelled by request";
    record.finished_at = now;
    CD_LOGC_INFO(
            SchedLog::Workflow,
            "Task '{}' cancelled during attempt {}",
            record.id,
            record.attempts);
}

void Workflow::harvest_completions(const Nanos now, std::vector<Notification> &notifications) {
    for (auto &completion : limiter_.drain_completions()) {
        TaskRecord *record = graph_.find(completion.task_id);
        if (record == nullptr || record->status != TaskStatus::Running) {
            CD_LOGC_DEBUG(
                    SchedLog::Workflow,
                    "Ignoring completion of '{}', task no longer running",
                    completion.task_id);
            continue;
        }

        if (completion.result.is_success()) {
            if (const auto ec = graph_.transition(record->id, TaskStatus::Succeeded); ec) {
                continue;
            }
            record->result = std::move(completion.result.output);
            record->error.clear();
            record->failure_kind = FailureKind::None;
            record->finished_at = completion.finished_at;
            CD_LOGC_DEBUG(
                    SchedLog::Workflow,
                    "Task '{}' succeeded on attempt {} in {} ms",
                    record->id,
                    record->attempts,
                    to_millis(completion.finished_at - completion.started_at));
            notifications.push_back(Notification{.failed = false, .record = *record});
            continue;
        }

        const RetryDecision decision = retry_.on_failure(
                *record,
                FailureKind::Execution,
                std::move(completion.result.error),
                completion.result.retryable,
                now);
        if (!decision.retry) {
            notifications.push_back(Notification{.failed = true, .record = *record});
        }
    }
}

void Workflow::expire_attempts(const Nanos now, std::vector<Notification> &notifications) {
    for (const auto &expiry : limiter_.expire_deadlines(now)) {
        TaskRecord *record = graph_.find(expiry.task_id);
        if (record == nullptr || record->status != TaskStatus::Running ||
            record->attempts != expiry.attempt) {
            continue;
        }
        const RetryDecision decision = retry_.on_failure(
                *record,
                FailureKind::Timeout,
                std::format(
                        "Task '{}' timed out after {} ms", record->id, to_millis(record->timeout)),
                true,
                now);
        if (!decision.retry) {
            notifications.push_back(Notification{.failed = true, .record = *record});
        }
    }
}

void Workflow::block_dependents(const Nanos now, std::vector<Notification> &notifications) {
    for (const auto &task_id : graph_.propagate_failures(now)) {
        if (const TaskRecord *record = graph_.find(task_id); record != nullptr) {
            notifications.push_back(Notification{.failed = true, .record = *record});
        }
    }
}

void Workflow::promote_ready(const Nanos now) {
    for (const auto &task_id : graph_.ready_set(now, config_.continue_on_failure)) {
        if (const auto ec = graph_.transition(task_id, TaskStatus::Ready); ec) {
            continue;
        }
        TaskRecord *record = graph_.find(task_id);
        record->wake_at = Nanos{0};
        ready_queue_.push(ReadyEntry{
                .priority = record->priority, .sequence = record->sequence, .task_id = task_id});
    }
}

void Workflow::dispatch_ready(const Nanos now) {
    const std::size_t limit = effective_concurrency();
    while (limiter_.in_flight() < limit) {
        const auto entry = ready_queue_.pop();
        if (!entry.has_value()) {
            break;
        }
        TaskRecord *record = graph_.find(entry->task_id);
        if (record == nullptr || record->status != TaskStatus::Ready ||
            limiter_.is_in_flight(entry->task_id)) {
            continue;
        }
        if (const auto ec = graph_.transition(entry->task_id, TaskStatus::Running); ec) {
            continue;
        }

        ++record->attempts;
        record->started_at = now;
        record->finished_at = Nanos{0};

        DispatchRequest request{
                .task_id = record->id,
                .attempt = record->attempts,
                .payload = std::make_shared<const TaskPayload>(record->payload),
                .timeout = record->timeout};
        if (!limiter_.dispatch(std::move(request), now)) {
            CD_LOGC_ERROR(
                    SchedLog::Workflow, "Limiter rejected dispatch of '{}'", record->id);
            static_cast<void>(retry_.on_failure(
                    *record, FailureKind::Execution, "Dispatch rejected by limiter", true, now));
            break;
        }
        CD_LOGC_DEBUG(
                SchedLog::Workflow,
                "Started '{}' attempt {}/{} priority={}",
                record->id,
                record->attempts,
                record->max_attempts,
                ::wise_enum::to_string(record->priority));
    }
}

std::size_t Workflow::effective_concurrency() const {
    switch (config_.strategy) {
    case WorkflowStrategy::Sequential:
        return 1;
    case WorkflowStrategy::Parallel:
        return config_.max_concurrent;
    case WorkflowStrategy::Adaptive:
        break;
    }

    std::size_t width = 0;
    graph_.for_each([this, &width](const TaskRecord &record) {
        if (record.status != TaskStatus::Ready) {
            return;
        }
        if (config_.adaptive_counts_degraded_tasks || !graph_.has_failed_dependency(record)) {
            ++width;
        }
    });
    return std::min(config_.max_concurrent, std::max<std::size_t>(1, width));
}

bool Workflow::evaluate_outcome() {
    if (limiter_.in_flight() > 0) {
        return false;
    }
    if (status_ == WorkflowStatus::Cancelled || status_ == WorkflowStatus::Paused) {
        return true;
    }

    bool all_terminal = true;
    bool all_succeeded = true;
    graph_.for_each([&all_terminal, &all_succeeded](const TaskRecord &record) {
        all_terminal = all_terminal && is_terminal(record.status);
        all_succeeded = all_succeeded && record.status == TaskStatus::Succeeded;
    });
    if (!all_terminal) {
        return false;
    }

    set_status(
            all_succeeded || config_.continue_on_failure ? WorkflowStatus::Completed
                                                         : WorkflowStatus::Failed);
    CD_LOGC_INFO(
            SchedLog::Workflow,
            "Workflow '{}' finished {}: {}",
            config_.workflow_id,
            ::wise_enum::to_string(status_),
            compute_stats());
    return true;
}

Nanos Workflow::next_wake(const Nanos now) const {
    Nanos wake = now + config_.idle_poll;
    graph_.for_each([&wake](const TaskRecord &record) {
        if (record.status == TaskStatus::RetryPending) {
            wake = std::min(wake, record.wake_at);
        }
    });
    if (const auto deadline = limiter_.next_deadline(); deadline.has_value()) {
        wake = std::min(wake, deadline.value());
    }
    if (!config_.snapshot_path.empty() && status_ == WorkflowStatus::Running) {
        wake = std::min(wake, last_snapshot_at_ + config_.snapshot_interval);
    }
    return wake;
}

std::error_code Workflow::pause() {
    std::optional<QueueSnapshot> idle;
    {
        const std::unique_lock lock(state_mutex_);
        if (is_terminal(status_)) {
            return SchedErrc::WorkflowTerminal;
        }
        if (status_ != WorkflowStatus::Running) {
            return SchedErrc::InvalidTransition;
        }
        set_status(WorkflowStatus::Paused);
        idle = take_idle_snapshot();
    }
    if (idle.has_value()) {
        persist_snapshot(idle.value());
    }
    notify();
    return {};
}

std::error_code Workflow::resume() {
    std::optional<QueueSnapshot> idle;
    {
        const std::unique_lock lock(state_mutex_);
        if (is_terminal(status_)) {
            return SchedErrc::WorkflowTerminal;
        }
        if (status_ != WorkflowStatus::Paused) {
            return SchedErrc::InvalidTransition;
        }
        set_status(WorkflowStatus::Running);
        idle = take_idle_snapshot();
    }
    if (idle.has_value()) {
        persist_snapshot(idle.value());
    }
    notify();
    return {};
}

std::error_code Workflow::cancel() {
    std::optional<QueueSnapshot> idle;
    {
        const std::unique_lock lock(state_mutex_);
        if (is_terminal(status_)) {
            return SchedErrc::WorkflowTerminal;
        }

        std::vector<std::string> waiting;
        graph_.for_each([&waiting](const TaskRecord &record) {
            if (record.status == TaskStatus::Pending || record.status == TaskStatus::Ready ||
                record.status == TaskStatus::RetryPending) {
                waiting.push_back(record.id);
            }
        });

        const Nanos now = Time::now_ns();
        std::size_t cancelled = 0;
        for (const auto &id : waiting) {
            if (const auto ec = graph_.transition(id, TaskStatus::Cancelled); ec) {
                CD_LOGC_WARN(
                        SchedLog::Workflow,
                        "Task '{}' not cancelled: {}",
                        id,
                        get_error_name(ec));
                continue;
            }
            TaskRecord *record = graph_.find(id);
            record->failure_kind = FailureKind::Cancellation;
            record->error = "Workflow cancelled";
            record->wake_at = Nanos{0};
            record->finished_at = now;
            ++cancelled;
        }
        ready_queue_.clear();
        set_status(WorkflowStatus::Cancelled);
        if (loop_active_) {
            cancel_requested_.store(true, std::memory_order_release);
        }
        CD_LOGC_INFO(
                SchedLog::Workflow,
                "Workflow '{}' cancelled, {} waiting tasks cancelled",
                config_.workflow_id,
                cancelled);
        idle = take_idle_snapshot();
    }
    if (idle.has_value()) {
        persist_snapshot(idle.value());
    }
    notify();
    return {};
}

std::optional<TaskStatus> Workflow::get_task_status(const std::string_view task_id) const {
    const std::shared_lock lock(state_mutex_);
    const TaskRecord *record = graph_.find(task_id);
    if (record == nullptr) {
        return std::nullopt;
    }
    return record->status;
}

std::optional<TaskRecord> Workflow::get_task(const std::string_view task_id) const {
    const std::shared_lock lock(state_mutex_);
    const TaskRecord *record = graph_.find(task_id);
    if (record == nullptr) {
        return std::nullopt;
    }
    return *record;
}

QueueStats Workflow::get_queue_stats() const {
    const std::shared_lock lock(state_mutex_);
    return compute_stats();
}

WorkflowStatus Workflow::get_workflow_status() const {
    const std::shared_lock lock(state_mutex_);
    return status_;
}

WorkflowSummary Workflow::get_summary() const {
    const std::shared_lock lock(state_mutex_);
    return build_summary();
}

std::vector<TaskRecord> Workflow::get_tasks_by_status(const TaskStatus status) const {
    std::vector<TaskRecord> matches;
    const std::shared_lock lock(state_mutex_);
    graph_.for_each([status, &matches](const TaskRecord &record) {
        if (record.status == status) {
            matches.push_back(record);
        }
    });
    return matches;
}

std::vector<TaskRecord> Workflow::get_tasks_by_tag(const std::string_view tag) const {
    std::vector<TaskRecord> matches;
    const std::shared_lock lock(state_mutex_);
    graph_.for_each([tag, &matches](const TaskRecord &record) {
        if (record.has_tag(tag)) {
            matches.push_back(record);
        }
    });
    return matches;
}

std::optional<RetrySummary> Workflow::get_retry_summary(const std::string_view task_id) const {
    const std::shared_lock lock(state_mutex_);
    const TaskRecord *record = graph_.find(task_id);
    if (record == nullptr) {
        return std::nullopt;
    }
    return RetryController::summarize(*record);
}

std::vector<std::vector<std::string>> Workflow::parallel_groups() const {
    const std::shared_lock lock(state_mutex_);
    return graph_.parallel_groups();
}

std::vector<std::string> Workflow::topological_order() const {
    const std::shared_lock lock(state_mutex_);
    return graph_.topological_order();
}

std::size_t Workflow::clear_completed() {
    const std::unique_lock lock(state_mutex_);
    const std::size_t removed = graph_.retire_succeeded();
    CD_LOGC_INFO(
            SchedLog::Workflow,
            "Workflow '{}' cleared {} completed tasks",
            config_.workflow_id,
            removed);
    return removed;
}

void Workflow::on_task_complete(TaskCallback callback) {
    const std::unique_lock lock(state_mutex_);
    on_complete_ = std::move(callback);
}

void Workflow::on_task_failed(TaskCallback callback) {
    const std::unique_lock lock(state_mutex_);
    on_failed_ = std::move(callback);
}

QueueSnapshot Workflow::snapshot() const {
    const std::shared_lock lock(state_mutex_);
    return build_snapshot();
}

std::error_code Workflow::restore(QueueSnapshot snapshot) {
    const std::unique_lock lock(state_mutex_);
    if (loop_active_) {
        CD_LOGC_ERROR(
                SchedLog::Workflow,
                "Cannot restore workflow '{}' while it is being processed",
                config_.workflow_id);
        return SchedErrc::InvalidParameter;
    }
    if (snapshot.workflow_id != config_.workflow_id) {
        CD_LOGC_ERROR(
                SchedLog::Workflow,
                "Snapshot of workflow '{}' cannot restore workflow '{}'",
                snapshot.workflow_id,
                config_.workflow_id);
        return SchedErrc::InvalidParameter;
    }

    std::size_t requeued = 0;
    for (auto &record : snapshot.tasks) {
        if (record.status == TaskStatus::Running) {
            // The interrupted attempt never reported, do not charge it
            record.status = TaskStatus::Pending;
            record.attempts = record.attempts > 0 ? record.attempts - 1 : 0;
            record.started_at = Nanos{0};
            ++requeued;
        } else if (record.status == TaskStatus::Ready) {
            record.status = TaskStatus::Pending;
        }
    }

    if (const auto ec = graph_.restore(
                std::move(snapshot.tasks),
                std::move(snapshot.retired_ids),
                snapshot.next_sequence);
        ec) {
        return ec;
    }

    ready_queue_.clear();
    cancel_requests_.clear();
    cancel_requested_.store(false, std::memory_order_release);
    status_ = snapshot.workflow_status == WorkflowStatus::Running ? WorkflowStatus::Pending
                                                                  : snapshot.workflow_status;
    status_changed_ = false;

    CD_LOGC_INFO(
            SchedLog::Workflow,
            "Restored workflow '{}' as {} with {} tasks ({} interrupted tasks requeued)",
            config_.workflow_id,
            ::wise_enum::to_string(status_),
            graph_.size(),
            requeued);
    return {};
}

std::error_code Workflow::save_snapshot() const {
    if (config_.snapshot_path.empty()) {
        CD_LOGC_WARN(
                SchedLog::Workflow,
                "Workflow '{}' has no snapshot path configured",
                config_.workflow_id);
        return SchedErrc::InvalidParameter;
    }
    const QueueSnapshot current = snapshot();
    const std::lock_guard<std::mutex> write_lock(snapshot_write_mutex_);
    return write_snapshot(current, config_.snapshot_path);
}

std::error_code Workflow::restore_from_snapshot_file() {
    if (config_.snapshot_path.empty()) {
        CD_LOGC_WARN(
                SchedLog::Workflow,
                "Workflow '{}' has no snapshot path configured",
                config_.workflow_id);
        return SchedErrc::InvalidParameter;
    }
    std::error_code exists_error{};
    if (!std::filesystem::exists(config_.snapshot_path, exists_error)) {
        CD_LOGC_WARN(
                SchedLog::Workflow,
                "Snapshot file '{}' not found",
                config_.snapshot_path.string());
        return SchedErrc::FileOpenFailed;
    }

    auto loaded = read_snapshot(config_.snapshot_path);
    if (!loaded) {
        return SchedErrc::SnapshotParseFailed;
    }
    return restore(std::move(loaded.value()));
}

void Workflow::set_status(const WorkflowStatus status) {
    if (status_ == status) {
        return;
    }
    CD_LOGC_INFO(
            SchedLog::Workflow,
            "Workflow '{}' {} -> {}",
            config_.workflow_id,
            ::wise_enum::to_string(status_),
            ::wise_enum::to_string(status));
    status_ = status;
    status_changed_ = true;
}

QueueStats Workflow::compute_stats() const {
    QueueStats stats{};
    stats.max_concurrent = config_.max_concurrent;
    graph_.for_each([&stats](const TaskRecord &record) {
        ++stats.total;
        switch (record.status) {
        case TaskStatus::Pending:
            ++stats.pending;
            break;
        case TaskStatus::Ready:
            ++stats.ready;
            break;
        case TaskStatus::Running:
            ++stats.running;
            break;
        case TaskStatus::RetryPending:
            ++stats.retry_pending;
            break;
        case TaskStatus::Succeeded:
            ++stats.succeeded;
            break;
        case TaskStatus::Failed:
            ++stats.failed;
            break;
        case TaskStatus::Blocked:
            ++stats.blocked;
            break;
        case TaskStatus::Cancelled:
            ++stats.cancelled;
            break;
        }
    });
    stats.queue_size = stats.ready;
    return stats;
}

WorkflowSummary Workflow::build_summary() const {
    WorkflowSummary summary{};
    summary.workflow_id = config_.workflow_id;
    summary.status = status_;
    summary.stats = compute_stats();
    summary.elapsed = last_elapsed_;

    phmap::flat_hash_set<std::string> seen_causes;
    const auto add_cause = [&summary, &seen_causes](const std::string &task_id) {
        if (seen_causes.insert(task_id).second) {
            summary.root_cause_ids.push_back(task_id);
        }
    };
    graph_.for_each([&summary, &add_cause](const TaskRecord &record) {
        switch (record.status) {
        case TaskStatus::Failed:
            add_cause(record.id);
            break;
        case TaskStatus::Blocked:
            summary.blocked_ids.push_back(record.id);
            add_cause(record.blocked_by);
            break;
        case TaskStatus::Cancelled:
            summary.cancelled_ids.push_back(record.id);
            break;
        default:
            break;
        }
    });
    return summary;
}

QueueSnapshot Workflow::build_snapshot() const {
    QueueSnapshot snapshot{};
    snapshot.workflow_id = config_.workflow_id;
    snapshot.workflow_status = status_;
    snapshot.next_sequence = graph_.next_sequence();
    snapshot.timestamp = Time::now_ns();
    snapshot.tasks.reserve(graph_.size());
    graph_.for_each([&snapshot](const TaskRecord &record) { snapshot.tasks.push_back(record); });
    snapshot.retired_ids = graph_.retired_ids();
    return snapshot;
}

std::optional<QueueSnapshot> Workflow::take_idle_snapshot() {
    if (loop_active_ || !status_changed_ || config_.snapshot_path.empty()) {
        return std::nullopt;
    }
    status_changed_ = false;
    return build_snapshot();
}

void Workflow::persist_snapshot(const QueueSnapshot &snapshot) const {
    const std::lock_guard<std::mutex> write_lock(snapshot_write_mutex_);
    if (const auto ec = write_snapshot(snapshot, config_.snapshot_path); ec) {
        CD_LOGC_WARN(
                SchedLog::Workflow,
                "Snapshot of workflow '{}' not written: {}",
                config_.workflow_id,
                get_error_name(ec));
    }
}

TaskDefaults Workflow::task_defaults() const {
    return TaskDefaults{
            .max_attempts = config_.retry.max_attempts, .timeout = config_.default_timeout};
}

void Workflow::notify() {
    {
        const std::lock_guard<std::mutex> lock(event_mutex_);
        event_pending_ = true;
    }
    event_cv_.notify_one();
}

void Workflow::fire(const std::vector<Notification> &notifications) const {
    if (notifications.empty()) {
        return;
    }
    TaskCallback on_complete;
    TaskCallback on_failed;
    {
        const std::shared_lock lock(state_mutex_);
        on_complete = on_complete_;
        on_failed = on_failed_;
    }

    for (const auto &notification : notifications) {
        const TaskCallback &callback = notification.failed ? on_failed : on_complete;
        if (!callback) {
            continue;
        }
        try {
            callback(notification.record);
        } catch (const std::exception &e) {
            CD_LOGC_ERROR(
                    SchedLog::Workflow,
                    "Callback for task '{}' threw: {}",
                    notification.record.id,
                    e.what());
        }
    }
}

} // namespace conductor::sched
