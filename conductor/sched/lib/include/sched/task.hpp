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
 * @file task.hpp
 * @brief Task model: status state machine, descriptors, records and executor contract
 *
 * A task is described by the caller with a TaskDescriptor and tracked by the
 * scheduler as a TaskRecord. The payload is opaque: the scheduler copies it
 * into the execution context and never looks inside it.
 */

#ifndef CONDUCTOR_SCHED_TASK_HPP
#define CONDUCTOR_SCHED_TASK_HPP

#include <any>
#include <atomic>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <wise_enum.h>

#include "log/log_macros.hpp"
#include "sched/sched_errors.hpp"
#include "sched/sched_log.hpp"
#include "sched/time.hpp"

namespace conductor::sched {

/// Task priority, lower value is dispatched first
enum class TaskPriority : std::uint8_t {
    Critical,  //!< 0
    High,      //!< 1
    Normal,    //!< 2
    Low,       //!< 3
    Background //!< 4
};

/// Task execution status
enum class TaskStatus : std::uint8_t {
    Pending,      //!< Waiting for dependencies
    Ready,        //!< Dependencies satisfied, queued for dispatch
    Running,      //!< Occupying a worker slot
    RetryPending, //!< Failed attempt, waiting for backoff to elapse
    Succeeded,    //!< Finished successfully
    Failed,       //!< Finished with a terminal failure
    Blocked,      //!< Never ran because an upstream task failed
    Cancelled     //!< Cancelled before or during execution
};

} // namespace conductor::sched

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(conductor::sched::TaskPriority, Critical, High, Normal, Low, Background)
WISE_ENUM_ADAPT(
        conductor::sched::TaskStatus,
        Pending,
        Ready,
        Running,
        RetryPending,
        Succeeded,
        Failed,
        Blocked,
        Cancelled)

namespace conductor::sched {

[[nodiscard]] constexpr bool is_terminal(const TaskStatus status) noexcept {
    return status == TaskStatus::Succeeded || status == TaskStatus::Failed ||
           status == TaskStatus::Blocked || status == TaskStatus::Cancelled;
}

/**
 * Check for a terminal status other than success
 *
 * @param[in] status Status to check
 * @return true for Failed, Blocked and Cancelled
 */
[[nodiscard]] constexpr bool is_terminal_failure(const TaskStatus status) noexcept {
    return is_terminal(status) && status != TaskStatus::Succeeded;
}

/**
 * Check whether the task state machine allows a status change
 *
 * Running tasks move to exactly one outcome. Tasks that never ran can only be
 * cancelled or blocked. RetryPending goes back through Ready.
 *
 * @param[in] from Current status
 * @param[in] to Requested status
 * @return true if the change is allowed
 */
[[nodiscard]] constexpr bool can_transition(const TaskStatus from, const TaskStatus to) noexcept {
    switch (from) {
    case TaskStatus::Pending:
        return to == TaskStatus::Ready || to == TaskStatus::Blocked ||
               to == TaskStatus::Cancelled;
    case TaskStatus::Ready:
        return to == TaskStatus::Running || to == TaskStatus::Cancelled;
    case TaskStatus::Running:
        return to == TaskStatus::Succeeded || to == TaskStatus::RetryPending ||
               to == TaskStatus::Failed || to == TaskStatus::Blocked ||
               to == TaskStatus::Cancelled;
    case TaskStatus::RetryPending:
        return to == TaskStatus::Ready || to == TaskStatus::Cancelled;
    case TaskStatus::Succeeded:
    case TaskStatus::Failed:
    case TaskStatus::Blocked:
    case TaskStatus::Cancelled:
        return false;
    }
    return false;
}

/**
 * Opaque task payload
 *
 * The tag and body are persisted with the task. user_data is an in-process
 * convenience for executors and is not written to snapshots.
 */
struct TaskPayload final {
    std::string tag;    //!< Caller defined discriminator, e.g. an intent name
    std::string body;   //!< Caller defined serialized parameters
    std::any user_data; //!< In-process data, not persisted. For large objects use
                        //!< std::shared_ptr<T> to avoid copies

    /**
     * Helper to safely get user data of specific type
     * @return Optional containing the data if type matches, nullopt otherwise
     */
    template <typename T> [[nodiscard]] std::optional<T> get_user_data() const {
        if (!user_data.has_value()) {
            return std::nullopt;
        }

        try {
            return std::any_cast<T>(user_data);
        } catch (const std::bad_any_cast &) {
            CD_LOGC_ERROR(
                    SchedLog::Task,
                    "TaskPayload::get_user_data() bad_any_cast - requested "
                    "type does not match stored type");
            return std::nullopt;
        }
    }
};

/**
 * Cancellation token for cooperative task cancellation
 *
 * One token is created per dispatched attempt and shared between the
 * coordinating loop and the executor.
 */
class CancellationToken final {
private:
    // NOLINTBEGIN(readability-redundant-member-init) - {} is required for std::atomic zero-init
    std::atomic<bool> cancelled_{}; //!< Atomic cancellation flag
    // NOLINTEND(readability-redundant-member-init)

public:
    CancellationToken() = default;
    ~CancellationToken() = default;

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;
    CancellationToken(CancellationToken &&) = delete;
    CancellationToken &operator=(CancellationToken &&) = delete;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
};

/**
 * Context handed to the executor for one attempt
 */
struct ExecutionContext final {
    std::string task_id;                                   //!< Task being executed
    std::uint32_t attempt{1};                              //!< 1-based attempt number
    std::shared_ptr<const TaskPayload> payload;            //!< Copy of the task payload
    std::shared_ptr<CancellationToken> cancellation_token; //!< Set on cancel or timeout
    Nanos deadline{0}; //!< Absolute deadline, zero when the task has no timeout

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancellation_token && cancellation_token->is_cancelled();
    }

    /**
     * Get remaining time before the deadline
     *
     * @return Remaining time, or nullopt if the task has no timeout
     */
    [[nodiscard]] std::optional<Nanos> remaining() const;
};

/**
 * Outcome reported by the executor
 */
struct ExecutionResult final {
    bool success{true};   //!< Whether the attempt succeeded
    bool retryable{true}; //!< False stops retries regardless of attempts left
    std::string output;   //!< Result payload on success
    std::string error;    //!< Error description on failure

    [[nodiscard]] static ExecutionResult ok(std::string output = {});
    [[nodiscard]] static ExecutionResult failure(std::string error);

    /**
     * Failure that must not be retried
     *
     * @param[in] error Error description
     * @return Failed result with retryable=false
     */
    [[nodiscard]] static ExecutionResult non_retryable(std::string error);

    [[nodiscard]] bool is_success() const noexcept { return success; }
};

/// Executor invoked by worker threads, must be safe to call concurrently
using Executor = std::function<ExecutionResult(const ExecutionContext &)>;

/// Concept for callables accepted as executors
// clang-format off
template <typename Func>
concept ValidExecutor =
    (std::is_invocable_r_v<ExecutionResult, Func, const ExecutionContext &>) ||
    (std::is_invocable_v<Func, const ExecutionContext &> &&
     std::is_void_v<std::invoke_result_t<Func, const ExecutionContext &>>);
// clang-format on

/**
 * Adapt a callable into an Executor
 *
 * Callables returning void report success when they return normally.
 *
 * @param[in] func Callable taking the execution context
 * @return Executor wrapping the callable
 */
template <typename Func>
    requires ValidExecutor<Func>
[[nodiscard]] Executor make_executor(Func &&func) {
    if constexpr (std::is_void_v<std::invoke_result_t<Func, const ExecutionContext &>>) {
        return [captured_func = std::forward<Func>(func)](const ExecutionContext &ctx) {
            captured_func(ctx);
            return ExecutionResult::ok();
        };
    } else {
        return Executor{std::forward<Func>(func)};
    }
}

/**
 * Invoke an executor, converting exceptions into failed results
 *
 * @param[in] executor Executor to run
 * @param[in] ctx Execution context
 * @return Executor result, or a failure carrying the exception message
 */
[[nodiscard]] ExecutionResult invoke_executor(const Executor &executor, const ExecutionContext &ctx);

class TaskDescriptorBuilder;

/**
 * Caller supplied description of a task
 *
 * Unset max_attempts and timeout take the workflow defaults.
 */
struct TaskDescriptor final {
    std::string id;                            //!< Unique task id
    TaskPayload payload;                       //!< Opaque payload
    TaskPriority priority{TaskPriority::Normal}; //!< Dispatch priority
    std::vector<std::string> dependencies;     //!< Ids that must finish first
    std::vector<std::string> tags;             //!< Free form labels for queries
    std::optional<std::uint32_t> max_attempts; //!< Attempt budget override
    std::optional<Nanos> timeout;              //!< Per attempt timeout override

    /**
     * Start building a descriptor
     *
     * @param[in] id Unique task id
     * @return Builder for chaining
     */
    [[nodiscard]] static TaskDescriptorBuilder create(std::string id);
};

/**
 * Fluent builder for TaskDescriptor
 */
class TaskDescriptorBuilder final {
public:
    explicit TaskDescriptorBuilder(std::string id);

    TaskDescriptorBuilder &payload(std::string tag, std::string body = {});

    template <typename T> TaskDescriptorBuilder &user_data(T &&data) {
        descriptor_.payload.user_data = std::any{std::forward<T>(data)};
        return *this;
    }

    TaskDescriptorBuilder &priority(TaskPriority priority);

    TaskDescriptorBuilder &depends_on(std::string dependency);
    TaskDescriptorBuilder &depends_on(std::initializer_list<std::string_view> dependencies);

    TaskDescriptorBuilder &tag(std::string tag);

    /**
     * Override the attempt budget
     *
     * @param[in] attempts Total attempts including the first
     * @return Reference to this builder for chaining
     */
    TaskDescriptorBuilder &max_attempts(std::uint32_t attempts);

    template <typename Rep, typename Period>
    TaskDescriptorBuilder &timeout(std::chrono::duration<Rep, Period> timeout_duration) {
        descriptor_.timeout = std::chrono::duration_cast<Nanos>(timeout_duration);
        return *this;
    }

    [[nodiscard]] TaskDescriptor build() const;

private:
    TaskDescriptor descriptor_;
};

/// One failed attempt
struct ErrorRecord final {
    std::uint32_t attempt{0};             //!< Attempt that failed
    Nanos timestamp{0};                   //!< When the failure was recorded
    FailureKind kind{FailureKind::None};  //!< Failure classification
    std::string message;                  //!< Error description
    Nanos retry_delay{0};                 //!< Backoff applied after this failure
};

/**
 * Scheduler side state of a task
 */
struct TaskRecord final {
    std::string id;
    TaskPayload payload;
    TaskPriority priority{TaskPriority::Normal};
    std::vector<std::string> dependencies;
    std::vector<std::string> tags;
    TaskStatus status{TaskStatus::Pending};
    std::uint32_t attempts{0};     //!< Attempts started so far
    std::uint32_t max_attempts{1}; //!< Attempt budget
    Nanos timeout{0};              //!< Per attempt timeout, zero for none
    std::uint64_t sequence{0};     //!< Submission order, FIFO tie-break
    Nanos created_at{0};
    Nanos started_at{0}; //!< Start of the latest attempt
    Nanos finished_at{0};
    Nanos wake_at{0};                         //!< Retry wake time while RetryPending
    std::string result;                       //!< Executor output on success
    std::string error;                        //!< Last error description
    FailureKind failure_kind{FailureKind::None}; //!< Classification of the last failure
    std::string blocked_by;                   //!< Root cause id when Blocked
    std::vector<ErrorRecord> error_history;   //!< One entry per failed attempt

    [[nodiscard]] bool has_tag(std::string_view tag) const;
};

} // namespace conductor::sched

#endif // CONDUCTOR_SCHED_TASK_HPP
