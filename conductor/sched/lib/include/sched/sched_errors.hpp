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
 * @file sched_errors.hpp
 * @brief Error codes and failure taxonomy for the scheduler
 *
 * Submission and persistence errors are reported through std::error_code
 * using SchedErrc. Task level failures are classified by FailureKind and
 * stored on the task record rather than returned to the caller.
 */

#ifndef CONDUCTOR_SCHED_SCHED_ERRORS_HPP
#define CONDUCTOR_SCHED_SCHED_ERRORS_HPP

#include <array>
#include <cstdint>
#include <format>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <wise_enum.h>

namespace conductor::sched {

/**
 * Scheduler error codes compatible with std::error_code
 */
// clang-format off
enum class SchedErrc : std::uint8_t {
    Success,             //!< Operation succeeded
    DuplicateTaskId,     //!< A task with the same id already exists
    UnknownDependency,   //!< A dependency id does not resolve to a known task
    CycleDetected,       //!< The submission would create a dependency cycle
    InvalidParameter,    //!< Invalid parameter provided
    TaskNotFound,        //!< Task id not found in the registry
    InvalidTransition,   //!< Status change not allowed by the task state machine
    WorkflowTerminal,    //!< Workflow already completed, failed or cancelled
    FileOpenFailed,      //!< File open operation failed
    FileWriteFailed,     //!< File write operation failed
    SnapshotParseFailed  //!< Snapshot document is malformed
};
// clang-format on

static_assert(
        static_cast<std::uint32_t>(SchedErrc::SnapshotParseFailed) <=
                std::numeric_limits<std::uint8_t>::max(),
        "SchedErrc enumerator values must fit in std::uint8_t");

/**
 * Classification of a task level failure
 */
enum class FailureKind : std::uint8_t {
    None,            //!< No failure recorded
    Validation,      //!< Malformed submission
    Execution,       //!< Executor reported failure
    Timeout,         //!< Deadline exceeded
    Cancellation,    //!< Workflow or task level cancel
    DependencyFailed //!< Propagated from a failed or blocked upstream task
};

} // namespace conductor::sched

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        conductor::sched::SchedErrc,
        Success,
        DuplicateTaskId,
        UnknownDependency,
        CycleDetected,
        InvalidParameter,
        TaskNotFound,
        InvalidTransition,
        WorkflowTerminal,
        FileOpenFailed,
        FileWriteFailed,
        SnapshotParseFailed)

WISE_ENUM_ADAPT(
        conductor::sched::FailureKind,
        None,
        Validation,
        Execution,
        Timeout,
        Cancellation,
        DependencyFailed)

// Register SchedErrc as an error code enum to enable implicit conversion to
// std::error_code
namespace std {
template <> struct is_error_code_enum<conductor::sched::SchedErrc> : true_type {};
} // namespace std

namespace conductor::sched {

/**
 * Error category for scheduler errors
 */
class SchedErrorCategory final : public std::error_category {
private:
    static constexpr std::array<std::string_view, 11> KMESSAGES{
            "Success: Operation completed successfully",
            "Duplicate task id: A task with this id is already registered",
            "Unknown dependency: A dependency id does not resolve to a known task",
            "Cycle detected: The submission would create a dependency cycle",
            "Invalid parameter: Parameter value is invalid or out of range",
            "Task not found: Task id not found in the registry",
            "Invalid transition: Status change not allowed by the task state machine",
            "Workflow terminal: The workflow has finished and no longer accepts changes",
            "File open failed: Unable to open file",
            "File write failed: Unable to write data to file",
            "Snapshot parse failed: Snapshot document is malformed"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<SchedErrc>,
            "KMESSAGES array size must match the number of SchedErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "conductor::sched"; }

    /**
     * Get a descriptive message for the given error code
     *
     * @param[in] condition The error code value
     * @return A descriptive error message
     */
    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown scheduler error: {}", condition);
    }

    /**
     * Map scheduler errors to standard error conditions where applicable
     *
     * @param[in] condition The error code value
     * @return The equivalent standard error condition
     */
    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<SchedErrc>(condition)) {
        case SchedErrc::Success:
            return {};
        case SchedErrc::InvalidParameter:
        case SchedErrc::DuplicateTaskId:
        case SchedErrc::UnknownDependency:
        case SchedErrc::CycleDetected:
            return std::errc::invalid_argument;
        case SchedErrc::TaskNotFound:
            return std::errc::no_such_file_or_directory;
        case SchedErrc::InvalidTransition:
        case SchedErrc::WorkflowTerminal:
            return std::errc::operation_not_permitted;
        case SchedErrc::FileOpenFailed:
        case SchedErrc::FileWriteFailed:
            return std::errc::io_error;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

[[nodiscard]] inline const SchedErrorCategory &sched_category() noexcept {
    static const SchedErrorCategory instance{};
    return instance;
}

/**
 * Create an error_code from a SchedErrc value
 *
 * @param[in] errc The scheduler error code
 * @return A std::error_code representing the error
 */
[[nodiscard]] inline std::error_code make_error_code(const SchedErrc errc) noexcept {
    return {static_cast<int>(errc), sched_category()};
}

/**
 * Check whether a submission was rejected as malformed
 *
 * @param[in] ec Result of add_task or add_tasks
 * @return true for duplicate id, unknown dependency, cycle or invalid parameter
 */
[[nodiscard]] inline bool is_validation_error(const std::error_code &ec) noexcept {
    return ec.category() == sched_category() &&
           ec.default_error_condition() == std::errc::invalid_argument;
}

[[nodiscard]] inline const char *get_error_name(const SchedErrc errc) noexcept {
    return ::wise_enum::to_string(errc).data();
}

/**
 * Get the name of a SchedErrc from a std::error_code
 *
 * @param[in] ec The error code
 * @return The enum name, or "unknown" if not a scheduler error
 */
[[nodiscard]] inline const char *get_error_name(const std::error_code &ec) noexcept {
    if (ec.category() != sched_category()) {
        return "unknown";
    }
    return get_error_name(static_cast<SchedErrc>(ec.value()));
}

} // namespace conductor::sched

#endif // CONDUCTOR_SCHED_SCHED_ERRORS_HPP
