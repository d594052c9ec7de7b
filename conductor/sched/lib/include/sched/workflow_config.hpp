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
 * @file workflow_config.hpp
 * @brief Workflow settings and JSON configuration loading
 */

#ifndef CONDUCTOR_SCHED_WORKFLOW_CONFIG_HPP
#define CONDUCTOR_SCHED_WORKFLOW_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>
#include <wise_enum.h>

#include "log/components.hpp"
#include "sched/retry_controller.hpp"
#include "sched/time.hpp"

namespace conductor::sched {

/// Dispatch strategy of a workflow
enum class WorkflowStrategy : std::uint8_t {
    Sequential, //!< One task at a time
    Parallel,   //!< Up to max_concurrent tasks
    Adaptive    //!< Concurrency follows the width of the ready set
};

/// Workflow lifecycle status
enum class WorkflowStatus : std::uint8_t {
    Pending,   //!< Created, not processing yet
    Running,   //!< Dispatching tasks
    Paused,    //!< Dispatch suspended, running tasks finish
    Completed, //!< All tasks finished successfully, or terminal under continue_on_failure
    Failed,    //!< A task failed terminally
    Cancelled  //!< Cancelled by the caller
};

} // namespace conductor::sched

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(conductor::sched::WorkflowStrategy, Sequential, Parallel, Adaptive)
WISE_ENUM_ADAPT(
        conductor::sched::WorkflowStatus, Pending, Running, Paused, Completed, Failed, Cancelled)

namespace conductor::sched {

[[nodiscard]] constexpr bool is_terminal(const WorkflowStatus status) noexcept {
    return status == WorkflowStatus::Completed || status == WorkflowStatus::Failed ||
           status == WorkflowStatus::Cancelled;
}

/**
 * Parse a strategy name, case-insensitive
 *
 * @param[in] name Strategy name such as "parallel"
 * @return Strategy, or nullopt for unknown names
 */
[[nodiscard]] std::optional<WorkflowStrategy> parse_strategy(std::string_view name);

/**
 * Workflow settings
 */
struct WorkflowConfig final {
    static constexpr std::size_t DEFAULT_MAX_CONCURRENT = 5;
    static constexpr std::chrono::seconds DEFAULT_SNAPSHOT_INTERVAL{5};
    static constexpr std::chrono::milliseconds DEFAULT_IDLE_POLL{100};

    std::string workflow_id;                               //!< Workflow identifier
    WorkflowStrategy strategy{WorkflowStrategy::Parallel}; //!< Dispatch strategy
    std::size_t max_concurrent{DEFAULT_MAX_CONCURRENT};    //!< Slot budget
    bool continue_on_failure{false}; //!< Dependents of failed tasks still run
    RetryPolicy retry;               //!< Backoff policy and default attempt budget
    Nanos default_timeout{0};        //!< Per attempt timeout for tasks without one
    std::filesystem::path snapshot_path; //!< Snapshot file, empty disables persistence
    Nanos snapshot_interval{DEFAULT_SNAPSHOT_INTERVAL}; //!< Periodic snapshot interval
    Nanos idle_poll{DEFAULT_IDLE_POLL};                 //!< Upper bound for a loop wait
    bool adaptive_counts_degraded_tasks{true}; //!< Tasks unblocked by continue_on_failure
                                               //!< widen adaptive concurrency
    log::LogLevel log_level{log::LogLevel::Info}; //!< Level for the scheduler components

    /**
     * Validate settings
     *
     * @throws std::invalid_argument on an empty id, zero max_concurrent,
     * non-positive intervals or an invalid retry policy
     */
    void validate() const;
};

/**
 * Parse a JSON configuration document
 *
 * Missing keys keep their defaults.
 *
 * @param[in] json_text JSON document
 * @return Parsed configuration or error message
 */
[[nodiscard]] tl::expected<WorkflowConfig, std::string>
parse_workflow_config(std::string_view json_text);

/**
 * Load a JSON configuration file
 *
 * @param[in] path Configuration file path
 * @return Parsed configuration or error message
 */
[[nodiscard]] tl::expected<WorkflowConfig, std::string>
load_workflow_config(const std::filesystem::path &path);

} // namespace conductor::sched

#endif // CONDUCTOR_SCHED_WORKFLOW_CONFIG_HPP
