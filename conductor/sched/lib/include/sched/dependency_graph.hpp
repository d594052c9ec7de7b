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
 * @file dependency_graph.hpp
 * @brief Task registry with dependency validation and ready set resolution
 */

#ifndef CONDUCTOR_SCHED_DEPENDENCY_GRAPH_HPP
#define CONDUCTOR_SCHED_DEPENDENCY_GRAPH_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <parallel_hashmap/phmap.h>

#include "sched/task.hpp"
#include "sched/time.hpp"

namespace conductor::sched {

/**
 * Values applied to descriptors that leave fields unset
 */
struct TaskDefaults final {
    std::uint32_t max_attempts{1}; //!< Attempt budget
    Nanos timeout{0};              //!< Per attempt timeout, zero for none
};

/**
 * Task registry and dependency graph
 *
 * Every dependency of a registered task is itself registered (or was
 * registered and later retired after succeeding), so the graph only ever
 * grows by appending tasks whose dependencies already exist. Registration
 * order is therefore a topological order, which the propagation pass relies on.
 *
 * Not thread-safe; the owning workflow serializes access.
 */
class DependencyGraph final {
public:
    /**
     * Register a single task
     *
     * @param[in] descriptor Task description
     * @param[in] defaults Values for unset descriptor fields
     * @param[in] now Creation timestamp
     * @return Empty code on success, otherwise DuplicateTaskId,
     * UnknownDependency, CycleDetected or InvalidParameter
     */
    [[nodiscard]] std::error_code
    add_task(TaskDescriptor descriptor, const TaskDefaults &defaults, Nanos now);

    /**
     * Register a batch atomically
     *
     * Tasks in the batch may depend on each other in any order. If any task is
     * rejected the graph is left untouched.
     *
     * @param[in] batch Task descriptions
     * @param[in] defaults Values for unset descriptor fields
     * @param[in] now Creation timestamp
     * @return Empty code on success, otherwise the first rejection reason
     */
    [[nodiscard]] std::error_code
    add_tasks(std::vector<TaskDescriptor> batch, const TaskDefaults &defaults, Nanos now);

    /**
     * Replace the registry with restored records
     *
     * Records are re-validated: ids must be unique, dependencies must resolve
     * and the graph must be acyclic.
     *
     * @param[in] records Restored task records
     * @param[in] retired_ids Ids of succeeded tasks removed before the snapshot
     * @param[in] next_sequence Next creation sequence number
     * @return Empty code on success, SnapshotParseFailed otherwise
     */
    [[nodiscard]] std::error_code restore(
            std::vector<TaskRecord> records,
            std::vector<std::string> retired_ids,
            std::uint64_t next_sequence);

    [[nodiscard]] TaskRecord *find(std::string_view task_id);
    [[nodiscard]] const TaskRecord *find(std::string_view task_id) const;

    [[nodiscard]] bool contains(std::string_view task_id) const;

    /**
     * Change the status of a task through the state machine
     *
     * @param[in] task_id Task to update
     * @param[in] to New status
     * @return Empty code on success, TaskNotFound or InvalidTransition otherwise
     */
    [[nodiscard]] std::error_code transition(std::string_view task_id, TaskStatus to);

    /**
     * Compute the tasks eligible for dispatch
     *
     * A task is eligible when it is Pending, or RetryPending with an elapsed
     * wake time, and every dependency has succeeded. With continue_on_failure
     * any terminal dependency counts as satisfied.
     *
     * @param[in] now Current time
     * @param[in] continue_on_failure Treat failed dependencies as satisfied
     * @return Eligible ids ordered by priority then sequence
     */
    [[nodiscard]] std::vector<std::string>
    ready_set(Nanos now, bool continue_on_failure) const;

    /**
     * Block every waiting task with a failed, blocked or cancelled dependency
     *
     * Runs in registration order so blocking is transitive in a single pass.
     *
     * @param[in] now Timestamp recorded as the finish time
     * @return Ids of tasks that were blocked by this call
     */
    std::vector<std::string> propagate_failures(Nanos now);

    /**
     * Check whether a dependency was satisfied only through continue_on_failure
     *
     * @param[in] record Task to inspect
     * @return true if any dependency ended in a terminal failure
     */
    [[nodiscard]] bool has_failed_dependency(const TaskRecord &record) const;

    /**
     * Group tasks by dependency generation
     *
     * Generation 0 holds tasks without dependencies; every other task sits one
     * generation after its deepest dependency. Tasks in a group can run in
     * parallel.
     *
     * @return Task ids per generation, registration order inside a group
     */
    [[nodiscard]] std::vector<std::vector<std::string>> parallel_groups() const;

    /**
     * Get all task ids sorted by dependency generation
     *
     * @return Topologically ordered ids, stable within a generation
     */
    [[nodiscard]] std::vector<std::string> topological_order() const;

    /**
     * Remove succeeded tasks that nothing unfinished depends on
     *
     * Removed ids stay known so later submissions may still depend on them.
     *
     * @return Number of tasks removed
     */
    std::size_t retire_succeeded();

    /**
     * Visit every record in registration order
     *
     * @param[in] visitor Callback receiving each record
     */
    void for_each(const std::function<void(const TaskRecord &)> &visitor) const;

    /**
     * Visit every record in registration order with write access
     *
     * Callers must respect the task state machine when changing status.
     *
     * @param[in] visitor Callback receiving each record
     */
    void update_each(const std::function<void(TaskRecord &)> &visitor);

    [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }
    [[nodiscard]] bool empty() const noexcept { return order_.empty(); }
    [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }
    [[nodiscard]] const std::vector<std::string> &retired_ids() const noexcept {
        return retired_ids_;
    }

    void clear();

private:
    /// Status of a dependency, retired ids count as succeeded
    [[nodiscard]] TaskStatus dependency_status(const std::string &dependency_id) const;

    [[nodiscard]] bool is_known(const std::string &task_id) const;

    [[nodiscard]] std::vector<std::uint32_t> calculate_generations() const;

    phmap::flat_hash_map<std::string, std::unique_ptr<TaskRecord>> tasks_; //!< Records by id
    phmap::flat_hash_map<std::string, std::vector<std::string>>
            dependents_;                    //!< Reverse edges
    phmap::flat_hash_set<std::string> retired_; //!< Succeeded and removed ids
    std::vector<std::string> retired_ids_;      //!< Retired ids in removal order
    std::vector<std::string> order_;            //!< Registration order
    std::uint64_t next_sequence_{0};            //!< Next creation sequence number
};

} // namespace conductor::sched

#endif // CONDUCTOR_SCHED_DEPENDENCY_GRAPH_HPP
