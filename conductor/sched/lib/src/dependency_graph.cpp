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
 * @file dependency_graph.cpp
 * @brief Task registry, submission validation and failure propagation
 */

#include <algorithm>   // for sort, max, any_of, all_of, find
#include <cstddef>     // for size_t
#include <cstdint>     // for uint32_t, uint64_t
#include <format>      // for format
#include <functional>  // for function
#include <memory>      // for make_unique
#include <queue>       // for queue
#include <string>      // for string
#include <string_view> // for string_view
#include <system_error> // for error_code
#include <tuple>       // for tie
#include <utility>     // for move
#include <vector>      // for vector

#include <parallel_hashmap/phmap.h> // for flat_hash_map, flat_hash_set

#include <wise_enum.h> // for to_string

#include "log/log_macros.hpp"
#include "sched/dependency_graph.hpp"
#include "sched/sched_errors.hpp"
#include "sched/sched_log.hpp"
#include "sched/task.hpp"

namespace conductor::sched {

namespace {

/// Copy dependencies dropping repeats, first occurrence wins
std::vector<std::string> unique_dependencies(const std::vector<std::string> &dependencies) {
    std::vector<std::string> unique;
    unique.reserve(dependencies.size());
    for (const auto &dependency : dependencies) {
        if (std::find(unique.begin(), unique.end(), dependency) == unique.end()) {
            unique.push_back(dependency);
        }
    }
    return unique;
}

/**
 * Order node indices with Kahn's algorithm
 *
 * @param[in] children Edges from each node to the nodes depending on it
 * @param[in,out] in_degree Number of unresolved dependencies per node
 * @return Processed nodes in topological order. Shorter than the node count
 * when the graph contains a cycle
 */
std::vector<std::size_t> kahn_order(
        const std::vector<std::vector<std::size_t>> &children,
        std::vector<std::size_t> &in_degree) {
    std::queue<std::size_t> queue{};
    for (std::size_t i = 0; i < in_degree.size(); ++i) {
        if (in_degree[i] == 0) {
            queue.push(i);
        }
    }

    std::vector<std::size_t> order;
    order.reserve(in_degree.size());
    while (!queue.empty()) {
        const std::size_t current_idx = queue.front();
        queue.pop();
        order.push_back(current_idx);

        for (const std::size_t child_idx : children[current_idx]) {
            --in_degree[child_idx];
            if (in_degree[child_idx] == 0) {
                queue.push(child_idx);
            }
        }
    }
    return order;
}

} // namespace

std::error_code
DependencyGraph::add_task(TaskDescriptor descriptor, const TaskDefaults &defaults, const Nanos now) {
    std::vector<TaskDescriptor> batch;
    batch.push_back(std::move(descriptor));
    return add_tasks(std::move(batch), defaults, now);
}

std::error_code DependencyGraph::add_tasks(
        std::vector<TaskDescriptor> batch, const TaskDefaults &defaults, const Nanos now) {
    const std::size_t num_tasks = batch.size();
    if (num_tasks == 0) {
        return {};
    }

    phmap::flat_hash_map<std::string, std::size_t> batch_index;
    std::vector<std::vector<std::string>> dependencies(num_tasks);
    for (std::size_t i = 0; i < num_tasks; ++i) {
        const auto &descriptor = batch[i];
        if (descriptor.id.empty() ||
            (descriptor.max_attempts.has_value() && descriptor.max_attempts.value() == 0) ||
            (descriptor.timeout.has_value() && descriptor.timeout.value() < Nanos{0})) {
            CD_LOGC_WARN(
                    SchedLog::Graph,
                    "Rejected task '{}': empty id, zero attempts or negative timeout",
                    descriptor.id);
            return SchedErrc::InvalidParameter;
        }
        if (is_known(descriptor.id) || !batch_index.emplace(descriptor.id, i).second) {
            CD_LOGC_WARN(SchedLog::Graph, "Rejected task '{}': duplicate id", descriptor.id);
            return SchedErrc::DuplicateTaskId;
        }
        dependencies[i] = unique_dependencies(descriptor.dependencies);
    }

    // Edges inside the batch; edges to registered tasks cannot close a cycle
    // because registered tasks never depend on new ones
    std::vector<std::vector<std::size_t>> children(num_tasks);
    std::vector<std::size_t> in_degree(num_tasks, 0);
    for (std::size_t i = 0; i < num_tasks; ++i) {
        for (const auto &dependency : dependencies[i]) {
            if (dependency == batch[i].id) {
                CD_LOGC_WARN(
                        SchedLog::Graph, "Rejected task '{}': depends on itself", batch[i].id);
                return SchedErrc::CycleDetected;
            }
            const auto it = batch_index.find(dependency);
            if (it != batch_index.end()) {
                children[it->second].push_back(i);
                ++in_degree[i];
            } else if (!is_known(dependency)) {
                CD_LOGC_WARN(
                        SchedLog::Graph,
                        "Rejected task '{}': unknown dependency '{}'",
                        batch[i].id,
                        dependency);
                return SchedErrc::UnknownDependency;
            }
        }
    }

    const std::vector<std::size_t> insertion_order = kahn_order(children, in_degree);
    if (insertion_order.size() != num_tasks) {
        for (std::size_t i = 0; i < num_tasks; ++i) {
            if (in_degree[i] > 0) {
                CD_LOGC_WARN(
                        SchedLog::Graph,
                        "Rejected batch of {} tasks: circular dependency detected involving "
                        "task '{}'",
                        num_tasks,
                        batch[i].id);
                break;
            }
        }
        return SchedErrc::CycleDetected;
    }

    // Validation done, nothing below can fail
    const std::uint64_t sequence_base = next_sequence_;
    next_sequence_ += num_tasks;
    for (const std::size_t idx : insertion_order) {
        auto &descriptor = batch[idx];
        auto record = std::make_unique<TaskRecord>();
        record->id = descriptor.id;
        record->payload = std::move(descriptor.payload);
        record->priority = descriptor.priority;
        record->dependencies = std::move(dependencies[idx]);
        record->tags = std::move(descriptor.tags);
        record->max_attempts = descriptor.max_attempts.value_or(defaults.max_attempts);
        record->timeout = descriptor.timeout.value_or(defaults.timeout);
        record->sequence = sequence_base + idx;
        record->created_at = now;

        for (const auto &dependency : record->dependencies) {
            dependents_[dependency].push_back(record->id);
        }
        CD_LOGC_DEBUG(
                SchedLog::Graph,
                "Registered task '{}' priority={} deps={} seq={}",
                record->id,
                ::wise_enum::to_string(record->priority),
                record->dependencies.size(),
                record->sequence);
        order_.push_back(record->id);
        std::string key = record->id;
        tasks_.emplace(std::move(key), std::move(record));
    }
    return {};
}

std::error_code DependencyGraph::restore(
        std::vector<TaskRecord> records,
        std::vector<std::string> retired_ids,
        const std::uint64_t next_sequence) {
    std::sort(records.begin(), records.end(), [](const TaskRecord &a, const TaskRecord &b) {
        return a.sequence < b.sequence;
    });

    const phmap::flat_hash_set<std::string> retired(retired_ids.begin(), retired_ids.end());
    phmap::flat_hash_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (records[i].id.empty() || retired.contains(records[i].id) ||
            !index.emplace(records[i].id, i).second) {
            CD_LOGC_ERROR(
                    SchedLog::Graph, "Snapshot contains empty or duplicate id '{}'", records[i].id);
            return SchedErrc::SnapshotParseFailed;
        }
    }

    std::vector<std::vector<std::size_t>> children(records.size());
    std::vector<std::size_t> in_degree(records.size(), 0);
    for (std::size_t i = 0; i < records.size(); ++i) {
        records[i].dependencies = unique_dependencies(records[i].dependencies);
        for (const auto &dependency : records[i].dependencies) {
            const auto it = index.find(dependency);
            if (it != index.end()) {
                children[it->second].push_back(i);
                ++in_degree[i];
            } else if (!retired.contains(dependency)) {
                CD_LOGC_ERROR(
                        SchedLog::Graph,
                        "Snapshot task '{}' depends on unknown task '{}'",
                        records[i].id,
                        dependency);
                return SchedErrc::SnapshotParseFailed;
            }
        }
    }

    const std::vector<std::size_t> topo_order = kahn_order(children, in_degree);
    if (topo_order.size() != records.size()) {
        CD_LOGC_ERROR(SchedLog::Graph, "Snapshot dependency graph contains a cycle");
        return SchedErrc::SnapshotParseFailed;
    }

    clear();
    retired_ = retired;
    retired_ids_ = std::move(retired_ids);
    std::uint64_t max_sequence = 0;
    for (const std::size_t idx : topo_order) {
        auto record = std::make_unique<TaskRecord>(std::move(records[idx]));
        max_sequence = std::max(max_sequence, record->sequence + 1);
        for (const auto &dependency : record->dependencies) {
            dependents_[dependency].push_back(record->id);
        }
        order_.push_back(record->id);
        std::string key = record->id;
        tasks_.emplace(std::move(key), std::move(record));
    }
    next_sequence_ = std::max(next_sequence, max_sequence);

    CD_LOGC_INFO(
            SchedLog::Graph,
            "Restored {} tasks ({} retired), next sequence {}",
            order_.size(),
            retired_ids_.size(),
            next_sequence_);
    return {};
}

TaskRecord *DependencyGraph::find(const std::string_view task_id) {
    const auto it = tasks_.find(std::string{task_id});
    return it == tasks_.end() ? nullptr : it->second.get();
}

const TaskRecord *DependencyGraph::find(const std::string_view task_id) const {
    const auto it = tasks_.find(std::string{task_id});
    return it == tasks_.end() ? nullptr : it->second.get();
}

bool DependencyGraph::contains(const std::string_view task_id) const {
    return find(task_id) != nullptr;
}

std::error_code DependencyGraph::transition(const std::string_view task_id, const TaskStatus to) {
    TaskRecord *record = find(task_id);
    if (record == nullptr) {
        return SchedErrc::TaskNotFound;
    }
    if (!can_transition(record->status, to)) {
        CD_LOGC_WARN(
                SchedLog::Graph,
                "Task '{}' cannot move from {} to {}",
                task_id,
                ::wise_enum::to_string(record->status),
                ::wise_enum::to_string(to));
        return SchedErrc::InvalidTransition;
    }
    CD_LOGC_TRACE_L1(
            SchedLog::Graph,
            "Task '{}' {} -> {}",
            task_id,
            ::wise_enum::to_string(record->status),
            ::wise_enum::to_string(to));
    record->status = to;
    return {};
}

std::vector<std::string>
DependencyGraph::ready_set(const Nanos now, const bool continue_on_failure) const {
    std::vector<const TaskRecord *> eligible;
    for (const auto &task_id : order_) {
        const TaskRecord &record = *tasks_.at(task_id);
        const bool waiting = record.status == TaskStatus::Pending ||
                             (record.status == TaskStatus::RetryPending && record.wake_at <= now);
        if (!waiting) {
            continue;
        }
        const bool satisfied = std::all_of(
                record.dependencies.begin(),
                record.dependencies.end(),
                [this, continue_on_failure](const std::string &dependency) {
                    const TaskStatus status = dependency_status(dependency);
                    return status == TaskStatus::Succeeded ||
                           (continue_on_failure && is_terminal(status));
                });
        if (satisfied) {
            eligible.push_back(&record);
        }
    }

    std::sort(eligible.begin(), eligible.end(), [](const TaskRecord *a, const TaskRecord *b) {
        return std::tie(a->priority, a->sequence) < std::tie(b->priority, b->sequence);
    });

    std::vector<std::string> ids;
    ids.reserve(eligible.size());
    for (const TaskRecord *record : eligible) {
        ids.push_back(record->id);
    }
    return ids;
}

std::vector<std::string> DependencyGraph::propagate_failures(const Nanos now) {
    std::vector<std::string> blocked;
    for (const auto &task_id : order_) {
        TaskRecord &record = *tasks_.at(task_id);
        if (record.status != TaskStatus::Pending) {
            continue;
        }
        const auto failed_dep = std::find_if(
                record.dependencies.begin(),
                record.dependencies.end(),
                [this](const std::string &dependency) {
                    return is_terminal_failure(dependency_status(dependency));
                });
        if (failed_dep == record.dependencies.end()) {
            continue;
        }

        const TaskRecord &upstream = *tasks_.at(*failed_dep);
        const std::string &root_cause =
                upstream.blocked_by.empty() ? upstream.id : upstream.blocked_by;
        record.status = TaskStatus::Blocked;
        record.failure_kind = FailureKind::DependencyFailed;
        record.blocked_by = root_cause;
        record.error = std::format(
                "Dependency '{}' ended {}, root cause '{}'",
                upstream.id,
                ::wise_enum::to_string(upstream.status),
                root_cause);
        record.finished_at = now;
        blocked.push_back(record.id);
        CD_LOGC_INFO(SchedLog::Graph, "Task '{}' blocked: {}", record.id, record.error);
    }
    return blocked;
}

bool DependencyGraph::has_failed_dependency(const TaskRecord &record) const {
    return std::any_of(
            record.dependencies.begin(),
            record.dependencies.end(),
            [this](const std::string &dependency) {
                return is_terminal_failure(dependency_status(dependency));
            });
}

std::vector<std::uint32_t> DependencyGraph::calculate_generations() const {
    // order_ is topological, so every dependency's generation is final
    // before its dependents are visited
    phmap::flat_hash_map<std::string, std::uint32_t> generation_by_id;
    std::vector<std::uint32_t> generations;
    generations.reserve(order_.size());
    for (const auto &task_id : order_) {
        const TaskRecord &record = *tasks_.at(task_id);
        std::uint32_t generation = 0;
        for (const auto &dependency : record.dependencies) {
            const auto it = generation_by_id.find(dependency);
            if (it != generation_by_id.end()) {
                generation = std::max(generation, it->second + 1);
            }
        }
        generation_by_id.emplace(task_id, generation);
        generations.push_back(generation);
    }
    return generations;
}

std::vector<std::vector<std::string>> DependencyGraph::parallel_groups() const {
    const auto generations = calculate_generations();
    std::vector<std::vector<std::string>> groups;
    for (std::size_t i = 0; i < order_.size(); ++i) {
        if (generations[i] >= groups.size()) {
            groups.resize(generations[i] + 1);
        }
        groups[generations[i]].push_back(order_[i]);
    }
    return groups;
}

std::vector<std::string> DependencyGraph::topological_order() const {
    std::vector<std::string> ordered;
    ordered.reserve(order_.size());
    for (auto &group : parallel_groups()) {
        for (auto &task_id : group) {
            ordered.push_back(std::move(task_id));
        }
    }
    return ordered;
}

std::size_t DependencyGraph::retire_succeeded() {
    std::vector<std::string> kept;
    kept.reserve(order_.size());
    std::size_t removed = 0;

    for (const auto &task_id : order_) {
        const TaskRecord &record = *tasks_.at(task_id);
        bool removable = record.status == TaskStatus::Succeeded;
        if (removable) {
            const auto it = dependents_.find(task_id);
            if (it != dependents_.end()) {
                removable = std::all_of(
                        it->second.begin(), it->second.end(), [this](const std::string &child) {
                            const TaskRecord *child_record = find(child);
                            return child_record == nullptr || is_terminal(child_record->status);
                        });
            }
        }

        if (!removable) {
            kept.push_back(task_id);
            continue;
        }
        retired_.insert(task_id);
        retired_ids_.push_back(task_id);
        dependents_.erase(task_id);
        tasks_.erase(task_id);
        ++removed;
    }

    order_ = std::move(kept);
    if (removed > 0) {
        CD_LOGC_INFO(SchedLog::Graph, "Cleared {} completed tasks", removed);
    }
    return removed;
}

void DependencyGraph::for_each(const std::function<void(const TaskRecord &)> &visitor) const {
    for (const auto &task_id : order_) {
        visitor(*tasks_.at(task_id));
    }
}

void DependencyGraph::update_each(const std::function<void(TaskRecord &)> &visitor) {
    for (const auto &task_id : order_) {
        visitor(*tasks_.at(task_id));
    }
}

void DependencyGraph::clear() {
    tasks_.clear();
    dependents_.clear();
    retired_.clear();
    retired_ids_.clear();
    order_.clear();
    next_sequence_ = 0;
}

TaskStatus DependencyGraph::dependency_status(const std::string &dependency_id) const {
    const auto it = tasks_.find(dependency_id);
    if (it != tasks_.end()) {
        return it->second->status;
    }
    // Only retired ids are missing; they succeeded
    return TaskStatus::Succeeded;
}

bool DependencyGraph::is_known(const std::string &task_id) const {
    return tasks_.contains(task_id) || retired_.contains(task_id);
}

} // namespace conductor::sched
