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
 * @file ready_queue.hpp
 * @brief Priority queue of tasks ready for dispatch
 */

#ifndef CONDUCTOR_SCHED_READY_QUEUE_HPP
#define CONDUCTOR_SCHED_READY_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <vector>

#include "sched/task.hpp"

namespace conductor::sched {

/**
 * Ready queue entry
 */
struct ReadyEntry final {
    TaskPriority priority{TaskPriority::Normal}; //!< Task priority
    std::uint64_t sequence{0};                   //!< Creation sequence
    std::string task_id;                         //!< Task id
};

/**
 * Ready tasks ordered by (priority ascending, creation sequence ascending)
 *
 * Sequence numbers are unique, so the order is total and dispatch is
 * deterministic.
 */
class ReadyQueue final {
public:
    /**
     * Entry comparison for priority queue (priority first, then creation sequence)
     */
    struct DispatchOrderComparator {
        /**
         * @param[in] a First entry
         * @param[in] b Second entry
         * @return True if a should be dispatched after b
         */
        bool operator()(const ReadyEntry &a, const ReadyEntry &b) const noexcept {
            if (a.priority != b.priority) {
                return a.priority > b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    void push(ReadyEntry entry);

    /**
     * Remove and return the next entry to dispatch
     *
     * @return Highest priority entry, or nullopt when empty
     */
    [[nodiscard]] std::optional<ReadyEntry> pop();

    /**
     * Remove an entry by task id
     *
     * @param[in] task_id Task to remove
     * @return true if an entry was removed
     */
    bool erase(std::string_view task_id);

    [[nodiscard]] std::size_t size() const noexcept { return queue_.size(); }
    [[nodiscard]] bool empty() const noexcept { return queue_.empty(); }
    void clear();

private:
    using Queue = std::priority_queue<ReadyEntry, std::vector<ReadyEntry>, DispatchOrderComparator>;

    /// Move all entries out, highest priority first
    std::vector<ReadyEntry> drain();

    Queue queue_; //!< Ordered entries
};

} // namespace conductor::sched

#endif // CONDUCTOR_SCHED_READY_QUEUE_HPP
