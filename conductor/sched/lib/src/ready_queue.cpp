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
 * @file ready_queue.cpp
 * @brief Ready queue implementation
 */

#include <algorithm>   // for remove_if
#include <cstddef>     // for size_t
#include <optional>    // for optional, nullopt
#include <string_view> // for string_view
#include <utility>     // for move
#include <vector>      // for vector

#include "sched/ready_queue.hpp"

namespace conductor::sched {

void ReadyQueue::push(ReadyEntry entry) { queue_.push(std::move(entry)); }

std::optional<ReadyEntry> ReadyQueue::pop() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    ReadyEntry entry = queue_.top();
    queue_.pop();
    return entry;
}

bool ReadyQueue::erase(const std::string_view task_id) {
    std::vector<ReadyEntry> container = drain();
    const std::size_t before = container.size();
    container.erase(
            std::remove_if(
                    container.begin(),
                    container.end(),
                    [task_id](const ReadyEntry &entry) { return entry.task_id == task_id; }),
            container.end());
    const bool removed = container.size() != before;
    queue_ = Queue(DispatchOrderComparator{}, std::move(container));
    return removed;
}

void ReadyQueue::clear() { queue_ = Queue{}; }

std::vector<ReadyEntry> ReadyQueue::drain() {
    std::vector<ReadyEntry> container{};
    container.reserve(queue_.size());
    while (!queue_.empty()) {
        container.push_back(queue_.top());
        queue_.pop();
    }
    return container;
}

} // namespace conductor::sched
