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
 * @file task.cpp
 * @brief Task model implementation
 */

#include <algorithm>        // for find, max
#include <cstdint>          // for uint32_t
#include <exception>        // for exception
#include <format>           // for format
#include <initializer_list> // for initializer_list
#include <optional>         // for optional, nullopt
#include <stdexcept>        // for invalid_argument
#include <string>           // for string
#include <string_view>      // for string_view
#include <utility>          // for move

#include "sched/sched_log.hpp"
#include "sched/task.hpp"
#include "sched/time.hpp"

namespace conductor::sched {

std::optional<Nanos> ExecutionContext::remaining() const {
    if (deadline == Nanos{0}) {
        return std::nullopt;
    }
    return std::max(deadline - Time::now_ns(), Nanos{0});
}

ExecutionResult ExecutionResult::ok(std::string output) {
    ExecutionResult result{};
    result.output = std::move(output);
    return result;
}

ExecutionResult ExecutionResult::failure(std::string error) {
    ExecutionResult result{};
    result.success = false;
    result.error = std::move(error);
    return result;
}

ExecutionResult ExecutionResult::non_retryable(std::string error) {
    ExecutionResult result = failure(std::move(error));
    result.retryable = false;
    return result;
}

ExecutionResult invoke_executor(const Executor &executor, const ExecutionContext &ctx) {
    try {
        return executor(ctx);
    } catch (const std::exception &e) {
        return ExecutionResult::failure(std::format("Exception: {}", e.what()));
    } catch (...) {
        return ExecutionResult::failure("Unknown exception occurred");
    }
}

TaskDescriptorBuilder TaskDescriptor::create(std::string id) {
    return TaskDescriptorBuilder{std::move(id)};
}

TaskDescriptorBuilder::TaskDescriptorBuilder(std::string id) { descriptor_.id = std::move(id); }

TaskDescriptorBuilder &TaskDescriptorBuilder::payload(std::string tag, std::string body) {
    descriptor_.payload.tag = std::move(tag);
    descriptor_.payload.body = std::move(body);
    return *this;
}

TaskDescriptorBuilder &TaskDescriptorBuilder::priority(const TaskPriority priority) {
    descriptor_.priority = priority;
    return *this;
}

TaskDescriptorBuilder &TaskDescriptorBuilder::depends_on(std::string dependency) {
    descriptor_.dependencies.push_back(std::move(dependency));
    return *this;
}

TaskDescriptorBuilder &
TaskDescriptorBuilder::depends_on(const std::initializer_list<std::string_view> dependencies) {
    for (const auto dependency : dependencies) {
        descriptor_.dependencies.emplace_back(dependency);
    }
    return *this;
}

TaskDescriptorBuilder &TaskDescriptorBuilder::tag(std::string tag) {
    descriptor_.tags.push_back(std::move(tag));
    return *this;
}

TaskDescriptorBuilder &TaskDescriptorBuilder::max_attempts(const std::uint32_t attempts) {
    descriptor_.max_attempts = attempts;
    return *this;
}

TaskDescriptor TaskDescriptorBuilder::build() const {
    if (descriptor_.id.empty()) {
        log_and_throw<std::invalid_argument>(SchedLog::Task, "Task id must not be empty");
    }
    if (descriptor_.max_attempts.has_value() && descriptor_.max_attempts.value() == 0) {
        log_and_throw<std::invalid_argument>(
                SchedLog::Task, "Task '{}' must allow at least one attempt", descriptor_.id);
    }
    if (descriptor_.timeout.has_value() && descriptor_.timeout.value() < Nanos{0}) {
        log_and_throw<std::invalid_argument>(
                SchedLog::Task, "Task '{}' has a negative timeout", descriptor_.id);
    }
    return descriptor_;
}

bool TaskRecord::has_tag(const std::string_view tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

} // namespace conductor::sched
