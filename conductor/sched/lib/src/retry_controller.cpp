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
 * @file retry_controller.cpp
 * @brief Retry controller implementation
 */

#include <algorithm>   // for min, transform, any_of
#include <array>       // for array
#include <cctype>      // for tolower
#include <chrono>      // for duration_cast, duration
#include <cmath>       // for pow
#include <cstdint>     // for uint32_t
#include <stdexcept>   // for invalid_argument
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move, pair

#include "log/log_macros.hpp"
#include "sched/retry_controller.hpp"
#include "sched/sched_log.hpp"

namespace conductor::sched {

namespace {

struct ClassPatterns final {
    ErrorClass error_class{ErrorClass::Unknown};
    std::array<std::string_view, 4> patterns{};
};

// Empty entries pad the shorter pattern lists
constexpr std::array<ClassPatterns, 5> ERROR_PATTERNS{{
        {ErrorClass::Network, {"connection", "timeout", "network", "unreachable"}},
        {ErrorClass::Permission, {"permission", "access denied", "forbidden", ""}},
        {ErrorClass::NotFound, {"not found", "does not exist", "missing", ""}},
        {ErrorClass::Resource, {"resource", "memory", "disk space", ""}},
        {ErrorClass::Temporary, {"busy", "locked", "in use", "try again"}},
}};

std::string to_lower(const std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

} // namespace

ErrorClass classify_error(const std::string_view message) {
    const std::string lowered = to_lower(message);
    for (const auto &entry : ERROR_PATTERNS) {
        const bool matched =
                std::any_of(entry.patterns.begin(), entry.patterns.end(), [&](const auto pattern) {
                    return !pattern.empty() && lowered.find(pattern) != std::string::npos;
                });
        if (matched) {
            return entry.error_class;
        }
    }
    return ErrorClass::Unknown;
}

Nanos RetryPolicy::compute_delay(const std::uint32_t attempt) const {
    const auto exponent = static_cast<double>(attempt > 0 ? attempt - 1 : 0);
    const double scaled =
            static_cast<double>(backoff_base.count()) * std::pow(backoff_multiplier, exponent);
    if (scaled >= static_cast<double>(max_backoff.count())) {
        return max_backoff;
    }
    return std::min(Nanos{static_cast<Nanos::rep>(scaled)}, max_backoff);
}

void RetryPolicy::validate() const {
    if (max_attempts == 0) {
        log_and_throw<std::invalid_argument>(SchedLog::Retry, "max_attempts must be at least 1");
    }
    if (backoff_base < Nanos{0} || max_backoff < Nanos{0}) {
        log_and_throw<std::invalid_argument>(
                SchedLog::Retry, "Backoff durations must not be negative");
    }
    if (backoff_multiplier < 1.0) {
        log_and_throw<std::invalid_argument>(
                SchedLog::Retry,
                "backoff_multiplier must be at least 1.0, got {}",
                backoff_multiplier);
    }
}

RetryController::RetryController(RetryPolicy policy) : policy_{std::move(policy)} {
    policy_.validate();
}

RetryDecision RetryController::on_failure(
        TaskRecord &record,
        const FailureKind kind,
        std::string error,
        const bool retryable,
        const Nanos now) const {
    RetryDecision decision{};
    decision.error_class = classify_error(error);

    // Timeouts are always worth another attempt, classification applies to executor errors
    bool may_retry = retryable || kind == FailureKind::Timeout;
    if (kind == FailureKind::Execution && policy_.classify_errors &&
        !is_retryable(decision.error_class)) {
        may_retry = false;
    }

    decision.retry = may_retry && record.attempts < record.max_attempts;
    if (decision.retry) {
        decision.delay = policy_.compute_delay(record.attempts);
        decision.wake_at = now + decision.delay;
    }

    record.error_history.push_back(ErrorRecord{
            .attempt = record.attempts,
            .timestamp = now,
            .kind = kind,
            .message = error,
            .retry_delay = decision.delay});
    record.error = std::move(error);
    record.failure_kind = kind;

    if (decision.retry) {
        record.status = TaskStatus::RetryPending;
        record.wake_at = decision.wake_at;
        CD_LOGC_INFO(
                SchedLog::Retry,
                "Task '{}' attempt {}/{} failed ({}), retrying in {} ms",
                record.id,
                record.attempts,
                record.max_attempts,
                ::wise_enum::to_string(decision.error_class),
                std::chrono::duration_cast<std::chrono::milliseconds>(decision.delay).count());
    } else {
        record.status = TaskStatus::Failed;
        record.wake_at = Nanos{0};
        record.finished_at = now;
        CD_LOGC_WARN(
                SchedLog::Retry,
                "Task '{}' failed after {}/{} attempts: {}",
                record.id,
                record.attempts,
                record.max_attempts,
                record.error);
    }
    return decision;
}

RetrySummary RetryController::summarize(const TaskRecord &record) {
    RetrySummary summary{
            .task_id = record.id,
            .attempts = record.attempts,
            .max_attempts = record.max_attempts,
            .last_error = record.error,
            .error_history = record.error_history,
            .total_backoff = Nanos{0},
            .succeeded = record.status == TaskStatus::Succeeded};
    for (const auto &entry : record.error_history) {
        summary.total_backoff += entry.retry_delay;
    }
    return summary;
}

} // namespace conductor::sched
