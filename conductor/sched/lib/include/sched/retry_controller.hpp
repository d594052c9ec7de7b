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
 * @file retry_controller.hpp
 * @brief Retry decisions with exponential backoff and error classification
 */

#ifndef CONDUCTOR_SCHED_RETRY_CONTROLLER_HPP
#define CONDUCTOR_SCHED_RETRY_CONTROLLER_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <wise_enum.h>

#include "sched/sched_errors.hpp"
#include "sched/task.hpp"
#include "sched/time.hpp"

namespace conductor::sched {

/// Error class derived from the failure message
enum class ErrorClass : std::uint8_t {
    Network,    //!< Connection problems, retryable
    Permission, //!< Access denied, not retryable
    NotFound,   //!< Missing resource, not retryable
    Resource,   //!< Exhausted resource, retryable
    Temporary,  //!< Busy or locked, retryable
    Unknown     //!< Unmatched message, retryable
};

} // namespace conductor::sched

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        conductor::sched::ErrorClass, Network, Permission, NotFound, Resource, Temporary, Unknown)

namespace conductor::sched {

/**
 * Classify an error message by case-insensitive substring patterns
 *
 * Classes are tried in declaration order, the first match wins.
 *
 * @param[in] message Error description
 * @return Matching class, Unknown if no pattern matches
 */
[[nodiscard]] ErrorClass classify_error(std::string_view message);

/**
 * Check whether an error class may be retried
 *
 * @param[in] error_class Class to check
 * @return false for Permission and NotFound
 */
[[nodiscard]] constexpr bool is_retryable(const ErrorClass error_class) noexcept {
    return error_class != ErrorClass::Permission && error_class != ErrorClass::NotFound;
}

/**
 * Backoff policy shared by all tasks of a workflow
 */
struct RetryPolicy final {
    static constexpr std::uint32_t DEFAULT_MAX_ATTEMPTS = 3;
    static constexpr std::chrono::seconds DEFAULT_BACKOFF_BASE{1};
    static constexpr double DEFAULT_BACKOFF_MULTIPLIER = 2.0;
    static constexpr std::chrono::seconds DEFAULT_MAX_BACKOFF{60};

    std::uint32_t max_attempts{DEFAULT_MAX_ATTEMPTS}; //!< Default attempt budget per task
    Nanos backoff_base{DEFAULT_BACKOFF_BASE};         //!< Delay after the first failure
    double backoff_multiplier{DEFAULT_BACKOFF_MULTIPLIER}; //!< Growth factor per attempt
    Nanos max_backoff{DEFAULT_MAX_BACKOFF};           //!< Upper bound for any delay
    bool classify_errors{false}; //!< Stop retrying Permission and NotFound failures

    /**
     * Compute the delay before the next attempt
     *
     * delay = min(backoff_base * backoff_multiplier^(attempt - 1), max_backoff)
     *
     * @param[in] attempt Attempt that just failed, 1-based
     * @return Delay before the next attempt
     */
    [[nodiscard]] Nanos compute_delay(std::uint32_t attempt) const;

    /**
     * Validate policy values
     *
     * @throws std::invalid_argument on zero attempts, negative delays or a
     * multiplier below 1
     */
    void validate() const;
};

/**
 * Outcome of a failed attempt
 */
struct RetryDecision final {
    bool retry{false};                    //!< Task moved to RetryPending
    Nanos delay{0};                       //!< Backoff before the next attempt
    Nanos wake_at{0};                     //!< When the task becomes eligible again
    ErrorClass error_class{ErrorClass::Unknown}; //!< Classification of the error message
};

/**
 * Retry history of one task
 */
struct RetrySummary final {
    std::string task_id;
    std::uint32_t attempts{0};
    std::uint32_t max_attempts{0};
    std::string last_error;
    std::vector<ErrorRecord> error_history;
    Nanos total_backoff{0}; //!< Sum of all applied retry delays
    bool succeeded{false};
};

/**
 * Applies the retry policy to failed attempts
 *
 * Only execution failures and timeouts are handled here. Cancellation and
 * propagated dependency failures never retry.
 */
class RetryController final {
public:
    explicit RetryController(RetryPolicy policy = {});

    /**
     * Record a failed attempt and move the task on
     *
     * The attempt counter is expected to already include the failed attempt.
     * The task goes to RetryPending when attempts remain and the error is
     * retryable, otherwise to Failed.
     *
     * @param[in,out] record Running task
     * @param[in] kind Execution or Timeout
     * @param[in] error Error description
     * @param[in] retryable False if the executor marked the failure final
     * @param[in] now Current time
     * @return Decision taken
     */
    RetryDecision on_failure(
            TaskRecord &record, FailureKind kind, std::string error, bool retryable, Nanos now) const;

    /**
     * Summarize the retry history of a task
     *
     * @param[in] record Task to summarize
     * @return Attempts, errors and total backoff
     */
    [[nodiscard]] static RetrySummary summarize(const TaskRecord &record);

    [[nodiscard]] const RetryPolicy &policy() const noexcept { return policy_; }

private:
    RetryPolicy policy_;
};

} // namespace conductor::sched

#endif // CONDUCTOR_SCHED_RETRY_CONTROLLER_HPP
