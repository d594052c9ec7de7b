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
 * @file time.hpp
 * @brief Clock helpers shared by the scheduler components
 */

#ifndef CONDUCTOR_SCHED_TIME_HPP
#define CONDUCTOR_SCHED_TIME_HPP

#include <chrono>
#include <string>

namespace conductor::sched {

/// Time type for nanosecond precision timing
using Nanos = std::chrono::nanoseconds;

/**
 * Scheduler clock
 *
 * Task timestamps, retry wake times and deadlines are all nanoseconds since
 * the system clock epoch so that persisted snapshots stay meaningful across
 * process restarts.
 */
class Time final {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * Get current time in nanoseconds
     *
     * @return Current time in nanoseconds since epoch
     */
    [[nodiscard]] static Nanos now_ns();

    /**
     * Convert a nanosecond timestamp into a clock time point
     *
     * @param[in] time_ns Nanoseconds since epoch
     * @return Matching system clock time point
     */
    [[nodiscard]] static TimePoint to_time_point(Nanos time_ns);

    /**
     * Format a timestamp as ISO-8601 UTC with millisecond precision
     *
     * @param[in] time_ns Nanoseconds since epoch, zero formats as empty string
     * @return Formatted timestamp
     */
    [[nodiscard]] static std::string to_iso8601(Nanos time_ns);
};

} // namespace conductor::sched

#endif // CONDUCTOR_SCHED_TIME_HPP
