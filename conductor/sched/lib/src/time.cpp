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
 * @file time.cpp
 * @brief Scheduler clock implementation
 */

#include <chrono> // for system_clock, duration_cast, floor
#include <format> // for format
#include <string> // for string

#include "sched/time.hpp"

namespace conductor::sched {

Nanos Time::now_ns() {
    return std::chrono::duration_cast<Nanos>(
            std::chrono::system_clock::now().time_since_epoch());
}

Time::TimePoint Time::to_time_point(const Nanos time_ns) {
    return TimePoint{std::chrono::duration_cast<std::chrono::system_clock::duration>(time_ns)};
}

std::string Time::to_iso8601(const Nanos time_ns) {
    if (time_ns == Nanos{0}) {
        return {};
    }
    const auto tp = std::chrono::floor<std::chrono::milliseconds>(to_time_point(time_ns));
    return std::format("{:%FT%TZ}", tp);
}

} // namespace conductor::sched
