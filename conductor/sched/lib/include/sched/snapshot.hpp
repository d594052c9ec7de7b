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
 * @file snapshot.hpp
 * @brief JSON persistence of workflow state
 */

#ifndef CONDUCTOR_SCHED_SNAPSHOT_HPP
#define CONDUCTOR_SCHED_SNAPSHOT_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <tl/expected.hpp>

#include "sched/task.hpp"
#include "sched/time.hpp"
#include "sched/workflow_config.hpp"

namespace conductor::sched {

/// Snapshot document format version
inline constexpr int SNAPSHOT_FORMAT_VERSION = 1;

/**
 * Persisted workflow state
 *
 * Holds the task records as they were at capture time. Status rewriting for
 * restart (Running back to Pending) happens when the snapshot is restored
 * into a workflow, not here.
 */
struct QueueSnapshot final {
    std::string workflow_id;
    WorkflowStatus workflow_status{WorkflowStatus::Pending};
    std::uint64_t next_sequence{0};       //!< Next creation sequence number
    Nanos timestamp{0};                   //!< Capture time
    std::vector<TaskRecord> tasks;        //!< Records in registration order
    std::vector<std::string> retired_ids; //!< Succeeded tasks removed by clear_completed

    /**
     * Ids of every succeeded task, retired ones first
     *
     * @return Completed task ids
     */
    [[nodiscard]] std::vector<std::string> completed_tasks() const;
};

/**
 * Serialize a snapshot
 *
 * @param[in] snapshot Snapshot to serialize
 * @return JSON document
 */
[[nodiscard]] nlohmann::json to_json(const QueueSnapshot &snapshot);

/**
 * Deserialize a snapshot
 *
 * @param[in] doc JSON document
 * @return Snapshot or error message
 */
[[nodiscard]] tl::expected<QueueSnapshot, std::string> snapshot_from_json(const nlohmann::json &doc);

/**
 * Parse snapshot text
 *
 * @param[in] text JSON text
 * @return Snapshot or error message
 */
[[nodiscard]] tl::expected<QueueSnapshot, std::string> parse_snapshot(std::string_view text);

/**
 * Write a snapshot atomically
 *
 * The document is written to a sibling temporary file which is then renamed
 * over the target.
 *
 * @param[in] snapshot Snapshot to write
 * @param[in] path Target file
 * @return Empty code on success, FileOpenFailed or FileWriteFailed otherwise
 */
[[nodiscard]] std::error_code
write_snapshot(const QueueSnapshot &snapshot, const std::filesystem::path &path);

/**
 * Read a snapshot file
 *
 * @param[in] path Snapshot file
 * @return Snapshot or error message
 */
[[nodiscard]] tl::expected<QueueSnapshot, std::string>
read_snapshot(const std::filesystem::path &path);

} // namespace conductor::sched

#endif // CONDUCTOR_SCHED_SNAPSHOT_HPP
