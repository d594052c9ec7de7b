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
 * @file snapshot.cpp
 * @brief Snapshot serialization and file IO
 */

#include <cstdint>      // for int64_t, uint32_t, uint64_t
#include <filesystem>   // for path, rename, remove
#include <format>       // for format
#include <fstream>      // for ifstream, ofstream
#include <sstream>      // for ostringstream
#include <stdexcept>    // for runtime_error
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <utility>      // for move
#include <vector>       // for vector

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>
#include <wise_enum.h>

#include "log/log_macros.hpp"
#include "sched/sched_errors.hpp"
#include "sched/sched_log.hpp"
#include "sched/snapshot.hpp"
#include "sched/task.hpp"
#include "sched/time.hpp"
#include "sched/workflow_config.hpp"

namespace conductor::sched {

namespace {

using Json = nlohmann::json;

/// Malformed snapshot content
class SnapshotFormatError final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <typename E> std::string enum_name(const E value) {
    return std::string{::wise_enum::to_string(value)};
}

template <typename E> E read_enum(const Json &node, const char *key) {
    const auto name = node.at(key).get<std::string>();
    const auto value = ::wise_enum::from_string<E>(name);
    if (!value) {
        throw SnapshotFormatError(std::format("Unknown value '{}' for '{}'", name, key));
    }
    return *value;
}

Nanos read_nanos(const Json &node, const char *key) {
    return Nanos{node.value(key, std::int64_t{0})};
}

Json error_record_to_json(const ErrorRecord &entry) {
    return Json{
            {"attempt", entry.attempt},
            {"timestamp_ns", entry.timestamp.count()},
            {"timestamp", Time::to_iso8601(entry.timestamp)},
            {"kind", enum_name(entry.kind)},
            {"message", entry.message},
            {"retry_delay_ns", entry.retry_delay.count()}};
}

ErrorRecord error_record_from_json(const Json &node) {
    return ErrorRecord{
            .attempt = node.at("attempt").get<std::uint32_t>(),
            .timestamp = read_nanos(node, "timestamp_ns"),
            .kind = read_enum<FailureKind>(node, "kind"),
            .message = node.value("message", std::string{}),
            .retry_delay = read_nanos(node, "retry_delay_ns")};
}

Json task_to_json(const TaskRecord &record) {
    Json history = Json::array();
    for (const auto &entry : record.error_history) {
        history.push_back(error_record_to_json(entry));
    }

    return Json{
            {"id", record.id},
            {"payload", Json{{"tag", record.payload.tag}, {"body", record.payload.body}}},
            {"priority", enum_name(record.priority)},
            {"dependencies", record.dependencies},
            {"tags", record.tags},
            {"status", enum_name(record.status)},
            {"attempts", record.attempts},
            {"max_attempts", record.max_attempts},
            {"timeout_ns", record.timeout.count()},
            {"sequence", record.sequence},
            {"created_at_ns", record.created_at.count()},
            {"started_at_ns", record.started_at.count()},
            {"finished_at_ns", record.finished_at.count()},
            {"wake_at_ns", record.wake_at.count()},
            {"result", record.result},
            {"error", record.error},
            {"failure_kind", enum_name(record.failure_kind)},
            {"blocked_by", record.blocked_by},
            {"error_history", std::move(history)}};
}

TaskRecord task_from_json(const Json &node) {
    TaskRecord record{};
    record.id = node.at("id").get<std::string>();
    if (node.contains("payload")) {
        const auto &payload = node.at("payload");
        record.payload.tag = payload.value("tag", std::string{});
        record.payload.body = payload.value("body", std::string{});
    }
    record.priority = read_enum<TaskPriority>(node, "priority");
    record.dependencies =
            node.value("dependencies", std::vector<std::string>{});
    record.tags = node.value("tags", std::vector<std::string>{});
    record.status = read_enum<TaskStatus>(node, "status");
    record.attempts = node.value("attempts", std::uint32_t{0});
    record.max_attempts = node.value("max_attempts", std::uint32_t{1});
    record.timeout = read_nanos(node, "timeout_ns");
    record.sequence = node.at("sequence").get<std::uint64_t>();
    record.created_at = read_nanos(node, "created_at_ns");
    record.started_at = read_nanos(node, "started_at_ns");
    record.finished_at = read_nanos(node, "finished_at_ns");
    record.wake_at = read_nanos(node, "wake_at_ns");
    record.result = node.value("result", std::string{});
    record.error = node.value("error", std::string{});
    record.failure_kind = node.contains("failure_kind")
                                  ? read_enum<FailureKind>(node, "failure_kind")
                                  : FailureKind::None;
    record.blocked_by = node.value("blocked_by", std::string{});
    if (node.contains("error_history")) {
        for (const auto &entry : node.at("error_history")) {
            record.error_history.push_back(error_record_from_json(entry));
        }
    }
    if (record.max_attempts == 0) {
        throw SnapshotFormatError(std::format("Task '{}' has zero max_attempts", record.id));
    }
    return record;
}

} // namespace

std::vector<std::string> QueueSnapshot::completed_tasks() const {
    std::vector<std::string> completed = retired_ids;
    for (const auto &record : tasks) {
        if (record.status == TaskStatus::Succeeded) {
            completed.push_back(record.id);
        }
    }
    return completed;
}

nlohmann::json to_json(const QueueSnapshot &snapshot) {
    Json tasks = Json::array();
    for (const auto &record : snapshot.tasks) {
        tasks.push_back(task_to_json(record));
    }

    return Json{
            {"version", SNAPSHOT_FORMAT_VERSION},
            {"workflow_id", snapshot.workflow_id},
            {"workflow_status", enum_name(snapshot.workflow_status)},
            {"next_sequence", snapshot.next_sequence},
            {"timestamp_ns", snapshot.timestamp.count()},
            {"timestamp", Time::to_iso8601(snapshot.timestamp)},
            {"tasks", std::move(tasks)},
            {"retired_ids", snapshot.retired_ids},
            {"completed_tasks", snapshot.completed_tasks()}};
}

tl::expected<QueueSnapshot, std::string> snapshot_from_json(const nlohmann::json &doc) {
    if (!doc.is_object()) {
        return tl::unexpected(std::string{"Snapshot root must be an object"});
    }

    try {
        const int version = doc.value("version", SNAPSHOT_FORMAT_VERSION);
        if (version != SNAPSHOT_FORMAT_VERSION) {
            return tl::unexpected(std::format("Unsupported snapshot version {}", version));
        }

        QueueSnapshot snapshot{};
        snapshot.workflow_id = doc.at("workflow_id").get<std::string>();
        snapshot.workflow_status = read_enum<WorkflowStatus>(doc, "workflow_status");
        snapshot.next_sequence = doc.value("next_sequence", std::uint64_t{0});
        snapshot.timestamp = read_nanos(doc, "timestamp_ns");
        for (const auto &node : doc.at("tasks")) {
            snapshot.tasks.push_back(task_from_json(node));
        }
        snapshot.retired_ids = doc.value("retired_ids", std::vector<std::string>{});
        return snapshot;
    } catch (const SnapshotFormatError &e) {
        return tl::unexpected(std::string{e.what()});
    } catch (const Json::exception &e) {
        return tl::unexpected(std::format("Malformed snapshot: {}", e.what()));
    }
}

tl::expected<QueueSnapshot, std::string> parse_snapshot(const std::string_view text) {
    const Json doc = Json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return tl::unexpected(std::string{"Snapshot is not valid JSON"});
    }
    return snapshot_from_json(doc);
}

std::error_code write_snapshot(const QueueSnapshot &snapshot, const std::filesystem::path &path) {
    std::filesystem::path temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            CD_LOGC_ERROR(
                    SchedLog::Snapshot, "Cannot open '{}' for writing", temp_path.string());
            return make_error_code(SchedErrc::FileOpenFailed);
        }
        file << to_json(snapshot).dump(2) << '\n';
        file.flush();
        if (!file.good()) {
            CD_LOGC_ERROR(SchedLog::Snapshot, "Failed writing '{}'", temp_path.string());
            std::error_code cleanup_error{};
            std::filesystem::remove(temp_path, cleanup_error);
            return make_error_code(SchedErrc::FileWriteFailed);
        }
    }

    std::error_code rename_error{};
    std::filesystem::rename(temp_path, path, rename_error);
    if (rename_error) {
        CD_LOGC_ERROR(
                SchedLog::Snapshot,
                "Failed to move snapshot into '{}': {}",
                path.string(),
                rename_error.message());
        std::error_code cleanup_error{};
        std::filesystem::remove(temp_path, cleanup_error);
        return make_error_code(SchedErrc::FileWriteFailed);
    }

    CD_LOGC_DEBUG(
            SchedLog::Snapshot,
            "Wrote snapshot of workflow '{}' ({} tasks) to '{}'",
            snapshot.workflow_id,
            snapshot.tasks.size(),
            path.string());
    return {};
}

tl::expected<QueueSnapshot, std::string> read_snapshot(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return tl::unexpected(std::format("Cannot open snapshot file '{}'", path.string()));
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    auto snapshot = parse_snapshot(contents.str());
    if (!snapshot) {
        CD_LOGC_ERROR(
                SchedLog::Snapshot, "Rejected snapshot '{}': {}", path.string(), snapshot.error());
        return tl::unexpected(std::format("{}: {}", path.string(), snapshot.error()));
    }
    return snapshot;
}

} // namespace conductor::sched
