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
 * @file workflow_config.cpp
 * @brief Workflow configuration implementation
 */

#include <algorithm>   // for equal
#include <cctype>      // for tolower
#include <chrono>      // for milliseconds
#include <cstddef>     // for size_t
#include <cstdint>     // for int64_t, uint32_t
#include <exception>   // for exception
#include <filesystem>  // for path, exists
#include <format>      // for format
#include <fstream>     // for ifstream
#include <optional>    // for optional, nullopt
#include <sstream>     // for ostringstream
#include <stdexcept>   // for invalid_argument
#include <string>      // for string
#include <string_view> // for string_view
#include <utility>     // for move

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>
#include <wise_enum.h>

#include "log/components.hpp"
#include "log/log_macros.hpp"
#include "sched/sched_log.hpp"
#include "sched/workflow_config.hpp"

namespace conductor::sched {

namespace {

using Json = nlohmann::json;

bool iequals(const std::string_view a, const std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](const char x, const char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

/// Read a non-negative millisecond count
tl::expected<Nanos, std::string> read_millis(const Json &node, const std::string_view key) {
    const auto &value = node.at(std::string{key});
    if (!value.is_number_integer() && !value.is_number_unsigned()) {
        return tl::unexpected(std::format("'{}' must be an integer number of milliseconds", key));
    }
    const auto millis = value.get<std::int64_t>();
    if (millis < 0) {
        return tl::unexpected(std::format("'{}' must not be negative, got {}", key, millis));
    }
    return std::chrono::milliseconds{millis};
}

tl::expected<bool, std::string> read_bool(const Json &node, const std::string_view key) {
    const auto &value = node.at(std::string{key});
    if (!value.is_boolean()) {
        return tl::unexpected(std::format("'{}' must be a boolean", key));
    }
    return value.get<bool>();
}

tl::expected<std::string, std::string> read_string(const Json &node, const std::string_view key) {
    const auto &value = node.at(std::string{key});
    if (!value.is_string()) {
        return tl::unexpected(std::format("'{}' must be a string", key));
    }
    return value.get<std::string>();
}

tl::expected<std::uint32_t, std::string>
read_positive(const Json &node, const std::string_view key) {
    const auto &value = node.at(std::string{key});
    if (!value.is_number_integer() && !value.is_number_unsigned()) {
        return tl::unexpected(std::format("'{}' must be an integer", key));
    }
    const auto number = value.get<std::int64_t>();
    static constexpr std::int64_t MAX_VALUE = 1'000'000;
    if (number < 1 || number > MAX_VALUE) {
        return tl::unexpected(
                std::format("'{}' must be between 1 and {}, got {}", key, MAX_VALUE, number));
    }
    return static_cast<std::uint32_t>(number);
}

std::optional<std::string> apply_retry(const Json &node, RetryPolicy &retry) {
    if (!node.is_object()) {
        return "'retry' must be an object";
    }
    if (node.contains("max_attempts")) {
        const auto attempts = read_positive(node, "max_attempts");
        if (!attempts) {
            return attempts.error();
        }
        retry.max_attempts = *attempts;
    }
    if (node.contains("backoff_base_ms")) {
        const auto base = read_millis(node, "backoff_base_ms");
        if (!base) {
            return base.error();
        }
        retry.backoff_base = *base;
    }
    if (node.contains("backoff_multiplier")) {
        const auto &value = node.at("backoff_multiplier");
        if (!value.is_number()) {
            return "'backoff_multiplier' must be a number";
        }
        retry.backoff_multiplier = value.get<double>();
        if (retry.backoff_multiplier < 1.0) {
            return std::format(
                    "'backoff_multiplier' must be at least 1.0, got {}", retry.backoff_multiplier);
        }
    }
    if (node.contains("max_backoff_ms")) {
        const auto max_backoff = read_millis(node, "max_backoff_ms");
        if (!max_backoff) {
            return max_backoff.error();
        }
        retry.max_backoff = *max_backoff;
    }
    if (node.contains("classify_errors")) {
        const auto classify = read_bool(node, "classify_errors");
        if (!classify) {
            return classify.error();
        }
        retry.classify_errors = *classify;
    }
    return std::nullopt;
}

std::optional<std::string> apply_document(const Json &doc, WorkflowConfig &config) {
    if (doc.contains("workflow_id")) {
        const auto id = read_string(doc, "workflow_id");
        if (!id) {
            return id.error();
        }
        config.workflow_id = *id;
    }
    if (doc.contains("strategy")) {
        const auto name = read_string(doc, "strategy");
        if (!name) {
            return name.error();
        }
        const auto strategy = parse_strategy(*name);
        if (!strategy.has_value()) {
            return std::format(
                    "Unknown strategy '{}', expected sequential, parallel or adaptive", *name);
        }
        config.strategy = strategy.value();
    }
    if (doc.contains("max_concurrent")) {
        const auto max_concurrent = read_positive(doc, "max_concurrent");
        if (!max_concurrent) {
            return max_concurrent.error();
        }
        config.max_concurrent = *max_concurrent;
    }
    if (doc.contains("continue_on_failure")) {
        const auto cof = read_bool(doc, "continue_on_failure");
        if (!cof) {
            return cof.error();
        }
        config.continue_on_failure = *cof;
    }
    if (doc.contains("retry")) {
        if (auto error = apply_retry(doc.at("retry"), config.retry); error.has_value()) {
            return error;
        }
    }
    if (doc.contains("default_timeout_ms")) {
        const auto timeout = read_millis(doc, "default_timeout_ms");
        if (!timeout) {
            return timeout.error();
        }
        config.default_timeout = *timeout;
    }
    if (doc.contains("snapshot_path")) {
        const auto path = read_string(doc, "snapshot_path");
        if (!path) {
            return path.error();
        }
        config.snapshot_path = *path;
    }
    if (doc.contains("snapshot_interval_ms")) {
        const auto interval = read_millis(doc, "snapshot_interval_ms");
        if (!interval) {
            return interval.error();
        }
        if (*interval == Nanos{0}) {
            return "'snapshot_interval_ms' must be positive";
        }
        config.snapshot_interval = *interval;
    }
    if (doc.contains("idle_poll_ms")) {
        const auto idle_poll = read_millis(doc, "idle_poll_ms");
        if (!idle_poll) {
            return idle_poll.error();
        }
        if (*idle_poll == Nanos{0}) {
            return "'idle_poll_ms' must be positive";
        }
        config.idle_poll = *idle_poll;
    }
    if (doc.contains("adaptive_counts_degraded_tasks")) {
        const auto counts = read_bool(doc, "adaptive_counts_degraded_tasks");
        if (!counts) {
            return counts.error();
        }
        config.adaptive_counts_degraded_tasks = *counts;
    }
    if (doc.contains("log_level")) {
        const auto name = read_string(doc, "log_level");
        if (!name) {
            return name.error();
        }
        const auto level = log::parse_log_level(*name);
        if (!level.has_value()) {
            return std::format("Unknown log level '{}'", *name);
        }
        config.log_level = level.value();
    }
    return std::nullopt;
}

} // namespace

std::optional<WorkflowStrategy> parse_strategy(const std::string_view name) {
    for (const auto &value_and_name : ::wise_enum::range<WorkflowStrategy>) {
        if (iequals(value_and_name.name, name)) {
            return value_and_name.value;
        }
    }
    return std::nullopt;
}

void WorkflowConfig::validate() const {
    if (workflow_id.empty()) {
        log_and_throw<std::invalid_argument>(SchedLog::Config, "workflow_id must not be empty");
    }
    if (max_concurrent == 0) {
        log_and_throw<std::invalid_argument>(
                SchedLog::Config, "Workflow '{}': max_concurrent must be at least 1", workflow_id);
    }
    if (default_timeout < Nanos{0}) {
        log_and_throw<std::invalid_argument>(
                SchedLog::Config, "Workflow '{}': default_timeout must not be negative", workflow_id);
    }
    if (snapshot_interval <= Nanos{0} || idle_poll <= Nanos{0}) {
        log_and_throw<std::invalid_argument>(
                SchedLog::Config,
                "Workflow '{}': snapshot_interval and idle_poll must be positive",
                workflow_id);
    }
    retry.validate();
}

tl::expected<WorkflowConfig, std::string> parse_workflow_config(const std::string_view json_text) {
    const Json doc = Json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return tl::unexpected(std::string{"Configuration is not valid JSON"});
    }
    if (!doc.is_object()) {
        return tl::unexpected(std::string{"Configuration root must be an object"});
    }

    WorkflowConfig config{};
    try {
        if (auto error = apply_document(doc, config); error.has_value()) {
            return tl::unexpected(std::move(error.value()));
        }
    } catch (const Json::exception &e) {
        return tl::unexpected(std::format("Configuration value out of range: {}", e.what()));
    }

    CD_LOGC_DEBUG(
            SchedLog::Config,
            "Parsed configuration for workflow '{}': strategy={}, max_concurrent={}",
            config.workflow_id,
            ::wise_enum::to_string(config.strategy),
            config.max_concurrent);
    return config;
}

tl::expected<WorkflowConfig, std::string>
load_workflow_config(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return tl::unexpected(std::format("Cannot open configuration file '{}'", path.string()));
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    auto config = parse_workflow_config(contents.str());
    if (!config) {
        return tl::unexpected(std::format("{}: {}", path.string(), config.error()));
    }
    return config;
}

} // namespace conductor::sched
