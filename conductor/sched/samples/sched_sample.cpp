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
 * @file sched_sample.cpp
 * @brief Workflow orchestrator demonstration application
 */

#include <chrono>  // for chrono::milliseconds
#include <cstddef> // for size_t
#include <cstdlib> // for EXIT_SUCCESS, EXIT_FAILURE
#include <exception>
#include <format>   // for format
#include <iostream> // for cerr
#include <optional>
#include <string> // for string, to_string
#include <system_error>
#include <thread> // for this_thread::sleep_for
#include <utility>
#include <vector>

#include <tl/expected.hpp> // for expected, unexpected

#include <CLI/CLI.hpp> // for App, Range, IsMember, ParseError

#include "internal_use_only/config.hpp" // for project_name, project_version
#include "log/components.hpp"           // for register_component
#include "log/log_macros.hpp"           // for CD_LOG_INFO, CD_LOG_ERROR
#include "log/logger.hpp"               // for Logger, LoggerConfig
#include "sched/sched_errors.hpp"       // for get_error_name
#include "sched/sched_log.hpp"          // for SchedLog
#include "sched/task.hpp"               // for TaskDescriptor, ExecutionResult
#include "sched/workflow.hpp"           // for Workflow
#include "sched/workflow_config.hpp"    // for WorkflowConfig, load_workflow_config

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

namespace {
namespace cs = conductor::sched;
namespace cl = conductor::log;

struct AppConfig {
    std::string strategy{"parallel"};
    std::size_t max_concurrent{4};
    std::size_t tasks{15};
    std::size_t fail_every{0};
    int work_ms{20};
    std::string config_file;
    std::string snapshot_file;
    std::string log_file;
    bool restore{false};
};

/**
 * Parse command line arguments
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return Parsed configuration on success, empty string if --help or --version shown, error message
 * on failure
 */
tl::expected<AppConfig, std::string> parse_arguments(const int argc, const char **argv) {
    CLI::App app{std::format(
            "Workflow Orchestrator Demo - {} version {}",
            conductor::cmake::project_name,
            conductor::cmake::project_version)};

    AppConfig config{};
    app.add_option("-s,--strategy", config.strategy, "Dispatch strategy")
            ->check(CLI::IsMember({"sequential", "parallel", "adaptive"}, CLI::ignore_case));
    app.add_option("-m,--max-concurrent", config.max_concurrent, "Maximum concurrent tasks")
            ->check(CLI::Range(1, 256));
    app.add_option("-n,--tasks", config.tasks, "Number of tasks in the generated tree")
            ->check(CLI::Range(1, 10000));
    app.add_option(
               "-f,--fail-every",
               config.fail_every,
               "First attempt of every Nth task fails with a transient error (0 disables)")
            ->check(CLI::Range(0, 10000));
    app.add_option("-w,--work-ms", config.work_ms, "Simulated work per task in milliseconds")
            ->check(CLI::Range(0, 60000));
    app.add_option("-c,--config", config.config_file, "JSON workflow configuration file")
            ->check(CLI::ExistingFile);
    app.add_option("--snapshot", config.snapshot_file, "Snapshot file for persistence");
    app.add_option("--log-file", config.log_file, "Write logs to this file instead of console");
    app.add_flag("-r,--restore", config.restore, "Resume from the snapshot file")
            ->needs(app.get_option("--snapshot"));

    app.set_version_flag(
            "--version",
            std::string{conductor::cmake::project_version},
            "Show version information");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        const int exit_code = app.exit(e);
        if (exit_code == 0) {
            // Success codes (--help or --version) - return empty error string
            return tl::unexpected("");
        }
        return tl::unexpected(std::format("Argument parsing failed: {}", e.what()));
    }

    return config;
}

/**
 * Build the workflow configuration from the optional file and command line
 *
 * @param[in] app Parsed command line
 * @return Workflow configuration or error message
 */
tl::expected<cs::WorkflowConfig, std::string> make_workflow_config(const AppConfig &app) {
    cs::WorkflowConfig config{};
    if (!app.config_file.empty()) {
        auto loaded = cs::load_workflow_config(app.config_file);
        if (!loaded.has_value()) {
            return tl::unexpected(loaded.error());
        }
        config = std::move(loaded.value());
    } else {
        config.strategy = cs::parse_strategy(app.strategy).value_or(cs::WorkflowStrategy::Parallel);
        config.max_concurrent = app.max_concurrent;
        config.retry.backoff_base = std::chrono::milliseconds{100};
        config.retry.max_backoff = std::chrono::seconds{2};
    }
    if (config.workflow_id.empty()) {
        config.workflow_id = "demo_workflow";
    }
    if (!app.snapshot_file.empty()) {
        config.snapshot_path = app.snapshot_file;
    }
    return config;
}

/**
 * Generate a binary tree of tasks: task i depends on task (i - 1) / 2
 *
 * @param[in] count Number of tasks
 * @return Task descriptors in submission order
 */
std::vector<cs::TaskDescriptor> make_task_tree(const std::size_t count) {
    std::vector<cs::TaskDescriptor> tasks;
    tasks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto builder = cs::TaskDescriptor::create(std::format("task_{}", i))
                               .payload("simulate", std::to_string(i))
                               .tag(i % 2 == 0 ? "even" : "odd");
        if (i > 0) {
            builder.depends_on(std::format("task_{}", (i - 1) / 2));
        }
        if (i == 0) {
            builder.priority(cs::TaskPriority::Critical);
        }
        tasks.push_back(builder.build());
    }
    return tasks;
}

} // namespace

/**
 * Main application entry point
 *
 * Builds a tree of simulated tasks, runs it through the orchestrator with the
 * selected strategy and reports the workflow summary.
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return EXIT_SUCCESS when the workflow completes, EXIT_FAILURE otherwise
 */
int main(int argc, const char **argv) {
    try {
        const auto app = parse_arguments(argc, argv);
        if (!app.has_value()) {
            // Empty error string means --help or --version was shown (success)
            if (!app.error().empty()) {
                std::cerr << app.error() << '\n';
                return EXIT_FAILURE;
            }
            return EXIT_SUCCESS;
        }

        const auto config = make_workflow_config(app.value());
        if (!config.has_value()) {
            std::cerr << std::format("Invalid configuration: {}\n", config.error());
            return EXIT_FAILURE;
        }

        if (app->log_file.empty()) {
            cl::Logger::configure(cl::LoggerConfig::console(config->log_level));
        } else {
            cl::Logger::configure(cl::LoggerConfig::file(app->log_file, config->log_level));
        }
        cl::register_component<cs::SchedLog>(config->log_level);

        auto workflow = cs::Workflow::create("").config(config.value()).build();

        if (app->restore) {
            if (const auto ec = workflow->restore_from_snapshot_file(); ec) {
                CD_LOG_ERROR("Restore failed: {}", cs::get_error_name(ec));
                return EXIT_FAILURE;
            }
        } else if (const auto ec = workflow->add_tasks(make_task_tree(app->tasks)); ec) {
            CD_LOG_ERROR("Task submission failed: {}", cs::get_error_name(ec));
            return EXIT_FAILURE;
        }

        workflow->on_task_failed([](const cs::TaskRecord &record) {
            CD_LOG_WARN("Task '{}' did not succeed: {}", record.id, record.error);
        });

        const auto work = std::chrono::milliseconds{app->work_ms};
        const std::size_t fail_every = app->fail_every;
        const auto summary = workflow->process_queue(
                [work, fail_every](const cs::ExecutionContext &ctx) -> cs::ExecutionResult {
                    std::this_thread::sleep_for(work);
                    if (ctx.is_cancelled()) {
                        return cs::ExecutionResult::failure("interrupted");
                    }
                    const std::size_t index = std::stoul(ctx.payload->body);
                    if (fail_every > 0 && (index + 1) % fail_every == 0 && ctx.attempt == 1) {
                        return cs::ExecutionResult::failure("connection reset, try again");
                    }
                    return cs::ExecutionResult::ok(std::format("done in {} attempt(s)", ctx.attempt));
                });

        CD_LOG_INFO("{}", summary.message());
        for (const auto &group : workflow->parallel_groups()) {
            CD_LOG_DEBUG("Parallel group of {} tasks, first '{}'", group.size(), group.front());
        }
        cl::Logger::flush();

        return summary.status == cs::WorkflowStatus::Completed ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception &e) {
        std::cerr << std::format("Unhandled exception: {}\n", e.what());
        return EXIT_FAILURE;
    } catch (...) {
        std::cerr << "Unknown exception occurred\n";
        return EXIT_FAILURE;
    }
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
