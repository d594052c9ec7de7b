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
 * @file logger.hpp
 * @brief Process logger backed by quill
 *
 * Wraps a single quill logger with a small configuration surface. Scheduler
 * code never talks to quill directly; it goes through the CD_LOG macros in
 * log_macros.hpp which resolve the logger through detail::get_quill_logger().
 */

#ifndef CONDUCTOR_LOG_LOGGER_HPP
#define CONDUCTOR_LOG_LOGGER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// Disable Quill's non-prefixed macros to avoid conflicts
#define QUILL_DISABLE_NON_PREFIXED_MACROS

#include <quill/Backend.h>
#include <quill/DeferredFormatCodec.h>
#include <quill/DirectFormatCodec.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/Sink.h>
#include <quill/std/Vector.h>

#include <wise_enum.h>

#include "log/components.hpp"

namespace conductor::log {

/**
 * Frontend options for the scheduler logger
 *
 * The coordinating loop must never stall on a full log queue, so the queue is
 * bounded and drops on overflow.
 */
struct SchedulerFrontendOptions final {
    static constexpr quill::QueueType queue_type = // NOLINT(readability-identifier-naming)
            quill::QueueType::BoundedDropping;
    static constexpr std::uint32_t initial_queue_capacity = // NOLINT(readability-identifier-naming)
            1024 * 1024;                                    //!< 1 MB per producing thread
    static constexpr std::uint32_t
            blocking_queue_retry_interval_ns = 0; // NOLINT(readability-identifier-naming)
    static constexpr std::size_t
            unbounded_queue_max_capacity = 0; // NOLINT(readability-identifier-naming)
    static constexpr quill::HugePagesPolicy huge_pages_policy = // NOLINT(readability-identifier-naming)
            quill::HugePagesPolicy::Never;
};

using SchedulerFrontend = quill::FrontendImpl<SchedulerFrontendOptions>;
using SchedulerLogger = quill::LoggerImpl<SchedulerFrontendOptions>;

/// Supported log output destinations
enum class SinkType {
    Console,      //!< Console output
    File,         //!< Plain file output
    RotatingFile, //!< Size and time rotated file output
    JsonFile      //!< Structured JSON file output
};

} // namespace conductor::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(conductor::log::SinkType, Console, File, RotatingFile, JsonFile)

namespace conductor::log {

/**
 * Configuration for logger initialization
 */
struct LoggerConfig final {
    SinkType sink_type{SinkType::Console}; //!< Output destination
    std::string log_file;                  //!< Path for file based sinks
    LogLevel min_level{LogLevel::Info};    //!< Minimum level to process
    bool enable_colors{true};              //!< Colour console output
    bool enable_file_line{true};           //!< Include source file and line
    bool enable_thread_name{true};         //!< Include thread name
    static constexpr std::chrono::microseconds DEFAULT_BACKEND_SLEEP{100};
    std::chrono::nanoseconds backend_sleep_duration{DEFAULT_BACKEND_SLEEP}; //!< Backend idle sleep

    /**
     * Create console logger configuration (default)
     *
     * @param[in] level Minimum log level to process
     * @param[in] colors Enable color output
     * @return LoggerConfig configured for console output
     */
    static LoggerConfig console(LogLevel level = LogLevel::Info, bool colors = true);

    /**
     * Create file logger configuration
     *
     * @param[in] path Path to the log file
     * @param[in] level Minimum log level to process
     * @return LoggerConfig configured for file output
     */
    static LoggerConfig file(std::string path, LogLevel level = LogLevel::Info);

    static LoggerConfig rotating_file(std::string path, LogLevel level = LogLevel::Info);

    static LoggerConfig json_file(std::string path, LogLevel level = LogLevel::Info);

    LoggerConfig &with_file_line(bool enable = true);
    LoggerConfig &with_thread_name(bool enable = true);
    LoggerConfig &with_colors(bool enable = true);
    LoggerConfig &with_backend_sleep_duration(std::chrono::nanoseconds duration);
};

namespace detail {
/**
 * Get the process quill logger, creating a console logger on first use
 *
 * @return Pointer to the active logger
 */
SchedulerLogger *get_quill_logger();
} // namespace detail

/**
 * Process wide logger
 *
 * Owns the quill backend thread and the single frontend logger used by the
 * logging macros. Reconfiguration replaces the logger and restarts the
 * backend, so it belongs in application start-up, not in hot paths.
 */
class Logger final {
public:
    /**
     * Replace the active logger
     *
     * @param[in] config Logger configuration
     * @throws std::invalid_argument if a file sink is requested without a path
     */
    static void configure(const LoggerConfig &config);

    static void set_level(LogLevel level);

    /// Block until every queued message has been written
    static void flush();

    [[nodiscard]] static SinkType get_sink_type();

    [[nodiscard]] static LogLevel get_current_level();

    /**
     * Get the log file path actually opened by the sink
     *
     * @return Path, or empty string for console output
     */
    [[nodiscard]] static std::string get_actual_log_file();

    ~Logger() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

private:
    explicit Logger(const LoggerConfig &config);

    [[nodiscard]] static std::unique_ptr<Logger> &get_instance();

    [[nodiscard]] std::shared_ptr<quill::Sink> create_sink(const LoggerConfig &config);

    static quill::LogLevel to_quill_level(LogLevel level);
    static LogLevel from_quill_level(quill::LogLevel level);

    SinkType sink_type_{SinkType::Console}; //!< Configured sink type
    std::string actual_log_file_;           //!< File opened by the sink
    SchedulerLogger *quill_logger_{nullptr};  //!< Underlying quill logger

    friend SchedulerLogger *detail::get_quill_logger();
};

} // namespace conductor::log

#endif // CONDUCTOR_LOG_LOGGER_HPP
