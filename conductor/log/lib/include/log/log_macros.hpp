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
 * @file log_macros.hpp
 * @brief Logging macros for plain and component scoped messages
 */

#ifndef CONDUCTOR_LOG_LOG_MACROS_HPP
#define CONDUCTOR_LOG_LOG_MACROS_HPP

#include <quill/LogMacros.h>

#include "log/components.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#endif

#define CD_GET_LOGGER() ::conductor::log::detail::get_quill_logger()

/**
 * Helper macro for component logging
 *
 * Checks the component level before formatting anything.
 *
 * @param level_enum Conductor log level enumerator
 * @param quill_level Matching quill macro suffix
 * @param component Component to log for
 * @param message Log message format string
 * @param ... Format arguments
 */
#define CD_LOGC_HELPER(level_enum, quill_level, component, message, ...)                           \
    do {                                                                                           \
        if (::conductor::log::ComponentLevelStorage<decltype(component)>::should_log(              \
                    component, ::conductor::log::LogLevel::level_enum)) {                          \
            QUILL_LOG_##quill_level(                                                               \
                    CD_GET_LOGGER(),                                                               \
                    "[{}] " message,                                                               \
                    ::conductor::log::format_component_name(component),                            \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

/**
 * Make a value type loggable; it is copied and formatted on the backend thread
 *
 * @code
 * CD_LOGGABLE_DEFERRED_FORMAT(Stats, "running: {}, pending: {}", obj.running, obj.pending)
 * @endcode
 */
#define CD_LOGGABLE_DEFERRED_FORMAT(type, format_str, ...)                                         \
    template <> struct fmtquill::formatter<type> {                                                 \
        constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {                 \
            return ctx.begin();                                                                    \
        }                                                                                          \
                                                                                                   \
        template <typename FormatContext>                                                          \
        auto format(const type &obj, FormatContext &ctx) const -> decltype(ctx.out()) {            \
            return fmtquill::format_to(ctx.out(), #type "(" format_str ")", __VA_ARGS__);          \
        }                                                                                          \
    };                                                                                             \
                                                                                                   \
    template <> struct quill::Codec<type> : quill::DeferredFormatCodec<type> {};

#define CD_LOG_TRACE_L1(fmt, ...) QUILL_LOG_TRACE_L1(CD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define CD_LOGC_TRACE_L1(c, m, ...) CD_LOGC_HELPER(TraceL1, TRACE_L1, c, m, ##__VA_ARGS__)

#define CD_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(CD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define CD_LOGC_DEBUG(c, m, ...) CD_LOGC_HELPER(Debug, DEBUG, c, m, ##__VA_ARGS__)

#define CD_LOG_INFO(fmt, ...) QUILL_LOG_INFO(CD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define CD_LOGC_INFO(c, m, ...) CD_LOGC_HELPER(Info, INFO, c, m, ##__VA_ARGS__)

#define CD_LOG_NOTICE(fmt, ...) QUILL_LOG_NOTICE(CD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define CD_LOGC_NOTICE(c, m, ...) CD_LOGC_HELPER(Notice, NOTICE, c, m, ##__VA_ARGS__)

#define CD_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(CD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define CD_LOGC_WARN(c, m, ...) CD_LOGC_HELPER(Warn, WARNING, c, m, ##__VA_ARGS__)

#define CD_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(CD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define CD_LOGC_ERROR(c, m, ...) CD_LOGC_HELPER(Error, ERROR, c, m, ##__VA_ARGS__)

#define CD_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(CD_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define CD_LOGC_CRITICAL(c, m, ...) CD_LOGC_HELPER(Critical, CRITICAL, c, m, ##__VA_ARGS__)

#ifdef __clang__
#pragma clang diagnostic pop
#endif

// NOLINTEND(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)

#endif // CONDUCTOR_LOG_LOG_MACROS_HPP
