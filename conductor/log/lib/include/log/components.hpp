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
 * @file components.hpp
 * @brief Log levels and per-component level filtering
 */

#ifndef CONDUCTOR_LOG_COMPONENTS_HPP
#define CONDUCTOR_LOG_COMPONENTS_HPP

#include <array>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

#include <wise_enum.h>

namespace conductor::log {

/**
 * Log severity levels, most verbose first
 *
 * Shared by the logger and by the component filters.
 */
enum class LogLevel {
    TraceL1, //!< Fine grained tracing
    Debug,   //!< Debug messages
    Info,    //!< Informational messages
    Notice,  //!< Notice messages
    Warn,    //!< Warning messages
    Error,   //!< Error messages
    Critical //!< Critical error messages
};

} // namespace conductor::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(conductor::log::LogLevel, TraceL1, Debug, Info, Notice, Warn, Error, Critical)

namespace conductor::log {

/**
 * Get the default log level for new components
 *
 * @return Default log level (Info)
 */
LogLevel get_logger_default_level();

/**
 * Parse a log level from its name
 *
 * Accepts the enumerator names ("Debug", "Warn", ...) and their lower case
 * spellings ("debug", "warn", ...).
 *
 * @param[in] name Level name
 * @return Parsed level, or nullopt for an unknown name
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/**
 * Lookup table for contiguous wise_enum enumerations
 *
 * @note Requires enum values to be contiguous starting from 0
 * @tparam EnumType The enum type to create registry for
 */
template <typename EnumType> struct EnumRegistry final {
private:
    static constexpr std::size_t NUM_VALUES = ::wise_enum::size<EnumType>;

    static const std::array<std::string_view, NUM_VALUES> &get_name_table() {
        static const std::array<std::string_view, NUM_VALUES> table = [] {
            std::array<std::string_view, NUM_VALUES> names{};
            std::size_t idx = 0;
            for (auto value_and_name : ::wise_enum::range<EnumType>) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
                names[idx++] =
                        std::string_view{value_and_name.name.data(), value_and_name.name.size()};
            }
            return names;
        }();
        return table;
    }

public:
    /**
     * Get string name for enum value
     *
     * @param[in] value Enum value to get name for
     * @return Enum name, or "UNKNOWN" if out of range
     */
    static std::string_view get_name(const EnumType value) {
        const auto idx = static_cast<std::size_t>(value);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return idx < NUM_VALUES ? get_name_table()[idx] : std::string_view{"UNKNOWN"};
    }

    static constexpr bool is_valid(const EnumType value) {
        return static_cast<std::size_t>(value) < NUM_VALUES;
    }

    static constexpr std::size_t get_table_size() { return NUM_VALUES; }
};

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * Declare a log component enum with specified values
 *
 * @param ComponentType Name of the component enum type
 * @param ... List of component values
 */
#define DECLARE_LOG_COMPONENT(ComponentType, ...) WISE_ENUM_CLASS(ComponentType, __VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)

/**
 * Per-component log level storage
 *
 * One level per enumerator, indexed directly by the enum value so the check
 * in the logging macros stays a single array load.
 *
 * @tparam ComponentType The component enum type
 */
template <typename ComponentType> class ComponentLevelStorage final {
private:
    static constexpr std::size_t NUM_COMPONENTS = ::wise_enum::size<ComponentType>;
    static std::array<LogLevel, NUM_COMPONENTS> levels; //!< Per-component levels
    static std::once_flag init_flag;                    //!< Guards first initialization

public:
    static void initialize() {
        std::call_once(init_flag, []() { levels.fill(get_logger_default_level()); });
    }

    /**
     * Get the current log level for a component
     *
     * @param[in] component Component to query
     * @return Current log level for the component
     */
    static LogLevel get_level(const ComponentType component) {
        initialize();
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return levels[static_cast<std::size_t>(component)];
    }

    /**
     * Set log level for a specific component
     *
     * @param[in] component Component to configure
     * @param[in] level New log level for the component
     */
    static void set_level(const ComponentType component, const LogLevel level) {
        initialize();
        const auto idx = static_cast<std::size_t>(component);
        if (idx < NUM_COMPONENTS) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
            levels[idx] = level;
        }
    }

    /**
     * Check if a message should be logged for a component
     *
     * @param[in] component Component being logged to
     * @param[in] message_level Log level of the message
     * @return true if message should be logged
     */
    static bool should_log(const ComponentType component, const LogLevel message_level) {
        initialize();
        const auto idx = static_cast<std::size_t>(component);
        if (idx >= NUM_COMPONENTS) {
            return message_level >= get_logger_default_level();
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return message_level >= levels[idx];
    }

    static void set_all_levels(const LogLevel level) {
        initialize();
        levels.fill(level);
    }
};

template <typename ComponentType>
std::array<LogLevel, ComponentLevelStorage<ComponentType>::NUM_COMPONENTS>
        ComponentLevelStorage<ComponentType>::levels;

template <typename ComponentType> std::once_flag ComponentLevelStorage<ComponentType>::init_flag;

/**
 * Get string representation of component name
 *
 * @tparam ComponentType Component enum type
 * @param[in] component Component enum value
 * @return Component name
 */
template <typename ComponentType>
std::string_view format_component_name(const ComponentType component) {
    return EnumRegistry<ComponentType>::get_name(component);
}

/**
 * Register components with individual log levels
 *
 * @tparam ComponentType Component enum type
 * @param[in] component_levels Map of components to their log levels
 */
template <typename ComponentType>
void register_component(const std::unordered_map<ComponentType, LogLevel> &component_levels) {
    ComponentLevelStorage<ComponentType>::initialize();
    for (const auto &[component, level] : component_levels) {
        ComponentLevelStorage<ComponentType>::set_level(component, level);
    }
}

/**
 * Register all components with the same log level
 *
 * @tparam ComponentType Component enum type
 * @param[in] level Log level to assign to all components
 */
template <typename ComponentType> void register_component(const LogLevel level) {
    ComponentLevelStorage<ComponentType>::set_all_levels(level);
}

template <typename ComponentType>
[[nodiscard]] LogLevel get_component_level(const ComponentType component) {
    return ComponentLevelStorage<ComponentType>::get_level(component);
}

} // namespace conductor::log

#endif // CONDUCTOR_LOG_COMPONENTS_HPP
