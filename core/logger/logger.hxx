/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

/*
 *   A note on the thread safety of the logger API:
 *
 *   The API is thread safe unless the underlying logger object is changed during run-time, this
 * happens in create_*_logger() and reset(). The caller must guarantee no other threads are calling
 * the logging functions at this moment.
 */

#pragma once

#include "level.hxx"

#include <fmt/core.h>
#include <spdlog/fwd.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace metasearch::core::logger
{
struct configuration;

/**
 * Converts "trace", "debug", "info", "warning", "error", "critical" or "off" into level.
 *
 * Returns trace for strings it does not understand.
 */
auto
level_from_str(const std::string& str) -> level;

/**
 * Initialize the logger.
 *
 * See note about thread safety at the top of the file
 *
 * @param logger_settings the configuration for the logger
 * @return optional error message if something goes wrong
 */
auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>;

/**
 * Initialize the logger with the blackhole logger object
 *
 * This method is intended to be used by unit tests which don't need any output (but may call
 * methods who tries to fetch the logger)
 */
void
create_blackhole_logger();

/**
 * Initialize the logger with the logger which logs to the console
 */
void
create_console_logger();

/**
 * Get the underlying logger object, or nullptr if the logger has not been initialized
 */
auto
get() -> spdlog::logger*;

/**
 * Reset the underlying logger object
 */
void
reset();

/**
 * Set the log level of the logger
 */
void
set_log_levels(level lvl);

/**
 * Checks whether a specific level should be logged based on the current configuration.
 */
auto
should_log(level lvl) -> bool;

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail

template<typename String, typename... Args>
inline void
log(const char* file, int line, const char* function, level lvl, const String& msg, Args&&... args)
{
  detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
}

/**
 * Tell the logger to flush its buffers
 */
void
flush();

/**
 * Tell the logger to shut down (flush buffers) and release _ALL_ loggers
 */
void
shutdown();

auto
is_initialized() -> bool;
} // namespace metasearch::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define METASEARCH_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define METASEARCH_LOGGER_FUNCTION __FUNCTION__
#endif

/**
 * Arguments are not evaluated unless the severity is enabled.
 */
#define METASEARCH_LOG(file, line, function, severity, ...)                                        \
  do {                                                                                             \
    if (metasearch::core::logger::should_log(severity)) {                                          \
      metasearch::core::logger::log(file, line, function, severity, __VA_ARGS__);                  \
    }                                                                                              \
  } while (false)

#define MS_LOG_TRACE(...)                                                                          \
  METASEARCH_LOG(__FILE__,                                                                         \
                 __LINE__,                                                                         \
                 METASEARCH_LOGGER_FUNCTION,                                                       \
                 metasearch::core::logger::level::trace,                                           \
                 __VA_ARGS__)
#define MS_LOG_DEBUG(...)                                                                          \
  METASEARCH_LOG(__FILE__,                                                                         \
                 __LINE__,                                                                         \
                 METASEARCH_LOGGER_FUNCTION,                                                       \
                 metasearch::core::logger::level::debug,                                           \
                 __VA_ARGS__)
#define MS_LOG_INFO(...)                                                                           \
  METASEARCH_LOG(__FILE__,                                                                         \
                 __LINE__,                                                                         \
                 METASEARCH_LOGGER_FUNCTION,                                                       \
                 metasearch::core::logger::level::info,                                            \
                 __VA_ARGS__)
#define MS_LOG_WARNING(...)                                                                        \
  METASEARCH_LOG(__FILE__,                                                                         \
                 __LINE__,                                                                         \
                 METASEARCH_LOGGER_FUNCTION,                                                       \
                 metasearch::core::logger::level::warn,                                            \
                 __VA_ARGS__)
#define MS_LOG_ERROR(...)                                                                          \
  METASEARCH_LOG(__FILE__,                                                                         \
                 __LINE__,                                                                         \
                 METASEARCH_LOGGER_FUNCTION,                                                       \
                 metasearch::core::logger::level::err,                                             \
                 __VA_ARGS__)
#define MS_LOG_CRITICAL(...)                                                                       \
  METASEARCH_LOG(__FILE__,                                                                         \
                 __LINE__,                                                                         \
                 METASEARCH_LOGGER_FUNCTION,                                                       \
                 metasearch::core::logger::level::critical,                                        \
                 __VA_ARGS__)
