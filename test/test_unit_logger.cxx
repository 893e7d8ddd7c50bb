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

#include "test_helper.hxx"

#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <memory>
#include <string>
#include <vector>

namespace
{
/**
 * Replaces the global logger for the duration of the test and restores console logger afterwards.
 */
class captured_logger
{
public:
  explicit captured_logger(metasearch::core::logger::level lvl)
    : sink_{ std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64) }
  {
    metasearch::core::logger::configuration configuration{};
    configuration.console = false;
    configuration.unit_test = true;
    configuration.log_level = lvl;
    configuration.sink = sink_;
    auto error = metasearch::core::logger::create_file_logger(configuration);
    REQUIRE_FALSE(error.has_value());
  }

  captured_logger(const captured_logger&) = delete;
  captured_logger(captured_logger&&) = delete;
  auto operator=(const captured_logger&) -> captured_logger& = delete;
  auto operator=(captured_logger&&) -> captured_logger& = delete;

  ~captured_logger()
  {
    metasearch::core::logger::reset();
    test::utils::reset_logger();
  }

  [[nodiscard]] auto lines() const -> std::vector<std::string>
  {
    return sink_->last_formatted();
  }

private:
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};
} // namespace

TEST_CASE("unit: logger level from string", "[unit]")
{
  using metasearch::core::logger::level;
  using metasearch::core::logger::level_from_str;

  CHECK(level_from_str("trace") == level::trace);
  CHECK(level_from_str("debug") == level::debug);
  CHECK(level_from_str("info") == level::info);
  CHECK(level_from_str("warning") == level::warn);
  CHECK(level_from_str("warn") == level::warn);
  CHECK(level_from_str("error") == level::err);
  CHECK(level_from_str("critical") == level::critical);
  CHECK(level_from_str("off") == level::off);
  CHECK(level_from_str("verbose") == level::trace);
}

TEST_CASE("unit: logger filters messages below configured level", "[unit]")
{
  captured_logger logger{ metasearch::core::logger::level::info };

  MS_LOG_DEBUG("invisible {}", 1);
  MS_LOG_INFO("visible {}", 2);
  MS_LOG_WARNING("visible {}", 3);
  metasearch::core::logger::flush();

  auto lines = logger.lines();
  REQUIRE(lines.size() == 2);
  CHECK(lines[0].find("visible 2") != std::string::npos);
  CHECK(lines[1].find("visible 3") != std::string::npos);
  CHECK_FALSE(metasearch::core::logger::should_log(metasearch::core::logger::level::debug));
  CHECK(metasearch::core::logger::should_log(metasearch::core::logger::level::err));
}

TEST_CASE("unit: logger level can be changed at runtime", "[unit]")
{
  captured_logger logger{ metasearch::core::logger::level::warn };

  MS_LOG_INFO("first");
  metasearch::core::logger::set_log_levels(metasearch::core::logger::level::trace);
  MS_LOG_TRACE("second");
  metasearch::core::logger::flush();

  auto lines = logger.lines();
  REQUIRE(lines.size() == 1);
  CHECK(lines[0].find("second") != std::string::npos);
}

TEST_CASE("unit: logger is silent when not initialized", "[unit]")
{
  metasearch::core::logger::reset();
  CHECK_FALSE(metasearch::core::logger::is_initialized());
  CHECK_FALSE(metasearch::core::logger::should_log(metasearch::core::logger::level::critical));
  MS_LOG_CRITICAL("goes nowhere");
  test::utils::reset_logger();
  CHECK(metasearch::core::logger::is_initialized());
}
