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

#pragma once

#include <metasearch/client_options.hxx>

#include <core/utils/duration_parser.hxx>

#include <CLI/CLI.hpp>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace std::chrono
{
inline bool
lexical_cast(const std::string& input, std::chrono::milliseconds& value)
{
  try {
    value = std::chrono::duration_cast<std::chrono::milliseconds>(
      metasearch::core::utils::parse_duration(input));
  } catch (const metasearch::core::utils::duration_parse_error&) {
    try {
      value = std::chrono::milliseconds(std::stoull(input, nullptr, 10));
    } catch (const std::invalid_argument&) {
      // cannot parse input as duration: not a number
      return false;
    } catch (const std::out_of_range&) {
      // cannot parse input as duration: out of range
      return false;
    }
  }
  return true;
}

inline std::ostream&
operator<<(std::ostream& os, std::chrono::milliseconds duration)
{
  os << fmt::format("{}", duration);
  return os;
}
} // namespace std::chrono

namespace msc
{
struct connection_options {
  std::string base_url{};
};

struct security_options {
  std::string trust_certificate_path{};
  std::string tls_verify_mode{};
};

struct logger_options {
  std::string level{};
  std::string output_path{};
};

struct timeout_options {
  std::chrono::milliseconds connect_timeout{};
  std::chrono::milliseconds request_timeout{};
  std::chrono::milliseconds idle_http_connection_timeout{};
};

struct pagination_options {
  std::size_t empty_page_retries{};
  std::optional<std::size_t> transport_retry_limit{};
  std::chrono::milliseconds transport_retry_backoff{};
};

struct behavior_options {
  std::string user_agent_extra{};
  std::size_t max_idle_connections_per_host{};
};

struct common_options {
  connection_options connection{};
  security_options security{};
  logger_options logger{};
  timeout_options timeouts{};
  pagination_options pagination{};
  behavior_options behavior{};
};

void
add_common_options(CLI::App* app, common_options& options);

void
apply_logger_options(const logger_options& options);

auto
build_client_options(const common_options& options) -> metasearch::client_options;

auto
getenv_or_default(const std::string& var_name, const std::string& default_value) -> std::string;

[[noreturn]] void
fail(std::string_view message);
} // namespace msc
