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

#include <metasearch/pagination_options.hxx>
#include <metasearch/tls_verify_mode.hxx>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace metasearch
{
/**
 * Options for @ref client, shared by every request it sends.
 *
 * @since 1.0.0
 * @committed
 */
class client_options
{
public:
  static constexpr std::chrono::milliseconds default_connect_timeout{ std::chrono::seconds{ 10 } };
  static constexpr std::chrono::milliseconds default_request_timeout{ std::chrono::seconds{ 10 } };
  static constexpr std::chrono::milliseconds default_idle_http_connection_timeout{
    std::chrono::hours{ 1 }
  };
  static constexpr std::size_t default_max_idle_connections_per_host{ 100 };

  /**
   * Appended to the "user-agent" header of every request.
   */
  auto user_agent_extra(std::string extra) -> client_options&
  {
    user_agent_extra_ = std::move(extra);
    return *this;
  }

  auto connect_timeout(std::chrono::milliseconds timeout) -> client_options&
  {
    connect_timeout_ = timeout;
    return *this;
  }

  /**
   * Time budget of a single HTTP exchange, including connection setup.
   */
  auto request_timeout(std::chrono::milliseconds timeout) -> client_options&
  {
    request_timeout_ = timeout;
    return *this;
  }

  /**
   * How long an unused keep-alive connection stays in the pool.
   */
  auto idle_http_connection_timeout(std::chrono::milliseconds timeout) -> client_options&
  {
    idle_http_connection_timeout_ = timeout;
    return *this;
  }

  auto max_idle_connections_per_host(std::size_t connections) -> client_options&
  {
    max_idle_connections_per_host_ = connections;
    return *this;
  }

  auto tls_verify(tls_verify_mode mode) -> client_options&
  {
    tls_verify_ = mode;
    return *this;
  }

  /**
   * Path to a PEM file with additional trusted certificates, system trust store is used as well.
   */
  auto trust_certificate(std::string certificate_path) -> client_options&
  {
    trust_certificate_ = std::move(certificate_path);
    return *this;
  }

  [[nodiscard]] auto pagination() -> pagination_options&
  {
    return pagination_;
  }

  auto pagination(pagination_options options) -> client_options&
  {
    pagination_ = std::move(options);
    return *this;
  }

  struct built {
    std::string user_agent_extra;
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds request_timeout;
    std::chrono::milliseconds idle_http_connection_timeout;
    std::size_t max_idle_connections_per_host;
    tls_verify_mode tls_verify;
    std::optional<std::string> trust_certificate;
    pagination_options::built pagination;
  };

  [[nodiscard]] auto build() const -> built
  {
    return {
      user_agent_extra_,
      connect_timeout_,
      request_timeout_,
      idle_http_connection_timeout_,
      max_idle_connections_per_host_,
      tls_verify_,
      trust_certificate_,
      pagination_.build(),
    };
  }

private:
  std::string user_agent_extra_{};
  std::chrono::milliseconds connect_timeout_{ default_connect_timeout };
  std::chrono::milliseconds request_timeout_{ default_request_timeout };
  std::chrono::milliseconds idle_http_connection_timeout_{ default_idle_http_connection_timeout };
  std::size_t max_idle_connections_per_host_{ default_max_idle_connections_per_host };
  tls_verify_mode tls_verify_{ tls_verify_mode::peer };
  std::optional<std::string> trust_certificate_{};
  pagination_options pagination_{};
};
} // namespace metasearch
