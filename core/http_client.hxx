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

#include "core/io/http_transport.hxx"
#include "core/utils/base_url.hxx"

#include <metasearch/tls_verify_mode.hxx>

#include <asio/io_context.hpp>
#include <asio/ssl/context.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace metasearch::core
{
namespace io
{
class http_session;
} // namespace io

struct http_client_options {
  std::string user_agent{};
  std::chrono::milliseconds connect_timeout{ std::chrono::seconds{ 10 } };
  std::chrono::milliseconds request_timeout{ std::chrono::seconds{ 10 } };
  std::chrono::milliseconds idle_http_connection_timeout{ std::chrono::hours{ 1 } };
  std::size_t max_idle_connections_per_host{ 100 };
  tls_verify_mode tls_verify{ tls_verify_mode::peer };
  std::optional<std::string> trust_certificate{};
};

/**
 * HTTP/1.1 transport bound to a single backend. Keeps connections alive between requests and pools
 * them, so the sequential page requests of an operation usually share one connection.
 */
class http_client
  : public io::http_transport
  , public std::enable_shared_from_this<http_client>
{
public:
  /**
   * @return invalid_argument if the trust certificate cannot be loaded, unsupported_scheme if the
   * endpoint is neither http nor https.
   */
  static auto create(asio::io_context& io, utils::base_url endpoint, http_client_options options)
    -> std::pair<std::error_code, std::shared_ptr<http_client>>;

  http_client(asio::io_context& io, utils::base_url endpoint, http_client_options options);
  http_client(const http_client&) = delete;
  http_client(http_client&&) = delete;
  auto operator=(const http_client&) -> http_client& = delete;
  auto operator=(http_client&&) -> http_client& = delete;
  ~http_client() override;

  void execute(io::http_request request, response_handler&& handler) override;
  void close() override;

  [[nodiscard]] auto endpoint() const -> const utils::base_url&;
  [[nodiscard]] auto number_of_idle_sessions() const -> std::size_t;

private:
  struct pending_request;

  auto configure_tls() -> std::error_code;
  auto check_out() -> std::pair<std::shared_ptr<io::http_session>, bool>;
  void check_in(const std::shared_ptr<io::http_session>& session);
  void release(const std::shared_ptr<io::http_session>& session);
  void dispatch(io::http_request request, std::shared_ptr<pending_request> pending);
  void send(const std::shared_ptr<io::http_session>& session,
            io::http_request request,
            std::shared_ptr<pending_request> pending,
            bool reused);

  asio::io_context& ctx_;
  asio::ssl::context tls_;
  utils::base_url endpoint_;
  http_client_options options_;
  std::atomic_bool closed_{ false };

  std::list<std::shared_ptr<io::http_session>> idle_sessions_{};
  std::list<std::shared_ptr<io::http_session>> busy_sessions_{};
  mutable std::mutex sessions_mutex_{};
};
} // namespace metasearch::core
