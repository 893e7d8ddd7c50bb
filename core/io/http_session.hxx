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

#include "http_message.hxx"
#include "http_parser.hxx"
#include "streams.hxx"

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace metasearch::core::io
{
/**
 * HTTP/1.1 connection to the backend. Serves one request at a time and can be reused for the next
 * one when the server keeps the connection alive.
 */
class http_session : public std::enable_shared_from_this<http_session>
{
public:
  http_session(asio::io_context& ctx,
               std::string hostname,
               std::string service,
               std::string host_header,
               std::string user_agent,
               std::chrono::milliseconds connect_timeout);

  http_session(asio::io_context& ctx,
               asio::ssl::context& tls,
               std::string hostname,
               std::string service,
               std::string host_header,
               std::string user_agent,
               std::chrono::milliseconds connect_timeout);

  ~http_session();

  [[nodiscard]] auto log_prefix() const -> const std::string&;
  [[nodiscard]] auto id() const -> const std::string&;
  [[nodiscard]] auto is_connected() const -> bool;
  [[nodiscard]] auto hostname() const -> const std::string&;
  [[nodiscard]] auto port() const -> const std::string&;

  /**
   * Resolves the hostname and connects to the first reachable address. The callback receives the
   * error if none of the addresses accepted the connection in time.
   */
  void connect(std::function<void(std::error_code)>&& callback);
  void on_stop(std::function<void()> handler);
  void stop();

  [[nodiscard]] auto keep_alive() const -> bool;
  [[nodiscard]] auto is_stopped() const -> bool;

  void write_and_subscribe(http_request& request,
                           std::function<void(std::error_code, http_response&&)>&& handler);

  void set_idle(std::chrono::milliseconds timeout);
  auto reset_idle() -> bool;

private:
  struct response_context {
    std::function<void(std::error_code, http_response&&)> handler{};
    http_parser parser{};
  };

  void on_resolve(std::error_code ec, const asio::ip::tcp::resolver::results_type& endpoints);
  void do_connect(asio::ip::tcp::resolver::results_type::iterator it);
  void on_connect(const std::error_code& ec, asio::ip::tcp::resolver::results_type::iterator it);
  void do_read();
  void do_write();
  void write(const std::string_view& buf);
  void flush();
  void complete_current_response(std::error_code ec);
  void invoke_connect_callback(std::error_code ec);

  std::string id_;
  asio::io_context& ctx_;
  asio::ip::tcp::resolver resolver_;
  std::unique_ptr<stream_impl> stream_;
  asio::steady_timer connect_deadline_timer_;
  asio::steady_timer idle_timer_;

  std::string hostname_;
  std::string service_;
  std::string host_header_;
  std::string user_agent_;
  std::chrono::milliseconds connect_timeout_;
  std::string log_prefix_;

  std::atomic_bool stopped_{ false };
  std::atomic_bool connected_{ false };
  std::atomic_bool keep_alive_{ true };
  std::atomic_bool reading_{ false };

  std::function<void(std::error_code)> connect_callback_{};
  std::mutex connect_callback_mutex_{};
  std::error_code last_connect_error_{};
  std::function<void()> on_stop_handler_{ nullptr };

  response_context current_response_{};
  std::mutex current_response_mutex_{};

  std::array<std::uint8_t, 16384> input_buffer_{};
  std::vector<std::vector<std::uint8_t>> output_buffer_{};
  std::vector<std::vector<std::uint8_t>> writing_buffer_{};
  std::mutex output_buffer_mutex_{};
  std::mutex writing_buffer_mutex_{};
  asio::ip::tcp::resolver::results_type endpoints_{};
};
} // namespace metasearch::core::io
