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
#include <metasearch/error.hxx>
#include <metasearch/search_request.hxx>

#include <memory>
#include <string>
#include <utility>

namespace asio
{
class io_context;
} // namespace asio

namespace metasearch
{
#ifndef METASEARCH_CXX_CLIENT_DOXYGEN
namespace core
{
class search_component;
namespace io
{
class http_transport;
} // namespace io
} // namespace core
#endif

/**
 * Entry point of the library, bound to a single backend.
 *
 * The client owns a pool of HTTP connections, create it once and share it between searches.
 *
 * @since 1.0.0
 * @committed
 */
class client
{
public:
  /**
   * Creates client with its own HTTP transport running on @p io.
   *
   * @param base_url location of the backend, e.g. "https://searx.example" or
   * "http://localhost:8888/searx/". Trailing slashes are removed and "/search" is appended.
   *
   * @exception errc::common::invalid_argument the base URL cannot be parsed, or the trust
   * certificate cannot be loaded
   * @exception errc::network::unsupported_scheme the scheme is neither "http" nor "https"
   */
  [[nodiscard]] static auto create(asio::io_context& io,
                                   const std::string& base_url,
                                   const client_options& options = {}) -> std::pair<error, client>;

  /**
   * Creates client which sends its requests through the given transport.
   */
  [[nodiscard]] static auto create(asio::io_context& io,
                                   const std::string& base_url,
                                   std::shared_ptr<core::io::http_transport> transport,
                                   const client_options& options = {}) -> std::pair<error, client>;

  client() = default;

  /**
   * Starts a search for @p query. The parameters can be refined on the returned builder.
   */
  [[nodiscard]] auto search(std::string query) const -> search_request;

  /**
   * Full URL of the search endpoint.
   */
  [[nodiscard]] auto endpoint() const -> std::string;

  /**
   * Closes pooled connections. Requests in flight fail with errc::common::request_canceled.
   */
  void close() const;

private:
  explicit client(std::shared_ptr<core::search_component> component);

  std::shared_ptr<core::search_component> component_{};
};
} // namespace metasearch
