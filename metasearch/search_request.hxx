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

#include <metasearch/error.hxx>
#include <metasearch/search_parameters.hxx>
#include <metasearch/search_response.hxx>
#include <metasearch/search_result.hxx>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace metasearch
{
#ifndef METASEARCH_CXX_CLIENT_DOXYGEN
namespace core
{
class search_component;
} // namespace core
#endif

using search_handler = std::function<void(error, search_response)>;
using search_get_num_handler = std::function<void(error, std::vector<search_result>)>;

/**
 * Builder of a search, obtained from @ref client::search.
 *
 * The value is cheap to copy, all copies share the transport of the client they were created by.
 * Configuring never fails, invalid values are reported when the request is sent.
 *
 * @since 1.0.0
 * @committed
 */
class search_request
{
public:
  search_request(std::shared_ptr<core::search_component> component, std::string query);

  /**
   * Sets or overwrites the 1-based page number. The value is not checked, the backend is
   * authoritative.
   */
  auto with_page(std::uint32_t page) -> search_request&;

  /**
   * Replaces the whole parameter set, including the query.
   */
  auto with_parameters(search_parameters parameters) -> search_request&;

  [[nodiscard]] auto parameters() const -> const search_parameters&;

  /**
   * Sends a single request with the current parameters.
   *
   * @exception errc::common::invalid_argument the language is not a well-formed tag
   * @exception errc::common::parsing_failure the body is not JSON
   * @exception errc::common::schema_mismatch the body does not have the expected structure
   * @exception errc::common::unambiguous_timeout no response within the request timeout
   * @exception errc::network::http_status_failure the status code is not 2xx
   */
  void send(search_handler&& handler) const;

  [[nodiscard]] auto send() const -> std::future<std::pair<error, search_response>>;

  /**
   * Collects @p num results from consecutive pages, starting from page 1 regardless of the page
   * configured with @ref with_page.
   *
   * The result has exactly @p num elements, or less if the backend has run out of results, which
   * is not an error. Transport failures are retried as configured in @ref pagination_options, when
   * they are eventually reported, the results collected so far are passed along with the error.
   */
  void send_get_num(std::size_t num, search_get_num_handler&& handler) const;

  [[nodiscard]] auto send_get_num(std::size_t num) const
    -> std::future<std::pair<error, std::vector<search_result>>>;

private:
  std::shared_ptr<core::search_component> component_;
  search_parameters parameters_;
};
} // namespace metasearch
