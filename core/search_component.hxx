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
#include "core/operations/search_page.hxx"
#include "core/utils/base_url.hxx"

#include <metasearch/pagination_options.hxx>
#include <metasearch/search_result.hxx>

#include <asio/io_context.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace metasearch::core
{
using search_page_handler = std::function<void(operations::search_page_response&&)>;
using paginated_search_handler =
  std::function<void(error_context::search&&, std::vector<search_result>&&)>;

/**
 * Binds the shared transport to the endpoint of one backend. Every search operation of a client
 * goes through the same component.
 */
class search_component : public std::enable_shared_from_this<search_component>
{
public:
  search_component(asio::io_context& io,
                   std::shared_ptr<io::http_transport> transport,
                   utils::base_url endpoint,
                   pagination_options::built pagination);

  /**
   * Sends exactly one page request.
   */
  void execute(operations::search_page_request request, search_page_handler&& handler);

  /**
   * Collects @p num results by requesting consecutive pages, starting from the first.
   */
  void execute_paginated(search_parameters parameters,
                         std::size_t num,
                         paginated_search_handler&& handler);

  void close();

  [[nodiscard]] auto endpoint() const -> const utils::base_url&;
  [[nodiscard]] auto io_context() -> asio::io_context&;

private:
  asio::io_context& io_;
  std::shared_ptr<io::http_transport> transport_;
  utils::base_url endpoint_;
  pagination_options::built pagination_;
};
} // namespace metasearch::core
