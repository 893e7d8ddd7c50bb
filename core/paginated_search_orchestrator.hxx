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

#include "core/error_context/search.hxx"

#include <metasearch/pagination_options.hxx>
#include <metasearch/search_parameters.hxx>
#include <metasearch/search_result.hxx>

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace asio
{
class io_context;
} // namespace asio

namespace metasearch::core
{
class search_component;
class paginated_search_orchestrator_impl;

using paginated_search_callback =
  std::function<void(error_context::search&&, std::vector<search_result>&&)>;

/**
 * Requests pages one after another, starting with page 1, until at least @c num results have been
 * collected, then returns exactly @c num of them in page order.
 *
 * - A page with no results is requested again. When it stays empty for
 *   @ref pagination_options::built::empty_page_retries attempts in a row, the backend is considered
 *   exhausted and the results collected so far are returned without an error.
 * - A transport failure (network error, timeout, non-2xx status) repeats the same request. It
 *   neither advances the page nor counts as an empty attempt. Unless
 *   @ref pagination_options::built::transport_retry_limit is set, there is no limit.
 * - A body that cannot be decoded ends the operation with the decoding error and the results
 *   collected before it.
 *
 * Pages are never requested concurrently.
 */
class paginated_search_orchestrator
{
public:
  paginated_search_orchestrator(asio::io_context& io,
                                std::shared_ptr<search_component> component,
                                search_parameters parameters,
                                std::size_t num,
                                pagination_options::built options);

  void start(paginated_search_callback&& callback);

private:
  std::shared_ptr<paginated_search_orchestrator_impl> impl_;
};
} // namespace metasearch::core
