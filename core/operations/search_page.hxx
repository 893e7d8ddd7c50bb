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
#include "core/io/http_message.hxx"

#include <metasearch/search_parameters.hxx>
#include <metasearch/search_response.hxx>

#include <chrono>
#include <optional>
#include <string>
#include <system_error>

namespace metasearch::core::operations
{
struct search_page_response {
  error_context::search ctx;
  search_response response{};
};

/**
 * One call of the search endpoint: a single page for a single set of parameters.
 */
struct search_page_request {
  using response_type = search_page_response;
  using encoded_request_type = io::http_request;
  using encoded_response_type = io::http_response;
  using error_context_type = error_context::search;

  static constexpr std::size_t max_body_in_context{ 1024 };

  /**
   * Full path of the endpoint, including the "/search" suffix.
   */
  std::string path{ "/search" };
  search_parameters parameters{};
  std::optional<std::chrono::milliseconds> timeout{};

  /**
   * @return invalid_argument if the language is not a well-formed tag
   */
  [[nodiscard]] auto encode_to(encoded_request_type& encoded) const -> std::error_code;

  /**
   * Transport errors already recorded in @p ctx are kept as is. Non-2xx statuses become
   * http_status_failure, otherwise the body is decoded.
   */
  [[nodiscard]] auto make_response(error_context::search&& ctx,
                                   const encoded_response_type& encoded) const
    -> search_page_response;
};
} // namespace metasearch::core::operations
