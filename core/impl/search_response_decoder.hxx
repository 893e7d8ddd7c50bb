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

#include <metasearch/search_response.hxx>

#include <string>
#include <string_view>
#include <system_error>

namespace metasearch::core::impl
{
struct decoded_search_response {
  /**
   * parsing_failure when the body is not JSON, schema_mismatch when its structure is unexpected.
   */
  std::error_code ec{};
  std::string message{};
  search_response response{};
};

/**
 * Decodes body of the search endpoint.
 *
 * All eight top-level fields are required, other top-level fields are ignored. Every element of
 * "results" goes through @ref decode_search_result, a single element matching no known shape fails
 * the whole page.
 */
auto
decode_search_response(std::string_view body) -> decoded_search_response;
} // namespace metasearch::core::impl
