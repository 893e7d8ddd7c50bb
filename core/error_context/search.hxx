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

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace metasearch::core::error_context
{
struct search {
  std::error_code ec{};
  std::string message{};

  std::string method{};
  std::string endpoint{};
  std::string query{};
  std::optional<std::uint32_t> page{};
  std::string parameters{};

  std::uint32_t http_status{};
  std::string http_body{};

  std::size_t empty_page_attempts{};
  std::size_t transport_retries{};
  std::optional<std::string> last_transport_error{};
  std::size_t results_accumulated{};
};
} // namespace metasearch::core::error_context
