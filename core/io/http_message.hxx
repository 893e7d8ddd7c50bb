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

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace metasearch::core::io
{
struct http_request {
  std::string method{ "GET" };
  std::string path{ "/" };
  std::map<std::string, std::string> headers{};
  std::string body{};
  std::chrono::milliseconds timeout{}; /* effective timeout, zero means transport default */
};

struct http_response {
  std::uint32_t status_code{ 0 };
  std::string status_message{};
  std::map<std::string, std::string> headers{};
  std::string body{};
  bool keep_alive{ true };

  [[nodiscard]] auto is_success() const -> bool
  {
    return status_code >= 200 && status_code < 300;
  }

  [[nodiscard]] auto must_close_connection() const -> bool
  {
    if (!keep_alive) {
      return true;
    }
    if (const auto it = headers.find("connection"); it != headers.end()) {
      return it->second == "close";
    }
    return false;
  }
};
} // namespace metasearch::core::io
