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

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace metasearch::core::utils
{
/**
 * Location of the search endpoint, derived from the base URL of the backend.
 */
struct base_url {
  enum class address_type {
    ipv4,
    ipv6,
    dns,
  };

  std::string scheme{ "http" };
  bool tls{ false };
  std::string host{};
  address_type type{ address_type::dns };
  std::uint16_t port{ 80 };

  /**
   * Path of the search endpoint: the path of the base URL without trailing slashes, followed by
   * "/search".
   */
  std::string path{ "/search" };

  std::optional<std::string> error{};

  /**
   * Value for the "host" header, omits the port when it is the default for the scheme.
   */
  [[nodiscard]] auto host_header() const -> std::string;

  /**
   * Full URL of the search endpoint, e.g. "https://searx.example/search".
   */
  [[nodiscard]] auto endpoint() const -> std::string;
};

/**
 * Parses base URL of the backend, e.g. "https://searx.example", "http://127.0.0.1:8089/" or
 * "https://example.org/searx/".
 *
 * Only "http" and "https" schemes are accepted. On failure the @ref base_url::error is set.
 */
auto
parse_base_url(const std::string& input) -> base_url;
} // namespace metasearch::core::utils
