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

#include <metasearch/response_format.hxx>

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace metasearch
{
/**
 * Form fields of a single search call.
 *
 * Every optional field that is not set, and every empty list, is omitted from the request, so the
 * backend applies its own defaults.
 *
 * @since 1.0.0
 * @committed
 */
struct search_parameters {
  search_parameters() = default;
  explicit search_parameters(std::string query, response_format response_format = response_format::json);

  /**
   * Query text. Not checked for emptiness, the backend decides what an empty query means.
   */
  std::string q{};
  response_format format{ response_format::json };

  /**
   * 1-based page number.
   */
  std::optional<std::uint32_t> pageno{};

  /**
   * Sent as a single comma-separated field.
   */
  std::vector<std::string> categories{};

  /**
   * Sent as a single comma-separated field.
   */
  std::vector<std::string> engines{};

  /**
   * Language tag, e.g. "en-US". Checked for well-formedness before the request is sent.
   */
  std::optional<std::string> language{};

  std::optional<std::uint32_t> results_on_new_tab{};
  std::optional<bool> image_proxy{};
  std::optional<std::string> autocomplete{};
  std::optional<std::uint32_t> safesearch{};
  std::optional<std::string> theme{};

  /**
   * Renders the fields in wire order, skipping the ones which are not set.
   */
  [[nodiscard]] auto to_form_fields() const -> std::vector<std::pair<std::string, std::string>>;

  /**
   * Rebuilds parameters from decoded form fields. Unknown fields are ignored.
   *
   * @return invalid_argument if "q" is missing, or a numeric, boolean or format field cannot be
   * parsed.
   */
  static auto from_form_fields(const std::vector<std::pair<std::string, std::string>>& fields)
    -> std::pair<std::error_code, search_parameters>;

  auto operator==(const search_parameters& other) const -> bool;
  auto operator!=(const search_parameters& other) const -> bool;
};
} // namespace metasearch
