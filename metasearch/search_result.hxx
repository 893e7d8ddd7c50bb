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

#include <metasearch/legacy_search_result.hxx>
#include <metasearch/main_search_result.hxx>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace metasearch
{
/**
 * One entry of the result list: either a @ref legacy_search_result or a @ref main_search_result.
 *
 * The shape is selected once, when the response is decoded, and never changes afterwards. The
 * accessors shared by both shapes are provided for convenience, use @ref as_legacy or
 * @ref as_main (or @ref variant with `std::visit`) to reach shape-specific fields.
 *
 * @since 1.0.0
 * @committed
 */
class search_result
{
public:
  using variant_type = std::variant<legacy_search_result, main_search_result>;

  explicit search_result(legacy_search_result result);
  explicit search_result(main_search_result result);

  [[nodiscard]] auto is_legacy() const -> bool;
  [[nodiscard]] auto is_main() const -> bool;

  /**
   * @throws std::bad_variant_access if the result has the main shape
   */
  [[nodiscard]] auto as_legacy() const -> const legacy_search_result&;

  /**
   * @throws std::bad_variant_access if the result has the legacy shape
   */
  [[nodiscard]] auto as_main() const -> const main_search_result&;

  [[nodiscard]] auto variant() const -> const variant_type&;

  [[nodiscard]] auto url() const -> const std::optional<std::string>&;
  [[nodiscard]] auto engine() const -> std::optional<std::string>;
  [[nodiscard]] auto title() const -> const std::string&;
  [[nodiscard]] auto content() const -> const std::string&;
  [[nodiscard]] auto engines() const -> const std::vector<std::string>&;
  [[nodiscard]] auto positions() const -> const std::vector<std::int32_t>&;
  [[nodiscard]] auto score() const -> double;
  [[nodiscard]] auto category() const -> const std::string&;
  [[nodiscard]] auto priority() const -> priority_type;

private:
  variant_type value_;
};
} // namespace metasearch
