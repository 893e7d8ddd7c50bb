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

#include <metasearch/search_result.hxx>

#include <utility>

namespace metasearch
{
search_result::search_result(legacy_search_result result)
  : value_{ std::move(result) }
{
}

search_result::search_result(main_search_result result)
  : value_{ std::move(result) }
{
}

auto
search_result::is_legacy() const -> bool
{
  return std::holds_alternative<legacy_search_result>(value_);
}

auto
search_result::is_main() const -> bool
{
  return std::holds_alternative<main_search_result>(value_);
}

auto
search_result::as_legacy() const -> const legacy_search_result&
{
  return std::get<legacy_search_result>(value_);
}

auto
search_result::as_main() const -> const main_search_result&
{
  return std::get<main_search_result>(value_);
}

auto
search_result::variant() const -> const variant_type&
{
  return value_;
}

auto
search_result::url() const -> const std::optional<std::string>&
{
  return std::visit(
    [](const auto& result) -> const std::optional<std::string>& {
      return result.url;
    },
    value_);
}

auto
search_result::engine() const -> std::optional<std::string>
{
  if (const auto* legacy = std::get_if<legacy_search_result>(&value_); legacy != nullptr) {
    return legacy->engine;
  }
  return std::get<main_search_result>(value_).engine;
}

auto
search_result::title() const -> const std::string&
{
  return std::visit(
    [](const auto& result) -> const std::string& {
      return result.title;
    },
    value_);
}

auto
search_result::content() const -> const std::string&
{
  return std::visit(
    [](const auto& result) -> const std::string& {
      return result.content;
    },
    value_);
}

auto
search_result::engines() const -> const std::vector<std::string>&
{
  return std::visit(
    [](const auto& result) -> const std::vector<std::string>& {
      return result.engines;
    },
    value_);
}

auto
search_result::positions() const -> const std::vector<std::int32_t>&
{
  return std::visit(
    [](const auto& result) -> const std::vector<std::int32_t>& {
      return result.positions;
    },
    value_);
}

auto
search_result::score() const -> double
{
  return std::visit(
    [](const auto& result) {
      return result.score;
    },
    value_);
}

auto
search_result::category() const -> const std::string&
{
  return std::visit(
    [](const auto& result) -> const std::string& {
      return result.category;
    },
    value_);
}

auto
search_result::priority() const -> priority_type
{
  return std::visit(
    [](const auto& result) {
      return result.priority;
    },
    value_);
}
} // namespace metasearch
