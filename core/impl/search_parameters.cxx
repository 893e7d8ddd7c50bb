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

#include <metasearch/error_codes.hxx>
#include <metasearch/search_parameters.hxx>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>

namespace metasearch
{
namespace
{
auto
to_string(response_format format) -> std::string
{
  switch (format) {
    case response_format::json:
      return "json";
  }
  return "json";
}

auto
parse_unsigned(const std::string& value) -> std::optional<std::uint32_t>
{
  std::uint32_t result{};
  const auto* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, result);
  if (ec != std::errc{} || ptr != end || value.empty()) {
    return {};
  }
  return result;
}

auto
parse_bool(const std::string& value) -> std::optional<bool>
{
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  return {};
}

auto
split_list(const std::string& value) -> std::vector<std::string>
{
  std::vector<std::string> items{};
  if (value.empty()) {
    return items;
  }
  std::size_t start = 0;
  while (true) {
    auto comma = value.find(',', start);
    if (comma == std::string::npos) {
      items.emplace_back(value.substr(start));
      break;
    }
    items.emplace_back(value.substr(start, comma - start));
    start = comma + 1;
  }
  return items;
}
} // namespace

search_parameters::search_parameters(std::string query, response_format response_format)
  : q{ std::move(query) }
  , format{ response_format }
{
}

auto
search_parameters::to_form_fields() const -> std::vector<std::pair<std::string, std::string>>
{
  std::vector<std::pair<std::string, std::string>> fields{
    { "q", q },
    { "format", to_string(format) },
  };
  if (pageno) {
    fields.emplace_back("pageno", std::to_string(pageno.value()));
  }
  if (!categories.empty()) {
    fields.emplace_back("categories", fmt::format("{}", fmt::join(categories, ",")));
  }
  if (!engines.empty()) {
    fields.emplace_back("engines", fmt::format("{}", fmt::join(engines, ",")));
  }
  if (language) {
    fields.emplace_back("language", language.value());
  }
  if (results_on_new_tab) {
    fields.emplace_back("results_on_new_tab", std::to_string(results_on_new_tab.value()));
  }
  if (image_proxy) {
    fields.emplace_back("image_proxy", image_proxy.value() ? "true" : "false");
  }
  if (autocomplete) {
    fields.emplace_back("autocomplete", autocomplete.value());
  }
  if (safesearch) {
    fields.emplace_back("safesearch", std::to_string(safesearch.value()));
  }
  if (theme) {
    fields.emplace_back("theme", theme.value());
  }
  return fields;
}

auto
search_parameters::from_form_fields(const std::vector<std::pair<std::string, std::string>>& fields)
  -> std::pair<std::error_code, search_parameters>
{
  search_parameters params{};
  bool has_query{ false };
  for (const auto& [name, value] : fields) {
    if (name == "q") {
      params.q = value;
      has_query = true;
    } else if (name == "format") {
      if (value != "json") {
        return { errc::common::invalid_argument, {} };
      }
      params.format = response_format::json;
    } else if (name == "pageno" || name == "results_on_new_tab" || name == "safesearch") {
      auto number = parse_unsigned(value);
      if (!number) {
        return { errc::common::invalid_argument, {} };
      }
      if (name == "pageno") {
        params.pageno = number;
      } else if (name == "results_on_new_tab") {
        params.results_on_new_tab = number;
      } else {
        params.safesearch = number;
      }
    } else if (name == "image_proxy") {
      auto flag = parse_bool(value);
      if (!flag) {
        return { errc::common::invalid_argument, {} };
      }
      params.image_proxy = flag;
    } else if (name == "categories") {
      params.categories = split_list(value);
    } else if (name == "engines") {
      params.engines = split_list(value);
    } else if (name == "language") {
      params.language = value;
    } else if (name == "autocomplete") {
      params.autocomplete = value;
    } else if (name == "theme") {
      params.theme = value;
    }
  }
  if (!has_query) {
    return { errc::common::invalid_argument, {} };
  }
  return { {}, std::move(params) };
}

auto
search_parameters::operator==(const search_parameters& other) const -> bool
{
  return q == other.q && format == other.format && pageno == other.pageno &&
         categories == other.categories && engines == other.engines && language == other.language &&
         results_on_new_tab == other.results_on_new_tab && image_proxy == other.image_proxy &&
         autocomplete == other.autocomplete && safesearch == other.safesearch && theme == other.theme;
}

auto
search_parameters::operator!=(const search_parameters& other) const -> bool
{
  return !(*this == other);
}
} // namespace metasearch
