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

#include "search_result_variant.hxx"

#include "core/impl/field_reader.hxx"
#include "core/utils/json.hxx"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <tao/json/value.hpp>

#include <set>

namespace metasearch::core::impl
{
namespace
{
const std::set<std::string> main_fields{
  "url",     "engine",   "parsed_url", "template", "title",      "content",     "img_src",
  "iframe_src", "audio_src", "thumbnail", "publishedDate", "pubdate", "length", "views",
  "author",  "metadata", "priority",   "engines",  "open_group", "close_group", "positions",
  "score",   "category",
};
} // namespace

auto
search_result_shape_mismatch::to_string(std::size_t index) const -> std::string
{
  auto message = fmt::format("result #{} does not match any known shape: legacy shape rejected ({}), "
                             "main shape rejected ({})",
                             index,
                             legacy_reason,
                             main_reason);
  if (!unknown_fields.empty()) {
    message += fmt::format(", fields unknown to both shapes: {}", fmt::join(unknown_fields, ", "));
  }
  return message;
}

auto
decode_legacy_search_result(const tao::json::value& element, std::string& reason)
  -> std::optional<legacy_search_result>
{
  if (!element.is_object()) {
    reason = fmt::format("expected object, got {}", utils::json::type_name(element));
    return {};
  }
  legacy_search_result result{};
  field_reader reader{ element, true };
  reader.optional("url", result.url);
  reader.required("template", result.template_name);
  reader.required("engine", result.engine);
  reader.optional("parsed_url", result.parsed_url);
  reader.required("title", result.title);
  reader.required("content", result.content);
  reader.required("img_src", result.img_src);
  reader.required("thumbnail", result.thumbnail);
  reader.required("priority", result.priority);
  reader.list("engines", result.engines);
  reader.list("positions", result.positions);
  reader.required("score", result.score);
  reader.required("category", result.category);
  reader.optional("publishedDate", result.published_date);
  reader.optional("pubdate", result.pubdate);
  if (!reader.finish()) {
    reason = reader.describe();
    return {};
  }
  return result;
}

auto
decode_main_search_result(const tao::json::value& element, std::string& reason)
  -> std::optional<main_search_result>
{
  if (!element.is_object()) {
    reason = fmt::format("expected object, got {}", utils::json::type_name(element));
    return {};
  }
  main_search_result result{};
  field_reader reader{ element, true };
  reader.optional("url", result.url);
  reader.optional("engine", result.engine);
  reader.optional("parsed_url", result.parsed_url);
  reader.required("template", result.template_name);
  reader.required("title", result.title);
  reader.required("content", result.content);
  reader.required("img_src", result.img_src);
  reader.required("iframe_src", result.iframe_src);
  reader.required("audio_src", result.audio_src);
  reader.required("thumbnail", result.thumbnail);
  reader.optional("publishedDate", result.published_date);
  reader.optional("pubdate", result.pubdate);
  reader.optional("length", result.length);
  reader.required("views", result.views);
  reader.required("author", result.author);
  reader.required("metadata", result.metadata);
  reader.required("priority", result.priority);
  reader.list("engines", result.engines);
  reader.required("open_group", result.open_group);
  reader.required("close_group", result.close_group);
  reader.list("positions", result.positions);
  reader.required("score", result.score);
  reader.required("category", result.category);
  if (!reader.finish()) {
    reason = reader.describe();
    return {};
  }
  return result;
}

auto
decode_search_result(const tao::json::value& element, search_result_shape_mismatch& mismatch)
  -> std::optional<search_result>
{
  if (auto legacy = decode_legacy_search_result(element, mismatch.legacy_reason); legacy) {
    return search_result{ std::move(legacy.value()) };
  }
  if (auto main = decode_main_search_result(element, mismatch.main_reason); main) {
    return search_result{ std::move(main.value()) };
  }
  mismatch.unknown_fields.clear();
  if (element.is_object()) {
    for (const auto& [key, value] : element.get_object()) {
      if (main_fields.count(key) == 0) {
        mismatch.unknown_fields.push_back(key);
      }
    }
  }
  return {};
}
} // namespace metasearch::core::impl
