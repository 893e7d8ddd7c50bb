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

#include "core/utils/iso8601.hxx"

#include <metasearch/search_response.hxx>

#include <tao/json/contrib/traits.hpp>
#include <tao/json/forward.hpp>
#include <tao/json/value.hpp>

namespace metasearch::core::impl
{
inline auto
priority_to_string(priority_type priority) -> const char*
{
  switch (priority) {
    case priority_type::high:
      return "high";
    case priority_type::low:
      return "low";
    case priority_type::none:
      break;
  }
  return "";
}

template<typename Value, typename T>
void
assign_optional(Value& v, const char* name, const std::optional<T>& field)
{
  if (field) {
    v[name] = field.value();
  } else {
    v[name] = tao::json::null;
  }
}

template<typename Value>
void
assign_optional(Value& v,
                const char* name,
                const std::optional<std::chrono::system_clock::time_point>& field)
{
  if (field) {
    v[name] = utils::format_date_time(field.value());
  } else {
    v[name] = tao::json::null;
  }
}
} // namespace metasearch::core::impl

namespace tao::json
{
template<>
struct traits<metasearch::engine_error> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const metasearch::engine_error& error)
  {
    v = tao::json::empty_array;
    v.emplace_back(error.engine);
    v.emplace_back(error.error_msg);
  }
};

template<>
struct traits<metasearch::answer> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const metasearch::answer& answer)
  {
    v = tao::json::empty_object;
    metasearch::core::impl::assign_optional(v, "url", answer.url);
    metasearch::core::impl::assign_optional(v, "engine", answer.engine);
    metasearch::core::impl::assign_optional(v, "parsed_url", answer.parsed_url);
  }
};

template<>
struct traits<metasearch::legacy_search_result> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const metasearch::legacy_search_result& r)
  {
    using metasearch::core::impl::assign_optional;
    v = tao::json::empty_object;
    assign_optional(v, "url", r.url);
    v["template"] = r.template_name;
    v["engine"] = r.engine;
    assign_optional(v, "parsed_url", r.parsed_url);
    v["title"] = r.title;
    v["content"] = r.content;
    v["img_src"] = r.img_src;
    v["thumbnail"] = r.thumbnail;
    v["priority"] = metasearch::core::impl::priority_to_string(r.priority);
    v["engines"] = r.engines;
    v["positions"] = r.positions;
    v["score"] = r.score;
    v["category"] = r.category;
    assign_optional(v, "publishedDate", r.published_date);
    assign_optional(v, "pubdate", r.pubdate);
  }
};

template<>
struct traits<metasearch::main_search_result> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const metasearch::main_search_result& r)
  {
    using metasearch::core::impl::assign_optional;
    v = tao::json::empty_object;
    assign_optional(v, "url", r.url);
    assign_optional(v, "engine", r.engine);
    assign_optional(v, "parsed_url", r.parsed_url);
    v["template"] = r.template_name;
    v["title"] = r.title;
    v["content"] = r.content;
    v["img_src"] = r.img_src;
    v["iframe_src"] = r.iframe_src;
    v["audio_src"] = r.audio_src;
    v["thumbnail"] = r.thumbnail;
    assign_optional(v, "publishedDate", r.published_date);
    assign_optional(v, "pubdate", r.pubdate);
    if (r.length) {
      v["length"] = metasearch::core::utils::format_iso8601_duration(r.length.value());
    } else {
      v["length"] = tao::json::null;
    }
    v["views"] = r.views;
    v["author"] = r.author;
    v["metadata"] = r.metadata;
    v["priority"] = metasearch::core::impl::priority_to_string(r.priority);
    v["engines"] = r.engines;
    v["open_group"] = r.open_group;
    v["close_group"] = r.close_group;
    v["positions"] = r.positions;
    v["score"] = r.score;
    v["category"] = r.category;
  }
};

template<>
struct traits<metasearch::search_result> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const metasearch::search_result& r)
  {
    if (r.is_legacy()) {
      v = r.as_legacy();
    } else {
      v = r.as_main();
    }
  }
};

template<>
struct traits<metasearch::infobox> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const metasearch::infobox& i)
  {
    using metasearch::core::impl::assign_optional;
    v = tao::json::empty_object;
    v["infobox"] = i.infobox;
    v["id"] = i.id;
    v["content"] = i.content;
    assign_optional(v, "urls", i.urls);
    assign_optional(v, "attributes", i.attributes);
    v["engine"] = i.engine;
    assign_optional(v, "url", i.url);
    v["img_src"] = i.img_src;
    v["template"] = i.template_name;
    assign_optional(v, "parsed_url", i.parsed_url);
    v["title"] = i.title;
    v["thumbnail"] = i.thumbnail;
    v["priority"] = metasearch::core::impl::priority_to_string(i.priority);
    v["engines"] = i.engines;
    v["positions"] = i.positions;
    v["score"] = i.score;
    v["category"] = i.category;
    assign_optional(v, "publishedDate", i.published_date);
    assign_optional(v, "pubdate", i.pubdate);
  }
};

template<>
struct traits<metasearch::search_response> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const metasearch::search_response& r)
  {
    v = tao::json::empty_object;
    v["query"] = r.query;
    v["number_of_results"] = r.number_of_results;
    v["results"] = r.results;
    v["answers"] = r.answers;
    v["corrections"] = r.corrections;
    v["infoboxes"] = r.infoboxes;
    v["suggestions"] = r.suggestions;
    v["unresponsive_engines"] = r.unresponsive_engines;
  }
};
} // namespace tao::json
