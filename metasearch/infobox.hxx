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

#include <metasearch/priority_type.hxx>

#include <tao/json/value.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace metasearch
{
/**
 * Structured information box about an entity, usually displayed beside the result list.
 *
 * Unlike search results, infoboxes tolerate fields unknown to the library. The entries of
 * @ref urls and @ref attributes have no fixed schema and are kept as JSON values.
 *
 * @since 1.0.0
 * @committed
 */
struct infobox {
  std::string infobox{};
  std::string id{};
  std::string content{};

  /**
   * Related links, e.g. `{"title": "Wikipedia", "url": "https://..."}`.
   */
  std::optional<std::vector<std::map<std::string, tao::json::value>>> urls{};

  /**
   * Key/value facts about the entity, e.g. `{"label": "Born", "value": "1970"}`.
   */
  std::optional<std::vector<std::map<std::string, tao::json::value>>> attributes{};

  std::string engine{};
  std::optional<std::string> url{};
  std::string img_src{};
  std::string template_name{};
  std::optional<std::vector<std::string>> parsed_url{};
  std::string title{};
  std::string thumbnail{};
  priority_type priority{ priority_type::none };
  std::vector<std::string> engines{};

  /**
   * The backend reports positions of an infobox as a single string.
   */
  std::string positions{};
  double score{};
  std::string category{};
  std::optional<std::chrono::system_clock::time_point> published_date{};
  std::optional<std::string> pubdate{};
};
} // namespace metasearch
