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

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace metasearch
{
/**
 * Result shape emitted by older backend versions.
 *
 * Its field set is a strict subset of @ref main_search_result. An element is only decoded into this
 * shape when it carries no field outside of the list below.
 *
 * @since 1.0.0
 * @committed
 */
struct legacy_search_result {
  std::optional<std::string> url{};
  std::string template_name{};
  std::string engine{};
  std::optional<std::vector<std::string>> parsed_url{};

  std::string title{};
  std::string content{};
  std::string img_src{};
  std::string thumbnail{};
  priority_type priority{ priority_type::none };
  std::vector<std::string> engines{};
  std::vector<std::int32_t> positions{};
  double score{};
  std::string category{};

  /**
   * Wire name `publishedDate`. The backend sends naive date-times, they are interpreted as UTC.
   */
  std::optional<std::chrono::system_clock::time_point> published_date{};
  std::optional<std::string> pubdate{};
};
} // namespace metasearch
