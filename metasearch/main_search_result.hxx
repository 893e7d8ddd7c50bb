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

#include <metasearch/iso8601_duration.hxx>
#include <metasearch/priority_type.hxx>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace metasearch
{
/**
 * Result shape of current backend versions, with media fields, grouping flags and extra metadata.
 *
 * @since 1.0.0
 * @committed
 */
struct main_search_result {
  std::optional<std::string> url{};
  std::optional<std::string> engine{};
  std::optional<std::vector<std::string>> parsed_url{};

  std::string template_name{};
  std::string title{};
  std::string content{};
  std::string img_src{};
  std::string iframe_src{};
  std::string audio_src{};
  std::string thumbnail{};

  /**
   * Wire name `publishedDate`. The backend sends naive date-times, they are interpreted as UTC.
   */
  std::optional<std::chrono::system_clock::time_point> published_date{};

  /**
   * Still emitted by some templates of the backend, but scheduled for removal there.
   *
   * @deprecated use @ref published_date
   */
  std::optional<std::string> pubdate{};

  std::optional<iso8601_duration> length{};
  std::string views{};
  std::string author{};
  std::string metadata{};
  priority_type priority{ priority_type::none };
  std::vector<std::string> engines{};
  bool open_group{ false };
  bool close_group{ false };
  std::vector<std::int32_t> positions{};
  double score{};
  std::string category{};
};
} // namespace metasearch
