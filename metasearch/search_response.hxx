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

#include <metasearch/answer.hxx>
#include <metasearch/engine_error.hxx>
#include <metasearch/infobox.hxx>
#include <metasearch/search_result.hxx>

#include <cstdint>
#include <string>
#include <vector>

namespace metasearch
{
/**
 * Decoded response of a single page request.
 *
 * @since 1.0.0
 * @committed
 */
struct search_response {
  /**
   * The query as echoed by the backend.
   */
  std::string query{};

  /**
   * Estimate of the total number of results across all engines.
   *
   * It is reported by the backend and has no relation to the size of @ref results.
   */
  std::int64_t number_of_results{};

  std::vector<search_result> results{};
  std::vector<answer_set> answers{};
  std::vector<std::string> corrections{};
  std::vector<infobox> infoboxes{};
  std::vector<std::string> suggestions{};
  std::vector<engine_error> unresponsive_engines{};
};
} // namespace metasearch
