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

#include <optional>
#include <string>
#include <vector>

namespace metasearch
{
/**
 * Instant answer produced by a specialized engine (calculator, dictionary and so on).
 *
 * Fields unknown to the library are ignored.
 *
 * @since 1.0.0
 * @committed
 */
struct answer {
  std::optional<std::string> url{};
  std::optional<std::string> engine{};
  std::optional<std::vector<std::string>> parsed_url{};
};

/**
 * Answers are grouped by the backend, each group is rendered together.
 *
 * @since 1.0.0
 * @committed
 */
using answer_set = std::vector<answer>;
} // namespace metasearch
