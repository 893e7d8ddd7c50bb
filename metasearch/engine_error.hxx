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

#include <string>

namespace metasearch
{
/**
 * Upstream engine that failed to respond, or responded with an error, while serving the query.
 *
 * On the wire it is a two-element array `["engine name", "error message"]`.
 *
 * @since 1.0.0
 * @committed
 */
struct engine_error {
  std::string engine{};
  std::string error_msg{};

  auto operator==(const engine_error& other) const -> bool
  {
    return engine == other.engine && error_msg == other.error_msg;
  }
};
} // namespace metasearch
