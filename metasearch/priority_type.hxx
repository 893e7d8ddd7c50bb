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

namespace metasearch
{
/**
 * Display priority assigned to a result by the backend.
 *
 * On the wire, @ref priority_type::none is encoded as an empty string, the others as `"high"` and
 * `"low"`.
 *
 * @since 1.0.0
 * @committed
 */
enum class priority_type {
  none,
  high,
  low,
};
} // namespace metasearch
