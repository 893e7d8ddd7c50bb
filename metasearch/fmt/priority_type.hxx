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

#include <fmt/core.h>

#include <string_view>

template<>
struct fmt::formatter<metasearch::priority_type> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(metasearch::priority_type value, FormatContext& ctx) const
  {
    std::string_view name = "unknown";
    switch (value) {
      case metasearch::priority_type::none:
        name = "none";
        break;
      case metasearch::priority_type::high:
        name = "high";
        break;
      case metasearch::priority_type::low:
        name = "low";
        break;
    }
    return format_to(ctx.out(), "{}", name);
  }
};
