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

#include <metasearch/error_codes.hxx>

#include <string>

namespace metasearch::core::impl
{

struct common_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "metasearch.common";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::common>(ev)) {
      case errc::common::invalid_argument:
        return "invalid_argument (1)";
      case errc::common::parsing_failure:
        return "parsing_failure (2)";
      case errc::common::schema_mismatch:
        return "schema_mismatch (3)";
      case errc::common::request_canceled:
        return "request_canceled (4)";
      case errc::common::unambiguous_timeout:
        return "unambiguous_timeout (5)";
      case errc::common::internal_failure:
        return "internal_failure (6)";
    }
    return "FIXME: unknown error code (recompile with newer library): metasearch.common." +
           std::to_string(ev);
  }
};

const inline static common_error_category common_category_instance;

auto
common_category() noexcept -> const std::error_category&
{
  return common_category_instance;
}

} // namespace metasearch::core::impl
