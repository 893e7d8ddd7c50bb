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

#include <metasearch/search_result.hxx>

#include <tao/json/forward.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace metasearch::core::impl
{
/**
 * Explains why a result element could not be decoded into any of the known shapes.
 */
struct search_result_shape_mismatch {
  std::string legacy_reason{};
  std::string main_reason{};

  /**
   * Fields of the element which belong to neither shape.
   */
  std::vector<std::string> unknown_fields{};

  [[nodiscard]] auto to_string(std::size_t index) const -> std::string;
};

auto
decode_legacy_search_result(const tao::json::value& element, std::string& reason)
  -> std::optional<legacy_search_result>;

auto
decode_main_search_result(const tao::json::value& element, std::string& reason)
  -> std::optional<main_search_result>;

/**
 * Decodes one element of the "results" array.
 *
 * The element is first decoded strictly as @ref legacy_search_result: every required field must be
 * present and no other field is allowed. Only if that fails, it is decoded strictly as
 * @ref main_search_result. The order matters, as the legacy field set is a subset of the main one,
 * an element with any main-only field can never be taken for a legacy one, while an element which
 * has only legacy fields lacks the required main-only fields and cannot be taken for a main one.
 *
 * @return empty optional if neither shape matches, @p mismatch is filled in this case.
 */
auto
decode_search_result(const tao::json::value& element, search_result_shape_mismatch& mismatch)
  -> std::optional<search_result>;
} // namespace metasearch::core::impl
