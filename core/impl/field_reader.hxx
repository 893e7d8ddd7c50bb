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

#include "core/utils/iso8601.hxx"
#include "core/utils/json.hxx"

#include <metasearch/iso8601_duration.hxx>
#include <metasearch/priority_type.hxx>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <tao/json/value.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace metasearch::core::impl
{
/*
 * decode_value() overloads return empty optional on success, or description of the type mismatch.
 */
inline auto
type_mismatch(std::string_view expected, const tao::json::value& actual) -> std::optional<std::string>
{
  return fmt::format("expected {}, got {}", expected, utils::json::type_name(actual));
}

inline auto
decode_value(const tao::json::value& v, std::string& out) -> std::optional<std::string>
{
  if (!v.is_string()) {
    return type_mismatch("string", v);
  }
  out = v.get_string();
  return {};
}

inline auto
decode_value(const tao::json::value& v, bool& out) -> std::optional<std::string>
{
  if (!v.is_boolean()) {
    return type_mismatch("boolean", v);
  }
  out = v.get_boolean();
  return {};
}

inline auto
decode_value(const tao::json::value& v, double& out) -> std::optional<std::string>
{
  if (!v.is_number()) {
    return type_mismatch("number", v);
  }
  out = v.as<double>();
  return {};
}

inline auto
decode_value(const tao::json::value& v, std::int64_t& out) -> std::optional<std::string>
{
  if (v.is_signed()) {
    out = v.get_signed();
    return {};
  }
  if (v.is_unsigned()) {
    if (v.get_unsigned() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::string{ "integer does not fit into 64 bits" };
    }
    out = static_cast<std::int64_t>(v.get_unsigned());
    return {};
  }
  return type_mismatch("integer", v);
}

inline auto
decode_value(const tao::json::value& v, std::int32_t& out) -> std::optional<std::string>
{
  std::int64_t wide{};
  if (auto error = decode_value(v, wide); error) {
    return error;
  }
  if (wide < std::numeric_limits<std::int32_t>::min() || wide > std::numeric_limits<std::int32_t>::max()) {
    return fmt::format("integer {} does not fit into 32 bits", wide);
  }
  out = static_cast<std::int32_t>(wide);
  return {};
}

inline auto
decode_value(const tao::json::value& v, priority_type& out) -> std::optional<std::string>
{
  if (!v.is_string()) {
    return type_mismatch("string", v);
  }
  const auto& name = v.get_string();
  if (name.empty()) {
    out = priority_type::none;
  } else if (name == "high") {
    out = priority_type::high;
  } else if (name == "low") {
    out = priority_type::low;
  } else {
    return fmt::format(R"(unknown priority "{}")", name);
  }
  return {};
}

inline auto
decode_value(const tao::json::value& v, std::chrono::system_clock::time_point& out)
  -> std::optional<std::string>
{
  if (!v.is_string()) {
    return type_mismatch("string", v);
  }
  auto tp = utils::parse_date_time(v.get_string());
  if (!tp) {
    return fmt::format(R"(invalid date-time "{}")", v.get_string());
  }
  out = tp.value();
  return {};
}

inline auto
decode_value(const tao::json::value& v, iso8601_duration& out) -> std::optional<std::string>
{
  if (!v.is_string()) {
    return type_mismatch("string", v);
  }
  auto duration = utils::parse_iso8601_duration(v.get_string());
  if (!duration) {
    return fmt::format(R"(invalid ISO 8601 duration "{}")", v.get_string());
  }
  out = duration.value();
  return {};
}

inline auto
decode_value(const tao::json::value& v, tao::json::value& out) -> std::optional<std::string>
{
  out = v;
  return {};
}

inline auto
decode_value(const tao::json::value& v, std::map<std::string, tao::json::value>& out)
  -> std::optional<std::string>
{
  if (!v.is_object()) {
    return type_mismatch("object", v);
  }
  out.clear();
  for (const auto& [key, value] : v.get_object()) {
    out.emplace(key, value);
  }
  return {};
}

template<typename T>
auto
decode_value(const tao::json::value& v, std::vector<T>& out) -> std::optional<std::string>
{
  if (!v.is_array()) {
    return type_mismatch("array", v);
  }
  std::vector<T> items{};
  items.reserve(v.get_array().size());
  std::size_t index{ 0 };
  for (const auto& entry : v.get_array()) {
    T item{};
    if (auto error = decode_value(entry, item); error) {
      return fmt::format("element #{}: {}", index, error.value());
    }
    items.emplace_back(std::move(item));
    ++index;
  }
  out = std::move(items);
  return {};
}

/**
 * Reads fields of a JSON object and collects every problem instead of stopping at the first one.
 *
 * In strict mode, fields which have not been read by the time @ref finish is called are reported
 * as unexpected.
 */
class field_reader
{
public:
  field_reader(const tao::json::value& object, bool strict)
    : object_{ object }
    , strict_{ strict }
  {
  }

  /**
   * Field must be present and must not be null.
   */
  template<typename T>
  void required(const std::string& name, T& out)
  {
    known_.insert(name);
    const auto* field = object_.find(name);
    if (field == nullptr) {
      missing_.push_back(name);
      return;
    }
    if (auto error = decode_value(*field, out); error) {
      mistyped_.push_back(fmt::format("{} ({})", name, error.value()));
    }
  }

  /**
   * Absent and null fields leave the value empty.
   */
  template<typename T>
  void optional(const std::string& name, std::optional<T>& out)
  {
    known_.insert(name);
    const auto* field = object_.find(name);
    if (field == nullptr || field->is_null()) {
      out.reset();
      return;
    }
    T value{};
    if (auto error = decode_value(*field, value); error) {
      mistyped_.push_back(fmt::format("{} ({})", name, error.value()));
      return;
    }
    out = std::move(value);
  }

  /**
   * Absent and null lists are read as empty.
   */
  template<typename T>
  void list(const std::string& name, std::vector<T>& out)
  {
    known_.insert(name);
    const auto* field = object_.find(name);
    if (field == nullptr || field->is_null()) {
      out.clear();
      return;
    }
    if (auto error = decode_value(*field, out); error) {
      mistyped_.push_back(fmt::format("{} ({})", name, error.value()));
    }
  }

  /**
   * @return true if every required field was found and all fields had expected types
   */
  [[nodiscard]] auto finish() -> bool
  {
    if (strict_) {
      for (const auto& [key, value] : object_.get_object()) {
        if (known_.count(key) == 0) {
          unexpected_.push_back(key);
        }
      }
    }
    return missing_.empty() && mistyped_.empty() && unexpected_.empty();
  }

  [[nodiscard]] auto unexpected_fields() const -> const std::vector<std::string>&
  {
    return unexpected_;
  }

  /**
   * Human readable summary, for example "missing: title, content; unexpected: iframe_src".
   */
  [[nodiscard]] auto describe() const -> std::string
  {
    std::vector<std::string> parts{};
    if (!missing_.empty()) {
      parts.emplace_back(fmt::format("missing: {}", fmt::join(missing_, ", ")));
    }
    if (!mistyped_.empty()) {
      parts.emplace_back(fmt::format("mistyped: {}", fmt::join(mistyped_, ", ")));
    }
    if (!unexpected_.empty()) {
      parts.emplace_back(fmt::format("unexpected: {}", fmt::join(unexpected_, ", ")));
    }
    return fmt::format("{}", fmt::join(parts, "; "));
  }

private:
  const tao::json::value& object_;
  bool strict_;
  std::set<std::string> known_{};
  std::vector<std::string> missing_{};
  std::vector<std::string> mistyped_{};
  std::vector<std::string> unexpected_{};
};
} // namespace metasearch::core::impl
