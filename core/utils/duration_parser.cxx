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

#include "duration_parser.hxx"

#include <fmt/core.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string_view>

namespace metasearch::core::utils
{
namespace
{
auto
unit_in_nanoseconds(std::string_view unit) -> double
{
  if (unit == "ns") {
    return 1;
  }
  if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") {
    return 1e3;
  }
  if (unit == "ms") {
    return 1e6;
  }
  if (unit == "s") {
    return 1e9;
  }
  if (unit == "m") {
    return 60e9;
  }
  if (unit == "h") {
    return 3600e9;
  }
  return 0;
}

auto
is_digit(char c) -> bool
{
  return c >= '0' && c <= '9';
}
} // namespace

auto
parse_duration(const std::string& text) -> std::chrono::nanoseconds
{
  std::string_view s{ text };
  bool negative{ false };
  if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }
  if (s == "0") {
    return std::chrono::nanoseconds::zero();
  }
  if (s.empty()) {
    throw duration_parse_error(fmt::format(R"(invalid duration "{}")", text));
  }

  double total{ 0 };
  while (!s.empty()) {
    std::size_t i = 0;
    while (i < s.size() && is_digit(s[i])) {
      ++i;
    }
    const auto integer_part = s.substr(0, i);
    std::string_view fraction_part{};
    if (i < s.size() && s[i] == '.') {
      const auto start = ++i;
      while (i < s.size() && is_digit(s[i])) {
        ++i;
      }
      fraction_part = s.substr(start, i - start);
    }
    if (integer_part.empty() && fraction_part.empty()) {
      throw duration_parse_error(fmt::format(R"(invalid duration "{}")", text));
    }

    const auto unit_start = i;
    while (i < s.size() && s[i] != '.' && !is_digit(s[i])) {
      ++i;
    }
    const auto unit = s.substr(unit_start, i - unit_start);
    if (unit.empty()) {
      throw duration_parse_error(fmt::format(R"(missing unit in duration "{}")", text));
    }
    const auto scale = unit_in_nanoseconds(unit);
    if (scale == 0) {
      throw duration_parse_error(fmt::format(R"(unknown unit "{}" in duration "{}")", unit, text));
    }

    double value{ 0 };
    for (const char c : integer_part) {
      value = value * 10 + (c - '0');
    }
    double divisor{ 10 };
    for (const char c : fraction_part) {
      value += (c - '0') / divisor;
      divisor *= 10;
    }
    total += value * scale;
    s.remove_prefix(i);
  }

  if (total > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    throw duration_parse_error(fmt::format(R"(invalid duration "{}": out of range)", text));
  }
  auto ns = static_cast<std::int64_t>(std::llround(total));
  return std::chrono::nanoseconds{ negative ? -ns : ns };
}
} // namespace metasearch::core::utils
