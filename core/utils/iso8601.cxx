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

#include "iso8601.hxx"

#include <fmt/core.h>

#include <tao/pegtl.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <system_error>

namespace metasearch::core::utils
{
namespace
{
// Howard Hinnant's days_from_civil/civil_from_days, proleptic Gregorian calendar.
constexpr auto
days_from_civil(std::int64_t y, unsigned m, unsigned d) -> std::int64_t
{
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct civil_date {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

constexpr auto
civil_from_days(std::int64_t z) -> civil_date
{
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return { y + (m <= 2 ? 1 : 0), m, d };
}

constexpr auto
is_leap_year(std::int64_t y) -> bool
{
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

constexpr auto
days_in_month(std::int64_t y, unsigned m) -> unsigned
{
  constexpr unsigned days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
  return m == 2 && is_leap_year(y) ? 29 : days[m - 1];
}

auto
to_number(std::string_view digits, std::uint32_t& number) -> bool
{
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
  return ec == std::errc{} && ptr == digits.data() + digits.size();
}
} // namespace

namespace priv
{
using namespace tao::pegtl;

struct date_time_parts {
  std::uint32_t year{};
  std::uint32_t month{};
  std::uint32_t day{};
  std::uint32_t hour{};
  std::uint32_t minute{};
  std::uint32_t second{};
  std::uint64_t nanoseconds{};
  bool invalid{ false };
};

struct year : rep<4, digit> {
};
struct month : rep<2, digit> {
};
struct day : rep<2, digit> {
};
struct hour : rep<2, digit> {
};
struct minute : rep<2, digit> {
};
struct second : rep<2, digit> {
};
struct fraction : plus<digit> {
};

struct date_time_grammar : seq<year,
                               one<'-'>,
                               month,
                               one<'-'>,
                               day,
                               one<'T', 't'>,
                               hour,
                               one<':'>,
                               minute,
                               one<':'>,
                               second,
                               opt<one<'.'>, fraction>,
                               eof> {
};

template<typename Rule>
struct date_time_action {
};

#define METASEARCH_DATE_TIME_FIELD(rule)                                                           \
  template<>                                                                                       \
  struct date_time_action<rule> {                                                                  \
    template<typename ActionInput>                                                                 \
    static void apply(const ActionInput& in, date_time_parts& parts)                              \
    {                                                                                              \
      if (!to_number(in.string(), parts.rule)) {                                                  \
        parts.invalid = true;                                                                      \
      }                                                                                            \
    }                                                                                              \
  }

METASEARCH_DATE_TIME_FIELD(year);
METASEARCH_DATE_TIME_FIELD(month);
METASEARCH_DATE_TIME_FIELD(day);
METASEARCH_DATE_TIME_FIELD(hour);
METASEARCH_DATE_TIME_FIELD(minute);
METASEARCH_DATE_TIME_FIELD(second);

#undef METASEARCH_DATE_TIME_FIELD

template<>
struct date_time_action<fraction> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, date_time_parts& parts)
  {
    // nanosecond precision, extra digits are truncated
    auto digits = in.string().substr(0, 9);
    digits.append(9 - digits.size(), '0');
    parts.nanoseconds = std::strtoull(digits.c_str(), nullptr, 10);
  }
};

struct number : plus<digit> {
};
struct decimal : seq<number, opt<one<'.', ','>, number>> {
};

template<char Designator>
struct component : seq<decimal, one<Designator>> {
};

struct weeks : component<'W'> {
};
struct years : component<'Y'> {
};
struct months : component<'M'> {
};
struct days : component<'D'> {
};
struct hours : component<'H'> {
};
struct minutes : component<'M'> {
};
struct seconds : component<'S'> {
};

struct time_part : seq<one<'T'>, at<digit>, opt<hours>, opt<minutes>, opt<seconds>> {
};
struct date_part : seq<opt<years>, opt<months>, opt<days>> {
};

// "P" alone, or "PT" without components, are not valid durations
struct duration_grammar
  : seq<one<'P'>,
        sor<seq<weeks, eof>, seq<at<sor<digit, seq<one<'T'>, digit>>>, date_part, opt<time_part>, eof>>> {
};

struct duration_state {
  iso8601_duration duration{};
  std::string integral{};
  double value{};
  bool fractional{ false };
  bool invalid{ false };
};

template<typename Rule>
struct duration_action {
};

template<>
struct duration_action<decimal> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, duration_state& state)
  {
    auto text = in.string();
    for (auto& c : text) {
      if (c == ',') {
        c = '.';
      }
    }
    const auto separator = text.find('.');
    state.fractional = separator != std::string::npos;
    state.integral = text.substr(0, separator);
    state.value = std::strtod(text.c_str(), nullptr);
  }
};

// only seconds might have a fraction, every component must fit into 32 bits
#define METASEARCH_DURATION_FIELD(rule)                                                            \
  template<>                                                                                       \
  struct duration_action<rule> {                                                                   \
    template<typename ActionInput>                                                                 \
    static void apply(const ActionInput& /* in */, duration_state& state)                         \
    {                                                                                              \
      if (state.fractional || !to_number(state.integral, state.duration.rule)) {                  \
        state.invalid = true;                                                                      \
      }                                                                                            \
    }                                                                                              \
  }

METASEARCH_DURATION_FIELD(weeks);
METASEARCH_DURATION_FIELD(years);
METASEARCH_DURATION_FIELD(months);
METASEARCH_DURATION_FIELD(days);
METASEARCH_DURATION_FIELD(hours);
METASEARCH_DURATION_FIELD(minutes);

#undef METASEARCH_DURATION_FIELD

template<>
struct duration_action<seconds> {
  template<typename ActionInput>
  static void apply(const ActionInput& /* in */, duration_state& state)
  {
    if (std::uint32_t whole{}; !to_number(state.integral, whole)) {
      state.invalid = true;
      return;
    }
    state.duration.seconds = state.value;
  }
};
} // namespace priv

auto
parse_date_time(std::string_view text) -> std::optional<std::chrono::system_clock::time_point>
{
  priv::date_time_parts parts{};
  auto in = tao::pegtl::memory_input(text.data(), text.size(), __FUNCTION__);
  if (!tao::pegtl::parse<priv::date_time_grammar, priv::date_time_action>(in, parts)) {
    return {};
  }
  if (parts.invalid || parts.month < 1 || parts.month > 12 || parts.day < 1 ||
      parts.day > days_in_month(parts.year, parts.month) || parts.hour > 23 || parts.minute > 59 ||
      parts.second > 59) {
    return {};
  }
  const auto days = days_from_civil(parts.year, parts.month, parts.day);
  const auto since_epoch = std::chrono::hours{ days * 24 + parts.hour } +
                           std::chrono::minutes{ parts.minute } + std::chrono::seconds{ parts.second } +
                           std::chrono::nanoseconds{ parts.nanoseconds };
  return std::chrono::system_clock::time_point{
    std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch)
  };
}

auto
format_date_time(std::chrono::system_clock::time_point tp) -> std::string
{
  const auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
  auto days = std::chrono::duration_cast<std::chrono::hours>(since_epoch).count() / 24;
  auto rest = since_epoch - std::chrono::hours{ days * 24 };
  if (rest.count() < 0) {
    --days;
    rest += std::chrono::hours{ 24 };
  }
  const auto date = civil_from_days(days);
  const auto hour = std::chrono::duration_cast<std::chrono::hours>(rest);
  const auto minute = std::chrono::duration_cast<std::chrono::minutes>(rest - hour);
  const auto second = std::chrono::duration_cast<std::chrono::seconds>(rest - hour - minute);
  const auto micros = (rest - hour - minute - second).count();

  auto result = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                            date.year,
                            date.month,
                            date.day,
                            hour.count(),
                            minute.count(),
                            second.count());
  if (micros != 0) {
    result += fmt::format(".{:06}", micros);
  }
  return result;
}

auto
parse_iso8601_duration(std::string_view text) -> std::optional<iso8601_duration>
{
  priv::duration_state state{};
  auto in = tao::pegtl::memory_input(text.data(), text.size(), __FUNCTION__);
  if (!tao::pegtl::parse<priv::duration_grammar, priv::duration_action>(in, state)) {
    return {};
  }
  if (state.invalid) {
    return {};
  }
  return state.duration;
}

auto
format_iso8601_duration(const iso8601_duration& duration) -> std::string
{
  if (duration.weeks != 0) {
    return fmt::format("P{}W", duration.weeks);
  }
  std::string result{ "P" };
  if (duration.years != 0) {
    result += fmt::format("{}Y", duration.years);
  }
  if (duration.months != 0) {
    result += fmt::format("{}M", duration.months);
  }
  if (duration.days != 0) {
    result += fmt::format("{}D", duration.days);
  }
  if (duration.hours != 0 || duration.minutes != 0 || duration.seconds != 0) {
    result += 'T';
    if (duration.hours != 0) {
      result += fmt::format("{}H", duration.hours);
    }
    if (duration.minutes != 0) {
      result += fmt::format("{}M", duration.minutes);
    }
    if (duration.seconds != 0) {
      result += fmt::format("{}S", duration.seconds);
    }
  }
  if (result.size() == 1) {
    result += "T0S";
  }
  return result;
}
} // namespace metasearch::core::utils
