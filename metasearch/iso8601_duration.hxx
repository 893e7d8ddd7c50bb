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

#include <chrono>
#include <cstdint>

namespace metasearch
{
/**
 * ISO 8601 duration (`PnYnMnDTnHnMnS` or `PnW`), as reported for the length of media results.
 *
 * Calendar components are kept as sent, because their length in seconds is not fixed.
 *
 * @since 1.0.0
 * @committed
 */
struct iso8601_duration {
  std::uint32_t years{};
  std::uint32_t months{};
  std::uint32_t weeks{};
  std::uint32_t days{};
  std::uint32_t hours{};
  std::uint32_t minutes{};
  double seconds{};

  /**
   * Converts the time components (weeks and smaller) to a duration. Years and months are ignored.
   */
  [[nodiscard]] auto time_part() const -> std::chrono::milliseconds
  {
    const auto total_hours = std::int64_t{ 24 } * 7 * weeks + std::int64_t{ 24 } * days + hours;
    return std::chrono::hours{ total_hours } + std::chrono::minutes{ minutes } +
           std::chrono::milliseconds{ static_cast<std::int64_t>(seconds * 1000) };
  }

  auto operator==(const iso8601_duration& other) const -> bool
  {
    return years == other.years && months == other.months && weeks == other.weeks &&
           days == other.days && hours == other.hours && minutes == other.minutes &&
           seconds == other.seconds;
  }
};
} // namespace metasearch
