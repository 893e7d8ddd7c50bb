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

#include <metasearch/iso8601_duration.hxx>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace metasearch::core::utils
{
/**
 * Parses naive date-time "YYYY-MM-DDTHH:MM:SS[.fraction]".
 *
 * The value does not carry a time zone, it is interpreted as UTC.
 */
auto
parse_date_time(std::string_view text) -> std::optional<std::chrono::system_clock::time_point>;

/**
 * Formats time point as "YYYY-MM-DDTHH:MM:SS[.ffffff]" in UTC, the fraction is only written when
 * it is not zero.
 */
auto
format_date_time(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * Parses ISO 8601 duration "PnYnMnDTnHnMnS" or "PnW". Only seconds may have a fraction.
 */
auto
parse_iso8601_duration(std::string_view text) -> std::optional<iso8601_duration>;

auto
format_iso8601_duration(const iso8601_duration& duration) -> std::string;
} // namespace metasearch::core::utils
