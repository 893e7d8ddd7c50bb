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

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace metasearch::core::utils::string_codec
{
/**
 * Serializes a single value following the `application/x-www-form-urlencoded` rules of the WHATWG
 * URL standard: alphanumerics and `*-._` are kept, space becomes `+`, everything else is
 * percent-encoded byte by byte.
 */
auto
form_encode(const std::string& src) -> std::string;

/**
 * Reverses @ref form_encode. Returns empty optional if a percent sequence is truncated or is not
 * hexadecimal.
 */
auto
form_decode(const std::string& src) -> std::optional<std::string>;

/**
 * Serializes pairs as `key=value` joined with `&`, in the given order.
 */
auto
form_encode(const std::vector<std::pair<std::string, std::string>>& values) -> std::string;

/**
 * Splits a form body into decoded pairs. Returns empty optional on malformed escapes.
 */
auto
form_decode_fields(const std::string& body)
  -> std::optional<std::vector<std::pair<std::string, std::string>>>;
} // namespace metasearch::core::utils::string_codec
