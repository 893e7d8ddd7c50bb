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

#include "url_codec.hxx"

#include <fmt/core.h>

#include <cstdint>

namespace metasearch::core::utils::string_codec
{
namespace
{
/* See: https://url.spec.whatwg.org/#urlencoded-serializing */
auto
is_form_safe(unsigned char c) -> bool
{
  return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '*' ||
         c == '-' || c == '.' || c == '_';
}

auto
hex_value(char c) -> int
{
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}
} // namespace

auto
form_encode(const std::string& src) -> std::string
{
  std::string out;
  out.reserve(src.size());
  for (const char ch : src) {
    auto c = static_cast<unsigned char>(ch);
    if (is_form_safe(c)) {
      out.push_back(ch);
    } else if (c == ' ') {
      out.push_back('+');
    } else {
      out.append(fmt::format("%{:02X}", static_cast<std::uint8_t>(c)));
    }
  }
  return out;
}

auto
form_decode(const std::string& src) -> std::optional<std::string>
{
  std::string out;
  out.reserve(src.size());
  for (std::size_t i = 0; i < src.size(); ++i) {
    const char c = src[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= src.size()) {
        return {};
      }
      const int hi = hex_value(src[i + 1]);
      const int lo = hex_value(src[i + 2]);
      if (hi < 0 || lo < 0) {
        return {};
      }
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

auto
form_encode(const std::vector<std::pair<std::string, std::string>>& values) -> std::string
{
  std::string out;
  for (const auto& [key, value] : values) {
    if (!out.empty()) {
      out.push_back('&');
    }
    out.append(form_encode(key)).append("=").append(form_encode(value));
  }
  return out;
}

auto
form_decode_fields(const std::string& body)
  -> std::optional<std::vector<std::pair<std::string, std::string>>>
{
  std::vector<std::pair<std::string, std::string>> fields;
  std::size_t start = 0;
  while (start <= body.size()) {
    auto end = body.find('&', start);
    if (end == std::string::npos) {
      end = body.size();
    }
    if (end > start) {
      const auto pair = body.substr(start, end - start);
      const auto eq = pair.find('=');
      auto key = form_decode(pair.substr(0, eq));
      auto value = form_decode(eq == std::string::npos ? std::string{} : pair.substr(eq + 1));
      if (!key || !value) {
        return {};
      }
      fields.emplace_back(std::move(key.value()), std::move(value.value()));
    }
    start = end + 1;
  }
  return fields;
}
} // namespace metasearch::core::utils::string_codec
