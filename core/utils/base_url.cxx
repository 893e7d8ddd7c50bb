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

#include "base_url.hxx"

#include <fmt/core.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/uri.hpp>

#include <algorithm>
#include <cctype>

namespace metasearch::core::utils
{
namespace priv
{
using namespace tao::pegtl;

struct scheme : seq<uri::scheme, one<':'>, uri::dslash> {
};

using reg_char = sor<uri::unreserved, uri::pct_encoded, uri::sub_delims>;
struct reg_name : plus<reg_char> {
};
struct host : sor<uri::IP_literal, seq<uri::IPv4address, not_at<reg_char>>, reg_name> {
};

struct path : uri::path_abempty {
};

using opt_userinfo = opt<uri::userinfo, one<'@'>>;
using opt_port = opt<uri::colon, uri::port>;

using grammar = must<seq<scheme, opt_userinfo, host, opt_port, path, tao::pegtl::eof>>;

template<typename Rule>
struct action {
};

template<>
struct action<scheme> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, base_url& url)
  {
    url.scheme = in.string().substr(0, in.string().rfind(':'));
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    if (url.scheme == "http") {
      url.port = 80;
      url.tls = false;
    } else if (url.scheme == "https") {
      url.port = 443;
      url.tls = true;
    } else {
      url.port = 0;
    }
  }
};

template<>
struct action<reg_name> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, base_url& url)
  {
    url.type = base_url::address_type::dns;
    url.host = in.string();
  }
};

template<>
struct action<uri::IPv4address> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, base_url& url)
  {
    url.type = base_url::address_type::ipv4;
    url.host = in.string();
  }
};

template<>
struct action<uri::IPv6address> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, base_url& url)
  {
    url.type = base_url::address_type::ipv6;
    url.host = in.string();
  }
};

template<>
struct action<uri::port> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, base_url& url)
  {
    if (in.empty()) {
      return;
    }
    const auto value = in.size() > 5 ? 0UL : std::stoul(in.string());
    if (value == 0 || value > 65535) {
      url.error = fmt::format("port number {} is out of range", in.string());
      return;
    }
    url.port = static_cast<std::uint16_t>(value);
  }
};

template<>
struct action<path> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, base_url& url)
  {
    auto value = in.string();
    while (!value.empty() && value.back() == '/') {
      value.pop_back();
    }
    url.path = value + "/search";
  }
};
} // namespace priv

auto
base_url::host_header() const -> std::string
{
  const auto& address = type == address_type::ipv6 ? fmt::format("[{}]", host) : host;
  if ((tls && port == 443) || (!tls && port == 80)) {
    return address;
  }
  return fmt::format("{}:{}", address, port);
}

auto
base_url::endpoint() const -> std::string
{
  return fmt::format("{}://{}{}", scheme, host_header(), path);
}

auto
parse_base_url(const std::string& input) -> base_url
{
  base_url res{};

  if (input.empty()) {
    res.error = "failed to parse base URL: empty input";
    return res;
  }

  auto in = tao::pegtl::memory_input(input, __FUNCTION__);
  try {
    tao::pegtl::parse<priv::grammar, priv::action>(in, res);
  } catch (const tao::pegtl::parse_error& e) {
    for (const auto& position : e.positions()) {
      if (position.source == __FUNCTION__) {
        res.error = fmt::format("failed to parse base URL (column: {}, trailer: \"{}\")",
                                position.column,
                                input.substr(position.byte));
        break;
      }
    }
    if (!res.error) {
      res.error = e.what();
    }
    return res;
  }
  if (res.error) {
    return res;
  }
  if (res.scheme != "http" && res.scheme != "https") {
    res.error = fmt::format(R"(unsupported scheme "{}" in base URL, expected "http" or "https")",
                            res.scheme);
  }
  return res;
}
} // namespace metasearch::core::utils
