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

#include "test_helper.hxx"

#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "core/meta/version.hxx"
#include "core/utils/base_url.hxx"
#include "core/utils/duration_parser.hxx"
#include "core/utils/iso8601.hxx"
#include "core/utils/json.hxx"
#include "core/utils/language_tag.hxx"
#include "core/utils/url_codec.hxx"

#include <metasearch/build_version.hxx>
#include <metasearch/error_codes.hxx>

#include <tao/json.hpp>

#include <sstream>

TEST_CASE("unit: transformer to deduplicate JSON keys", "[unit]")
{
  using Catch::Matchers::ContainsSubstring;

  std::string input{ R"({"answer":"wrong","answer":42})" };

  CHECK_THROWS_WITH(tao::json::from_string(input),
                    ContainsSubstring("duplicate JSON object key \"answer\""));

  auto result = metasearch::core::utils::json::parse(input);
  INFO(metasearch::core::utils::json::generate(result));
  CHECK(result.is_object());
  CHECK(result.find("answer") != nullptr);
  CHECK(result["answer"].is_integer());
  CHECK(result["answer"].as<std::int64_t>() == 42);
}

TEST_CASE("unit: string representation of the error codes", "[unit]")
{
  std::error_code rc = metasearch::errc::common::schema_mismatch;
  CHECK(rc.category().name() == std::string("metasearch.common"));
  CHECK(rc.value() == 3);
  CHECK(rc.message() == "schema_mismatch (3)");
  std::stringstream ss;
  ss << rc;
  CHECK(ss.str() == "metasearch.common:3");

  rc = metasearch::errc::network::unsupported_scheme;
  CHECK(rc.category().name() == std::string("metasearch.network"));
  CHECK(rc.value() == 107);
}

TEST_CASE("unit: form encoding", "[unit]")
{
  using namespace metasearch::core::utils::string_codec;

  CHECK(form_encode("rust lang") == "rust+lang");
  CHECK(form_encode("a+b=c&d") == "a%2Bb%3Dc%26d");
  CHECK(form_encode("*-._~") == "*-._%7E");
  CHECK(form_encode("\xD0\xBF\xD1\x80") == "%D0%BF%D1%80");

  CHECK(form_decode("rust+lang") == "rust lang");
  CHECK(form_decode("%d0%bf%D1%80") == "\xD0\xBF\xD1\x80");
  CHECK_FALSE(form_decode("100%").has_value());
  CHECK_FALSE(form_decode("%4").has_value());
  CHECK_FALSE(form_decode("%zz").has_value());

  auto fields = form_decode_fields("q=a%26b&empty=&flag&&format=json");
  REQUIRE(fields.has_value());
  CHECK(fields.value() == std::vector<std::pair<std::string, std::string>>{
                            { "q", "a&b" }, { "empty", "" }, { "flag", "" }, { "format", "json" } });
  CHECK_FALSE(form_decode_fields("q=%").has_value());
}

TEST_CASE("unit: language tags", "[unit]")
{
  using metasearch::core::utils::is_valid_language_tag;

  for (const auto* tag : { "en",
                           "en-US",
                           "zh-Hant-TW",
                           "sr-Latn-RS",
                           "de-CH-1996",
                           "es-419",
                           "x-private",
                           "en-a-bbb-x-a-ccc",
                           "i-klingon",
                           "all",
                           "auto" }) {
    INFO(tag);
    CHECK(is_valid_language_tag(tag));
  }

  for (const auto* tag : { "", "e", "en_US", "english please", "en-", "-en", "en--US", "toolonglang", "x" }) {
    INFO(tag);
    CHECK_FALSE(is_valid_language_tag(tag));
  }
}

TEST_CASE("unit: base URL of the backend", "[unit]")
{
  using metasearch::core::utils::parse_base_url;

  SECTION("plain host")
  {
    auto url = parse_base_url("https://searx.example");
    REQUIRE_FALSE(url.error.has_value());
    CHECK(url.tls);
    CHECK(url.port == 443);
    CHECK(url.host == "searx.example");
    CHECK(url.path == "/search");
    CHECK(url.host_header() == "searx.example");
    CHECK(url.endpoint() == "https://searx.example/search");
  }

  SECTION("port and prefix")
  {
    auto url = parse_base_url("HTTP://127.0.0.1:8089/searx/");
    REQUIRE_FALSE(url.error.has_value());
    CHECK(url.scheme == "http");
    CHECK_FALSE(url.tls);
    CHECK(url.type == metasearch::core::utils::base_url::address_type::ipv4);
    CHECK(url.port == 8089);
    CHECK(url.path == "/searx/search");
    CHECK(url.host_header() == "127.0.0.1:8089");
  }

  SECTION("IPv6 literal")
  {
    auto url = parse_base_url("http://[::1]:8888");
    REQUIRE_FALSE(url.error.has_value());
    CHECK(url.type == metasearch::core::utils::base_url::address_type::ipv6);
    CHECK(url.host == "::1");
    CHECK(url.endpoint() == "http://[::1]:8888/search");
  }

  SECTION("invalid")
  {
    for (const auto* input : { "", "searx.example", "ftp://searx.example", "http://", "http://host:70000",
                               "https://searx.example/?q=rust" }) {
      INFO(input);
      CHECK(parse_base_url(input).error.has_value());
    }
  }
}

TEST_CASE("unit: ISO 8601 date-time", "[unit]")
{
  using metasearch::core::utils::format_date_time;
  using metasearch::core::utils::parse_date_time;

  auto tp = parse_date_time("1970-01-02T00:00:01");
  REQUIRE(tp.has_value());
  CHECK(tp->time_since_epoch() == std::chrono::hours{ 24 } + std::chrono::seconds{ 1 });

  tp = parse_date_time("2024-02-29T23:59:59.250");
  REQUIRE(tp.has_value());
  CHECK(format_date_time(tp.value()) == "2024-02-29T23:59:59.250000");

  tp = parse_date_time("1969-12-31T23:00:00");
  REQUIRE(tp.has_value());
  CHECK(format_date_time(tp.value()) == "1969-12-31T23:00:00");

  for (const auto* input : { "",
                             "2023-02-29T00:00:00",
                             "2024-13-01T00:00:00",
                             "2024-01-01T24:00:00",
                             "2024-01-01",
                             "2024-01-01 00:00:00",
                             "2024-01-01T00:00:00.",
                             "99999-01-01T00:00:00",
                             "2024-01-01T00:00:00Z",
                             "2024-01-01T00:00:00+02:00",
                             "Mon, 01 Jan 2024 00:00:00 GMT" }) {
    INFO(input);
    CHECK_FALSE(parse_date_time(input).has_value());
  }
}

TEST_CASE("unit: ISO 8601 duration", "[unit]")
{
  using metasearch::core::utils::format_iso8601_duration;
  using metasearch::core::utils::parse_iso8601_duration;

  auto d = parse_iso8601_duration("P1Y2M3DT4H5M6.5S");
  REQUIRE(d.has_value());
  CHECK(d->years == 1);
  CHECK(d->months == 2);
  CHECK(d->days == 3);
  CHECK(d->hours == 4);
  CHECK(d->minutes == 5);
  CHECK(d->seconds == 6.5);

  d = parse_iso8601_duration("P2W");
  REQUIRE(d.has_value());
  CHECK(d->weeks == 2);
  CHECK(d->time_part() == std::chrono::hours{ 24 * 14 });
  CHECK(format_iso8601_duration(d.value()) == "P2W");

  d = parse_iso8601_duration("PT1H30M");
  REQUIRE(d.has_value());
  CHECK(d->time_part() == std::chrono::minutes{ 90 });

  d = parse_iso8601_duration("PT0,5S");
  REQUIRE(d.has_value());
  CHECK(d->seconds == 0.5);

  d = parse_iso8601_duration("PT4294967295H");
  REQUIRE(d.has_value());
  CHECK(d->hours == 4294967295U);

  for (const auto* input : { "", "P", "PT", "P1.5D", "PT1.5M", "1H", "P1W2D", "PT5S3M", "P-1D",
                             "PT99999999999H", "P4294967296D", "PT4294967296S" }) {
    INFO(input);
    CHECK_FALSE(parse_iso8601_duration(input).has_value());
  }
}

TEST_CASE("unit: duration strings of command line options", "[unit]")
{
  using metasearch::core::utils::duration_parse_error;
  using metasearch::core::utils::parse_duration;
  using namespace std::chrono_literals;

  CHECK(parse_duration("0") == 0ns);
  CHECK(parse_duration("300ms") == 300ms);
  CHECK(parse_duration("2h45m") == 2h + 45min);
  CHECK(parse_duration("-1.5h") == -90min);
  CHECK(parse_duration("1.5us") == 1500ns);
  CHECK(parse_duration("+10s") == 10s);

  CHECK_THROWS_AS(parse_duration(""), duration_parse_error);
  CHECK_THROWS_AS(parse_duration("10"), duration_parse_error);
  CHECK_THROWS_AS(parse_duration("ms"), duration_parse_error);
  CHECK_THROWS_AS(parse_duration("10days"), duration_parse_error);
  CHECK_THROWS_AS(parse_duration("."), duration_parse_error);
}

TEST_CASE("unit: user_agent string", "[unit]")
{
  auto expected = fmt::format("metasearch-cxx-client/{}.{}.{} ({}/{}; rev={})",
                              METASEARCH_CXX_CLIENT_VERSION_MAJOR,
                              METASEARCH_CXX_CLIENT_VERSION_MINOR,
                              METASEARCH_CXX_CLIENT_VERSION_PATCH,
                              METASEARCH_CXX_CLIENT_SYSTEM_NAME,
                              METASEARCH_CXX_CLIENT_SYSTEM_PROCESSOR,
                              METASEARCH_CXX_CLIENT_GIT_REVISION_SHORT);

  CHECK(metasearch::core::meta::user_agent_for_http() == expected);
  CHECK(metasearch::core::meta::user_agent_for_http("msc/1.0") == expected + " msc/1.0");
  CHECK(metasearch::core::meta::user_agent_for_http("hello\r\nworld") == expected + " hello  world");
}

TEST_CASE("unit: build information", "[unit]")
{
  auto info = metasearch::core::meta::sdk_build_info();
  CHECK(info["version"] == fmt::format("{}.{}.{}",
                                       METASEARCH_CXX_CLIENT_VERSION_MAJOR,
                                       METASEARCH_CXX_CLIENT_VERSION_MINOR,
                                       METASEARCH_CXX_CLIENT_VERSION_PATCH));
  CHECK(info.count("llhttp") == 1);
  CHECK(info.count("openssl_runtime") == 1);

  auto json = metasearch::core::utils::json::parse(metasearch::core::meta::sdk_build_info_json());
  CHECK(json["version_major"].as<std::int64_t>() == METASEARCH_CXX_CLIENT_VERSION_MAJOR);
  CHECK(json["semver"].get_string() == metasearch::core::meta::sdk_semver());
}
