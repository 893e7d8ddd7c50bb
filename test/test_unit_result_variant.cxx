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

#include "core/impl/search_result_variant.hxx"
#include "core/utils/iso8601.hxx"
#include "core/utils/json.hxx"

#include <metasearch/fmt/priority_type.hxx>

#include <tao/json/value.hpp>

#include <string>

using metasearch::core::impl::decode_search_result;
using metasearch::core::impl::search_result_shape_mismatch;
using metasearch::core::utils::json::parse;

namespace
{
const std::string legacy_element = R"(
{
  "url": "https://www.rust-lang.org/",
  "template": "default.html",
  "engine": "duckduckgo",
  "parsed_url": ["https", "www.rust-lang.org", "/", "", "", ""],
  "title": "Rust Programming Language",
  "content": "A language empowering everyone to build reliable and efficient software.",
  "img_src": "",
  "thumbnail": "",
  "priority": "",
  "engines": ["duckduckgo", "brave"],
  "positions": [1, 3],
  "score": 4.5,
  "category": "general",
  "publishedDate": null,
  "pubdate": null
})";

const std::string main_element = R"(
{
  "url": "https://www.youtube.com/watch?v=abc",
  "engine": "youtube",
  "parsed_url": ["https", "www.youtube.com", "/watch", "", "v=abc", ""],
  "template": "videos.html",
  "title": "Rust in 100 Seconds",
  "content": "Rust is a memory-safe compiled programming language.",
  "img_src": "",
  "iframe_src": "https://www.youtube-nocookie.com/embed/abc",
  "audio_src": "",
  "thumbnail": "https://i.ytimg.com/vi/abc/hqdefault.jpg",
  "publishedDate": "2021-09-20T15:30:00",
  "pubdate": "2021-09-20 15:30:00",
  "length": "PT2M26S",
  "views": "3.1M",
  "author": "Fireship",
  "metadata": "",
  "priority": "high",
  "engines": ["youtube"],
  "open_group": false,
  "close_group": false,
  "positions": [2],
  "score": 0.5,
  "category": "videos"
})";

/* Same fields as above, listed in a different order. */
const std::string main_element_shuffled = R"(
{
  "category": "videos",
  "score": 0.5,
  "positions": [2],
  "close_group": false,
  "open_group": false,
  "engines": ["youtube"],
  "priority": "high",
  "metadata": "",
  "author": "Fireship",
  "views": "3.1M",
  "length": "PT2M26S",
  "pubdate": "2021-09-20 15:30:00",
  "publishedDate": "2021-09-20T15:30:00",
  "thumbnail": "https://i.ytimg.com/vi/abc/hqdefault.jpg",
  "audio_src": "",
  "iframe_src": "https://www.youtube-nocookie.com/embed/abc",
  "img_src": "",
  "content": "Rust is a memory-safe compiled programming language.",
  "title": "Rust in 100 Seconds",
  "template": "videos.html",
  "parsed_url": ["https", "www.youtube.com", "/watch", "", "v=abc", ""],
  "engine": "youtube",
  "url": "https://www.youtube.com/watch?v=abc"
})";
} // namespace

TEST_CASE("unit: element with legacy fields only is decoded as legacy result", "[unit]")
{
  search_result_shape_mismatch mismatch{};
  auto result = decode_search_result(parse(legacy_element), mismatch);
  REQUIRE(result.has_value());
  REQUIRE(result->is_legacy());
  CHECK_FALSE(result->is_main());

  const auto& legacy = result->as_legacy();
  CHECK(legacy.url == "https://www.rust-lang.org/");
  CHECK(legacy.engine == "duckduckgo");
  CHECK(legacy.template_name == "default.html");
  REQUIRE(legacy.parsed_url.has_value());
  CHECK(legacy.parsed_url->size() == 6);
  CHECK(legacy.engines == std::vector<std::string>{ "duckduckgo", "brave" });
  CHECK(legacy.positions == std::vector<std::int32_t>{ 1, 3 });
  CHECK(legacy.score == 4.5);
  CHECK(legacy.priority == metasearch::priority_type::none);
  CHECK_FALSE(legacy.published_date.has_value());
  CHECK_FALSE(legacy.pubdate.has_value());

  CHECK(result->title() == "Rust Programming Language");
  CHECK(result->engine() == "duckduckgo");
  CHECK(result->category() == "general");
  CHECK_THROWS_AS(result->as_main(), std::bad_variant_access);
}

TEST_CASE("unit: element with main-only fields is decoded as main result", "[unit]")
{
  for (const auto& body : { main_element, main_element_shuffled }) {
    search_result_shape_mismatch mismatch{};
    auto result = decode_search_result(parse(body), mismatch);
    REQUIRE(result.has_value());
    REQUIRE(result->is_main());
    CHECK(mismatch.legacy_reason.find("iframe_src") != std::string::npos);

    const auto& main = result->as_main();
    CHECK(main.engine == "youtube");
    CHECK(main.template_name == "videos.html");
    CHECK(main.iframe_src == "https://www.youtube-nocookie.com/embed/abc");
    CHECK(main.views == "3.1M");
    CHECK(main.author == "Fireship");
    CHECK(main.priority == metasearch::priority_type::high);
    CHECK_FALSE(main.open_group);
    CHECK_FALSE(main.close_group);
    REQUIRE(main.published_date.has_value());
    CHECK(metasearch::core::utils::format_date_time(main.published_date.value()) ==
          "2021-09-20T15:30:00");
    CHECK(main.pubdate == "2021-09-20 15:30:00");
    REQUIRE(main.length.has_value());
    CHECK(main.length->minutes == 2);
    CHECK(main.length->seconds == 26);
    CHECK(main.length->time_part() == std::chrono::seconds{ 146 });

    CHECK(result->positions() == std::vector<std::int32_t>{ 2 });
    CHECK(result->score() == 0.5);
    CHECK(result->priority() == metasearch::priority_type::high);
  }
}

TEST_CASE("unit: element matching no shape is rejected with explanation", "[unit]")
{
  auto element = parse(main_element);
  element["sponsored"] = true;

  search_result_shape_mismatch mismatch{};
  auto result = decode_search_result(element, mismatch);
  REQUIRE_FALSE(result.has_value());
  CHECK(mismatch.unknown_fields == std::vector<std::string>{ "sponsored" });
  CHECK(mismatch.main_reason.find("sponsored") != std::string::npos);

  auto message = mismatch.to_string(4);
  CHECK(message.find("result #4") != std::string::npos);
  CHECK(message.find("legacy shape rejected") != std::string::npos);
  CHECK(message.find("main shape rejected") != std::string::npos);
  CHECK(message.find("fields unknown to both shapes: sponsored") != std::string::npos);
}

TEST_CASE("unit: element missing required field is rejected", "[unit]")
{
  auto element = parse(legacy_element);
  element.get_object().erase("title");

  search_result_shape_mismatch mismatch{};
  REQUIRE_FALSE(decode_search_result(element, mismatch).has_value());
  CHECK(mismatch.legacy_reason.find("missing: title") != std::string::npos);
  CHECK(mismatch.unknown_fields.empty());
  CHECK(mismatch.to_string(0).find("fields unknown to both shapes") == std::string::npos);
}

TEST_CASE("unit: element with mistyped field is rejected", "[unit]")
{
  auto element = parse(legacy_element);
  element["score"] = "high";

  search_result_shape_mismatch mismatch{};
  REQUIRE_FALSE(decode_search_result(element, mismatch).has_value());
  CHECK(mismatch.legacy_reason.find("mistyped: score") != std::string::npos);
}

TEST_CASE("unit: absent or null engines and positions are decoded as empty lists", "[unit]")
{
  SECTION("absent")
  {
    auto element = parse(legacy_element);
    element.get_object().erase("engines");
    element.get_object().erase("positions");

    search_result_shape_mismatch mismatch{};
    auto result = decode_search_result(element, mismatch);
    REQUIRE(result.has_value());
    CHECK(result->is_legacy());
    CHECK(result->engines().empty());
    CHECK(result->positions().empty());
  }

  SECTION("null")
  {
    auto element = parse(main_element);
    element["engines"] = tao::json::null;
    element["positions"] = tao::json::null;

    search_result_shape_mismatch mismatch{};
    auto result = decode_search_result(element, mismatch);
    REQUIRE(result.has_value());
    CHECK(result->is_main());
    CHECK(result->engines().empty());
    CHECK(result->positions().empty());
  }
}

TEST_CASE("unit: priority of search result", "[unit]")
{
  auto element = parse(legacy_element);
  search_result_shape_mismatch mismatch{};

  element["priority"] = "low";
  auto low = decode_search_result(element, mismatch);
  REQUIRE(low.has_value());
  CHECK(low->priority() == metasearch::priority_type::low);

  CHECK(fmt::format("{}", low->priority()) == "low");

  element["priority"] = "urgent";
  REQUIRE_FALSE(decode_search_result(element, mismatch).has_value());
  CHECK(mismatch.legacy_reason.find("priority") != std::string::npos);
}

TEST_CASE("unit: published date and length must be well-formed", "[unit]")
{
  search_result_shape_mismatch mismatch{};

  auto element = parse(main_element);
  element["publishedDate"] = "20 September 2021";
  REQUIRE_FALSE(decode_search_result(element, mismatch).has_value());
  CHECK(mismatch.main_reason.find("publishedDate") != std::string::npos);

  element = parse(main_element);
  element["length"] = "2:26";
  REQUIRE_FALSE(decode_search_result(element, mismatch).has_value());
  CHECK(mismatch.main_reason.find("length") != std::string::npos);

  element = parse(main_element);
  element["length"] = "PT99999999999H";
  REQUIRE_FALSE(decode_search_result(element, mismatch).has_value());
  CHECK(mismatch.main_reason.find("length") != std::string::npos);

  element = parse(main_element);
  element["publishedDate"] = "2021-09-20 15:30:00";
  REQUIRE_FALSE(decode_search_result(element, mismatch).has_value());
  CHECK(mismatch.main_reason.find("publishedDate") != std::string::npos);

  element = parse(main_element);
  element["length"] = tao::json::null;
  auto result = decode_search_result(element, mismatch);
  REQUIRE(result.has_value());
  CHECK_FALSE(result->as_main().length.has_value());
}

TEST_CASE("unit: result element which is not an object", "[unit]")
{
  search_result_shape_mismatch mismatch{};
  REQUIRE_FALSE(decode_search_result(parse(R"(["https://example.com"])"), mismatch).has_value());
  CHECK(mismatch.legacy_reason == "expected object, got array");
  CHECK(mismatch.main_reason == "expected object, got array");
  CHECK(mismatch.unknown_fields.empty());
}
