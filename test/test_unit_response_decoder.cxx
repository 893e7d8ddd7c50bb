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

#include "core/impl/search_response_decoder.hxx"
#include "core/impl/search_response_json.hxx"
#include "core/utils/json.hxx"

#include <metasearch/error_codes.hxx>

#include <tao/json.hpp>

using metasearch::core::impl::decode_search_response;

namespace
{
const std::string full_response = R"(
{
  "query": "rust",
  "number_of_results": 1430000,
  "results": [
    {
      "url": "https://www.rust-lang.org/",
      "template": "default.html",
      "engine": "duckduckgo",
      "parsed_url": ["https", "www.rust-lang.org", "/", "", "", ""],
      "title": "Rust Programming Language",
      "content": "A language empowering everyone.",
      "img_src": "",
      "thumbnail": "",
      "priority": "",
      "engines": ["duckduckgo"],
      "positions": [1],
      "score": 1.0,
      "category": "general"
    },
    {
      "url": "https://www.youtube.com/watch?v=abc",
      "engine": "youtube",
      "template": "videos.html",
      "title": "Rust in 100 Seconds",
      "content": "",
      "img_src": "",
      "iframe_src": "https://www.youtube-nocookie.com/embed/abc",
      "audio_src": "",
      "thumbnail": "",
      "publishedDate": null,
      "length": null,
      "views": "",
      "author": "",
      "metadata": "",
      "priority": "low",
      "engines": ["youtube"],
      "open_group": true,
      "close_group": false,
      "positions": [3],
      "score": 0.33,
      "category": "videos"
    }
  ],
  "answers": [
    [{ "url": "https://doc.rust-lang.org/", "engine": "wikidata", "answer": "systems language" }],
    []
  ],
  "corrections": ["rest"],
  "infoboxes": [
    {
      "infobox": "Rust",
      "id": "https://en.wikipedia.org/wiki/Rust_(programming_language)",
      "content": "Rust is a general-purpose programming language.",
      "urls": [{ "title": "Official website", "url": "https://www.rust-lang.org/", "official": true }],
      "attributes": [{ "label": "Designed by", "value": "Graydon Hoare", "entity": "P287" }],
      "engine": "wikipedia",
      "img_src": "",
      "template": "infobox.html",
      "title": "",
      "thumbnail": "",
      "priority": "",
      "engines": ["wikipedia", "wikidata"],
      "positions": "",
      "score": 0,
      "category": "general"
    }
  ],
  "suggestions": ["rust lang", "rust game"],
  "unresponsive_engines": [["google", "timeout"], ["bing", "CAPTCHA"]],
  "paging": true,
  "number_of_pages": 10
})";

auto
response_with(const std::string& key, tao::json::value value) -> std::string
{
  auto body = metasearch::core::utils::json::parse(full_response);
  body[key] = std::move(value);
  return metasearch::core::utils::json::generate(body);
}
} // namespace

TEST_CASE("unit: decode complete search response", "[unit]")
{
  auto decoded = decode_search_response(full_response);
  REQUIRE_SUCCESS(decoded.ec);
  const auto& resp = decoded.response;

  CHECK(resp.query == "rust");
  CHECK(resp.number_of_results == 1430000);

  REQUIRE(resp.results.size() == 2);
  CHECK(resp.results[0].is_legacy());
  CHECK(resp.results[1].is_main());
  CHECK(resp.results[1].as_main().open_group);
  CHECK(resp.results[1].priority() == metasearch::priority_type::low);

  REQUIRE(resp.answers.size() == 2);
  REQUIRE(resp.answers[0].size() == 1);
  CHECK(resp.answers[0][0].engine == "wikidata");
  CHECK(resp.answers[0][0].url == "https://doc.rust-lang.org/");
  CHECK_FALSE(resp.answers[0][0].parsed_url.has_value());
  CHECK(resp.answers[1].empty());

  CHECK(resp.corrections == std::vector<std::string>{ "rest" });
  CHECK(resp.suggestions == std::vector<std::string>{ "rust lang", "rust game" });

  REQUIRE(resp.infoboxes.size() == 1);
  const auto& box = resp.infoboxes[0];
  CHECK(box.infobox == "Rust");
  CHECK(box.engine == "wikipedia");
  CHECK(box.positions.empty());
  CHECK_FALSE(box.url.has_value());
  REQUIRE(box.urls.has_value());
  REQUIRE(box.urls->size() == 1);
  CHECK(box.urls->at(0).at("title").get_string() == "Official website");
  CHECK(box.urls->at(0).at("official").get_boolean());
  REQUIRE(box.attributes.has_value());
  CHECK(box.attributes->at(0).at("value").get_string() == "Graydon Hoare");

  REQUIRE(resp.unresponsive_engines.size() == 2);
  CHECK(resp.unresponsive_engines[0] == metasearch::engine_error{ "google", "timeout" });
  CHECK(resp.unresponsive_engines[1] == metasearch::engine_error{ "bing", "CAPTCHA" });
}

TEST_CASE("unit: number of results does not depend on the result list", "[unit]")
{
  auto decoded = decode_search_response(R"({"query":"nothing","number_of_results":0,"results":[],)"
                                        R"("answers":[],"corrections":[],"infoboxes":[],)"
                                        R"("suggestions":[],"unresponsive_engines":[]})");
  REQUIRE_SUCCESS(decoded.ec);
  CHECK(decoded.response.number_of_results == 0);
  CHECK(decoded.response.results.empty());

  decoded = decode_search_response(response_with("number_of_results", 0));
  REQUIRE_SUCCESS(decoded.ec);
  CHECK(decoded.response.number_of_results == 0);
  CHECK(decoded.response.results.size() == 2);

  decoded = decode_search_response(response_with("number_of_results", 1.5));
  CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
  CHECK(decoded.message.find("number_of_results") != std::string::npos);
}

TEST_CASE("unit: body which is not JSON", "[unit]")
{
  for (const auto* body : { "", "<html><body>Too Many Requests</body></html>", R"({"query": )" }) {
    auto decoded = decode_search_response(body);
    CHECK(decoded.ec == metasearch::errc::common::parsing_failure);
    CHECK(decoded.message.find("not valid JSON") != std::string::npos);
  }
}

TEST_CASE("unit: body with unexpected top-level structure", "[unit]")
{
  SECTION("not an object")
  {
    auto decoded = decode_search_response(R"(["rust"])");
    CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
    CHECK(decoded.message == "expected object at the top level, got array");
  }

  SECTION("missing fields")
  {
    auto body = metasearch::core::utils::json::parse(full_response);
    body.get_object().erase("suggestions");
    body.get_object().erase("answers");
    auto decoded = decode_search_response(metasearch::core::utils::json::generate(body));
    CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
    CHECK(decoded.message.find("missing: answers, suggestions") != std::string::npos);
  }

  SECTION("mistyped field")
  {
    auto decoded = decode_search_response(response_with("corrections", "rest"));
    CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
    CHECK(decoded.message.find("mistyped: corrections (expected array, got string)") !=
          std::string::npos);
  }

  SECTION("unknown top-level fields are ignored")
  {
    auto decoded = decode_search_response(response_with("brand_new_section", tao::json::empty_object));
    REQUIRE_SUCCESS(decoded.ec);
    CHECK(decoded.response.results.size() == 2);
  }
}

TEST_CASE("unit: single invalid result fails the whole page", "[unit]")
{
  auto body = metasearch::core::utils::json::parse(full_response);
  body["results"].get_array().at(1)["sponsored"] = true;

  auto decoded = decode_search_response(metasearch::core::utils::json::generate(body));
  CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
  CHECK(decoded.message.find("result #1 does not match any known shape") != std::string::npos);
  CHECK(decoded.message.find("sponsored") != std::string::npos);
  CHECK(decoded.response.results.empty());
}

TEST_CASE("unit: unresponsive engine must be a pair of strings", "[unit]")
{
  auto decoded = decode_search_response(response_with(
    "unresponsive_engines", metasearch::core::utils::json::parse(R"([["google", "timeout", 429]])")));
  CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
  CHECK(decoded.message.find("unresponsive engine #0: expected two elements, got 3") !=
        std::string::npos);

  decoded = decode_search_response(response_with(
    "unresponsive_engines", metasearch::core::utils::json::parse(R"([["google", 503]])")));
  CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
  CHECK(decoded.message.find("unresponsive engine #0: error message") != std::string::npos);

  decoded = decode_search_response(response_with(
    "unresponsive_engines", metasearch::core::utils::json::parse(R"([{"google": "timeout"}])")));
  CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
  CHECK(decoded.message.find("expected array, got object") != std::string::npos);
}

TEST_CASE("unit: invalid answers and infoboxes", "[unit]")
{
  auto decoded = decode_search_response(
    response_with("answers", metasearch::core::utils::json::parse("[[42]]")));
  CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
  CHECK(decoded.message.find("answer #0.0: expected object, got number") != std::string::npos);

  auto body = metasearch::core::utils::json::parse(full_response);
  body["infoboxes"].get_array().at(0).get_object().erase("id");
  decoded = decode_search_response(metasearch::core::utils::json::generate(body));
  CHECK(decoded.ec == metasearch::errc::common::schema_mismatch);
  CHECK(decoded.message.find("infobox #0: missing: id") != std::string::npos);

  body = metasearch::core::utils::json::parse(full_response);
  body["infoboxes"].get_array().at(0)["wikidata_id"] = "Q575650";
  decoded = decode_search_response(metasearch::core::utils::json::generate(body));
  REQUIRE_SUCCESS(decoded.ec);
}

TEST_CASE("unit: decoded response can be rendered back to JSON", "[unit]")
{
  auto decoded = decode_search_response(full_response);
  REQUIRE_SUCCESS(decoded.ec);

  tao::json::value rendered = decoded.response;
  CHECK(rendered["query"].get_string() == "rust");
  CHECK(rendered["number_of_results"].as<std::int64_t>() == 1430000);
  CHECK(rendered["results"].get_array().size() == 2);
  CHECK(rendered["results"].get_array().at(1)["iframe_src"].get_string() ==
        "https://www.youtube-nocookie.com/embed/abc");
  CHECK(rendered["results"].get_array().at(1)["priority"].get_string() == "low");
  CHECK(rendered["unresponsive_engines"].get_array().at(0).get_array().at(1).get_string() == "timeout");
}
