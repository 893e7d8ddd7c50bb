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

#include "core/io/http_parser.hxx"

#include <string>

using metasearch::core::io::http_parser;

TEST_CASE("unit: parse response with content length", "[unit]")
{
  http_parser parser{};
  std::string input{ "HTTP/1.1 200 OK\r\n"
                     "Content-Type: application/json\r\n"
                     "Content-Length: 15\r\n"
                     "\r\n"
                     R"({"query":"rs"})" "\n" };

  auto res = parser.feed(input.data(), input.size());
  REQUIRE_FALSE(res.failure);
  REQUIRE(res.complete);
  CHECK(parser.response.status_code == 200);
  CHECK(parser.response.status_message == "OK");
  CHECK(parser.response.headers["content-type"] == "application/json");
  CHECK(parser.response.body == "{\"query\":\"rs\"}\n");
  CHECK(parser.response.is_success());
  CHECK_FALSE(parser.response.must_close_connection());
}

TEST_CASE("unit: parse response split into many pieces", "[unit]")
{
  http_parser parser{};
  std::string input{ "HTTP/1.1 503 Service Unavailable\r\n"
                     "Retry-After: 120\r\n"
                     "X-Backend-Name: searx-eu-1\r\n"
                     "Content-Length: 11\r\n"
                     "\r\n"
                     "unavailable" };

  for (std::size_t i = 0; i < input.size(); ++i) {
    auto res = parser.feed(input.data() + i, 1);
    REQUIRE_FALSE(res.failure);
    CHECK(res.complete == (i + 1 == input.size()));
  }
  CHECK(parser.response.status_code == 503);
  CHECK(parser.response.status_message == "Service Unavailable");
  CHECK(parser.response.headers["retry-after"] == "120");
  CHECK(parser.response.headers["x-backend-name"] == "searx-eu-1");
  CHECK(parser.response.body == "unavailable");
  CHECK_FALSE(parser.response.is_success());
}

TEST_CASE("unit: parse chunked response", "[unit]")
{
  http_parser parser{};
  std::string head{ "HTTP/1.1 200 OK\r\n"
                    "Transfer-Encoding: chunked\r\n"
                    "\r\n" };
  std::string chunks{ "5\r\nhello\r\n"
                      "7\r\n, world\r\n"
                      "0\r\n\r\n" };

  auto res = parser.feed(head.data(), head.size());
  REQUIRE_FALSE(res.failure);
  REQUIRE_FALSE(res.complete);

  res = parser.feed(chunks.data(), chunks.size());
  REQUIRE_FALSE(res.failure);
  REQUIRE(res.complete);
  CHECK(parser.response.body == "hello, world");
}

TEST_CASE("unit: parse response delimited by connection close", "[unit]")
{
  http_parser parser{};
  std::string input{ "HTTP/1.0 200 OK\r\n"
                     "Content-Type: application/json\r\n"
                     "\r\n"
                     "{\"results\":[]}" };

  auto res = parser.feed(input.data(), input.size());
  REQUIRE_FALSE(res.failure);
  REQUIRE_FALSE(res.complete);

  res = parser.finish();
  REQUIRE_FALSE(res.failure);
  REQUIRE(res.complete);
  CHECK(parser.response.body == "{\"results\":[]}");
  CHECK(parser.response.must_close_connection());
}

TEST_CASE("unit: connection close header", "[unit]")
{
  http_parser parser{};
  std::string input{ "HTTP/1.1 200 OK\r\n"
                     "Connection: close\r\n"
                     "Content-Length: 2\r\n"
                     "\r\n"
                     "{}" };

  auto res = parser.feed(input.data(), input.size());
  REQUIRE(res.complete);
  CHECK(parser.response.headers["connection"] == "close");
  CHECK(parser.response.must_close_connection());
}

TEST_CASE("unit: parser reports malformed response", "[unit]")
{
  http_parser parser{};
  std::string input{ "SMTP/1.1 220 smtp.example ESMTP\r\n\r\n" };

  auto res = parser.feed(input.data(), input.size());
  CHECK(res.failure);
  CHECK_FALSE(res.complete);
  CHECK_FALSE(res.error.empty());
}

TEST_CASE("unit: parser can be reused after reset", "[unit]")
{
  http_parser parser{};
  std::string first{ "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n" };
  std::string second{ "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\n[]" };

  auto res = parser.feed(first.data(), first.size());
  REQUIRE(res.complete);
  CHECK(parser.response.status_code == 404);

  parser.reset();
  CHECK_FALSE(parser.complete);
  CHECK(parser.response.headers.empty());

  res = parser.feed(second.data(), second.size());
  REQUIRE(res.complete);
  CHECK(parser.response.status_code == 200);
  CHECK(parser.response.status_message == "OK");
  CHECK(parser.response.body == "[]");
}

TEST_CASE("unit: moved parser keeps its state", "[unit]")
{
  http_parser parser{};
  std::string head{ "HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nnu" };
  std::string tail{ "ll" };

  auto res = parser.feed(head.data(), head.size());
  REQUIRE_FALSE(res.complete);

  http_parser moved{ std::move(parser) };
  res = moved.feed(tail.data(), tail.size());
  REQUIRE(res.complete);
  CHECK(moved.response.body == "null");
}
