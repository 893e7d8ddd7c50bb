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

#include "utils/scripted_transport.hxx"

#include <metasearch/client.hxx>
#include <metasearch/error_codes.hxx>

#include <asio/io_context.hpp>

#include <tao/json.hpp>

namespace
{
struct paginated_outcome {
  metasearch::error err{};
  std::vector<metasearch::search_result> results{};
  bool completed{ false };
};

auto
make_client(asio::io_context& io,
            const std::shared_ptr<test::utils::scripted_transport>& transport,
            const metasearch::client_options& options = {}) -> metasearch::client
{
  auto [err, client] = metasearch::client::create(io, "http://127.0.0.1:8888/", transport, options);
  REQUIRE_NO_ERROR(err);
  return client;
}

auto
collect(asio::io_context& io, const metasearch::search_request& request, std::size_t num)
  -> paginated_outcome
{
  paginated_outcome outcome{};
  request.send_get_num(num, [&outcome](auto err, auto results) {
    outcome.err = std::move(err);
    outcome.results = std::move(results);
    outcome.completed = true;
  });
  io.run();
  io.restart();
  return outcome;
}

auto
titles(const std::vector<metasearch::search_result>& results) -> std::vector<std::string>
{
  std::vector<std::string> values{};
  values.reserve(results.size());
  for (const auto& result : results) {
    values.push_back(result.title());
  }
  return values;
}
} // namespace

TEST_CASE("unit: pagination collects results until the backend is exhausted", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_with_results("rust", 10, "page 1")
    .respond_with_results("rust", 10, "page 2")
    .respond_empty(3);
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 25);

  REQUIRE(outcome.completed);
  REQUIRE_NO_ERROR(outcome.err);
  REQUIRE(outcome.results.size() == 20);
  CHECK(outcome.results.front().title() == "page 1 #0");
  CHECK(outcome.results[9].title() == "page 1 #9");
  CHECK(outcome.results[10].title() == "page 2 #0");
  CHECK(outcome.results.back().title() == "page 2 #9");
  CHECK(transport->requested_pages() == std::vector<std::uint32_t>{ 1, 2, 3, 3, 3 });
}

TEST_CASE("unit: pagination does not request a page after the empty page budget is spent", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_empty(3).respond_with_results("rust", 10, "late");
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 5);

  REQUIRE(outcome.completed);
  REQUIRE_NO_ERROR(outcome.err);
  CHECK(outcome.results.empty());
  CHECK(transport->requests().size() == 3);
  CHECK(transport->requested_pages() == std::vector<std::uint32_t>{ 1, 1, 1 });
}

TEST_CASE("unit: pagination accepts a page which is non-empty on a later attempt", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_with_results("rust", 10, "page 1")
    .respond_empty(2)
    .respond_with_results("rust", 10, "page 2")
    .respond_empty(2)
    .respond_with_results("rust", 10, "page 3");
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 30);

  REQUIRE_NO_ERROR(outcome.err);
  CHECK(outcome.results.size() == 30);
  CHECK(transport->requested_pages() == std::vector<std::uint32_t>{ 1, 2, 2, 2, 3, 3, 3 });
}

TEST_CASE("unit: pagination truncates results to the requested number", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_with_results("rust", 10, "page 1").respond_with_results("rust", 10, "page 2");
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 15);

  REQUIRE_NO_ERROR(outcome.err);
  REQUIRE(outcome.results.size() == 15);
  CHECK(outcome.results.back().title() == "page 2 #4");
  CHECK(transport->requested_pages() == std::vector<std::uint32_t>{ 1, 2 });

  SECTION("exact multiple of the page size")
  {
    transport->respond_with_results("rust", 10, "page 1").respond_with_results("rust", 10, "page 2");
    auto exact = collect(io, client.search("rust"), 20);
    REQUIRE_NO_ERROR(exact.err);
    CHECK(exact.results.size() == 20);
    CHECK(transport->requests().size() == 4);
  }
}

TEST_CASE("unit: pagination keeps the order of pages and of results within a page", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_with_results("rust", 2, "a")
    .respond_with_results("rust", 1, "b")
    .respond_with_results("rust", 2, "c");
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 5);

  REQUIRE_NO_ERROR(outcome.err);
  CHECK(titles(outcome.results) == std::vector<std::string>{ "a #0", "a #1", "b #0", "c #0", "c #1" });
}

TEST_CASE("unit: pagination with zero results requested does not send anything", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 0);

  REQUIRE(outcome.completed);
  REQUIRE_NO_ERROR(outcome.err);
  CHECK(outcome.results.empty());
  CHECK(transport->requests().empty());
}

TEST_CASE("unit: pagination always starts from the first page", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_with_results("rust", 3, "page 1");
  auto client = make_client(io, transport);

  auto request = client.search("rust").with_page(7);
  auto outcome = collect(io, request, 3);

  REQUIRE_NO_ERROR(outcome.err);
  CHECK(transport->requested_pages() == std::vector<std::uint32_t>{ 1 });
  CHECK(request.parameters().pageno == 7);
}

TEST_CASE("unit: pagination retries transport failures without spending the empty page budget",
          "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_with_results("rust", 10, "page 1")
    .fail(metasearch::errc::network::connect_failure)
    .respond_empty()
    .fail(metasearch::errc::common::unambiguous_timeout)
    .respond_empty()
    .respond(503, "Service Unavailable")
    .fail(metasearch::errc::network::end_of_stream)
    .respond_empty();
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 25);

  REQUIRE_NO_ERROR(outcome.err);
  CHECK(outcome.results.size() == 10);
  // the last failure is followed by the scripted empty page and two unscripted ones
  CHECK(transport->requested_pages() == std::vector<std::uint32_t>{ 1, 2, 2, 2, 2, 2, 2, 2, 2, 2 });
}

TEST_CASE("unit: pagination restarts the empty page budget after a transport failure", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_with_results("rust", 10, "page 1")
    .respond_empty()
    .fail(metasearch::errc::network::connect_failure)
    .respond_empty(3)
    .respond_with_results("rust", 10, "never requested");
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 25);

  REQUIRE(outcome.completed);
  REQUIRE_NO_ERROR(outcome.err);
  CHECK(outcome.results.size() == 10);
  CHECK(transport->requested_pages() == std::vector<std::uint32_t>{ 1, 2, 2, 2, 2, 2 });
}

TEST_CASE("unit: pagination keeps trying a page with empty pages on both sides of a transport failure",
          "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_with_results("rust", 10, "page 1")
    .respond_empty(2)
    .fail(metasearch::errc::network::connect_failure)
    .respond_empty(2)
    .respond_with_results("rust", 10, "page 2");
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 20);

  REQUIRE_NO_ERROR(outcome.err);
  REQUIRE(outcome.results.size() == 20);
  CHECK(outcome.results.back().title() == "page 2 #9");
  CHECK(transport->requested_pages() == std::vector<std::uint32_t>{ 1, 2, 2, 2, 2, 2, 2 });
}

TEST_CASE("unit: pagination retries transport failures forever by default", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  for (int i = 0; i < 50; ++i) {
    transport->fail(metasearch::errc::network::resolve_failure);
  }
  transport->respond_with_results("rust", 4, "page 1");
  auto client = make_client(io, transport);

  auto outcome = collect(io, client.search("rust"), 4);

  REQUIRE_NO_ERROR(outcome.err);
  CHECK(outcome.results.size() == 4);
  CHECK(transport->requests().size() == 51);
}

TEST_CASE("unit: pagination reports transport failure when the retry limit is reached", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  transport->respond_with_results("rust", 10, "page 1")
    .fail(metasearch::errc::network::connect_failure)
    .fail(metasearch::errc::network::connect_failure)
    .fail(metasearch::errc::network::connect_failure)
    .respond_with_results("rust", 10, "page 2");

  metasearch::client_options options{};
  options.pagination().transport_retry_limit(2);
  auto client = make_client(io, transport, options);

  auto outcome = collect(io, client.search("rust"), 20);

  REQUIRE(outcome.completed);
  CHECK(outcome.err.ec() == metasearch::errc::network::connect_failure);
  CHECK(outcome.results.size() == 10);
  CHECK(transport->requests().size() == 4);

  auto ctx = outcome.err.ctx().as<tao::json::value>();
  CHECK(ctx["transport_retries"].get_unsigned() == 3);
  CHECK(ctx["results_accumulated"].get_unsigned() == 10);
  CHECK(ctx["page"].get_unsigned() == 2);
}

TEST_CASE("unit: pagination does not retry a body which cannot be decoded", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;

  SECTION("not JSON")
  {
    auto transport = std::make_shared<test::utils::scripted_transport>(io);
    transport->respond_with_results("rust", 5, "page 1").respond(200, "<html>rate limited</html>");
    auto client = make_client(io, transport);

    auto outcome = collect(io, client.search("rust"), 10);

    CHECK(outcome.err.ec() == metasearch::errc::common::parsing_failure);
    CHECK(outcome.results.size() == 5);
    CHECK(transport->requests().size() == 2);
  }

  SECTION("unknown result shape")
  {
    auto transport = std::make_shared<test::utils::scripted_transport>(io);
    transport->respond(
      200,
      R"({"query":"rust","number_of_results":1,"results":[{"title":"x","brand_new_field":1}],)"
      R"("answers":[],"corrections":[],"infoboxes":[],"suggestions":[],"unresponsive_engines":[]})");
    auto client = make_client(io, transport);

    auto outcome = collect(io, client.search("rust"), 10);

    CHECK(outcome.err.ec() == metasearch::errc::common::schema_mismatch);
    CHECK(outcome.err.message().find("brand_new_field") != std::string::npos);
    CHECK(outcome.results.empty());
    CHECK(transport->requests().size() == 1);
  }
}

TEST_CASE("unit: pagination fails fast on invalid language", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  auto client = make_client(io, transport);

  metasearch::search_parameters parameters{ "rust" };
  parameters.language = "not a language";
  auto outcome = collect(io, client.search("rust").with_parameters(parameters), 10);

  CHECK(outcome.err.ec() == metasearch::errc::common::invalid_argument);
  CHECK(transport->requests().empty());
}

TEST_CASE("unit: single page request", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  auto [err, client] =
    metasearch::client::create(io, "http://localhost:8888/searx//", transport, {});
  REQUIRE_NO_ERROR(err);
  CHECK(client.endpoint() == "http://localhost:8888/searx/search");

  SECTION("success")
  {
    transport->respond_with_results("rust", 3, "only");

    metasearch::search_parameters parameters{ "rust" };
    parameters.categories = { "general", "it" };
    auto request = client.search("ignored").with_parameters(parameters).with_page(2);

    std::optional<std::pair<metasearch::error, metasearch::search_response>> outcome{};
    request.send([&outcome](auto e, auto resp) {
      outcome.emplace(std::move(e), std::move(resp));
    });
    io.run();

    REQUIRE(outcome.has_value());
    REQUIRE_NO_ERROR(outcome->first);
    CHECK(outcome->second.query == "rust");
    CHECK(outcome->second.number_of_results == 3000);
    CHECK(outcome->second.results.size() == 3);

    auto requests = transport->requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].method == "POST");
    CHECK(requests[0].path == "/searx/search");
    CHECK(requests[0].headers["content-type"] == "application/x-www-form-urlencoded");
    CHECK(requests[0].body == "q=rust&format=json&pageno=2&categories=general%2Cit");
  }

  SECTION("empty page is not retried")
  {
    transport->respond_empty().respond_with_results("rust", 3, "later");

    std::optional<std::pair<metasearch::error, metasearch::search_response>> outcome{};
    client.search("rust").send([&outcome](auto e, auto resp) {
      outcome.emplace(std::move(e), std::move(resp));
    });
    io.run();

    REQUIRE(outcome.has_value());
    REQUIRE_NO_ERROR(outcome->first);
    CHECK(outcome->second.results.empty());
    CHECK(transport->requests().size() == 1);
  }

  SECTION("HTTP status failure")
  {
    transport->respond(502, "Bad Gateway");

    std::optional<std::pair<metasearch::error, metasearch::search_response>> outcome{};
    client.search("rust").send([&outcome](auto e, auto resp) {
      outcome.emplace(std::move(e), std::move(resp));
    });
    io.run();

    REQUIRE(outcome.has_value());
    CHECK(outcome->first.ec() == metasearch::errc::network::http_status_failure);
    auto ctx = outcome->first.ctx().as<tao::json::value>();
    CHECK(ctx["http_status"].get_unsigned() == 502);
    CHECK(ctx["http_body"].get_string() == "Bad Gateway");
    CHECK(ctx["endpoint"].get_string() == "http://localhost:8888/searx/search");
  }

  SECTION("close is forwarded to the transport")
  {
    client.close();
    CHECK(transport->is_closed());
  }
}

TEST_CASE("unit: client rejects invalid base URL", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);

  {
    auto [err, client] = metasearch::client::create(io, "ftp://example.com", transport, {});
    CHECK(err.ec() == metasearch::errc::network::unsupported_scheme);
  }
  {
    auto [err, client] = metasearch::client::create(io, "http://exa mple.com", transport, {});
    CHECK(err.ec() == metasearch::errc::common::invalid_argument);
  }
  {
    auto [err, client] = metasearch::client::create(io, "https://example.com", nullptr, {});
    CHECK(err.ec() == metasearch::errc::common::invalid_argument);
  }
}

TEST_CASE("unit: requests of a client which has not been created fail without sending", "[unit]")
{
  test::utils::init_logger();
  asio::io_context io;
  auto transport = std::make_shared<test::utils::scripted_transport>(io);
  auto [err, client] = metasearch::client::create(io, "ftp://example.com", transport, {});
  REQUIRE(err.ec() == metasearch::errc::network::unsupported_scheme);
  CHECK(client.endpoint().empty());

  auto request = client.search("rust");

  std::optional<metasearch::error> single{};
  request.send([&single](auto e, auto /* resp */) {
    single = std::move(e);
  });
  REQUIRE(single.has_value());
  CHECK(single->ec() == metasearch::errc::common::invalid_argument);

  auto outcome = collect(io, request, 10);
  REQUIRE(outcome.completed);
  CHECK(outcome.err.ec() == metasearch::errc::common::invalid_argument);
  CHECK(outcome.results.empty());

  auto [future_err, results] = request.send_get_num(10).get();
  CHECK(future_err.ec() == metasearch::errc::common::invalid_argument);
  CHECK(results.empty());

  client.close();
  CHECK(transport->requests().empty());
  CHECK_FALSE(transport->is_closed());
}
