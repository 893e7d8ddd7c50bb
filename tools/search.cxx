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

#include "search.hxx"
#include "utils.hxx"

#include "core/impl/search_response_json.hxx"
#include "core/logger/logger.hxx"
#include "core/utils/json.hxx"

#include <metasearch/client.hxx>
#include <metasearch/fmt/error.hxx>
#include <metasearch/fmt/priority_type.hxx>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <tao/json.hpp>

#include <thread>

namespace msc
{
namespace
{
void
print_result(std::size_t index, const metasearch::search_result& result)
{
  fmt::print(stdout, "{:>3}. {}\n", index, result.title());
  if (const auto& url = result.url(); url) {
    fmt::print(stdout, "     {}\n", url.value());
  }
  if (!result.content().empty()) {
    fmt::print(stdout, "     {}\n", result.content());
  }
  fmt::print(stdout,
             "     [{}] engines: {}, score: {:.3f}, category: {}\n",
             result.is_legacy() ? "legacy" : "main",
             fmt::join(result.engines(), ","),
             result.score(),
             result.category());
  if (result.priority() != metasearch::priority_type::none) {
    fmt::print(stdout, "     priority: {}\n", result.priority());
  }
}

void
print_response(const metasearch::search_response& response)
{
  fmt::print(stdout,
             "Query: \"{}\", estimated number of results: {}\n",
             response.query,
             response.number_of_results);
  for (std::size_t i = 0; i < response.results.size(); ++i) {
    print_result(i + 1, response.results[i]);
  }
  if (!response.suggestions.empty()) {
    fmt::print(stdout, "Suggestions: {}\n", fmt::join(response.suggestions, ", "));
  }
  if (!response.corrections.empty()) {
    fmt::print(stdout, "Corrections: {}\n", fmt::join(response.corrections, ", "));
  }
  for (const auto& box : response.infoboxes) {
    fmt::print(stdout, "Infobox \"{}\" ({}): {}\n", box.infobox, box.engine, box.content);
  }
  for (const auto& error : response.unresponsive_engines) {
    fmt::print(stderr, "Engine \"{}\" did not respond: {}\n", error.engine, error.error_msg);
  }
}

class search_app : public CLI::App
{
public:
  search_app()
    : CLI::App{ R"(Search the backend.

Examples:

1. Fetch the first page:

    msc search --base-url https://searx.example rust

2. Collect 25 results from consecutive pages, only from two engines:

    msc search --num 25 --engine duckduckgo --engine wikipedia 'rust language'
)",
                "search" }
  {
    add_option("query", query_, "Search terms.")->required(true);
    add_option("--num",
               num_,
               "Collect this number of results from consecutive pages (the --page option is "
               "ignored then).");
    add_option("--page", page_, "Page number (1-based).");
    add_option("--category", categories_, "Restrict search to the category (repeatable).")
      ->allow_extra_args(false);
    add_option("--engine", engines_, "Restrict search to the engine (repeatable).")
      ->allow_extra_args(false);
    add_option("--language", language_, "Language tag, for example \"en-US\".");
    add_option("--safesearch", safesearch_, "Safe search level (0, 1 or 2).");
    add_option("--theme", theme_, "Theme of the backend.");
    add_option("--image-proxy", image_proxy_, "Proxy images through the backend.");
    add_option("--results-on-new-tab", results_on_new_tab_, "Open results in a new tab (0 or 1).");
    add_option("--autocomplete", autocomplete_, "Autocomplete service.");
    add_flag("--json", json_, "Print results in JSON format.");

    add_common_options(this, common_options_);

    allow_extras(true);
  }

  [[nodiscard]] int execute() const
  {
    apply_logger_options(common_options_.logger);

    auto client_options = build_client_options(common_options_);

    metasearch::search_parameters parameters{ query_ };
    parameters.pageno = page_;
    parameters.categories = categories_;
    parameters.engines = engines_;
    parameters.language = language_;
    parameters.safesearch = safesearch_;
    parameters.theme = theme_;
    parameters.image_proxy = image_proxy_;
    parameters.results_on_new_tab = results_on_new_tab_;
    parameters.autocomplete = autocomplete_;

    asio::io_context io;
    auto guard = asio::make_work_guard(io);
    std::thread io_thread([&io]() {
      io.run();
    });

    const auto& base_url = common_options_.connection.base_url;
    auto [create_err, client] = metasearch::client::create(io, base_url, client_options);
    if (create_err) {
      fail(fmt::format("Failed to create client for \"{}\": {}", base_url, create_err));
    }

    auto request = client.search(query_).with_parameters(parameters);
    int rc{ 0 };
    if (num_) {
      auto [err, results] = request.send_get_num(num_.value()).get();
      if (err) {
        fmt::print(stderr, "ERROR: {}\n", err);
        rc = 1;
      }
      if (json_) {
        tao::json::value array = tao::json::empty_array;
        for (const auto& result : results) {
          array.emplace_back(result);
        }
        fmt::print(stdout, "{}\n", metasearch::core::utils::json::generate_pretty(array));
      } else {
        for (std::size_t i = 0; i < results.size(); ++i) {
          print_result(i + 1, results[i]);
        }
        fmt::print(stdout, "Collected {} of {} requested results\n", results.size(), num_.value());
      }
    } else {
      auto [err, response] = request.send().get();
      if (err) {
        fmt::print(stderr, "ERROR: {}\n", err);
        rc = 1;
      } else if (json_) {
        fmt::print(stdout,
                   "{}\n",
                   metasearch::core::utils::json::generate_pretty(tao::json::value(response)));
      } else {
        print_response(response);
      }
    }

    client.close();
    guard.reset();
    io_thread.join();

    return rc;
  }

private:
  common_options common_options_{};

  std::string query_{};
  std::optional<std::size_t> num_{};
  std::optional<std::uint32_t> page_{};
  std::vector<std::string> categories_{};
  std::vector<std::string> engines_{};
  std::optional<std::string> language_{};
  std::optional<std::uint32_t> safesearch_{};
  std::optional<std::string> theme_{};
  std::optional<bool> image_proxy_{};
  std::optional<std::uint32_t> results_on_new_tab_{};
  std::optional<std::string> autocomplete_{};
  bool json_{ false };
};
} // namespace

auto
make_search_command() -> std::shared_ptr<CLI::App>
{
  return std::make_shared<search_app>();
}

auto
execute_search_command(const CLI::App* app) -> int
{
  if (const auto* search = dynamic_cast<const search_app*>(app); search != nullptr) {
    return search->execute();
  }
  return 1;
}
} // namespace msc
