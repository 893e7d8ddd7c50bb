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

#include "search_response_decoder.hxx"

#include "core/impl/field_reader.hxx"
#include "core/impl/search_result_variant.hxx"
#include "core/logger/logger.hxx"
#include "core/utils/json.hxx"

#include <metasearch/error_codes.hxx>

#include <tao/json.hpp>

namespace metasearch::core::impl
{
namespace
{
auto
decode_answer(const tao::json::value& element, answer& out) -> std::optional<std::string>
{
  if (!element.is_object()) {
    return type_mismatch("object", element);
  }
  field_reader reader{ element, false };
  reader.optional("url", out.url);
  reader.optional("engine", out.engine);
  reader.optional("parsed_url", out.parsed_url);
  if (!reader.finish()) {
    return reader.describe();
  }
  return {};
}

auto
decode_infobox(const tao::json::value& element, infobox& out) -> std::optional<std::string>
{
  if (!element.is_object()) {
    return type_mismatch("object", element);
  }
  field_reader reader{ element, false };
  reader.required("infobox", out.infobox);
  reader.required("id", out.id);
  reader.required("content", out.content);
  reader.optional("urls", out.urls);
  reader.optional("attributes", out.attributes);
  reader.required("engine", out.engine);
  reader.optional("url", out.url);
  reader.required("img_src", out.img_src);
  reader.required("template", out.template_name);
  reader.optional("parsed_url", out.parsed_url);
  reader.required("title", out.title);
  reader.required("thumbnail", out.thumbnail);
  reader.required("priority", out.priority);
  reader.list("engines", out.engines);
  reader.required("positions", out.positions);
  reader.required("score", out.score);
  reader.required("category", out.category);
  reader.optional("publishedDate", out.published_date);
  reader.optional("pubdate", out.pubdate);
  if (!reader.finish()) {
    return reader.describe();
  }
  return {};
}

auto
decode_engine_error(const tao::json::value& element, engine_error& out) -> std::optional<std::string>
{
  if (!element.is_array()) {
    return type_mismatch("array", element);
  }
  const auto& pair = element.get_array();
  if (pair.size() != 2) {
    return fmt::format("expected two elements, got {}", pair.size());
  }
  if (auto error = decode_value(pair[0], out.engine); error) {
    return fmt::format("engine name: {}", error.value());
  }
  if (auto error = decode_value(pair[1], out.error_msg); error) {
    return fmt::format("error message: {}", error.value());
  }
  return {};
}

auto
schema_mismatch(std::string_view body, std::string message) -> decoded_search_response
{
  MS_LOG_DEBUG("unable to decode search response: {}, body: {}", message, body);
  decoded_search_response decoded{};
  decoded.ec = errc::common::schema_mismatch;
  decoded.message = std::move(message);
  return decoded;
}
} // namespace

auto
decode_search_response(std::string_view body) -> decoded_search_response
{
  tao::json::value payload;
  try {
    payload = utils::json::parse(body);
  } catch (const tao::pegtl::parse_error& e) {
    MS_LOG_DEBUG("unable to parse search response: {}, body: {}", e.what(), body);
    decoded_search_response decoded{};
    decoded.ec = errc::common::parsing_failure;
    decoded.message = fmt::format("response body is not valid JSON: {}", e.what());
    return decoded;
  }
  if (!payload.is_object()) {
    return schema_mismatch(
      body, fmt::format("expected object at the top level, got {}", utils::json::type_name(payload)));
  }

  decoded_search_response decoded{};
  auto& response = decoded.response;

  std::vector<tao::json::value> results{};
  std::vector<std::vector<tao::json::value>> answers{};
  std::vector<tao::json::value> infoboxes{};
  std::vector<tao::json::value> unresponsive_engines{};

  field_reader reader{ payload, false };
  reader.required("query", response.query);
  reader.required("number_of_results", response.number_of_results);
  reader.required("results", results);
  reader.required("answers", answers);
  reader.required("corrections", response.corrections);
  reader.required("infoboxes", infoboxes);
  reader.required("suggestions", response.suggestions);
  reader.required("unresponsive_engines", unresponsive_engines);
  if (!reader.finish()) {
    return schema_mismatch(body, fmt::format("unexpected response structure: {}", reader.describe()));
  }

  response.results.reserve(results.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    search_result_shape_mismatch mismatch{};
    auto result = decode_search_result(results[i], mismatch);
    if (!result) {
      return schema_mismatch(body, mismatch.to_string(i));
    }
    response.results.emplace_back(std::move(result.value()));
  }

  response.answers.reserve(answers.size());
  for (std::size_t i = 0; i < answers.size(); ++i) {
    answer_set group{};
    group.reserve(answers[i].size());
    for (std::size_t j = 0; j < answers[i].size(); ++j) {
      answer entry{};
      if (auto error = decode_answer(answers[i][j], entry); error) {
        return schema_mismatch(body, fmt::format("answer #{}.{}: {}", i, j, error.value()));
      }
      group.emplace_back(std::move(entry));
    }
    response.answers.emplace_back(std::move(group));
  }

  response.infoboxes.reserve(infoboxes.size());
  for (std::size_t i = 0; i < infoboxes.size(); ++i) {
    infobox entry{};
    if (auto error = decode_infobox(infoboxes[i], entry); error) {
      return schema_mismatch(body, fmt::format("infobox #{}: {}", i, error.value()));
    }
    response.infoboxes.emplace_back(std::move(entry));
  }

  response.unresponsive_engines.reserve(unresponsive_engines.size());
  for (std::size_t i = 0; i < unresponsive_engines.size(); ++i) {
    engine_error entry{};
    if (auto error = decode_engine_error(unresponsive_engines[i], entry); error) {
      return schema_mismatch(body, fmt::format("unresponsive engine #{}: {}", i, error.value()));
    }
    response.unresponsive_engines.emplace_back(std::move(entry));
  }

  MS_LOG_TRACE(R"(decoded search response for "{}": results={}, answers={}, infoboxes={}, unresponsive_engines={})",
               response.query,
               response.results.size(),
               response.answers.size(),
               response.infoboxes.size(),
               response.unresponsive_engines.size());
  return decoded;
}
} // namespace metasearch::core::impl
