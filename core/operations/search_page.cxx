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

#include "search_page.hxx"

#include "core/impl/search_response_decoder.hxx"
#include "core/utils/language_tag.hxx"
#include "core/utils/url_codec.hxx"

#include <metasearch/error_codes.hxx>

#include <fmt/core.h>

namespace metasearch::core::operations
{
namespace
{
auto
truncate_body(const std::string& body) -> std::string
{
  if (body.size() <= search_page_request::max_body_in_context) {
    return body;
  }
  return fmt::format("{}... ({} bytes total)",
                     body.substr(0, search_page_request::max_body_in_context),
                     body.size());
}
} // namespace

auto
search_page_request::encode_to(encoded_request_type& encoded) const -> std::error_code
{
  if (const auto& language = parameters.language;
      language.has_value() && !utils::is_valid_language_tag(language.value())) {
    return errc::common::invalid_argument;
  }
  encoded.method = "POST";
  encoded.path = path;
  encoded.headers["content-type"] = "application/x-www-form-urlencoded";
  encoded.headers["accept"] = "application/json";
  encoded.body = utils::string_codec::form_encode(parameters.to_form_fields());
  if (timeout) {
    encoded.timeout = timeout.value();
  }
  return {};
}

auto
search_page_request::make_response(error_context::search&& ctx,
                                   const encoded_response_type& encoded) const
  -> search_page_response
{
  search_page_response response{ std::move(ctx) };
  if (response.ctx.ec) {
    return response;
  }
  response.ctx.http_status = encoded.status_code;
  if (!encoded.is_success()) {
    response.ctx.ec = errc::network::http_status_failure;
    response.ctx.message = fmt::format("unexpected HTTP status {} {}", encoded.status_code, encoded.status_message);
    response.ctx.http_body = truncate_body(encoded.body);
    return response;
  }
  auto decoded = impl::decode_search_response(encoded.body);
  if (decoded.ec) {
    response.ctx.ec = decoded.ec;
    response.ctx.message = std::move(decoded.message);
    response.ctx.http_body = truncate_body(encoded.body);
    return response;
  }
  response.response = std::move(decoded.response);
  return response;
}
} // namespace metasearch::core::operations
