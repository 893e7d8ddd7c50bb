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

#include "search_component.hxx"

#include "core/logger/logger.hxx"
#include "core/paginated_search_orchestrator.hxx"
#include "core/utils/url_codec.hxx"

#include <metasearch/error_codes.hxx>

#include <fmt/core.h>

namespace metasearch::core
{
search_component::search_component(asio::io_context& io,
                                   std::shared_ptr<io::http_transport> transport,
                                   utils::base_url endpoint,
                                   pagination_options::built pagination)
  : io_{ io }
  , transport_{ std::move(transport) }
  , endpoint_{ std::move(endpoint) }
  , pagination_{ pagination }
{
}

void
search_component::execute(operations::search_page_request request, search_page_handler&& handler)
{
  request.path = endpoint_.path;

  error_context::search ctx{};
  ctx.method = "POST";
  ctx.endpoint = endpoint_.endpoint();
  ctx.query = request.parameters.q;
  ctx.page = request.parameters.pageno;
  ctx.parameters = utils::string_codec::form_encode(request.parameters.to_form_fields());

  io::http_request encoded{};
  if (auto ec = request.encode_to(encoded); ec) {
    ctx.ec = ec;
    ctx.message = fmt::format(R"(invalid language tag "{}")", request.parameters.language.value_or(""));
    return handler(request.make_response(std::move(ctx), {}));
  }

  MS_LOG_TRACE("POST {} page={} body={}",
               ctx.endpoint,
               ctx.page.has_value() ? std::to_string(ctx.page.value()) : std::string{ "default" },
               encoded.body);
  transport_->execute(
    std::move(encoded),
    [request = std::move(request), ctx = std::move(ctx), handler = std::move(handler)](
      std::error_code ec, io::http_response&& msg) mutable {
      if (ec) {
        ctx.ec = ec;
        ctx.message = ec.message();
      }
      handler(request.make_response(std::move(ctx), msg));
    });
}

void
search_component::execute_paginated(search_parameters parameters,
                                    std::size_t num,
                                    paginated_search_handler&& handler)
{
  auto orchestrator = std::make_shared<paginated_search_orchestrator>(
    io_, shared_from_this(), std::move(parameters), num, pagination_);
  orchestrator->start(std::move(handler));
}

void
search_component::close()
{
  transport_->close();
}

auto
search_component::endpoint() const -> const utils::base_url&
{
  return endpoint_;
}

auto
search_component::io_context() -> asio::io_context&
{
  return io_;
}
} // namespace metasearch::core
