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

#include "core/impl/error.hxx"
#include "core/operations/search_page.hxx"
#include "core/search_component.hxx"

#include <metasearch/error_codes.hxx>
#include <metasearch/search_request.hxx>

namespace metasearch
{
search_request::search_request(std::shared_ptr<core::search_component> component, std::string query)
  : component_{ std::move(component) }
  , parameters_{ std::move(query), response_format::json }
{
}

auto
search_request::with_page(std::uint32_t page) -> search_request&
{
  parameters_.pageno = page;
  return *this;
}

auto
search_request::with_parameters(search_parameters parameters) -> search_request&
{
  parameters_ = std::move(parameters);
  return *this;
}

auto
search_request::parameters() const -> const search_parameters&
{
  return parameters_;
}

void
search_request::send(search_handler&& handler) const
{
  if (!component_) {
    return handler({ errc::common::invalid_argument, "search request is not bound to a client" }, {});
  }
  core::operations::search_page_request request{};
  request.parameters = parameters_;
  component_->execute(std::move(request),
                      [handler = std::move(handler)](core::operations::search_page_response&& resp) {
                        if (resp.ctx.ec) {
                          return handler(core::impl::make_error(resp.ctx), {});
                        }
                        handler({}, std::move(resp.response));
                      });
}

auto
search_request::send() const -> std::future<std::pair<error, search_response>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, search_response>>>();
  send([barrier](auto err, auto result) mutable {
    barrier->set_value({ std::move(err), std::move(result) });
  });
  return barrier->get_future();
}

void
search_request::send_get_num(std::size_t num, search_get_num_handler&& handler) const
{
  if (!component_) {
    return handler({ errc::common::invalid_argument, "search request is not bound to a client" }, {});
  }
  component_->execute_paginated(
    parameters_,
    num,
    [handler = std::move(handler)](core::error_context::search&& ctx,
                                   std::vector<search_result>&& results) {
      if (ctx.ec) {
        return handler(core::impl::make_error(ctx), std::move(results));
      }
      handler({}, std::move(results));
    });
}

auto
search_request::send_get_num(std::size_t num) const
  -> std::future<std::pair<error, std::vector<search_result>>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, std::vector<search_result>>>>();
  send_get_num(num, [barrier](auto err, auto result) mutable {
    barrier->set_value({ std::move(err), std::move(result) });
  });
  return barrier->get_future();
}
} // namespace metasearch
