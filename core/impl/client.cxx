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

#include "core/http_client.hxx"
#include "core/logger/logger.hxx"
#include "core/meta/version.hxx"
#include "core/search_component.hxx"
#include "core/utils/base_url.hxx"

#include <metasearch/client.hxx>
#include <metasearch/error_codes.hxx>

namespace metasearch
{
namespace
{
auto
parse_endpoint(const std::string& base_url, core::utils::base_url& endpoint) -> error
{
  endpoint = core::utils::parse_base_url(base_url);
  if (!endpoint.error) {
    return {};
  }
  MS_LOG_ERROR(R"(unable to use "{}" as base URL: {})", base_url, endpoint.error.value());
  if (endpoint.scheme != "http" && endpoint.scheme != "https" && !endpoint.scheme.empty()) {
    return { errc::network::unsupported_scheme, endpoint.error.value() };
  }
  return { errc::common::invalid_argument, endpoint.error.value() };
}
} // namespace

client::client(std::shared_ptr<core::search_component> component)
  : component_{ std::move(component) }
{
}

auto
client::create(asio::io_context& io, const std::string& base_url, const client_options& options)
  -> std::pair<error, client>
{
  core::utils::base_url endpoint{};
  if (auto err = parse_endpoint(base_url, endpoint); err) {
    return { std::move(err), {} };
  }
  auto opts = options.build();
  core::http_client_options transport_options{};
  transport_options.user_agent = core::meta::user_agent_for_http(opts.user_agent_extra);
  transport_options.connect_timeout = opts.connect_timeout;
  transport_options.request_timeout = opts.request_timeout;
  transport_options.idle_http_connection_timeout = opts.idle_http_connection_timeout;
  transport_options.max_idle_connections_per_host = opts.max_idle_connections_per_host;
  transport_options.tls_verify = opts.tls_verify;
  transport_options.trust_certificate = opts.trust_certificate;

  auto [ec, transport] = core::http_client::create(io, endpoint, std::move(transport_options));
  if (ec) {
    return { error{ ec, "unable to create HTTP transport" }, {} };
  }
  MS_LOG_DEBUG("created client for {}, {}", endpoint.endpoint(), core::meta::sdk_build_info_short());
  return { {},
           client{ std::make_shared<core::search_component>(
             io, std::move(transport), std::move(endpoint), opts.pagination) } };
}

auto
client::create(asio::io_context& io,
               const std::string& base_url,
               std::shared_ptr<core::io::http_transport> transport,
               const client_options& options) -> std::pair<error, client>
{
  if (!transport) {
    return { error{ errc::common::invalid_argument, "transport must not be null" }, {} };
  }
  core::utils::base_url endpoint{};
  if (auto err = parse_endpoint(base_url, endpoint); err) {
    return { std::move(err), {} };
  }
  auto opts = options.build();
  return { {},
           client{ std::make_shared<core::search_component>(
             io, std::move(transport), std::move(endpoint), opts.pagination) } };
}

auto
client::search(std::string query) const -> search_request
{
  return { component_, std::move(query) };
}

auto
client::endpoint() const -> std::string
{
  if (!component_) {
    return {};
  }
  return component_->endpoint().endpoint();
}

void
client::close() const
{
  if (component_) {
    component_->close();
  }
}
} // namespace metasearch
