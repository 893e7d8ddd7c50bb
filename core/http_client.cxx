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

#include "http_client.hxx"

#include "core/io/http_session.hxx"
#include "core/logger/logger.hxx"

#include <metasearch/error_codes.hxx>

#include <asio/ssl.hpp>
#include <asio/steady_timer.hpp>

namespace metasearch::core
{
struct http_client::pending_request {
  pending_request(asio::io_context& ctx, response_handler&& handler)
    : deadline{ ctx }
    , handler_{ std::move(handler) }
  {
  }

  void invoke(std::error_code ec, io::http_response&& response)
  {
    response_handler handler{};
    {
      const std::scoped_lock lock(mutex_);
      std::swap(handler, handler_);
    }
    if (handler) {
      deadline.cancel();
      handler(ec, std::move(response));
    }
  }

  [[nodiscard]] auto is_completed() -> bool
  {
    const std::scoped_lock lock(mutex_);
    return !handler_;
  }

  asio::steady_timer deadline;
  std::weak_ptr<io::http_session> session{};

private:
  std::mutex mutex_{};
  response_handler handler_;
};

auto
http_client::create(asio::io_context& io, utils::base_url endpoint, http_client_options options)
  -> std::pair<std::error_code, std::shared_ptr<http_client>>
{
  if (endpoint.scheme != "http" && endpoint.scheme != "https") {
    return { errc::network::unsupported_scheme, nullptr };
  }
  auto client = std::make_shared<http_client>(io, std::move(endpoint), std::move(options));
  if (auto ec = client->configure_tls(); ec) {
    return { ec, nullptr };
  }
  return { {}, client };
}

http_client::http_client(asio::io_context& io,
                         utils::base_url endpoint,
                         http_client_options options)
  : ctx_{ io }
  , tls_{ asio::ssl::context::tls_client }
  , endpoint_{ std::move(endpoint) }
  , options_{ std::move(options) }
{
}

http_client::~http_client()
{
  close();
}

auto
http_client::configure_tls() -> std::error_code
{
  if (!endpoint_.tls) {
    return {};
  }
  tls_.set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 |
                   asio::ssl::context::no_sslv3 | asio::ssl::context::no_tlsv1 |
                   asio::ssl::context::no_tlsv1_1);
  std::error_code ec{};
  tls_.set_default_verify_paths(ec);
  if (ec) {
    MS_LOG_WARNING("unable to load default CA paths: {}", ec.message());
  }
  if (const auto& path = options_.trust_certificate; path) {
    tls_.load_verify_file(path.value(), ec);
    if (ec) {
      MS_LOG_ERROR(R"(unable to load trust certificate from "{}": {})", path.value(), ec.message());
      return errc::common::invalid_argument;
    }
  }
  switch (options_.tls_verify) {
    case tls_verify_mode::none:
      MS_LOG_WARNING("TLS peer verification is disabled for {}", endpoint_.endpoint());
      tls_.set_verify_mode(asio::ssl::verify_none);
      break;
    case tls_verify_mode::peer:
      tls_.set_verify_mode(asio::ssl::verify_peer);
      break;
  }
  return {};
}

auto
http_client::endpoint() const -> const utils::base_url&
{
  return endpoint_;
}

auto
http_client::number_of_idle_sessions() const -> std::size_t
{
  const std::scoped_lock lock(sessions_mutex_);
  return idle_sessions_.size();
}

void
http_client::execute(io::http_request request, response_handler&& handler)
{
  if (closed_) {
    return handler(errc::common::request_canceled, {});
  }
  auto pending = std::make_shared<pending_request>(ctx_, std::move(handler));
  auto timeout = request.timeout.count() > 0 ? request.timeout : options_.request_timeout;
  pending->deadline.expires_after(timeout);
  pending->deadline.async_wait([pending, timeout, endpoint = endpoint_.endpoint()](std::error_code ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    MS_LOG_DEBUG("request to {} did not complete in {}ms", endpoint, timeout.count());
    auto session = pending->session.lock();
    pending->invoke(errc::common::unambiguous_timeout, {});
    if (session) {
      session->stop();
    }
  });
  dispatch(std::move(request), std::move(pending));
}

void
http_client::dispatch(io::http_request request, std::shared_ptr<pending_request> pending)
{
  if (closed_) {
    return pending->invoke(errc::common::request_canceled, {});
  }
  auto [session, reused] = check_out();
  pending->session = session;
  if (reused) {
    return send(session, std::move(request), std::move(pending), true);
  }
  session->connect([self = shared_from_this(), session, request = std::move(request), pending](
                     std::error_code ec) mutable {
    if (ec) {
      self->release(session);
      return pending->invoke(ec, {});
    }
    if (pending->is_completed()) {
      return self->check_in(session);
    }
    self->send(session, std::move(request), std::move(pending), false);
  });
}

void
http_client::send(const std::shared_ptr<io::http_session>& session,
                  io::http_request request,
                  std::shared_ptr<pending_request> pending,
                  bool reused)
{
  auto retry_request = request;
  session->write_and_subscribe(
    request,
    [self = shared_from_this(), session, retry_request = std::move(retry_request), pending, reused](
      std::error_code ec, io::http_response&& response) mutable {
      if (reused && ec == errc::network::end_of_stream && !pending->is_completed()) {
        // the backend has closed the idle connection, the request was never processed
        MS_LOG_DEBUG("{} pooled connection is closed, retrying on a fresh one", session->log_prefix());
        self->release(session);
        return self->dispatch(std::move(retry_request), std::move(pending));
      }
      if (ec) {
        self->release(session);
      } else {
        self->check_in(session);
      }
      pending->invoke(ec, std::move(response));
    });
}

auto
http_client::check_out() -> std::pair<std::shared_ptr<io::http_session>, bool>
{
  const std::scoped_lock lock(sessions_mutex_);
  std::shared_ptr<io::http_session> session{};
  while (!idle_sessions_.empty()) {
    session = idle_sessions_.front();
    idle_sessions_.pop_front();
    if (session->reset_idle() && !session->is_stopped()) {
      busy_sessions_.push_back(session);
      return { session, true };
    }
    MS_LOG_TRACE("{} idle timer has expired, attempting to select another session",
                 session->log_prefix());
    session.reset();
  }
  const auto service = std::to_string(endpoint_.port);
  if (endpoint_.tls) {
    session = std::make_shared<io::http_session>(ctx_,
                                                 tls_,
                                                 endpoint_.host,
                                                 service,
                                                 endpoint_.host_header(),
                                                 options_.user_agent,
                                                 options_.connect_timeout);
  } else {
    session = std::make_shared<io::http_session>(ctx_,
                                                 endpoint_.host,
                                                 service,
                                                 endpoint_.host_header(),
                                                 options_.user_agent,
                                                 options_.connect_timeout);
  }
  busy_sessions_.push_back(session);
  return { session, false };
}

void
http_client::check_in(const std::shared_ptr<io::http_session>& session)
{
  if (closed_ || !session->is_connected() || session->is_stopped() || !session->keep_alive()) {
    return release(session);
  }
  const std::scoped_lock lock(sessions_mutex_);
  busy_sessions_.remove(session);
  if (idle_sessions_.size() >= options_.max_idle_connections_per_host) {
    MS_LOG_DEBUG("{} idle pool is full, closing HTTP session", session->log_prefix());
    return asio::post(ctx_, [session]() {
      session->stop();
    });
  }
  session->set_idle(options_.idle_http_connection_timeout);
  MS_LOG_TRACE("{} put HTTP session back to idle connections", session->log_prefix());
  idle_sessions_.push_back(session);
}

void
http_client::release(const std::shared_ptr<io::http_session>& session)
{
  {
    const std::scoped_lock lock(sessions_mutex_);
    busy_sessions_.remove(session);
    idle_sessions_.remove(session);
  }
  asio::post(ctx_, [session]() {
    session->stop();
  });
}

void
http_client::close()
{
  if (closed_.exchange(true)) {
    return;
  }
  std::list<std::shared_ptr<io::http_session>> idle_sessions;
  std::list<std::shared_ptr<io::http_session>> busy_sessions;
  {
    const std::scoped_lock lock(sessions_mutex_);
    idle_sessions = std::move(idle_sessions_);
    busy_sessions = std::move(busy_sessions_);
  }
  for (auto& s : idle_sessions) {
    s->reset_idle();
    s->stop();
  }
  for (auto& s : busy_sessions) {
    s->stop();
  }
}
} // namespace metasearch::core
