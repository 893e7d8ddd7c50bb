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

#include "http_session.hxx"

#include "core/logger/logger.hxx"

#include <metasearch/error_codes.hxx>

#include <fmt/core.h>

#include <atomic>
#include <utility>

namespace metasearch::core::io
{
namespace
{
auto
next_session_id() -> std::string
{
  static std::atomic_uint64_t counter{ 0 };
  return fmt::format("{:016x}", ++counter);
}
} // namespace

http_session::http_session(asio::io_context& ctx,
                           std::string hostname,
                           std::string service,
                           std::string host_header,
                           std::string user_agent,
                           std::chrono::milliseconds connect_timeout)
  : id_(next_session_id())
  , ctx_(ctx)
  , resolver_(ctx_)
  , stream_(std::make_unique<plain_stream_impl>(ctx_))
  , connect_deadline_timer_(stream_->get_executor())
  , idle_timer_(stream_->get_executor())
  , hostname_(std::move(hostname))
  , service_(std::move(service))
  , host_header_(std::move(host_header))
  , user_agent_(std::move(user_agent))
  , connect_timeout_(connect_timeout)
  , log_prefix_(fmt::format("[{}/{}] <{}:{}>", stream_->log_prefix(), id_, hostname_, service_))
{
}

http_session::http_session(asio::io_context& ctx,
                           asio::ssl::context& tls,
                           std::string hostname,
                           std::string service,
                           std::string host_header,
                           std::string user_agent,
                           std::chrono::milliseconds connect_timeout)
  : id_(next_session_id())
  , ctx_(ctx)
  , resolver_(ctx_)
  , stream_(std::make_unique<tls_stream_impl>(ctx_, tls, hostname))
  , connect_deadline_timer_(stream_->get_executor())
  , idle_timer_(stream_->get_executor())
  , hostname_(std::move(hostname))
  , service_(std::move(service))
  , host_header_(std::move(host_header))
  , user_agent_(std::move(user_agent))
  , connect_timeout_(connect_timeout)
  , log_prefix_(fmt::format("[{}/{}] <{}:{}>", stream_->log_prefix(), id_, hostname_, service_))
{
}

http_session::~http_session()
{
  stop();
}

auto
http_session::log_prefix() const -> const std::string&
{
  return log_prefix_;
}

auto
http_session::id() const -> const std::string&
{
  return id_;
}

auto
http_session::is_connected() const -> bool
{
  return connected_;
}

auto
http_session::hostname() const -> const std::string&
{
  return hostname_;
}

auto
http_session::port() const -> const std::string&
{
  return service_;
}

void
http_session::connect(std::function<void(std::error_code)>&& callback)
{
  if (stopped_) {
    return callback(errc::common::request_canceled);
  }
  {
    const std::scoped_lock lock(connect_callback_mutex_);
    connect_callback_ = std::move(callback);
  }
  MS_LOG_DEBUG("{} attempt to establish HTTP connection", log_prefix_);
  resolver_.async_resolve(
    hostname_,
    service_,
    [self = shared_from_this()](std::error_code ec,
                                const asio::ip::tcp::resolver::results_type& endpoints) {
      self->on_resolve(ec, endpoints);
    });
}

void
http_session::on_stop(std::function<void()> handler)
{
  on_stop_handler_ = std::move(handler);
}

void
http_session::complete_current_response(std::error_code ec)
{
  response_context ctx{};
  {
    const std::scoped_lock lock(current_response_mutex_);
    std::swap(current_response_, ctx);
  }
  if (ctx.handler) {
    ctx.handler(ec, std::move(ctx.parser.response));
  }
}

void
http_session::invoke_connect_callback(std::error_code ec)
{
  std::function<void(std::error_code)> cb;
  {
    const std::scoped_lock lock(connect_callback_mutex_);
    cb = std::move(connect_callback_);
    connect_callback_ = nullptr;
  }
  if (cb) {
    cb(ec);
  }
}

void
http_session::stop()
{
  if (stopped_.exchange(true)) {
    return;
  }
  connected_ = false;
  stream_->close([](std::error_code) {
  });
  resolver_.cancel();
  connect_deadline_timer_.cancel();
  idle_timer_.cancel();

  invoke_connect_callback(errc::common::request_canceled);
  complete_current_response(errc::common::request_canceled);

  if (auto handler = std::move(on_stop_handler_); handler) {
    handler();
  }
}

auto
http_session::keep_alive() const -> bool
{
  return keep_alive_;
}

auto
http_session::is_stopped() const -> bool
{
  return stopped_;
}

void
http_session::write_and_subscribe(http_request& request,
                                  std::function<void(std::error_code, http_response&&)>&& handler)
{
  if (stopped_) {
    return handler(errc::common::request_canceled, {});
  }
  {
    response_context ctx{ std::move(handler) };
    const std::scoped_lock lock(current_response_mutex_);
    std::swap(current_response_, ctx);
  }
  request.headers["user-agent"] = user_agent_;
  request.headers["connection"] = "keep-alive";
  request.headers["content-length"] = std::to_string(request.body.size());
  write(fmt::format("{} {} HTTP/1.1\r\nhost: {}\r\n", request.method, request.path, host_header_));
  for (const auto& [name, value] : request.headers) {
    write(fmt::format("{}: {}\r\n", name, value));
  }
  write("\r\n");
  write(request.body);
  flush();
}

void
http_session::set_idle(std::chrono::milliseconds timeout)
{
  idle_timer_.expires_after(timeout);
  return idle_timer_.async_wait([self = shared_from_this()](std::error_code ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    MS_LOG_DEBUG("{} idle timeout expired, stopping session", self->log_prefix_);
    self->stop();
  });
}

auto
http_session::reset_idle() -> bool
{
  // The timer has a single pending wait, so it has already expired if cancel() returns 0.
  return idle_timer_.cancel() != 0;
}

void
http_session::write(const std::string_view& buf)
{
  if (stopped_) {
    return;
  }
  const std::scoped_lock lock(output_buffer_mutex_);
  output_buffer_.emplace_back(buf.begin(), buf.end());
}

void
http_session::flush()
{
  if (!connected_ || stopped_) {
    return;
  }
  asio::post(asio::bind_executor(stream_->get_executor(), [self = shared_from_this()]() {
    self->do_write();
  }));
}

void
http_session::on_resolve(std::error_code ec, const asio::ip::tcp::resolver::results_type& endpoints)
{
  if (ec == asio::error::operation_aborted || stopped_) {
    return;
  }
  if (ec) {
    MS_LOG_ERROR("{} error on resolve: {}", log_prefix_, ec.message());
    return invoke_connect_callback(errc::network::resolve_failure);
  }
  endpoints_ = endpoints;
  MS_LOG_TRACE("{} resolved to {} endpoint(s)", log_prefix_, endpoints_.size());
  do_connect(endpoints_.begin());
}

void
http_session::do_connect(asio::ip::tcp::resolver::results_type::iterator it)
{
  if (stopped_) {
    return;
  }
  if (it == endpoints_.end()) {
    MS_LOG_ERROR("{} no more endpoints left to connect, backend is not reachable", log_prefix_);
    return invoke_connect_callback(last_connect_error_ ? last_connect_error_
                                                       : errc::network::connect_failure);
  }
  MS_LOG_DEBUG("{} connecting to {}:{}, timeout={}ms",
               log_prefix_,
               it->endpoint().address().to_string(),
               it->endpoint().port(),
               connect_timeout_.count());
  connect_deadline_timer_.expires_after(connect_timeout_);
  connect_deadline_timer_.async_wait([self = shared_from_this(), it](const auto timer_ec) mutable {
    if (timer_ec == asio::error::operation_aborted || self->stopped_) {
      return;
    }
    MS_LOG_DEBUG("{} unable to connect to {}:{} in time, trying next address",
                 self->log_prefix_,
                 it->endpoint().address().to_string(),
                 it->endpoint().port());
    self->last_connect_error_ = errc::network::connect_failure;
    return self->stream_->close([self, next_address = ++it](std::error_code /* ec */) {
      self->do_connect(next_address);
    });
  });
  stream_->async_connect(it->endpoint(), [self = shared_from_this(), it](std::error_code ec) {
    self->on_connect(ec, it);
  });
}

void
http_session::on_connect(const std::error_code& ec,
                         asio::ip::tcp::resolver::results_type::iterator it)
{
  if (ec == asio::error::operation_aborted || stopped_) {
    return;
  }
  if (!stream_->is_open() || ec) {
    MS_LOG_WARNING("{} unable to connect to {}:{}: {}",
                   log_prefix_,
                   it->endpoint().address().to_string(),
                   it->endpoint().port(),
                   ec.message());
    connect_deadline_timer_.cancel();
    last_connect_error_ = ec.category() == asio::error::get_ssl_category()
                            ? std::error_code{ errc::network::handshake_failure }
                            : std::error_code{ errc::network::connect_failure };
    if (stream_->is_open()) {
      stream_->close([self = shared_from_this(), next_address = ++it](std::error_code /* ec */) {
        self->do_connect(next_address);
      });
    } else {
      do_connect(++it);
    }
    return;
  }
  connected_ = true;
  stream_->set_options();
  MS_LOG_DEBUG("{} connected to {}:{}",
               log_prefix_,
               it->endpoint().address().to_string(),
               it->endpoint().port());
  connect_deadline_timer_.cancel();
  invoke_connect_callback({});
  flush();
}

void
http_session::do_read()
{
  if (stopped_ || reading_ || !stream_->is_open()) {
    return;
  }
  reading_ = true;
  stream_->async_read_some(
    asio::buffer(input_buffer_),
    [self = shared_from_this()](std::error_code ec, std::size_t bytes_transferred) {
      if (ec == asio::error::operation_aborted || self->stopped_) {
        return;
      }
      if (ec) {
        // the response might be delimited by the end of the connection
        http_parser::feeding_result res{};
        {
          const std::scoped_lock lock(self->current_response_mutex_);
          res = self->current_response_.parser.finish();
        }
        self->keep_alive_ = false;
        self->reading_ = false;
        if (!res.failure && res.complete) {
          self->complete_current_response({});
        } else {
          MS_LOG_DEBUG("{} IO error while reading from the socket: {}", self->log_prefix_, ec.message());
          self->complete_current_response(errc::network::end_of_stream);
        }
        return self->stop();
      }
      http_parser::feeding_result res{};
      {
        const std::scoped_lock lock(self->current_response_mutex_);
        res = self->current_response_.parser.feed(
          reinterpret_cast<const char*>(self->input_buffer_.data()), bytes_transferred);
      }
      if (res.failure) {
        MS_LOG_ERROR("{} unable to parse HTTP response: {}", self->log_prefix_, res.error);
        self->reading_ = false;
        self->keep_alive_ = false;
        self->complete_current_response(errc::network::protocol_error);
        return self->stop();
      }
      if (res.complete) {
        response_context ctx{};
        {
          const std::scoped_lock lock(self->current_response_mutex_);
          std::swap(self->current_response_, ctx);
        }
        if (ctx.parser.response.must_close_connection()) {
          self->keep_alive_ = false;
        }
        self->reading_ = false;
        if (ctx.handler) {
          ctx.handler({}, std::move(ctx.parser.response));
        }
        return;
      }
      self->reading_ = false;
      return self->do_read();
    });
}

void
http_session::do_write()
{
  if (stopped_) {
    return;
  }
  const std::scoped_lock lock(writing_buffer_mutex_, output_buffer_mutex_);
  if (!writing_buffer_.empty() || output_buffer_.empty()) {
    return;
  }
  std::swap(writing_buffer_, output_buffer_);
  std::vector<asio::const_buffer> buffers;
  buffers.reserve(writing_buffer_.size());
  for (auto& buf : writing_buffer_) {
    buffers.emplace_back(asio::buffer(buf));
  }
  stream_->async_write(
    buffers, [self = shared_from_this()](std::error_code ec, std::size_t bytes_transferred) {
      MS_LOG_TRACE("{} rc={}, bytes_sent={}",
                   self->log_prefix_,
                   ec ? ec.message() : "ok",
                   bytes_transferred);
      if (ec == asio::error::operation_aborted || self->stopped_) {
        return;
      }
      if (ec) {
        MS_LOG_ERROR("{} IO error while writing to the socket: {}", self->log_prefix_, ec.message());
        self->keep_alive_ = false;
        self->complete_current_response(errc::network::end_of_stream);
        return self->stop();
      }
      {
        const std::scoped_lock inner_lock(self->writing_buffer_mutex_);
        self->writing_buffer_.clear();
      }
      bool want_write = false;
      {
        const std::scoped_lock inner_lock(self->output_buffer_mutex_);
        want_write = !self->output_buffer_.empty();
      }
      if (want_write) {
        return self->do_write();
      }
      self->do_read();
    });
}
} // namespace metasearch::core::io
