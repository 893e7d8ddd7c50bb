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

#include "paginated_search_orchestrator.hxx"

#include "core/logger/logger.hxx"
#include "core/search_component.hxx"

#include <metasearch/error_codes.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>

#include <fmt/core.h>

#include <cstddef>
#include <iterator>

namespace metasearch::core
{
namespace
{
auto
is_transport_failure(std::error_code ec) -> bool
{
  return ec.category() == impl::network_category() || ec == errc::common::unambiguous_timeout;
}
} // namespace

class paginated_search_orchestrator_impl
  : public std::enable_shared_from_this<paginated_search_orchestrator_impl>
{
public:
  paginated_search_orchestrator_impl(asio::io_context& io,
                                     std::shared_ptr<search_component> component,
                                     search_parameters parameters,
                                     std::size_t num,
                                     pagination_options::built options)
    : io_{ io }
    , component_{ std::move(component) }
    , parameters_{ std::move(parameters) }
    , num_{ num }
    , options_{ options }
    , backoff_timer_{ io }
  {
  }

  void start(paginated_search_callback&& callback)
  {
    callback_ = std::move(callback);
    if (num_ == 0) {
      return complete({});
    }
    results_.reserve(num_);
    request_page();
  }

private:
  void request_page()
  {
    operations::search_page_request request{};
    request.parameters = parameters_;
    request.parameters.pageno = page_;
    MS_LOG_DEBUG(R"(requesting page {} of "{}", attempt {}/{}, collected {}/{})",
                 page_,
                 parameters_.q,
                 empty_attempts_ + 1,
                 options_.empty_page_retries,
                 results_.size(),
                 num_);
    component_->execute(std::move(request),
                        [self = shared_from_this()](operations::search_page_response&& resp) {
                          self->on_page(std::move(resp));
                        });
  }

  void schedule_request()
  {
    asio::post(io_, [self = shared_from_this()]() {
      self->request_page();
    });
  }

  void on_page(operations::search_page_response&& resp)
  {
    if (resp.ctx.ec) {
      if (is_transport_failure(resp.ctx.ec)) {
        return on_transport_failure(std::move(resp.ctx));
      }
      MS_LOG_DEBUG("page {} of \"{}\" has failed, giving up: {} ({})",
                   page_,
                   parameters_.q,
                   resp.ctx.ec.message(),
                   resp.ctx.message);
      return complete(std::move(resp.ctx));
    }
    consecutive_transport_failures_ = 0;

    auto& page_results = resp.response.results;
    if (page_results.empty()) {
      ++empty_attempts_;
      if (empty_attempts_ >= options_.empty_page_retries) {
        MS_LOG_DEBUG(R"(page {} of "{}" is still empty after {} attempts, no more results, collected {}/{})",
                     page_,
                     parameters_.q,
                     empty_attempts_,
                     results_.size(),
                     num_);
        return complete(std::move(resp.ctx));
      }
      return schedule_request();
    }

    MS_LOG_DEBUG(R"(page {} of "{}" returned {} results)", page_, parameters_.q, page_results.size());
    results_.insert(results_.end(),
                    std::make_move_iterator(page_results.begin()),
                    std::make_move_iterator(page_results.end()));
    empty_attempts_ = 0;
    ++page_;
    if (results_.size() >= num_) {
      return complete(std::move(resp.ctx));
    }
    schedule_request();
  }

  void on_transport_failure(error_context::search&& ctx)
  {
    // the page starts over with the full empty page budget
    empty_attempts_ = 0;
    ++consecutive_transport_failures_;
    ++transport_retries_;
    last_transport_error_ = ctx.ec.message();
    if (const auto& limit = options_.transport_retry_limit;
        limit.has_value() && consecutive_transport_failures_ > limit.value()) {
      MS_LOG_WARNING(R"(page {} of "{}" has failed {} times in a row, last error: {} ({}))",
                     page_,
                     parameters_.q,
                     consecutive_transport_failures_,
                     ctx.ec.message(),
                     ctx.message);
      return complete(std::move(ctx));
    }
    MS_LOG_WARNING(R"(transport failure for page {} of "{}", retrying: {} ({}))",
                   page_,
                   parameters_.q,
                   ctx.ec.message(),
                   ctx.message);
    if (options_.transport_retry_backoff.count() == 0) {
      return schedule_request();
    }
    backoff_timer_.expires_after(options_.transport_retry_backoff);
    backoff_timer_.async_wait([self = shared_from_this()](std::error_code ec) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      self->request_page();
    });
  }

  void complete(error_context::search&& ctx)
  {
    if (results_.size() > num_) {
      results_.erase(results_.begin() + static_cast<std::ptrdiff_t>(num_), results_.end());
    }
    if (ctx.query.empty()) {
      ctx.query = parameters_.q;
    }
    ctx.empty_page_attempts = empty_attempts_;
    ctx.transport_retries = transport_retries_;
    ctx.last_transport_error = last_transport_error_;
    ctx.results_accumulated = results_.size();
    MS_LOG_DEBUG(R"(pagination of "{}" has finished on page {}, returning {} results{})",
                 parameters_.q,
                 page_,
                 results_.size(),
                 ctx.ec ? fmt::format(", ec={}", ctx.ec.message()) : std::string{});

    paginated_search_callback callback{};
    std::swap(callback, callback_);
    if (callback) {
      callback(std::move(ctx), std::move(results_));
    }
  }

  asio::io_context& io_;
  std::shared_ptr<search_component> component_;
  search_parameters parameters_;
  std::size_t num_;
  pagination_options::built options_;
  asio::steady_timer backoff_timer_;
  paginated_search_callback callback_{};

  std::vector<search_result> results_{};
  std::uint32_t page_{ 1 };
  std::size_t empty_attempts_{ 0 };
  std::size_t consecutive_transport_failures_{ 0 };
  std::size_t transport_retries_{ 0 };
  std::optional<std::string> last_transport_error_{};
};

paginated_search_orchestrator::paginated_search_orchestrator(asio::io_context& io,
                                                             std::shared_ptr<search_component> component,
                                                             search_parameters parameters,
                                                             std::size_t num,
                                                             pagination_options::built options)
  : impl_{ std::make_shared<paginated_search_orchestrator_impl>(io,
                                                                std::move(component),
                                                                std::move(parameters),
                                                                num,
                                                                options) }
{
}

void
paginated_search_orchestrator::start(paginated_search_callback&& callback)
{
  impl_->start(std::move(callback));
}
} // namespace metasearch::core
