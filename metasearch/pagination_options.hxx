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

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

namespace metasearch
{
/**
 * Retry policy of @ref search_request::send_get_num.
 *
 * @since 1.0.0
 * @committed
 */
class pagination_options
{
public:
  static constexpr std::size_t default_empty_page_retries{ 3 };
  static constexpr std::chrono::milliseconds default_transport_retry_backoff{ 0 };

  /**
   * Number of times a page is requested before an empty answer is taken as the end of the result
   * list. Values below one are treated as one.
   */
  auto empty_page_retries(std::size_t attempts) -> pagination_options&
  {
    empty_page_retries_ = attempts;
    return *this;
  }

  /**
   * Maximum number of consecutive transport failures tolerated for the same page.
   *
   * By default the request is retried until the backend answers. When the limit is exceeded, the
   * transport error is reported together with the results collected so far.
   */
  auto transport_retry_limit(std::size_t retries) -> pagination_options&
  {
    transport_retry_limit_ = retries;
    return *this;
  }

  /**
   * Delay before the request is retried after a transport failure.
   */
  auto transport_retry_backoff(std::chrono::milliseconds backoff) -> pagination_options&
  {
    transport_retry_backoff_ = backoff;
    return *this;
  }

  struct built {
    std::size_t empty_page_retries;
    std::optional<std::size_t> transport_retry_limit;
    std::chrono::milliseconds transport_retry_backoff;
  };

  [[nodiscard]] auto build() const -> built
  {
    return {
      empty_page_retries_ == 0 ? 1 : empty_page_retries_,
      transport_retry_limit_,
      transport_retry_backoff_,
    };
  }

private:
  std::size_t empty_page_retries_{ default_empty_page_retries };
  std::optional<std::size_t> transport_retry_limit_{};
  std::chrono::milliseconds transport_retry_backoff_{ default_transport_retry_backoff };
};
} // namespace metasearch
