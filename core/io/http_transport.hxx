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

#include "http_message.hxx"

#include <functional>
#include <system_error>

namespace metasearch::core::io
{
/**
 * Sends a request to the backend and delivers exactly one response or failure to the handler.
 *
 * Implementations must be safe to share between independent operations. The handler might be
 * invoked on any thread running the associated io_context.
 */
class http_transport
{
public:
  using response_handler = std::function<void(std::error_code, http_response&&)>;

  virtual ~http_transport() = default;

  virtual void execute(http_request request, response_handler&& handler) = 0;

  /**
   * Stops all pooled connections. Requests in flight are completed with request_canceled.
   */
  virtual void close() = 0;
};
} // namespace metasearch::core::io
