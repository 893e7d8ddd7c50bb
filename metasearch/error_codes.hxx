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

#include <system_error>

namespace metasearch
{
#ifndef METASEARCH_CXX_CLIENT_DOXYGEN
namespace core::impl
{
auto
common_category() noexcept -> const std::error_category&;

auto
network_category() noexcept -> const std::error_category&;
} // namespace core::impl
#endif

namespace errc
{
/**
 * Errors shared by every operation of the library.
 *
 * @since 1.0.0
 * @committed
 */
enum class common {
  /**
   * A parameter passed to the operation cannot be sent to the backend.
   *
   * For example, the language tag does not follow the BCP 47 grammar.
   *
   * @since 1.0.0
   * @committed
   */
  invalid_argument = 1,

  /**
   * The response body is not a valid JSON document.
   *
   * @since 1.0.0
   * @committed
   */
  parsing_failure = 2,

  /**
   * The response is valid JSON, but its structure does not match any known shape of the backend
   * API: a required field is missing or has an unexpected type, or a result element carries fields
   * that neither the legacy nor the main result shape declares.
   *
   * This error is never retried, as it signals an unrecognized backend version.
   *
   * @since 1.0.0
   * @committed
   */
  schema_mismatch = 3,

  /**
   * The request has been cancelled before the response arrived (e.g. the transport was closed).
   *
   * @since 1.0.0
   * @committed
   */
  request_canceled = 4,

  /**
   * The response did not arrive within the configured request timeout.
   *
   * @since 1.0.0
   * @committed
   */
  unambiguous_timeout = 5,

  /**
   * Unexpected state of the library itself.
   *
   * @since 1.0.0
   * @uncommitted
   */
  internal_failure = 6,
};

/**
 * Errors reported by the HTTP transport.
 *
 * Every error of this category is considered transient by the pagination engine.
 *
 * @since 1.0.0
 * @committed
 */
enum class network {
  /**
   * Unable to resolve the hostname of the backend.
   *
   * @since 1.0.0
   * @committed
   */
  resolve_failure = 101,

  /**
   * None of the resolved addresses accepted the connection.
   *
   * @since 1.0.0
   * @committed
   */
  connect_failure = 102,

  /**
   * The TLS handshake has failed.
   *
   * @since 1.0.0
   * @committed
   */
  handshake_failure = 103,

  /**
   * The backend sent bytes that cannot be parsed as an HTTP/1.1 response.
   *
   * @since 1.0.0
   * @committed
   */
  protocol_error = 104,

  /**
   * The connection was closed before the response was complete.
   *
   * @since 1.0.0
   * @committed
   */
  end_of_stream = 105,

  /**
   * The backend answered with a status code outside of the 2xx range.
   *
   * @since 1.0.0
   * @committed
   */
  http_status_failure = 106,

  /**
   * The base URL uses a scheme other than "http" or "https".
   *
   * @since 1.0.0
   * @committed
   */
  unsupported_scheme = 107,
};

#ifndef METASEARCH_CXX_CLIENT_DOXYGEN
inline auto
make_error_code(common e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::common_category() };
}

inline auto
make_error_code(network e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::network_category() };
}
#endif
} // namespace errc
} // namespace metasearch

#ifndef METASEARCH_CXX_CLIENT_DOXYGEN
template<>
struct std::is_error_code_enum<metasearch::errc::common> : std::true_type {
};

template<>
struct std::is_error_code_enum<metasearch::errc::network> : std::true_type {
};
#endif
