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

#include "utils.hxx"

#include <core/logger/logger.hxx>
#include <core/meta/version.hxx>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace msc
{
namespace
{
auto
safe_getenv(const std::string& name) noexcept -> std::optional<std::string>
{
  if (name.empty()) {
    return std::nullopt;
  }
  if (const char* val = std::getenv(name.c_str())) { // NOLINT(concurrency-mt-unsafe)
    if (val[0] != '\0') {
      return std::string(val);
    }
  }
  return std::nullopt;
}

auto
default_client_options() -> const auto&
{
  static const auto default_client_options_ = metasearch::client_options{}.build();
  return default_client_options_;
}

void
add_options(CLI::App* app, connection_options& options)
{
  auto* group = app->add_option_group("Connection", "Specify location of the search backend.");

  group
    ->add_option("--base-url",
                 options.base_url,
                 "Base URL of the backend, \"/search\" is appended to it. Also see MSC_BASE_URL "
                 "environment variable.")
    ->default_val(getenv_or_default("MSC_BASE_URL", "http://localhost:8888"));
}

void
add_options(CLI::App* app, logger_options& options)
{
  const std::vector<std::string> allowed_log_levels{
    "trace", "debug", "info", "warning", "error", "critical", "off",
  };
  auto* group = app->add_option_group("Logger", "Set logger verbosity and file output.");

  group
    ->add_option(
      "--log-level", options.level, "Log level. Also see MSC_LOG_LEVEL environment variable.")
    ->default_val(getenv_or_default("MSC_LOG_LEVEL", "off"))
    ->transform(CLI::IsMember(allowed_log_levels));
  group
    ->add_option("--log-output",
                 options.output_path,
                 "File to write logs (when is not set, logs will be written to STDERR).")
    ->transform(CLI::ExistingFile | CLI::NonexistentPath);
}

void
add_options(CLI::App* app, security_options& options)
{
  const std::vector<std::string> allowed_tls_verification_modes{
    "peer",
    "none",
  };
  auto* group = app->add_option_group("Security", "Set TLS options for https:// backends.");

  group
    ->add_option("--trust-certificate-path",
                 options.trust_certificate_path,
                 "Path to the trust certificate bundle.")
    ->transform(CLI::ExistingFile);
  group
    ->add_option(
      "--tls-verify-mode", options.tls_verify_mode, "Verification mode for TLS connections.")
    ->default_val("peer")
    ->transform(CLI::IsMember(allowed_tls_verification_modes));
}

void
add_options(CLI::App* app, timeout_options& options)
{
  const auto& defaults = default_client_options();
  auto* group = app->add_option_group("Timeouts", "Set timeouts of HTTP requests.");

  group->add_option("--connect-timeout", options.connect_timeout, "Timeout for socket connection.")
    ->default_val(defaults.connect_timeout)
    ->type_name("DURATION");
  group
    ->add_option("--request-timeout",
                 options.request_timeout,
                 "Timeout for a single HTTP request (one page).")
    ->default_val(defaults.request_timeout)
    ->type_name("DURATION");
  group
    ->add_option("--idle-http-connection-timeout",
                 options.idle_http_connection_timeout,
                 "Period to wait before calling HTTP connection idle.")
    ->default_val(defaults.idle_http_connection_timeout)
    ->type_name("DURATION");
}

void
add_options(CLI::App* app, pagination_options& options)
{
  const auto& defaults = default_client_options();
  auto* group = app->add_option_group("Pagination", "Set retry policy of paginated searches.");

  group
    ->add_option("--empty-page-retries",
                 options.empty_page_retries,
                 "Number of empty answers for a page before the backend is considered exhausted.")
    ->default_val(defaults.pagination.empty_page_retries);
  group->add_option("--transport-retry-limit",
                    options.transport_retry_limit,
                    "Give up after this number of consecutive transport failures (unlimited when "
                    "not set).");
  group
    ->add_option("--transport-retry-backoff",
                 options.transport_retry_backoff,
                 "Delay between transport retries.")
    ->default_val(defaults.pagination.transport_retry_backoff)
    ->type_name("DURATION");
}

auto
full_user_agent(const std::string& extra) -> std::string
{
  return metasearch::core::meta::user_agent_for_http(extra);
}

void
add_options(CLI::App* app, behavior_options& options)
{
  const auto& defaults = default_client_options();
  const std::string default_user_agent_extra{ "msc" };
  auto* group =
    app->add_option_group("Behavior", "Set options related to general library behavior.");

  group
    ->add_option("--user-agent-extra",
                 options.user_agent_extra,
                 fmt::format("Append extra string to the user-agent (full user-agent is \"{}\").",
                             full_user_agent(default_user_agent_extra)))
    ->default_val(default_user_agent_extra);
  group
    ->add_option("--max-idle-connections-per-host",
                 options.max_idle_connections_per_host,
                 "Number of idle HTTP connections kept in the pool.")
    ->default_val(defaults.max_idle_connections_per_host);
}
} // namespace

auto
getenv_or_default(const std::string& var_name, const std::string& default_value) -> std::string
{
  return safe_getenv(var_name).value_or(default_value);
}

void
add_common_options(CLI::App* app, common_options& options)
{
  add_options(app, options.connection);
  add_options(app, options.security);
  add_options(app, options.logger);
  add_options(app, options.timeouts);
  add_options(app, options.pagination);
  add_options(app, options.behavior);
}

void
apply_logger_options(const logger_options& options)
{
  auto level = metasearch::core::logger::level_from_str(options.level);

  if (level != metasearch::core::logger::level::off) {
    metasearch::core::logger::configuration configuration{};

    if (options.output_path.empty()) {
      configuration.console = true;
      configuration.unit_test = true;
    } else {
      configuration.filename = options.output_path;
    }
    configuration.log_level = level;
    if (auto err = metasearch::core::logger::create_file_logger(configuration); err) {
      fail(fmt::format("unable to initialize logger: {}", err.value()));
    }
  }

  spdlog::set_level(spdlog::level::from_str(options.level));
  metasearch::core::logger::set_log_levels(level);
}

auto
build_client_options(const common_options& options) -> metasearch::client_options
{
  metasearch::client_options client_options{};

  if (!options.security.trust_certificate_path.empty()) {
    client_options.trust_certificate(options.security.trust_certificate_path);
  }
  if (options.security.tls_verify_mode == "none") {
    client_options.tls_verify(metasearch::tls_verify_mode::none);
  } else if (options.security.tls_verify_mode == "peer") {
    client_options.tls_verify(metasearch::tls_verify_mode::peer);
  } else if (!options.security.tls_verify_mode.empty()) {
    fail(fmt::format("unexpected value '{}' for --tls-verify-mode",
                     options.security.tls_verify_mode));
  }

  client_options.connect_timeout(options.timeouts.connect_timeout);
  client_options.request_timeout(options.timeouts.request_timeout);
  client_options.idle_http_connection_timeout(options.timeouts.idle_http_connection_timeout);

  client_options.pagination().empty_page_retries(options.pagination.empty_page_retries);
  if (const auto& limit = options.pagination.transport_retry_limit; limit) {
    client_options.pagination().transport_retry_limit(limit.value());
  }
  client_options.pagination().transport_retry_backoff(options.pagination.transport_retry_backoff);

  client_options.user_agent_extra(options.behavior.user_agent_extra);
  client_options.max_idle_connections_per_host(options.behavior.max_idle_connections_per_host);

  return client_options;
}

[[noreturn]] void
fail(std::string_view message)
{
  fmt::print(stderr, "ERROR: {}\n", message);

#if defined(__APPLE__) && (__MAC_OS_X_VERSION_MAX_ALLOWED < 150000)
  std::_Exit(EXIT_FAILURE);
#else
  std::quick_exit(EXIT_FAILURE);
#endif
}
} // namespace msc
