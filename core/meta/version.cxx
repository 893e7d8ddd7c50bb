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

#include "version.hxx"

#include "core/utils/json.hxx"

#include <metasearch/build_version.hxx>

#include <asio/version.hpp>
#include <fmt/core.h>
#include <llhttp.h>
#include <openssl/crypto.h>
#include <spdlog/version.h>
#include <tao/json/value.hpp>

namespace metasearch::core::meta
{
auto
sdk_build_info() -> std::map<std::string, std::string>
{
  std::map<std::string, std::string> info{};
  info["build_timestamp"] = METASEARCH_CXX_CLIENT_BUILD_TIMESTAMP;
  info["revision"] = METASEARCH_CXX_CLIENT_GIT_REVISION;
  info["version_major"] = std::to_string(METASEARCH_CXX_CLIENT_VERSION_MAJOR);
  info["version_minor"] = std::to_string(METASEARCH_CXX_CLIENT_VERSION_MINOR);
  info["version_patch"] = std::to_string(METASEARCH_CXX_CLIENT_VERSION_PATCH);
  info["version"] = fmt::format("{}.{}.{}",
                                METASEARCH_CXX_CLIENT_VERSION_MAJOR,
                                METASEARCH_CXX_CLIENT_VERSION_MINOR,
                                METASEARCH_CXX_CLIENT_VERSION_PATCH);
  info["semver"] = sdk_semver();
  info["platform"] = METASEARCH_CXX_CLIENT_SYSTEM;
  info["platform_name"] = METASEARCH_CXX_CLIENT_SYSTEM_NAME;
  info["cpu"] = METASEARCH_CXX_CLIENT_SYSTEM_PROCESSOR;
  info["cxx"] = METASEARCH_CXX_CLIENT_CXX_COMPILER;
  info["cmake_version"] = METASEARCH_CXX_CLIENT_CMAKE_VERSION;
  info["cmake_build_type"] = METASEARCH_CXX_CLIENT_CMAKE_BUILD_TYPE;
  info["spdlog"] = fmt::format("{}.{}.{}", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
  info["fmt"] =
    fmt::format("{}.{}.{}", FMT_VERSION / 10'000, FMT_VERSION / 100 % 100, FMT_VERSION % 100);
  info["asio"] =
    fmt::format("{}.{}.{}", ASIO_VERSION / 100'000, ASIO_VERSION / 100 % 1000, ASIO_VERSION % 100);
  info["llhttp"] =
    fmt::format("{}.{}.{}", LLHTTP_VERSION_MAJOR, LLHTTP_VERSION_MINOR, LLHTTP_VERSION_PATCH);
  info["openssl_headers"] = OPENSSL_VERSION_TEXT;
  info["openssl_runtime"] = OpenSSL_version(OPENSSL_VERSION);
  info["__cplusplus"] = fmt::format("{}", __cplusplus);
#if defined(__GLIBC__)
  info["libc"] = fmt::format("glibc {}.{}", __GLIBC__, __GLIBC_MINOR__);
#endif

  return info;
}

auto
sdk_build_info_json() -> std::string
{
  tao::json::value info = tao::json::empty_object;
  for (const auto& [name, value] : sdk_build_info()) {
    if (name == "version_major" || name == "version_minor" || name == "version_patch") {
      info[name] = std::stoi(value);
    } else {
      info[name] = value;
    }
  }
  return utils::json::generate(info);
}

auto
sdk_build_info_short() -> std::string
{
  return fmt::format(R"(rev="{}", compiler="{}", system="{}", date="{}")",
                     METASEARCH_CXX_CLIENT_GIT_REVISION,
                     METASEARCH_CXX_CLIENT_CXX_COMPILER,
                     METASEARCH_CXX_CLIENT_SYSTEM,
                     METASEARCH_CXX_CLIENT_BUILD_TIMESTAMP);
}

auto
sdk_semver() -> const std::string&
{
  static const std::string version{ fmt::format("{}.{}.{}+{}",
                                                METASEARCH_CXX_CLIENT_VERSION_MAJOR,
                                                METASEARCH_CXX_CLIENT_VERSION_MINOR,
                                                METASEARCH_CXX_CLIENT_VERSION_PATCH,
                                                METASEARCH_CXX_CLIENT_GIT_REVISION_SHORT) };
  return version;
}

auto
sdk_version() -> const std::string&
{
  static const std::string version{ fmt::format("metasearch-cxx-client/{}.{}.{}",
                                                METASEARCH_CXX_CLIENT_VERSION_MAJOR,
                                                METASEARCH_CXX_CLIENT_VERSION_MINOR,
                                                METASEARCH_CXX_CLIENT_VERSION_PATCH) };
  return version;
}

auto
sdk_id() -> const std::string&
{
  static const std::string identifier{ fmt::format("{} ({}/{}; rev={})",
                                                   sdk_version(),
                                                   METASEARCH_CXX_CLIENT_SYSTEM_NAME,
                                                   METASEARCH_CXX_CLIENT_SYSTEM_PROCESSOR,
                                                   METASEARCH_CXX_CLIENT_GIT_REVISION_SHORT) };
  return identifier;
}

auto
os() -> const std::string&
{
  static const std::string system{ METASEARCH_CXX_CLIENT_SYSTEM };
  return system;
}

auto
user_agent_for_http(const std::string& extra) -> std::string
{
  auto user_agent = sdk_id();
  if (!extra.empty()) {
    user_agent.append(" ").append(extra);
  }
  for (auto& ch : user_agent) {
    if (ch == '\n' || ch == '\r') {
      ch = ' ';
    }
  }
  return user_agent;
}
} // namespace metasearch::core::meta
