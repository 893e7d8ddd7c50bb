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

#include "error.hxx"

#include "core/error_context/search_json.hxx"
#include "core/utils/json.hxx"

#include <metasearch/error.hxx>
#include <metasearch/error_context.hxx>

#include <tao/json/value.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace metasearch
{
error_context::error_context(internal_error_context internal)
  : internal_{ std::move(internal) }
{
}

auto
error_context::to_json(error_context_json_format format) const -> std::string
{
  if (!internal_.is_object()) {
    return "{}";
  }
  switch (format) {
    case error_context_json_format::compact:
      return core::utils::json::generate(internal_);
    case error_context_json_format::pretty:
      return core::utils::json::generate_pretty(internal_);
  }
  return core::utils::json::generate(internal_);
}

error_context::operator bool() const
{
  return internal_.is_object() && !internal_.get_object().empty();
}

error::error(std::error_code ec, std::string message, error_context ctx)
  : ec_{ ec }
  , message_{ std::move(message) }
  , ctx_{ std::move(ctx) }
{
}

auto
error::ec() const -> std::error_code
{
  return ec_;
}

auto
error::message() const -> const std::string&
{
  return message_;
}

auto
error::ctx() const -> const error_context&
{
  return ctx_;
}

error::operator bool() const
{
  return ec_.value() != 0;
}

auto
error::operator==(const metasearch::error& other) const -> bool
{
  return ec() == other.ec() && message() == other.message();
}

namespace core::impl
{
auto
make_error(const core::error_context::search& core_ctx) -> error
{
  if (!core_ctx.ec) {
    return {};
  }
  return { core_ctx.ec, core_ctx.message, error_context{ tao::json::value(core_ctx) } };
}
} // namespace core::impl
} // namespace metasearch
