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

#include "core/error_context/search.hxx"

#include <tao/json/forward.hpp>
#include <tao/json/value.hpp>

namespace tao::json
{
template<>
struct traits<metasearch::core::error_context::search> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v,
                     const metasearch::core::error_context::search& ctx)
  {
    v = tao::json::empty_object;
    if (ctx.ec) {
      v["ec"] = ctx.ec.message();
    }
    v["method"] = ctx.method;
    v["endpoint"] = ctx.endpoint;
    v["query"] = ctx.query;
    if (const auto& val = ctx.page; val.has_value()) {
      v["page"] = val.value();
    }
    if (!ctx.parameters.empty()) {
      v["parameters"] = ctx.parameters;
    }
    if (ctx.http_status != 0) {
      v["http_status"] = ctx.http_status;
    }
    if (!ctx.http_body.empty()) {
      v["http_body"] = ctx.http_body;
    }
    v["empty_page_attempts"] = ctx.empty_page_attempts;
    v["transport_retries"] = ctx.transport_retries;
    if (const auto& val = ctx.last_transport_error; val.has_value()) {
      v["last_transport_error"] = val.value();
    }
    v["results_accumulated"] = ctx.results_accumulated;
  }
};
} // namespace tao::json
