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

#include "search.hxx"
#include "version.hxx"

#include "core/meta/version.hxx"

#include <fmt/core.h>

int
main(int argc, const char** argv)
{
  CLI::App app{ "Query a federated search backend.", "msc" };
  app.set_version_flag("--version", fmt::format("msc {}", metasearch::core::meta::sdk_semver()));
  app.require_subcommand(1);
  app.allow_windows_style_options(true);

  app.add_subcommand(msc::make_version_command());
  app.add_subcommand(msc::make_search_command());

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  for (const auto& item : app.get_subcommands()) {
    if (item->get_name() == "version") {
      return msc::execute_version_command(item);
    }
    if (item->get_name() == "search") {
      return msc::execute_search_command(item);
    }
  }

  return 0;
}
