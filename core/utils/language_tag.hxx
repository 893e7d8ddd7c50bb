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

#include <string_view>

namespace metasearch::core::utils
{
/**
 * Checks that the value is a well-formed language tag as defined by RFC 5646 (BCP 47), e.g.
 * "en", "en-US", "zh-Hant-TW", "sr-Latn-RS", "de-CH-1996" or "x-private".
 *
 * Only the syntax is verified, subtags are not looked up in the IANA registry. The backend-specific
 * values "all" and "auto" are accepted because they are well-formed too.
 */
auto
is_valid_language_tag(std::string_view tag) -> bool;
} // namespace metasearch::core::utils
