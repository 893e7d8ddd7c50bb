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

#include "language_tag.hxx"

#include <tao/pegtl.hpp>

namespace metasearch::core::utils
{
namespace priv
{
using namespace tao::pegtl;

using sep = one<'-'>;
template<unsigned Min, unsigned Max, typename Rule>
using subtag = seq<rep_min_max<Min, Max, Rule>, not_at<alnum>>;

// extlang = 3ALPHA *2("-" 3ALPHA)
struct extlang : seq<subtag<3, 3, alpha>, rep_max<2, seq<sep, subtag<3, 3, alpha>>>> {
};

// language = 2*3ALPHA ["-" extlang] / 4ALPHA / 5*8ALPHA
struct language : sor<seq<subtag<2, 3, alpha>, opt<sep, extlang>>, subtag<4, 4, alpha>, subtag<5, 8, alpha>> {
};

struct script : subtag<4, 4, alpha> {
};

struct region : sor<subtag<2, 2, alpha>, subtag<3, 3, digit>> {
};

struct variant : sor<subtag<5, 8, alnum>, seq<digit, subtag<3, 3, alnum>>> {
};

// any single alphanumeric except "x"
struct singleton : seq<not_at<one<'x', 'X'>>, alnum, not_at<alnum>> {
};

struct extension : seq<singleton, plus<sep, subtag<2, 8, alnum>>> {
};

struct privateuse : seq<one<'x', 'X'>, plus<sep, subtag<1, 8, alnum>>> {
};

struct langtag : seq<language,
                     opt<sep, script>,
                     opt<sep, region>,
                     star<sep, variant>,
                     star<sep, extension>,
                     opt<sep, privateuse>> {
};

struct irregular : sor<TAO_PEGTL_ISTRING("en-GB-oed"),
                       TAO_PEGTL_ISTRING("i-ami"),
                       TAO_PEGTL_ISTRING("i-bnn"),
                       TAO_PEGTL_ISTRING("i-default"),
                       TAO_PEGTL_ISTRING("i-enochian"),
                       TAO_PEGTL_ISTRING("i-hak"),
                       TAO_PEGTL_ISTRING("i-klingon"),
                       TAO_PEGTL_ISTRING("i-lux"),
                       TAO_PEGTL_ISTRING("i-mingo"),
                       TAO_PEGTL_ISTRING("i-navajo"),
                       TAO_PEGTL_ISTRING("i-pwn"),
                       TAO_PEGTL_ISTRING("i-tao"),
                       TAO_PEGTL_ISTRING("i-tay"),
                       TAO_PEGTL_ISTRING("i-tsu"),
                       TAO_PEGTL_ISTRING("sgn-BE-FR"),
                       TAO_PEGTL_ISTRING("sgn-BE-NL"),
                       TAO_PEGTL_ISTRING("sgn-CH-DE")> {
};

struct regular : sor<TAO_PEGTL_ISTRING("art-lojban"),
                     TAO_PEGTL_ISTRING("cel-gaulish"),
                     TAO_PEGTL_ISTRING("no-bok"),
                     TAO_PEGTL_ISTRING("no-nyn"),
                     TAO_PEGTL_ISTRING("zh-guoyu"),
                     TAO_PEGTL_ISTRING("zh-hakka"),
                     TAO_PEGTL_ISTRING("zh-min-nan"),
                     TAO_PEGTL_ISTRING("zh-min"),
                     TAO_PEGTL_ISTRING("zh-xiang")> {
};

struct grandfathered : sor<irregular, regular> {
};

struct grammar
  : sor<seq<grandfathered, eof>, seq<langtag, eof>, seq<privateuse, eof>> {
};
} // namespace priv

auto
is_valid_language_tag(std::string_view tag) -> bool
{
  if (tag.empty()) {
    return false;
  }
  auto in = tao::pegtl::memory_input(tag.data(), tag.size(), __FUNCTION__);
  return tao::pegtl::parse<priv::grammar>(in);
}
} // namespace metasearch::core::utils
