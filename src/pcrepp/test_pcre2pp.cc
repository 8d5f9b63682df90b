/**
 * Copyright (c) 2022, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "pcre2pp.hh"

using loupe::pcre2pp::code;
using loupe::pcre2pp::found;
using loupe::pcre2pp::not_found;

TEST_CASE("bad pattern")
{
    auto compile_res = code::from(string_fragment::from_const("[abc"));

    REQUIRE(compile_res.isErr());
    auto ce = compile_res.unwrapErr();
    CHECK(ce.ce_offset == 4);
    CHECK(ce.ce_pattern == "[abc");
    CHECK_FALSE(ce.get_message().empty());
}

TEST_CASE("capture count")
{
    auto co = code::from(string_fragment::from_const("(a)(?:b)(?<name>c)"))
                  .unwrap();

    CHECK(co.get_capture_count() == 2);
    CHECK(co.get_pattern() == "(a)(?:b)(?<name>c)");
}

TEST_CASE("find_in")
{
    auto co = code::from(string_fragment::from_const("time(out|d out)"))
                  .unwrap();

    auto hit = co.find_in("connect timeout after 5s"_frag).ignore_error();
    REQUIRE(hit.has_value());
    CHECK(hit->f_all.to_string() == "timeout");
    CHECK(hit->f_remaining.to_string() == " after 5s");

    CHECK_FALSE(co.find_in("connected"_frag).ignore_error().has_value());
}

TEST_CASE("caseless")
{
    auto co = code::from(string_fragment::from_const("refused"),
                         PCRE2_CASELESS)
                  .unwrap();

    CHECK(co.find_in("Connection REFUSED"_frag).ignore_error().has_value());
}

TEST_CASE("utf8 input")
{
    auto co = code::from(string_fragment::from_const("caf.")).unwrap();
    auto hit = co.find_in(string_fragment::from_const("un caf\xc3\xa9 noir"))
                   .ignore_error();

    REQUIRE(hit.has_value());
    CHECK(hit->f_all.length() == 5);
}

TEST_CASE("captures")
{
    static const char INPUT[] = "key1=1234;key2=5678;";

    auto co = code::from(string_fragment::from_const(R"((\w+)=([^;]+);)"))
                  .unwrap();
    auto md = co.create_match_data();
    auto input = string_fragment::from_const(INPUT);

    auto first = co.find_in(input, md);
    REQUIRE(first.is<found>());
    CHECK(md.get_count() == 3);
    CHECK(md[1]->to_string() == "key1");
    CHECK(md[2]->to_string() == "1234");
    CHECK_FALSE(md[3].has_value());

    auto rest = first.get<found>().f_remaining;
    auto second = co.find_in(input, md, rest.sf_begin);
    REQUIRE(second.is<found>());
    CHECK(md[1]->to_string() == "key2");
    CHECK(md[2]->to_string() == "5678");
    CHECK(second.get<found>().f_remaining.empty());

    CHECK(co.find_in(input, md, input.length()).is<not_found>());
    CHECK(md.get_count() == 0);
    CHECK_FALSE(md[0].has_value());
}

TEST_CASE("optional captures")
{
    auto co = code::from(string_fragment::from_const("(a)|(b)")).unwrap();
    auto md = co.create_match_data();

    REQUIRE(co.find_in("b"_frag, md).is<found>());
    CHECK_FALSE(md[1].has_value());
    CHECK(md[2]->to_string() == "b");
}

TEST_CASE("to_shared")
{
    auto co = code::from(string_fragment::from_const("err(or)?"))
                  .unwrap()
                  .to_shared();

    CHECK(co->find_in("an error"_frag).ignore_error().has_value());
    CHECK(co->to_string() == "err(or)?");
}
