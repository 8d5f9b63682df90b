/**
 * Copyright (c) 2025, Timothy Stack
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
 *
 * @file string_fragment.tests.cc
 */

#include <string>

#include "base/string_fragment.hh"

#include "config.h"
#include "doctest/doctest.h"
#include "fmt/format.h"

TEST_CASE("string_fragment::find")
{
    auto sf = "the quick brown fox"_frag;

    CHECK(sf.find('q') == 4);
    CHECK_FALSE(sf.find('z').has_value());
    CHECK(sf.find("brown"_frag) == 10);
    CHECK_FALSE(sf.find("BROWN"_frag).has_value());
    CHECK(sf.find(""_frag) == 0);
    CHECK_FALSE("ab"_frag.find("abc"_frag).has_value());
}

TEST_CASE("string_fragment::ifind")
{
    auto sf = "Connection REFUSED by peer"_frag;

    CHECK(sf.ifind("refused"_frag) == 11);
    CHECK(sf.ifind("connection"_frag) == 0);
    CHECK(sf.ifind("PEER"_frag) == 22);
    CHECK_FALSE(sf.ifind("timeout"_frag).has_value());
    CHECK_FALSE("ab"_frag.ifind("abc"_frag).has_value());
}

TEST_CASE("string_fragment::trim")
{
    CHECK("  abc \r\n"_frag.trim().to_string() == "abc");
    CHECK("xxabcxx"_frag.trim("x").to_string() == "abc");
    CHECK("abc\r\n"_frag.rtrim("\r\n").to_string() == "abc");
    CHECK("   "_frag.trim().empty());
}

TEST_CASE("string_fragment::sub_range")
{
    auto sf = "0123456789"_frag;

    CHECK(sf.sub_range(2, 5).to_string() == "234");
    CHECK(sf.substr(7).to_string() == "789");
    CHECK(sf.sub_range(2, 5).sub_range(1, 2).to_string() == "3");
}

TEST_CASE("string_fragment::compare")
{
    CHECK("abc"_frag == "abc");
    CHECK("abc"_frag != "abd"_frag);
    CHECK("abc"_frag < "abd"_frag);
    CHECK("ab"_frag < "abc"_frag);
    CHECK("ABC"_frag.iequal("abc"_frag));
    CHECK("level=info"_frag.startswith("level"));
    CHECK("app.log"_frag.endswith(".log"));
}

TEST_CASE("string_fragment::to_unquoted_string")
{
    CHECK("\"hello\""_frag.to_unquoted_string() == "hello");
    CHECK("'a b'"_frag.to_unquoted_string() == "a b");
    CHECK("\"a\\\"b\""_frag.to_unquoted_string() == "a\"b");
    CHECK("plain"_frag.to_unquoted_string() == "plain");
}

TEST_CASE("string_fragment::format")
{
    CHECK(fmt::format(FMT_STRING("[{}]"), "abc"_frag) == "[abc]");
}
