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
 * @file is_utf8.tests.cc
 */

#include <string>

#include "base/is_utf8.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("is_utf8::valid")
{
    auto ascii = is_utf8("hello, world"_frag);

    CHECK(ascii.is_valid());
    CHECK(ascii.usr_invalid_count == 0);
    CHECK(ascii.usr_valid_frag.length() == 12);
    CHECK_FALSE(ascii.usr_has_ansi);

    auto multi = is_utf8(string_fragment::from_const("caf\xc3\xa9 \xe2\x82\xac"
                                                     " \xf0\x9f\x98\x80"));
    CHECK(multi.is_valid());

    auto ansi = is_utf8("\x1b[31merror\x1b[0m"_frag);
    CHECK(ansi.is_valid());
    CHECK(ansi.usr_has_ansi);
}

TEST_CASE("is_utf8::invalid")
{
    SUBCASE("bad lead byte")
    {
        auto res = is_utf8(string_fragment::from_const("ab\xff" "cd"));

        CHECK_FALSE(res.is_valid());
        CHECK(res.usr_faulty_bytes == 1);
        CHECK(res.usr_invalid_count == 1);
        CHECK(res.usr_valid_frag.to_string() == "ab");
    }

    SUBCASE("bad continuation")
    {
        auto res = is_utf8(string_fragment::from_const("\xe2\x41x"));

        CHECK_FALSE(res.is_valid());
        CHECK(std::string(res.usr_message) == "Invalid continuation byte.");
        CHECK(res.usr_valid_frag.empty());
    }

    SUBCASE("truncated")
    {
        auto res = is_utf8(string_fragment::from_const("ok\xe2\x82"));

        CHECK_FALSE(res.is_valid());
        CHECK(std::string(res.usr_message)
              == "Truncated multi-byte sequence.");
        CHECK(res.usr_valid_frag.to_string() == "ok");
    }

    SUBCASE("surrogate")
    {
        auto res = is_utf8(string_fragment::from_const("\xed\xa0\x80"));

        CHECK_FALSE(res.is_valid());
    }

    SUBCASE("overlong")
    {
        auto res = is_utf8(string_fragment::from_const("\xc0\xaf"));

        CHECK_FALSE(res.is_valid());
        CHECK(res.usr_invalid_count == 2);
    }
}

TEST_CASE("scrub_to_utf8")
{
    std::string out;

    SUBCASE("valid input is copied")
    {
        auto count = scrub_to_utf8(
            string_fragment::from_const("caf\xc3\xa9"), out);

        CHECK(count == 0);
        CHECK(out == "caf\xc3\xa9");
    }

    SUBCASE("each bad sequence is replaced")
    {
        auto count = scrub_to_utf8(
            string_fragment::from_const("a\xff" "b\xfe" "c"), out);

        CHECK(count == 2);
        CHECK(out == "a\xef\xbf\xbd" "b\xef\xbf\xbd" "c");
    }

    SUBCASE("appends to existing content")
    {
        out = "prefix:";
        scrub_to_utf8("abc"_frag, out);

        CHECK(out == "prefix:abc");
    }
}
