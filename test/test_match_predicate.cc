/**
 * Copyright (c) 2025, loupe contributors
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
 * * Neither the name of the loupe project nor the names of its contributors
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

#include <string>

#include "config.h"
#include "line_flags.hh"
#include "match_predicate.hh"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace loupe;

namespace {

bool
eval(const match_predicate& pred, const char* line)
{
    auto sf = string_fragment::from_c_str(line);

    return pred.evaluate(sf, classify_line(sf)).mi_matched;
}

match_predicate
spec(const char* str)
{
    auto parse_res = parse_predicate_spec(string_fragment::from_c_str(str));

    if (parse_res.isErr()) {
        FAIL(parse_res.unwrapErr().to_string());
    }

    return parse_res.unwrap();
}

}  // namespace

TEST_CASE("plain: smart case")
{
    auto lower = match_predicate::plain("error");
    auto upper = match_predicate::plain("Error");

    CHECK(eval(lower, "an ERROR happened"));
    CHECK(eval(lower, "an error happened"));
    CHECK_FALSE(eval(upper, "an ERROR happened"));
    CHECK(eval(upper, "an Error happened"));
    CHECK_FALSE(eval(lower, "all good"));
}

TEST_CASE("plain: explicit case modes")
{
    auto sensitive = match_predicate::plain("error", case_mode::sensitive);
    auto insensitive = match_predicate::plain("Error", case_mode::insensitive);

    CHECK_FALSE(eval(sensitive, "ERROR"));
    CHECK(eval(sensitive, "error"));
    CHECK(eval(insensitive, "eRRoR"));

    CHECK(plain_predicate{"abc", case_mode::smart}.is_case_sensitive()
          == false);
    CHECK(plain_predicate{"aBc", case_mode::smart}.is_case_sensitive());
}

TEST_CASE("plain: empty needle matches everything")
{
    auto pred = match_predicate::plain("");

    CHECK(eval(pred, "anything"));
    CHECK(eval(pred, ""));
}

TEST_CASE("regex")
{
    auto pred = match_predicate::regex(
                    string_fragment::from_const("took \\d+ms"))
                    .unwrap();

    CHECK(eval(pred, "request took 25ms"));
    CHECK_FALSE(eval(pred, "request took forever"));
    CHECK_FALSE(eval(pred, "REQUEST TOOK 25MS"));

    auto ci = match_predicate::regex(string_fragment::from_const("took \\d+ms"),
                                     true)
                  .unwrap();
    CHECK(eval(ci, "REQUEST TOOK 25MS"));
}

TEST_CASE("regex: compile error")
{
    auto res = match_predicate::regex(string_fragment::from_const("abc(def"));

    REQUIRE(res.isErr());

    auto err = res.unwrapErr();
    CHECK(err.pe_stage == 0);
    CHECK(err.pe_offset == 7);
    CHECK(err.pe_msg.find("invalid regex: ") == 0);
    CHECK(err.pe_input == "abc(def");
}

TEST_CASE("parse_predicate_spec")
{
    SUBCASE("plain")
    {
        auto pred = spec("ERROR");

        REQUIRE(pred.is<plain_predicate>());
        CHECK(pred.get<plain_predicate>().pp_needle == "ERROR");
        CHECK(pred.get<plain_predicate>().pp_case == case_mode::smart);

        auto prefixed = spec("plain:/not/a/regex/");
        REQUIRE(prefixed.is<plain_predicate>());
        CHECK(prefixed.get<plain_predicate>().pp_needle == "/not/a/regex/");
    }

    SUBCASE("regex")
    {
        auto slashed = spec("/err(or)?/");
        REQUIRE(slashed.is<regex_predicate>());
        CHECK_FALSE(slashed.get<regex_predicate>().rp_insensitive);

        auto ci = spec("/err/i");
        REQUIRE(ci.is<regex_predicate>());
        CHECK(ci.get<regex_predicate>().rp_insensitive);

        auto prefixed = spec("regex:a.c");
        REQUIRE(prefixed.is<regex_predicate>());
        CHECK(eval(prefixed, "abc"));

        // a lone slash is a plain needle
        CHECK(spec("/").is<plain_predicate>());
    }

    SUBCASE("query")
    {
        auto text = spec("query:json | level == error");
        REQUIRE(text.is<query_predicate>());
        REQUIRE(text.get_query() != nullptr);
        CHECK(text.get_query()->get_format() == query::source_format::json);

        auto structured = spec(R"(  {"format": "logfmt"})");
        REQUIRE(structured.is<query_predicate>());
        CHECK(structured.get_query()->get_format()
              == query::source_format::logfmt);
    }

    SUBCASE("errors")
    {
        auto empty = parse_predicate_spec(string_fragment::from_const(""));
        REQUIRE(empty.isErr());
        CHECK(empty.unwrapErr().pe_msg == "empty filter");

        auto bad_query = parse_predicate_spec(
            string_fragment::from_const("query:json | level"));
        REQUIRE(bad_query.isErr());
        CHECK(bad_query.unwrapErr().pe_stage == 1);

        CHECK(parse_predicate_spec(string_fragment::from_const("/a(/"))
                  .isErr());
        CHECK(parse_predicate_spec(string_fragment::from_const("{\"format\""))
                  .isErr());
    }
}

TEST_CASE("evaluate: queries")
{
    auto pred = spec("query:json | status >= 500");

    auto matched = pred.evaluate(
        string_fragment::from_const(R"({"status": 503, "msg": "busy"})"),
        LF_FORMAT_JSON);
    CHECK(matched.mi_matched);
    CHECK_FALSE(matched.mi_parse_failed);
    CHECK(matched.mi_fields.lf_fields["msg"] == "busy");

    auto text = pred.evaluate(string_fragment::from_const("status 503"), 0);
    CHECK_FALSE(text.mi_matched);
    CHECK(text.mi_parse_failed);

    // plain predicates never report parse failures
    auto plain = match_predicate::plain("status");
    auto res = plain.evaluate(string_fragment::from_const("{bad"),
                              LF_FORMAT_JSON);
    CHECK(res.mi_matched == false);
    CHECK_FALSE(res.mi_parse_failed);
}

TEST_CASE("bitmap_shortcut and flags_prefilter")
{
    CHECK_FALSE(match_predicate::plain("error").bitmap_shortcut().has_value());
    CHECK(match_predicate::plain("error").flags_prefilter().first == 0);
    CHECK(spec("query:level == warn").bitmap_shortcut() == LEVEL_WARNING);
    CHECK(spec("query:json | level == err | x == 1").bitmap_shortcut()
          == LEVEL_ERROR);
    CHECK_FALSE(spec("query:json | level != error").bitmap_shortcut());
    CHECK_FALSE(spec("query:json | level == bogus").bitmap_shortcut());
    CHECK(spec("query:json | x == 1").flags_prefilter().second
          == LF_FORMAT_JSON);
    CHECK(spec("query:logfmt | count by (svc)").flags_prefilter().second
          == LF_FORMAT_LOGFMT);
}

TEST_CASE("to_string")
{
    CHECK(spec("ERROR").to_string() == "plain:ERROR");
    CHECK(spec("/a+b/").to_string() == "/a+b/");
    CHECK(spec("/a+b/i").to_string() == "/a+b/i");
    CHECK(spec("query:json|level==error").to_string()
          == R"(query:json | level == "error")");
}

TEST_CASE("operator==")
{
    CHECK(spec("ERROR") == spec("plain:ERROR"));
    CHECK(spec("ERROR") != spec("error"));
    CHECK(match_predicate::plain("x", case_mode::sensitive)
          != match_predicate::plain("x"));
    CHECK(spec("/x/") == spec("regex:x"));
    CHECK(spec("/x/") != spec("/x/i"));
    CHECK(spec("/x/") != spec("x"));
    CHECK(spec("query:json | a == 1")
          == spec(R"({"format": "json",
                      "filters": [{"field": "a", "op": "eq", "value": 1}]})"));
    CHECK(spec("query:json | a == 1") != spec("query:json | a == 2"));
}
