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
#include <vector>

#include "chunky_index.hh"
#include "config.h"
#include "field_extractor.hh"
#include "level_index.hh"
#include "line_bitmap.hh"
#include "line_flags.hh"
#include "line_index.hh"
#include "log_level.hh"
#include "test_support.hh"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace loupe;

namespace {

std::vector<line_no_t>
to_vector(const line_bitmap& bm)
{
    return {bm.begin(), bm.end()};
}

}  // namespace

TEST_CASE("chunky_index")
{
    chunky_index<int, 4> ci;

    CHECK(ci.empty());
    for (int lpc = 0; lpc < 11; lpc++) {
        ci.push_back(lpc * 10);
    }
    CHECK(ci.size() == 11);
    CHECK(ci.chunk_count() == 3);
    CHECK(ci[0] == 0);
    CHECK(ci[4] == 40);
    CHECK(ci.back() == 100);
    CHECK(std::vector<int>(ci.begin(), ci.end()).size() == 11);
    CHECK(*(ci.begin() + 7) == 70);

    ci.pop_back();
    ci.pop_back();
    ci.pop_back();
    CHECK(ci.size() == 8);
    CHECK(ci.chunk_count() == 2);
    CHECK(ci.back() == 70);

    ci.push_back(80);
    CHECK(ci.chunk_count() == 3);

    ci.clear();
    CHECK(ci.size() == 0);
    CHECK(ci.chunk_count() == 0);
}

TEST_CASE("line_bitmap")
{
    line_bitmap bm;

    for (line_no_t line : {1, 3, 5, 7, 9}) {
        bm.append(line);
    }

    CHECK(bm.contains(5));
    CHECK_FALSE(bm.contains(4));
    CHECK(bm.next(5) == 7);
    CHECK_FALSE(bm.next(9).has_value());
    CHECK(bm.prev(5) == 3);
    CHECK_FALSE(bm.prev(1).has_value());

    auto range = bm.equal_range(3, 8);
    CHECK(std::distance(range.first, range.second) == 3);

    line_bitmap other;
    for (line_no_t line : {2, 3, 7, 10}) {
        other.append(line);
    }
    CHECK(to_vector(bm.intersect(other)) == std::vector<line_no_t>{3, 7});
    CHECK(to_vector(bm.unite(other))
          == std::vector<line_no_t>{1, 2, 3, 5, 7, 9, 10});

    bm.truncate(6);
    CHECK(to_vector(bm) == std::vector<line_no_t>{1, 3, 5});
}

TEST_CASE("line_bitmap copies share full chunks")
{
    line_bitmap bm;

    for (line_no_t line = 0; line < 10000; line++) {
        bm.append(line * 2);
    }
    REQUIRE(bm.chunk_count() == 2);

    auto copy = bm;

    CHECK(copy == bm);
    CHECK(&copy[0] == &bm[0]);
    CHECK(&copy[line_bitmap::CHUNK_SIZE] == &bm[line_bitmap::CHUNK_SIZE]);
    // the partially filled chunk is private to each copy
    CHECK(&copy[9999] != &bm[9999]);

    bm.append(20000);
    CHECK(copy.size() == 10000);
    CHECK(bm.size() == 10001);

    // cutting into a shared chunk leaves the copy alone
    bm.truncate(6000);
    CHECK(bm.size() == 3000);
    CHECK(bm.chunk_count() == 0);
    CHECK(bm.back() == 5998);
    CHECK(copy.size() == 10000);
    CHECK(copy.back() == 19998);
    CHECK(copy.contains(9000));
    CHECK(copy.next(8191) == 8192);
    CHECK(copy.prev(8192) == 8190);

    auto evens = copy.equal_range(8190, 8200);
    CHECK(std::distance(evens.first, evens.second) == 5);

    bm.truncate(0);
    CHECK(bm.empty());
}

TEST_CASE("alias2level")
{
    CHECK(alias2level("ERR"_frag) == LEVEL_ERROR);
    CHECK(alias2level("Warning"_frag) == LEVEL_WARNING);
    CHECK(alias2level("warn"_frag) == LEVEL_WARNING);
    CHECK(alias2level("crit"_frag) == LEVEL_FATAL);
    CHECK(alias2level("emergency"_frag) == LEVEL_FATAL);
    CHECK(alias2level("panic"_frag) == LEVEL_FATAL);
    CHECK_FALSE(alias2level("notice"_frag).has_value());
    CHECK(string2level("notice"_frag) == LEVEL_UNKNOWN);
}

TEST_CASE("scan_level_keyword")
{
    CHECK(scan_level_keyword("INFO a"_frag) == LEVEL_INFO);
    CHECK(scan_level_keyword("[error] disk full"_frag) == LEVEL_ERROR);
    CHECK(scan_level_keyword("Warning: low memory"_frag) == LEVEL_WARNING);
    CHECK(scan_level_keyword("warnings were ignored"_frag) == LEVEL_UNKNOWN);
    CHECK(scan_level_keyword("xerror"_frag) == LEVEL_UNKNOWN);
    CHECK(scan_level_keyword("errors happened"_frag) == LEVEL_UNKNOWN);
    CHECK(scan_level_keyword("debug then error"_frag) == LEVEL_DEBUG);
    CHECK(scan_level_keyword("\x1b[31mERROR\x1b[0m x"_frag) == LEVEL_ERROR);
}

TEST_CASE("classify")
{
    CHECK(classify("2024-05-01 12:00:00 WARN disk at 91%"_frag)
          == LEVEL_WARNING);
    CHECK(classify(R"({"msg":"x","severity":"critical"})"_frag)
          == LEVEL_FATAL);
    CHECK(classify("ts=1 lvl=debug msg=hi"_frag) == LEVEL_DEBUG);
    CHECK(classify("nothing to see"_frag) == LEVEL_UNKNOWN);
    CHECK(classify(""_frag) == LEVEL_UNKNOWN);
}

TEST_CASE("classify_line")
{
    SUBCASE("plain text")
    {
        auto flags = classify_line("2024-01-01 12:00:00 WARN disk"_frag);

        CHECK(flags2level(flags) == LEVEL_WARNING);
        CHECK((flags & LF_HAS_TIMESTAMP) != 0);
        CHECK((flags & (LF_FORMAT_JSON | LF_FORMAT_LOGFMT)) == 0);
    }

    SUBCASE("empty")
    {
        CHECK(classify_line(" \t"_frag) == LF_IS_EMPTY);
        CHECK(classify_line(""_frag) == LF_IS_EMPTY);
    }

    SUBCASE("ansi")
    {
        auto flags = classify_line("\x1b[31mERROR\x1b[0m x"_frag);

        CHECK((flags & LF_HAS_ANSI) != 0);
        CHECK(flags2level(flags) == LEVEL_ERROR);
    }

    SUBCASE("json")
    {
        auto flags
            = classify_line(R"({"level":"error","service":"api"})"_frag);

        CHECK((flags & LF_FORMAT_JSON) != 0);
        CHECK(flags2level(flags) == LEVEL_ERROR);

        auto sev = classify_line(R"(  {"severity":"crit"})"_frag);
        CHECK(flags2level(sev) == LEVEL_FATAL);

        auto fallback
            = classify_line(R"({"level":"bogus","lvl":"debug"})"_frag);
        CHECK(flags2level(fallback) == LEVEL_DEBUG);

        auto broken = classify_line("{not json ERROR"_frag);
        CHECK((broken & LF_FORMAT_JSON) != 0);
        CHECK(flags2level(broken) == LEVEL_ERROR);
    }

    SUBCASE("logfmt")
    {
        auto flags = classify_line(R"(level=info msg="user error")"_frag);

        CHECK((flags & LF_FORMAT_LOGFMT) != 0);
        CHECK(flags2level(flags) == LEVEL_INFO);

        auto bare = classify_line("ts=1 ERROR happened"_frag);
        CHECK((bare & LF_FORMAT_LOGFMT) != 0);
        CHECK(flags2level(bare) == LEVEL_ERROR);
    }
}

TEST_CASE("decode_line")
{
    std::string scratch;
    size_t replacements = 0;

    auto valid = decode_line("fine"_frag, scratch, replacements);
    CHECK(valid.to_string() == "fine");
    CHECK(replacements == 0);

    auto fixed = decode_line(
        string_fragment::from_const("bad \xff byte"), scratch, replacements);
    CHECK(fixed.to_string() == "bad \xef\xbf\xbd byte");
    CHECK(replacements == 1);
}

TEST_CASE("extract_json_fields")
{
    auto fields_res = extract_json_fields(
        R"({"a":{"b":1,"c":[true,null,"x"]},"n":-1.50,"s":"t"})"_frag);

    REQUIRE(fields_res.isOk());

    auto fields = fields_res.unwrap();
    CHECK(fields["a.b"] == "1");
    CHECK(fields["a.c.0"] == "true");
    CHECK(fields["a.c.1"] == "null");
    CHECK(fields["a.c.2"] == "x");
    CHECK(fields["a.c"] == R"([true,null,"x"])");
    CHECK(fields["n"] == "-1.50");
    CHECK(fields["s"] == "t");

    CHECK(extract_json_fields("[1,2]"_frag).isErr());
    CHECK(extract_json_fields("{\"a\":"_frag).isErr());
}

TEST_CASE("extract_logfmt_fields")
{
    auto fields = extract_logfmt_fields(
        R"(ts=1 INFO level=warn msg="a b" level=error)"_frag);

    CHECK(fields.size() == 3);
    CHECK(fields["msg"] == "a b");
    CHECK(fields["level"] == "error");
    CHECK(has_logfmt_pair("a b c=d"_frag));
    CHECK_FALSE(has_logfmt_pair("no pairs here"_frag));
}

TEST_CASE("level_index::update")
{
    level_index li;

    li.update(0, LEVEL_INFO);
    li.update(1, LEVEL_ERROR | LF_FORMAT_LOGFMT);
    li.update(2, LEVEL_INFO);
    li.update(3, LF_IS_EMPTY);

    CHECK(li.size() == 4);
    CHECK(li.level_at(1) == LEVEL_ERROR);
    CHECK((li.flags_at(1) & LF_FORMAT_LOGFMT) != 0);

    auto hist = li.histogram();
    CHECK(hist[LEVEL_INFO] == 2);
    CHECK(hist[LEVEL_ERROR] == 1);
    CHECK(hist[LEVEL_UNKNOWN] == 1);

    size_t total = 0;
    for (const auto count : hist) {
        total += count;
    }
    CHECK(total == li.size());

    CHECK(to_vector(li.bitmap_for(LEVEL_INFO))
          == std::vector<line_no_t>{0, 2});
    CHECK(to_vector(li.bitmap_range(LEVEL_INFO, 1, 4))
          == std::vector<line_no_t>{2});
}

TEST_CASE("level_index::view_range")
{
    level_index li;

    for (line_no_t line = 0; line < 10; line++) {
        li.update(line, line % 3 == 0 ? LEVEL_ERROR : LEVEL_DEBUG);
    }

    auto rv = li.view_range(2, 5, LEVEL_ERROR);
    CHECK(rv.rv_start == 2);
    CHECK(rv.rv_flags.size() == 5);
    CHECK(to_vector(rv.rv_candidates) == std::vector<line_no_t>{3, 6});

    auto tail = li.view_range(8, 5);
    CHECK(tail.rv_flags.size() == 2);
    CHECK(tail.rv_candidates.empty());

    auto past = li.view_range(10, 5);
    CHECK(past.rv_flags.empty());
}

TEST_CASE("level_index::truncate")
{
    level_index li;

    for (line_no_t line = 0; line < 10; line++) {
        li.update(line, LEVEL_WARNING);
    }

    auto gen0 = li.generation();
    CHECK_FALSE(li.rewind_point(gen0).has_value());

    li.truncate(20);
    CHECK(li.generation() == gen0);

    li.truncate(8);
    auto gen1 = li.generation();
    CHECK(gen1 != gen0);
    CHECK(li.size() == 8);
    CHECK(li.histogram()[LEVEL_WARNING] == 8);

    li.update(8, LEVEL_INFO);
    li.truncate(5);
    CHECK(li.rewind_point(gen0) == 5);
    CHECK(li.rewind_point(gen1) == 5);
    CHECK_FALSE(li.rewind_point(li.generation()).has_value());

    li.clear();
    CHECK(li.size() == 0);
    CHECK(li.rewind_point(gen1) == 0);
}

TEST_CASE("level_index::catch_up")
{
    temp_dir td;
    auto path = td / "levels.log";

    write_file(path,
               "INFO a\n"
               "ERROR b\n"
               "INFO c\n"
               "\n"
               "{\"level\":\"warn\"}\n"
               "bad \xff utf\n");

    auto lines = line_index::open(path).unwrap();
    auto lb = lines->create_buffer();
    level_index li;

    auto catch_res = li.catch_up(*lines, *lb);
    REQUIRE(catch_res.isOk());
    CHECK(catch_res.unwrap() == 6);
    CHECK(li.level_at(0) == LEVEL_INFO);
    CHECK(li.level_at(1) == LEVEL_ERROR);
    CHECK(li.level_at(4) == LEVEL_WARNING);
    CHECK((li.flags_at(3) & LF_IS_EMPTY) != 0);
    CHECK(li.decode_errors() == 1);
    CHECK(to_vector(li.bitmap_for(LEVEL_ERROR)) == std::vector<line_no_t>{1});

    CHECK(li.catch_up(*lines, *lb).unwrap() == 0);

    append_file(path, "FATAL d\n");
    REQUIRE(lines->sync().isOk());
    CHECK(li.catch_up(*lines, *lb).unwrap() == 1);
    CHECK(li.level_at(6) == LEVEL_FATAL);
}
