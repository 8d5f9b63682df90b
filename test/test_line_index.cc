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

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>

#include "base/fs_util.hh"
#include "config.h"
#include "line_buffer.hh"
#include "line_index.hh"
#include "test_support.hh"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace loupe;

namespace {

std::vector<std::string>
read_all(const line_index& li)
{
    std::vector<std::string> retval;
    auto lb = li.create_buffer();

    for (size_t lpc = 0; lpc < li.size(); lpc++) {
        auto read_res = li.read_line(*lb, lpc);

        REQUIRE(read_res.isOk());
        retval.emplace_back(read_res.unwrap().to_string());
    }

    return retval;
}

std::vector<file_range>
all_ranges(const line_index& li)
{
    std::vector<file_range> retval;

    for (size_t lpc = 0; lpc < li.size(); lpc++) {
        retval.emplace_back(li.line_at(lpc).value());
    }

    return retval;
}

line_index::appended
expect_appended(const Result<line_index::sync_result, io_error>& res)
{
    REQUIRE(res.isOk());

    auto sr = res.unwrap();
    REQUIRE(sr.is<line_index::appended>());

    return sr.get<line_index::appended>();
}

}  // namespace

TEST_CASE("line_buffer::scan_lines")
{
    temp_dir td;
    auto path = td / "scan.log";

    write_file(path, "one\r\ntwo\n\nthree");

    auto fd = filesystem::open_file(path, O_RDONLY).unwrap();
    line_buffer lb(4);
    std::vector<file_range> ranges;

    lb.set_fd(path, fd.get());

    auto scan_res = lb.scan_lines(
        0, 15, [&ranges](const file_range& fr) { ranges.push_back(fr); });

    REQUIRE(scan_res.isOk());
    CHECK(scan_res.unwrap() == 10);
    REQUIRE(ranges.size() == 3);
    CHECK(ranges[0].fr_offset == 0);
    CHECK(ranges[0].fr_size == 5);
    CHECK(ranges[0].fr_metadata.m_has_cr);
    CHECK(ranges[1].fr_offset == 5);
    CHECK(ranges[1].fr_size == 4);
    CHECK_FALSE(ranges[1].fr_metadata.m_has_cr);
    CHECK(ranges[2].fr_offset == 9);
    CHECK(ranges[2].fr_size == 1);

    auto read_res = lb.read_range(ranges[0]);
    REQUIRE(read_res.isOk());

    bool has_cr = false;
    auto text = line_buffer::trim_terminator(read_res.unwrap(), has_cr);
    CHECK(text.to_string() == "one");
    CHECK(has_cr);
}

TEST_CASE("line_buffer::scan_lines cr at a block boundary")
{
    temp_dir td;
    auto path = td / "cr.log";

    // the block size splits the "\r\n" terminator
    write_file(path, "abc\r\nd\n");

    auto fd = filesystem::open_file(path, O_RDONLY).unwrap();
    line_buffer lb(4);
    std::vector<file_range> ranges;

    lb.set_fd(path, fd.get());
    REQUIRE(lb.scan_lines(0, 7, [&ranges](const file_range& fr) {
                  ranges.push_back(fr);
              }).isOk());

    REQUIRE(ranges.size() == 2);
    CHECK(ranges[0].fr_size == 5);
    CHECK(ranges[0].fr_metadata.m_has_cr);
    CHECK_FALSE(ranges[1].fr_metadata.m_has_cr);
}

TEST_CASE("line_index::open")
{
    temp_dir td;

    SUBCASE("empty file")
    {
        auto path = td / "empty.log";

        write_file(path, "");

        auto li = line_index::open(path).unwrap();
        CHECK(li->size() == 0);
        CHECK(li->file_size() == 0);
        CHECK_FALSE(li->line_at(0).has_value());
    }

    SUBCASE("missing file")
    {
        auto open_res = line_index::open(td / "missing.log");

        REQUIRE(open_res.isErr());
        CHECK(open_res.unwrapErr().ie_errno == ENOENT);
    }

    SUBCASE("directory")
    {
        auto open_res = line_index::open(td.get_path());

        REQUIRE(open_res.isErr());
        CHECK(open_res.unwrapErr().ie_errno == EISDIR);
    }

    SUBCASE("lines")
    {
        auto path = td / "lines.log";

        write_file(path, "first\nsecond line\r\n\nlast");

        auto li = line_index::open(path).unwrap();
        CHECK(li->size() == 3);
        CHECK(li->partial_size() == 4);
        CHECK(li->max_line_length() == 11);
        CHECK(read_all(*li)
              == std::vector<std::string>{"first", "second line", ""});

        auto lb = li->create_buffer();
        bool has_cr = false;
        auto read_res = li->read_line(*lb, 1, &has_cr);
        REQUIRE(read_res.isOk());
        CHECK(has_cr);

        auto range_res = li->read_line(*lb, 3);
        REQUIRE(range_res.isErr());
        CHECK(range_res.unwrapErr().ie_errno == ERANGE);
    }
}

TEST_CASE("line_index::sync")
{
    temp_dir td;
    auto path = td / "app.log";

    write_file(path, numbered_lines("line", 0, 10));

    auto li = line_index::open(path).unwrap();
    REQUIRE(li->size() == 10);

    SUBCASE("unchanged file")
    {
        auto app = expect_appended(li->sync());

        CHECK(app == line_index::appended{10, 0});
        CHECK(li->size() == 10);

        auto again = expect_appended(li->sync());
        CHECK(again == line_index::appended{10, 0});
    }

    SUBCASE("appended lines")
    {
        append_file(path, numbered_lines("line", 10, 5));

        auto app = expect_appended(li->sync());
        CHECK(app == line_index::appended{10, 5});
        CHECK(li->size() == 15);
        CHECK(read_all(*li).back() == "line 14");
    }

    SUBCASE("partial line is not counted until it is terminated")
    {
        append_file(path, "line 1");

        auto app1 = expect_appended(li->sync());
        CHECK(app1 == line_index::appended{10, 0});
        CHECK(li->size() == 10);
        CHECK(li->partial_size() == 6);

        append_file(path, "0\n");

        auto app2 = expect_appended(li->sync());
        CHECK(app2 == line_index::appended{10, 1});
        CHECK(read_all(*li).back() == "line 10");
    }

    SUBCASE("finalized partial line is reopened")
    {
        append_file(path, "tail");

        expect_appended(li->sync());
        CHECK(li->finalize());
        CHECK(li->is_finalized());
        CHECK_FALSE(li->finalize());
        CHECK(li->size() == 11);
        CHECK(read_all(*li).back() == "tail");

        append_file(path, "ing\nnext\n");

        auto app = expect_appended(li->sync());
        CHECK(app == line_index::appended{10, 2});
        CHECK_FALSE(li->is_finalized());
        CHECK(li->size() == 12);

        auto lines = read_all(*li);
        CHECK(lines[10] == "tailing");
        CHECK(lines[11] == "next");
    }

    SUBCASE("shrunk file")
    {
        write_file(path, "short\n");

        auto sync_res = li->sync();
        REQUIRE(sync_res.isOk());

        auto sr = sync_res.unwrap();
        REQUIRE(sr.is<line_index::truncated>());
        CHECK(sr.get<line_index::truncated>().t_reason == "file shrank");
        CHECK(li->size() == 10);
    }

    SUBCASE("replaced file")
    {
        auto new_path = td / "app.log.new";

        write_file(new_path, numbered_lines("line", 0, 20));
        REQUIRE(rename(new_path.c_str(), path.c_str()) == 0);

        auto sr = li->sync().unwrap();
        REQUIRE(sr.is<line_index::truncated>());
        CHECK(sr.get<line_index::truncated>().t_reason == "file was replaced");
    }

    SUBCASE("rewritten leading bytes")
    {
        auto content = numbered_lines("LINE", 0, 10);

        content.append("more\n");
        write_file(path, content);

        auto sr = li->sync().unwrap();
        REQUIRE(sr.is<line_index::truncated>());
        CHECK(sr.get<line_index::truncated>().t_reason
              == "leading bytes changed");
    }
}

TEST_CASE("line_index incremental equals full scan")
{
    temp_dir td;
    auto path = td / "grow.log";
    engine_config cfg;

    cfg.ec_read_block_size = 7;
    write_file(path, "");

    auto incremental = line_index::open(path, cfg).unwrap();
    std::string content;

    for (size_t lpc = 0; lpc < 50; lpc++) {
        auto chunk = std::string(lpc % 13, 'x') + (lpc % 3 == 0 ? "\r\n" : "\n");

        if (lpc % 4 == 1) {
            // split the line across two syncs
            auto half = chunk.size() / 2;

            append_file(path, chunk.substr(0, half));
            expect_appended(incremental->sync());
            append_file(path, chunk.substr(half));
        } else {
            append_file(path, chunk);
        }
        content.append(chunk);
        expect_appended(incremental->sync());
    }

    auto full = line_index::open(path, cfg).unwrap();

    CHECK(incremental->size() == 50);
    CHECK(full->size() == 50);
    CHECK(all_ranges(*incremental) == all_ranges(*full));
    CHECK(read_all(*incremental) == read_all(*full));
    CHECK(incremental->max_line_length() == full->max_line_length());
    CHECK(incremental->file_size() == content.size());
}
