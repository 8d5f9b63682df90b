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
 * @file fs_util.tests.cc
 */

#include <filesystem>
#include <fstream>

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include "base/fs_util.hh"

#include "config.h"
#include "doctest/doctest.h"

namespace {

std::filesystem::path
make_temp_file(const std::string& content)
{
    auto tmpl = (std::filesystem::temp_directory_path() / "fs_util.XXXXXX")
                    .string();
    auto fd = mkstemp(tmpl.data());

    if (fd != -1) {
        auto rc = write(fd, content.data(), content.size());
        (void) rc;
        close(fd);
    }

    return tmpl;
}

}  // namespace

TEST_CASE("fs_util::open_file")
{
    auto path = make_temp_file("hello\n");

    {
        auto open_res = loupe::filesystem::open_file(path, O_RDONLY);

        REQUIRE(open_res.isOk());
        CHECK(open_res.unwrap().get() != -1);
    }

    std::filesystem::remove(path);

    auto missing_res = loupe::filesystem::open_file(path, O_RDONLY);
    REQUIRE(missing_res.isErr());

    auto err = missing_res.unwrapErr();
    CHECK(err.ie_errno == ENOENT);
    CHECK(err.ie_path == path);
    CHECK(err.to_string().find("open failed") != std::string::npos);
}

TEST_CASE("fs_util::stat_file")
{
    auto path = make_temp_file("0123456789");

    auto stat_res = loupe::filesystem::stat_file(path);
    REQUIRE(stat_res.isOk());
    CHECK(stat_res.unwrap().st_size == 10);

    std::filesystem::remove(path);
    CHECK(loupe::filesystem::stat_file(path).isErr());
}

TEST_CASE("fs_util::pread_fully")
{
    auto path = make_temp_file("abcdefghij");
    auto open_res = loupe::filesystem::open_file(path, O_RDONLY);

    REQUIRE(open_res.isOk());

    auto fd = open_res.unwrap();
    char buf[32];

    SUBCASE("middle")
    {
        auto read_res
            = loupe::filesystem::pread_fully(path, fd.get(), buf, 3, 2);

        REQUIRE(read_res.isOk());
        CHECK(read_res.unwrap() == 3);
        CHECK(std::string(buf, 3) == "cde");
    }

    SUBCASE("short read at the end")
    {
        auto read_res = loupe::filesystem::pread_fully(
            path, fd.get(), buf, sizeof(buf), 7);

        REQUIRE(read_res.isOk());
        CHECK(read_res.unwrap() == 3);
        CHECK(std::string(buf, 3) == "hij");
    }

    SUBCASE("past the end")
    {
        auto read_res = loupe::filesystem::pread_fully(
            path, fd.get(), buf, sizeof(buf), 100);

        REQUIRE(read_res.isOk());
        CHECK(read_res.unwrap() == 0);
    }

    SUBCASE("bad descriptor")
    {
        auto read_res
            = loupe::filesystem::pread_fully(path, -1, buf, sizeof(buf), 0);

        REQUIRE(read_res.isErr());
        CHECK(read_res.unwrapErr().ie_errno == EBADF);
    }

    std::filesystem::remove(path);
}
