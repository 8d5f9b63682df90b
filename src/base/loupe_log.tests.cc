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
 * @file loupe_log.tests.cc
 */

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include "base/loupe_log.hh"
#include "doctest/doctest.h"

namespace {

struct log_level_guard {
    explicit log_level_guard(loupe_log_level_t level)
        : llg_saved(loupe_log_level)
    {
        loupe_log_level = level;
    }

    ~log_level_guard() { loupe_log_level = this->llg_saved; }

    loupe_log_level_t llg_saved;
};

}  // namespace

TEST_CASE("log_msg level filtering")
{
    log_level_guard guard(loupe_log_level_t::INFO);

    log_debug("this debug message is hidden");
    log_info("shown message %d", 42);
    log_error("shown error %s", "disk full");

    auto contents = log_ring_contents();

    CHECK(contents.find("this debug message is hidden") == std::string::npos);
    CHECK(contents.find(" I t") != std::string::npos);
    CHECK(contents.find("loupe_log.tests.cc:") != std::string::npos);
    CHECK(contents.find("shown message 42\n") != std::string::npos);
    CHECK(contents.find("shown error disk full\n") != std::string::npos);
}

TEST_CASE("log ring keeps whole recent lines")
{
    log_level_guard guard(loupe_log_level_t::TRACE);
    std::string filler(200, 'x');

    for (int lpc = 0; lpc < 2000; lpc++) {
        log_trace("filler %d %s", lpc, filler.c_str());
    }

    auto contents = log_ring_contents();

    CHECK(contents.size() <= 128 * 1024);
    CHECK(contents.size() > 100 * 1024);
    // the oldest line was dropped whole, so the ring starts with a timestamp
    CHECK(contents[0] == '2');
    CHECK(contents.back() == '\n');
    CHECK(contents.find("filler 1999 ") != std::string::npos);
    CHECK(contents.find("filler 0 ") == std::string::npos);

    auto* tmp = tmpfile();
    REQUIRE(tmp != nullptr);
    log_write_ring_to(fileno(tmp));
    CHECK(lseek(fileno(tmp), 0, SEEK_CUR) == (off_t) contents.size());
    fclose(tmp);
}

TEST_CASE("long messages are cut")
{
    log_level_guard guard(loupe_log_level_t::TRACE);
    std::string huge(8 * 1024, 'y');

    log_warning("huge %s", huge.c_str());

    auto contents = log_ring_contents();
    auto pos = contents.rfind(" W t");

    REQUIRE(pos != std::string::npos);

    auto eol = contents.find('\n', pos);
    REQUIRE(eol != std::string::npos);
    CHECK(eol - pos < 2 * 1024);
}

TEST_CASE("log_init_from_env")
{
    char path[] = "/tmp/loupe_log.XXXXXX";
    auto fd = mkstemp(path);
    REQUIRE(fd != -1);
    close(fd);

    unsetenv("LOUPE_LOG_PATH");
    CHECK_FALSE(log_init_from_env());

    setenv("LOUPE_LOG_PATH", path, 1);
    REQUIRE(log_init_from_env());
    log_error("written to the file");
    unsetenv("LOUPE_LOG_PATH");

    auto* file = loupe_log_file.value();
    loupe_log_file = std::nullopt;
    fclose(file);

    auto* in = fopen(path, "r");
    REQUIRE(in != nullptr);
    std::string contents;
    char buf[1024];
    size_t rc;
    while ((rc = fread(buf, 1, sizeof(buf), in)) > 0) {
        contents.append(buf, rc);
    }
    fclose(in);
    unlink(path);

    CHECK(contents.find("started logging to") != std::string::npos);
    CHECK(contents.find(" E t") != std::string::npos);
    CHECK(contents.find("written to the file\n") != std::string::npos);
}
