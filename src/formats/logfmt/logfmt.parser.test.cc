/**
 * Copyright (c) 2021, Timothy Stack
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
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON
 * ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file logfmt.parser.test.cc
 */

#include <string>
#include <vector>

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "logfmt.parser.hh"

namespace {

/**
 * Run the parser over a line and describe each step: "key=value" for pairs,
 * "[word]" for bare words and "!offset:message" for errors.
 */
std::vector<std::string>
steps(const char* line)
{
    std::vector<std::string> retval;
    logfmt::parser p(string_fragment::from_c_str(line));
    auto done = false;

    while (!done) {
        p.step().match(
            [&done](const logfmt::parser::end_of_input&) { done = true; },
            [&retval](const logfmt::parser::kvpair& kvp) {
                retval.emplace_back(kvp.first.to_string() + "="
                                    + logfmt::to_string(kvp.second));
            },
            [&retval](const logfmt::parser::bare_word& bw) {
                retval.emplace_back("[" + bw.bw_value.to_string() + "]");
            },
            [&retval, &done](const logfmt::parser::error& err) {
                retval.emplace_back("!" + std::to_string(err.e_offset) + ":"
                                    + err.e_msg);
                done = true;
            });
    }

    return retval;
}

}  // namespace

TEST_CASE("key value pairs")
{
    CHECK(steps(R"(level=info svc=api latency=12 msg="request done")")
          == std::vector<std::string>{
              "level=info",
              "svc=api",
              "latency=12",
              "msg=request done",
          });
}

TEST_CASE("empty values")
{
    CHECK(steps("a= b=2 c=")
          == std::vector<std::string>{"a=", "b=2", "c="});
}

TEST_CASE("quoted values keep their quotes in the raw token")
{
    logfmt::parser p("msg=\"disk full\" code=7"_frag);
    auto first = p.step();

    REQUIRE(first.is<logfmt::parser::kvpair>());

    const auto& value = first.get<logfmt::parser::kvpair>().second;
    REQUIRE(value.is<logfmt::parser::quoted_value>());
    CHECK(value.get<logfmt::parser::quoted_value>().qv_value
          == "\"disk full\"");

    auto second = p.step();
    REQUIRE(second.is<logfmt::parser::kvpair>());
    CHECK(second.get<logfmt::parser::kvpair>()
              .second.get<logfmt::parser::unquoted_value>()
              .uv_value
          == "7");
}

TEST_CASE("escapes in quoted values")
{
    CHECK(steps(R"(msg="say \"hi\"\tnow" path="C:\\tmp")")
          == std::vector<std::string>{
              "msg=say \"hi\"\tnow",
              "path=C:\\tmp",
          });
}

TEST_CASE("bare words are reported and skipped")
{
    CHECK(steps("2024-01-01T00:00:00Z INFO level=info msg=started")
          == std::vector<std::string>{
              "[2024-01-01T00:00:00Z]",
              "[INFO]",
              "level=info",
              "msg=started",
          });
}

TEST_CASE("errors")
{
    CHECK(steps(R"(ok=1 abc="12 2)")
          == std::vector<std::string>{"ok=1", "!9:non-terminated string"});
}

TEST_CASE("blank input")
{
    CHECK(steps("").empty());
    CHECK(steps("   ").empty());
}
