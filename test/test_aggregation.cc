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

#include "aggregation.hh"
#include "config.h"
#include "line_flags.hh"
#include "query.eval.hh"
#include "query.parser.hh"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace loupe;

namespace {

using group_key = std::vector<std::string>;

/**
 * Run the lines through a compiled query and feed the matches to an
 * aggregator, the same way a filter job does.
 */
aggregation_result
aggregate(const char* query_text,
          const std::vector<const char*>& lines,
          size_t max_groups = 10000)
{
    auto ast = query::parse_query(string_fragment::from_c_str(query_text))
                   .unwrap();
    auto cq = query::compiled_query::compile(ast).unwrap();
    aggregator agg(ast.qa_aggregate.value(), ast.qa_format, max_groups);

    for (size_t lpc = 0; lpc < lines.size(); lpc++) {
        auto sf = string_fragment::from_c_str(lines[lpc]);
        auto lf = cq->extract(sf, classify_line(sf));

        if (cq->matches(lf)) {
            agg.feed(lpc, lf);
        }
    }

    return agg.snapshot();
}

query::line_fields
fields(std::initializer_list<std::pair<const std::string, std::string>> kv)
{
    query::line_fields retval;

    retval.lf_fields = kv;
    return retval;
}

query::aggregate_clause
count_by(std::vector<std::string> fields,
         std::optional<size_t> limit = std::nullopt)
{
    return query::aggregate_clause{std::move(fields), limit};
}

}  // namespace

TEST_CASE("count errors by service")
{
    auto res = aggregate(R"(json | level == "error" | count by (service))",
                         {
                             R"({"level":"error","service":"api"})",
                             R"({"level":"info","service":"api"})",
                             R"({"level":"error","service":"api"})",
                             R"({"level":"error","service":"api"})",
                         });

    CHECK(res.ar_fields == group_key{"service"});
    REQUIRE(res.ar_groups.size() == 1);
    CHECK(res.ar_groups[0].ag_key == group_key{"api"});
    CHECK(res.ar_groups[0].ag_count == 3);
    CHECK(res.ar_total_matches == 3);
    CHECK_FALSE(res.ar_overflowed);

    std::vector<line_no_t> lines(res.ar_groups[0].ag_lines.begin(),
                                 res.ar_groups[0].ag_lines.end());
    CHECK(lines == std::vector<line_no_t>{0, 2, 3});
}

TEST_CASE("groups are ordered by count then first appearance")
{
    auto res = aggregate("logfmt | count by (svc)",
                         {
                             "svc=b",
                             "svc=a",
                             "svc=c",
                             "svc=a",
                             "svc=c",
                             "svc=d",
                         });

    REQUIRE(res.ar_groups.size() == 4);
    CHECK(res.ar_groups[0].ag_key == group_key{"a"});
    CHECK(res.ar_groups[1].ag_key == group_key{"c"});
    CHECK(res.ar_groups[2].ag_key == group_key{"b"});
    CHECK(res.ar_groups[3].ag_key == group_key{"d"});
    CHECK(res.ar_total_matches == 6);
}

TEST_CASE("top N")
{
    auto res = aggregate("logfmt | count by (svc) | top 2",
                         {
                             "svc=b",
                             "svc=a",
                             "svc=c",
                             "svc=a",
                         });

    REQUIRE(res.ar_groups.size() == 2);
    CHECK(res.ar_groups[0].ag_key == group_key{"a"});
    CHECK(res.ar_groups[1].ag_key == group_key{"b"});
    // the limit only affects what is reported
    CHECK(res.ar_total_matches == 4);
    CHECK_FALSE(res.ar_overflowed);
}

TEST_CASE("multiple group fields and placeholders")
{
    auto res = aggregate("json | count by (service, level)",
                         {
                             R"({"service":"api","level":"error"})",
                             R"({"service":"api"})",
                             R"({"service":"api","level":"error"})",
                             "{not json",
                             "plain text",
                         });

    // lines that are not JSON objects do not match, so they get no group
    REQUIRE(res.ar_groups.size() == 2);
    CHECK(res.ar_groups[0].ag_key == group_key{"api", "error"});
    CHECK(res.ar_groups[0].ag_count == 2);
    CHECK(res.ar_groups[1].ag_key == group_key{"api", GROUP_VALUE_MISSING});
    CHECK(res.ar_groups[1].ag_count == 1);
    CHECK(res.ar_total_matches == 3);
}

TEST_CASE("plain queries group everything together")
{
    auto res = aggregate("line contains x | count by (line)",
                         {"x1", "x2", "y", "x3"});

    REQUIRE(res.ar_groups.size() == 1);
    CHECK(res.ar_groups[0].ag_key == group_key{GROUP_VALUE_RAW});
    CHECK(res.ar_groups[0].ag_count == 3);
}

TEST_CASE("eviction of rare groups")
{
    aggregator agg(count_by({"k"}), query::source_format::json, 3);

    agg.feed(0, fields({{"k", "a"}}));
    agg.feed(1, fields({{"k", "a"}}));
    agg.feed(2, fields({{"k", "b"}}));
    agg.feed(3, fields({{"k", "c"}}));
    CHECK(agg.group_count() == 3);
    // "b" and "c" are tied for least frequent, the newer one goes
    agg.feed(4, fields({{"k", "d"}}));
    CHECK(agg.group_count() == 3);

    auto res = agg.snapshot();
    REQUIRE(res.ar_groups.size() == 3);
    CHECK(res.ar_groups[0].ag_key == group_key{"a"});
    CHECK(res.ar_groups[0].ag_count == 2);
    CHECK(res.ar_groups[1].ag_key == group_key{"b"});
    CHECK(res.ar_groups[2].ag_key == group_key{"d"});
    CHECK(res.ar_total_matches == 5);
    CHECK(res.ar_evicted_groups == 1);
    CHECK(res.ar_overflowed);

    // an evicted key comes back as a new group
    agg.feed(5, fields({{"k", "c"}}));
    res = agg.snapshot();
    CHECK(res.ar_evicted_groups == 2);
    CHECK(res.ar_groups.back().ag_key == group_key{"c"});
}

TEST_CASE("a zero group limit still keeps one group")
{
    aggregator agg(count_by({"k"}), query::source_format::json, 0);

    agg.feed(0, fields({{"k", "a"}}));
    agg.feed(1, fields({{"k", "a"}}));

    auto res = agg.snapshot();
    REQUIRE(res.ar_groups.size() == 1);
    CHECK(res.ar_groups[0].ag_count == 2);
    CHECK_FALSE(res.ar_overflowed);
}

TEST_CASE("truncate")
{
    aggregator agg(count_by({"k"}), query::source_format::logfmt, 100);

    agg.feed(1, fields({{"k", "a"}}));
    agg.feed(3, fields({{"k", "b"}}));
    agg.feed(5, fields({{"k", "a"}}));
    agg.feed(7, fields({{"k", "b"}}));
    agg.feed(8, fields({{"k", "c"}}));

    agg.truncate(5, 2);

    auto res = agg.snapshot();
    REQUIRE(res.ar_groups.size() == 2);
    CHECK(res.ar_groups[0].ag_key == group_key{"a"});
    CHECK(res.ar_groups[0].ag_count == 1);
    CHECK(res.ar_groups[1].ag_key == group_key{"b"});
    CHECK(res.ar_groups[1].ag_count == 1);
    CHECK(res.ar_total_matches == 2);

    // a group that was dropped starts over
    agg.feed(6, fields({{"k", "c"}}));
    agg.feed(7, fields({{"k", "b"}}));
    res = agg.snapshot();
    REQUIRE(res.ar_groups.size() == 3);
    CHECK(res.ar_groups[0].ag_key == group_key{"b"});
    CHECK(res.ar_groups[0].ag_count == 2);
    CHECK(res.ar_groups[2].ag_key == group_key{"c"});
    CHECK(res.ar_total_matches == 4);

    agg.clear();
    CHECK(agg.group_count() == 0);
    CHECK(agg.snapshot().ar_total_matches == 0);
}
