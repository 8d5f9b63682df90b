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

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "filter_engine.hh"
#include "level_index.hh"
#include "line_index.hh"
#include "match_predicate.hh"
#include "test_support.hh"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace loupe;
using namespace std::chrono_literals;

namespace {

/**
 * A file with its line and level indexes, kept up to date the way
 * log_source does it.
 */
struct indexed_file {
    explicit indexed_file(const std::string& content)
        : if_path(if_dir / "test.log")
    {
        write_file(this->if_path, content);
        this->if_lines = line_index::open(this->if_path).unwrap();
        this->if_buffer = this->if_lines->create_buffer();

        auto catch_res = this->if_levels->catch_up(*this->if_lines,
                                                   *this->if_buffer);
        REQUIRE(catch_res.isOk());
    }

    void append(const std::string& content)
    {
        append_file(this->if_path, content);
        this->sync();
    }

    void sync()
    {
        auto sync_res = this->if_lines->sync();
        REQUIRE(sync_res.isOk());

        auto res = sync_res.unwrap();
        REQUIRE(res.is<line_index::appended>());

        const auto& app = res.get<line_index::appended>();
        if (app.a_first_line < this->if_levels->size()) {
            this->if_levels->truncate(app.a_first_line);
        }

        auto catch_res = this->if_levels->catch_up(*this->if_lines,
                                                   *this->if_buffer);
        REQUIRE(catch_res.isOk());
    }

    void finalize()
    {
        REQUIRE(this->if_lines->finalize());

        auto catch_res = this->if_levels->catch_up(*this->if_lines,
                                                   *this->if_buffer);
        REQUIRE(catch_res.isOk());
    }

    std::shared_ptr<filter_job> make_job(match_predicate pred,
                                         const engine_config& cfg = {}) const
    {
        return std::make_shared<filter_job>(
            std::move(pred), this->if_lines, this->if_levels, cfg);
    }

    temp_dir if_dir;
    std::filesystem::path if_path;
    std::shared_ptr<line_index> if_lines;
    std::shared_ptr<level_index> if_levels{std::make_shared<level_index>()};
    std::unique_ptr<line_buffer> if_buffer;
};

match_predicate
spec(const char* str)
{
    return parse_predicate_spec(string_fragment::from_c_str(str)).unwrap();
}

filter_result
wait_result(filter_job& job)
{
    REQUIRE(job.wait_for(10s));

    return job.poll();
}

filter_result
run_filter(const indexed_file& idx,
           match_predicate pred,
           const engine_config& cfg = {})
{
    auto job = idx.make_job(std::move(pred), cfg);

    job->start();
    return wait_result(*job);
}

std::vector<line_no_t>
to_vector(const line_bitmap& bm)
{
    return std::vector<line_no_t>(bm.begin(), bm.end());
}

std::string
mixed_levels(size_t count)
{
    static const char* const LINES[] = {
        "INFO service started\n",
        "ERROR connection refused\n",
        "{\"level\":\"error\",\"msg\":\"timeout\"}\n",
        "level=warn msg=\"slow disk\"\n",
        "DEBUG cache hit\n",
        "{\"severity\":\"error\",\"msg\":\"no level field\"}\n",
        "\n",
        "an error without a level keyword up front is still an error\n",
    };
    std::string retval;

    for (size_t lpc = 0; lpc < count; lpc++) {
        retval.append(LINES[lpc % (sizeof(LINES) / sizeof(LINES[0]))]);
    }

    return retval;
}

}  // namespace

TEST_CASE("job_state_name")
{
    CHECK(std::string(job_state_name(job_state::pending)) == "pending");
    CHECK(std::string(job_state_name(job_state::superseded)) == "superseded");
    CHECK_FALSE(is_finished(job_state::running));
    CHECK(is_finished(job_state::cancelled));
}

TEST_CASE("plain filter")
{
    indexed_file idx("INFO start\nERROR fail\nINFO ok\n");

    auto res = run_filter(idx, match_predicate::plain("ERROR"));

    CHECK(res.fr_state == job_state::done);
    CHECK(res.fr_complete);
    CHECK(res.fr_scanned == 3);
    CHECK(to_vector(res.fr_matched) == std::vector<line_no_t>{1});
    CHECK_FALSE(res.fr_error.has_value());
    CHECK_FALSE(res.fr_aggregation.has_value());
}

TEST_CASE("empty file")
{
    indexed_file idx("");

    auto res = run_filter(idx, match_predicate::plain("x"));

    CHECK(res.fr_state == job_state::done);
    CHECK(res.fr_complete);
    CHECK(res.fr_scanned == 0);
    CHECK(res.fr_matched.empty());
}

TEST_CASE("small batches give the same result")
{
    indexed_file idx(mixed_levels(1000));
    engine_config small;

    small.ec_batch_size = 3;
    small.ec_batch_time = 0ms;

    auto big = run_filter(idx, spec("/error/i"));
    auto batched = run_filter(idx, spec("/error/i"), small);

    CHECK(big.fr_scanned == 1000);
    CHECK(batched.fr_scanned == 1000);
    CHECK(to_vector(big.fr_matched) == to_vector(batched.fr_matched));
    // 4 of every 8 lines mention an error
    CHECK(big.fr_matched.size() == 500);
}

TEST_CASE("results are deterministic")
{
    indexed_file idx(mixed_levels(500));

    auto first = run_filter(idx, spec("query:json | level == error"));
    auto second = run_filter(idx, spec("query:json | level == error"));

    CHECK(to_vector(first.fr_matched) == to_vector(second.fr_matched));
    CHECK(first.fr_parse_failures == second.fr_parse_failures);
}

TEST_CASE("the level shortcut does not change the result")
{
    indexed_file idx(mixed_levels(800));
    engine_config cfg;

    cfg.ec_batch_size = 64;

    auto level_pred = spec("query:level == error");
    auto severity_pred = spec("query:severity == error");

    REQUIRE(level_pred.bitmap_shortcut() == LEVEL_ERROR);
    REQUIRE_FALSE(severity_pred.bitmap_shortcut().has_value());

    auto with_shortcut = run_filter(idx, level_pred, cfg);
    auto without = run_filter(idx, severity_pred, cfg);

    CHECK(with_shortcut.fr_scanned == 800);
    CHECK(with_shortcut.fr_complete);
    CHECK(to_vector(with_shortcut.fr_matched) == to_vector(without.fr_matched));
    CHECK(to_vector(with_shortcut.fr_matched)
          == to_vector(idx.if_levels->bitmap_for(LEVEL_ERROR)));

    auto json_shortcut = run_filter(idx, spec("query:json | level == error"));
    auto json_regex
        = run_filter(idx, spec(R"(query:json | level =~ "^error$")"));

    CHECK(to_vector(json_shortcut.fr_matched)
          == to_vector(json_regex.fr_matched));
    CHECK(json_shortcut.fr_matched.size() == 100);
}

TEST_CASE("parse failures and decode errors")
{
    indexed_file idx(
        "{\"a\":1}\n"
        "text\n"
        "{bad\n"
        "\n"
        "{\"a\":2,\"b\":\"\xff"
        "\"}\n");

    auto res = run_filter(idx, spec("query:json | a >= 1"));

    CHECK(to_vector(res.fr_matched) == std::vector<line_no_t>{0, 4});
    CHECK(res.fr_parse_failures == 3);
    CHECK(res.fr_decode_errors == 1);

    auto plain = run_filter(idx, match_predicate::plain("a"));
    CHECK(plain.fr_parse_failures == 0);
    CHECK(plain.fr_decode_errors == 1);
}

TEST_CASE("aggregation")
{
    indexed_file idx(
        "{\"level\":\"error\",\"service\":\"api\"}\n"
        "{\"level\":\"info\",\"service\":\"api\"}\n"
        "{\"level\":\"error\",\"service\":\"db\"}\n"
        "{\"level\":\"error\",\"service\":\"api\"}\n");

    auto res = run_filter(
        idx, spec("query:json | level == error | count by (service)"));

    REQUIRE(res.fr_aggregation.has_value());

    const auto& agg = res.fr_aggregation.value();
    REQUIRE(agg.ar_groups.size() == 2);
    CHECK(agg.ar_groups[0].ag_key == std::vector<std::string>{"api"});
    CHECK(agg.ar_groups[0].ag_count == 2);
    CHECK(agg.ar_groups[1].ag_key == std::vector<std::string>{"db"});
    CHECK(agg.ar_total_matches == 3);
    CHECK(res.fr_matched.size() == 3);
}

TEST_CASE("cancel")
{
    indexed_file idx(mixed_levels(100));

    SUBCASE("before the scan starts")
    {
        auto job = idx.make_job(match_predicate::plain("error"));

        CHECK(job->get_state() == job_state::pending);
        job->cancel();
        job->start();

        auto res = wait_result(*job);
        CHECK(res.fr_state == job_state::cancelled);
        CHECK_FALSE(res.fr_complete);
        CHECK_FALSE(job->take_checkpoint().has_value());
    }

    SUBCASE("superseded")
    {
        auto job = idx.make_job(match_predicate::plain("error"));

        job->supersede();
        job->start();
        CHECK(wait_result(*job).fr_state == job_state::superseded);
    }

    SUBCASE("while running")
    {
        indexed_file big(mixed_levels(200000));
        engine_config cfg;

        cfg.ec_batch_size = 1;

        auto job = big.make_job(spec("/e.*r/"), cfg);

        job->start();
        job->cancel();

        auto res = wait_result(*job);
        CHECK(is_finished(res.fr_state));
        if (res.fr_state == job_state::cancelled) {
            CHECK_FALSE(res.fr_complete);
        }
        // a finished job ignores later cancellations
        job->cancel();
        CHECK(job->get_state() == res.fr_state);
    }
}

TEST_CASE("resume from a checkpoint")
{
    indexed_file idx(mixed_levels(16));
    auto job = idx.make_job(spec("query:level == error | count by (level)"));

    job->start();

    auto first = wait_result(*job);
    CHECK(first.fr_scanned == 16);

    auto cp = job->take_checkpoint();
    REQUIRE(cp.has_value());
    CHECK(cp->c_cursor == 16);
    CHECK(job->final_generation() == std::nullopt);

    idx.append(mixed_levels(8));

    auto next = idx.make_job(job->get_predicate());
    next->start(std::move(cp));

    auto second = wait_result(*next);
    auto fresh = run_filter(idx, job->get_predicate());

    CHECK(second.fr_scanned == 24);
    CHECK(to_vector(second.fr_matched) == to_vector(fresh.fr_matched));
    REQUIRE(second.fr_aggregation.has_value());
    REQUIRE(fresh.fr_aggregation.has_value());
    CHECK(second.fr_aggregation->ar_total_matches
          == fresh.fr_aggregation->ar_total_matches);
    CHECK(second.fr_aggregation->ar_groups[0].ag_count
          == fresh.fr_aggregation->ar_groups[0].ag_count);
}

TEST_CASE("rewind after a reopened partial line")
{
    indexed_file idx("ERROR a\nb");

    idx.finalize();
    REQUIRE(idx.if_levels->size() == 2);

    auto job = idx.make_job(spec("query:level == error"));
    job->start();
    CHECK(to_vector(wait_result(*job).fr_matched)
          == std::vector<line_no_t>{0});

    auto cp = job->take_checkpoint();
    REQUIRE(cp.has_value());

    // line 1 becomes an error once the rest of it is written
    idx.append("ad ERROR\nERROR c\n");
    REQUIRE(idx.if_levels->size() == 3);
    CHECK(idx.if_levels->rewind_point(cp->c_generation) == 1);

    auto next = idx.make_job(job->get_predicate());
    next->start(std::move(cp));

    auto res = wait_result(*next);
    CHECK(res.fr_scanned == 3);
    CHECK(to_vector(res.fr_matched) == std::vector<line_no_t>{0, 1, 2});
}

TEST_CASE("structured queries skip lines in other formats")
{
    indexed_file idx(
        "{\"level\":\"error\",\"service\":\"api\"}\n"
        "hello plain text\n"
        "{\"level\":\"info\",\"service\":\"db\"}\n"
        "level=warn service=api\n"
        "\n"
        "{\"service\":\"api\"}\n");

    auto grouped = run_filter(idx, spec("query:json | count by (service)"));

    CHECK(to_vector(grouped.fr_matched) == std::vector<line_no_t>{0, 2, 5});
    CHECK(grouped.fr_parse_failures == 3);
    REQUIRE(grouped.fr_aggregation.has_value());

    const auto& agg = grouped.fr_aggregation.value();
    REQUIRE(agg.ar_groups.size() == 2);
    CHECK(agg.ar_groups[0].ag_key == std::vector<std::string>{"api"});
    CHECK(agg.ar_groups[0].ag_count == 2);
    CHECK(agg.ar_groups[1].ag_key == std::vector<std::string>{"db"});
    CHECK(agg.ar_total_matches == 3);

    auto bare = run_filter(idx, spec("query:json"));
    CHECK(to_vector(bare.fr_matched) == std::vector<line_no_t>{0, 2, 5});

    auto excluded = run_filter(
        idx,
        spec(R"({"format": "json",
                 "exclude": [{"field": "service", "pattern": "db"}]})"));
    CHECK(to_vector(excluded.fr_matched) == std::vector<line_no_t>{0, 5});

    auto logfmt = run_filter(idx, spec("query:logfmt"));
    CHECK(to_vector(logfmt.fr_matched) == std::vector<line_no_t>{3});
}

TEST_CASE("a zero batch size still scans every line")
{
    indexed_file idx(mixed_levels(40));
    engine_config cfg;

    cfg.ec_batch_size = 0;

    auto res = run_filter(idx, spec("/error/i"), cfg);

    CHECK(res.fr_state == job_state::done);
    CHECK(res.fr_complete);
    CHECK(res.fr_scanned == 40);
    CHECK(res.fr_matched.size() == 20);
}

TEST_CASE("polled results share the published matches")
{
    indexed_file idx(mixed_levels(20000));
    auto job = idx.make_job(spec("/error/i"));

    job->start();

    auto first = wait_result(*job);
    auto second = job->poll();

    REQUIRE(first.fr_matched.size() == 10000);
    REQUIRE(first.fr_matched.chunk_count() > 0);
    CHECK(&first.fr_matched[0] == &second.fr_matched[0]);
    CHECK(first.fr_matched == second.fr_matched);
}

TEST_CASE("a read failure ends the job with an error")
{
    indexed_file idx(mixed_levels(100));

    // the file shrinks behind the index's back
    write_file(idx.if_path, "");

    auto res = run_filter(idx, match_predicate::plain("error"));

    CHECK(res.fr_state == job_state::done);
    REQUIRE(res.fr_error.has_value());
    CHECK(res.fr_error->ie_path == idx.if_path);
    CHECK_FALSE(res.fr_complete);
    CHECK(res.fr_scanned == 0);
    CHECK(res.fr_matched.empty());

    auto job = idx.make_job(match_predicate::plain("error"));
    job->start();
    wait_result(*job);
    // a failed job cannot be resumed
    CHECK_FALSE(job->take_checkpoint().has_value());
}
