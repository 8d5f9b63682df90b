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
 *
 * @file filter_engine.cc
 */

#include <algorithm>

#include "filter_engine.hh"

#include "base/loupe_log.hh"
#include "config.h"
#include "line_flags.hh"

namespace loupe {

std::atomic<uint64_t> filter_job::NEXT_ID{1};

const char*
job_state_name(job_state st)
{
    switch (st) {
        case job_state::pending:
            return "pending";
        case job_state::running:
            return "running";
        case job_state::done:
            return "done";
        case job_state::cancelled:
            return "cancelled";
        case job_state::superseded:
            return "superseded";
    }

    return "unknown";
}

filter_job::filter_job(match_predicate pred,
                       std::shared_ptr<const line_index> lines,
                       std::shared_ptr<const level_index> levels,
                       const engine_config& cfg)
    : fj_id(NEXT_ID++), fj_predicate(std::move(pred)),
      fj_lines(std::move(lines)), fj_levels(std::move(levels)),
      fj_config(cfg), fj_channel(std::make_shared<result_channel>())
{
}

filter_job::~filter_job()
{
    this->fj_cancel = true;
    this->fj_channel.reset();
    if (this->fj_thread.joinable()) {
        this->fj_thread.join();
    }
}

void
filter_job::start(std::optional<checkpoint> resume)
{
    require(!this->fj_thread.joinable());

    checkpoint cp;

    if (resume) {
        cp = std::move(resume.value());
        log_info("job %llu: resuming filter %s at line %u",
                 (unsigned long long) this->fj_id,
                 this->fj_predicate.to_string().c_str(),
                 cp.c_cursor);
    } else {
        const auto* cq = this->fj_predicate.get_query();

        cp.c_generation = this->fj_levels->generation();
        if (cq != nullptr && cq->get_ast().qa_aggregate) {
            cp.c_aggregator.emplace(cq->get_ast().qa_aggregate.value(),
                                    cq->get_format(),
                                    this->fj_config.ec_max_group_count);
        }
        log_info("job %llu: starting filter %s on %s",
                 (unsigned long long) this->fj_id,
                 this->fj_predicate.to_string().c_str(),
                 this->fj_lines->get_path().c_str());
    }

    {
        auto initial = std::make_shared<const filter_result>(
            this->to_result(cp, job_state::pending));
        safe::WriteAccess<safe_channel_state> state(this->fj_channel->rc_state);

        state->cs_latest = std::move(initial);
    }

    this->fj_thread = std::thread(&filter_job::run,
                                  this,
                                  std::weak_ptr<result_channel>(this->fj_channel),
                                  std::move(cp));
}

void
filter_job::cancel()
{
    this->fj_cancel = true;

    safe::WriteAccess<safe_channel_state> state(this->fj_channel->rc_state);

    if (!is_finished(state->cs_state)) {
        state->cs_state = this->fj_superseded ? job_state::superseded
                                              : job_state::cancelled;
        log_info("job %llu: %s",
                 (unsigned long long) this->fj_id,
                 job_state_name(state->cs_state));
    }
    this->fj_channel->rc_cond.notify_all();
}

void
filter_job::supersede()
{
    this->fj_superseded = true;
    this->cancel();
}

job_state
filter_job::get_state() const
{
    safe::ReadAccess<safe_channel_state> state(this->fj_channel->rc_state);

    return state->cs_state;
}

filter_result
filter_job::poll() const
{
    std::shared_ptr<const filter_result> latest;
    job_state st;

    {
        safe::ReadAccess<safe_channel_state> state(
            this->fj_channel->rc_state);

        latest = state->cs_latest;
        st = state->cs_state;
    }

    // the copy shares the full chunks of the match bitmaps with the snapshot
    auto retval = *latest;

    retval.fr_state = st;

    return retval;
}

bool
filter_job::wait_for(std::chrono::milliseconds timeout) const
{
    safe::WriteAccess<safe_channel_state, std::unique_lock> state(
        this->fj_channel->rc_state);

    return this->fj_channel->rc_cond.wait_for(
        state.lock, timeout, [&state]() {
            return is_finished(state->cs_state);
        });
}

std::optional<filter_job::checkpoint>
filter_job::take_checkpoint()
{
    safe::WriteAccess<safe_channel_state> state(this->fj_channel->rc_state);
    auto retval = std::move(state->cs_final);

    state->cs_final = std::nullopt;

    return retval;
}

std::optional<size_t>
filter_job::final_generation() const
{
    safe::ReadAccess<safe_channel_state> state(this->fj_channel->rc_state);

    if (!state->cs_final) {
        return std::nullopt;
    }

    return state->cs_final->c_generation;
}

filter_result
filter_job::to_result(const checkpoint& cp, job_state st) const
{
    filter_result retval;

    retval.fr_state = st;
    retval.fr_matched = cp.c_matched;
    retval.fr_scanned = cp.c_cursor;
    retval.fr_complete = st == job_state::done;
    retval.fr_decode_errors = cp.c_decode_errors;
    retval.fr_parse_failures = cp.c_parse_failures;
    if (cp.c_aggregator) {
        retval.fr_aggregation = cp.c_aggregator->snapshot();
    }

    return retval;
}

bool
filter_job::publish(const std::weak_ptr<result_channel>& weak_chan,
                    filter_result fr)
{
    auto chan = weak_chan.lock();

    if (!chan) {
        log_debug("job %llu: consumer is gone, stopping",
                  (unsigned long long) this->fj_id);
        this->fj_cancel = true;
        return false;
    }

    auto snapshot = std::make_shared<const filter_result>(std::move(fr));
    safe::WriteAccess<safe_channel_state> state(chan->rc_state);

    if (state->cs_state != job_state::running) {
        return false;
    }
    state->cs_latest = std::move(snapshot);

    return true;
}

void
filter_job::finish(const std::weak_ptr<result_channel>& weak_chan,
                   job_state st,
                   std::optional<filter_result> fr,
                   std::optional<checkpoint> cp)
{
    auto chan = weak_chan.lock();

    if (!chan) {
        return;
    }

    std::shared_ptr<const filter_result> snapshot;

    if (fr) {
        snapshot = std::make_shared<const filter_result>(std::move(fr.value()));
    }

    {
        safe::WriteAccess<safe_channel_state> state(chan->rc_state);

        if (!is_finished(state->cs_state)) {
            state->cs_state = st;
            if (snapshot) {
                state->cs_latest = std::move(snapshot);
            }
            state->cs_final = std::move(cp);
        }
    }
    chan->rc_cond.notify_all();
}

Result<bool, io_error>
filter_job::scan_line(line_buffer& lb,
                      line_no_t line,
                      line_flags_t flags,
                      checkpoint& cp,
                      std::string& scratch) const
{
    auto prefilter = this->fj_predicate.flags_prefilter();

    if ((flags & prefilter.first) != prefilter.second) {
        // only structured queries have a prefilter and lines that fail it
        // cannot be parsed in the query's format.
        cp.c_parse_failures += 1;
        return Ok(true);
    }

    auto fr = this->fj_lines->line_at(line);
    if (!fr) {
        return Ok(false);
    }

    auto bytes = TRY(lb.read_range(fr.value()));
    bool has_cr = false;
    auto raw = line_buffer::trim_terminator(bytes, has_cr);
    auto text = decode_line(raw, scratch, cp.c_decode_errors);
    auto mi = this->fj_predicate.evaluate(text, flags);

    if (mi.mi_parse_failed) {
        cp.c_parse_failures += 1;
    }
    if (mi.mi_matched) {
        cp.c_matched.append(line);
        if (cp.c_aggregator) {
            cp.c_aggregator->feed(line, mi.mi_fields);
        }
    }

    return Ok(true);
}

void
filter_job::run(std::weak_ptr<result_channel> weak_chan, checkpoint cp)
{
    auto lb = this->fj_lines->create_buffer();
    auto shortcut = this->fj_predicate.bitmap_shortcut();
    auto batch_size = std::max<size_t>(this->fj_config.ec_batch_size, 1);
    auto last_publish = std::chrono::steady_clock::now();
    std::string scratch;

    {
        auto chan = weak_chan.lock();

        if (!chan) {
            return;
        }

        safe::WriteAccess<safe_channel_state> state(chan->rc_state);

        if (state->cs_state != job_state::pending) {
            return;
        }
        state->cs_state = job_state::running;
        state->cs_latest = std::make_shared<const filter_result>(
            this->to_result(cp, job_state::running));
    }

    while (!this->fj_cancel) {
        auto rv = this->fj_levels->view_range(
            cp.c_cursor, batch_size, shortcut);

        if (rv.rv_generation != cp.c_generation) {
            auto rewind_opt = this->fj_levels->rewind_point(cp.c_generation);

            cp.c_generation = rv.rv_generation;
            if (rewind_opt && rewind_opt.value() < cp.c_cursor) {
                log_debug("job %llu: rewinding from line %u to %zu",
                          (unsigned long long) this->fj_id,
                          cp.c_cursor,
                          rewind_opt.value());
                cp.c_cursor = (line_no_t) rewind_opt.value();
                cp.c_matched.truncate(cp.c_cursor);
                if (cp.c_aggregator) {
                    cp.c_aggregator->truncate(cp.c_cursor,
                                              cp.c_matched.size());
                }
            }
            continue;
        }
        if (rv.rv_flags.empty()) {
            break;
        }

        auto batch_end = (line_no_t) (rv.rv_start + rv.rv_flags.size());
        auto stopped_at = batch_end;
        std::optional<io_error> err;

        auto scan_one = [&](line_no_t line) {
            auto flags = rv.rv_flags[line - rv.rv_start];
            auto scan_res = this->scan_line(*lb, line, flags, cp, scratch);

            if (scan_res.isErr()) {
                err = scan_res.unwrapErr();
                stopped_at = line;
                return false;
            }
            if (!scan_res.unwrap()) {
                stopped_at = line;
                return false;
            }
            return true;
        };

        if (shortcut) {
            for (const auto line : rv.rv_candidates) {
                if (!scan_one(line)) {
                    break;
                }
            }
        } else {
            for (auto line = rv.rv_start; line < batch_end; line++) {
                if (!scan_one(line)) {
                    break;
                }
            }
        }
        cp.c_cursor = stopped_at;

        if (err) {
            log_error("job %llu: read failed -- %s",
                      (unsigned long long) this->fj_id,
                      err->to_string().c_str());

            auto fr = this->to_result(cp, job_state::done);

            fr.fr_complete = false;
            fr.fr_error = std::move(err);
            this->finish(weak_chan, job_state::done, std::move(fr), std::nullopt);
            return;
        }
        if (stopped_at < batch_end) {
            // The line index is being rewritten by a sync, wait for the
            // level index to catch up with it.
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_publish >= this->fj_config.ec_batch_time) {
            if (!this->publish(weak_chan,
                               this->to_result(cp, job_state::running)))
            {
                break;
            }
            last_publish = now;
        }
    }

    if (this->fj_cancel) {
        log_debug("job %llu: stopped at line %u",
                  (unsigned long long) this->fj_id,
                  cp.c_cursor);
        this->finish(weak_chan,
                     this->fj_superseded ? job_state::superseded
                                         : job_state::cancelled,
                     std::nullopt,
                     std::nullopt);
        return;
    }

    log_info("job %llu: done, %zu of %u line(s) matched",
             (unsigned long long) this->fj_id,
             cp.c_matched.size(),
             cp.c_cursor);

    auto fr = this->to_result(cp, job_state::done);
    this->finish(weak_chan, job_state::done, std::move(fr), std::move(cp));
}

}  // namespace loupe
