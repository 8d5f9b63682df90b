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
 * @file filter_engine.hh
 */

#ifndef loupe_filter_engine_hh
#define loupe_filter_engine_hh

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "aggregation.hh"
#include "base/fs_util.hh"
#include "level_index.hh"
#include "line_bitmap.hh"
#include "line_index.hh"
#include "loupe.cfg.hh"
#include "match_predicate.hh"
#include "safe/safe.h"

namespace loupe {

enum class job_state {
    pending,
    running,
    done,
    cancelled,
    superseded,
};

const char* job_state_name(job_state st);

inline bool
is_finished(job_state st)
{
    return st != job_state::pending && st != job_state::running;
}

/**
 * A snapshot of the progress of a filter job.
 */
struct filter_result {
    job_state fr_state{job_state::pending};
    /** The matching lines in file order. */
    line_bitmap fr_matched;
    /** The number of lines covered by the scan so far. */
    size_t fr_scanned{0};
    /** True once the scan reached the end of the indexed lines. */
    bool fr_complete{false};
    /** Ill-formed UTF-8 sequences replaced in the lines that were read. */
    size_t fr_decode_errors{0};
    /** Lines a structured query could not parse. */
    size_t fr_parse_failures{0};
    /** Set when the scan was aborted by a read failure. */
    std::optional<io_error> fr_error;
    std::optional<aggregation_result> fr_aggregation;
};

/**
 * The state of a scan that can be carried over into a follow-up job when
 * more lines are appended.
 */
struct filter_checkpoint {
    line_no_t c_cursor{0};
    /** The level_index generation the scan is consistent with. */
    size_t c_generation{0};
    line_bitmap c_matched;
    size_t c_decode_errors{0};
    size_t c_parse_failures{0};
    std::optional<aggregator> c_aggregator;
};

/**
 * Runs a match_predicate over the lines of one source in a background
 * thread.  The worker evaluates the lines in batches and, between batches,
 * checks for cancellation and publishes snapshots of its progress.  The
 * worker keeps going while the source grows, and finishes once it has
 * caught up with the level_index.
 */
class filter_job {
public:
    using checkpoint = filter_checkpoint;

    filter_job(match_predicate pred,
               std::shared_ptr<const line_index> lines,
               std::shared_ptr<const level_index> levels,
               const engine_config& cfg);

    filter_job(const filter_job&) = delete;

    filter_job& operator=(const filter_job&) = delete;

    /** Cancels the scan and waits for the worker to exit. */
    ~filter_job();

    /**
     * Start the worker thread, from line zero or from where a previous job
     * with the same predicate left off.
     */
    void start(std::optional<checkpoint> resume = std::nullopt);

    /** Stop the scan.  No more snapshots are published afterward. */
    void cancel();

    /** Same as cancel(), but records that a newer job replaced this one. */
    void supersede();

    job_state get_state() const;

    /** @return The latest snapshot published by the worker. */
    filter_result poll() const;

    /**
     * Wait for the job to finish.
     *
     * @return True if the job finished within the timeout.
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

    /**
     * Take the final state of a job that finished successfully, so a
     * follow-up job can resume from it.
     */
    std::optional<checkpoint> take_checkpoint();

    /**
     * @return The level_index generation the final result is consistent
     *   with, if the job finished successfully.
     */
    std::optional<size_t> final_generation() const;

    const match_predicate& get_predicate() const { return this->fj_predicate; }

    const std::shared_ptr<const line_index>& get_line_index() const
    {
        return this->fj_lines;
    }

    uint64_t get_id() const { return this->fj_id; }

private:
    struct channel_state {
        job_state cs_state{job_state::pending};
        /** Published snapshots are never modified, only replaced. */
        std::shared_ptr<const filter_result> cs_latest{
            std::make_shared<const filter_result>()};
        std::optional<checkpoint> cs_final;
    };

    using safe_channel_state = safe::Safe<channel_state>;

    struct result_channel {
        safe_channel_state rc_state;
        std::condition_variable rc_cond;
    };

    void run(std::weak_ptr<result_channel> weak_chan, checkpoint cp);

    /**
     * Evaluate one line and record the outcome in the checkpoint.
     *
     * @return False if the line is no longer in the line index.
     */
    Result<bool, io_error> scan_line(line_buffer& lb,
                                     line_no_t line,
                                     line_flags_t flags,
                                     checkpoint& cp,
                                     std::string& scratch) const;

    filter_result to_result(const checkpoint& cp, job_state st) const;

    /**
     * Hand a snapshot to the consumer.
     *
     * @return False if the consumer is gone or the job was cancelled.
     */
    bool publish(const std::weak_ptr<result_channel>& weak_chan,
                 filter_result fr);

    void finish(const std::weak_ptr<result_channel>& weak_chan,
                job_state st,
                std::optional<filter_result> fr,
                std::optional<checkpoint> cp);

    static std::atomic<uint64_t> NEXT_ID;

    const uint64_t fj_id;
    const match_predicate fj_predicate;
    const std::shared_ptr<const line_index> fj_lines;
    const std::shared_ptr<const level_index> fj_levels;
    const engine_config fj_config;
    std::shared_ptr<result_channel> fj_channel;
    std::atomic<bool> fj_cancel{false};
    std::atomic<bool> fj_superseded{false};
    std::thread fj_thread;
};

}  // namespace loupe

#endif
