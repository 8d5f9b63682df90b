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
 * @file log_source.hh
 */

#ifndef loupe_log_source_hh
#define loupe_log_source_hh

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "base/file_range.hh"
#include "base/fs_util.hh"
#include "base/log_level_enum.hh"
#include "filter_engine.hh"
#include "level_index.hh"
#include "line_buffer.hh"
#include "line_index.hh"
#include "loupe.cfg.hh"
#include "match_predicate.hh"
#include "result.h"
#include "safe/safe.h"

namespace loupe {

/**
 * A line as handed to a viewer.
 */
struct line_record {
    /** The decoded text, cut off at the display limit. */
    std::string lr_text;
    log_level_t lr_level{LEVEL_UNKNOWN};
    /** The bytes of the line in the file, including the terminator. */
    file_range lr_range;
    /** True if lr_text was cut off. */
    bool lr_truncated{false};
};

/**
 * One open log file: its line and level indexes, and the filter job
 * running over it, if any.  The indexes are replaced wholesale when the file
 * is truncated or replaced.
 *
 * sync() and finalize() are serialized internally.  Everything else can be
 * called from any thread.
 */
class log_source {
public:
    static Result<std::shared_ptr<log_source>, io_error> open(
        const std::filesystem::path& path, const engine_config& cfg);

    log_source(const log_source&) = delete;

    log_source& operator=(const log_source&) = delete;

    ~log_source();

    const std::filesystem::path& get_path() const { return this->ls_path; }

    size_t line_count() const;

    Result<line_record, io_error> get_line(size_t index) const;

    level_histogram histogram() const;

    /**
     * Pick up changes to the file.  If the file was truncated or replaced,
     * the indexes are rebuilt and any filter job is restarted from the
     * first line.
     */
    Result<line_index::sync_result, io_error> sync();

    /**
     * Count a trailing unterminated line, used when the file will not be
     * written to anymore.
     *
     * @return True if a line was added.
     */
    Result<bool, io_error> finalize();

    /**
     * Begin filtering with the given predicate.  A running job with the same
     * predicate is kept, a finished one is continued from where it stopped
     * and a job with a different predicate is superseded.
     *
     * @return An identifier for the filter session.
     */
    uint64_t start_filter(match_predicate pred);

    /**
     * @return The latest result for the session.  If the session was
     *   replaced by another, the result is empty with the "superseded"
     *   state.
     */
    filter_result poll_result(uint64_t session);

    void cancel(uint64_t session);

    /**
     * Wait until the filter has caught up with the indexed lines.
     *
     * @return True if it did within the timeout.
     */
    bool wait_for(uint64_t session, std::chrono::milliseconds timeout);

    /** Stop any filter job. */
    void close();

    std::shared_ptr<const line_index> get_line_index() const;

    std::shared_ptr<const level_index> get_level_index() const;

private:
    struct indexes {
        std::shared_ptr<line_index> i_lines;
        std::shared_ptr<level_index> i_levels;
        /** Used by get_line(). */
        std::unique_ptr<line_buffer> i_read_buffer;
    };

    using safe_indexes = safe::Safe<indexes>;

    struct job_slot {
        uint64_t js_session{0};
        std::shared_ptr<filter_job> js_job;
        /** True after the session was cancelled by the consumer. */
        bool js_cancelled{false};
        uint64_t js_next_session{1};
    };

    using safe_job_slot = safe::Safe<job_slot>;

    log_source(std::filesystem::path path, const engine_config& cfg);

    Result<void, io_error> rebuild();

    std::shared_ptr<filter_job> make_job(const match_predicate& pred) const;

    /**
     * @return True if the current job finished without reaching the end of
     *   the level index, or the index changed under it.
     */
    bool needs_follow_up(const job_slot& slot) const;

    /** Start a follow-up job if needs_follow_up(). */
    void refresh_job(job_slot& slot) const;

    const std::filesystem::path ls_path;
    const engine_config ls_config;
    std::mutex ls_sync_mutex;
    /** Used by sync() to classify new lines. */
    std::unique_ptr<line_buffer> ls_sync_buffer;
    mutable safe_indexes ls_indexes;
    mutable safe_job_slot ls_job;
};

}  // namespace loupe

#endif
