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
 * @file source_collection.hh
 */

#ifndef loupe_source_collection_hh
#define loupe_source_collection_hh

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "base/fs_util.hh"
#include "base/string_fragment.hh"
#include "filter_engine.hh"
#include "level_index.hh"
#include "line_index.hh"
#include "log_source.hh"
#include "loupe.cfg.hh"
#include "match_predicate.hh"
#include "query.ast.hh"
#include "result.h"
#include "safe/safe.h"

namespace loupe {

using source_handle = uint32_t;

struct filter_job_handle {
    source_handle fjh_source{0};
    uint64_t fjh_session{0};
};

enum class change_kind {
    modified,
    removed,
    created,
};

/**
 * The set of open log files.  The methods can be called from the thread
 * delivering file change notifications as well as from the viewer.
 */
class source_collection {
public:
    /**
     * Receives changes to the indexes of the open sources.  Callbacks are
     * made on the thread that called notify() or sync_all().
     */
    class change_listener {
    public:
        virtual ~change_listener() = default;

        virtual void source_appended(source_handle handle,
                                     const line_index::appended& app)
        {
        }

        virtual void source_truncated(source_handle handle,
                                      const std::string& reason)
        {
        }

        virtual void source_error(source_handle handle, const io_error& err)
        {
        }
    };

    explicit source_collection(const engine_config& cfg = {});

    source_collection(const source_collection&) = delete;

    source_collection& operator=(const source_collection&) = delete;

    ~source_collection();

    void set_listener(change_listener* listener)
    {
        this->sc_listener = listener;
    }

    Result<source_handle, io_error> open_source(
        const std::filesystem::path& path);

    /** @return False if the handle is not open. */
    bool close(source_handle handle);

    std::optional<size_t> line_count(source_handle handle) const;

    Result<line_record, io_error> get_line(source_handle handle,
                                           size_t index) const;

    std::optional<level_histogram> histogram(source_handle handle) const;

    /**
     * Start filtering a source with a predicate spec as accepted by
     * parse_predicate_spec().  On a parse error, the current filter, if
     * any, keeps running.
     */
    Result<filter_job_handle, query::parse_error> start_filter(
        source_handle handle, string_fragment spec);

    std::optional<filter_job_handle> start_filter(source_handle handle,
                                                  match_predicate pred);

    filter_result poll_result(const filter_job_handle& job) const;

    void cancel(const filter_job_handle& job);

    /**
     * Block until the filter has caught up with the source.  Meant for
     * non-interactive callers.
     */
    bool wait_for(const filter_job_handle& job,
                  std::chrono::milliseconds timeout) const;

    /**
     * Handle a notification from a file watcher.  Modifications and
     * creations sync the matching sources, a removal finalizes them.
     */
    void notify(const std::filesystem::path& path, change_kind kind);

    /** Sync every open source. */
    void sync_all();

    std::shared_ptr<log_source> get_source(source_handle handle) const;

private:
    using source_map = std::map<source_handle, std::shared_ptr<log_source>>;
    using safe_source_map = safe::Safe<source_map>;

    void sync_source(source_handle handle, log_source& src);

    void finalize_source(source_handle handle, log_source& src);

    const engine_config sc_config;
    mutable safe_source_map sc_sources;
    std::atomic<source_handle> sc_next_handle{1};
    change_listener* sc_listener{nullptr};
};

}  // namespace loupe

#endif
