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
 * @file source_collection.cc
 */

#include <vector>

#include <errno.h>

#include "source_collection.hh"

#include "base/loupe_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace loupe {

static std::filesystem::path
normalize_path(const std::filesystem::path& path)
{
    std::error_code ec;
    auto retval = std::filesystem::absolute(path, ec);

    if (ec) {
        return path.lexically_normal();
    }

    return retval.lexically_normal();
}

source_collection::source_collection(const engine_config& cfg)
    : sc_config(cfg)
{
}

source_collection::~source_collection()
{
    source_map sources;

    {
        safe::WriteAccess<safe_source_map> sm(this->sc_sources);

        sources.swap(*sm);
    }
    for (auto& pair : sources) {
        pair.second->close();
    }
}

std::shared_ptr<log_source>
source_collection::get_source(source_handle handle) const
{
    safe::ReadAccess<safe_source_map> sm(this->sc_sources);
    auto iter = sm->find(handle);

    if (iter == sm->end()) {
        return nullptr;
    }

    return iter->second;
}

Result<source_handle, io_error>
source_collection::open_source(const std::filesystem::path& path)
{
    auto src = TRY(log_source::open(normalize_path(path), this->sc_config));
    auto retval = this->sc_next_handle++;

    log_info("source %u: opened %s", retval, src->get_path().c_str());
    {
        safe::WriteAccess<safe_source_map> sm(this->sc_sources);

        sm->emplace(retval, std::move(src));
    }

    return Ok(retval);
}

bool
source_collection::close(source_handle handle)
{
    std::shared_ptr<log_source> src;

    {
        safe::WriteAccess<safe_source_map> sm(this->sc_sources);
        auto iter = sm->find(handle);

        if (iter == sm->end()) {
            return false;
        }
        src = std::move(iter->second);
        sm->erase(iter);
    }

    log_info("source %u: closing %s", handle, src->get_path().c_str());
    src->close();

    return true;
}

std::optional<size_t>
source_collection::line_count(source_handle handle) const
{
    auto src = this->get_source(handle);

    if (!src) {
        return std::nullopt;
    }

    return src->line_count();
}

Result<line_record, io_error>
source_collection::get_line(source_handle handle, size_t index) const
{
    auto src = this->get_source(handle);

    if (!src) {
        return Err(io_error{
            "",
            EBADF,
            fmt::format(FMT_STRING("unknown source handle {}"), handle),
        });
    }

    return src->get_line(index);
}

std::optional<level_histogram>
source_collection::histogram(source_handle handle) const
{
    auto src = this->get_source(handle);

    if (!src) {
        return std::nullopt;
    }

    return src->histogram();
}

Result<filter_job_handle, query::parse_error>
source_collection::start_filter(source_handle handle, string_fragment spec)
{
    auto pred = TRY(parse_predicate_spec(spec));
    auto retval = this->start_filter(handle, std::move(pred));

    if (!retval) {
        return Err(query::parse_error{
            0,
            0,
            fmt::format(FMT_STRING("unknown source handle {}"), handle),
            spec.to_string(),
        });
    }

    return Ok(retval.value());
}

std::optional<filter_job_handle>
source_collection::start_filter(source_handle handle, match_predicate pred)
{
    auto src = this->get_source(handle);

    if (!src) {
        log_error("start_filter: unknown source handle %u", handle);
        return std::nullopt;
    }

    return filter_job_handle{handle, src->start_filter(std::move(pred))};
}

filter_result
source_collection::poll_result(const filter_job_handle& job) const
{
    auto src = this->get_source(job.fjh_source);

    if (!src) {
        filter_result retval;

        retval.fr_state = job_state::cancelled;
        return retval;
    }

    return src->poll_result(job.fjh_session);
}

void
source_collection::cancel(const filter_job_handle& job)
{
    auto src = this->get_source(job.fjh_source);

    if (src) {
        src->cancel(job.fjh_session);
    }
}

bool
source_collection::wait_for(const filter_job_handle& job,
                            std::chrono::milliseconds timeout) const
{
    auto src = this->get_source(job.fjh_source);

    if (!src) {
        return false;
    }

    return src->wait_for(job.fjh_session, timeout);
}

void
source_collection::sync_source(source_handle handle, log_source& src)
{
    auto sync_res = src.sync();

    if (sync_res.isErr()) {
        auto err = sync_res.unwrapErr();

        log_error("source %u: sync failed -- %s",
                  handle,
                  err.to_string().c_str());
        if (this->sc_listener != nullptr) {
            this->sc_listener->source_error(handle, err);
        }
        return;
    }

    if (this->sc_listener == nullptr) {
        return;
    }

    auto res = sync_res.unwrap();
    res.match(
        [this, handle](const line_index::appended& app) {
            if (app.a_new_lines > 0) {
                this->sc_listener->source_appended(handle, app);
            }
        },
        [this, handle](const line_index::truncated& tr) {
            this->sc_listener->source_truncated(handle, tr.t_reason);
        });
}

void
source_collection::finalize_source(source_handle handle, log_source& src)
{
    auto fin_res = src.finalize();

    if (fin_res.isErr()) {
        auto err = fin_res.unwrapErr();

        log_error("source %u: finalize failed -- %s",
                  handle,
                  err.to_string().c_str());
        if (this->sc_listener != nullptr) {
            this->sc_listener->source_error(handle, err);
        }
        return;
    }

    if (fin_res.unwrap() && this->sc_listener != nullptr) {
        auto count = src.line_count();

        this->sc_listener->source_appended(
            handle, line_index::appended{count - 1, 1});
    }
}

void
source_collection::notify(const std::filesystem::path& path, change_kind kind)
{
    auto norm = normalize_path(path);
    std::vector<std::pair<source_handle, std::shared_ptr<log_source>>> matches;

    {
        safe::ReadAccess<safe_source_map> sm(this->sc_sources);

        for (const auto& pair : *sm) {
            if (pair.second->get_path() == norm) {
                matches.emplace_back(pair);
            }
        }
    }

    for (auto& pair : matches) {
        switch (kind) {
            case change_kind::modified:
            case change_kind::created:
                this->sync_source(pair.first, *pair.second);
                break;
            case change_kind::removed:
                log_info("source %u: file was removed, keeping the last "
                         "index",
                         pair.first);
                this->finalize_source(pair.first, *pair.second);
                break;
        }
    }
}

void
source_collection::sync_all()
{
    std::vector<std::pair<source_handle, std::shared_ptr<log_source>>> sources;

    {
        safe::ReadAccess<safe_source_map> sm(this->sc_sources);

        sources.assign(sm->begin(), sm->end());
    }

    for (auto& pair : sources) {
        this->sync_source(pair.first, *pair.second);
    }
}

}  // namespace loupe
