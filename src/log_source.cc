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
 * @file log_source.cc
 */

#include <errno.h>

#include "log_source.hh"

#include "base/loupe_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "line_flags.hh"

namespace loupe {

log_source::log_source(std::filesystem::path path, const engine_config& cfg)
    : ls_path(std::move(path)), ls_config(cfg)
{
}

log_source::~log_source()
{
    this->close();
}

Result<std::shared_ptr<log_source>, io_error>
log_source::open(const std::filesystem::path& path, const engine_config& cfg)
{
    auto retval = std::shared_ptr<log_source>(new log_source(path, cfg));
    auto lines = TRY(line_index::open(path, cfg));
    auto levels = std::make_shared<level_index>();
    auto sync_buffer = lines->create_buffer();

    TRY(levels->catch_up(*lines, *sync_buffer));

    retval->ls_sync_buffer = std::move(sync_buffer);
    {
        safe::WriteAccess<safe_indexes> idx(retval->ls_indexes);

        idx->i_read_buffer = lines->create_buffer();
        idx->i_lines = std::move(lines);
        idx->i_levels = std::move(levels);
    }

    return Ok(retval);
}

std::shared_ptr<const line_index>
log_source::get_line_index() const
{
    safe::ReadAccess<safe_indexes> idx(this->ls_indexes);

    return idx->i_lines;
}

std::shared_ptr<const level_index>
log_source::get_level_index() const
{
    safe::ReadAccess<safe_indexes> idx(this->ls_indexes);

    return idx->i_levels;
}

size_t
log_source::line_count() const
{
    return this->get_line_index()->size();
}

level_histogram
log_source::histogram() const
{
    return this->get_level_index()->histogram();
}

Result<line_record, io_error>
log_source::get_line(size_t index) const
{
    safe::WriteAccess<safe_indexes> idx(this->ls_indexes);
    auto fr = idx->i_lines->line_at(index);

    if (!fr) {
        return Err(io_error{
            this->ls_path,
            ERANGE,
            fmt::format(FMT_STRING("line {} is out of range -- {}"),
                        index,
                        this->ls_path),
        });
    }

    bool has_cr = false;
    auto raw = TRY(idx->i_lines->read_line(*idx->i_read_buffer, index, &has_cr));
    std::string scratch;
    size_t replacements = 0;
    auto text = decode_line(raw, scratch, replacements);
    line_record retval;

    retval.lr_range = fr.value();
    retval.lr_range.fr_metadata.m_has_cr = has_cr;
    retval.lr_range.fr_metadata.m_valid_utf = replacements == 0;
    // the line can be ahead of the level index while a sync is running
    auto flags = index < idx->i_levels->size()
        ? idx->i_levels->flags_at(index)
        : classify_line(text);

    retval.lr_level = flags2level(flags);
    retval.lr_range.fr_metadata.m_has_ansi = (flags & LF_HAS_ANSI) != 0;

    auto max_len = this->ls_config.ec_max_line_display;
    if ((size_t) text.length() > max_len) {
        auto cut = (int) max_len;

        // back up to the start of a UTF-8 sequence
        while (cut > 0 && (((unsigned char) text[cut]) & 0xc0) == 0x80) {
            cut -= 1;
        }
        text = text.sub_range(0, cut);
        retval.lr_truncated = true;
    }
    retval.lr_text = text.to_string();

    return Ok(retval);
}

std::shared_ptr<filter_job>
log_source::make_job(const match_predicate& pred) const
{
    safe::ReadAccess<safe_indexes> idx(this->ls_indexes);

    return std::make_shared<filter_job>(
        pred, idx->i_lines, idx->i_levels, this->ls_config);
}

bool
log_source::needs_follow_up(const job_slot& slot) const
{
    if (!slot.js_job || slot.js_cancelled) {
        return false;
    }
    if (slot.js_job->get_state() != job_state::done) {
        return false;
    }

    auto levels = this->get_level_index();
    if (slot.js_job->get_line_index() != this->get_line_index()) {
        return false;
    }

    auto gen = slot.js_job->final_generation();
    if (!gen) {
        return false;
    }

    auto res = slot.js_job->poll();

    return res.fr_scanned != levels->size()
        || gen.value() != levels->generation();
}

void
log_source::refresh_job(job_slot& slot) const
{
    if (!this->needs_follow_up(slot)) {
        return;
    }

    auto cp = slot.js_job->take_checkpoint();
    auto job = this->make_job(slot.js_job->get_predicate());

    log_debug("continuing filter on %s", this->ls_path.c_str());
    job->start(std::move(cp));
    slot.js_job = std::move(job);
}

Result<void, io_error>
log_source::rebuild()
{
    auto new_lines = TRY(line_index::open(this->ls_path, this->ls_config));
    auto new_levels = std::make_shared<level_index>();
    auto sync_buffer = new_lines->create_buffer();

    TRY(new_levels->catch_up(*new_lines, *sync_buffer));

    {
        safe::WriteAccess<safe_indexes> idx(this->ls_indexes);

        idx->i_read_buffer = new_lines->create_buffer();
        idx->i_lines = std::move(new_lines);
        idx->i_levels = std::move(new_levels);
    }
    this->ls_sync_buffer = std::move(sync_buffer);

    safe::WriteAccess<safe_job_slot> slot(this->ls_job);
    if (slot->js_job && !slot->js_cancelled) {
        auto job = this->make_job(slot->js_job->get_predicate());

        slot->js_job->supersede();
        log_info("restarting filter on %s", this->ls_path.c_str());
        job->start();
        slot->js_job = std::move(job);
    }

    return Ok();
}

Result<line_index::sync_result, io_error>
log_source::sync()
{
    std::lock_guard<std::mutex> lg(this->ls_sync_mutex);
    std::shared_ptr<line_index> lines;
    std::shared_ptr<level_index> levels;

    {
        safe::ReadAccess<safe_indexes> idx(this->ls_indexes);

        lines = idx->i_lines;
        levels = idx->i_levels;
    }

    auto retval = TRY(lines->sync());

    if (retval.is<line_index::truncated>()) {
        log_info("rebuilding the index of %s: %s",
                 this->ls_path.c_str(),
                 retval.get<line_index::truncated>().t_reason.c_str());
        TRY(this->rebuild());
        return Ok(retval);
    }

    const auto& app = retval.get<line_index::appended>();
    if (app.a_first_line < levels->size()) {
        levels->truncate(app.a_first_line);
    }
    TRY(levels->catch_up(*lines, *this->ls_sync_buffer));

    safe::WriteAccess<safe_job_slot> slot(this->ls_job);
    this->refresh_job(*slot);

    return Ok(retval);
}

Result<bool, io_error>
log_source::finalize()
{
    std::lock_guard<std::mutex> lg(this->ls_sync_mutex);
    std::shared_ptr<line_index> lines;
    std::shared_ptr<level_index> levels;

    {
        safe::ReadAccess<safe_indexes> idx(this->ls_indexes);

        lines = idx->i_lines;
        levels = idx->i_levels;
    }

    if (!lines->finalize()) {
        return Ok(false);
    }

    TRY(levels->catch_up(*lines, *this->ls_sync_buffer));

    safe::WriteAccess<safe_job_slot> slot(this->ls_job);
    this->refresh_job(*slot);

    return Ok(true);
}

uint64_t
log_source::start_filter(match_predicate pred)
{
    auto lines = this->get_line_index();
    safe::WriteAccess<safe_job_slot> slot(this->ls_job);

    if (slot->js_job && !slot->js_cancelled
        && slot->js_job->get_predicate() == pred
        && slot->js_job->get_line_index() == lines
        && !slot->js_job->poll().fr_error)
    {
        log_debug("filter %s is unchanged", pred.to_string().c_str());
        this->refresh_job(*slot);
        return slot->js_session;
    }

    if (slot->js_job) {
        slot->js_job->supersede();
    }

    auto job = this->make_job(pred);

    job->start();
    slot->js_job = std::move(job);
    slot->js_session = slot->js_next_session++;
    slot->js_cancelled = false;

    return slot->js_session;
}

filter_result
log_source::poll_result(uint64_t session)
{
    safe::WriteAccess<safe_job_slot> slot(this->ls_job);

    if (slot->js_session != session || !slot->js_job) {
        filter_result retval;

        retval.fr_state = job_state::superseded;
        return retval;
    }

    this->refresh_job(*slot);

    return slot->js_job->poll();
}

void
log_source::cancel(uint64_t session)
{
    safe::WriteAccess<safe_job_slot> slot(this->ls_job);

    if (slot->js_session != session || !slot->js_job) {
        return;
    }

    slot->js_job->cancel();
    slot->js_cancelled = true;
}

bool
log_source::wait_for(uint64_t session, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        std::shared_ptr<filter_job> job;

        {
            safe::WriteAccess<safe_job_slot> slot(this->ls_job);

            if (slot->js_session != session || !slot->js_job) {
                return false;
            }
            if (slot->js_cancelled) {
                return true;
            }
            this->refresh_job(*slot);
            job = slot->js_job;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        if (!job->wait_for(std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - now)))
        {
            return false;
        }

        safe::WriteAccess<safe_job_slot> slot(this->ls_job);
        if (slot->js_job != job) {
            continue;
        }
        if (job->get_state() != job_state::done || job->poll().fr_error) {
            return true;
        }
        if (!this->needs_follow_up(*slot)) {
            return true;
        }
    }
}

void
log_source::close()
{
    std::shared_ptr<filter_job> job;

    {
        safe::WriteAccess<safe_job_slot> slot(this->ls_job);

        job = std::move(slot->js_job);
        slot->js_job = nullptr;
    }
    if (job) {
        job->cancel();
    }
}

}  // namespace loupe
