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
 * @file line_index.cc
 */

#include <algorithm>
#include <vector>

#include <errno.h>
#include <fcntl.h>

#include "line_index.hh"

#include <zlib.h>

#include "base/loupe_log.hh"
#include "config.h"

namespace loupe {

line_index::line_index(std::filesystem::path path,
                       auto_fd fd,
                       const engine_config& cfg)
    : li_path(std::move(path)), li_fd(std::move(fd)), li_config(cfg),
      li_line_buffer(cfg.ec_read_block_size)
{
    this->li_line_buffer.set_fd(this->li_path, this->li_fd.get());
}

Result<std::shared_ptr<line_index>, io_error>
line_index::open(const std::filesystem::path& path, const engine_config& cfg)
{
    auto st = TRY(filesystem::stat_file(path));

    if (!S_ISREG(st.st_mode)) {
        return Err(io_error{
            path,
            S_ISDIR(st.st_mode) ? EISDIR : EINVAL,
            fmt::format(FMT_STRING("not a regular file -- {}"), path),
        });
    }

    auto fd = TRY(filesystem::open_file(path, O_RDONLY));
    auto fst = TRY(filesystem::stat_fd(path, fd.get()));
    auto retval = std::shared_ptr<line_index>(
        new line_index(path, std::move(fd), cfg));

    retval->li_identity.i_dev = fst.st_dev;
    retval->li_identity.i_ino = fst.st_ino;

    auto sync_res = TRY(retval->sync());
    if (sync_res.is<truncated>()) {
        return Err(io_error{
            path,
            0,
            fmt::format(FMT_STRING("file changed while opening -- {}"), path),
        });
    }

    log_info("opened %s: %zu lines, %llu bytes",
             path.c_str(),
             retval->size(),
             (unsigned long long) retval->file_size());

    return Ok(retval);
}

Result<uint32_t, io_error>
line_index::fingerprint(size_t len)
{
    std::vector<char> buf(len);

    auto rc = TRY(filesystem::pread_fully(
        this->li_path, this->li_fd.get(), buf.data(), len, 0));

    return Ok((uint32_t) crc32(crc32(0L, Z_NULL, 0),
                               (const Bytef*) buf.data(),
                               (uInt) rc));
}

Result<line_index::sync_result, io_error>
line_index::sync()
{
    auto st = TRY(filesystem::stat_file(this->li_path));

    if (st.st_dev != this->li_identity.i_dev
        || st.st_ino != this->li_identity.i_ino)
    {
        log_info("file was replaced -- %s", this->li_path.c_str());
        return Ok(sync_result{truncated{"file was replaced"}});
    }

    file_size_t prev_size;
    file_off_t partial_start;
    size_t prev_count;
    {
        safe::ReadAccess<safe_offsets_state> state(this->li_state);

        prev_size = state->os_file_size;
        partial_start = state->os_partial_start;
        prev_count = state->os_starts.size();
    }

    if ((file_size_t) st.st_size < prev_size) {
        log_info("file shrank from %llu to %lld -- %s",
                 (unsigned long long) prev_size,
                 (long long) st.st_size,
                 this->li_path.c_str());
        return Ok(sync_result{truncated{"file shrank"}});
    }

    if (this->li_identity.i_fingerprint_len > 0) {
        auto crc = TRY(this->fingerprint(this->li_identity.i_fingerprint_len));

        if (crc != this->li_identity.i_fingerprint) {
            log_info("leading bytes changed -- %s", this->li_path.c_str());
            return Ok(sync_result{truncated{"leading bytes changed"}});
        }
    }

    if ((file_size_t) st.st_size == prev_size) {
        return Ok(sync_result{appended{prev_count, 0}});
    }

    std::vector<file_off_t> new_starts;
    size_t max_len = 0;
    auto scan_end = TRY(this->li_line_buffer.scan_lines(
        partial_start, st.st_size, [&](const file_range& fr) {
            size_t text_len
                = fr.fr_size - 1 - (fr.fr_metadata.m_has_cr ? 1 : 0);

            new_starts.push_back(fr.fr_offset);
            max_len = std::max(max_len, text_len);
        }));

    auto new_fp_len
        = std::min<size_t>(this->li_config.ec_fingerprint_size, st.st_size);
    std::optional<uint32_t> new_fp;
    if (new_fp_len > this->li_identity.i_fingerprint_len) {
        new_fp = TRY(this->fingerprint(new_fp_len));
    }

    appended retval;
    {
        safe::WriteAccess<safe_offsets_state> state(this->li_state);

        retval.a_first_line = state->os_starts.size();
        if (state->os_partial_counted) {
            state->os_starts.pop_back();
            state->os_partial_counted = false;
            retval.a_first_line -= 1;
        }
        state->os_finalized = false;
        for (const auto off : new_starts) {
            state->os_starts.push_back(off);
        }
        state->os_end = scan_end;
        state->os_partial_start = scan_end;
        state->os_file_size = st.st_size;
        state->os_max_line_length
            = std::max(state->os_max_line_length, max_len);
        retval.a_new_lines = state->os_starts.size() - retval.a_first_line;
    }

    if (new_fp) {
        this->li_identity.i_fingerprint_len = new_fp_len;
        this->li_identity.i_fingerprint = new_fp.value();
    }

    log_debug("synced %s: %zu new lines from line %zu",
              this->li_path.c_str(),
              retval.a_new_lines,
              retval.a_first_line);

    return Ok(sync_result{retval});
}

bool
line_index::finalize()
{
    safe::WriteAccess<safe_offsets_state> state(this->li_state);

    if (state->os_finalized) {
        return false;
    }

    state->os_finalized = true;
    if ((file_size_t) state->os_partial_start < state->os_file_size) {
        auto partial_len = state->os_file_size - state->os_partial_start;

        state->os_starts.push_back(state->os_partial_start);
        state->os_end = state->os_file_size;
        state->os_partial_counted = true;
        state->os_max_line_length
            = std::max<size_t>(state->os_max_line_length, partial_len);
        return true;
    }

    return false;
}

bool
line_index::is_finalized() const
{
    safe::ReadAccess<safe_offsets_state> state(this->li_state);

    return state->os_finalized;
}

size_t
line_index::size() const
{
    safe::ReadAccess<safe_offsets_state> state(this->li_state);

    return state->os_starts.size();
}

std::optional<file_range>
line_index::line_at(size_t index) const
{
    safe::ReadAccess<safe_offsets_state> state(this->li_state);

    if (index >= state->os_starts.size()) {
        return std::nullopt;
    }

    file_range retval;

    retval.fr_offset = state->os_starts[index];
    if (index + 1 < state->os_starts.size()) {
        retval.fr_size = state->os_starts[index + 1] - retval.fr_offset;
    } else {
        retval.fr_size = state->os_end - retval.fr_offset;
    }

    return retval;
}

Result<string_fragment, io_error>
line_index::read_line(line_buffer& lb, size_t index, bool* has_cr) const
{
    auto fr = this->line_at(index);

    if (!fr) {
        return Err(io_error{
            this->li_path,
            ERANGE,
            fmt::format(FMT_STRING("line {} is out of range -- {}"),
                        index,
                        this->li_path),
        });
    }

    auto bytes = TRY(lb.read_range(fr.value()));
    bool cr = false;
    auto retval = line_buffer::trim_terminator(bytes, cr);

    if (has_cr != nullptr) {
        *has_cr = cr;
    }

    return Ok(retval);
}

std::unique_ptr<line_buffer>
line_index::create_buffer() const
{
    auto retval
        = std::make_unique<line_buffer>(this->li_config.ec_read_block_size);

    retval->set_fd(this->li_path, this->li_fd.get());

    return retval;
}

file_size_t
line_index::file_size() const
{
    safe::ReadAccess<safe_offsets_state> state(this->li_state);

    return state->os_file_size;
}

file_size_t
line_index::partial_size() const
{
    safe::ReadAccess<safe_offsets_state> state(this->li_state);

    return state->os_file_size - state->os_partial_start;
}

size_t
line_index::max_line_length() const
{
    safe::ReadAccess<safe_offsets_state> state(this->li_state);

    return state->os_max_line_length;
}

}  // namespace loupe
