/**
 * Copyright (c) 2025, Timothy Stack
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
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file line_buffer.cc
 */

#include <algorithm>

#include <string.h>

#include "line_buffer.hh"

#include "base/loupe_log.hh"
#include "config.h"

namespace loupe {

line_buffer::line_buffer(size_t block_size)
    : lb_block_size(std::max<size_t>(block_size, 1))
{
}

void
line_buffer::set_fd(const std::filesystem::path& path, int fd)
{
    this->lb_path = path;
    this->lb_fd = fd;
    this->reset();
}

void
line_buffer::reset()
{
    this->lb_buffer_size = 0;
    this->lb_file_offset = 0;
}

Result<void, io_error>
line_buffer::fill_range(file_off_t start, size_t len)
{
    require(this->lb_fd != -1);

    len = std::max(len, this->lb_block_size);
    if (this->lb_buffer.size() < len) {
        this->lb_buffer.resize(len);
    }

    this->lb_buffer_size = 0;
    this->lb_file_offset = start;
    auto read_res = filesystem::pread_fully(
        this->lb_path, this->lb_fd, this->lb_buffer.data(), len, start);
    if (read_res.isErr()) {
        return Err(read_res.unwrapErr());
    }
    this->lb_buffer_size = read_res.unwrap();

    return Ok();
}

Result<file_off_t, io_error>
line_buffer::scan_lines(file_off_t start,
                        file_off_t end,
                        const line_callback& cb)
{
    file_off_t line_start = start;
    file_off_t offset = start;
    bool prev_was_cr = false;

    while (offset < end) {
        auto request = std::min<size_t>(this->lb_block_size, end - offset);

        TRY(this->fill_range(offset, request));
        if (this->lb_buffer_size == 0) {
            log_warning("file shrank while scanning -- %s",
                        this->lb_path.c_str());
            break;
        }

        auto avail = std::min<size_t>(this->lb_buffer_size, end - offset);
        const auto* block = this->lb_buffer.data();
        size_t pos = 0;

        while (pos < avail) {
            const auto* lf
                = (const char*) memchr(&block[pos], '\n', avail - pos);

            if (lf == nullptr) {
                prev_was_cr = block[avail - 1] == '\r';
                pos = avail;
                break;
            }

            auto lf_pos = (size_t) (lf - block);
            file_range fr;

            fr.fr_offset = line_start;
            fr.fr_size = offset + lf_pos + 1 - line_start;
            if (lf_pos > 0) {
                fr.fr_metadata.m_has_cr = block[lf_pos - 1] == '\r';
            } else {
                fr.fr_metadata.m_has_cr = prev_was_cr && fr.fr_size > 1;
            }
            prev_was_cr = false;
            cb(fr);

            line_start = fr.next_offset();
            pos = lf_pos + 1;
        }

        offset += avail;
    }

    return Ok(line_start);
}

Result<string_fragment, io_error>
line_buffer::read_range(file_range fr)
{
    if (fr.fr_size == 0) {
        return Ok(string_fragment::from_const(""));
    }

    if (!this->in_range(fr)) {
        TRY(this->fill_range(fr.fr_offset, fr.fr_size));
        if (!this->in_range(fr)) {
            return Err(io_error{
                this->lb_path,
                0,
                fmt::format(FMT_STRING("short read at offset {} -- {}"),
                            fr.fr_offset,
                            this->lb_path),
            });
        }
    }

    auto buffer_offset = fr.fr_offset - this->lb_file_offset;

    return Ok(string_fragment::from_bytes(
        &this->lb_buffer[buffer_offset], (size_t) fr.fr_size));
}

string_fragment
line_buffer::trim_terminator(string_fragment bytes, bool& has_cr)
{
    has_cr = false;
    if (!bytes.empty() && bytes.back() == '\n') {
        bytes.sf_end -= 1;
        if (!bytes.empty() && bytes.back() == '\r') {
            bytes.sf_end -= 1;
            has_cr = true;
        }
    }

    return bytes;
}

}  // namespace loupe
