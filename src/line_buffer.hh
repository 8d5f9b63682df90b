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
 * @file line_buffer.hh
 */

#ifndef loupe_line_buffer_hh
#define loupe_line_buffer_hh

#include <filesystem>
#include <functional>
#include <vector>

#include <sys/types.h>

#include "base/file_range.hh"
#include "base/fs_util.hh"
#include "base/string_fragment.hh"
#include "result.h"

namespace loupe {

/**
 * Buffer for reading whole lines out of a file descriptor.  The class
 * presents a stateless interface: callers specify the range they want and
 * the class takes care of caching the surrounding block.  The descriptor is
 * not owned and is only accessed with pread(), so several buffers may share
 * one descriptor across threads.
 */
class line_buffer {
public:
    static constexpr size_t DEFAULT_BLOCK_SIZE = 256 * 1024;

    explicit line_buffer(size_t block_size = DEFAULT_BLOCK_SIZE);

    line_buffer(const line_buffer&) = delete;

    line_buffer& operator=(const line_buffer&) = delete;

    void set_fd(const std::filesystem::path& path, int fd);

    int get_fd() const { return this->lb_fd; }

    /** Forget any cached data. */
    void reset();

    using line_callback = std::function<void(const file_range&)>;

    /**
     * Find the complete lines in the given range of the file.  The callback
     * receives the range of each line, including its terminator, in file
     * order.
     *
     * @param start The offset of the start of a line.
     * @param end The offset to stop scanning at.
     * @return The offset of the first byte after the last terminator found,
     *   which is where the trailing partial line, if any, begins.
     */
    Result<file_off_t, io_error> scan_lines(file_off_t start,
                                            file_off_t end,
                                            const line_callback& cb);

    /**
     * Read the bytes in the given range.  The returned fragment is only
     * valid until the next call on this buffer.
     */
    Result<string_fragment, io_error> read_range(file_range fr);

    /**
     * Strip the line terminator, and a carriage-return preceding it, from
     * the bytes of a line.
     */
    static string_fragment trim_terminator(string_fragment bytes,
                                           bool& has_cr);

private:
    bool in_range(const file_range& fr) const
    {
        return this->lb_file_offset <= fr.fr_offset
            && fr.next_offset()
            <= this->lb_file_offset + (file_off_t) this->lb_buffer_size;
    }

    Result<void, io_error> fill_range(file_off_t start, size_t len);

    std::filesystem::path lb_path;
    int lb_fd{-1};
    size_t lb_block_size;
    std::vector<char> lb_buffer;
    size_t lb_buffer_size{0};
    file_off_t lb_file_offset{0};
};

}  // namespace loupe

#endif
