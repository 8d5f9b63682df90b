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
 * @file line_index.hh
 */

#ifndef loupe_line_index_hh
#define loupe_line_index_hh

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <sys/types.h>

#include "base/auto_fd.hh"
#include "base/file_range.hh"
#include "base/fs_util.hh"
#include "chunky_index.hh"
#include "line_buffer.hh"
#include "loupe.cfg.hh"
#include "mapbox/variant.hpp"
#include "result.h"
#include "safe/safe.h"

namespace loupe {

/**
 * Index of the line-start offsets in a single file.  The index is built with
 * one full scan when the file is opened and then extended with sync(), which
 * only reads the bytes appended since the previous scan.
 *
 * sync() and finalize() must be called from a single thread.  The accessors
 * can be called from any thread; they see the index as of the last completed
 * sync().
 */
class line_index {
public:
    /**
     * Lines were added.  Lines before a_first_line are unchanged, lines from
     * a_first_line up to the new size are new.  a_first_line is less than
     * the previous size only when a finalized partial line was reopened
     * because more bytes arrived.
     */
    struct appended {
        size_t a_first_line{0};
        size_t a_new_lines{0};

        bool operator==(const appended& rhs) const
        {
            return this->a_first_line == rhs.a_first_line
                && this->a_new_lines == rhs.a_new_lines;
        }
    };

    /**
     * The file shrank or was replaced.  The index is left as it was and
     * should be discarded.
     */
    struct truncated {
        std::string t_reason;
    };

    using sync_result = mapbox::util::variant<appended, truncated>;

    static Result<std::shared_ptr<line_index>, io_error> open(
        const std::filesystem::path& path, const engine_config& cfg = {});

    line_index(const line_index&) = delete;

    line_index& operator=(const line_index&) = delete;

    Result<sync_result, io_error> sync();

    /**
     * Count a trailing unterminated line as a complete line.
     *
     * @return True if a line was added.
     */
    bool finalize();

    bool is_finalized() const;

    /** @return The number of lines. */
    size_t size() const;

    /** @return The byte range of a line, including its terminator. */
    std::optional<file_range> line_at(size_t index) const;

    /**
     * Read the text of a line, without its terminator, using the given
     * buffer.  The buffer must be reading this index's descriptor.
     */
    Result<string_fragment, io_error> read_line(line_buffer& lb,
                                                size_t index,
                                                bool* has_cr = nullptr) const;

    /** @return A buffer that reads from this index's file. */
    std::unique_ptr<line_buffer> create_buffer() const;

    file_size_t file_size() const;

    /** @return The number of bytes after the last line terminator. */
    file_size_t partial_size() const;

    /** @return The length of the longest line, without its terminator. */
    size_t max_line_length() const;

    const std::filesystem::path& get_path() const { return this->li_path; }

    int get_fd() const { return this->li_fd.get(); }

    const engine_config& get_config() const { return this->li_config; }

private:
    line_index(std::filesystem::path path,
               auto_fd fd,
               const engine_config& cfg);

    struct offsets_state {
        chunky_index<file_off_t> os_starts;
        /** The end of the last counted line. */
        file_off_t os_end{0};
        /** The offset after the last terminator. */
        file_off_t os_partial_start{0};
        file_size_t os_file_size{0};
        size_t os_max_line_length{0};
        bool os_finalized{false};
        /** True if finalize() added the partial line to os_starts. */
        bool os_partial_counted{false};
    };

    using safe_offsets_state = safe::Safe<offsets_state>;

    struct identity {
        dev_t i_dev{0};
        ino_t i_ino{0};
        size_t i_fingerprint_len{0};
        uint32_t i_fingerprint{0};
    };

    Result<uint32_t, io_error> fingerprint(size_t len);

    std::filesystem::path li_path;
    auto_fd li_fd;
    engine_config li_config;
    line_buffer li_line_buffer;
    identity li_identity;
    mutable safe_offsets_state li_state;
};

}  // namespace loupe

#endif
