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
 * @file level_index.hh
 */

#ifndef loupe_level_index_hh
#define loupe_level_index_hh

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "base/fs_util.hh"
#include "base/log_level_enum.hh"
#include "chunky_index.hh"
#include "line_bitmap.hh"
#include "line_flags.hh"
#include "line_index.hh"
#include "result.h"
#include "safe/safe.h"

namespace loupe {

using level_histogram = std::array<size_t, LEVEL__MAX>;

/**
 * The per-line flags of a file along with a bitmap of lines for each
 * severity.  Lines are immutable once they are indexed, so the index only
 * grows, except for a reopened partial line or a full rebuild after the
 * file is truncated.
 *
 * Updates must come from the thread that syncs the line_index.  Readers on
 * other threads see a state consistent with some line count.
 */
class level_index {
public:
    /**
     * A consistent copy of part of the index, used by filter jobs.
     */
    struct range_view {
        /** Changes every time lines are dropped from the index. */
        size_t rv_generation{0};
        line_no_t rv_start{0};
        std::vector<line_flags_t> rv_flags;
        /**
         * The lines in the range with the requested severity, empty if no
         * severity was requested.
         */
        line_bitmap rv_candidates;
    };

    /** @return The number of classified lines. */
    size_t size() const;

    /**
     * Record the flags of the next line.  Lines must be added in order.
     */
    void update(line_no_t line, line_flags_t flags);

    /**
     * Classify the lines in the line index that are not in this index yet.
     *
     * @return The number of lines classified.
     */
    Result<size_t, io_error> catch_up(const line_index& li, line_buffer& lb);

    /** Drop every line at or after the given line number. */
    void truncate(size_t line_count);

    void clear();

    line_flags_t flags_at(line_no_t line) const;

    log_level_t level_at(line_no_t line) const
    {
        return flags2level(this->flags_at(line));
    }

    level_histogram histogram() const;

    /** @return A copy of the bitmap for the given severity. */
    line_bitmap bitmap_for(log_level_t level) const;

    /**
     * @return The lines with the given severity in [start, stop).
     */
    line_bitmap bitmap_range(log_level_t level,
                             line_no_t start,
                             line_no_t stop) const;

    /** @return The number of ill-formed UTF-8 sequences seen so far. */
    size_t decode_errors() const;

    /**
     * Copy the flags of up to "max_count" lines starting at "start".
     *
     * @param level If given, also collect the lines with this severity.
     */
    range_view view_range(line_no_t start,
                          size_t max_count,
                          std::optional<log_level_t> level = std::nullopt) const;

    size_t generation() const;

    /**
     * @return The smallest line count the index was truncated to after the
     *   given generation, or nullopt if it was not truncated.
     */
    std::optional<size_t> rewind_point(size_t since_generation) const;

private:
    struct index_state {
        chunky_index<line_flags_t> is_flags;
        std::array<line_bitmap, LEVEL__MAX> is_bitmaps;
        size_t is_decode_errors{0};
        size_t is_generation{0};
        /** (generation, line count) for each truncate() call. */
        std::vector<std::pair<size_t, size_t>> is_truncations;
    };

    using safe_index_state = safe::Safe<index_state>;

    mutable safe_index_state lvi_state;
};

}  // namespace loupe

#endif
