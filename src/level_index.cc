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
 * @file level_index.cc
 */

#include <algorithm>
#include <vector>

#include "level_index.hh"

#include "base/loupe_log.hh"
#include "config.h"

namespace loupe {

static constexpr size_t CLASSIFY_BATCH_SIZE = 1024;

size_t
level_index::size() const
{
    safe::ReadAccess<safe_index_state> state(this->lvi_state);

    return state->is_flags.size();
}

void
level_index::update(line_no_t line, line_flags_t flags)
{
    safe::WriteAccess<safe_index_state> state(this->lvi_state);

    require(line == state->is_flags.size());

    state->is_flags.push_back(flags);
    state->is_bitmaps[flags2level(flags)].append(line);
}

Result<size_t, io_error>
level_index::catch_up(const line_index& li, line_buffer& lb)
{
    auto start = this->size();
    auto end = li.size();
    std::vector<line_flags_t> batch;
    std::string scratch;
    size_t retval = 0;

    batch.reserve(CLASSIFY_BATCH_SIZE);
    for (auto curr = start; curr < end;) {
        size_t decode_errors = 0;

        batch.clear();
        for (; curr < end && batch.size() < CLASSIFY_BATCH_SIZE; curr++) {
            auto raw = TRY(li.read_line(lb, curr));
            auto text = decode_line(raw, scratch, decode_errors);

            batch.push_back(classify_line(text));
        }

        safe::WriteAccess<safe_index_state> state(this->lvi_state);
        auto line = (line_no_t) state->is_flags.size();

        for (const auto flags : batch) {
            state->is_flags.push_back(flags);
            state->is_bitmaps[flags2level(flags)].append(line);
            line += 1;
        }
        state->is_decode_errors += decode_errors;
        retval += batch.size();
    }

    return Ok(retval);
}

void
level_index::truncate(size_t line_count)
{
    safe::WriteAccess<safe_index_state> state(this->lvi_state);

    if (state->is_flags.size() <= line_count) {
        return;
    }

    while (state->is_flags.size() > line_count) {
        state->is_flags.pop_back();
    }
    for (auto& bm : state->is_bitmaps) {
        bm.truncate(line_count);
    }
    state->is_generation += 1;
    state->is_truncations.emplace_back(state->is_generation, line_count);
}

void
level_index::clear()
{
    safe::WriteAccess<safe_index_state> state(this->lvi_state);

    state->is_flags.clear();
    for (auto& bm : state->is_bitmaps) {
        bm.clear();
    }
    state->is_decode_errors = 0;
    state->is_generation += 1;
    state->is_truncations.emplace_back(state->is_generation, 0);
}

line_flags_t
level_index::flags_at(line_no_t line) const
{
    safe::ReadAccess<safe_index_state> state(this->lvi_state);

    return state->is_flags[line];
}

level_histogram
level_index::histogram() const
{
    safe::ReadAccess<safe_index_state> state(this->lvi_state);
    level_histogram retval;

    for (size_t lpc = 0; lpc < retval.size(); lpc++) {
        retval[lpc] = state->is_bitmaps[lpc].size();
    }

    return retval;
}

line_bitmap
level_index::bitmap_for(log_level_t level) const
{
    safe::ReadAccess<safe_index_state> state(this->lvi_state);

    return state->is_bitmaps[level];
}

line_bitmap
level_index::bitmap_range(log_level_t level,
                          line_no_t start,
                          line_no_t stop) const
{
    safe::ReadAccess<safe_index_state> state(this->lvi_state);
    auto range = state->is_bitmaps[level].equal_range(start, stop);
    line_bitmap retval;

    for (auto iter = range.first; iter != range.second; ++iter) {
        retval.append(*iter);
    }

    return retval;
}

size_t
level_index::decode_errors() const
{
    safe::ReadAccess<safe_index_state> state(this->lvi_state);

    return state->is_decode_errors;
}

level_index::range_view
level_index::view_range(line_no_t start,
                        size_t max_count,
                        std::optional<log_level_t> level) const
{
    safe::ReadAccess<safe_index_state> state(this->lvi_state);
    range_view retval;
    size_t stop = std::min(state->is_flags.size(), start + max_count);

    retval.rv_generation = state->is_generation;
    retval.rv_start = start;
    if (start >= stop) {
        return retval;
    }

    retval.rv_flags.reserve(stop - start);
    for (auto iter = state->is_flags.begin() + start;
         iter != state->is_flags.begin() + stop;
         ++iter)
    {
        retval.rv_flags.push_back(*iter);
    }
    if (level) {
        auto range = state->is_bitmaps[level.value()].equal_range(
            start, (line_no_t) stop);

        for (auto iter = range.first; iter != range.second; ++iter) {
            retval.rv_candidates.append(*iter);
        }
    }

    return retval;
}

size_t
level_index::generation() const
{
    safe::ReadAccess<safe_index_state> state(this->lvi_state);

    return state->is_generation;
}

std::optional<size_t>
level_index::rewind_point(size_t since_generation) const
{
    safe::ReadAccess<safe_index_state> state(this->lvi_state);
    std::optional<size_t> retval;

    for (const auto& trunc : state->is_truncations) {
        if (trunc.first <= since_generation) {
            continue;
        }
        if (!retval || trunc.second < retval.value()) {
            retval = trunc.second;
        }
    }

    return retval;
}

}  // namespace loupe
