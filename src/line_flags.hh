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
 * @file line_flags.hh
 */

#ifndef loupe_line_flags_hh
#define loupe_line_flags_hh

#include <cstdint>
#include <string>

#include "base/log_level_enum.hh"
#include "base/string_fragment.hh"
#include "field_extractor.hh"

namespace loupe {

/**
 * Per-line attributes derived when a line is indexed.  The low three bits
 * hold the log_level_t of the line.
 */
using line_flags_t = uint32_t;

constexpr line_flags_t LF_LEVEL_MASK = 0x07;
constexpr line_flags_t LF_FORMAT_JSON = 1U << 3;
constexpr line_flags_t LF_FORMAT_LOGFMT = 1U << 4;
constexpr line_flags_t LF_HAS_ANSI = 1U << 5;
constexpr line_flags_t LF_HAS_TIMESTAMP = 1U << 6;
constexpr line_flags_t LF_IS_EMPTY = 1U << 8;

constexpr int LEVEL_SCAN_LIMIT = 80;
constexpr int TIMESTAMP_SCAN_LIMIT = 30;

inline log_level_t
flags2level(line_flags_t flags)
{
    return static_cast<log_level_t>(flags & LF_LEVEL_MASK);
}

/**
 * Prepare the raw bytes of a line for matching.  Valid UTF-8 is passed
 * through untouched, otherwise the line is copied into "scratch" with the
 * ill-formed sequences replaced.
 *
 * @param replacements Incremented by the number of replaced sequences.
 * @return The text to match against.
 */
string_fragment decode_line(string_fragment raw,
                            std::string& scratch,
                            size_t& replacements);

/**
 * Determine the format flags and severity of a decoded line.
 */
line_flags_t classify_line(string_fragment line);

/** @return The severity bits of classify_line(). */
inline log_level_t
classify(string_fragment line)
{
    return flags2level(classify_line(line));
}

/**
 * Look for a "level", "severity" or "lvl" field, in that order, whose value
 * is a known level alias.
 */
log_level_t level_from_fields(const field_map& fields);

bool has_timestamp_prefix(string_fragment line);

}  // namespace loupe

#endif
