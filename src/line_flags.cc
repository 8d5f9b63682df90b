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
 * @file line_flags.cc
 */

#include <ctype.h>

#include "line_flags.hh"

#include "base/is_utf8.hh"
#include "config.h"
#include "log_level.hh"

namespace loupe {

string_fragment
decode_line(string_fragment raw, std::string& scratch, size_t& replacements)
{
    auto scan_res = is_utf8(raw);

    if (scan_res.is_valid()) {
        return raw;
    }

    scratch.clear();
    replacements += scrub_to_utf8(raw, scratch);

    return string_fragment::from_str(scratch);
}

log_level_t
level_from_fields(const field_map& fields)
{
    static const char* const LEVEL_FIELDS[] = {"level", "severity", "lvl"};

    for (const auto* name : LEVEL_FIELDS) {
        auto iter = fields.find(name);

        if (iter == fields.end()) {
            continue;
        }

        auto level_opt = alias2level(string_fragment::from_str(iter->second));
        if (level_opt) {
            return level_opt.value();
        }
    }

    return LEVEL_UNKNOWN;
}

static bool
digits_at(const string_fragment& sf, int pos, int count)
{
    if (pos + count > sf.length()) {
        return false;
    }
    for (int lpc = 0; lpc < count; lpc++) {
        if (!isdigit((unsigned char) sf[pos + lpc])) {
            return false;
        }
    }

    return true;
}

bool
has_timestamp_prefix(string_fragment line)
{
    auto prefix = line.trim().sub_range(0, TIMESTAMP_SCAN_LIMIT);

    for (int lpc = 0; lpc < prefix.length(); lpc++) {
        if (digits_at(prefix, lpc, 4) && lpc + 4 < prefix.length()
            && prefix[lpc + 4] == '-')
        {
            return true;
        }
        if (digits_at(prefix, lpc, 2) && lpc + 8 <= prefix.length()
            && prefix[lpc + 2] == ':' && digits_at(prefix, lpc + 3, 2)
            && prefix[lpc + 5] == ':' && digits_at(prefix, lpc + 6, 2))
        {
            return true;
        }
    }

    return false;
}

line_flags_t
classify_line(string_fragment line)
{
    line_flags_t retval = 0;
    auto trimmed = line.trim();
    auto level = LEVEL_UNKNOWN;

    if (trimmed.empty()) {
        return LF_IS_EMPTY;
    }

    if (line.find('\x1b')) {
        retval |= LF_HAS_ANSI;
    }
    if (has_timestamp_prefix(line)) {
        retval |= LF_HAS_TIMESTAMP;
    }

    if (trimmed.front() == '{') {
        retval |= LF_FORMAT_JSON;

        auto fields_res = extract_json_fields(line);
        if (fields_res.isOk()) {
            level = level_from_fields(fields_res.unwrap());
        }
    } else if (has_logfmt_pair(line)) {
        retval |= LF_FORMAT_LOGFMT;
        level = level_from_fields(extract_logfmt_fields(line));
    }

    if (level == LEVEL_UNKNOWN) {
        level = scan_level_keyword(line.sub_range(0, LEVEL_SCAN_LIMIT));
    }

    return retval | static_cast<line_flags_t>(level);
}

}  // namespace loupe
