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
 * @file log_level.cc
 */

#include <array>

#include "log_level.hh"

#include <ctype.h>
#include <strings.h>

#include "config.h"

const char* const level_names[LEVEL__MAX + 1] = {
    "unknown",
    "trace",
    "debug",
    "info",
    "warning",
    "error",
    "fatal",
    nullptr,
};

namespace {

struct level_alias {
    const char* la_name;
    log_level_t la_level;
};

constexpr std::array<level_alias, 13> LEVEL_ALIASES = {{
    {"trace", LEVEL_TRACE},
    {"debug", LEVEL_DEBUG},
    {"info", LEVEL_INFO},
    {"warn", LEVEL_WARNING},
    {"warning", LEVEL_WARNING},
    {"error", LEVEL_ERROR},
    {"err", LEVEL_ERROR},
    {"fatal", LEVEL_FATAL},
    {"critical", LEVEL_FATAL},
    {"crit", LEVEL_FATAL},
    {"emerg", LEVEL_FATAL},
    {"emergency", LEVEL_FATAL},
    {"panic", LEVEL_FATAL},
}};

struct level_keyword {
    const char* lk_word;
    int lk_length;
    log_level_t lk_level;
};

/* Checked in order, so "warning" is tried before "warn". */
constexpr std::array<level_keyword, 7> LEVEL_KEYWORDS = {{
    {"fatal", 5, LEVEL_FATAL},
    {"error", 5, LEVEL_ERROR},
    {"warning", 7, LEVEL_WARNING},
    {"warn", 4, LEVEL_WARNING},
    {"info", 4, LEVEL_INFO},
    {"debug", 5, LEVEL_DEBUG},
    {"trace", 5, LEVEL_TRACE},
}};

bool
keyword_at(const string_fragment& text, int pos, const level_keyword& kw)
{
    auto end = pos + kw.lk_length;

    if (end > text.length()) {
        return false;
    }
    if (strncasecmp(&text.data()[pos], kw.lk_word, kw.lk_length) != 0) {
        return false;
    }

    return end == text.length() || !isalpha((unsigned char) text[end]);
}

}  // namespace

std::optional<log_level_t>
alias2level(string_fragment levelstr)
{
    for (const auto& alias : LEVEL_ALIASES) {
        if (levelstr.iequal(string_fragment::from_c_str(alias.la_name))) {
            return alias.la_level;
        }
    }

    return std::nullopt;
}

log_level_t
string2level(string_fragment levelstr)
{
    return alias2level(levelstr).value_or(LEVEL_UNKNOWN);
}

log_level_t
scan_level_keyword(string_fragment text)
{
    auto after_ansi = false;
    int lpc = 0;

    while (lpc < text.length()) {
        auto ch = (unsigned char) text[lpc];

        if (ch == 0x1b) {
            lpc += 1;
            if (lpc < text.length() && text[lpc] == '[') {
                lpc += 1;
                while (lpc < text.length()
                       && !((unsigned char) text[lpc] >= 0x40
                            && (unsigned char) text[lpc] <= 0x7e))
                {
                    lpc += 1;
                }
                if (lpc < text.length()) {
                    lpc += 1;
                }
            }
            after_ansi = true;
            continue;
        }

        auto at_boundary = after_ansi || lpc == 0
            || !isalpha((unsigned char) text[lpc - 1]);
        after_ansi = false;
        if (at_boundary && isalpha(ch)) {
            for (const auto& kw : LEVEL_KEYWORDS) {
                if (tolower(ch) == kw.lk_word[0] && keyword_at(text, lpc, kw)) {
                    return kw.lk_level;
                }
            }
        }
        lpc += 1;
    }

    return LEVEL_UNKNOWN;
}
