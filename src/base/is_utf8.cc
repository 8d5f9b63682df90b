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
 * @file is_utf8.cc
 */

#include "is_utf8.hh"

#include "config.h"

/*
  Table 3-7. Well-Formed UTF-8 Byte Sequences
  -----------------------------------------------------------------------------
  |  Code Points        | First Byte | Second Byte | Third Byte | Fourth Byte |
  |  U+0000..U+007F     |     00..7F |             |            |             |
  |  U+0080..U+07FF     |     C2..DF |      80..BF |            |             |
  |  U+0800..U+0FFF     |         E0 |      A0..BF |     80..BF |             |
  |  U+1000..U+CFFF     |     E1..EC |      80..BF |     80..BF |             |
  |  U+D000..U+D7FF     |         ED |      80..9F |     80..BF |             |
  |  U+E000..U+FFFF     |     EE..EF |      80..BF |     80..BF |             |
  |  U+10000..U+3FFFF   |         F0 |      90..BF |     80..BF |      80..BF |
  |  U+40000..U+FFFFF   |     F1..F3 |      80..BF |     80..BF |      80..BF |
  |  U+100000..U+10FFFF |         F4 |      80..8F |     80..BF |      80..BF |
  -----------------------------------------------------------------------------
*/

namespace {

struct seq_check {
    /** Length of the well-formed sequence, or zero if it is ill-formed. */
    int sc_length{0};
    /** Number of bytes that take part in the error. */
    int sc_faulty{0};
    /** Number of bytes to replace when resynchronizing. */
    int sc_skip{1};
    const char* sc_message{nullptr};
};

seq_check
check_sequence(const unsigned char* ustr, ssize_t avail)
{
    seq_check retval;
    unsigned char lo = 0x80, hi = 0xBF;
    int expected;

    if (ustr[0] <= 0x7F) {
        retval.sc_length = 1;
        return retval;
    }
    if (ustr[0] >= 0xC2 && ustr[0] <= 0xDF) {
        expected = 2;
    } else if (ustr[0] >= 0xE0 && ustr[0] <= 0xEF) {
        expected = 3;
        if (ustr[0] == 0xE0) {
            lo = 0xA0;
        } else if (ustr[0] == 0xED) {
            hi = 0x9F;
        }
    } else if (ustr[0] >= 0xF0 && ustr[0] <= 0xF4) {
        expected = 4;
        if (ustr[0] == 0xF0) {
            lo = 0x90;
        } else if (ustr[0] == 0xF4) {
            hi = 0x8F;
        }
    } else {
        retval.sc_faulty = 1;
        retval.sc_message
            = "Expecting bytes in the following ranges: 00..7F C2..F4.";
        return retval;
    }

    for (int lpc = 1; lpc < expected; lpc++) {
        if (lpc >= avail) {
            retval.sc_faulty = lpc;
            retval.sc_skip = lpc;
            retval.sc_message = "Truncated multi-byte sequence.";
            return retval;
        }

        auto byte_lo = lpc == 1 ? lo : (unsigned char) 0x80;
        auto byte_hi = lpc == 1 ? hi : (unsigned char) 0xBF;
        if (ustr[lpc] < byte_lo || ustr[lpc] > byte_hi) {
            retval.sc_faulty = lpc + 1;
            retval.sc_skip = lpc;
            retval.sc_message = "Invalid continuation byte.";
            return retval;
        }
    }

    retval.sc_length = expected;
    return retval;
}

}  // namespace

utf8_scan_result
is_utf8(string_fragment str)
{
    const auto* ustr = str.udata();
    utf8_scan_result retval;
    ssize_t i = 0;
    ssize_t valid_end = -1;

    while (i < str.length()) {
        if (ustr[i] == '\x1b') {
            retval.usr_has_ansi = true;
        }

        auto sc = check_sequence(&ustr[i], str.length() - i);
        if (sc.sc_length > 0) {
            i += sc.sc_length;
            continue;
        }

        if (retval.usr_message == nullptr) {
            retval.usr_message = sc.sc_message;
            retval.usr_faulty_bytes = sc.sc_faulty;
            valid_end = i;
        }
        retval.usr_invalid_count += 1;
        i += sc.sc_skip;
    }

    retval.usr_valid_frag
        = str.sub_range(0, valid_end == -1 ? str.length() : valid_end);
    return retval;
}

size_t
scrub_to_utf8(string_fragment str, std::string& out)
{
    static constexpr const char REPLACEMENT[] = "\xEF\xBF\xBD";

    const auto* ustr = str.udata();
    size_t retval = 0;
    ssize_t i = 0;

    out.reserve(out.size() + str.length());
    while (i < str.length()) {
        auto sc = check_sequence(&ustr[i], str.length() - i);

        if (sc.sc_length > 0) {
            out.append(str.data() + i, sc.sc_length);
            i += sc.sc_length;
        } else {
            out.append(REPLACEMENT);
            retval += 1;
            i += sc.sc_skip;
        }
    }

    return retval;
}
