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
 * @file is_utf8.hh
 */

#ifndef loupe_is_utf8_hh
#define loupe_is_utf8_hh

#include <string>

#include <stdlib.h>
#include <sys/types.h>

#include "string_fragment.hh"

struct utf8_scan_result {
    const char* usr_message{nullptr};
    size_t usr_faulty_bytes{0};
    /** The number of ill-formed sequences found in the whole input. */
    size_t usr_invalid_count{0};
    string_fragment usr_valid_frag{string_fragment::invalid()};
    bool usr_has_ansi{false};

    bool is_valid() const { return this->usr_message == nullptr; }
};

/**
 * Check if the given fragment is a valid UTF-8 sequence.  The message and
 * faulty byte count describe the first error, the valid fragment is the
 * prefix before that error.
 */
utf8_scan_result is_utf8(string_fragment frag);

/**
 * Append the given bytes to "out", replacing each ill-formed sequence with
 * U+FFFD.
 *
 * @return The number of replacements made.
 */
size_t scrub_to_utf8(string_fragment frag, std::string& out);

#endif
