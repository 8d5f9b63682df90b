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
 * @file file_range.hh
 */

#ifndef loupe_file_range_hh
#define loupe_file_range_hh

#include <cstdint>

using file_off_t = int64_t;
using file_size_t = uint64_t;
using file_ssize_t = int64_t;

/**
 * The bytes of one line in a file, including the terminator if the line had
 * one when it was indexed.
 */
struct file_range {
    struct metadata {
        bool m_valid_utf{true};
        bool m_has_ansi{false};
        /** The terminator is "\r\n". */
        bool m_has_cr{false};
    };

    file_off_t fr_offset{0};
    file_ssize_t fr_size{0};
    metadata fr_metadata;

    file_off_t next_offset() const { return this->fr_offset + this->fr_size; }

    bool empty() const { return this->fr_size == 0; }

    bool operator==(const file_range& rhs) const
    {
        return this->fr_offset == rhs.fr_offset && this->fr_size == rhs.fr_size;
    }
};

#endif
