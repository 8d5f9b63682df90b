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
 * @file log_level.hh
 */

#ifndef log_level_hh
#define log_level_hh

#include <optional>

#include <sys/types.h>

#include "base/log_level_enum.hh"
#include "base/string_fragment.hh"

extern const char* const level_names[LEVEL__MAX + 1];

constexpr size_t MAX_LEVEL_NAME_LEN = 7;

/**
 * Map a level name to its severity using the alias table (e.g. "err",
 * "crit", "warning").  The comparison ignores case.
 *
 * @return The severity or nullopt if the name is not a known alias.
 */
std::optional<log_level_t> alias2level(string_fragment levelstr);

/**
 * Same as alias2level(), but unknown names map to LEVEL_UNKNOWN.
 */
log_level_t string2level(string_fragment levelstr);

/**
 * Scan the given text for the first word-bounded severity keyword.  ANSI
 * escape sequences are skipped in place.
 */
log_level_t scan_level_keyword(string_fragment text);

#endif
