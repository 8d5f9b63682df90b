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
 * @file logfmt.parser.hh
 */

#ifndef loupe_logfmt_parser_hh
#define loupe_logfmt_parser_hh

#include <string>
#include <utility>

#include "base/string_fragment.hh"
#include "mapbox/variant.hpp"

namespace logfmt {

/**
 * Tokenizer for lines of "key=value" pairs.  Words that are not followed by
 * an '=' are returned as bare words so the caller can skip over them.
 */
class parser {
public:
    explicit parser(string_fragment sf);

    struct end_of_input {};
    struct error {
        int e_offset;
        const std::string e_msg;
    };
    struct bare_word {
        string_fragment bw_value;
    };
    struct unquoted_value {
        string_fragment uv_value;
    };
    struct quoted_value {
        /** The value, including the surrounding quotes. */
        string_fragment qv_value;
    };
    using value_type = mapbox::util::variant<unquoted_value, quoted_value>;

    using kvpair = std::pair<string_fragment, value_type>;

    using step_result
        = mapbox::util::variant<end_of_input, kvpair, bare_word, error>;

    step_result step();

private:
    string_fragment p_next_input;
};

/** @return The decoded text of a value returned by the parser. */
std::string to_string(const parser::value_type& value);

}  // namespace logfmt

#endif
