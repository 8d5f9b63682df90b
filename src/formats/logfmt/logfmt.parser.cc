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
 * @file logfmt.parser.cc
 */

#include <ctype.h>

#include "logfmt.parser.hh"

#include "config.h"

logfmt::parser::parser(string_fragment sf) : p_next_input(sf) {}

static bool
is_key_char(char ch)
{
    return ch != '=' && ch != '"' && !isspace((unsigned char) ch);
}

static bool
is_not_space(char ch)
{
    return !isspace((unsigned char) ch);
}

logfmt::parser::step_result
logfmt::parser::step()
{
    const static auto IS_DQ = string_fragment::tag1{'"'};
    const static auto IS_EQ = string_fragment::tag1{'='};

    auto remaining = this->p_next_input.skip([](char ch) {
        return isspace((unsigned char) ch);
    });

    if (remaining.empty()) {
        this->p_next_input = remaining;
        return end_of_input{};
    }

    auto pair_opt = remaining.split_while(is_key_char);

    if (!pair_opt) {
        auto word = remaining.split_when(
            [](char ch) { return isspace((unsigned char) ch); });

        this->p_next_input = word.second;
        return bare_word{word.first};
    }

    auto key_frag = pair_opt->first;
    auto after_eq = pair_opt->second.consume(IS_EQ);

    if (!after_eq || after_eq->sf_begin != pair_opt->second.sf_begin + 1) {
        auto word = remaining.split_when(
            [](char ch) { return isspace((unsigned char) ch); });

        this->p_next_input = word.second;
        return bare_word{word.first};
    }

    auto value_start = after_eq.value();

    if (value_start.startswith("\"")) {
        string_fragment::quoted_string_body qsb;
        auto body = value_start.consume_n(1).value();
        auto quoted_pair = body.split_while(qsb);
        auto after_body = quoted_pair ? quoted_pair->second : body;
        auto after_quote = after_body.consume(IS_DQ);

        if (!after_quote) {
            this->p_next_input = string_fragment{};
            return error{value_start.sf_begin, "non-terminated string"};
        }

        this->p_next_input = after_quote.value();
        return std::make_pair(
            key_frag,
            value_type{quoted_value{string_fragment{
                value_start.sf_string,
                value_start.sf_begin,
                after_quote->sf_begin,
            }}});
    }

    auto value_pair = value_start.split_while(is_not_space);

    if (value_pair) {
        this->p_next_input = value_pair->second;
        return std::make_pair(key_frag,
                              value_type{unquoted_value{value_pair->first}});
    }

    this->p_next_input = value_start;
    return std::make_pair(
        key_frag,
        value_type{unquoted_value{string_fragment{
            value_start.sf_string, value_start.sf_begin, value_start.sf_begin}}});
}

std::string
logfmt::to_string(const parser::value_type& value)
{
    return value.match(
        [](const parser::unquoted_value& uv) { return uv.uv_value.to_string(); },
        [](const parser::quoted_value& qv) {
            return qv.qv_value.to_unquoted_string();
        });
}
