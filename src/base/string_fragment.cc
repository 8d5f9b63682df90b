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
 * @file string_fragment.cc
 */

#include <ctype.h>

#include "string_fragment.hh"

#include "config.h"

std::optional<int>
string_fragment::find(const string_fragment& needle) const
{
    if (needle.empty()) {
        return 0;
    }
    if (needle.length() > this->length()) {
        return std::nullopt;
    }

    const auto* found = (const char*) memmem(
        this->data(), this->length(), needle.data(), needle.length());
    if (found == nullptr) {
        return std::nullopt;
    }

    return found - this->data();
}

std::optional<int>
string_fragment::ifind(const string_fragment& needle) const
{
    if (needle.empty()) {
        return 0;
    }

    const auto first = tolower((unsigned char) needle.front());
    const auto last_start = this->length() - needle.length();
    for (int lpc = 0; lpc <= last_start; lpc++) {
        if (tolower((unsigned char) this->data()[lpc]) != first) {
            continue;
        }
        if (strncasecmp(&this->data()[lpc], needle.data(), needle.length())
            == 0)
        {
            return lpc;
        }
    }

    return std::nullopt;
}

std::optional<string_fragment>
string_fragment::consume_n(int amount) const
{
    if (amount > this->length()) {
        return std::nullopt;
    }

    return string_fragment{
        this->sf_string,
        this->sf_begin + amount,
        this->sf_end,
    };
}

std::string
string_fragment::to_unquoted_string() const
{
    auto sub_sf = *this;

    if (sub_sf.length() >= 2
        && ((sub_sf.startswith("\"") && sub_sf.endswith("\""))
            || (sub_sf.startswith("'") && sub_sf.endswith("'"))))
    {
        sub_sf.sf_begin += 1;
        sub_sf.sf_end -= 1;
    }

    std::string retval;

    retval.reserve(sub_sf.length());

    auto in_escape = false;
    for (auto ch : sub_sf) {
        if (in_escape) {
            switch (ch) {
                case 'n':
                    retval.push_back('\n');
                    break;
                case 't':
                    retval.push_back('\t');
                    break;
                case 'r':
                    retval.push_back('\r');
                    break;
                case '"':
                case '\'':
                case '\\':
                    retval.push_back(ch);
                    break;
                default:
                    retval.push_back('\\');
                    retval.push_back(ch);
                    break;
            }
            in_escape = false;
        } else if (ch == '\\') {
            in_escape = true;
        } else {
            retval.push_back(ch);
        }
    }
    if (in_escape) {
        retval.push_back('\\');
    }

    return retval;
}

string_fragment
string_fragment::trim(const char* tokens) const
{
    string_fragment retval = *this;

    while (retval.sf_begin < retval.sf_end
           && retval.sf_string[retval.sf_begin] != '\0'
           && strchr(tokens, retval.sf_string[retval.sf_begin]) != nullptr)
    {
        retval.sf_begin += 1;
    }

    return retval.rtrim(tokens);
}

string_fragment
string_fragment::rtrim(const char* tokens) const
{
    string_fragment retval = *this;

    while (retval.sf_begin < retval.sf_end
           && retval.sf_string[retval.sf_end - 1] != '\0'
           && strchr(tokens, retval.sf_string[retval.sf_end - 1]) != nullptr)
    {
        retval.sf_end -= 1;
    }

    return retval;
}

string_fragment
string_fragment::trim() const
{
    return this->trim(" \t\r\n");
}
