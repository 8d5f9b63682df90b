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
 * @file pcre2pp.hh
 */

#ifndef loupe_pcre2pp_hh
#define loupe_pcre2pp_hh

#define PCRE2_CODE_UNIT_WIDTH 8

#include <memory>
#include <optional>
#include <string>

#include <pcre2.h>

#include "base/auto_mem.hh"
#include "base/string_fragment.hh"
#include "mapbox/variant.hpp"
#include "result.h"

namespace loupe {
namespace pcre2pp {

class code;

struct compile_error {
    std::string ce_pattern;
    int ce_code{0};
    size_t ce_offset{0};

    std::string get_message() const;
};

/**
 * The capture offsets of the last match made with this object.
 */
class match_data {
public:
    std::optional<string_fragment> operator[](size_t index) const;

    /** @return The number of captures set by the last match, including 0. */
    size_t get_count() const { return this->md_count; }

private:
    friend code;

    explicit match_data(auto_mem<pcre2_match_data> dat);

    auto_mem<pcre2_match_data> md_data;
    string_fragment md_subject;
    size_t md_count{0};
};

struct found {
    /** The text matched by the whole pattern. */
    string_fragment f_all;
    /** The text after the match, where the next search should start. */
    string_fragment f_remaining;
};

struct not_found {};

struct match_error {
    int me_code{0};

    std::string get_message() const;
};

class matches_result : public mapbox::util::variant<found, not_found, match_error> {
public:
    using variant::variant;

    /**
     * @return The match, if there was one.  Errors from the matcher, like
     *   hitting the match limit, are logged and count as no match.
     */
    std::optional<found> ignore_error() const;
};

/**
 * A compiled pattern.  Patterns are always compiled in UTF mode since lines
 * are decoded before they are matched.
 */
class code {
public:
    static Result<code, compile_error> from(string_fragment sf,
                                            uint32_t options = 0);

    const std::string& get_pattern() const { return this->p_pattern; }

    std::string to_string() const { return this->p_pattern; }

    size_t get_capture_count() const;

    match_data create_match_data() const;

    /**
     * Search the subject starting at the given offset and record the
     * captures in "md".
     */
    matches_result find_in(string_fragment subject,
                           match_data& md,
                           int start = 0) const;

    /** Search with a per-thread match_data, when the captures do not matter. */
    matches_result find_in(string_fragment subject) const;

    std::shared_ptr<code> to_shared() &&
    {
        return std::make_shared<code>(std::move(*this));
    }

    code(code&&) = default;

private:
    code(auto_mem<pcre2_code> co, std::string pattern)
        : p_code(std::move(co)), p_pattern(std::move(pattern))
    {
    }

    auto_mem<pcre2_code> p_code;
    std::string p_pattern;
};

}  // namespace pcre2pp
}  // namespace loupe

#endif
