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
 * @file pcre2pp.cc
 */

#include "pcre2pp.hh"

#include "base/loupe_log.hh"
#include "config.h"

namespace loupe {
namespace pcre2pp {

static std::string
error_message(int rc)
{
    unsigned char buffer[1024];

    pcre2_get_error_message(rc, buffer, sizeof(buffer));

    return {(const char*) buffer};
}

std::string
compile_error::get_message() const
{
    return error_message(this->ce_code);
}

std::string
match_error::get_message() const
{
    return error_message(this->me_code);
}

match_data::match_data(auto_mem<pcre2_match_data> dat)
    : md_data(std::move(dat))
{
}

std::optional<string_fragment>
match_data::operator[](size_t index) const
{
    if (index >= this->md_count) {
        return std::nullopt;
    }

    const auto* ovector = pcre2_get_ovector_pointer(this->md_data.in());
    auto start = ovector[index * 2];
    auto stop = ovector[index * 2 + 1];

    if (start == PCRE2_UNSET || stop == PCRE2_UNSET) {
        return std::nullopt;
    }

    return this->md_subject.sub_range(start, stop);
}

std::optional<found>
matches_result::ignore_error() const
{
    return this->match(
        [](const found& fo) { return std::make_optional(fo); },
        [](const not_found&) -> std::optional<found> { return std::nullopt; },
        [](const match_error& err) -> std::optional<found> {
            log_error("pcre2_match failed: %s", err.get_message().c_str());
            return std::nullopt;
        });
}

Result<code, compile_error>
code::from(string_fragment sf, uint32_t options)
{
    compile_error ce;
    auto_mem<pcre2_code> co(pcre2_code_free);

    co = pcre2_compile(sf.udata(),
                       sf.length(),
                       options | PCRE2_UTF,
                       &ce.ce_code,
                       &ce.ce_offset,
                       nullptr);
    if (co == nullptr) {
        ce.ce_pattern = sf.to_string();
        return Err(ce);
    }

    auto jit_rc = pcre2_jit_compile(co, PCRE2_JIT_COMPLETE);
    if (jit_rc < 0) {
        log_debug("JIT is not available for /%s/: %d",
                  sf.to_string().c_str(),
                  jit_rc);
    }

    return Ok(code{std::move(co), sf.to_string()});
}

size_t
code::get_capture_count() const
{
    uint32_t retval = 0;

    pcre2_pattern_info(this->p_code.in(), PCRE2_INFO_CAPTURECOUNT, &retval);

    return retval;
}

match_data
code::create_match_data() const
{
    auto_mem<pcre2_match_data> md(pcre2_match_data_free);

    md = pcre2_match_data_create_from_pattern(this->p_code.in(), nullptr);

    return match_data{std::move(md)};
}

matches_result
code::find_in(string_fragment subject, match_data& md, int start) const
{
    auto rc = pcre2_match(this->p_code.in(),
                          subject.udata(),
                          subject.length(),
                          start,
                          0,
                          md.md_data.in(),
                          nullptr);

    md.md_subject = subject;
    if (rc == PCRE2_ERROR_NOMATCH) {
        md.md_count = 0;
        return not_found{};
    }
    if (rc < 0) {
        md.md_count = 0;
        return match_error{rc};
    }

    // rc is zero when the ovector was too small for every capture
    md.md_count = rc == 0 ? pcre2_get_ovector_count(md.md_data.in()) : rc;

    auto all = md[0].value();
    return found{
        all,
        subject.sub_range(all.sf_end - subject.sf_begin, subject.length()),
    };
}

matches_result
code::find_in(string_fragment subject) const
{
    thread_local auto_mem<pcre2_match_data> tl_data(pcre2_match_data_free);
    thread_local uint32_t tl_pairs = 0;

    auto pairs = (uint32_t) this->get_capture_count() + 1;
    if (tl_data.empty() || tl_pairs < pairs) {
        tl_data = pcre2_match_data_create(pairs, nullptr);
        tl_pairs = pairs;
    }

    auto rc = pcre2_match(this->p_code.in(),
                          subject.udata(),
                          subject.length(),
                          0,
                          0,
                          tl_data.in(),
                          nullptr);
    if (rc == PCRE2_ERROR_NOMATCH) {
        return not_found{};
    }
    if (rc < 0) {
        return match_error{rc};
    }

    const auto* ovector = pcre2_get_ovector_pointer(tl_data.in());
    return found{
        subject.sub_range(ovector[0], ovector[1]),
        subject.sub_range(ovector[1], subject.length()),
    };
}

}  // namespace pcre2pp
}  // namespace loupe
