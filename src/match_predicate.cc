/**
 * Copyright (c) 2025, loupe contributors
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
 * * Neither the name of the loupe project nor the names of its contributors
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
 * @file match_predicate.cc
 */

#include <ctype.h>

#include "match_predicate.hh"

#include "base/loupe_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "query.json.hh"
#include "query.parser.hh"

namespace loupe {

bool
plain_predicate::is_case_sensitive() const
{
    switch (this->pp_case) {
        case case_mode::sensitive:
            return true;
        case case_mode::insensitive:
            return false;
        case case_mode::smart:
            break;
    }

    for (const auto ch : this->pp_needle) {
        if (isupper((unsigned char) ch)) {
            return true;
        }
    }

    return false;
}

match_predicate
match_predicate::plain(std::string needle, case_mode mode)
{
    return plain_predicate{std::move(needle), mode};
}

Result<match_predicate, query::parse_error>
match_predicate::regex(string_fragment pattern, bool insensitive)
{
    auto compile_res
        = pcre2pp::code::from(pattern, insensitive ? PCRE2_CASELESS : 0);

    if (compile_res.isErr()) {
        auto ce = compile_res.unwrapErr();

        return Err(query::parse_error{
            0,
            static_cast<int>(ce.ce_offset),
            fmt::format(FMT_STRING("invalid regex: {}"), ce.get_message()),
            pattern.to_string(),
        });
    }

    return Ok(match_predicate{
        regex_predicate{compile_res.unwrap().to_shared(), insensitive}});
}

Result<match_predicate, query::parse_error>
match_predicate::from_query(query::query_ast ast)
{
    auto cq = TRY(query::compiled_query::compile(std::move(ast)));

    return Ok(match_predicate{query_predicate{std::move(cq)}});
}

bool
match_predicate::matches(string_fragment line,
                         const query::line_fields& fields) const
{
    return this->match(
        [&line](const plain_predicate& pp) {
            auto needle = string_fragment::from_str(pp.pp_needle);

            if (pp.is_case_sensitive()) {
                return line.find(needle).has_value();
            }
            return line.ifind(needle).has_value();
        },
        [&line](const regex_predicate& rp) {
            return rp.rp_code->find_in(line).ignore_error().has_value();
        },
        [&fields](const query_predicate& qp) {
            return qp.qp_query->matches(fields);
        });
}

match_info
match_predicate::evaluate(string_fragment line, line_flags_t flags) const
{
    match_info retval;

    if (this->is<query_predicate>()) {
        const auto& qp = this->get_unchecked<query_predicate>();

        retval.mi_fields = qp.qp_query->extract(line, flags);
        retval.mi_parse_failed = !retval.mi_fields.lf_parsed;
    }
    retval.mi_matched = this->matches(line, retval.mi_fields);

    return retval;
}

std::optional<log_level_t>
match_predicate::bitmap_shortcut() const
{
    if (!this->is<query_predicate>()) {
        return std::nullopt;
    }

    return this->get_unchecked<query_predicate>().qp_query->severity_shortcut();
}

std::pair<line_flags_t, line_flags_t>
match_predicate::flags_prefilter() const
{
    if (!this->is<query_predicate>()) {
        return {0, 0};
    }

    return this->get_unchecked<query_predicate>().qp_query->flags_prefilter();
}

const query::compiled_query*
match_predicate::get_query() const
{
    if (!this->is<query_predicate>()) {
        return nullptr;
    }

    return this->get_unchecked<query_predicate>().qp_query.get();
}

std::string
match_predicate::to_string() const
{
    return this->match(
        [](const plain_predicate& pp) {
            return fmt::format(FMT_STRING("plain:{}"), pp.pp_needle);
        },
        [](const regex_predicate& rp) {
            return fmt::format(FMT_STRING("/{}/{}"),
                               rp.rp_code->get_pattern(),
                               rp.rp_insensitive ? "i" : "");
        },
        [](const query_predicate& qp) {
            return fmt::format(FMT_STRING("query:{}"),
                               query::to_string(qp.qp_query->get_ast()));
        });
}

bool
match_predicate::operator==(const match_predicate& rhs) const
{
    if (this->which() != rhs.which()) {
        return false;
    }

    return this->match(
        [&rhs](const plain_predicate& pp) {
            const auto& other = rhs.get_unchecked<plain_predicate>();

            return pp.pp_needle == other.pp_needle
                && pp.pp_case == other.pp_case;
        },
        [&rhs](const regex_predicate& rp) {
            const auto& other = rhs.get_unchecked<regex_predicate>();

            return rp.rp_code->get_pattern() == other.rp_code->get_pattern()
                && rp.rp_insensitive == other.rp_insensitive;
        },
        [&rhs](const query_predicate& qp) {
            const auto& other = rhs.get_unchecked<query_predicate>();

            return qp.qp_query->get_ast() == other.qp_query->get_ast();
        });
}

Result<match_predicate, query::parse_error>
parse_predicate_spec(string_fragment spec)
{
    if (spec.startswith("plain:")) {
        return Ok(match_predicate::plain(spec.substr(6).to_string()));
    }
    if (spec.startswith("regex:")) {
        return match_predicate::regex(spec.substr(6));
    }
    if (spec.startswith("query:")) {
        auto ast = TRY(query::parse_query(spec.substr(6)));

        return match_predicate::from_query(std::move(ast));
    }
    if (spec.length() >= 2 && spec.startswith("/")) {
        if (spec.endswith("/")) {
            return match_predicate::regex(spec.sub_range(1, spec.length() - 1));
        }
        if (spec.length() >= 3 && spec.endswith("/i")) {
            return match_predicate::regex(
                spec.sub_range(1, spec.length() - 2), true);
        }
    }

    auto trimmed = spec.trim();
    if (!trimmed.empty() && trimmed.front() == '{') {
        auto ast = TRY(query::parse_structured_query(trimmed));

        return match_predicate::from_query(std::move(ast));
    }

    if (spec.empty()) {
        return Err(query::parse_error{0, 0, "empty filter", ""});
    }

    return Ok(match_predicate::plain(spec.to_string()));
}

}  // namespace loupe
