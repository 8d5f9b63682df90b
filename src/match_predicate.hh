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
 * @file match_predicate.hh
 */

#ifndef loupe_match_predicate_hh
#define loupe_match_predicate_hh

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "base/log_level_enum.hh"
#include "base/string_fragment.hh"
#include "line_flags.hh"
#include "mapbox/variant.hpp"
#include "pcrepp/pcre2pp.hh"
#include "query.ast.hh"
#include "query.eval.hh"
#include "result.h"

namespace loupe {

enum class case_mode {
    sensitive,
    insensitive,
    /** Insensitive unless the needle has an upper-case letter. */
    smart,
};

struct plain_predicate {
    std::string pp_needle;
    case_mode pp_case{case_mode::smart};

    bool is_case_sensitive() const;
};

struct regex_predicate {
    std::shared_ptr<pcre2pp::code> rp_code;
    bool rp_insensitive{false};
};

struct query_predicate {
    std::shared_ptr<const query::compiled_query> qp_query;
};

/**
 * The outcome of evaluating a predicate against one line.
 */
struct match_info {
    bool mi_matched{false};
    /** True if a structured query could not parse the line. */
    bool mi_parse_failed{false};
    query::line_fields mi_fields;
};

/**
 * A test applied to each line of a source by a filter job.
 */
class match_predicate
    : public mapbox::util::variant<plain_predicate,
                                   regex_predicate,
                                   query_predicate> {
public:
    using variant::variant;

    static match_predicate plain(std::string needle,
                                 case_mode mode = case_mode::smart);

    static Result<match_predicate, query::parse_error> regex(
        string_fragment pattern, bool insensitive = false);

    static Result<match_predicate, query::parse_error> from_query(
        query::query_ast ast);

    /**
     * @param line The decoded text of the line.
     * @param fields The fields of the line, only used by queries.
     */
    bool matches(string_fragment line, const query::line_fields& fields) const;

    /**
     * Evaluate the predicate, extracting the fields of the line first if
     * this is a query.
     *
     * @param flags The classification of the line.
     */
    match_info evaluate(string_fragment line, line_flags_t flags) const;

    /**
     * @return A severity whose bitmap contains every line that can match,
     *   if there is one.
     */
    std::optional<log_level_t> bitmap_shortcut() const;

    /**
     * @return A (mask, want) pair such that every line that can match
     *   satisfies (flags & mask) == want.
     */
    std::pair<line_flags_t, line_flags_t> flags_prefilter() const;

    /** @return The query, if this is a query predicate. */
    const query::compiled_query* get_query() const;

    std::string to_string() const;

    bool operator==(const match_predicate& rhs) const;

    bool operator!=(const match_predicate& rhs) const
    {
        return !(*this == rhs);
    }
};

/**
 * Parse a filter as typed by a user:
 *
 *   plain:<text>     substring match
 *   regex:<pattern>  PCRE2 regular expression
 *   /pattern/[i]     same as regex:, "i" makes it case-insensitive
 *   query:<text>     text form of a query
 *   {...}            structured form of a query
 *   <text>           same as plain:
 *
 * Substring matches use smart case.
 */
Result<match_predicate, query::parse_error> parse_predicate_spec(
    string_fragment spec);

}  // namespace loupe

#endif
