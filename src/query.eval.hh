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
 * @file query.eval.hh
 */

#ifndef loupe_query_eval_hh
#define loupe_query_eval_hh

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "base/log_level_enum.hh"
#include "base/string_fragment.hh"
#include "field_extractor.hh"
#include "line_flags.hh"
#include "pcrepp/pcre2pp.hh"
#include "query.ast.hh"
#include "result.h"

namespace loupe {
namespace query {

/**
 * The fields of one line as seen by a query.
 */
struct line_fields {
    /** False if the line could not be parsed in the query's format. */
    bool lf_parsed{true};
    field_map lf_fields;
};

/**
 * Compare two field values.  When both sides are finite numbers the
 * comparison is numeric, otherwise the strings are compared byte-wise.
 *
 * @return A value less than, equal to or greater than zero.
 */
int compare_values(const std::string& lhs, const std::string& rhs);

/**
 * A query_ast with its regular expressions compiled, ready to be evaluated
 * against lines.  Instances are immutable and can be shared between
 * threads.
 */
class compiled_query {
public:
    static Result<std::shared_ptr<const compiled_query>, parse_error> compile(
        query_ast ast);

    compiled_query(const compiled_query&) = delete;
    compiled_query& operator=(const compiled_query&) = delete;

    const query_ast& get_ast() const { return this->cq_ast; }

    source_format get_format() const { return this->cq_ast.qa_format; }

    /**
     * Collect the fields of a decoded line.  For plain queries these are
     * the "line", "level" and "severity" pseudo-fields.
     *
     * @param flags The classification of the line from classify_line().
     */
    line_fields extract(string_fragment line, line_flags_t flags) const;

    /**
     * @return True if the line was parsed in the query's format, and the
     *   fields pass every filter and no exclusion.
     */
    bool matches(const line_fields& lf) const;

    /**
     * A severity that every matching line must have been classified with,
     * if one of the filters implies it.
     */
    std::optional<log_level_t> severity_shortcut() const;

    /**
     * A (mask, want) pair over the line flags that every matching line
     * satisfies, i.e. (flags & mask) == want.
     */
    std::pair<line_flags_t, line_flags_t> flags_prefilter() const;

private:
    struct compiled_filter {
        const filter_clause* cf_clause;
        std::shared_ptr<pcre2pp::code> cf_regex;
    };

    explicit compiled_query(query_ast ast) : cq_ast(std::move(ast)) {}

    bool eval_filter(const compiled_filter& cf, const std::string& value) const;

    query_ast cq_ast;
    std::vector<compiled_filter> cq_filters;
};

}  // namespace query
}  // namespace loupe

#endif
