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
 * @file query.ast.hh
 */

#ifndef loupe_query_ast_hh
#define loupe_query_ast_hh

#include <optional>
#include <string>
#include <vector>

#include "base/string_fragment.hh"

namespace loupe {
namespace query {

enum class source_format {
    plain,
    json,
    logfmt,
};

enum class compare_op {
    eq,
    ne,
    gt,
    lt,
    gte,
    lte,
    regex,
    not_regex,
    contains,
};

struct filter_clause {
    std::string fc_field;
    compare_op fc_op{compare_op::eq};
    std::string fc_value;

    bool operator==(const filter_clause& rhs) const
    {
        return this->fc_field == rhs.fc_field && this->fc_op == rhs.fc_op
            && this->fc_value == rhs.fc_value;
    }
};

/**
 * Reject a line when the field contains the pattern.  Only the structured
 * form of a query can express exclusions.
 */
struct exclude_clause {
    std::string ec_field;
    std::string ec_pattern;

    bool operator==(const exclude_clause& rhs) const
    {
        return this->ec_field == rhs.ec_field
            && this->ec_pattern == rhs.ec_pattern;
    }
};

struct aggregate_clause {
    std::vector<std::string> ac_fields;
    std::optional<size_t> ac_limit;

    bool operator==(const aggregate_clause& rhs) const
    {
        return this->ac_fields == rhs.ac_fields
            && this->ac_limit == rhs.ac_limit;
    }
};

struct query_ast {
    source_format qa_format{source_format::plain};
    std::vector<filter_clause> qa_filters;
    std::vector<exclude_clause> qa_excludes;
    std::optional<aggregate_clause> qa_aggregate;

    bool operator==(const query_ast& rhs) const
    {
        return this->qa_format == rhs.qa_format
            && this->qa_filters == rhs.qa_filters
            && this->qa_excludes == rhs.qa_excludes
            && this->qa_aggregate == rhs.qa_aggregate;
    }

    bool operator!=(const query_ast& rhs) const { return !(*this == rhs); }
};

/**
 * A malformed query.  The stage is the zero-based index of the
 * pipe-separated stage that failed and the offset is a byte offset into the
 * input.  The stage text is the trimmed source of that stage, empty when
 * the error is not tied to a stage.
 */
struct parse_error {
    int pe_stage{0};
    int pe_offset{0};
    std::string pe_msg;
    std::string pe_input;
    std::string pe_stage_text;

    std::string to_string() const;
};

/** The names of the pseudo-fields available to plain queries. */
constexpr const char* PLAIN_LINE_FIELD = "line";
constexpr const char* PLAIN_LEVEL_FIELD = "level";
constexpr const char* PLAIN_SEVERITY_FIELD = "severity";

const char* format_name(source_format fmt);

std::optional<source_format> format_from_name(string_fragment name);

/** @return The operator as it is written in the text form. */
const char* op_symbol(compare_op op);

/** @return The operator name used in the structured form. */
const char* op_name(compare_op op);

/**
 * Look up an operator by its structured-form name or its symbol.
 */
std::optional<compare_op> op_from_string(string_fragment str);

bool is_plain_field(const std::string& field);

}  // namespace query
}  // namespace loupe

#endif
