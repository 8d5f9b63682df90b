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
 * @file query.eval.cc
 */

#include <cmath>

#include "query.eval.hh"

#include "base/loupe_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "log_level.hh"
#include "query.parser.hh"
#include "scn/scan.h"

namespace loupe {
namespace query {

static std::optional<double>
to_number(const std::string& str)
{
    auto scan_res = scn::scan_value<double>(std::string_view{str});

    if (!scan_res || !scan_res->range().empty()
        || !std::isfinite(scan_res->value()))
    {
        return std::nullopt;
    }

    return scan_res->value();
}

int
compare_values(const std::string& lhs, const std::string& rhs)
{
    auto lnum = to_number(lhs);

    if (lnum) {
        auto rnum = to_number(rhs);

        if (rnum) {
            if (lnum.value() < rnum.value()) {
                return -1;
            }
            if (lnum.value() > rnum.value()) {
                return 1;
            }
            return 0;
        }
    }

    return lhs.compare(rhs);
}

Result<std::shared_ptr<const compiled_query>, parse_error>
compiled_query::compile(query_ast ast)
{
    std::shared_ptr<compiled_query> retval(new compiled_query(std::move(ast)));
    int stage = retval->cq_ast.qa_format == source_format::plain ? 0 : 1;

    for (const auto& fc : retval->cq_ast.qa_filters) {
        compiled_filter cf{&fc, nullptr};

        if (fc.fc_op == compare_op::regex || fc.fc_op == compare_op::not_regex)
        {
            auto compile_res = pcre2pp::code::from(
                string_fragment::from_str(fc.fc_value));

            if (compile_res.isErr()) {
                auto ce = compile_res.unwrapErr();

                return Err(parse_error{
                    stage,
                    0,
                    fmt::format(FMT_STRING("invalid regex for field '{}': {}"),
                                fc.fc_field,
                                ce.get_message()),
                    fc.fc_value,
                    fmt::format(FMT_STRING("{} {} {}"),
                                fc.fc_field,
                                op_symbol(fc.fc_op),
                                quote_value(fc.fc_value)),
                });
            }
            cf.cf_regex = compile_res.unwrap().to_shared();
        }
        retval->cq_filters.emplace_back(cf);
        stage += 1;
    }

    return Ok(std::shared_ptr<const compiled_query>(std::move(retval)));
}

line_fields
compiled_query::extract(string_fragment line, line_flags_t flags) const
{
    line_fields retval;

    switch (this->cq_ast.qa_format) {
        case source_format::plain: {
            const auto* level_name = level_names[flags2level(flags)];

            retval.lf_fields[PLAIN_LINE_FIELD] = line.to_string();
            retval.lf_fields[PLAIN_LEVEL_FIELD] = level_name;
            retval.lf_fields[PLAIN_SEVERITY_FIELD] = level_name;
            break;
        }
        case source_format::json: {
            if (!(flags & LF_FORMAT_JSON)) {
                retval.lf_parsed = false;
                break;
            }

            auto fields_res = extract_json_fields(line);
            if (fields_res.isErr()) {
                log_trace("line is not a JSON object: %s",
                          fields_res.unwrapErr().c_str());
                retval.lf_parsed = false;
            } else {
                retval.lf_fields = fields_res.unwrap();
            }
            break;
        }
        case source_format::logfmt: {
            if (!(flags & LF_FORMAT_LOGFMT)) {
                retval.lf_parsed = false;
                break;
            }
            retval.lf_fields = extract_logfmt_fields(line);
            break;
        }
    }

    return retval;
}

bool
compiled_query::eval_filter(const compiled_filter& cf,
                            const std::string& value) const
{
    const auto& fc = *cf.cf_clause;

    switch (fc.fc_op) {
        case compare_op::eq:
            return compare_values(value, fc.fc_value) == 0;
        case compare_op::ne:
            return compare_values(value, fc.fc_value) != 0;
        case compare_op::gt:
            return compare_values(value, fc.fc_value) > 0;
        case compare_op::lt:
            return compare_values(value, fc.fc_value) < 0;
        case compare_op::gte:
            return compare_values(value, fc.fc_value) >= 0;
        case compare_op::lte:
            return compare_values(value, fc.fc_value) <= 0;
        case compare_op::contains:
            return string_fragment::from_str(value)
                .find(string_fragment::from_str(fc.fc_value))
                .has_value();
        case compare_op::regex:
        case compare_op::not_regex: {
            auto sf = string_fragment::from_str(value);

            return cf.cf_regex->find_in(sf).match(
                [&fc](pcre2pp::found) {
                    return fc.fc_op == compare_op::regex;
                },
                [&fc](pcre2pp::not_found) {
                    return fc.fc_op == compare_op::not_regex;
                },
                [](pcre2pp::match_error err) {
                    log_error("regex match failed: %s",
                              err.get_message().c_str());
                    return false;
                });
        }
    }

    return false;
}

bool
compiled_query::matches(const line_fields& lf) const
{
    if (!lf.lf_parsed) {
        return false;
    }

    for (const auto& cf : this->cq_filters) {
        auto iter = lf.lf_fields.find(cf.cf_clause->fc_field);

        if (iter == lf.lf_fields.end()) {
            return false;
        }
        if (!this->eval_filter(cf, iter->second)) {
            return false;
        }
    }

    for (const auto& ec : this->cq_ast.qa_excludes) {
        auto iter = lf.lf_fields.find(ec.ec_field);

        if (iter == lf.lf_fields.end()) {
            continue;
        }
        if (string_fragment::from_str(iter->second)
                .find(string_fragment::from_str(ec.ec_pattern)))
        {
            return false;
        }
    }

    return true;
}

std::optional<log_level_t>
compiled_query::severity_shortcut() const
{
    for (const auto& fc : this->cq_ast.qa_filters) {
        if (fc.fc_op != compare_op::eq || fc.fc_field != PLAIN_LEVEL_FIELD) {
            continue;
        }

        auto level_opt = alias2level(string_fragment::from_str(fc.fc_value));
        if (level_opt) {
            return level_opt;
        }
    }

    return std::nullopt;
}

std::pair<line_flags_t, line_flags_t>
compiled_query::flags_prefilter() const
{
    switch (this->cq_ast.qa_format) {
        case source_format::json:
            return {LF_FORMAT_JSON | LF_IS_EMPTY, LF_FORMAT_JSON};
        case source_format::logfmt:
            return {LF_FORMAT_LOGFMT | LF_IS_EMPTY, LF_FORMAT_LOGFMT};
        case source_format::plain:
            break;
    }

    return {0, 0};
}

}  // namespace query
}  // namespace loupe
