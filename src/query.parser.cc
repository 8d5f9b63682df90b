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
 * @file query.parser.cc
 */

#include <ctype.h>

#include "query.parser.hh"

#include "base/loupe_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "fmt/ranges.h"
#include "scn/scan.h"

namespace loupe {
namespace query {

std::string
parse_error::to_string() const
{
    if (this->pe_stage_text.empty()) {
        return fmt::format(FMT_STRING("stage {}: {} (at offset {})"),
                           this->pe_stage,
                           this->pe_msg,
                           this->pe_offset);
    }
    return fmt::format(FMT_STRING("stage {} ({}): {} (at offset {})"),
                       this->pe_stage,
                       this->pe_stage_text,
                       this->pe_msg,
                       this->pe_offset);
}

const char*
format_name(source_format fmt)
{
    switch (fmt) {
        case source_format::plain:
            return "plain";
        case source_format::json:
            return "json";
        case source_format::logfmt:
            return "logfmt";
    }

    return "plain";
}

std::optional<source_format>
format_from_name(string_fragment name)
{
    if (name == "json") {
        return source_format::json;
    }
    if (name == "logfmt") {
        return source_format::logfmt;
    }
    if (name == "plain" || name == "raw") {
        return source_format::plain;
    }

    return std::nullopt;
}

namespace {

struct op_names {
    compare_op on_op;
    const char* on_symbol;
    const char* on_name;
};

const op_names OP_NAMES[] = {
    {compare_op::eq, "==", "eq"},
    {compare_op::ne, "!=", "ne"},
    {compare_op::gt, ">", "gt"},
    {compare_op::lt, "<", "lt"},
    {compare_op::gte, ">=", "gte"},
    {compare_op::lte, "<=", "lte"},
    {compare_op::regex, "=~", "regex"},
    {compare_op::not_regex, "!~", "not_regex"},
    {compare_op::contains, "contains", "contains"},
};

}  // namespace

const char*
op_symbol(compare_op op)
{
    for (const auto& on : OP_NAMES) {
        if (on.on_op == op) {
            return on.on_symbol;
        }
    }

    return "==";
}

const char*
op_name(compare_op op)
{
    for (const auto& on : OP_NAMES) {
        if (on.on_op == op) {
            return on.on_name;
        }
    }

    return "eq";
}

std::optional<compare_op>
op_from_string(string_fragment str)
{
    if (str == "~=") {
        return compare_op::regex;
    }
    for (const auto& on : OP_NAMES) {
        if (str == string_fragment::from_c_str(on.on_symbol)
            || str == string_fragment::from_c_str(on.on_name))
        {
            return on.on_op;
        }
    }

    return std::nullopt;
}

bool
is_plain_field(const std::string& field)
{
    return field == PLAIN_LINE_FIELD || field == PLAIN_LEVEL_FIELD
        || field == PLAIN_SEVERITY_FIELD;
}

namespace {

bool
is_field_char(char ch)
{
    return isalnum((unsigned char) ch) || ch == '_' || ch == '.' || ch == '-'
        || ch == '@' || ((unsigned char) ch) >= 0x80;
}

class text_parser {
public:
    explicit text_parser(string_fragment input) : tp_input(input) {}

    Result<query_ast, parse_error> parse();

private:
    parse_error error(std::string msg) const
    {
        return this->error_at(this->tp_pos, std::move(msg));
    }

    parse_error error_at(int pos, std::string msg) const
    {
        return parse_error{
            this->tp_stage,
            pos,
            std::move(msg),
            this->tp_input.to_string(),
            this->stage_text(),
        };
    }

    /** The current stage, up to the next unquoted pipe, trimmed. */
    std::string stage_text() const
    {
        auto end = this->tp_stage_start;
        char quote = '\0';
        while (end < this->tp_input.length()) {
            auto ch = this->tp_input[end];
            if (quote != '\0') {
                if (ch == '\\') {
                    end += 1;
                } else if (ch == quote) {
                    quote = '\0';
                }
            } else if (ch == '"' || ch == '\'') {
                quote = ch;
            } else if (ch == '|') {
                break;
            }
            end += 1;
        }
        if (end > this->tp_input.length()) {
            end = this->tp_input.length();
        }

        return this->tp_input.sub_range(this->tp_stage_start, end)
            .trim()
            .to_string();
    }

    bool at_end() const { return this->tp_pos >= this->tp_input.length(); }

    char peek() const
    {
        return this->at_end() ? '\0' : this->tp_input[this->tp_pos];
    }

    void skip_whitespace()
    {
        while (!this->at_end() && isspace((unsigned char) this->peek())) {
            this->tp_pos += 1;
        }
    }

    bool consume_char(char ch)
    {
        if (!this->at_end() && this->peek() == ch) {
            this->tp_pos += 1;
            return true;
        }
        return false;
    }

    bool consume_str(const char* str)
    {
        auto rest = this->tp_input.substr(this->tp_pos);

        if (rest.startswith(str)) {
            this->tp_pos += strlen(str);
            return true;
        }
        return false;
    }

    /**
     * Check for a whole word at the current position.  The word must be
     * followed by the end of input, whitespace, or one of the characters in
     * "terminators".
     */
    bool peek_word(const char* word, const char* terminators = "|") const
    {
        auto rest = this->tp_input.substr(this->tp_pos);
        auto len = (int) strlen(word);

        if (!rest.startswith(word)) {
            return false;
        }
        if (len == rest.length()) {
            return true;
        }

        auto next = rest[len];
        return isspace((unsigned char) next) || strchr(terminators, next);
    }

    bool consume_word(const char* word, const char* terminators = "|")
    {
        if (this->peek_word(word, terminators)) {
            this->tp_pos += strlen(word);
            return true;
        }
        return false;
    }

    bool at_aggregate()
    {
        auto saved = this->tp_pos;
        auto retval = false;

        if (this->consume_word("count", "|(")) {
            this->skip_whitespace();
            retval = this->peek_word("by", "|(");
        }
        this->tp_pos = saved;

        return retval;
    }

    Result<std::string, parse_error> parse_field();
    Result<compare_op, parse_error> parse_operator();
    Result<std::string, parse_error> parse_value();
    Result<std::string, parse_error> parse_quoted(char quote);
    Result<filter_clause, parse_error> parse_filter(source_format fmt);
    Result<aggregate_clause, parse_error> parse_aggregate();
    Result<size_t, parse_error> parse_top();

    string_fragment tp_input;
    int tp_pos{0};
    int tp_stage{0};
    int tp_stage_start{0};
};

Result<std::string, parse_error>
text_parser::parse_field()
{
    auto start = this->tp_pos;

    while (!this->at_end() && is_field_char(this->peek())) {
        this->tp_pos += 1;
    }
    if (this->tp_pos == start) {
        return Err(this->error("expected a field name"));
    }

    return Ok(this->tp_input.sub_range(start, this->tp_pos).to_string());
}

Result<compare_op, parse_error>
text_parser::parse_operator()
{
    if (this->consume_str("==")) {
        return Ok(compare_op::eq);
    }
    if (this->consume_str("!=")) {
        return Ok(compare_op::ne);
    }
    if (this->consume_str("=~") || this->consume_str("~=")) {
        return Ok(compare_op::regex);
    }
    if (this->consume_str("!~")) {
        return Ok(compare_op::not_regex);
    }
    if (this->consume_str(">=")) {
        return Ok(compare_op::gte);
    }
    if (this->consume_str("<=")) {
        return Ok(compare_op::lte);
    }
    if (this->consume_str(">")) {
        return Ok(compare_op::gt);
    }
    if (this->consume_str("<")) {
        return Ok(compare_op::lt);
    }
    if (this->consume_word("contains", "\"'")) {
        return Ok(compare_op::contains);
    }

    return Err(this->error(
        "expected an operator (==, !=, >, <, >=, <=, ~=, =~, !~, contains)"));
}

Result<std::string, parse_error>
text_parser::parse_quoted(char quote)
{
    auto start = this->tp_pos;
    std::string retval;

    this->tp_pos += 1;
    while (!this->at_end()) {
        auto ch = this->peek();

        this->tp_pos += 1;
        if (ch == quote) {
            return Ok(retval);
        }
        if (ch != '\\') {
            retval.push_back(ch);
            continue;
        }
        if (this->at_end()) {
            break;
        }

        auto escaped = this->peek();
        this->tp_pos += 1;
        switch (escaped) {
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
                retval.push_back(escaped);
                break;
            default:
                retval.push_back('\\');
                retval.push_back(escaped);
                break;
        }
    }

    return Err(this->error_at(start, "unterminated string"));
}

Result<std::string, parse_error>
text_parser::parse_value()
{
    auto ch = this->peek();

    if (ch == '"' || ch == '\'') {
        return this->parse_quoted(ch);
    }

    auto start = this->tp_pos;
    while (!this->at_end() && !isspace((unsigned char) this->peek())
           && this->peek() != '|')
    {
        this->tp_pos += 1;
    }
    if (this->tp_pos == start) {
        return Err(this->error("expected a value"));
    }

    return Ok(this->tp_input.sub_range(start, this->tp_pos).to_string());
}

Result<filter_clause, parse_error>
text_parser::parse_filter(source_format fmt)
{
    filter_clause retval;
    auto field_start = this->tp_pos;

    retval.fc_field = TRY(this->parse_field());
    if (fmt == source_format::plain && !is_plain_field(retval.fc_field)) {
        return Err(this->error_at(
            field_start,
            fmt::format(FMT_STRING("unknown field '{}', plain text queries "
                                   "can only use line, level or severity"),
                        retval.fc_field)));
    }
    this->skip_whitespace();
    retval.fc_op = TRY(this->parse_operator());
    this->skip_whitespace();
    retval.fc_value = TRY(this->parse_value());

    return Ok(retval);
}

Result<aggregate_clause, parse_error>
text_parser::parse_aggregate()
{
    aggregate_clause retval;

    this->consume_word("count", "|(");
    this->skip_whitespace();
    this->consume_word("by", "|(");
    this->skip_whitespace();
    if (!this->consume_char('(')) {
        return Err(this->error("expected '(' after 'by'"));
    }
    while (true) {
        this->skip_whitespace();
        retval.ac_fields.emplace_back(TRY(this->parse_field()));
        this->skip_whitespace();
        if (this->consume_char(')')) {
            break;
        }
        if (!this->consume_char(',')) {
            return Err(this->error("expected ',' or ')' in the field list"));
        }
    }

    return Ok(retval);
}

Result<size_t, parse_error>
text_parser::parse_top()
{
    if (!this->consume_word("top")) {
        return Err(this->error("only 'top N' can follow an aggregation"));
    }
    this->skip_whitespace();

    auto start = this->tp_pos;
    while (!this->at_end() && isdigit((unsigned char) this->peek())) {
        this->tp_pos += 1;
    }
    if (this->tp_pos == start) {
        return Err(this->error("expected a number after 'top'"));
    }

    auto digits = this->tp_input.sub_range(start, this->tp_pos);
    auto scan_res = scn::scan_value<size_t>(digits.to_string_view());
    if (!scan_res || !scan_res->range().empty() || scan_res->value() == 0) {
        return Err(this->error_at(
            start, "expected a positive number of groups after 'top'"));
    }

    return Ok(scan_res->value());
}

Result<query_ast, parse_error>
text_parser::parse()
{
    query_ast retval;
    auto need_stage = true;

    this->skip_whitespace();
    if (this->at_end()) {
        return Err(this->error("empty query"));
    }

    if (this->consume_word("json")) {
        retval.qa_format = source_format::json;
        need_stage = false;
    } else if (this->consume_word("logfmt")) {
        retval.qa_format = source_format::logfmt;
        need_stage = false;
    } else if (this->consume_word("plain")) {
        need_stage = false;
    }

    while (true) {
        this->skip_whitespace();
        if (!need_stage) {
            if (this->at_end()) {
                break;
            }
            if (!this->consume_char('|')) {
                return Err(this->error(fmt::format(
                    FMT_STRING("expected '|', found '{}'"), this->peek())));
            }
            this->tp_stage += 1;
            this->tp_stage_start = this->tp_pos;
            this->skip_whitespace();
        }
        need_stage = false;

        if (this->at_end()) {
            return Err(
                this->error("expected a filter clause or aggregation"));
        }

        if (!this->at_aggregate()) {
            retval.qa_filters.emplace_back(
                TRY(this->parse_filter(retval.qa_format)));
            continue;
        }

        retval.qa_aggregate = TRY(this->parse_aggregate());
        this->skip_whitespace();
        if (this->consume_char('|')) {
            this->tp_stage += 1;
            this->tp_stage_start = this->tp_pos;
            this->skip_whitespace();
            retval.qa_aggregate->ac_limit = TRY(this->parse_top());
            this->skip_whitespace();
        }
        if (!this->at_end()) {
            return Err(
                this->error("nothing can follow the aggregation stage"));
        }
        break;
    }

    return Ok(retval);
}

}  // namespace

Result<query_ast, parse_error>
parse_query(string_fragment input)
{
    text_parser tp(input);

    auto retval = tp.parse();
    if (retval.isErr()) {
        log_debug("query parse failed: %s",
                  retval.unwrapErr().to_string().c_str());
    }

    return retval;
}

std::string
quote_value(const std::string& value)
{
    std::string retval = "\"";

    for (const auto ch : value) {
        switch (ch) {
            case '"':
                retval.append("\\\"");
                break;
            case '\\':
                retval.append("\\\\");
                break;
            case '\n':
                retval.append("\\n");
                break;
            case '\t':
                retval.append("\\t");
                break;
            case '\r':
                retval.append("\\r");
                break;
            default:
                retval.push_back(ch);
                break;
        }
    }
    retval.push_back('"');

    return retval;
}

std::string
to_string(const query_ast& ast)
{
    std::vector<std::string> stages;

    if (ast.qa_format != source_format::plain) {
        stages.emplace_back(format_name(ast.qa_format));
    }
    for (const auto& fc : ast.qa_filters) {
        stages.emplace_back(fmt::format(FMT_STRING("{} {} {}"),
                                        fc.fc_field,
                                        op_symbol(fc.fc_op),
                                        quote_value(fc.fc_value)));
    }
    if (ast.qa_aggregate) {
        stages.emplace_back(
            fmt::format(FMT_STRING("count by ({})"),
                        fmt::join(ast.qa_aggregate->ac_fields, ", ")));
        if (ast.qa_aggregate->ac_limit) {
            stages.emplace_back(fmt::format(
                FMT_STRING("top {}"), ast.qa_aggregate->ac_limit.value()));
        }
    }
    if (stages.empty()) {
        return "plain";
    }

    return fmt::format(FMT_STRING("{}"), fmt::join(stages, " | "));
}

}  // namespace query
}  // namespace loupe
