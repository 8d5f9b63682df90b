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
 * @file query.json.cc
 */

#include <ctype.h>
#include <string.h>

#include "query.json.hh"

#include "base/auto_mem.hh"
#include "base/loupe_log.hh"
#include "config.h"
#include "field_extractor.hh"
#include "fmt/format.h"
#include "yajl/yajl_gen.h"
#include "yajl/yajl_tree.h"

namespace loupe {
namespace query {

namespace {

class structured_parser {
public:
    explicit structured_parser(string_fragment input) : sp_input(input) {}

    Result<query_ast, parse_error> parse();

private:
    parse_error error(const std::string& path, const std::string& msg) const
    {
        return parse_error{
            0,
            0,
            path.empty() ? msg : fmt::format(FMT_STRING("{}: {}"), path, msg),
            this->sp_input.to_string(),
        };
    }

    Result<std::string, parse_error> get_string(const std::string& path,
                                                yajl_val val) const
    {
        if (!YAJL_IS_STRING(val)) {
            return Err(this->error(path, "expecting a string"));
        }
        return Ok(std::string(YAJL_GET_STRING(val)));
    }

    Result<std::string, parse_error> get_field_name(const std::string& path,
                                                    yajl_val val) const;
    Result<filter_clause, parse_error> parse_filter(const std::string& path,
                                                    yajl_val val) const;
    Result<exclude_clause, parse_error> parse_exclude(const std::string& path,
                                                      yajl_val val) const;
    Result<aggregate_clause, parse_error> parse_aggregate(
        const std::string& path, yajl_val val) const;

    string_fragment sp_input;
};

Result<std::string, parse_error>
structured_parser::get_field_name(const std::string& path, yajl_val val) const
{
    auto retval = TRY(this->get_string(path, val));

    if (retval.empty()) {
        return Err(this->error(path, "field names cannot be empty"));
    }
    for (const auto ch : retval) {
        if (!(isalnum((unsigned char) ch) || ch == '_' || ch == '.'
              || ch == '-' || ch == '@' || ((unsigned char) ch) >= 0x80))
        {
            return Err(this->error(
                path,
                fmt::format(FMT_STRING("invalid character '{}' in field name"),
                            ch)));
        }
    }

    return Ok(retval);
}

Result<filter_clause, parse_error>
structured_parser::parse_filter(const std::string& path, yajl_val val) const
{
    if (!YAJL_IS_OBJECT(val)) {
        return Err(this->error(path, "expecting an object"));
    }

    filter_clause retval;
    bool has_field = false, has_op = false, has_value = false;
    const auto* obj = YAJL_GET_OBJECT(val);

    for (size_t lpc = 0; lpc < obj->len; lpc++) {
        auto key = string_fragment::from_c_str(obj->keys[lpc]);
        auto key_path = fmt::format(FMT_STRING("{}.{}"), path, key);
        auto* child = obj->values[lpc];

        if (key == "field") {
            retval.fc_field = TRY(this->get_field_name(key_path, child));
            has_field = true;
        } else if (key == "op") {
            auto op_str = TRY(this->get_string(key_path, child));
            auto op_opt = op_from_string(string_fragment::from_str(op_str));

            if (!op_opt) {
                return Err(this->error(
                    key_path,
                    fmt::format(FMT_STRING("unknown operator '{}'"), op_str)));
            }
            retval.fc_op = op_opt.value();
            has_op = true;
        } else if (key == "value") {
            if (YAJL_IS_OBJECT(child) || YAJL_IS_ARRAY(child)) {
                return Err(this->error(key_path, "expecting a scalar value"));
            }
            retval.fc_value = json_value_to_string(child);
            has_value = true;
        } else {
            return Err(this->error(
                key_path, fmt::format(FMT_STRING("unknown key '{}'"), key)));
        }
    }

    if (!has_field) {
        return Err(this->error(path, "missing 'field'"));
    }
    if (!has_op) {
        return Err(this->error(path, "missing 'op'"));
    }
    if (!has_value) {
        return Err(this->error(path, "missing 'value'"));
    }

    return Ok(retval);
}

Result<exclude_clause, parse_error>
structured_parser::parse_exclude(const std::string& path, yajl_val val) const
{
    if (!YAJL_IS_OBJECT(val)) {
        return Err(this->error(path, "expecting an object"));
    }

    exclude_clause retval;
    bool has_field = false, has_pattern = false;
    const auto* obj = YAJL_GET_OBJECT(val);

    for (size_t lpc = 0; lpc < obj->len; lpc++) {
        auto key = string_fragment::from_c_str(obj->keys[lpc]);
        auto key_path = fmt::format(FMT_STRING("{}.{}"), path, key);
        auto* child = obj->values[lpc];

        if (key == "field") {
            retval.ec_field = TRY(this->get_field_name(key_path, child));
            has_field = true;
        } else if (key == "pattern") {
            retval.ec_pattern = TRY(this->get_string(key_path, child));
            has_pattern = true;
        } else {
            return Err(this->error(
                key_path, fmt::format(FMT_STRING("unknown key '{}'"), key)));
        }
    }

    if (!has_field) {
        return Err(this->error(path, "missing 'field'"));
    }
    if (!has_pattern) {
        return Err(this->error(path, "missing 'pattern'"));
    }

    return Ok(retval);
}

Result<aggregate_clause, parse_error>
structured_parser::parse_aggregate(const std::string& path, yajl_val val) const
{
    if (!YAJL_IS_OBJECT(val)) {
        return Err(this->error(path, "expecting an object"));
    }

    aggregate_clause retval;
    const auto* obj = YAJL_GET_OBJECT(val);

    for (size_t lpc = 0; lpc < obj->len; lpc++) {
        auto key = string_fragment::from_c_str(obj->keys[lpc]);
        auto key_path = fmt::format(FMT_STRING("{}.{}"), path, key);
        auto* child = obj->values[lpc];

        if (key == "type") {
            auto type_str = TRY(this->get_string(key_path, child));

            if (type_str != "count_by") {
                return Err(this->error(
                    key_path,
                    fmt::format(FMT_STRING("unsupported aggregation '{}'"),
                                type_str)));
            }
        } else if (key == "fields") {
            if (!YAJL_IS_ARRAY(child)) {
                return Err(this->error(key_path, "expecting an array"));
            }

            const auto* arr = YAJL_GET_ARRAY(child);
            for (size_t index = 0; index < arr->len; index++) {
                retval.ac_fields.emplace_back(TRY(this->get_field_name(
                    fmt::format(FMT_STRING("{}[{}]"), key_path, index),
                    arr->values[index])));
            }
        } else if (key == "limit") {
            if (YAJL_IS_NULL(child)) {
                continue;
            }
            if (!YAJL_IS_INTEGER(child) || YAJL_GET_INTEGER(child) <= 0) {
                return Err(
                    this->error(key_path, "expecting a positive integer"));
            }
            retval.ac_limit = (size_t) YAJL_GET_INTEGER(child);
        } else {
            return Err(this->error(
                key_path, fmt::format(FMT_STRING("unknown key '{}'"), key)));
        }
    }

    if (retval.ac_fields.empty()) {
        return Err(this->error(path, "at least one group field is required"));
    }

    return Ok(retval);
}

Result<query_ast, parse_error>
structured_parser::parse()
{
    auto input_str = this->sp_input.to_string();
    char errbuf[256];
    auto_mem<yajl_val_s> tree(yajl_tree_free);

    errbuf[0] = '\0';
    tree = yajl_tree_parse(input_str.c_str(), errbuf, sizeof(errbuf));
    if (tree.empty()) {
        auto* nl = strchr(errbuf, '\n');

        if (nl != nullptr) {
            *nl = '\0';
        }
        return Err(this->error("", errbuf[0] ? errbuf : "invalid JSON"));
    }
    if (!YAJL_IS_OBJECT(tree.in())) {
        return Err(this->error("", "expecting a JSON object"));
    }

    query_ast retval;
    const auto* obj = YAJL_GET_OBJECT(tree.in());

    for (size_t lpc = 0; lpc < obj->len; lpc++) {
        auto key = string_fragment::from_c_str(obj->keys[lpc]);
        auto* child = obj->values[lpc];

        if (key == "format" || key == "parser") {
            auto name = TRY(this->get_string(key.to_string(), child));
            auto fmt_opt = format_from_name(string_fragment::from_str(name));

            if (!fmt_opt) {
                return Err(this->error(
                    key.to_string(),
                    fmt::format(FMT_STRING("unknown format '{}'"), name)));
            }
            retval.qa_format = fmt_opt.value();
        } else if (key == "filters" || key == "exclude") {
            if (!YAJL_IS_ARRAY(child)) {
                return Err(this->error(key.to_string(), "expecting an array"));
            }

            const auto* arr = YAJL_GET_ARRAY(child);
            for (size_t index = 0; index < arr->len; index++) {
                auto elem_path = fmt::format(FMT_STRING("{}[{}]"), key, index);

                if (key == "filters") {
                    retval.qa_filters.emplace_back(
                        TRY(this->parse_filter(elem_path, arr->values[index])));
                } else {
                    retval.qa_excludes.emplace_back(TRY(
                        this->parse_exclude(elem_path, arr->values[index])));
                }
            }
        } else if (key == "aggregate") {
            if (YAJL_IS_NULL(child)) {
                continue;
            }
            retval.qa_aggregate = TRY(this->parse_aggregate("aggregate", child));
        } else {
            return Err(this->error(
                "", fmt::format(FMT_STRING("unknown key '{}'"), key)));
        }
    }

    if (retval.qa_format == source_format::plain) {
        for (const auto& fc : retval.qa_filters) {
            if (!is_plain_field(fc.fc_field)) {
                return Err(this->error(
                    "filters",
                    fmt::format(FMT_STRING("unknown field '{}', plain text "
                                           "queries can only use line, "
                                           "level or severity"),
                                fc.fc_field)));
            }
        }
    }

    return Ok(retval);
}

yajl_gen_status
gen_string(yajl_gen gen, const std::string& str)
{
    return yajl_gen_string(
        gen, (const unsigned char*) str.c_str(), str.length());
}

}  // namespace

Result<query_ast, parse_error>
parse_structured_query(string_fragment json)
{
    structured_parser sp(json);

    auto retval = sp.parse();
    if (retval.isErr()) {
        log_debug("structured query parse failed: %s",
                  retval.unwrapErr().pe_msg.c_str());
    }

    return retval;
}

std::string
to_json(const query_ast& ast)
{
    auto_mem<yajl_gen_t> gen(yajl_gen_free);
    const unsigned char* buf;
    size_t len;

    gen = yajl_gen_alloc(nullptr);

    yajl_gen_map_open(gen.in());
    gen_string(gen.in(), "format");
    gen_string(gen.in(), format_name(ast.qa_format));

    gen_string(gen.in(), "filters");
    yajl_gen_array_open(gen.in());
    for (const auto& fc : ast.qa_filters) {
        yajl_gen_map_open(gen.in());
        gen_string(gen.in(), "field");
        gen_string(gen.in(), fc.fc_field);
        gen_string(gen.in(), "op");
        gen_string(gen.in(), op_name(fc.fc_op));
        gen_string(gen.in(), "value");
        gen_string(gen.in(), fc.fc_value);
        yajl_gen_map_close(gen.in());
    }
    yajl_gen_array_close(gen.in());

    gen_string(gen.in(), "exclude");
    yajl_gen_array_open(gen.in());
    for (const auto& ec : ast.qa_excludes) {
        yajl_gen_map_open(gen.in());
        gen_string(gen.in(), "field");
        gen_string(gen.in(), ec.ec_field);
        gen_string(gen.in(), "pattern");
        gen_string(gen.in(), ec.ec_pattern);
        yajl_gen_map_close(gen.in());
    }
    yajl_gen_array_close(gen.in());

    if (ast.qa_aggregate) {
        gen_string(gen.in(), "aggregate");
        yajl_gen_map_open(gen.in());
        gen_string(gen.in(), "type");
        gen_string(gen.in(), "count_by");
        gen_string(gen.in(), "fields");
        yajl_gen_array_open(gen.in());
        for (const auto& field : ast.qa_aggregate->ac_fields) {
            gen_string(gen.in(), field);
        }
        yajl_gen_array_close(gen.in());
        if (ast.qa_aggregate->ac_limit) {
            gen_string(gen.in(), "limit");
            yajl_gen_integer(gen.in(), ast.qa_aggregate->ac_limit.value());
        }
        yajl_gen_map_close(gen.in());
    }
    yajl_gen_map_close(gen.in());

    yajl_gen_get_buf(gen.in(), &buf, &len);

    return std::string((const char*) buf, len);
}

}  // namespace query
}  // namespace loupe
