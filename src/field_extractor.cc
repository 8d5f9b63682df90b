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
 * @file field_extractor.cc
 */

#include <string.h>

#include "field_extractor.hh"

#include "base/auto_mem.hh"
#include "base/loupe_log.hh"
#include "config.h"
#include "formats/logfmt/logfmt.parser.hh"

namespace loupe {

yajl_gen_status
yajl_gen_tree(yajl_gen hand, yajl_val val)
{
    switch (val->type) {
        case yajl_t_string: {
            const auto* str = YAJL_GET_STRING(val);

            return yajl_gen_string(
                hand, (const unsigned char*) str, strlen(str));
        }
        case yajl_t_number: {
            return yajl_gen_number(
                hand, YAJL_GET_NUMBER(val), strlen(YAJL_GET_NUMBER(val)));
        }
        case yajl_t_object: {
            auto rc = yajl_gen_map_open(hand);
            if (rc != yajl_gen_status_ok) {
                return rc;
            }
            for (size_t lpc = 0; lpc < YAJL_GET_OBJECT(val)->len; lpc++) {
                const auto* key = YAJL_GET_OBJECT(val)->keys[lpc];

                rc = yajl_gen_string(
                    hand, (const unsigned char*) key, strlen(key));
                if (rc != yajl_gen_status_ok) {
                    return rc;
                }
                rc = yajl_gen_tree(hand, YAJL_GET_OBJECT(val)->values[lpc]);
                if (rc != yajl_gen_status_ok) {
                    return rc;
                }
            }
            return yajl_gen_map_close(hand);
        }
        case yajl_t_array: {
            auto rc = yajl_gen_array_open(hand);
            if (rc != yajl_gen_status_ok) {
                return rc;
            }
            for (size_t lpc = 0; lpc < YAJL_GET_ARRAY(val)->len; lpc++) {
                rc = yajl_gen_tree(hand, YAJL_GET_ARRAY(val)->values[lpc]);
                if (rc != yajl_gen_status_ok) {
                    return rc;
                }
            }
            return yajl_gen_array_close(hand);
        }
        case yajl_t_true: {
            return yajl_gen_bool(hand, true);
        }
        case yajl_t_false: {
            return yajl_gen_bool(hand, false);
        }
        case yajl_t_null: {
            return yajl_gen_null(hand);
        }
        default:
            return yajl_gen_status_ok;
    }
}

std::string
json_value_to_string(yajl_val val)
{
    switch (val->type) {
        case yajl_t_string:
            return YAJL_GET_STRING(val);
        case yajl_t_number:
            return YAJL_GET_NUMBER(val);
        case yajl_t_true:
            return "true";
        case yajl_t_false:
            return "false";
        case yajl_t_null:
            return "null";
        default:
            break;
    }

    auto_mem<yajl_gen_t> gen(yajl_gen_free);
    const unsigned char* buf;
    size_t len;

    gen = yajl_gen_alloc(nullptr);
    if (yajl_gen_tree(gen.in(), val) != yajl_gen_status_ok) {
        log_error("unable to render JSON container");
        return "";
    }
    yajl_gen_get_buf(gen.in(), &buf, &len);

    return std::string((const char*) buf, len);
}

static void
flatten_json(const std::string& prefix, yajl_val val, field_map& fields)
{
    if (!prefix.empty()) {
        fields[prefix] = json_value_to_string(val);
    }

    if (YAJL_IS_OBJECT(val)) {
        const auto* obj = YAJL_GET_OBJECT(val);

        for (size_t lpc = 0; lpc < obj->len; lpc++) {
            auto path = prefix.empty() ? std::string(obj->keys[lpc])
                                       : prefix + "." + obj->keys[lpc];

            flatten_json(path, obj->values[lpc], fields);
        }
    } else if (YAJL_IS_ARRAY(val)) {
        const auto* arr = YAJL_GET_ARRAY(val);

        for (size_t lpc = 0; lpc < arr->len; lpc++) {
            auto path = prefix.empty() ? std::to_string(lpc)
                                       : prefix + "." + std::to_string(lpc);

            flatten_json(path, arr->values[lpc], fields);
        }
    }
}

Result<field_map, std::string>
extract_json_fields(string_fragment line)
{
    // yajl_tree_parse() needs a NUL-terminated buffer
    auto line_str = line.to_string();
    char errbuf[256];
    auto_mem<yajl_val_s> tree(yajl_tree_free);

    errbuf[0] = '\0';
    tree = yajl_tree_parse(line_str.c_str(), errbuf, sizeof(errbuf));
    if (tree.empty()) {
        auto* nl = strchr(errbuf, '\n');

        if (nl != nullptr) {
            *nl = '\0';
        }
        return Err(std::string(errbuf[0] ? errbuf : "invalid JSON"));
    }
    if (!YAJL_IS_OBJECT(tree.in())) {
        return Err(std::string("expecting a JSON object"));
    }

    field_map retval;

    flatten_json("", tree.in(), retval);

    return Ok(std::move(retval));
}

field_map
extract_logfmt_fields(string_fragment line)
{
    field_map retval;
    logfmt::parser p(line);
    bool done = false;

    while (!done) {
        auto step_res = p.step();

        done = step_res.match(
            [](const logfmt::parser::end_of_input&) { return true; },
            [](const logfmt::parser::error&) { return true; },
            [](const logfmt::parser::bare_word&) { return false; },
            [&retval](const logfmt::parser::kvpair& kvp) {
                retval[kvp.first.to_string()] = logfmt::to_string(kvp.second);
                return false;
            });
    }

    return retval;
}

bool
has_logfmt_pair(string_fragment line)
{
    logfmt::parser p(line);

    while (true) {
        auto step_res = p.step();

        if (step_res.is<logfmt::parser::kvpair>()) {
            return true;
        }
        if (!step_res.is<logfmt::parser::bare_word>()) {
            return false;
        }
    }
}

}  // namespace loupe
