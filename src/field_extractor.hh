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
 * @file field_extractor.hh
 */

#ifndef loupe_field_extractor_hh
#define loupe_field_extractor_hh

#include <map>
#include <string>

#include "base/string_fragment.hh"
#include "result.h"
#include "yajl/yajl_gen.h"
#include "yajl/yajl_tree.h"

namespace loupe {

/**
 * The structured fields of a single line, keyed by their dotted path.
 */
using field_map = std::map<std::string, std::string>;

/**
 * Parse a line as a JSON object and flatten it into a field map.  Nested
 * members are addressed with dots ("req.path") and array elements with their
 * index ("items.0.id").  Containers are also recorded under their own path,
 * rendered as compact JSON.
 *
 * @return The fields or an error message if the line is not a JSON object.
 */
Result<field_map, std::string> extract_json_fields(string_fragment line);

/**
 * Collect the key=value pairs in a line.  When a key repeats, the last value
 * wins.
 */
field_map extract_logfmt_fields(string_fragment line);

/**
 * @return True if the logfmt tokenizer finds at least one key=value pair in
 *   the line.
 */
bool has_logfmt_pair(string_fragment line);

/**
 * Render a parsed JSON value the way queries compare it: strings as-is,
 * numbers as their literal text, keywords by name and containers as
 * compact JSON.
 */
std::string json_value_to_string(yajl_val val);

yajl_gen_status yajl_gen_tree(yajl_gen hand, yajl_val val);

}  // namespace loupe

#endif
