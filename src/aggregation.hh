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
 * @file aggregation.hh
 */

#ifndef loupe_aggregation_hh
#define loupe_aggregation_hh

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "line_bitmap.hh"
#include "query.ast.hh"
#include "query.eval.hh"

namespace loupe {

constexpr const char* GROUP_VALUE_MISSING = "<missing>";
constexpr const char* GROUP_VALUE_RAW = "<raw>";

struct aggregate_group {
    std::vector<std::string> ag_key;
    size_t ag_count{0};
    /** The matched lines that fell into this group. */
    line_bitmap ag_lines;
};

struct aggregation_result {
    std::vector<std::string> ar_fields;
    /**
     * The groups by descending count.  Groups with the same count are in
     * the order they were first seen.  Limited to "top N" if the query
     * asked for it.
     */
    std::vector<aggregate_group> ar_groups;
    /** All lines fed to the aggregation, including evicted groups. */
    size_t ar_total_matches{0};
    /** The number of groups dropped to stay under the cardinality cap. */
    size_t ar_evicted_groups{0};
    /**
     * True if groups were evicted, in which case the counts are
     * approximate.
     */
    bool ar_overflowed{false};
};

/**
 * Counts matched lines by group key as they come out of a filter job.
 * When the number of groups reaches the cap, the least frequent group is
 * evicted to make room for a new one.  Among groups with the same count,
 * the most recently created one is evicted first.
 */
class aggregator {
public:
    aggregator(query::aggregate_clause clause,
               query::source_format format,
               size_t max_groups);

    /** Add a matched line to its group. */
    void feed(line_no_t line, const query::line_fields& lf);

    /**
     * Forget the lines at or after the given line.
     *
     * @param total_matches The number of matched lines before "line".
     */
    void truncate(line_no_t line, size_t total_matches);

    void clear();

    size_t group_count() const { return this->ag_groups.size(); }

    aggregation_result snapshot() const;

    std::vector<std::string> key_for(const query::line_fields& lf) const;

private:
    using group_seq_t = size_t;

    struct by_rarity {
        bool operator()(const std::pair<size_t, group_seq_t>& lhs,
                        const std::pair<size_t, group_seq_t>& rhs) const
        {
            if (lhs.first != rhs.first) {
                return lhs.first < rhs.first;
            }
            return lhs.second > rhs.second;
        }
    };

    void evict_one();

    query::aggregate_clause ag_clause;
    query::source_format ag_format;
    size_t ag_max_groups;
    std::map<std::vector<std::string>, group_seq_t> ag_key2seq;
    std::map<group_seq_t, aggregate_group> ag_groups;
    std::set<std::pair<size_t, group_seq_t>, by_rarity> ag_rarity;
    group_seq_t ag_next_seq{0};
    size_t ag_total_matches{0};
    size_t ag_evicted_groups{0};
};

}  // namespace loupe

#endif
