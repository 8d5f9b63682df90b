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
 * @file aggregation.cc
 */

#include <algorithm>

#include "aggregation.hh"

#include "base/loupe_log.hh"
#include "config.h"

namespace loupe {

aggregator::aggregator(query::aggregate_clause clause,
                       query::source_format format,
                       size_t max_groups)
    : ag_clause(std::move(clause)), ag_format(format),
      ag_max_groups(std::max<size_t>(max_groups, 1))
{
}

std::vector<std::string>
aggregator::key_for(const query::line_fields& lf) const
{
    std::vector<std::string> retval;

    retval.reserve(this->ag_clause.ac_fields.size());
    for (const auto& field : this->ag_clause.ac_fields) {
        if (this->ag_format == query::source_format::plain) {
            retval.emplace_back(GROUP_VALUE_RAW);
        } else {
            auto iter = lf.lf_fields.find(field);

            if (iter == lf.lf_fields.end()) {
                retval.emplace_back(GROUP_VALUE_MISSING);
            } else {
                retval.emplace_back(iter->second);
            }
        }
    }

    return retval;
}

void
aggregator::evict_one()
{
    auto victim = this->ag_rarity.begin();
    auto group_iter = this->ag_groups.find(victim->second);

    ensure(group_iter != this->ag_groups.end());

    log_debug("evicting aggregation group with %zu line(s)",
              group_iter->second.ag_count);
    this->ag_key2seq.erase(group_iter->second.ag_key);
    this->ag_groups.erase(group_iter);
    this->ag_rarity.erase(victim);
    this->ag_evicted_groups += 1;
}

void
aggregator::feed(line_no_t line, const query::line_fields& lf)
{
    auto key = this->key_for(lf);
    auto seq_iter = this->ag_key2seq.find(key);

    this->ag_total_matches += 1;
    if (seq_iter == this->ag_key2seq.end()) {
        if (this->ag_groups.size() >= this->ag_max_groups) {
            if (this->ag_evicted_groups == 0) {
                log_warning("aggregation exceeded %zu groups, evicting the "
                            "least frequent",
                            this->ag_max_groups);
            }
            this->evict_one();
        }

        auto seq = this->ag_next_seq++;
        auto& group = this->ag_groups[seq];

        group.ag_key = key;
        group.ag_count = 1;
        group.ag_lines.append(line);
        this->ag_key2seq.emplace(std::move(key), seq);
        this->ag_rarity.emplace(1, seq);
        return;
    }

    auto seq = seq_iter->second;
    auto& group = this->ag_groups[seq];

    this->ag_rarity.erase(std::make_pair(group.ag_count, seq));
    group.ag_count += 1;
    group.ag_lines.append(line);
    this->ag_rarity.emplace(group.ag_count, seq);
}

void
aggregator::truncate(line_no_t line, size_t total_matches)
{
    auto iter = this->ag_groups.begin();

    while (iter != this->ag_groups.end()) {
        auto& group = iter->second;
        auto old_count = group.ag_count;

        group.ag_lines.truncate(line);
        group.ag_count = group.ag_lines.size();
        if (group.ag_count == old_count) {
            ++iter;
            continue;
        }

        this->ag_rarity.erase(std::make_pair(old_count, iter->first));
        if (group.ag_count == 0) {
            this->ag_key2seq.erase(group.ag_key);
            iter = this->ag_groups.erase(iter);
        } else {
            this->ag_rarity.emplace(group.ag_count, iter->first);
            ++iter;
        }
    }
    this->ag_total_matches = total_matches;
}

void
aggregator::clear()
{
    this->ag_key2seq.clear();
    this->ag_groups.clear();
    this->ag_rarity.clear();
    this->ag_next_seq = 0;
    this->ag_total_matches = 0;
    this->ag_evicted_groups = 0;
}

aggregation_result
aggregator::snapshot() const
{
    aggregation_result retval;

    retval.ar_fields = this->ag_clause.ac_fields;
    retval.ar_total_matches = this->ag_total_matches;
    retval.ar_evicted_groups = this->ag_evicted_groups;
    retval.ar_overflowed = this->ag_evicted_groups > 0;

    // ag_groups is keyed by creation order, so a stable sort keeps ties in
    // first-seen order.
    retval.ar_groups.reserve(this->ag_groups.size());
    for (const auto& pair : this->ag_groups) {
        retval.ar_groups.emplace_back(pair.second);
    }
    std::stable_sort(
        retval.ar_groups.begin(),
        retval.ar_groups.end(),
        [](const aggregate_group& lhs, const aggregate_group& rhs) {
            return lhs.ag_count > rhs.ag_count;
        });
    if (this->ag_clause.ac_limit
        && retval.ar_groups.size() > this->ag_clause.ac_limit.value())
    {
        retval.ar_groups.resize(this->ag_clause.ac_limit.value());
    }

    return retval;
}

}  // namespace loupe
