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
 * @file line_bitmap.hh
 */

#ifndef loupe_line_bitmap_hh
#define loupe_line_bitmap_hh

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "base/loupe_log.hh"

namespace loupe {

using line_no_t = uint32_t;

/**
 * An ordered set of line numbers.  Lines are appended in increasing order
 * while a file is indexed, so insertion is a push onto the end.
 *
 * The lines are kept in fixed-size chunks.  Full chunks are immutable and
 * shared between copies, so copying a bitmap costs one pointer per chunk
 * plus the partially filled last chunk.
 */
class line_bitmap {
public:
    static constexpr size_t CHUNK_SIZE = 4096;

    class const_iterator {
    public:
        typedef std::random_access_iterator_tag iterator_category;
        typedef line_no_t value_type;
        typedef const line_no_t* pointer;
        typedef const line_no_t& reference;
        typedef std::ptrdiff_t difference_type;

        const_iterator(const line_bitmap* bm = nullptr, size_t offset = 0)
            : i_bitmap(bm), i_offset(offset)
        {
        }

        const line_no_t& operator*() const
        {
            return (*this->i_bitmap)[this->i_offset];
        }

        const line_no_t& operator[](difference_type n) const
        {
            return (*this->i_bitmap)[this->i_offset + n];
        }

        const_iterator& operator++()
        {
            this->i_offset += 1;
            return *this;
        }

        const_iterator operator++(int)
        {
            auto retval = *this;

            this->i_offset += 1;
            return retval;
        }

        const_iterator& operator--()
        {
            this->i_offset -= 1;
            return *this;
        }

        const_iterator operator--(int)
        {
            auto retval = *this;

            this->i_offset -= 1;
            return retval;
        }

        const_iterator& operator+=(difference_type n)
        {
            this->i_offset += n;
            return *this;
        }

        const_iterator& operator-=(difference_type n)
        {
            this->i_offset -= n;
            return *this;
        }

        const_iterator operator+(difference_type n) const
        {
            return const_iterator(this->i_bitmap, this->i_offset + n);
        }

        const_iterator operator-(difference_type n) const
        {
            return const_iterator(this->i_bitmap, this->i_offset - n);
        }

        difference_type operator-(const const_iterator& other) const
        {
            return (difference_type) this->i_offset
                - (difference_type) other.i_offset;
        }

        bool operator==(const const_iterator& other) const
        {
            return this->i_bitmap == other.i_bitmap
                && this->i_offset == other.i_offset;
        }

        bool operator!=(const const_iterator& other) const
        {
            return !(*this == other);
        }

        bool operator<(const const_iterator& other) const
        {
            return this->i_offset < other.i_offset;
        }

        bool operator>(const const_iterator& other) const
        {
            return other < *this;
        }

        bool operator<=(const const_iterator& other) const
        {
            return !(other < *this);
        }

        bool operator>=(const const_iterator& other) const
        {
            return !(*this < other);
        }

    private:
        const line_bitmap* i_bitmap;
        size_t i_offset;
    };

    void append(line_no_t line)
    {
        require(this->empty() || this->back() < line);

        this->lb_tail.push_back(line);
        if (this->lb_tail.size() == CHUNK_SIZE) {
            this->lb_chunks.emplace_back(
                std::make_shared<const std::vector<line_no_t>>(
                    std::move(this->lb_tail)));
            this->lb_tail = std::vector<line_no_t>();
            this->lb_tail.reserve(CHUNK_SIZE / 4);
        }
    }

    const line_no_t& operator[](size_t index) const
    {
        require(index < this->size());

        auto chunk = index / CHUNK_SIZE;
        if (chunk < this->lb_chunks.size()) {
            return (*this->lb_chunks[chunk])[index % CHUNK_SIZE];
        }

        return this->lb_tail[index - this->sealed_size()];
    }

    const line_no_t& back() const { return (*this)[this->size() - 1]; }

    bool contains(line_no_t line) const
    {
        return std::binary_search(this->begin(), this->end(), line);
    }

    size_t size() const { return this->sealed_size() + this->lb_tail.size(); }

    bool empty() const { return this->size() == 0; }

    /** The number of full chunks, which are shared between copies. */
    size_t chunk_count() const { return this->lb_chunks.size(); }

    const_iterator begin() const { return const_iterator(this, 0); }

    const_iterator end() const { return const_iterator(this, this->size()); }

    void clear()
    {
        this->lb_chunks.clear();
        this->lb_tail.clear();
    }

    /**
     * Drop every line greater than or equal to the given line.
     */
    void truncate(line_no_t line)
    {
        auto new_size
            = (size_t) (std::lower_bound(this->begin(), this->end(), line)
                        - this->begin());

        if (new_size >= this->sealed_size()) {
            this->lb_tail.resize(new_size - this->sealed_size());
            return;
        }

        auto keep_chunks = new_size / CHUNK_SIZE;
        std::vector<line_no_t> new_tail;

        if (new_size % CHUNK_SIZE > 0) {
            const auto& partial = *this->lb_chunks[keep_chunks];

            new_tail.assign(partial.begin(),
                            partial.begin() + (new_size % CHUNK_SIZE));
        }
        this->lb_chunks.resize(keep_chunks);
        this->lb_tail = std::move(new_tail);
    }

    /**
     * @return The lines in the half-open range [start, stop).
     */
    std::pair<const_iterator, const_iterator> equal_range(line_no_t start,
                                                          line_no_t stop) const
    {
        auto lb = std::lower_bound(this->begin(), this->end(), start);
        auto ub = std::lower_bound(lb, this->end(), stop);

        return std::make_pair(lb, ub);
    }

    /**
     * @return The first line after "start" or nullopt if there is none.
     */
    std::optional<line_no_t> next(line_no_t start) const
    {
        std::optional<line_no_t> retval;

        auto ub = std::upper_bound(this->begin(), this->end(), start);
        if (ub != this->end()) {
            retval = *ub;
        }

        ensure(!retval || start < retval.value());

        return retval;
    }

    /**
     * @return The last line before "start" or nullopt if there is none.
     */
    std::optional<line_no_t> prev(line_no_t start) const
    {
        std::optional<line_no_t> retval;

        auto lb = std::lower_bound(this->begin(), this->end(), start);
        if (lb != this->begin()) {
            lb -= 1;
            retval = *lb;
        }

        ensure(!retval || retval.value() < start);

        return retval;
    }

    line_bitmap intersect(const line_bitmap& other) const
    {
        line_bitmap retval;
        auto left = this->begin();
        auto right = other.begin();

        while (left != this->end() && right != other.end()) {
            if (*left < *right) {
                ++left;
            } else if (*right < *left) {
                ++right;
            } else {
                retval.append(*left);
                ++left;
                ++right;
            }
        }

        return retval;
    }

    line_bitmap unite(const line_bitmap& other) const
    {
        line_bitmap retval;
        auto left = this->begin();
        auto right = other.begin();

        while (left != this->end() || right != other.end()) {
            if (right == other.end() || (left != this->end() && *left < *right))
            {
                retval.append(*left);
                ++left;
            } else if (left == this->end() || *right < *left) {
                retval.append(*right);
                ++right;
            } else {
                retval.append(*left);
                ++left;
                ++right;
            }
        }

        return retval;
    }

    bool operator==(const line_bitmap& other) const
    {
        return this->size() == other.size()
            && std::equal(this->begin(), this->end(), other.begin());
    }

private:
    size_t sealed_size() const { return this->lb_chunks.size() * CHUNK_SIZE; }

    std::vector<std::shared_ptr<const std::vector<line_no_t>>> lb_chunks;
    std::vector<line_no_t> lb_tail;
};

}  // namespace loupe

#endif
