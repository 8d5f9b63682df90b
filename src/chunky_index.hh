/**
 * Copyright (c) 2025, Timothy Stack
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
 * * Neither the name of Timothy Stack nor the names of its contributors
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
 * @file chunky_index.hh
 */

#ifndef loupe_chunky_index_hh
#define loupe_chunky_index_hh

#include <iterator>
#include <memory>
#include <vector>

#include <stdlib.h>

#include "base/loupe_log.hh"

/**
 * An append-only array that grows in fixed-size chunks.  Elements never move
 * once they are stored, so growing the index costs one allocation per chunk
 * instead of a copy of everything stored so far.
 */
template<typename T, size_t CHUNK_SIZE = 4096>
class chunky_index {
public:
    class iterator {
    public:
        typedef std::random_access_iterator_tag iterator_category;
        typedef T value_type;
        typedef const T* pointer;
        typedef const T& reference;
        typedef std::ptrdiff_t difference_type;

        iterator(const chunky_index* ci = nullptr, size_t offset = 0)
            : i_chunky(ci), i_offset(offset)
        {
        }

        iterator& operator++()
        {
            this->i_offset += 1;
            return *this;
        }

        iterator& operator--()
        {
            this->i_offset -= 1;
            return *this;
        }

        const T& operator*() const { return (*this->i_chunky)[this->i_offset]; }

        bool operator!=(const iterator& other) const
        {
            return (this->i_chunky != other.i_chunky)
                || (this->i_offset != other.i_offset);
        }

        bool operator==(const iterator& other) const
        {
            return (this->i_chunky == other.i_chunky)
                && (this->i_offset == other.i_offset);
        }

        bool operator<(const iterator& other) const
        {
            return this->i_offset < other.i_offset;
        }

        difference_type operator-(const iterator& other) const
        {
            return this->i_offset - other.i_offset;
        }

        iterator operator+(difference_type n) const
        {
            return iterator(this->i_chunky, this->i_offset + n);
        }

        iterator& operator+=(difference_type n)
        {
            this->i_offset += n;
            return *this;
        }

        const T& operator[](difference_type n) const
        {
            return (*this->i_chunky)[this->i_offset + n];
        }

    private:
        const chunky_index* i_chunky;
        size_t i_offset;
    };

    chunky_index() = default;

    chunky_index(const chunky_index&) = delete;

    chunky_index(chunky_index&&) = default;

    chunky_index& operator=(chunky_index&&) = default;

    iterator begin() const { return iterator(this); }

    iterator end() const { return iterator(this, this->ci_size); }

    size_t size() const { return this->ci_size; }

    bool empty() const { return this->ci_size == 0; }

    size_t chunk_count() const { return this->ci_chunks.size(); }

    const T& operator[](size_t index) const
    {
        require(index < this->ci_size);

        return this->ci_chunks[index / CHUNK_SIZE]->c_body[index % CHUNK_SIZE];
    }

    const T& back() const { return (*this)[this->ci_size - 1]; }

    void push_back(const T& val)
    {
        if (this->ci_size == this->ci_chunks.size() * CHUNK_SIZE) {
            this->ci_chunks.emplace_back(std::make_unique<chunk>());
        }
        this->ci_chunks.back()->c_body[this->ci_size % CHUNK_SIZE] = val;
        this->ci_size += 1;
    }

    void pop_back()
    {
        require(this->ci_size > 0);

        this->ci_size -= 1;
        if (this->ci_size % CHUNK_SIZE == 0) {
            this->ci_chunks.pop_back();
        }
    }

    void clear()
    {
        this->ci_chunks.clear();
        this->ci_size = 0;
    }

private:
    struct chunk {
        T c_body[CHUNK_SIZE];
    };

    std::vector<std::unique_ptr<chunk>> ci_chunks;
    size_t ci_size{0};
};

#endif
