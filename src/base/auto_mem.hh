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
 * @file auto_mem.hh
 */

#ifndef loupe_auto_mem_hh
#define loupe_auto_mem_hh

#include <utility>

using free_func_t = void (*)(void*);

/**
 * Owns a pointer returned by a C library and releases it with the library's
 * free function, like yajl_tree_free() or pcre2_code_free().
 */
template<class T>
class auto_mem {
public:
    template<typename F>
    explicit auto_mem(F free_func) noexcept
        : am_ptr(nullptr), am_free_func((free_func_t) free_func)
    {
    }

    auto_mem(auto_mem&& other) noexcept
        : am_ptr(other.release()), am_free_func(other.am_free_func)
    {
    }

    auto_mem(const auto_mem&) = delete;

    ~auto_mem() { this->reset(); }

    auto_mem& operator=(T* ptr)
    {
        this->reset(ptr);
        return *this;
    }

    auto_mem& operator=(auto_mem&& other) noexcept
    {
        this->reset(other.release());
        this->am_free_func = other.am_free_func;
        return *this;
    }

    auto_mem& operator=(const auto_mem&) = delete;

    operator T*() const { return this->am_ptr; }

    T* in() const { return this->am_ptr; }

    bool empty() const { return this->am_ptr == nullptr; }

    T* release() { return std::exchange(this->am_ptr, nullptr); }

    void reset(T* ptr = nullptr)
    {
        if (this->am_ptr == ptr) {
            return;
        }
        if (this->am_ptr != nullptr) {
            this->am_free_func((void*) this->am_ptr);
        }
        this->am_ptr = ptr;
    }

private:
    T* am_ptr;
    free_func_t am_free_func;
};

#endif
