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
 * @file test_support.hh
 */

#ifndef loupe_test_support_hh
#define loupe_test_support_hh

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <stdlib.h>
#include <unistd.h>

/**
 * A directory under $TMPDIR that is removed along with its contents when
 * the object goes out of scope.
 */
class temp_dir {
public:
    temp_dir()
    {
        auto tmpl
            = (std::filesystem::temp_directory_path() / "loupe-test.XXXXXX")
                  .string();

        if (mkdtemp(tmpl.data()) != nullptr) {
            this->td_path = tmpl;
        }
    }

    ~temp_dir()
    {
        std::error_code ec;

        if (!this->td_path.empty()) {
            std::filesystem::remove_all(this->td_path, ec);
        }
    }

    temp_dir(const temp_dir&) = delete;

    temp_dir& operator=(const temp_dir&) = delete;

    std::filesystem::path operator/(const std::string& name) const
    {
        return this->td_path / name;
    }

    const std::filesystem::path& get_path() const { return this->td_path; }

private:
    std::filesystem::path td_path;
};

inline void
write_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);

    out << content;
}

inline void
append_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::app);

    out << content;
}

/** @return "count" lines of the form "<prefix> <n>\n", starting at "start". */
inline std::string
numbered_lines(const std::string& prefix, size_t start, size_t count)
{
    std::string retval;

    for (size_t lpc = start; lpc < start + count; lpc++) {
        retval.append(prefix);
        retval.push_back(' ');
        retval.append(std::to_string(lpc));
        retval.push_back('\n');
    }

    return retval;
}

#endif
