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
 * @file fs_util.hh
 */

#ifndef loupe_fs_util_hh
#define loupe_fs_util_hh

#include <filesystem>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

#include "auto_fd.hh"
#include "fmt/format.h"
#include "result.h"

namespace loupe {

/**
 * An open, stat or read failure for a single source.
 */
struct io_error {
    std::filesystem::path ie_path;
    int ie_errno{0};
    std::string ie_msg;

    static io_error from_errno(const std::filesystem::path& path,
                               const char* op);

    std::string to_string() const;
};

namespace filesystem {

inline int
statp(const std::filesystem::path& path, struct stat* buf)
{
    return stat(path.c_str(), buf);
}

inline int
openp(const std::filesystem::path& path, int flags)
{
    return open(path.c_str(), flags);
}

Result<auto_fd, io_error> open_file(const std::filesystem::path& path,
                                    int flags);

Result<struct stat, io_error> stat_file(const std::filesystem::path& path);

Result<struct stat, io_error> stat_fd(const std::filesystem::path& path,
                                      int fd);

/**
 * Read from the file until "len" bytes have been read or end-of-file is
 * reached.
 *
 * @return The number of bytes actually read.
 */
Result<size_t, io_error> pread_fully(const std::filesystem::path& path,
                                     int fd,
                                     char* buf,
                                     size_t len,
                                     off_t offset);

}  // namespace filesystem
}  // namespace loupe

namespace fmt {
template<>
struct formatter<std::filesystem::path> : formatter<string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const
        -> decltype(ctx.out());
};
}  // namespace fmt

#endif
