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
 * @file fs_util.cc
 */

#include <errno.h>
#include <fcntl.h>
#include <string.h>

#include "fs_util.hh"

#include "config.h"
#include "loupe_log.hh"

namespace loupe {

io_error
io_error::from_errno(const std::filesystem::path& path, const char* op)
{
    auto err = errno;

    return io_error{
        path,
        err,
        fmt::format(FMT_STRING("{} failed: {} -- {}"), op, path, strerror(err)),
    };
}

std::string
io_error::to_string() const
{
    return this->ie_msg;
}

namespace filesystem {

Result<auto_fd, io_error>
open_file(const std::filesystem::path& path, int flags)
{
    auto fd = openp(path, flags | O_CLOEXEC);

    if (fd == -1) {
        return Err(io_error::from_errno(path, "open"));
    }

    return Ok(auto_fd(fd));
}

Result<struct stat, io_error>
stat_file(const std::filesystem::path& path)
{
    struct stat retval;

    if (statp(path, &retval) == -1) {
        return Err(io_error::from_errno(path, "stat"));
    }

    return Ok(retval);
}

Result<struct stat, io_error>
stat_fd(const std::filesystem::path& path, int fd)
{
    struct stat retval;

    if (fstat(fd, &retval) == -1) {
        return Err(io_error::from_errno(path, "fstat"));
    }

    return Ok(retval);
}

Result<size_t, io_error>
pread_fully(const std::filesystem::path& path,
            int fd,
            char* buf,
            size_t len,
            off_t offset)
{
    size_t retval = 0;

    while (retval < len) {
        auto rc = pread(fd, &buf[retval], len - retval, offset + retval);

        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            return Err(io_error::from_errno(path, "pread"));
        }
        if (rc == 0) {
            break;
        }
        retval += rc;
    }

    return Ok(retval);
}

}  // namespace filesystem
}  // namespace loupe

auto
fmt::formatter<std::filesystem::path>::format(const std::filesystem::path& p,
                                              format_context& ctx) const
    -> decltype(ctx.out())
{
    return formatter<string_view>::format(p.native(), ctx);
}
