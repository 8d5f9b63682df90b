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
 * @file loupe_log.cc
 */

#include <signal.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include <atomic>
#include <mutex>

#include "loupe_log.hh"

#include "config.h"

static constexpr size_t RING_CAPACITY = 128 * 1024;
static constexpr size_t MAX_LOG_LINE_SIZE = 2 * 1024;

std::optional<FILE*> loupe_log_file;
loupe_log_level_t loupe_log_level = loupe_log_level_t::DEBUG;

// NOTE: This mutex is leaked so that it is not destroyed during exit.
static std::mutex&
log_mutex()
{
    static auto* retval = new std::mutex();

    return *retval;
}

static uint32_t
current_thread_number()
{
    static std::atomic<uint32_t> NEXT_NUMBER{0};
    thread_local uint32_t retval = NEXT_NUMBER++;

    return retval;
}

/**
 * Circular buffer of the most recent log lines.  When a new line does not
 * fit, whole lines are dropped from the front until it does.
 */
static struct {
    size_t lr_start;
    size_t lr_used;
    char lr_data[RING_CAPACITY];
} log_ring = {0, 0, {}};

static void
ring_drop_oldest_line()
{
    while (log_ring.lr_used > 0) {
        auto ch = log_ring.lr_data[log_ring.lr_start];

        log_ring.lr_start = (log_ring.lr_start + 1) % RING_CAPACITY;
        log_ring.lr_used -= 1;
        if (ch == '\n') {
            break;
        }
    }
}

static void
ring_append(const char* data, size_t len)
{
    while (log_ring.lr_used + len > RING_CAPACITY) {
        ring_drop_oldest_line();
    }
    for (size_t lpc = 0; lpc < len; lpc++) {
        auto pos = (log_ring.lr_start + log_ring.lr_used) % RING_CAPACITY;

        log_ring.lr_data[pos] = data[lpc];
        log_ring.lr_used += 1;
    }
}

static char
level_letter(loupe_log_level_t level)
{
    switch (level) {
        case loupe_log_level_t::TRACE:
            return 'T';
        case loupe_log_level_t::DEBUG:
            return 'D';
        case loupe_log_level_t::INFO:
            return 'I';
        case loupe_log_level_t::WARNING:
            return 'W';
        case loupe_log_level_t::ERROR:
            return 'E';
    }

    return '?';
}

bool
log_init_from_env()
{
    const char* log_path = getenv("LOUPE_LOG_PATH");

    if (log_path == nullptr) {
        return false;
    }

    auto* file = fopen(log_path, "ae");
    if (file == nullptr) {
        return false;
    }
    loupe_log_file = file;
    log_info("%s started logging to %s (pid=%d)",
             PACKAGE_STRING,
             log_path,
             getpid());

    return true;
}

void
log_msg(loupe_log_level_t level,
        const char* src_file,
        int line_number,
        const char* fmt,
        ...)
{
    if (level < loupe_log_level) {
        return;
    }

    const auto* base_name = strrchr(src_file, '/');
    if (base_name != nullptr) {
        src_file = base_name + 1;
    }

    char line[MAX_LOG_LINE_SIZE];
    struct timeval now;
    struct tm tm;

    gettimeofday(&now, nullptr);
    gmtime_r(&now.tv_sec, &tm);

    auto prefix_len = snprintf(line,
                               sizeof(line),
                               "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ %c t%u "
                               "%s:%d ",
                               tm.tm_year + 1900,
                               tm.tm_mon + 1,
                               tm.tm_mday,
                               tm.tm_hour,
                               tm.tm_min,
                               tm.tm_sec,
                               (int) (now.tv_usec / 1000),
                               level_letter(level),
                               current_thread_number(),
                               src_file,
                               line_number);
    if (prefix_len < 0) {
        return;
    }
    if ((size_t) prefix_len >= sizeof(line) - 1) {
        prefix_len = sizeof(line) - 2;
    }

    va_list args;
    va_start(args, fmt);
    auto avail = sizeof(line) - prefix_len - 1;
    auto msg_len = vsnprintf(&line[prefix_len], avail, fmt, args);
    va_end(args);

    if (msg_len < 0) {
        msg_len = 0;
    } else if ((size_t) msg_len >= avail) {
        msg_len = avail - 1;
    }

    auto total = (size_t) prefix_len + msg_len;
    line[total] = '\n';
    total += 1;

    std::lock_guard<std::mutex> lg(log_mutex());

    ring_append(line, total);
    if (loupe_log_file) {
        fwrite(line, 1, total, loupe_log_file.value());
        fflush(loupe_log_file.value());
    }
}

std::string
log_ring_contents()
{
    std::lock_guard<std::mutex> lg(log_mutex());
    std::string retval;

    retval.reserve(log_ring.lr_used);
    for (size_t lpc = 0; lpc < log_ring.lr_used; lpc++) {
        retval.push_back(
            log_ring.lr_data[(log_ring.lr_start + lpc) % RING_CAPACITY]);
    }

    return retval;
}

void
log_write_ring_to(int fd)
{
    auto contents = log_ring_contents();
    const char* pos = contents.data();
    auto remaining = contents.size();

    while (remaining > 0) {
        auto rc = write(fd, pos, remaining);

        if (rc <= 0) {
            break;
        }
        pos += rc;
        remaining -= rc;
    }
}

void
log_abort()
{
    raise(SIGABRT);
    _exit(1);
}
