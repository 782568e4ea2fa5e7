/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2024 Sky UK
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/
//
//  Logging.cpp
//  Quay
//
#ifndef _GNU_SOURCE
#  define _GNU_SOURCE
#endif

#include "Logging.h"

#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <cstdarg>
#include <cctype>
#include <ctime>
#include <algorithm>
#include <unistd.h>
#include <strings.h>
#include <sys/uio.h>



/* by default print all fatals, errors, warnings & milestones */
int __quay_log_level = QUAY_LOG_LEVEL_MILESTONE;


static void _quay_default_diag_printer(int level, const char *file, const char *func,
                                       int line, const char *message);

static QuayCommon::diag_printer_t __quay_diag_printer = &_quay_default_diag_printer;


/** ----------------------------------------------------------------------- **/
/**
 *  _quay_default_diag_printer - default log printer if none installed
 *
 *  Writes a single line to stderr prefixed with a monotonic timestamp, the
 *  level and the source location of the message.
 */
void _quay_default_diag_printer(int level, const char *file, const char *func,
                                int line, const char *message)
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);

    struct iovec iov[5];
    char tbuf[32];

    iov[0].iov_base = tbuf;
    iov[0].iov_len = snprintf(tbuf, sizeof(tbuf), "%.010lu.%.06lu ",
                              ts.tv_sec, ts.tv_nsec / 1000);
    iov[0].iov_len = std::min(iov[0].iov_len, sizeof(tbuf));

    switch (level) {
        case QUAY_LOG_LEVEL_FATAL:
            iov[1].iov_base = (void*)"FTL: ";
            iov[1].iov_len = 5;
            break;
        case QUAY_LOG_LEVEL_ERROR:
            iov[1].iov_base = (void*)"ERR: ";
            iov[1].iov_len = 5;
            break;
        case QUAY_LOG_LEVEL_WARNING:
            iov[1].iov_base = (void*)"WRN: ";
            iov[1].iov_len = 5;
            break;
        case QUAY_LOG_LEVEL_MILESTONE:
        case QUAY_LOG_LEVEL_PROD_MILESTONE:
            iov[1].iov_base = (void*)"MIL: ";
            iov[1].iov_len = 5;
            break;
        case QUAY_LOG_LEVEL_INFO:
            iov[1].iov_base = (void*)"NFO: ";
            iov[1].iov_len = 5;
            break;
        case QUAY_LOG_LEVEL_DEBUG:
            iov[1].iov_base = (void*)"DBG: ";
            iov[1].iov_len = 5;
            break;
        default:
            iov[1].iov_base = (void*)": ";
            iov[1].iov_len = 2;
            break;
    }

    char fbuf[160];
    iov[2].iov_base = (void*)fbuf;
    if (!file || !func || (line <= 0))
        iov[2].iov_len = snprintf(fbuf, sizeof(fbuf), "< M:? F:? L:? > ");
    else
        iov[2].iov_len = snprintf(fbuf, sizeof(fbuf), "< M:%.*s F:%.*s L:%d > ",
                                  64, file, 64, func, line);
    iov[2].iov_len = std::min(iov[2].iov_len, sizeof(fbuf));

    iov[3].iov_base = (void*)message;
    iov[3].iov_len = strlen(message);

    iov[4].iov_base = (void*)"\n";
    iov[4].iov_len = 1;


    if (writev(STDERR_FILENO, iov, 5) < 0)
    {
        // nowhere left to report it
    }
}


/** ----------------------------------------------------------------------- **/
/**
 *  _quay_log_vprintf - prints a log message at the given level
 *  @level: the level to message is for, should be one of QUAY_LOG_LEVEL_*
 *  @fmt: printf style format string
 *  @ap: printf style arguments
 *  @append: optional string appended to the formatted message
 *
 *  Messages longer than 512 characters are truncated.
 */
static void _quay_log_vprintf(int level, const char *file, const char *func,
                              int line, const char *fmt, va_list ap,
                              const char *append)
{
    if (__builtin_expect((level > __quay_log_level), 0))
        return;

    char mbuf[512];
    int len;

    len = vsnprintf(mbuf, sizeof(mbuf), fmt, ap);
    if (__builtin_expect((len < 1), 0))
        return;
    if (__builtin_expect((len > (int)(sizeof(mbuf) - 1)), 0))
        len = sizeof(mbuf) - 1;
    if (__builtin_expect((mbuf[len - 1] == '\n'), 0))
        len--;
    mbuf[len] = '\0';


    if (append && (len < (int)(sizeof(mbuf) - 1))) {
        size_t extra = std::min<size_t>(strlen(append), (sizeof(mbuf) - len - 1));
        memcpy(mbuf + len, append, extra);
        len += extra;
        mbuf[len] = '\0';
    }


    const char *fname = nullptr;
    if (file) {
        if ((fname = strrchr(file, '/')) == nullptr)
            fname = file;
        else
            fname++;
    }

    if (__quay_diag_printer) {
        __quay_diag_printer(level, fname, func, line, mbuf);
    }

}


extern "C" void __quay_log_printf(int level, const char *file,
                                  const char *func, int line,
                                  const char *fmt, ...)
{
    va_list ap;

    va_start(ap, fmt);
    _quay_log_vprintf(level, file, func, line, fmt, ap, nullptr);
    va_end(ap);
}

extern "C" void __quay_log_sys_printf(int err, int level, const char *file,
                                      const char *func, int line,
                                      const char *fmt, ...)
{
    va_list ap;
    char errbuf[64];
    const char *errmsg;
    char appendbuf[96];
    const char *append = nullptr;

    errmsg = strerror_r(err, errbuf, sizeof(errbuf));

    if (errmsg) {
        snprintf(appendbuf, sizeof(appendbuf), " (%d - %s)", err, errmsg);
        appendbuf[sizeof(appendbuf) - 1] = '\0';
        append = appendbuf;
    }

    va_start(ap, fmt);
    _quay_log_vprintf(level, file, func, line, fmt, ap, append);
    va_end(ap);
}



void QuayCommon::initLogging(diag_printer_t diagPrinter)
{
    if (diagPrinter)
        __quay_diag_printer = diagPrinter;
    else
        __quay_diag_printer = &_quay_default_diag_printer;
}

void QuayCommon::termLogging()
{
    __quay_diag_printer = &_quay_default_diag_printer;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Sets the log level from one of it's names.
 *
 *  Accepted names are 'fatal', 'error', 'warning', 'milestone', 'info' and
 *  'debug'.
 *
 *  @return true if the name was recognised, otherwise false and the level is
 *  left unchanged.
 */
bool QuayCommon::setLogLevel(const std::string &levelName)
{
    static const struct
    {
        const char *name;
        int level;
    } levels[] = {
        { "fatal",      QUAY_LOG_LEVEL_FATAL     },
        { "error",      QUAY_LOG_LEVEL_ERROR     },
        { "warning",    QUAY_LOG_LEVEL_WARNING   },
        { "milestone",  QUAY_LOG_LEVEL_MILESTONE },
        { "info",       QUAY_LOG_LEVEL_INFO      },
        { "debug",      QUAY_LOG_LEVEL_DEBUG     },
    };

    for (const auto &entry : levels)
    {
        if (strcasecmp(levelName.c_str(), entry.name) == 0)
        {
            __quay_log_level = entry.level;
            return true;
        }
    }

    return false;
}
