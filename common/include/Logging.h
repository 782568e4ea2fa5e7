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
//  Logging.h
//  Quay
//
#ifndef QUAY_LOGGING_H
#define QUAY_LOGGING_H


/**
 * One of the following should be set by the build system, if they aren't
 * we're in trouble.
 */
#if !defined(QUAY_BUILD_TYPE) || !defined(QUAY_RELEASE) || !defined(QUAY_DEBUG)
#  warning "No build type defined, expected QUAY_BUILD_TYPE to be defined to either QUAY_RELEASE or QUAY_DEBUG"
#endif
#if (QUAY_BUILD_TYPE != QUAY_RELEASE) && (QUAY_BUILD_TYPE != QUAY_DEBUG)
#  warning "QUAY_BUILD_TYPE is not equal to QUAY_RELEASE or QUAY_DEBUG"
#endif


#ifdef __cplusplus
extern "C" {
#endif



extern int __quay_log_level;
extern void __quay_log_printf(int level, const char *file, const char *func,
                              int line, const char *fmt, ...)
    __attribute__ ((format (printf, 5, 6)));
extern void __quay_log_sys_printf(int err, int level, const char *file,
                                  const char *func, int line,
                                  const char *fmt, ...)
    __attribute__ ((format (printf, 6, 7)));


#define QUAY_LOG_LEVEL_PROD_MILESTONE  -1
#define QUAY_LOG_LEVEL_FATAL            0
#define QUAY_LOG_LEVEL_ERROR            1
#define QUAY_LOG_LEVEL_WARNING          2
#define QUAY_LOG_LEVEL_MILESTONE        3
#define QUAY_LOG_LEVEL_INFO             4
#define QUAY_LOG_LEVEL_DEBUG            5



/**
 * Debugging macros.
 *
 * Primatives for debugging.
 *
 */
#define __QUAY_LOG_PRINTF(level, fmt, ...) \
    do {  \
        if (__builtin_expect(((level) <= __quay_log_level),0)) \
            __quay_log_printf((level), __FILE__, __FUNCTION__, __LINE__, fmt, ##__VA_ARGS__); \
    } while(0)

#define __QUAY_LOG_SYS_PRINTF(err, level, fmt, ...) \
    do {  \
        if (__builtin_expect(((level) <= __quay_log_level),0)) \
            __quay_log_sys_printf((err), (level), __FILE__, __FUNCTION__, __LINE__, fmt, ##__VA_ARGS__); \
    } while(0)


/* In all builds we support production milestone logging */
#define QUAY_LOG_PROD_MILESTONE(fmt,...) \
    __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_PROD_MILESTONE, fmt, ##__VA_ARGS__)


/* In release builds only enable the milestone, warning, error and fatal messages */
#if (QUAY_BUILD_TYPE == QUAY_RELEASE)
#   define QUAY_LOG_FN_ENTRY()
#   define QUAY_LOG_FN_EXIT()
#   define QUAY_LOG_DEBUG(fmt,...)
#   define QUAY_LOG_INFO(fmt,...)
#   define QUAY_LOG_MILESTONE(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_MILESTONE, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_WARN(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_WARNING, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_SYS_WARN(err,fmt,...) \
        __QUAY_LOG_SYS_PRINTF(err, QUAY_LOG_LEVEL_WARNING, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_ERROR(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_ERROR, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_SYS_ERROR(err, fmt,...) \
        __QUAY_LOG_SYS_PRINTF(err, QUAY_LOG_LEVEL_ERROR, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_ERROR_EXIT(fmt,...) \
        QUAY_LOG_ERROR(fmt, ##__VA_ARGS__)
#   define QUAY_LOG_SYS_ERROR_EXIT(err,fmt,...) \
        QUAY_LOG_SYS_ERROR(err, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_FATAL(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_FATAL, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_SYS_FATAL(err,fmt,...) \
        __QUAY_LOG_SYS_PRINTF(err, QUAY_LOG_LEVEL_FATAL, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_FATAL_EXIT(fmt,...) \
        QUAY_LOG_FATAL(fmt, ##__VA_ARGS__)
#   define QUAY_LOG_SYS_FATAL_EXIT(err,fmt,...) \
        QUAY_LOG_SYS_FATAL(err, fmt, ##__VA_ARGS__)

/* debug builds can print the following but the log level actually sets what
 * is printed.
 */
#else /* (QUAY_BUILD_TYPE == QUAY_RELEASE) */

#   define QUAY_LOG_FN_ENTRY() \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_DEBUG, "entry")
#   define QUAY_LOG_FN_EXIT() \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_DEBUG, "exit")
#   define QUAY_LOG_DEBUG(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_DEBUG, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_INFO(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_INFO, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_MILESTONE(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_MILESTONE, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_WARN(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_WARNING, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_SYS_WARN(err,fmt,...) \
        __QUAY_LOG_SYS_PRINTF(err, QUAY_LOG_LEVEL_WARNING, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_ERROR(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_ERROR, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_SYS_ERROR(err, fmt,...) \
        __QUAY_LOG_SYS_PRINTF(err, QUAY_LOG_LEVEL_ERROR, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_ERROR_EXIT(fmt,...) \
        do { \
            QUAY_LOG_ERROR(fmt, ##__VA_ARGS__); \
            QUAY_LOG_FN_EXIT(); \
        } while(0)
#   define QUAY_LOG_SYS_ERROR_EXIT(err,fmt,...) \
        do { \
            QUAY_LOG_SYS_ERROR(err, fmt, ##__VA_ARGS__); \
            QUAY_LOG_FN_EXIT(); \
        } while(0)
#   define QUAY_LOG_FATAL(fmt,...) \
        __QUAY_LOG_PRINTF(QUAY_LOG_LEVEL_FATAL, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_SYS_FATAL(err,fmt,...) \
        __QUAY_LOG_SYS_PRINTF(err, QUAY_LOG_LEVEL_FATAL, fmt, ##__VA_ARGS__)
#   define QUAY_LOG_FATAL_EXIT(fmt,...) \
        do { \
            QUAY_LOG_FATAL(fmt, ##__VA_ARGS__); \
            QUAY_LOG_FN_EXIT(); \
        } while(0)
#   define QUAY_LOG_SYS_FATAL_EXIT(err,fmt,...) \
        do { \
            QUAY_LOG_SYS_FATAL(err, fmt, ##__VA_ARGS__); \
            QUAY_LOG_FN_EXIT(); \
        } while(0)

#endif /* (QUAY_BUILD_TYPE != QUAY_RELEASE) */



#ifdef __cplusplus
}
#endif

#ifdef __cplusplus

#include <functional>
#include <string>


namespace QuayCommon
{

    typedef std::function<void (int level, const char *file, const char *func, int line, const char *message)> diag_printer_t;

    void initLogging(diag_printer_t diagPrinter = nullptr);
    void termLogging();

    bool setLogLevel(const std::string &levelName);

} // namespace QuayCommon

#endif // defined(__cplusplus)



#endif /* QUAY_LOGGING_H */
