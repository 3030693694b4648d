/* -*- Mode: C; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2026 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#ifndef LIBKVCORE_LOGGER_H
#define LIBKVCORE_LOGGER_H 1

#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @ingroup kvc-logging
 * @brief Logging Levels
 */
typedef enum {
    KVC_LOG_TRACE = 0, /**< The most verbose level */
    KVC_LOG_DEBUG,     /**< Diagnostic information, required to investigate problems */
    KVC_LOG_INFO,      /**< Useful information, not needed for most users */
    KVC_LOG_WARN,      /**< Set this level to only receive warnings */
    KVC_LOG_ERROR,     /**< Error messages, typically with a follow-up error code */
    KVC_LOG_FATAL,     /**< Fatal errors, the library cannot proceed */
    KVC_LOG_MAX        /**< Internal value for total number of levels */
} kvc_LOG_SEVERITY;

struct kvc_LOGGER_st;

/**
 * @brief Logger callback
 *
 * @param procs the logger object the callback belongs to
 * @param iid instance id
 * @param subsys a string describing the module which emitted the message
 * @param severity one of the KVC_LOG_* severity constants
 * @param srcfile the source file which emitted this message
 * @param srcline the line of the file for the message
 * @param fmt a printf format string
 * @param ap a va_list for vprintf
 */
typedef void (*kvc_LOGGER_CALLBACK)(struct kvc_LOGGER_st *procs, unsigned int iid, const char *subsys,
                                    int severity, const char *srcfile, int srcline, const char *fmt, va_list ap);

typedef struct kvc_LOGGER_st {
    kvc_LOGGER_CALLBACK callback;
    void *cookie;
} kvc_LOGGER;

#ifdef __cplusplus
}
#endif
#endif
