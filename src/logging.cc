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

#include "config_static.h"
#include "logging.h"
#include "settings.h"

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>

static hrtime_t start_time = 0;

static void console_log(kvc_LOGGER *procs, unsigned int iid, const char *subsys, int severity, const char *srcfile,
                        int srcline, const char *fmt, va_list ap);

#define KVC_CONSOLE_LEVELS 5

static kvc_LOGGER console_loggers[KVC_CONSOLE_LEVELS] = {
    {console_log, (void *)(uintptr_t)1}, {console_log, (void *)(uintptr_t)2}, {console_log, (void *)(uintptr_t)3},
    {console_log, (void *)(uintptr_t)4}, {console_log, (void *)(uintptr_t)5}};

const char *kvc_log_severity_string(int severity)
{
    switch (severity) {
        case KVC_LOG_TRACE:
            return "TRACE";
        case KVC_LOG_DEBUG:
            return "DEBUG";
        case KVC_LOG_INFO:
            return "INFO";
        case KVC_LOG_WARN:
            return "WARN";
        case KVC_LOG_ERROR:
            return "ERROR";
        case KVC_LOG_FATAL:
            return "FATAL";
        default:
            return "";
    }
}

static void console_log(kvc_LOGGER *procs, unsigned int iid, const char *subsys, int severity, const char *srcfile,
                        int srcline, const char *fmt, va_list ap)
{
    unsigned level = (unsigned)(uintptr_t)procs->cookie;
    int minsev = KVC_LOG_ERROR - (int)(level - 1);
    if (severity < minsev) {
        return;
    }

    hrtime_t now = gethrtime();
    if (!start_time) {
        start_time = now;
    }

    fprintf(stderr, "%lums ", (unsigned long)((now - start_time) / 1000000));
    fprintf(stderr, "[I%u] {%d} [%s] (%s - L:%d) ", iid, (int)getpid(), kvc_log_severity_string(severity), subsys,
            srcline);
    vfprintf(stderr, fmt, ap);
    fprintf(stderr, "\n");
    (void)srcfile;
}

kvc_LOGGER *kvc_console_logger(unsigned minlevel)
{
    if (minlevel == 0) {
        return NULL;
    }
    if (minlevel > KVC_CONSOLE_LEVELS) {
        minlevel = KVC_CONSOLE_LEVELS;
    }
    return &console_loggers[minlevel - 1];
}

kvc_LOGGER *kvc_init_console_logger(void)
{
    const char *envstr = getenv("KVC_LOGLEVEL");
    if (!envstr || !*envstr) {
        return NULL;
    }
    char *end = NULL;
    long level = strtol(envstr, &end, 10);
    if (*end != '\0' || level <= 0) {
        return NULL;
    }
    return kvc_console_logger((unsigned)level);
}

void kvc_log(const kvc::Settings *settings, const char *subsys, int severity, const char *srcfile, int srcline,
             const char *fmt, ...)
{
    kvc_LOGGER *procs = settings ? settings->logger : NULL;
    if (!procs || !procs->callback) {
        return;
    }

    va_list ap;
    va_start(ap, fmt);
    procs->callback(procs, settings->iid, subsys, severity, srcfile, srcline, fmt, ap);
    va_end(ap);
}
