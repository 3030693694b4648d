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

#ifndef KVC_LOGGING_H
#define KVC_LOGGING_H

#include <libkvcore/logger.h>

namespace kvc {
class Settings;
}

#ifdef __GNUC__
#define KVC__LOG_ATTR_FORMAT __attribute__((format(printf, 6, 7)))
#else
#define KVC__LOG_ATTR_FORMAT
#endif

/**
 * Log a message via the installed logger. The parameters correlate to the
 * arguments passed to the kvc_LOGGER_CALLBACK function.
 *
 * Typically a subsystem may wish to define macros in order to reduce the
 * number of arguments manually passed for each message.
 */
void kvc_log(const kvc::Settings *settings, const char *subsys, int severity, const char *srcfile, int srcline,
             const char *fmt, ...) KVC__LOG_ATTR_FORMAT;

/**
 * Returns the console logger if the `KVC_LOGLEVEL` environment variable is
 * set, NULL otherwise.
 */
kvc_LOGGER *kvc_init_console_logger(void);

/**
 * Console logger which writes to stderr, filtering messages below `minlevel`
 * where 1 is ERROR and 5 is TRACE.
 */
kvc_LOGGER *kvc_console_logger(unsigned minlevel);

const char *kvc_log_severity_string(int severity);

#define KVC_LOGS(settings, subsys, severity, msg) kvc_log(settings, subsys, severity, __FILE__, __LINE__, "%s", msg)

#endif /* KVC_LOGGING_H */
