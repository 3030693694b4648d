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

#include "settings.h"
#include "logging.h"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define LOGARGS(settings, lvl) settings, "cntl", KVC_LOG_##lvl, __FILE__, __LINE__

using namespace kvc;

kvc_STATUS kvc::parse_duration(const char *arg, uint32_t &usec)
{
    char *end = NULL;
    errno = 0;
    double dtmp = strtod(arg, &end);
    if (errno == ERANGE || end == arg || *end != '\0' || dtmp < 0) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    dtmp *= 1000000;
    if (dtmp > (double)UINT32_MAX) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    usec = static_cast<uint32_t>(dtmp);
    return KVC_SUCCESS;
}

static kvc_STATUS convert_intbool(const char *arg, bool &out)
{
    if (!strcmp(arg, "true") || !strcmp(arg, "on") || !strcmp(arg, "1")) {
        out = true;
    } else if (!strcmp(arg, "false") || !strcmp(arg, "off") || !strcmp(arg, "0")) {
        out = false;
    } else {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    return KVC_SUCCESS;
}

static kvc_STATUS convert_unsigned(const char *arg, unsigned &out)
{
    char *end = NULL;
    errno = 0;
    unsigned long tmp = strtoul(arg, &end, 10);
    if (errno == ERANGE || end == arg || *end != '\0' || arg[0] == '-' || tmp > UINT32_MAX) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    out = static_cast<unsigned>(tmp);
    return KVC_SUCCESS;
}

static void format_timevalue(uint32_t usec, std::string &out)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%g", (double)usec / 1000000.0);
    out = buf;
}

static void format_unsigned(unsigned val, std::string &out)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%u", val);
    out = buf;
}

typedef kvc_STATUS (*cntl_SETTER)(Settings *settings, const char *arg);
typedef void (*cntl_GETTER)(const Settings *settings, std::string &out);

#define TIMEVALUE_HANDLER(field)                                                                                       \
    static kvc_STATUS set_##field(Settings *settings, const char *arg)                                                 \
    {                                                                                                                  \
        return parse_duration(arg, settings->field);                                                                   \
    }                                                                                                                  \
    static void get_##field(const Settings *settings, std::string &out)                                                \
    {                                                                                                                  \
        format_timevalue(settings->field, out);                                                                        \
    }

/** As TIMEVALUE_HANDLER, for durations which must not be zero */
#define NONZERO_TIMEVALUE_HANDLER(field)                                                                               \
    static kvc_STATUS set_##field(Settings *settings, const char *arg)                                                 \
    {                                                                                                                  \
        uint32_t usec;                                                                                                 \
        kvc_STATUS rc = parse_duration(arg, usec);                                                                     \
        if (rc != KVC_SUCCESS) {                                                                                       \
            return rc;                                                                                                 \
        }                                                                                                              \
        if (usec == 0) {                                                                                               \
            return KVC_ERR_INVALID_ARGUMENT;                                                                           \
        }                                                                                                              \
        settings->field = usec;                                                                                        \
        return KVC_SUCCESS;                                                                                            \
    }                                                                                                                  \
    static void get_##field(const Settings *settings, std::string &out)                                                \
    {                                                                                                                  \
        format_timevalue(settings->field, out);                                                                        \
    }

#define BOOL_HANDLER(field)                                                                                            \
    static kvc_STATUS set_##field(Settings *settings, const char *arg)                                                 \
    {                                                                                                                  \
        return convert_intbool(arg, settings->field);                                                                  \
    }                                                                                                                  \
    static void get_##field(const Settings *settings, std::string &out)                                                \
    {                                                                                                                  \
        out = settings->field ? "true" : "false";                                                                      \
    }

NONZERO_TIMEVALUE_HANDLER(operation_timeout)
NONZERO_TIMEVALUE_HANDLER(durability_timeout)
NONZERO_TIMEVALUE_HANDLER(durability_interval)
NONZERO_TIMEVALUE_HANDLER(batch_defer_delay)
NONZERO_TIMEVALUE_HANDLER(connect_timeout)
TIMEVALUE_HANDLER(pool_idle_timeout)
TIMEVALUE_HANDLER(retry_backoff_max)
BOOL_HANDLER(enable_sync_durability)
BOOL_HANDLER(use_collections)

static kvc_STATUS set_pool_max_size(Settings *settings, const char *arg)
{
    unsigned val;
    kvc_STATUS rc = convert_unsigned(arg, val);
    if (rc != KVC_SUCCESS) {
        return rc;
    }
    if (val == 0) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    settings->pool_max_size = val;
    return KVC_SUCCESS;
}

static void get_pool_max_size(const Settings *settings, std::string &out)
{
    format_unsigned(settings->pool_max_size, out);
}

static kvc_STATUS set_console_log_level(Settings *settings, const char *arg)
{
    unsigned val;
    kvc_STATUS rc = convert_unsigned(arg, val);
    if (rc != KVC_SUCCESS) {
        return rc;
    }
    settings->console_log_level = val;
    settings->logger = kvc_console_logger(val);
    return KVC_SUCCESS;
}

static void get_console_log_level(const Settings *settings, std::string &out)
{
    format_unsigned(settings->console_log_level, out);
}

static kvc_STATUS set_bucket(Settings *settings, const char *arg)
{
    settings->bucket = arg;
    return KVC_SUCCESS;
}

static void get_bucket(const Settings *settings, std::string &out)
{
    out = settings->bucket;
}

typedef struct {
    const char *key;
    cntl_SETTER set;
    cntl_GETTER get;
} cntl_OPCODESTRS;

#define HANDLER(name) {#name, set_##name, get_##name}

static cntl_OPCODESTRS stropcode_map[] = {HANDLER(operation_timeout),
                                          {"timeout", set_operation_timeout, get_operation_timeout},
                                          HANDLER(durability_timeout),
                                          HANDLER(durability_interval),
                                          HANDLER(batch_defer_delay),
                                          HANDLER(connect_timeout),
                                          HANDLER(pool_idle_timeout),
                                          HANDLER(retry_backoff_max),
                                          HANDLER(pool_max_size),
                                          HANDLER(enable_sync_durability),
                                          HANDLER(use_collections),
                                          HANDLER(console_log_level),
                                          HANDLER(bucket),
                                          {NULL, NULL, NULL}};

static const cntl_OPCODESTRS *find_handler(const std::string &name)
{
    for (const cntl_OPCODESTRS *cur = stropcode_map; cur->key; ++cur) {
        if (name == cur->key) {
            return cur;
        }
    }
    return NULL;
}

kvc_STATUS Settings::set(const std::string &name, const std::string &value)
{
    const cntl_OPCODESTRS *handler = find_handler(name);
    if (handler == NULL) {
        kvc_log(LOGARGS(this, WARN), "Unknown setting \"%s\"", name.c_str());
        return KVC_ERR_INVALID_ARGUMENT;
    }
    kvc_STATUS rc = handler->set(this, value.c_str());
    if (rc != KVC_SUCCESS) {
        kvc_log(LOGARGS(this, WARN), "Invalid value \"%s\" for setting \"%s\"", value.c_str(), name.c_str());
        return rc;
    }
    kvc_log(LOGARGS(this, DEBUG), "Setting %s=%s", name.c_str(), value.c_str());
    return KVC_SUCCESS;
}

kvc_STATUS Settings::get(const std::string &name, std::string &value) const
{
    const cntl_OPCODESTRS *handler = find_handler(name);
    if (handler == NULL) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    handler->get(this, value);
    return KVC_SUCCESS;
}
