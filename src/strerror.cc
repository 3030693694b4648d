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

#include <libkvcore/error.h>
#include <string.h>

/* KVC_ERR_DOCUMENT_NOT_FOUND -> DOCUMENT_NOT_FOUND */
static const char *strip_prefix(const char *name)
{
    if (strncmp(name, "KVC_ERR_", 8) == 0) {
        return name + 8;
    }
    return name + 4;
}

const char *kvc_strerror_short(kvc_STATUS rc)
{
#define X(n, v, cls, f, s)                                                                                             \
    case n:                                                                                                            \
        return strip_prefix(#n);
    switch (rc) {
        KVC_XERROR(X)
        default:
            return "UNKNOWN_ERROR";
    }
#undef X
}

const char *kvc_strerror_long(kvc_STATUS rc)
{
#define X(n, v, cls, f, s)                                                                                             \
    case n:                                                                                                            \
        return s;
    switch (rc) {
        KVC_XERROR(X)
        default:
            return "Unknown error code";
    }
#undef X
}

kvc_ERROR_TYPE kvc_errtype(kvc_STATUS rc)
{
#define X(n, v, cls, f, s)                                                                                             \
    case n:                                                                                                            \
        return cls;
    switch (rc) {
        KVC_XERROR(X)
        default:
            return KVC_ERRTYPE_SHARED;
    }
#undef X
}

int kvc_errflags(kvc_STATUS rc)
{
#define X(n, v, cls, f, s)                                                                                             \
    case n:                                                                                                            \
        return f;
    switch (rc) {
        KVC_XERROR(X)
        default:
            return 0;
    }
#undef X
}
