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

/**
 * Platform specific definitions shared by all sources.
 */
#ifndef KVCORE_CONFIG_STATIC_H
#define KVCORE_CONFIG_STATIC_H 1

#include <stdint.h>
#include <inttypes.h>
#include <netinet/in.h>
#include <sys/time.h>
#include <unistd.h>

#ifdef __cplusplus
extern "C" {
#endif

uint64_t kvc_byteswap64(uint64_t val);

typedef uint64_t hrtime_t;

/** Monotonic time in nanoseconds */
hrtime_t gethrtime(void);

#ifdef __cplusplus
}
#endif

#if __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#define kvc_ntohll(a) (a)
#define kvc_htonll(a) (a)
#else
#define kvc_ntohll(a) kvc_byteswap64(a)
#define kvc_htonll(a) kvc_byteswap64(a)
#endif

#define KVC_US2NS(us) (((hrtime_t)(us)) * 1000)
#define KVC_NS2US(ns) ((ns) / 1000)
#define KVC_MS2US(ms) ((ms) * 1000)
#define KVC_S2US(s) ((s) * 1000000)

#endif /* KVCORE_CONFIG_STATIC_H */
