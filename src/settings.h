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

#ifndef KVC_SETTINGS_H
#define KVC_SETTINGS_H

#include <libkvcore/error.h>
#include <libkvcore/logger.h>
#include <stdint.h>
#include <string>

/** All timeouts are in microseconds */
#define KVC_DEFAULT_TIMEOUT 2500000
#define KVC_DEFAULT_DURABILITY_TIMEOUT 5000000
#define KVC_DEFAULT_DURABILITY_INTERVAL 100000
#define KVC_DEFAULT_BATCH_DEFER_DELAY 100000
#define KVC_DEFAULT_CONNECT_TIMEOUT 5000000
#define KVC_DEFAULT_POOL_IDLE_TIMEOUT 4500000
#define KVC_DEFAULT_RETRY_BACKOFF_MAX 500000
#define KVC_DEFAULT_POOL_MAX_SIZE 1

namespace kvc {

/**
 * Stateless setting structure.
 * Specifically this contains the 'environment' of the instance for things
 * which are intended to be passed around to other objects.
 */
class Settings {
  public:
    Settings();

    /**
     * Parse and apply a setting by name.
     * @return KVC_ERR_INVALID_ARGUMENT for an unknown name or a bad value
     */
    kvc_STATUS set(const std::string &name, const std::string &value);

    /** Current value of a setting in the format accepted by set() */
    kvc_STATUS get(const std::string &name, std::string &value) const;

    uint32_t operation_timeout;
    uint32_t durability_timeout;
    uint32_t durability_interval;

    /** Delay before a batch is retried when no topology is available */
    uint32_t batch_defer_delay;
    uint32_t connect_timeout;

    /** Idle endpoints above the first one are closed after this long */
    uint32_t pool_idle_timeout;
    uint32_t retry_backoff_max;

    /** Maximum number of connections per (node, service) pair */
    unsigned pool_max_size;

    /** Send durability levels to the server instead of polling */
    bool enable_sync_durability;

    /** Prefix keys with their collection id on the wire */
    bool use_collections;

    /** Level of the console logger, 0 is off */
    unsigned console_log_level;

    std::string bucket;
    kvc_LOGGER *logger;

    /** Instance id, used in log messages */
    unsigned iid;
};

/** Parse a duration given in (possibly fractional) seconds */
kvc_STATUS parse_duration(const char *value, uint32_t &usec);

} // namespace kvc

#endif
