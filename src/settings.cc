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

using namespace kvc;

static unsigned next_iid = 0;

Settings::Settings()
    : operation_timeout(KVC_DEFAULT_TIMEOUT), durability_timeout(KVC_DEFAULT_DURABILITY_TIMEOUT),
      durability_interval(KVC_DEFAULT_DURABILITY_INTERVAL), batch_defer_delay(KVC_DEFAULT_BATCH_DEFER_DELAY),
      connect_timeout(KVC_DEFAULT_CONNECT_TIMEOUT), pool_idle_timeout(KVC_DEFAULT_POOL_IDLE_TIMEOUT),
      retry_backoff_max(KVC_DEFAULT_RETRY_BACKOFF_MAX), pool_max_size(KVC_DEFAULT_POOL_MAX_SIZE),
      enable_sync_durability(false), use_collections(false), console_log_level(0),
      logger(kvc_init_console_logger()), iid(next_iid++)
{
}
