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

#include <libkvcore/retry.h>

using namespace kvc;

const char *kvc::retry_reason_name(RetryReason reason)
{
    switch (reason) {
        case RETRY_REASON_SOCKET_CLOSED_WHILE_IN_FLIGHT:
            return "socket_closed_while_in_flight";
        case RETRY_REASON_ENDPOINT_NOT_AVAILABLE:
            return "endpoint_not_available";
        case RETRY_REASON_TOPOLOGY_NOT_READY:
            return "topology_not_ready";
        case RETRY_REASON_NOT_MY_VBUCKET:
            return "not_my_vbucket";
        case RETRY_REASON_KV_TEMPORARY_FAILURE:
            return "kv_temporary_failure";
        case RETRY_REASON_KV_SYNC_WRITE_IN_PROGRESS:
            return "kv_sync_write_in_progress";
        default:
            return "unknown";
    }
}

bool kvc::retry_reason_allows_non_idempotent_retry(RetryReason reason)
{
    switch (reason) {
        case RETRY_REASON_ENDPOINT_NOT_AVAILABLE:
        case RETRY_REASON_TOPOLOGY_NOT_READY:
        case RETRY_REASON_NOT_MY_VBUCKET:
        case RETRY_REASON_KV_TEMPORARY_FAILURE:
        case RETRY_REASON_KV_SYNC_WRITE_IN_PROGRESS:
            return true;
        default:
            return false;
    }
}

RetryAction BestEffortRetryStrategy::should_retry(const RetryContext &ctx, RetryReason reason)
{
    if (!ctx.idempotent && !retry_reason_allows_non_idempotent_retry(reason)) {
        return RetryAction::do_not_retry();
    }
    unsigned shift = ctx.attempts < 10 ? ctx.attempts : 10;
    uint32_t delay = 1000U << shift;
    if (delay > max_backoff_) {
        delay = max_backoff_;
    }
    return RetryAction::retry_after(delay);
}

RetryAction FailFastRetryStrategy::should_retry(const RetryContext &, RetryReason)
{
    return RetryAction::do_not_retry();
}
