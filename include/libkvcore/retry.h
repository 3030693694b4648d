/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
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

#ifndef LIBKVCORE_RETRY_H
#define LIBKVCORE_RETRY_H 1

#include <stdint.h>

/**
 * @file
 * @brief Retry strategies
 *
 * Whenever an operation fails for a reason which may go away by itself the
 * operation's strategy is asked whether, and after how long, the operation
 * should be dispatched again.
 */

namespace kvc {

enum RetryReason {
    RETRY_REASON_UNKNOWN = 0,

    /** Connection was closed while the request was waiting for its response */
    RETRY_REASON_SOCKET_CLOSED_WHILE_IN_FLIGHT,

    /** No connection could be obtained for the target node */
    RETRY_REASON_ENDPOINT_NOT_AVAILABLE,

    /** No topology, or the partition has no active node */
    RETRY_REASON_TOPOLOGY_NOT_READY,

    /** The node no longer owns the partition */
    RETRY_REASON_NOT_MY_VBUCKET,

    /** The server reported a temporary failure or is busy */
    RETRY_REASON_KV_TEMPORARY_FAILURE,

    /** A synchronous write on the same document is in progress */
    RETRY_REASON_KV_SYNC_WRITE_IN_PROGRESS
};

const char *retry_reason_name(RetryReason reason);

/**
 * Whether a non idempotent operation may be sent again for this reason.
 * This is only the case when the server cannot have applied it.
 */
bool retry_reason_allows_non_idempotent_retry(RetryReason reason);

/** What the strategy knows about the operation being retried */
struct RetryContext {
    RetryContext() : attempts(0), idempotent(false) {}

    /** Number of retries performed so far */
    unsigned attempts;
    bool idempotent;
};

struct RetryAction {
    static RetryAction do_not_retry() {
        return RetryAction(false, 0);
    }
    static RetryAction retry_after(uint32_t usec) {
        return RetryAction(true, usec);
    }

    bool retry;

    /** Delay before the next dispatch, in microseconds */
    uint32_t delay;

  private:
    RetryAction(bool retry_, uint32_t delay_) : retry(retry_), delay(delay_) {}
};

class RetryStrategy {
  public:
    virtual ~RetryStrategy() {}
    virtual RetryAction should_retry(const RetryContext &ctx, RetryReason reason) = 0;
};

/**
 * Retries until the operation's deadline, backing off exponentially from
 * 1ms up to a configurable ceiling. Non idempotent operations are only
 * retried for reasons which guarantee the server did not apply them.
 */
class BestEffortRetryStrategy : public RetryStrategy {
  public:
    explicit BestEffortRetryStrategy(uint32_t max_backoff = 500000) : max_backoff_(max_backoff) {}
    RetryAction should_retry(const RetryContext &ctx, RetryReason reason);

  private:
    uint32_t max_backoff_;
};

/** Never retries */
class FailFastRetryStrategy : public RetryStrategy {
  public:
    RetryAction should_retry(const RetryContext &ctx, RetryReason reason);
};

} // namespace kvc

#endif
