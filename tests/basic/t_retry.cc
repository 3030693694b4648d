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
#include <gtest/gtest.h>
#include <libkvcore/retry.h>
#include "backoff.h"
#include "kvcio/iotable.h"
#include "operations/durability_internal.h"

using namespace kvc;

class RetryStrategyTest : public ::testing::Test
{
protected:
    static RetryContext context(unsigned attempts, bool idempotent) {
        RetryContext ctx;
        ctx.attempts = attempts;
        ctx.idempotent = idempotent;
        return ctx;
    }
};

class FakeClock : public Clock
{
public:
    FakeClock() : current(1000000000ULL) {}
    hrtime_t now() const {
        return current;
    }
    hrtime_t current;
};

TEST_F(RetryStrategyTest, testBestEffortBackoff)
{
    BestEffortRetryStrategy strategy(500000);
    RetryAction action = strategy.should_retry(context(0, true), RETRY_REASON_NOT_MY_VBUCKET);
    ASSERT_TRUE(action.retry);
    EXPECT_EQ(1000U, action.delay);

    action = strategy.should_retry(context(3, true), RETRY_REASON_NOT_MY_VBUCKET);
    EXPECT_EQ(8000U, action.delay);

    // Capped
    action = strategy.should_retry(context(9, true), RETRY_REASON_KV_TEMPORARY_FAILURE);
    EXPECT_EQ(500000U, action.delay);
    action = strategy.should_retry(context(100, true), RETRY_REASON_KV_TEMPORARY_FAILURE);
    EXPECT_TRUE(action.retry);
    EXPECT_EQ(500000U, action.delay);

    BestEffortRetryStrategy small(2000);
    EXPECT_EQ(2000U, small.should_retry(context(5, true), RETRY_REASON_NOT_MY_VBUCKET).delay);
}

TEST_F(RetryStrategyTest, testNonIdempotent)
{
    BestEffortRetryStrategy strategy;

    // The server cannot have applied these
    EXPECT_TRUE(strategy.should_retry(context(0, false), RETRY_REASON_NOT_MY_VBUCKET).retry);
    EXPECT_TRUE(strategy.should_retry(context(0, false), RETRY_REASON_KV_TEMPORARY_FAILURE).retry);
    EXPECT_TRUE(strategy.should_retry(context(0, false), RETRY_REASON_ENDPOINT_NOT_AVAILABLE).retry);
    EXPECT_TRUE(strategy.should_retry(context(0, false), RETRY_REASON_TOPOLOGY_NOT_READY).retry);
    EXPECT_TRUE(strategy.should_retry(context(0, false), RETRY_REASON_KV_SYNC_WRITE_IN_PROGRESS).retry);

    // ... but it may have applied these
    EXPECT_FALSE(strategy.should_retry(context(0, false), RETRY_REASON_SOCKET_CLOSED_WHILE_IN_FLIGHT).retry);
    EXPECT_FALSE(strategy.should_retry(context(0, false), RETRY_REASON_UNKNOWN).retry);
    EXPECT_TRUE(strategy.should_retry(context(0, true), RETRY_REASON_SOCKET_CLOSED_WHILE_IN_FLIGHT).retry);
}

TEST_F(RetryStrategyTest, testFailFast)
{
    FailFastRetryStrategy strategy;
    EXPECT_FALSE(strategy.should_retry(context(0, true), RETRY_REASON_NOT_MY_VBUCKET).retry);
    EXPECT_FALSE(strategy.should_retry(context(0, true), RETRY_REASON_TOPOLOGY_NOT_READY).retry);
}

TEST_F(RetryStrategyTest, testReasonNames)
{
    EXPECT_STREQ("not_my_vbucket", retry_reason_name(RETRY_REASON_NOT_MY_VBUCKET));
    EXPECT_STREQ("topology_not_ready", retry_reason_name(RETRY_REASON_TOPOLOGY_NOT_READY));
    EXPECT_STREQ("unknown", retry_reason_name(RETRY_REASON_UNKNOWN));
}

TEST_F(RetryStrategyTest, testBoundedRetryDeadline)
{
    io::Table iot(NULL, NULL);
    FakeClock clock;
    hrtime_t deadline = clock.current + KVC_US2NS(5000);
    BoundedRetry retry(&iot, &clock, deadline, 1000000, 1000000);

    EXPECT_FALSE(retry.expired());
    EXPECT_EQ(5000U, retry.remaining());

    // The one second delay is clamped to the five milliseconds left
    int nfired = 0;
    hrtime_t begin = gethrtime();
    ASSERT_TRUE(retry.schedule([&nfired]() { nfired++; }));
    iot.run();
    EXPECT_EQ(1, nfired);
    EXPECT_LT(gethrtime() - begin, KVC_US2NS(500000));
    EXPECT_EQ(1U, retry.attempts());

    clock.current = deadline;
    EXPECT_TRUE(retry.expired());
    EXPECT_EQ(0U, retry.remaining());
    EXPECT_FALSE(retry.schedule([&nfired]() { nfired++; }));
    EXPECT_EQ(1U, retry.attempts());
}

TEST_F(RetryStrategyTest, testBoundedRetryCancel)
{
    io::Table iot(NULL, NULL);
    FakeClock clock;
    CancelToken token;
    BoundedRetry retry(&iot, &clock, clock.current + KVC_US2NS(1000000), 1000, 1000, token);

    int nfired = 0;
    ASSERT_TRUE(retry.schedule([&nfired]() { nfired++; }));
    retry.cancel();
    iot.run();
    EXPECT_EQ(0, nfired);

    token.cancel();
    EXPECT_FALSE(retry.schedule([&nfired]() { nfired++; }));
}

class DurabilityThresholdsTest : public ::testing::Test
{
};

TEST_F(DurabilityThresholdsTest, testObserveCounts)
{
    DurabilityThresholds th;
    ASSERT_EQ(KVC_SUCCESS,
              durability_thresholds(DurabilityRequirement::observe(PERSIST_TO_TWO, REPLICATE_TO_ONE), 2, th));
    EXPECT_EQ(2U, th.persist_to);
    EXPECT_EQ(1U, th.replicate_to);
    EXPECT_FALSE(th.persist_master);

    // PersistTo counts the active node, ReplicateTo does not
    EXPECT_EQ(KVC_SUCCESS, durability_thresholds(DurabilityRequirement::persist_to(PERSIST_TO_TWO), 1, th));
    EXPECT_EQ(KVC_ERR_DURABILITY_IMPOSSIBLE,
              durability_thresholds(DurabilityRequirement::persist_to(PERSIST_TO_THREE), 1, th));
    EXPECT_EQ(KVC_ERR_DURABILITY_IMPOSSIBLE,
              durability_thresholds(DurabilityRequirement::replicate_to(REPLICATE_TO_TWO), 1, th));
    EXPECT_EQ(KVC_ERR_DURABILITY_IMPOSSIBLE,
              durability_thresholds(DurabilityRequirement::replicate_to(REPLICATE_TO_ONE), 0, th));
}

TEST_F(DurabilityThresholdsTest, testLevels)
{
    DurabilityThresholds th;

    // Three copies, majority of two
    ASSERT_EQ(KVC_SUCCESS, durability_thresholds(DurabilityRequirement::level(DURABILITY_LEVEL_MAJORITY), 2, th));
    EXPECT_EQ(0U, th.persist_to);
    EXPECT_EQ(1U, th.replicate_to);
    EXPECT_FALSE(th.persist_master);

    ASSERT_EQ(KVC_SUCCESS,
              durability_thresholds(DurabilityRequirement::level(DURABILITY_LEVEL_MAJORITY_AND_PERSIST_TO_ACTIVE), 2,
                                    th));
    EXPECT_EQ(1U, th.replicate_to);
    EXPECT_TRUE(th.persist_master);

    ASSERT_EQ(KVC_SUCCESS,
              durability_thresholds(DurabilityRequirement::level(DURABILITY_LEVEL_PERSIST_TO_MAJORITY), 2, th));
    EXPECT_EQ(2U, th.persist_to);
    EXPECT_EQ(0U, th.replicate_to);

    // A single copy is its own majority
    ASSERT_EQ(KVC_SUCCESS, durability_thresholds(DurabilityRequirement::level(DURABILITY_LEVEL_MAJORITY), 0, th));
    EXPECT_EQ(0U, th.replicate_to);

    // Two copies need both
    ASSERT_EQ(KVC_SUCCESS, durability_thresholds(DurabilityRequirement::level(DURABILITY_LEVEL_MAJORITY), 1, th));
    EXPECT_EQ(1U, th.replicate_to);
}

TEST_F(DurabilityThresholdsTest, testPollingDecision)
{
    Settings settings;
    EXPECT_FALSE(durability_needs_poll(&settings, DurabilityRequirement::none()));
    EXPECT_TRUE(durability_needs_poll(&settings, DurabilityRequirement::persist_to(PERSIST_TO_ONE)));
    EXPECT_TRUE(durability_needs_poll(&settings, DurabilityRequirement::level(DURABILITY_LEVEL_MAJORITY)));

    settings.enable_sync_durability = true;
    EXPECT_FALSE(durability_needs_poll(&settings, DurabilityRequirement::level(DURABILITY_LEVEL_MAJORITY)));
    EXPECT_TRUE(durability_needs_poll(&settings, DurabilityRequirement::persist_to(PERSIST_TO_ONE)));
}
