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
#include "iotests.h"
#include "kvcio/timer-ng.h"
#include <algorithm>
#include <map>
#include <set>

using namespace kvc;

class BatchExistsUnitTest : public MockUnitTest
{
protected:
    RespBatchExists run(Instance *instance, const CmdBatchExists &cmd) {
        RespBatchExists result;
        result.ctx.rc = KVC_ERR_GENERIC;
        EXPECT_EQ(KVC_SUCCESS, instance->batch_exists(cmd, [&result](const RespBatchExists &resp) { result = resp; }));
        instance->wait();
        return result;
    }

    RespBatchGet fetch(Instance *instance, const CmdBatchExists &cmd) {
        RespBatchGet result;
        result.ctx.rc = KVC_ERR_GENERIC;
        EXPECT_EQ(KVC_SUCCESS,
                  instance->batch_get_if_exists(cmd, [&result](const RespBatchGet &resp) { result = resp; }));
        instance->wait();
        return result;
    }
};

/**
 * @test
 * Probe a hundred keys, half of which were stored and one of which was
 * removed again
 *
 * @post
 * Exactly the live keys are found, and each node was asked once
 */
TEST_F(BatchExistsUnitTest, testManyKeys)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    CmdBatchExists cmd;
    std::set<std::string> expected;
    for (int ii = 0; ii < 100; ii++) {
        std::string key = "batchKey_" + std::to_string(ii);
        cmd.keys.push_back(key);
        if (ii % 2 == 0) {
            storeKey(instance, key, "{}");
            expected.insert(key);
        }
    }
    removeKey(instance, "batchKey_0");
    expected.erase("batchKey_0");

    // Duplicates are reported once
    cmd.keys.push_back("batchKey_2");

    RespBatchExists resp = run(instance, cmd);
    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_EQ(std::vector<std::string>(expected.begin(), expected.end()), resp.found);
    ASSERT_TRUE(std::is_sorted(resp.found.begin(), resp.found.end()));
    for (unsigned ii = 0; ii < 4; ii++) {
        ASSERT_EQ(1U, cluster->opcodeCount(ii, mc::CMD_OBSERVE));
    }
}

TEST_F(BatchExistsUnitTest, testNothingFound)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    CmdBatchExists cmd;
    cmd.keys.push_back("batchMissing_1");
    cmd.keys.push_back("batchMissing_2");
    RespBatchExists resp = run(instance, cmd);
    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_TRUE(resp.found.empty());
}

struct TopologyUpdate {
    Instance *instance;
    std::shared_ptr<const Topology> topology;
};

static void apply_topology(void *arg)
{
    TopologyUpdate *update = reinterpret_cast<TopologyUpdate *>(arg);
    update->instance->update_topology(update->topology);
}

/**
 * @test
 * Schedule a batch before the instance has a topology, and hand it one a
 * little later
 *
 * @post
 * The batch is deferred until the topology arrives and then succeeds
 */
TEST_F(BatchExistsUnitTest, testDeferredUntilTopology)
{
    HandleWrap hw;
    Instance *instance;
    createBareConnection(hw, instance);
    ASSERT_EQ(KVC_SUCCESS, instance->cntl("batch_defer_delay", "0.01"));

    cluster->storeDocument("deferredKey", "{}");

    TopologyUpdate update;
    update.instance = instance;
    update.topology = cluster->topology();
    io::SimpleTimer timer(instance->iotable(), &update, apply_topology);
    timer.rearm(50000);

    CmdBatchExists cmd;
    cmd.keys.push_back("deferredKey");
    cmd.keys.push_back("deferredMissing");
    cmd.timeout = 2000000;
    RespBatchExists resp = run(instance, cmd);

    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_EQ(1U, resp.found.size());
    ASSERT_EQ("deferredKey", resp.found[0]);
    ASSERT_EQ(RETRY_REASON_TOPOLOGY_NOT_READY, resp.ctx.last_retry_reason);
    ASSERT_LT(0U, resp.ctx.retry_attempts);
}

TEST_F(BatchExistsUnitTest, testTimeoutWithoutTopology)
{
    HandleWrap hw;
    Instance *instance;
    createBareConnection(hw, instance);
    ASSERT_EQ(KVC_SUCCESS, instance->cntl("batch_defer_delay", "0.01"));

    CmdBatchExists cmd;
    cmd.keys.push_back("neverRouted");
    cmd.timeout = 100000;
    RespBatchExists resp = run(instance, cmd);
    ASSERT_EQ(KVC_ERR_TIMEOUT, resp.rc());
    ASSERT_EQ(RETRY_REASON_TOPOLOGY_NOT_READY, resp.ctx.last_retry_reason);
    ASSERT_TRUE(resp.found.empty());
}

/**
 * @test
 * One node rejects the probe
 *
 * @post
 * The whole batch fails with that node's error
 */
TEST_F(BatchExistsUnitTest, testNodeFailure)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);
    cluster->injectStatus(0, mc::CMD_OBSERVE, mc::STATUS_EINVAL);

    CmdBatchExists cmd;
    for (int ii = 0; ii < 50; ii++) {
        cmd.keys.push_back("failingBatch_" + std::to_string(ii));
    }
    RespBatchExists resp = run(instance, cmd);
    ASSERT_EQ(KVC_ERR_INVALID_ARGUMENT, resp.rc());
    ASSERT_TRUE(resp.found.empty());
}

TEST_F(BatchExistsUnitTest, testInputErrors)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    bool invoked = false;
    BatchExistsCallback cb = [&invoked](const RespBatchExists &) { invoked = true; };

    CmdBatchExists cmd;
    ASSERT_EQ(KVC_ERR_INVALID_ARGUMENT, instance->batch_exists(cmd, cb));

    cmd.keys.push_back("valid");
    cmd.keys.push_back("");
    ASSERT_EQ(KVC_ERR_EMPTY_KEY, instance->batch_exists(cmd, cb));

    instance->wait();
    ASSERT_FALSE(invoked);
    ASSERT_EQ(0U, instance->pending());
}

TEST_F(BatchExistsUnitTest, testCancel)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    CmdBatchExists cmd;
    cmd.keys.push_back("cancelledBatch");
    int ncalls = 0;
    kvc_STATUS rc = KVC_SUCCESS;
    OperationHandle handle;
    ASSERT_EQ(KVC_SUCCESS, instance->batch_exists(cmd,
                                                  [&](const RespBatchExists &resp) {
                                                      rc = resp.rc();
                                                      ncalls++;
                                                  },
                                                  &handle));
    ASSERT_EQ(KVC_SUCCESS, instance->cancel(handle));
    ASSERT_EQ(1, ncalls);
    ASSERT_EQ(KVC_ERR_REQUEST_CANCELED, rc);
    instance->wait();
    ASSERT_EQ(1, ncalls);
    ASSERT_EQ(0U, cluster->opcodeCount(mc::CMD_OBSERVE));
}

/**
 * @test
 * Fetch a few documents out of many probed keys
 *
 * @post
 * Only the live documents are read, each with its value, flags and cas
 */
TEST_F(BatchExistsUnitTest, testGetIfExists)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    CmdBatchExists cmd;
    for (int ii = 0; ii < 40; ii++) {
        cmd.keys.push_back("sparseKey_" + std::to_string(ii));
    }
    std::map<std::string, std::string> expected;
    for (int ii = 0; ii < 40; ii += 8) {
        std::string key = "sparseKey_" + std::to_string(ii);
        std::string value = "{\"n\":" + std::to_string(ii) + "}";
        storeKey(instance, key, value);
        expected[key] = value;
    }
    removeKey(instance, "sparseKey_0");
    expected.erase("sparseKey_0");

    CmdStore flagged("sparseKey_3", "flagged");
    flagged.flags = 0xcafe;
    kvc_STATUS rc = KVC_ERR_GENERIC;
    ASSERT_EQ(KVC_SUCCESS, instance->upsert(flagged, [&rc](const RespStore &resp) { rc = resp.rc(); }));
    instance->wait();
    ASSERT_EQ(KVC_SUCCESS, rc);
    expected["sparseKey_3"] = "flagged";

    RespBatchGet resp = fetch(instance, cmd);
    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_EQ(expected.size(), resp.documents.size());
    std::map<std::string, std::string>::const_iterator it = expected.begin();
    for (size_t ii = 0; ii < resp.documents.size(); ++ii, ++it) {
        const BatchDocument &doc = resp.documents[ii];
        ASSERT_EQ(it->first, doc.key);
        ASSERT_EQ(it->second, doc.value);
        ASSERT_EQ(getCas(instance, doc.key), doc.cas);
        ASSERT_EQ(doc.key == "sparseKey_3" ? 0xcafeU : 0U, doc.flags);
    }
    ASSERT_EQ(expected.size(), cluster->opcodeCount(mc::CMD_GET));
    for (unsigned ii = 0; ii < 4; ii++) {
        ASSERT_EQ(1U, cluster->opcodeCount(ii, mc::CMD_OBSERVE));
    }
}

TEST_F(BatchExistsUnitTest, testGetIfExistsNothingFound)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    CmdBatchExists cmd;
    cmd.keys.push_back("absent_1");
    cmd.keys.push_back("absent_2");
    RespBatchGet resp = fetch(instance, cmd);
    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_TRUE(resp.documents.empty());
    ASSERT_EQ(0U, cluster->opcodeCount(mc::CMD_GET));
}

/**
 * @test
 * The only found document is removed before it is read
 *
 * @post
 * The batch succeeds without it
 */
TEST_F(BatchExistsUnitTest, testGetIfExistsRemovedBeforeFetch)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    std::string key("removedBeforeFetch");
    storeKey(instance, key, "{}");
    cluster->injectStatus(cluster->primaryFor(key), mc::CMD_GET, mc::STATUS_KEY_ENOENT);

    CmdBatchExists cmd;
    cmd.keys.push_back(key);
    cmd.keys.push_back("neverStored");
    RespBatchGet resp = fetch(instance, cmd);
    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_TRUE(resp.documents.empty());
    ASSERT_EQ(1U, cluster->opcodeCount(mc::CMD_GET));
}

TEST_F(BatchExistsUnitTest, testGetIfExistsFetchFailure)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    std::string key("failedFetch");
    storeKey(instance, key, "{}");
    cluster->injectStatus(cluster->primaryFor(key), mc::CMD_GET, mc::STATUS_EINVAL);

    CmdBatchExists cmd;
    cmd.keys.push_back(key);
    RespBatchGet resp = fetch(instance, cmd);
    ASSERT_EQ(KVC_ERR_INVALID_ARGUMENT, resp.rc());
    ASSERT_EQ(key, resp.ctx.key);
    ASSERT_TRUE(resp.documents.empty());
}

TEST_F(BatchExistsUnitTest, testGetIfExistsInputErrors)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    bool invoked = false;
    BatchGetCallback cb = [&invoked](const RespBatchGet &) { invoked = true; };

    CmdBatchExists cmd;
    ASSERT_EQ(KVC_ERR_INVALID_ARGUMENT, instance->batch_get_if_exists(cmd, cb));
    cmd.keys.push_back("");
    ASSERT_EQ(KVC_ERR_EMPTY_KEY, instance->batch_get_if_exists(cmd, cb));
    instance->wait();
    ASSERT_FALSE(invoked);
}
