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
#include "vbucket/router.h"
#include "config_static.h"

using namespace kvc;

class DurabilityUnitTest : public MockUnitTest
{
protected:
    void createConnection(HandleWrap &hw, Instance *&instance) {
        MockUnitTest::createConnection(hw, instance);
        ASSERT_EQ(KVC_SUCCESS, instance->cntl("durability_interval", "0.01"));
    }

    RespStore upsert(Instance *instance, const CmdStore &cmd) {
        RespStore result;
        result.ctx.rc = KVC_ERR_GENERIC;
        EXPECT_EQ(KVC_SUCCESS, instance->upsert(cmd, [&result](const RespStore &resp) { result = resp; }));
        instance->wait();
        return result;
    }

    void setPersists(bool persists) {
        for (unsigned ii = 0; ii < 4; ii++) {
            cluster->behavior(ii).persists = persists;
        }
    }
};

/**
 * @test
 * PersistTo=2 with one replica
 *
 * @post
 * The mutation succeeds after a single round, with both the active node and
 * the replica reporting it as persisted
 */
TEST_F(DurabilityUnitTest, testPersistToTwo)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    CmdStore cmd("persistToTwo", "{}");
    cmd.durability = DurabilityRequirement::persist_to(PERSIST_TO_TWO);
    RespStore resp = upsert(instance, cmd);

    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_TRUE(resp.durability.polled);
    ASSERT_TRUE(resp.durability.persisted_master);
    ASSERT_TRUE(resp.durability.exists_master);
    ASSERT_EQ(2U, resp.durability.npersisted);
    ASSERT_EQ(1U, resp.durability.nreplicated);
    ASSERT_EQ(2U, cluster->opcodeCount(mc::CMD_OBSERVE));
}

TEST_F(DurabilityUnitTest, testReplicateToWithoutPersistence)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);
    setPersists(false);

    CmdStore cmd("replicateOnly", "{}");
    cmd.durability = DurabilityRequirement::replicate_to(REPLICATE_TO_ONE);
    RespStore resp = upsert(instance, cmd);
    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_EQ(1U, resp.durability.nreplicated);
    ASSERT_EQ(0U, resp.durability.npersisted);
    ASSERT_FALSE(resp.durability.persisted_master);
}

TEST_F(DurabilityUnitTest, testTimeout)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);
    setPersists(false);

    CmdStore cmd("durabilityTimeout", "{}");
    cmd.timeout = 200000;
    cmd.durability = DurabilityRequirement::persist_to(PERSIST_TO_ONE);
    RespStore resp = upsert(instance, cmd);

    // The write itself succeeded
    ASSERT_EQ(KVC_ERR_DURABILITY_TIMEOUT, resp.rc());
    ASSERT_TRUE(KVC_ERROR_IS_DURABILITY(resp.rc()));
    ASSERT_NE(0U, resp.cas);
    ASSERT_TRUE(resp.durability.polled);
    ASSERT_LT(2U, cluster->opcodeCount(mc::CMD_OBSERVE));
    ASSERT_TRUE(cluster->findDocument("durabilityTimeout") != NULL);
}

TEST_F(DurabilityUnitTest, testImpossible)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    bool invoked = false;
    StoreCallback cb = [&invoked](const RespStore &) { invoked = true; };

    CmdStore cmd("durabilityImpossible", "{}");
    cmd.durability = DurabilityRequirement::persist_to(PERSIST_TO_THREE);
    ASSERT_EQ(KVC_ERR_DURABILITY_IMPOSSIBLE, instance->upsert(cmd, cb));

    cmd.durability = DurabilityRequirement::replicate_to(REPLICATE_TO_TWO);
    ASSERT_EQ(KVC_ERR_DURABILITY_IMPOSSIBLE, instance->upsert(cmd, cb));

    CmdDurabilityPoll poll;
    poll.items.push_back(DurabilityItem("durabilityImpossible", 1));
    poll.durability = DurabilityRequirement::observe(PERSIST_TO_THREE, REPLICATE_TO_NONE);
    ASSERT_EQ(KVC_ERR_DURABILITY_IMPOSSIBLE, instance->durability_poll(poll, [&invoked](const RespDurability &) {
        invoked = true;
    }));

    instance->wait();
    ASSERT_FALSE(invoked);
    ASSERT_EQ(0U, cluster->opcodeCount(mc::CMD_SET));
}

/**
 * @test
 * The document changes between the mutation and the poll
 *
 * @post
 * The poll reports a conflict instead of waiting for the deadline
 */
TEST_F(DurabilityUnitTest, testConflict)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    std::string key("durabilityConflict");
    storeKey(instance, key, "{}");
    uint64_t cas = getCas(instance, key);
    cluster->bumpCas(key);

    CmdDurabilityPoll cmd;
    cmd.items.push_back(DurabilityItem(key, cas));
    cmd.durability = DurabilityRequirement::persist_to(PERSIST_TO_ONE);
    cmd.timeout = 2000000;
    RespDurability resp;
    ASSERT_EQ(KVC_SUCCESS, instance->durability_poll(cmd, [&resp](const RespDurability &r) { resp = r; }));
    instance->wait();

    ASSERT_EQ(KVC_ERR_DURABILITY_CONFLICT, resp.rc());
    ASSERT_EQ(1U, resp.entries.size());
    ASSERT_EQ(key, resp.entries[0].key);
    ASSERT_EQ(KVC_ERR_DURABILITY_CONFLICT, resp.entries[0].rc);
    ASSERT_EQ(cas, resp.entries[0].cas);
}

/**
 * @test
 * The document changes after the mutation and the active node stops
 * answering
 *
 * @post
 * The replica reporting the newer cas ends the poll with a conflict well
 * before the deadline
 */
TEST_F(DurabilityUnitTest, testConflictOnReplica)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    std::string key("replicaConflict");
    storeKey(instance, key, "{}");
    uint64_t cas = getCas(instance, key);
    cluster->bumpCas(key);
    cluster->behavior(cluster->primaryFor(key)).drop_replies = true;

    CmdDurabilityPoll cmd;
    cmd.items.push_back(DurabilityItem(key, cas));
    cmd.durability = DurabilityRequirement::replicate_to(REPLICATE_TO_ONE);
    cmd.timeout = 2000000;
    RespDurability resp;
    hrtime_t begin = gethrtime();
    ASSERT_EQ(KVC_SUCCESS, instance->durability_poll(cmd, [&resp](const RespDurability &r) { resp = r; }));
    instance->wait();

    ASSERT_EQ(KVC_ERR_DURABILITY_CONFLICT, resp.rc());
    ASSERT_EQ(1U, resp.entries.size());
    ASSERT_EQ(KVC_ERR_DURABILITY_CONFLICT, resp.entries[0].rc);
    ASSERT_LT(gethrtime() - begin, KVC_US2NS(1000000));
}

/**
 * @test
 * A replica still holding the previous version of the document
 *
 * @post
 * The older cas is not a conflict; the poll waits for the replica until
 * the deadline
 */
TEST_F(DurabilityUnitTest, testLaggingReplicaIsNotConflict)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    std::string key("laggingReplica");
    storeKey(instance, key, "first");
    storeKey(instance, key, "second");
    uint64_t cas = getCas(instance, key);
    cluster->behavior(cluster->topology()->vbserver(vbucket_for_key(key, 64), 1)).replicates = false;

    CmdDurabilityPoll cmd;
    cmd.items.push_back(DurabilityItem(key, cas));
    cmd.durability = DurabilityRequirement::replicate_to(REPLICATE_TO_ONE);
    cmd.timeout = 100000;
    RespDurability resp;
    ASSERT_EQ(KVC_SUCCESS, instance->durability_poll(cmd, [&resp](const RespDurability &r) { resp = r; }));
    instance->wait();

    ASSERT_EQ(KVC_ERR_DURABILITY_TIMEOUT, resp.rc());
    ASSERT_EQ(0U, resp.entries[0].info.nreplicated);
    ASSERT_TRUE(resp.entries[0].info.exists_master);
}

/**
 * @test
 * PersistTo=2 with two replicas, one of which never answers
 *
 * @post
 * The mutation succeeds as soon as the active node and the other replica
 * report it persisted, without waiting for the silent replica
 */
TEST_F(DurabilityUnitTest, testPersistToTwoOfThreeCopies)
{
    createCluster(4, 2);
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    std::string key("twoOfThreeCopies");
    cluster->behavior(cluster->topology()->vbserver(vbucket_for_key(key, 64), 2)).drop_replies = true;

    CmdStore cmd(key, "{}");
    cmd.timeout = 5000000;
    cmd.durability = DurabilityRequirement::persist_to(PERSIST_TO_TWO);
    hrtime_t begin = gethrtime();
    RespStore resp = upsert(instance, cmd);

    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_EQ(2U, resp.durability.npersisted);
    ASSERT_TRUE(resp.durability.persisted_master);
    ASSERT_LT(gethrtime() - begin, KVC_US2NS(1000000));
    ASSERT_EQ(3U, cluster->opcodeCount(mc::CMD_OBSERVE));
}

/**
 * @test
 * Persistence lags behind for two rounds
 *
 * @post
 * The poll keeps going and succeeds in the third round
 */
TEST_F(DurabilityUnitTest, testMultipleRounds)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    for (unsigned ii = 0; ii < 4; ii++) {
        cluster->behavior(ii).observes_before_persist = 2;
    }

    CmdStore cmd("multipleRounds", "{}");
    cmd.durability = DurabilityRequirement::persist_to(PERSIST_TO_TWO);
    RespStore resp = upsert(instance, cmd);
    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_EQ(2U, resp.durability.npersisted);
    ASSERT_EQ(6U, cluster->opcodeCount(mc::CMD_OBSERVE));
}

TEST_F(DurabilityUnitTest, testRemoveWithDurability)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    std::string key("removeDurability");
    storeKey(instance, key, "{}");

    CmdRemove cmd(key);
    cmd.durability = DurabilityRequirement::observe(PERSIST_TO_ONE, REPLICATE_TO_ONE);
    RespRemove resp;
    ASSERT_EQ(KVC_SUCCESS, instance->remove(cmd, [&resp](const RespRemove &r) { resp = r; }));
    instance->wait();

    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_TRUE(resp.durability.polled);
    ASSERT_FALSE(resp.durability.exists_master);
    ASSERT_TRUE(resp.durability.persisted_master);
    ASSERT_EQ(1U, resp.durability.nreplicated);
}

/**
 * @test
 * Without synchronous durability a level is verified by polling
 */
TEST_F(DurabilityUnitTest, testLevelByPolling)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    CmdStore cmd("levelPolling", "{}");
    cmd.durability = DurabilityRequirement::level(DURABILITY_LEVEL_MAJORITY);
    RespStore resp = upsert(instance, cmd);
    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_TRUE(resp.durability.polled);
    ASSERT_EQ(1U, resp.durability.nreplicated);
    ASSERT_TRUE(cluster->lastFramingExtras.empty());

    // A lagging replica keeps the level from being reached
    std::string key("levelLagging");
    cluster->behavior(cluster->topology()->vbserver(vbucket_for_key(key, 64), 1)).replicates = false;
    CmdStore lagging(key, "{}");
    lagging.timeout = 100000;
    lagging.durability = DurabilityRequirement::level(DURABILITY_LEVEL_MAJORITY);
    resp = upsert(instance, lagging);
    ASSERT_EQ(KVC_ERR_DURABILITY_TIMEOUT, resp.rc());
    ASSERT_EQ(0U, resp.durability.nreplicated);
}

TEST_F(DurabilityUnitTest, testPollManyKeys)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);

    CmdDurabilityPoll cmd;
    for (int ii = 0; ii < 10; ii++) {
        std::string key = "pollMany_" + std::to_string(ii);
        storeKey(instance, key, "{}");
        cmd.items.push_back(DurabilityItem(key, getCas(instance, key)));
    }
    cmd.durability = DurabilityRequirement::observe(PERSIST_TO_TWO, REPLICATE_TO_ONE);

    unsigned before = cluster->opcodeCount(mc::CMD_OBSERVE);
    RespDurability resp;
    ASSERT_EQ(KVC_SUCCESS, instance->durability_poll(cmd, [&resp](const RespDurability &r) { resp = r; }));
    instance->wait();

    ASSERT_EQ(KVC_SUCCESS, resp.rc());
    ASSERT_EQ(10U, resp.entries.size());
    for (size_t ii = 0; ii < resp.entries.size(); ii++) {
        ASSERT_EQ(KVC_SUCCESS, resp.entries[ii].rc);
        ASSERT_EQ(2U, resp.entries[ii].info.npersisted);
    }
    // One request per node, not per key
    ASSERT_GE(4U, cluster->opcodeCount(mc::CMD_OBSERVE) - before);
}

TEST_F(DurabilityUnitTest, testPollCancel)
{
    HandleWrap hw;
    Instance *instance;
    createConnection(hw, instance);
    setPersists(false);

    std::string key("pollCancel");
    storeKey(instance, key, "{}");

    CmdDurabilityPoll cmd;
    cmd.items.push_back(DurabilityItem(key, getCas(instance, key)));
    cmd.durability = DurabilityRequirement::persist_to(PERSIST_TO_ONE);
    int ncalls = 0;
    kvc_STATUS rc = KVC_SUCCESS;
    OperationHandle handle;
    ASSERT_EQ(KVC_SUCCESS, instance->durability_poll(cmd,
                                                     [&](const RespDurability &r) {
                                                         rc = r.rc();
                                                         ncalls++;
                                                     },
                                                     &handle));
    ASSERT_EQ(KVC_SUCCESS, instance->cancel(handle));
    ASSERT_EQ(1, ncalls);
    ASSERT_EQ(KVC_ERR_REQUEST_CANCELED, rc);
    instance->wait();
    ASSERT_EQ(1, ncalls);
}
