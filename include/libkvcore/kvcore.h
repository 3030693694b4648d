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

#ifndef LIBKVCORE_KVCORE_H
#define LIBKVCORE_KVCORE_H 1

/**
 * @file
 * @brief Key/Value data path of the client
 *
 * @mainpage
 * An Instance routes key/value operations to the nodes of a cluster, using
 * the most recent Topology it was given, and multiplexes them over pooled
 * connections. Operations are scheduled with a completion callback and run
 * on a libevent event loop; Instance::wait() drives the loop until every
 * scheduled operation has completed.
 *
 * @code{.cpp}
 * kvc::Instance *instance;
 * kvc::CreateOptions options;
 * kvc::Instance::create(&instance, options);
 * instance->update_topology(topology);
 *
 * kvc::CmdCounter cmd("counter", 5);
 * instance->decrement(cmd, on_counter);
 * instance->wait();
 * delete instance;
 * @endcode
 */

#include <libkvcore/error.h>
#include <libkvcore/logger.h>
#include <libkvcore/durability.h>
#include <libkvcore/subdoc.h>
#include <libkvcore/retry.h>
#include <libkvcore/topology.h>
#include <libkvcore/transport.h>

#include <stdint.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct event_base;

namespace kvc {

class Settings;
class Clock;
class Router;
class Request;
class Operation;
namespace io {
class Table;
class Pool;
}

/** Identifies a scheduled operation for Instance::cancel() */
typedef uint64_t OperationHandle;

/** Default collection identifier */
static const uint32_t DEFAULT_COLLECTION = 0;

struct KeyValueErrorContext {
    KeyValueErrorContext()
        : rc(KVC_SUCCESS), status_code(0), opaque(0), cas(0), collection_id(0), retry_attempts(0),
          last_retry_reason(RETRY_REASON_UNKNOWN)
    {
    }

    kvc_STATUS rc;

    /** Raw status of the last response received, if any */
    uint16_t status_code;
    uint32_t opaque;
    uint64_t cas;
    std::string key;
    uint32_t collection_id;

    /** `host:port` of the last endpoint the operation was dispatched to */
    std::string endpoint;
    unsigned retry_attempts;
    RetryReason last_retry_reason;
};

struct MutationToken {
    MutationToken() : partition_id(0), partition_uuid(0), sequence_number(0) {}
    uint16_t partition_id;
    uint64_t partition_uuid;
    uint64_t sequence_number;
};

struct RespBase {
    RespBase() : cas(0) {}
    kvc_STATUS rc() const {
        return ctx.rc;
    }

    KeyValueErrorContext ctx;
    uint64_t cas;
};

struct RespCounter : RespBase {
    RespCounter() : value(0) {}
    uint64_t value;
    MutationToken token;
    DurabilityInfo durability;
};

struct RespExists : RespBase {
    RespExists() : exists(false), deleted(false), flags(0), expiry(0), seqno(0) {}
    bool exists;

    /** The document is a tombstone */
    bool deleted;
    uint32_t flags;
    uint32_t expiry;
    uint64_t seqno;
};

struct RespStore : RespBase {
    MutationToken token;
    DurabilityInfo durability;
};

typedef RespStore RespRemove;

struct RespSubdoc : RespBase {
    RespSubdoc() : deleted(false) {}

    /** One entry per command, at the index the command was supplied at */
    std::vector<SubdocResult> results;
    MutationToken token;
    DurabilityInfo durability;
    bool deleted;
};

struct RespBatchExists {
    kvc_STATUS rc() const {
        return ctx.rc;
    }

    KeyValueErrorContext ctx;

    /** Keys which exist, sorted and without duplicates */
    std::vector<std::string> found;
};

/** A document fetched by Instance::batch_get_if_exists() */
struct BatchDocument {
    BatchDocument() : cas(0), flags(0), datatype(0) {}
    std::string key;
    uint64_t cas;
    uint32_t flags;
    uint8_t datatype;
    std::string value;
};

struct RespBatchGet {
    kvc_STATUS rc() const {
        return ctx.rc;
    }

    KeyValueErrorContext ctx;

    /** Documents which exist, sorted by key */
    std::vector<BatchDocument> documents;
};

struct RespDurabilityEntry {
    RespDurabilityEntry() : rc(KVC_SUCCESS), cas(0) {}
    std::string key;
    kvc_STATUS rc;
    uint64_t cas;
    DurabilityInfo info;
};

struct RespDurability {
    kvc_STATUS rc() const {
        return ctx.rc;
    }

    /** rc is the first failure among the entries, if any */
    KeyValueErrorContext ctx;
    std::vector<RespDurabilityEntry> entries;
};

struct CmdBase {
    CmdBase() : collection_id(DEFAULT_COLLECTION), timeout(0) {}
    explicit CmdBase(const std::string &key_) : key(key_), collection_id(DEFAULT_COLLECTION), timeout(0) {}

    std::string key;
    uint32_t collection_id;

    /** Operation timeout in microseconds. 0 uses the instance default */
    uint32_t timeout;

    /** NULL uses the instance's strategy */
    std::shared_ptr<RetryStrategy> retry_strategy;
};

struct CmdCounter : CmdBase {
    CmdCounter() : delta(0), initial(0), has_initial(false), expiry(0) {}
    CmdCounter(const std::string &key_, uint64_t delta_)
        : CmdBase(key_), delta(delta_), initial(0), has_initial(false), expiry(0)
    {
    }

    /** Create the counter with this value if it does not exist */
    void set_initial(uint64_t value) {
        initial = value;
        has_initial = true;
    }

    uint64_t delta;
    uint64_t initial;
    bool has_initial;

    /** Only valid together with an initial value */
    uint32_t expiry;
    DurabilityRequirement durability;
};

typedef CmdBase CmdExists;

struct CmdStore : CmdBase {
    CmdStore() : flags(0), expiry(0), cas(0), datatype(0) {}
    CmdStore(const std::string &key_, const std::string &value_)
        : CmdBase(key_), value(value_), flags(0), expiry(0), cas(0), datatype(0)
    {
    }

    std::string value;
    uint32_t flags;
    uint32_t expiry;
    uint64_t cas;
    uint8_t datatype;
    DurabilityRequirement durability;
};

struct CmdRemove : CmdBase {
    CmdRemove() : cas(0) {}
    explicit CmdRemove(const std::string &key_) : CmdBase(key_), cas(0) {}

    uint64_t cas;
    DurabilityRequirement durability;
};

struct CmdSubdoc : CmdBase {
    CmdSubdoc() : cas(0), expiry(0), semantics(SUBDOC_STORE_REPLACE), access_deleted(false) {}
    explicit CmdSubdoc(const std::string &key_)
        : CmdBase(key_), cas(0), expiry(0), semantics(SUBDOC_STORE_REPLACE), access_deleted(false)
    {
    }

    std::vector<SubdocSpec> specs;

    /** Mutations only */
    uint64_t cas;
    uint32_t expiry;
    SubdocStoreSemantics semantics;
    DurabilityRequirement durability;

    /** Operate on a deleted document's extended attributes */
    bool access_deleted;
};

struct CmdBatchExists {
    CmdBatchExists() : collection_id(DEFAULT_COLLECTION), timeout(0) {}

    std::vector<std::string> keys;
    uint32_t collection_id;
    uint32_t timeout;
};

struct DurabilityItem {
    DurabilityItem() : cas(0), is_delete(false) {}
    DurabilityItem(const std::string &key_, uint64_t cas_, bool is_delete_ = false)
        : key(key_), cas(cas_), is_delete(is_delete_)
    {
    }

    std::string key;
    uint64_t cas;

    /** The mutation was a removal */
    bool is_delete;
};

struct CmdDurabilityPoll {
    CmdDurabilityPoll() : collection_id(DEFAULT_COLLECTION), timeout(0) {}

    std::vector<DurabilityItem> items;
    uint32_t collection_id;

    /** Must be an observe requirement */
    DurabilityRequirement durability;
    uint32_t timeout;
};

typedef std::function<void(const RespCounter &)> CounterCallback;
typedef std::function<void(const RespExists &)> ExistsCallback;
typedef std::function<void(const RespStore &)> StoreCallback;
typedef std::function<void(const RespSubdoc &)> SubdocCallback;
typedef std::function<void(const RespBatchExists &)> BatchExistsCallback;
typedef std::function<void(const RespBatchGet &)> BatchGetCallback;
typedef std::function<void(const RespDurability &)> DurabilityCallback;

struct CreateOptions {
    CreateOptions() : evbase(NULL), transport_factory(NULL), logger(NULL) {}

    /** Event loop to run on. If NULL the instance creates its own */
    event_base *evbase;

    /** If NULL, plain TCP connections are used */
    io::TransportFactory *transport_factory;
    kvc_LOGGER *logger;

    /** Bucket to select on every new KV connection. May be empty */
    std::string bucket;
};

class Instance {
  public:
    static kvc_STATUS create(Instance **instance, const CreateOptions &options);

    /** Outstanding operations complete with KVC_ERR_REQUEST_CANCELED */
    ~Instance();

    /**
     * Set a tunable by name, e.g. `cntl("operation_timeout", "1.5")`.
     * @return KVC_ERR_INVALID_ARGUMENT for unknown names or bad values
     */
    kvc_STATUS cntl(const std::string &name, const std::string &value);

    /**
     * Accept a new topology. Snapshots not newer than the current one are
     * ignored. KV connections to nodes which are no longer part of the
     * topology are drained.
     * @return true if the snapshot was accepted
     */
    bool update_topology(const std::shared_ptr<const Topology> &topology);

    kvc_STATUS increment(const CmdCounter &cmd, CounterCallback callback, OperationHandle *handle = NULL);
    kvc_STATUS decrement(const CmdCounter &cmd, CounterCallback callback, OperationHandle *handle = NULL);
    kvc_STATUS exists(const CmdExists &cmd, ExistsCallback callback, OperationHandle *handle = NULL);
    kvc_STATUS upsert(const CmdStore &cmd, StoreCallback callback, OperationHandle *handle = NULL);
    kvc_STATUS insert(const CmdStore &cmd, StoreCallback callback, OperationHandle *handle = NULL);
    kvc_STATUS replace(const CmdStore &cmd, StoreCallback callback, OperationHandle *handle = NULL);
    kvc_STATUS remove(const CmdRemove &cmd, StoreCallback callback, OperationHandle *handle = NULL);
    kvc_STATUS mutate_in(const CmdSubdoc &cmd, SubdocCallback callback, OperationHandle *handle = NULL);
    kvc_STATUS lookup_in(const CmdSubdoc &cmd, SubdocCallback callback, OperationHandle *handle = NULL);
    kvc_STATUS batch_exists(const CmdBatchExists &cmd, BatchExistsCallback callback, OperationHandle *handle = NULL);

    /**
     * Probe the keys like batch_exists() and fetch only those found. A key
     * removed between the probe and its fetch is left out of the result.
     */
    kvc_STATUS batch_get_if_exists(const CmdBatchExists &cmd, BatchGetCallback callback,
                                   OperationHandle *handle = NULL);
    kvc_STATUS durability_poll(const CmdDurabilityPoll &cmd, DurabilityCallback callback,
                               OperationHandle *handle = NULL);

    /**
     * Cancel a scheduled operation. Its callback is invoked with
     * KVC_ERR_REQUEST_CANCELED before this returns.
     * @return KVC_ERR_INVALID_ARGUMENT if the operation already completed
     */
    kvc_STATUS cancel(OperationHandle handle);

    /** Run the event loop until no scheduled operation remains */
    void wait();

    /** Number of scheduled operations which have not completed */
    size_t pending() const {
        return operations_.size();
    }

    Settings *settings() const {
        return settings_;
    }
    Router *router() const {
        return router_;
    }
    io::Pool *pool() const {
        return pool_;
    }
    io::Table *iotable() const {
        return iotable_;
    }
    const std::shared_ptr<RetryStrategy> &default_retry_strategy() const {
        return retry_strategy_;
    }
    const Clock *clock() const {
        return clock_;
    }

    /** Internal: track a user visible operation */
    OperationHandle add_operation(Operation *op);

    /** Internal: called exactly once when a tracked operation completes */
    void remove_operation(OperationHandle handle);

  private:
    Instance();
    void maybe_breakout();

    Settings *settings_;
    io::Table *iotable_;
    Router *router_;
    io::Pool *pool_;
    std::shared_ptr<RetryStrategy> retry_strategy_;
    const Clock *clock_;
    std::map<OperationHandle, Operation *> operations_;
    OperationHandle next_handle_;
    bool waiting_;

    Instance(const Instance &);
    Instance &operator=(const Instance &);
};

} // namespace kvc

#endif
