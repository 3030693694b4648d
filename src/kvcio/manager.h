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

#ifndef KVC_MANAGER_H
#define KVC_MANAGER_H

#include "endpoint.h"
#include <stdio.h>
#include <list>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * @file
 * @brief Endpoint Pooling Routines
 *
 * @details
 * Endpoints are pooled per (host:port, service) pair. A caller obtains an
 * endpoint with Pool::get() and must hand it back with Pool::put() once it
 * has written its request; in-flight responses are matched by the endpoint
 * itself, so a lease only covers the send.
 *
 * When no endpoint is available and the pool is below its maximum size a
 * new one is connected lazily. When the pool is at its maximum the request
 * waits until an endpoint is put back, or until its timeout expires.
 */

namespace kvc {
class Settings;

namespace io {

class Pool;
class PoolHost;
class PoolRequest;

/**
 * Invoked when an endpoint has been assigned to a request.
 * @param endpoint the leased endpoint, or NULL on failure
 * @param err KVC_SUCCESS, KVC_ERR_TIMEOUT or KVC_ERR_CONNECT
 * @param arg the argument passed to Pool::get()
 */
typedef void (*PoolCallback)(Endpoint *endpoint, kvc_STATUS err, void *arg);

/** Creates the protocol specific endpoint for a service */
typedef Endpoint *(*EndpointFactory)(PoolHost *parent, const std::string &host, uint16_t port, ServiceType type);

/**
 * Decides which member of a pool is handed out next. Only members for which
 * Endpoint::is_available() is true may be returned.
 */
class SelectionStrategy {
  public:
    virtual ~SelectionStrategy() {}
    virtual Endpoint *select(const std::vector<Endpoint *> &members) = 0;
};

/** Stateful cursor advanced modulo the pool size */
class RoundRobinSelectionStrategy : public SelectionStrategy {
  public:
    RoundRobinSelectionStrategy() : skip_(0) {}
    Endpoint *select(const std::vector<Endpoint *> &members);

  private:
    size_t skip_;
};

typedef SelectionStrategy *(*SelectionStrategyFactory)();

struct PoolStats {
    PoolStats() : total(0), idle(0), leased(0), connecting(0), draining(0), waiting(0) {}
    unsigned total;
    unsigned idle;
    unsigned leased;
    unsigned connecting;
    unsigned draining;
    unsigned waiting;
};

class PoolHost {
  public:
    PoolHost(Pool *parent, const std::string &host, uint16_t port, ServiceType type);
    ~PoolHost();

    PoolRequest *get(uint32_t timeout, PoolCallback callback, void *arg);
    void put(Endpoint *endpoint);
    void cancel(PoolRequest *request);
    void drain();

    /** Snapshot of the current members. Never modified once published */
    std::shared_ptr<const std::vector<Endpoint *> > members() const {
        return std::atomic_load(&members_);
    }

    PoolStats stats() const;
    void dump(FILE *fp) const;

    const Settings *settings() const;
    Table *io() const;
    const std::string &key() const {
        return key_;
    }

    // Called by endpoints
    void endpoint_ready(Endpoint *endpoint);
    void endpoint_closed(Endpoint *endpoint, Endpoint::State prev, kvc_STATUS err);
    void endpoint_idle(Endpoint *endpoint);

  private:
    friend class PoolRequest;

    void connection_available();
    void maybe_start_connections();
    void start_new_connection();
    void request_timed_out(PoolRequest *request);
    void invoke(PoolRequest *request, Endpoint *endpoint, kvc_STATUS err);
    void add_member(Endpoint *endpoint);
    void remove_member(Endpoint *endpoint);

    Pool *parent_;
    std::string host_;
    uint16_t port_;
    ServiceType service_;
    std::string key_;
    std::shared_ptr<const std::vector<Endpoint *> > members_;
    std::list<PoolRequest *> requests_;
    std::vector<Endpoint *> graveyard_;
    SelectionStrategy *strategy_;
    Timer<PoolHost, &PoolHost::connection_available> async_;

    PoolHost(const PoolHost &);
    PoolHost &operator=(const PoolHost &);
};

class Pool {
  public:
    Pool(Settings *settings, Table *io);
    ~Pool();

    /**
     * Request an endpoint for `hostport` ("host:port") and the service. The
     * callback is always invoked asynchronously, unless the request is
     * cancelled first.
     *
     * @return a handle which may be passed to cancel() until the callback
     *  has been invoked, or NULL if `hostport` is malformed
     */
    PoolRequest *get(const std::string &hostport, ServiceType type, uint32_t timeout, PoolCallback callback,
                     void *arg);

    /** Return an endpoint obtained via get() */
    void put(Endpoint *endpoint);

    /** Cancel a pending request. Its callback is not invoked */
    void cancel(PoolRequest *request);

    /** Drain all endpoints of a node, e.g. because it left the cluster */
    void drain(const std::string &hostport, ServiceType type);

    PoolStats stats(const std::string &hostport, ServiceType type) const;
    void dump(FILE *fp) const;

    void set_endpoint_factory(ServiceType type, EndpointFactory factory);
    void set_selection_strategy(SelectionStrategyFactory factory);

    Settings *settings;
    Table *io;

  private:
    friend class PoolHost;

    static std::string make_key(const std::string &hostport, ServiceType type);

    std::map<std::string, PoolHost *> hosts_;
    EndpointFactory factories_[SERVICE__MAX];
    SelectionStrategyFactory strategy_factory_;

    Pool(const Pool &);
    Pool &operator=(const Pool &);
};

/** Split "host:port". Returns false if there is no valid port */
bool split_hostport(const std::string &hostport, std::string &host, uint16_t &port);

} // namespace io
} // namespace kvc

#endif
