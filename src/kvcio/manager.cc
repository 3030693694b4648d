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

#include "manager.h"
#include "settings.h"
#include "logging.h"

#include <stdlib.h>
#include <algorithm>

#define LOGARGS(host, lvl) (host)->settings(), "pool", KVC_LOG_##lvl, __FILE__, __LINE__

/** Format string arguments for %p%s */
#define HE_LOGID(h) (h)->key().c_str(), (void *)(h)
#define HE_LOGFMT "<%s> (HE=%p) "

using namespace kvc;
using namespace kvc::io;

namespace kvc {
namespace io {
class PoolRequest {
  public:
    PoolRequest(PoolHost *host_, PoolCallback callback_, void *arg_)
        : host(host_), callback(callback_), arg(arg_), timer(host_->io(), this)
    {
    }

    void on_timeout() {
        host->request_timed_out(this);
    }

    PoolHost *host;
    PoolCallback callback;
    void *arg;
    Timer<PoolRequest, &PoolRequest::on_timeout> timer;
};
} // namespace io
} // namespace kvc

Endpoint *RoundRobinSelectionStrategy::select(const std::vector<Endpoint *> &members)
{
    size_t n = members.size();
    for (size_t ii = 0; ii < n; ++ii) {
        size_t ix = (skip_ + ii) % n;
        if (members[ix]->is_available()) {
            skip_ = (ix + 1) % n;
            return members[ix];
        }
    }
    return NULL;
}

static SelectionStrategy *create_round_robin()
{
    return new RoundRobinSelectionStrategy();
}

static Endpoint *create_plain_endpoint(PoolHost *parent, const std::string &host, uint16_t port, ServiceType type)
{
    return new Endpoint(parent, host, port, type);
}

bool io::split_hostport(const std::string &hostport, std::string &host, uint16_t &port)
{
    size_t pos = hostport.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 == hostport.size()) {
        return false;
    }
    char *end = NULL;
    unsigned long val = strtoul(hostport.c_str() + pos + 1, &end, 10);
    if (*end != '\0' || val == 0 || val > 65535) {
        return false;
    }
    host = hostport.substr(0, pos);
    port = static_cast<uint16_t>(val);
    return true;
}

PoolHost::PoolHost(Pool *parent, const std::string &host, uint16_t port, ServiceType type)
    : parent_(parent), host_(host), port_(port), service_(type),
      key_(Pool::make_key(host + ":" + std::to_string(port), type)), members_(new std::vector<Endpoint *>()),
      strategy_(parent->strategy_factory_()), async_(parent->io, this)
{
}

PoolHost::~PoolHost()
{
    async_.cancel();
    while (!requests_.empty()) {
        PoolRequest *req = requests_.front();
        requests_.pop_front();
        delete req;
    }
    std::shared_ptr<const std::vector<Endpoint *> > cur = members();
    for (size_t ii = 0; ii < cur->size(); ++ii) {
        delete (*cur)[ii];
    }
    for (size_t ii = 0; ii < graveyard_.size(); ++ii) {
        delete graveyard_[ii];
    }
    delete strategy_;
}

const Settings *PoolHost::settings() const
{
    return parent_->settings;
}

Table *PoolHost::io() const
{
    return parent_->io;
}

void PoolHost::add_member(Endpoint *endpoint)
{
    std::shared_ptr<const std::vector<Endpoint *> > cur = members();
    std::shared_ptr<std::vector<Endpoint *> > next(new std::vector<Endpoint *>(*cur));
    next->push_back(endpoint);
    std::atomic_store(&members_, std::shared_ptr<const std::vector<Endpoint *> >(next));
}

void PoolHost::remove_member(Endpoint *endpoint)
{
    std::shared_ptr<const std::vector<Endpoint *> > cur = members();
    std::shared_ptr<std::vector<Endpoint *> > next(new std::vector<Endpoint *>(*cur));
    next->erase(std::remove(next->begin(), next->end(), endpoint), next->end());
    std::atomic_store(&members_, std::shared_ptr<const std::vector<Endpoint *> >(next));
}

PoolStats PoolHost::stats() const
{
    PoolStats st;
    std::shared_ptr<const std::vector<Endpoint *> > cur = members();
    for (size_t ii = 0; ii < cur->size(); ++ii) {
        const Endpoint *ep = (*cur)[ii];
        st.total++;
        if (ep->state() == Endpoint::CONNECTING) {
            st.connecting++;
        } else if (ep->state() == Endpoint::DRAINING) {
            st.draining++;
        } else if (ep->leased()) {
            st.leased++;
        } else if (ep->state() == Endpoint::READY) {
            st.idle++;
        }
    }
    st.waiting = static_cast<unsigned>(requests_.size());
    return st;
}

void PoolHost::invoke(PoolRequest *req, Endpoint *endpoint, kvc_STATUS err)
{
    req->timer.cancel();
    if (endpoint) {
        endpoint->leased_ = true;
        endpoint->idle_timer_.cancel();
    }
    req->callback(endpoint, err, req->arg);
    delete req;
}

/**
 * Pairs waiting requests with available endpoints. This is always invoked
 * from the event loop so that request callbacks are never called from within
 * get() or put().
 */
void PoolHost::connection_available()
{
    while (!requests_.empty()) {
        std::shared_ptr<const std::vector<Endpoint *> > cur = members();
        Endpoint *endpoint = strategy_->select(*cur);
        if (endpoint == NULL) {
            break;
        }
        PoolRequest *req = requests_.front();
        requests_.pop_front();
        kvc_log(LOGARGS(this, TRACE), HE_LOGFMT "Assigning EP=%p to request %p", HE_LOGID(this), (void *)endpoint,
                (void *)req);
        invoke(req, endpoint, KVC_SUCCESS);
    }

    for (size_t ii = 0; ii < graveyard_.size(); ++ii) {
        delete graveyard_[ii];
    }
    graveyard_.clear();
}

void PoolHost::start_new_connection()
{
    Endpoint *endpoint = parent_->factories_[service_](this, host_, port_, service_);
    add_member(endpoint);
    kvc_log(LOGARGS(this, DEBUG), HE_LOGFMT "Starting connection EP=%p", HE_LOGID(this), (void *)endpoint);
    endpoint->connect(parent_->settings->connect_timeout);
}

void PoolHost::maybe_start_connections()
{
    std::shared_ptr<const std::vector<Endpoint *> > cur = members();
    size_t navail = 0, nconnecting = 0, ntotal = cur->size();
    for (size_t ii = 0; ii < cur->size(); ++ii) {
        if ((*cur)[ii]->is_available()) {
            navail++;
        } else if ((*cur)[ii]->state() == Endpoint::CONNECTING) {
            nconnecting++;
        }
    }
    while (requests_.size() > navail + nconnecting && ntotal < parent_->settings->pool_max_size) {
        start_new_connection();
        nconnecting++;
        ntotal++;
    }
}

PoolRequest *PoolHost::get(uint32_t timeout, PoolCallback callback, void *arg)
{
    PoolRequest *req = new PoolRequest(this, callback, arg);
    requests_.push_back(req);
    req->timer.rearm(timeout);
    maybe_start_connections();
    async_.signal();
    return req;
}

void PoolHost::put(Endpoint *endpoint)
{
    endpoint->leased_ = false;
    if (endpoint->state() == Endpoint::CLOSED) {
        return;
    }
    if (endpoint->state() == Endpoint::DRAINING) {
        endpoint->maybe_finish_drain();
        return;
    }
    if (members()->size() > parent_->settings->pool_max_size) {
        kvc_log(LOGARGS(this, DEBUG), HE_LOGFMT "Pool above maximum size, draining EP=%p", HE_LOGID(this),
                (void *)endpoint);
        endpoint->drain();
        return;
    }
    if (members()->size() > 1) {
        endpoint->idle_timer_.rearm(parent_->settings->pool_idle_timeout);
    }
    async_.signal();
}

void PoolHost::cancel(PoolRequest *req)
{
    std::list<PoolRequest *>::iterator it = std::find(requests_.begin(), requests_.end(), req);
    if (it == requests_.end()) {
        return;
    }
    requests_.erase(it);
    delete req;
}

void PoolHost::request_timed_out(PoolRequest *req)
{
    std::list<PoolRequest *>::iterator it = std::find(requests_.begin(), requests_.end(), req);
    if (it == requests_.end()) {
        return;
    }
    requests_.erase(it);
    kvc_log(LOGARGS(this, DEBUG), HE_LOGFMT "Request %p timed out waiting for an endpoint", HE_LOGID(this),
            (void *)req);
    invoke(req, NULL, KVC_ERR_TIMEOUT);
}

void PoolHost::drain()
{
    kvc_log(LOGARGS(this, INFO), HE_LOGFMT "Draining pool", HE_LOGID(this));
    std::shared_ptr<const std::vector<Endpoint *> > cur = members();
    for (size_t ii = 0; ii < cur->size(); ++ii) {
        (*cur)[ii]->drain();
    }
    while (!requests_.empty()) {
        PoolRequest *req = requests_.front();
        requests_.pop_front();
        invoke(req, NULL, KVC_ERR_CONNECT);
    }
}

void PoolHost::endpoint_ready(Endpoint *)
{
    async_.signal();
}

void PoolHost::endpoint_idle(Endpoint *endpoint)
{
    if (members()->size() > 1) {
        kvc_log(LOGARGS(this, DEBUG), HE_LOGFMT "Closing idle EP=%p", HE_LOGID(this), (void *)endpoint);
        endpoint->drain();
    }
}

void PoolHost::endpoint_closed(Endpoint *endpoint, Endpoint::State prev, kvc_STATUS err)
{
    remove_member(endpoint);
    graveyard_.push_back(endpoint);

    if (prev == Endpoint::CONNECTING && err != KVC_SUCCESS && !requests_.empty()) {
        PoolRequest *req = requests_.front();
        requests_.pop_front();
        kvc_log(LOGARGS(this, WARN), HE_LOGFMT "Failing request %p: connection could not be established (%s)",
                HE_LOGID(this), (void *)req, kvc_strerror_short(err));
        invoke(req, NULL, KVC_ERR_CONNECT);
    }

    // Replace the closed endpoint if there is still demand
    maybe_start_connections();
    async_.signal();
}

void PoolHost::dump(FILE *fp) const
{
    PoolStats st = stats();
    fprintf(fp, "HOST=%s Requests=%u, Total=%u, Idle=%u, Leased=%u, Connecting=%u, Draining=%u\n", key_.c_str(),
            st.waiting, st.total, st.idle, st.leased, st.connecting, st.draining);
    std::shared_ptr<const std::vector<Endpoint *> > cur = members();
    for (size_t ii = 0; ii < cur->size(); ++ii) {
        const Endpoint *ep = (*cur)[ii];
        fprintf(fp, "  EP=%p State=%s Leased=%d Inflight=%lu\n", (void *)ep, Endpoint::state_name(ep->state()),
                ep->leased(), (unsigned long)ep->inflight());
    }
}

Pool::Pool(Settings *settings_, Table *io_) : settings(settings_), io(io_), strategy_factory_(create_round_robin)
{
    for (size_t ii = 0; ii < SERVICE__MAX; ++ii) {
        factories_[ii] = create_plain_endpoint;
    }
}

Pool::~Pool()
{
    for (std::map<std::string, PoolHost *>::iterator it = hosts_.begin(); it != hosts_.end(); ++it) {
        delete it->second;
    }
}

std::string Pool::make_key(const std::string &hostport, ServiceType type)
{
    return hostport + "/" + service_name(type);
}

PoolRequest *Pool::get(const std::string &hostport, ServiceType type, uint32_t timeout, PoolCallback callback,
                       void *arg)
{
    std::string key = make_key(hostport, type);
    std::map<std::string, PoolHost *>::iterator it = hosts_.find(key);
    PoolHost *host;
    if (it == hosts_.end()) {
        std::string hostname;
        uint16_t port;
        if (!split_hostport(hostport, hostname, port)) {
            return NULL;
        }
        host = new PoolHost(this, hostname, port, type);
        hosts_[key] = host;
    } else {
        host = it->second;
    }
    return host->get(timeout, callback, arg);
}

void Pool::put(Endpoint *endpoint)
{
    endpoint->parent_->put(endpoint);
}

void Pool::cancel(PoolRequest *req)
{
    req->host->cancel(req);
}

void Pool::drain(const std::string &hostport, ServiceType type)
{
    std::map<std::string, PoolHost *>::iterator it = hosts_.find(make_key(hostport, type));
    if (it != hosts_.end()) {
        it->second->drain();
    }
}

PoolStats Pool::stats(const std::string &hostport, ServiceType type) const
{
    std::map<std::string, PoolHost *>::const_iterator it = hosts_.find(make_key(hostport, type));
    if (it == hosts_.end()) {
        return PoolStats();
    }
    return it->second->stats();
}

void Pool::dump(FILE *fp) const
{
    for (std::map<std::string, PoolHost *>::const_iterator it = hosts_.begin(); it != hosts_.end(); ++it) {
        it->second->dump(fp);
    }
}

void Pool::set_endpoint_factory(ServiceType type, EndpointFactory factory)
{
    factories_[type] = factory;
}

void Pool::set_selection_strategy(SelectionStrategyFactory factory)
{
    strategy_factory_ = factory;
}
