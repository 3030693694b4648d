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

#include "endpoint.h"
#include "manager.h"
#include "settings.h"
#include "logging.h"

#define LOGARGS(ep, lvl) (ep)->settings(), "endpoint", KVC_LOG_##lvl, __FILE__, __LINE__
#define LOGFMT "<%s/%s> (EP=%p) "
#define LOGID(ep) (ep)->name().c_str(), service_name((ep)->service()), (void *)(ep)

using namespace kvc;
using namespace kvc::io;

static std::string make_name(const std::string &host, uint16_t port)
{
    char buf[16];
    snprintf(buf, sizeof(buf), ":%u", (unsigned)port);
    return host + buf;
}

Endpoint::Endpoint(PoolHost *parent, const std::string &host, uint16_t port, ServiceType type)
    : parent_(parent), host_(host), port_(port), name_(make_name(host, port)), service_(type), transport_(NULL),
      state_(CONNECTING), leased_(false), connect_timer_(parent->io(), this), idle_timer_(parent->io(), this)
{
}

Endpoint::~Endpoint()
{
    if (transport_) {
        transport_->close();
        delete transport_;
    }
}

const Settings *Endpoint::settings() const
{
    return parent_->settings();
}

Table *Endpoint::io() const
{
    return parent_->io();
}

const char *Endpoint::state_name(State state)
{
    switch (state) {
        case CONNECTING:
            return "connecting";
        case READY:
            return "ready";
        case DRAINING:
            return "draining";
        case CLOSED:
            return "closed";
    }
    return "unknown";
}

void Endpoint::connect(uint32_t timeout)
{
    kvc_log(LOGARGS(this, DEBUG), LOGFMT "Connecting. Timeout=%uus", LOGID(this), timeout);
    transport_ = io()->create_transport(this);
    connect_timer_.rearm(timeout);
    transport_->connect(host_, port_);
}

void Endpoint::on_connect_timeout()
{
    kvc_log(LOGARGS(this, ERROR), LOGFMT "Failed to establish connection within time limit", LOGID(this));
    close(KVC_ERR_CONNECT);
}

void Endpoint::on_connected(kvc_STATUS err)
{
    connect_timer_.cancel();
    if (state_ != CONNECTING) {
        return;
    }
    if (err != KVC_SUCCESS) {
        kvc_log(LOGARGS(this, ERROR), LOGFMT "Connection failed: %s", LOGID(this), kvc_strerror_short(err));
        close(err);
        return;
    }
    start_handshake();
}

void Endpoint::handshake_done(kvc_STATUS err)
{
    if (state_ != CONNECTING) {
        return;
    }
    if (err != KVC_SUCCESS) {
        kvc_log(LOGARGS(this, ERROR), LOGFMT "Handshake failed: %s", LOGID(this), kvc_strerror_short(err));
        close(err);
        return;
    }
    kvc_log(LOGARGS(this, INFO), LOGFMT "Endpoint is ready", LOGID(this));
    state_ = READY;
    parent_->endpoint_ready(this);
}

void Endpoint::on_read(const char *buf, size_t nbuf)
{
    if (state_ == CLOSED) {
        return;
    }
    handle_data(buf, nbuf);
}

void Endpoint::on_error(kvc_STATUS err)
{
    kvc_log(LOGARGS(this, WARN), LOGFMT "Got I/O error %s", LOGID(this), kvc_strerror_short(err));
    close(err);
}

void Endpoint::write(const std::string &buf)
{
    if (transport_ && state_ != CLOSED) {
        transport_->write(buf.data(), buf.size());
    }
}

void Endpoint::drain()
{
    if (state_ == CONNECTING) {
        close(KVC_SUCCESS);
        return;
    }
    if (state_ != READY) {
        return;
    }
    kvc_log(LOGARGS(this, DEBUG), LOGFMT "Draining. %lu requests in flight", LOGID(this), (unsigned long)inflight());
    state_ = DRAINING;
    idle_timer_.cancel();
    maybe_finish_drain();
}

void Endpoint::maybe_finish_drain()
{
    if (state_ == DRAINING && inflight() == 0 && !leased_) {
        close(KVC_SUCCESS);
    }
}

void Endpoint::on_idle_timeout()
{
    if (is_available()) {
        parent_->endpoint_idle(this);
    }
}

void Endpoint::close(kvc_STATUS err)
{
    if (state_ == CLOSED) {
        return;
    }
    State prev = state_;
    kvc_log(LOGARGS(this, DEBUG), LOGFMT "Closing (%s -> closed): %s", LOGID(this), state_name(prev),
            kvc_strerror_short(err));
    state_ = CLOSED;
    connect_timer_.cancel();
    idle_timer_.cancel();
    if (transport_) {
        transport_->close();
    }
    handle_closed(err == KVC_SUCCESS ? KVC_ERR_NETWORK : err);
    parent_->endpoint_closed(this, prev, err);
}
