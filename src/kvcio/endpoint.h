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

#ifndef KVC_ENDPOINT_H
#define KVC_ENDPOINT_H

#include <libkvcore/topology.h>
#include <libkvcore/transport.h>
#include "timer-ng.h"
#include <string>

namespace kvc {
class Settings;

namespace io {
class Pool;
class PoolHost;

/**
 * @brief A pooled connection to one (node, service) pair
 *
 * An endpoint starts out CONNECTING and becomes READY once the transport is
 * connected and the protocol specific handshake (if any) has completed.
 * A DRAINING endpoint accepts no new work; it closes as soon as nothing is in
 * flight on it and it is not leased. CLOSED is terminal: the pool removes
 * the endpoint and destroys it once the event loop regains control.
 *
 * Subclasses implement the protocol spoken over the stream.
 */
class Endpoint : public Transport::Handler {
  public:
    enum State {
        CONNECTING,
        READY,
        DRAINING,
        CLOSED
    };

    Endpoint(PoolHost *parent, const std::string &host, uint16_t port, ServiceType type);
    virtual ~Endpoint();

    void connect(uint32_t timeout);

    /** Stop accepting work and close once idle */
    void drain();

    /** Close immediately, failing anything in flight with `err` */
    void close(kvc_STATUS err);

    State state() const {
        return state_;
    }
    ServiceType service() const {
        return service_;
    }
    const std::string &host() const {
        return host_;
    }
    uint16_t port() const {
        return port_;
    }
    const std::string &name() const {
        return name_;
    }
    bool leased() const {
        return leased_;
    }
    bool is_available() const {
        return state_ == READY && !leased_;
    }

    /** Requests which were written and still await their response */
    virtual size_t inflight() const {
        return 0;
    }

    const Settings *settings() const;
    Table *io() const;

    static const char *state_name(State state);

    // Transport::Handler
    void on_connected(kvc_STATUS err);
    void on_read(const char *buf, size_t nbuf);
    void on_error(kvc_STATUS err);

  protected:
    /** Called once the stream is connected. Must call handshake_done() */
    virtual void start_handshake() {
        handshake_done(KVC_SUCCESS);
    }
    void handshake_done(kvc_STATUS err);

    virtual void handle_data(const char *buf, size_t nbuf) {
        (void)buf;
        (void)nbuf;
    }

    /** Fail whatever is in flight */
    virtual void handle_closed(kvc_STATUS err) {
        (void)err;
    }

    void write(const std::string &buf);

    /** Call whenever the in-flight count drops */
    void maybe_finish_drain();

  private:
    void on_connect_timeout();
    void on_idle_timeout();

    friend class PoolHost;
    friend class Pool;

    PoolHost *parent_;
    std::string host_;
    uint16_t port_;
    std::string name_;
    ServiceType service_;
    Transport *transport_;
    State state_;
    bool leased_;
    Timer<Endpoint, &Endpoint::on_connect_timeout> connect_timer_;
    Timer<Endpoint, &Endpoint::on_idle_timeout> idle_timer_;

    Endpoint(const Endpoint &);
    Endpoint &operator=(const Endpoint &);
};

} // namespace io
} // namespace kvc

#endif
