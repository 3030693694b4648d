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

#ifndef KVC_MCSERVER_H
#define KVC_MCSERVER_H

#include "kvcio/endpoint.h"
#include "mc/packet.h"
#include <map>
#include <string>

namespace kvc {
namespace mc {

class Server;

/**
 * A request written to a Server which awaits its response. Exactly one of
 * the two handlers is invoked, unless the request is cancelled first.
 */
class PendingOp {
  public:
    virtual ~PendingOp() {}
    virtual void handle_response(Server *server, const Frame &frame) = 0;

    /** The connection failed before a response arrived */
    virtual void handle_failure(Server *server, kvc_STATUS err) = 0;
};

/**
 * @brief Key/value connection speaking the binary protocol
 *
 * Requests are correlated with their responses purely by opaque; the
 * opaque table is owned by this object and only touched from its own
 * receive path and from send()/cancel().
 */
class Server : public io::Endpoint {
  public:
    Server(io::PoolHost *parent, const std::string &host, uint16_t port, ServiceType type);
    ~Server();

    /**
     * Assign an opaque to `frame` and write it.
     * @return the opaque, which may be passed to cancel(), or 0 if the
     *  frame could not be encoded
     */
    uint32_t send(Frame &frame, PendingOp *op);

    /** Forget a request. A late response is discarded */
    void cancel(uint32_t opaque);

    size_t inflight() const {
        return pending_.size();
    }

    /** Endpoint factory for SERVICE_KV */
    static io::Endpoint *create(io::PoolHost *parent, const std::string &host, uint16_t port, ServiceType type);

  protected:
    void start_handshake();
    void handle_data(const char *buf, size_t nbuf);
    void handle_closed(kvc_STATUS err);

  private:
    enum ReadState {
        PKT_READ_COMPLETE,
        PKT_READ_PARTIAL,
        PKT_READ_ERROR
    };

    ReadState try_read();
    void handle_handshake_response(const Frame &frame);

    std::string rbuf_;
    std::map<uint32_t, PendingOp *> pending_;
    uint32_t next_opaque_;

    /** Opaque of the SELECT_BUCKET request while the handshake is running */
    uint32_t handshake_opaque_;
    bool handshaking_;
};

} // namespace mc
} // namespace kvc

#endif
