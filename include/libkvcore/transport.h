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

#ifndef LIBKVCORE_TRANSPORT_H
#define LIBKVCORE_TRANSPORT_H 1

#include <libkvcore/error.h>
#include <stddef.h>
#include <stdint.h>
#include <string>

struct event_base;

/**
 * @file
 * @brief Byte stream transport used by pooled endpoints
 *
 * The library does not deal with sockets, TLS or name resolution itself. A
 * TransportFactory creates one Transport per endpoint; the transport reports
 * its progress to the endpoint through the Handler interface. All handler
 * calls must be made from the event loop the instance runs on, and never
 * from within a call into the transport.
 */

namespace kvc {
namespace io {

class Transport {
  public:
    class Handler {
      public:
        virtual ~Handler() {}

        /** Called once. `err` is KVC_SUCCESS or KVC_ERR_CONNECT */
        virtual void on_connected(kvc_STATUS err) = 0;

        /** Bytes received. The buffer is only valid for the duration of the call */
        virtual void on_read(const char *buf, size_t nbuf) = 0;

        /** The stream failed or was closed by the peer. No further calls follow */
        virtual void on_error(kvc_STATUS err) = 0;
    };

    virtual ~Transport() {}

    virtual void connect(const std::string &host, uint16_t port) = 0;

    /** Queue bytes for writing. The transport copies the buffer */
    virtual void write(const char *buf, size_t nbuf) = 0;

    /** Close the stream. No handler calls are made after this returns */
    virtual void close() = 0;
};

class TransportFactory {
  public:
    virtual ~TransportFactory() {}
    virtual Transport *create(event_base *base, Transport::Handler *handler) = 0;
};

/** Plain TCP transport built on libevent bufferevents */
TransportFactory *default_transport_factory();

} // namespace io
} // namespace kvc

#endif
