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

#include "mcserver.h"
#include "mc/codec.h"
#include "settings.h"
#include "logging.h"

#define LOGARGS(c, lvl) (c)->settings(), "server", KVC_LOG_##lvl, __FILE__, __LINE__
#define LOGARGS_T(lvl) LOGARGS(this, lvl)

#define LOGFMT "<%s> (SRV=%p) "
#define LOGID(server) (server)->name().c_str(), (void *)(server)
#define LOGID_T() LOGID(this)

using namespace kvc;
using namespace kvc::mc;

Server::Server(io::PoolHost *parent, const std::string &host, uint16_t port, ServiceType type)
    : io::Endpoint(parent, host, port, type), next_opaque_(0), handshake_opaque_(0), handshaking_(false)
{
}

Server::~Server()
{
    pending_.clear();
}

io::Endpoint *Server::create(io::PoolHost *parent, const std::string &host, uint16_t port, ServiceType type)
{
    return new Server(parent, host, port, type);
}

void Server::start_handshake()
{
    const std::string &bucket = settings()->bucket;
    if (bucket.empty()) {
        handshake_done(KVC_SUCCESS);
        return;
    }

    Frame frame;
    frame.opcode = CMD_SELECT_BUCKET;
    frame.key = bucket;
    frame.opaque = handshake_opaque_ = ++next_opaque_;
    std::string buf;
    if (!encode_frame(frame, buf)) {
        handshake_done(KVC_ERR_INVALID_ARGUMENT);
        return;
    }
    kvc_log(LOGARGS_T(DEBUG), LOGFMT "Selecting bucket \"%s\"", LOGID_T(), bucket.c_str());
    handshaking_ = true;
    write(buf);
}

void Server::handle_handshake_response(const Frame &frame)
{
    handshaking_ = false;
    if (frame.opcode != CMD_SELECT_BUCKET || frame.opaque != handshake_opaque_) {
        kvc_log(LOGARGS_T(ERROR), LOGFMT "Unexpected packet during handshake (OP=0x%x, SEQ=%u)", LOGID_T(),
                frame.opcode, frame.opaque);
        handshake_done(KVC_ERR_PROTOCOL);
        return;
    }
    if (frame.status() != STATUS_SUCCESS) {
        kvc_log(LOGARGS_T(ERROR), LOGFMT "Bucket selection failed (RC=0x%x)", LOGID_T(), frame.status());
        handshake_done(KVC_ERR_CONNECT);
        return;
    }
    handshake_done(KVC_SUCCESS);
}

uint32_t Server::send(Frame &frame, PendingOp *op)
{
    frame.opaque = ++next_opaque_;
    if (frame.opaque == 0) {
        frame.opaque = ++next_opaque_;
    }
    std::string buf;
    if (!encode_frame(frame, buf)) {
        kvc_log(LOGARGS_T(ERROR), LOGFMT "Cannot encode packet (OP=0x%x)", LOGID_T(), frame.opcode);
        return 0;
    }
    pending_[frame.opaque] = op;
    kvc_log(LOGARGS_T(TRACE), LOGFMT "Sending packet (OP=0x%x, SEQ=%u, VB=%u)", LOGID_T(), frame.opcode,
            frame.opaque, frame.vbucket);
    write(buf);
    return frame.opaque;
}

void Server::cancel(uint32_t opaque)
{
    if (pending_.erase(opaque)) {
        maybe_finish_drain();
    }
}

Server::ReadState Server::try_read()
{
    Frame frame;
    size_t consumed = 0;

    switch (decode_frame(rbuf_.data(), rbuf_.size(), frame, &consumed)) {
        case DECODE_INCOMPLETE:
            return PKT_READ_PARTIAL;
        case DECODE_ERROR:
            kvc_log(LOGARGS_T(ERROR), LOGFMT "Received invalid packet header", LOGID_T());
            return PKT_READ_ERROR;
        case DECODE_OK:
            break;
    }
    rbuf_.erase(0, consumed);

    if (!frame.is_response()) {
        kvc_log(LOGARGS_T(ERROR), LOGFMT "Received request packet (OP=0x%x) on response stream", LOGID_T(),
                frame.opcode);
        return PKT_READ_ERROR;
    }

    if (handshaking_) {
        handle_handshake_response(frame);
        return PKT_READ_COMPLETE;
    }

    std::map<uint32_t, PendingOp *>::iterator it = pending_.find(frame.opaque);
    if (it == pending_.end()) {
        kvc_log(LOGARGS_T(WARN), LOGFMT "Found stale packet (OP=0x%x, RC=0x%x, SEQ=%u)", LOGID_T(), frame.opcode,
                frame.status(), frame.opaque);
        return PKT_READ_COMPLETE;
    }

    PendingOp *op = it->second;
    pending_.erase(it);
    kvc_log(LOGARGS_T(TRACE), LOGFMT "Received response (OP=0x%x, RC=0x%x, SEQ=%u)", LOGID_T(), frame.opcode,
            frame.status(), frame.opaque);
    op->handle_response(this, frame);
    return PKT_READ_COMPLETE;
}

void Server::handle_data(const char *buf, size_t nbuf)
{
    rbuf_.append(buf, nbuf);
    for (;;) {
        ReadState rv = try_read();
        if (state() == CLOSED) {
            return;
        }
        if (rv == PKT_READ_ERROR) {
            close(KVC_ERR_PROTOCOL);
            return;
        }
        if (rv == PKT_READ_PARTIAL) {
            break;
        }
    }
    maybe_finish_drain();
}

void Server::handle_closed(kvc_STATUS err)
{
    rbuf_.clear();
    if (pending_.empty()) {
        return;
    }
    kvc_log(LOGARGS_T(WARN), LOGFMT "Failing %lu pending commands with %s", LOGID_T(), (unsigned long)pending_.size(),
            kvc_strerror_short(err));

    // A handler may cancel other requests on this server
    while (!pending_.empty()) {
        std::map<uint32_t, PendingOp *>::iterator it = pending_.begin();
        PendingOp *op = it->second;
        pending_.erase(it);
        op->handle_failure(this, err);
    }
}
