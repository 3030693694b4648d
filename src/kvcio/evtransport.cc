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

/**
 * Plain TCP transport on top of libevent's bufferevents. Name resolution is
 * done synchronously by libevent since no evdns base is supplied.
 */

#include <libkvcore/transport.h>
#include <event2/event.h>
#include <event2/bufferevent.h>
#include <event2/buffer.h>
#include <sys/socket.h>

using namespace kvc::io;

namespace {

class EvTransport : public Transport {
  public:
    EvTransport(event_base *base, Handler *handler)
        : base_(base), handler_(handler), bev_(NULL), failev_(NULL), connected_(false)
    {
    }

    ~EvTransport() {
        close();
    }

    void connect(const std::string &host, uint16_t port) {
        bev_ = bufferevent_socket_new(base_, -1, BEV_OPT_CLOSE_ON_FREE);
        if (bev_ == NULL) {
            deliver_connect_error();
            return;
        }
        bufferevent_setcb(bev_, on_read_ready, NULL, on_event, this);
        bufferevent_enable(bev_, EV_READ | EV_WRITE);
        if (bufferevent_socket_connect_hostname(bev_, NULL, AF_UNSPEC, host.c_str(), port) != 0) {
            bufferevent_free(bev_);
            bev_ = NULL;
            deliver_connect_error();
        }
    }

    void write(const char *buf, size_t nbuf) {
        if (bev_) {
            bufferevent_write(bev_, buf, nbuf);
        }
    }

    void close() {
        if (bev_) {
            bufferevent_free(bev_);
            bev_ = NULL;
        }
        if (failev_) {
            event_free(failev_);
            failev_ = NULL;
        }
    }

  private:
    // Handler calls must not happen from within connect()
    void deliver_connect_error() {
        struct timeval tv = {0, 0};
        failev_ = evtimer_new(base_, on_connect_failed, this);
        evtimer_add(failev_, &tv);
    }

    static void on_connect_failed(evutil_socket_t, short, void *arg) {
        EvTransport *self = reinterpret_cast<EvTransport *>(arg);
        event_free(self->failev_);
        self->failev_ = NULL;
        self->handler_->on_connected(KVC_ERR_CONNECT);
    }

    static void on_read_ready(bufferevent *bev, void *arg) {
        EvTransport *self = reinterpret_cast<EvTransport *>(arg);
        evbuffer *input = bufferevent_get_input(bev);
        char buf[8192];
        int nr;
        while (self->bev_ && (nr = evbuffer_remove(input, buf, sizeof(buf))) > 0) {
            self->handler_->on_read(buf, static_cast<size_t>(nr));
        }
    }

    static void on_event(bufferevent *, short events, void *arg) {
        EvTransport *self = reinterpret_cast<EvTransport *>(arg);
        if (events & BEV_EVENT_CONNECTED) {
            self->connected_ = true;
            self->handler_->on_connected(KVC_SUCCESS);
            return;
        }
        if (events & (BEV_EVENT_ERROR | BEV_EVENT_EOF)) {
            bool was_connected = self->connected_;
            self->close();
            if (was_connected) {
                self->handler_->on_error(KVC_ERR_NETWORK);
            } else {
                self->handler_->on_connected(KVC_ERR_CONNECT);
            }
        }
    }

    event_base *base_;
    Handler *handler_;
    bufferevent *bev_;
    struct event *failev_;
    bool connected_;
};

class EvTransportFactory : public TransportFactory {
  public:
    Transport *create(event_base *base, Transport::Handler *handler) {
        return new EvTransport(base, handler);
    }
};

} // namespace

TransportFactory *kvc::io::default_transport_factory()
{
    static EvTransportFactory factory;
    return &factory;
}
