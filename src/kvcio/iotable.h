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

#ifndef KVC_IOTABLE_H
#define KVC_IOTABLE_H

#include <libkvcore/transport.h>

struct event_base;

namespace kvc {
namespace io {

/**
 * The event loop an instance runs on. Wraps a libevent event_base which is
 * either borrowed from the caller or created (and freed) by the table.
 */
class Table {
  public:
    /** @param base the loop to use, or NULL to create one */
    Table(event_base *base, TransportFactory *factory);
    ~Table();

    event_base *base() const {
        return base_;
    }

    TransportFactory *transport_factory() const {
        return factory_;
    }

    Transport *create_transport(Transport::Handler *handler) {
        return factory_->create(base_, handler);
    }

    /** Run the loop until stop() is called or no events remain */
    void run();
    void stop();

    bool is_running() const {
        return running_;
    }

  private:
    event_base *base_;
    TransportFactory *factory_;
    bool owned_;
    bool running_;

    Table(const Table &);
    Table &operator=(const Table &);
};

} // namespace io
} // namespace kvc

#endif
