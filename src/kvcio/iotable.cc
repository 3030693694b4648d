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

#include "iotable.h"
#include <event2/event.h>

using namespace kvc::io;

Table::Table(event_base *base, TransportFactory *factory)
    : base_(base), factory_(factory), owned_(false), running_(false)
{
    if (base_ == NULL) {
        base_ = event_base_new();
        owned_ = true;
    }
    if (factory_ == NULL) {
        factory_ = default_transport_factory();
    }
}

Table::~Table()
{
    if (owned_ && base_) {
        event_base_free(base_);
    }
}

void Table::run()
{
    running_ = true;
    event_base_loop(base_, 0);
    running_ = false;
}

void Table::stop()
{
    if (running_) {
        event_base_loopbreak(base_);
    }
}
