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

#include "internal.h"
#include "request.h"

using namespace kvc;

static kvc_STATUS schedule_counter(Instance *instance, const CmdCounter &cmd, bool decrement,
                                   CounterCallback callback, OperationHandle *handle)
{
    mc::Command mcmd;
    mcmd.type = mc::OP_COUNTER;
    mcmd.key = cmd.key;
    mcmd.collection_id = cmd.collection_id;
    mcmd.expiry = cmd.expiry;
    mcmd.counter.delta = cmd.delta;
    mcmd.counter.initial = cmd.initial;
    mcmd.counter.has_initial = cmd.has_initial;
    mcmd.counter.decrement = decrement;

    Request *req = new Request(instance, mcmd, cmd.timeout, cmd.retry_strategy,
                               [callback](Request &r, const mc::Response &resp) {
                                   RespCounter out;
                                   r.fill(resp, out);
                                   out.value = resp.value;
                                   out.token = r.token(resp);
                                   out.durability = r.durability_info();
                                   callback(out);
                               });
    req->set_durability(cmd.durability);
    kvc_STATUS rc = req->start(handle);
    if (rc != KVC_SUCCESS) {
        delete req;
    }
    return rc;
}

kvc_STATUS Instance::increment(const CmdCounter &cmd, CounterCallback callback, OperationHandle *handle)
{
    return schedule_counter(this, cmd, false, callback, handle);
}

kvc_STATUS Instance::decrement(const CmdCounter &cmd, CounterCallback callback, OperationHandle *handle)
{
    return schedule_counter(this, cmd, true, callback, handle);
}
