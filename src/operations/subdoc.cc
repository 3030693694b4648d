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

static kvc_STATUS schedule_subdoc(Instance *instance, const CmdSubdoc &cmd, bool mutate, SubdocCallback callback,
                                  OperationHandle *handle)
{
    mc::Command mcmd;
    mcmd.type = mutate ? mc::OP_SUBDOC_MUTATE : mc::OP_SUBDOC_LOOKUP;
    mcmd.key = cmd.key;
    mcmd.collection_id = cmd.collection_id;
    mcmd.cas = cmd.cas;
    mcmd.expiry = cmd.expiry;
    mcmd.subdoc.specs = cmd.specs;
    mcmd.subdoc.semantics = cmd.semantics;
    mcmd.subdoc.access_deleted = cmd.access_deleted;

    Request *req = new Request(instance, mcmd, cmd.timeout, cmd.retry_strategy,
                               [callback](Request &r, const mc::Response &resp) {
                                   RespSubdoc out;
                                   r.fill(resp, out);
                                   out.results = resp.subdoc;
                                   out.deleted = resp.deleted;
                                   out.token = r.token(resp);
                                   out.durability = r.durability_info();
                                   callback(out);
                               });
    if (mutate) {
        req->set_durability(cmd.durability);
    } else if (!cmd.durability.is_none()) {
        delete req;
        return KVC_ERR_INVALID_ARGUMENT;
    }
    kvc_STATUS rc = req->start(handle);
    if (rc != KVC_SUCCESS) {
        delete req;
    }
    return rc;
}

kvc_STATUS Instance::mutate_in(const CmdSubdoc &cmd, SubdocCallback callback, OperationHandle *handle)
{
    return schedule_subdoc(this, cmd, true, callback, handle);
}

kvc_STATUS Instance::lookup_in(const CmdSubdoc &cmd, SubdocCallback callback, OperationHandle *handle)
{
    return schedule_subdoc(this, cmd, false, callback, handle);
}
