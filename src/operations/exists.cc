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

kvc_STATUS Instance::exists(const CmdExists &cmd, ExistsCallback callback, OperationHandle *handle)
{
    mc::Command mcmd;
    mcmd.type = mc::OP_GET_META;
    mcmd.key = cmd.key;
    mcmd.collection_id = cmd.collection_id;

    Request *req = new Request(this, mcmd, cmd.timeout, cmd.retry_strategy,
                               [callback](Request &r, const mc::Response &resp) {
                                   RespExists out;
                                   r.fill(resp, out);
                                   if (resp.rc == KVC_SUCCESS) {
                                       out.exists = resp.exists && !resp.deleted;
                                       out.deleted = resp.deleted;
                                       out.flags = resp.flags;
                                       out.expiry = resp.expiry;
                                       out.seqno = resp.seqno;
                                   }
                                   callback(out);
                               });
    kvc_STATUS rc = req->start(handle);
    if (rc != KVC_SUCCESS) {
        delete req;
    }
    return rc;
}
