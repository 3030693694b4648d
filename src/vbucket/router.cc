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

#include "router.h"
#include <zlib.h>

using namespace kvc;

uint16_t kvc::vbucket_for_key(const std::string &key, unsigned nvbuckets)
{
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef *>(key.data()), static_cast<uInt>(key.size()));
    uint32_t digest = (static_cast<uint32_t>(crc) >> 16) & 0x7fff;
    return static_cast<uint16_t>(digest % nvbuckets);
}

bool Router::update(const std::shared_ptr<const Topology> &topology)
{
    if (!topology) {
        return false;
    }
    std::shared_ptr<const Topology> cur = snapshot();
    if (cur && topology->revision() <= cur->revision()) {
        return false;
    }
    std::atomic_store(&current_, topology);
    return true;
}

kvc_STATUS Router::route(const std::string &key, RouteResult &result) const
{
    result = RouteResult();
    std::shared_ptr<const Topology> topo = snapshot();
    if (!topo) {
        return result.rc;
    }

    result.snapshot = topo;
    result.vbid = vbucket_for_key(key, topo->num_partitions());
    result.primary = topo->vbserver(result.vbid, 0);
    for (unsigned ii = 1; ii <= topo->num_replicas(); ++ii) {
        result.replicas.push_back(topo->vbserver(result.vbid, ii));
    }
    if (result.primary == Topology::NO_NODE) {
        return result.rc;
    }
    result.rc = KVC_SUCCESS;
    return result.rc;
}

kvc_STATUS Router::route_node(const std::string &key, unsigned ix, int &node, uint16_t &vbid) const
{
    std::shared_ptr<const Topology> topo = snapshot();
    if (!topo) {
        return KVC_ERR_TOPOLOGY_NOT_READY;
    }
    vbid = vbucket_for_key(key, topo->num_partitions());
    node = topo->vbserver(vbid, ix);
    if (node == Topology::NO_NODE) {
        return KVC_ERR_TOPOLOGY_NOT_READY;
    }
    return KVC_SUCCESS;
}

kvc_STATUS Router::bucket_by_node(const std::vector<std::string> &keys, unsigned ix,
                                  std::map<int, std::vector<RoutedKey> > &out,
                                  std::shared_ptr<const Topology> *snapshot_out) const
{
    std::shared_ptr<const Topology> topo = snapshot();
    if (!topo) {
        return KVC_ERR_TOPOLOGY_NOT_READY;
    }
    for (size_t ii = 0; ii < keys.size(); ++ii) {
        uint16_t vbid = vbucket_for_key(keys[ii], topo->num_partitions());
        out[topo->vbserver(vbid, ix)].push_back(RoutedKey(keys[ii], vbid));
    }
    if (snapshot_out) {
        *snapshot_out = topo;
    }
    return KVC_SUCCESS;
}
