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

#include <libkvcore/topology.h>
#include <stdio.h>

const int kvc::Topology::NO_NODE;

using namespace kvc;

const char *kvc::service_name(ServiceType type)
{
    switch (type) {
        case SERVICE_KV:
            return "kv";
        case SERVICE_QUERY:
            return "query";
        case SERVICE_ANALYTICS:
            return "analytics";
        case SERVICE_SEARCH:
            return "search";
        case SERVICE_VIEWS:
            return "views";
        case SERVICE_MANAGEMENT:
            return "mgmt";
        default:
            return "unknown";
    }
}

std::string NodeInfo::endpoint(ServiceType type) const
{
    if (type >= SERVICE__MAX || ports[type] == 0 || hostname.empty()) {
        return std::string();
    }
    char buf[16];
    snprintf(buf, sizeof(buf), ":%u", (unsigned)ports[type]);
    return hostname + buf;
}

bool NodeInfo::operator==(const NodeInfo &other) const
{
    return hostname == other.hostname && ports[SERVICE_KV] == other.ports[SERVICE_KV];
}

kvc_STATUS Topology::create(uint64_t rev, const std::vector<NodeInfo> &nodes, unsigned nreplicas,
                            const std::vector<std::vector<int> > &vbmap, std::shared_ptr<const Topology> &out)
{
    if (nodes.empty() || vbmap.empty() || vbmap.size() > 0xffff) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    for (size_t ii = 0; ii < vbmap.size(); ++ii) {
        if (vbmap[ii].size() != nreplicas + 1) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
        for (size_t jj = 0; jj < vbmap[ii].size(); ++jj) {
            int ix = vbmap[ii][jj];
            if (ix != NO_NODE && (ix < 0 || static_cast<size_t>(ix) >= nodes.size())) {
                return KVC_ERR_INVALID_ARGUMENT;
            }
        }
    }
    for (size_t ii = 0; ii < nodes.size(); ++ii) {
        if (nodes[ii].endpoint(SERVICE_KV).empty()) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
    }

    std::shared_ptr<Topology> topo(new Topology());
    topo->rev_ = rev;
    topo->nreplicas_ = nreplicas;
    topo->nodes_ = nodes;
    topo->vbmap_ = vbmap;
    out = topo;
    return KVC_SUCCESS;
}

std::shared_ptr<const Topology> Topology::generate(unsigned nservers, unsigned nreplicas, unsigned nvbuckets,
                                                   uint64_t rev, const std::string &hostname, uint16_t base_port)
{
    std::vector<NodeInfo> nodes;
    for (unsigned ii = 0; ii < nservers; ++ii) {
        nodes.push_back(NodeInfo(hostname, static_cast<uint16_t>(base_port + ii)));
    }

    std::vector<std::vector<int> > vbmap(nvbuckets);
    for (unsigned ii = 0; ii < nvbuckets; ++ii) {
        int primary = static_cast<int>(ii % nservers);
        vbmap[ii].push_back(primary);
        for (unsigned jj = 0; jj < nreplicas; ++jj) {
            int replica = static_cast<int>((ii + jj + 1) % nservers);
            vbmap[ii].push_back(replica == primary ? NO_NODE : replica);
        }
    }

    std::shared_ptr<const Topology> out;
    if (create(rev, nodes, nreplicas, vbmap, out) != KVC_SUCCESS) {
        return std::shared_ptr<const Topology>();
    }
    return out;
}

int Topology::vbserver(unsigned vbid, unsigned ix) const
{
    if (vbid >= vbmap_.size() || ix > nreplicas_) {
        return NO_NODE;
    }
    return vbmap_[vbid][ix];
}

int Topology::node_index(const NodeInfo &info) const
{
    for (size_t ii = 0; ii < nodes_.size(); ++ii) {
        if (nodes_[ii] == info) {
            return static_cast<int>(ii);
        }
    }
    return NO_NODE;
}
