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

#ifndef LIBKVCORE_TOPOLOGY_H
#define LIBKVCORE_TOPOLOGY_H 1

#include <libkvcore/error.h>
#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

/**
 * @file
 * @brief Immutable cluster topology snapshots
 *
 * A snapshot maps every partition to an ordered list of node indices, the
 * first being the active (primary) node and the rest its replicas. Snapshots
 * are produced by the configuration provider and handed to
 * kvc::Instance::update_topology(). They are never modified once created.
 */

namespace kvc {

enum ServiceType {
    SERVICE_KV = 0,
    SERVICE_QUERY,
    SERVICE_ANALYTICS,
    SERVICE_SEARCH,
    SERVICE_VIEWS,
    SERVICE_MANAGEMENT,
    SERVICE__MAX
};

const char *service_name(ServiceType type);

struct NodeInfo {
    NodeInfo() : ports() {}
    NodeInfo(const std::string &host, uint16_t kv_port) : hostname(host), ports() {
        ports[SERVICE_KV] = kv_port;
    }

    /** Returns the `host:port` string for the service, or an empty string */
    std::string endpoint(ServiceType type) const;

    bool operator==(const NodeInfo &other) const;

    std::string hostname;
    uint16_t ports[SERVICE__MAX];
};

class Topology {
  public:
    /** Marks a partition slot with no node assigned */
    static const int NO_NODE = -1;

    /**
     * Create a snapshot from an explicit partition table.
     *
     * @param rev configuration revision. Newer snapshots must carry a
     *  higher revision
     * @param nodes the node list. Partition table entries index into it
     * @param nreplicas configured number of replicas
     * @param vbmap one entry per partition; each entry has `nreplicas + 1`
     *  node indices, or NO_NODE for a slot which is not active
     * @param[out] out the new snapshot
     * @return KVC_ERR_INVALID_ARGUMENT if the table is inconsistent
     */
    static kvc_STATUS create(uint64_t rev, const std::vector<NodeInfo> &nodes, unsigned nreplicas,
                             const std::vector<std::vector<int> > &vbmap, std::shared_ptr<const Topology> &out);

    /**
     * Generate a balanced snapshot, mostly useful for testing. Node `i`
     * listens on `hostname:base_port+i`. Replica slots which would land on
     * the primary node are left as NO_NODE.
     */
    static std::shared_ptr<const Topology> generate(unsigned nservers, unsigned nreplicas, unsigned nvbuckets,
                                                    uint64_t rev = 1, const std::string &hostname = "localhost",
                                                    uint16_t base_port = 11210);

    uint64_t revision() const {
        return rev_;
    }
    unsigned num_partitions() const {
        return static_cast<unsigned>(vbmap_.size());
    }
    unsigned num_replicas() const {
        return nreplicas_;
    }
    size_t num_nodes() const {
        return nodes_.size();
    }
    const NodeInfo &node(size_t ix) const {
        return nodes_[ix];
    }

    /**
     * Node index holding copy `ix` of the partition. `ix` 0 is the primary.
     * Returns NO_NODE for an inactive slot or out of range arguments.
     */
    int vbserver(unsigned vbid, unsigned ix) const;

    /** Index of the node with the given KV endpoint, or NO_NODE */
    int node_index(const NodeInfo &info) const;

  private:
    Topology() : rev_(0), nreplicas_(0) {}

    uint64_t rev_;
    unsigned nreplicas_;
    std::vector<NodeInfo> nodes_;
    std::vector<std::vector<int> > vbmap_;
};

} // namespace kvc

#endif
