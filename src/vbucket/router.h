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

#ifndef KVC_ROUTER_H
#define KVC_ROUTER_H

#include <libkvcore/topology.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kvc {

/** Partition of `key` for a map of `nvbuckets` partitions */
uint16_t vbucket_for_key(const std::string &key, unsigned nvbuckets);

struct RouteResult {
    RouteResult() : rc(KVC_ERR_TOPOLOGY_NOT_READY), vbid(0), primary(Topology::NO_NODE) {}

    kvc_STATUS rc;
    uint16_t vbid;
    int primary;

    /** Replica node indices in replica order; NO_NODE for inactive slots */
    std::vector<int> replicas;

    /** The snapshot the indices refer to */
    std::shared_ptr<const Topology> snapshot;
};

struct RoutedKey {
    RoutedKey() : vbid(0) {}
    RoutedKey(const std::string &key_, uint16_t vbid_) : key(key_), vbid(vbid_) {}
    std::string key;
    uint16_t vbid;
};

/**
 * @brief Maps keys to nodes using the most recent topology
 *
 * The current snapshot is swapped atomically; every routing call works on
 * a single snapshot which it hands back to the caller.
 */
class Router {
  public:
    Router() {}

    /**
     * Replace the current snapshot if `topology` carries a newer revision.
     * @return true if the snapshot was replaced
     */
    bool update(const std::shared_ptr<const Topology> &topology);

    std::shared_ptr<const Topology> snapshot() const {
        return std::atomic_load(&current_);
    }

    /**
     * Route a key to its primary and replicas. Fails with
     * KVC_ERR_TOPOLOGY_NOT_READY if there is no snapshot or the partition
     * has no active node.
     */
    kvc_STATUS route(const std::string &key, RouteResult &result) const;

    /**
     * Node holding copy `ix` (0 is the primary) of the key's partition.
     * Fails with KVC_ERR_TOPOLOGY_NOT_READY if there is no such node.
     */
    kvc_STATUS route_node(const std::string &key, unsigned ix, int &node, uint16_t &vbid) const;

    /**
     * Bucket keys by the node holding copy `ix` of their partition, all
     * against the same snapshot. Keys whose slot is inactive are returned
     * under Topology::NO_NODE.
     *
     * @return KVC_ERR_TOPOLOGY_NOT_READY if there is no snapshot
     */
    kvc_STATUS bucket_by_node(const std::vector<std::string> &keys, unsigned ix,
                              std::map<int, std::vector<RoutedKey> > &out,
                              std::shared_ptr<const Topology> *snapshot = NULL) const;

  private:
    std::shared_ptr<const Topology> current_;

    Router(const Router &);
    Router &operator=(const Router &);
};

} // namespace kvc

#endif
