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

#ifndef KVC_DURABILITY_INTERNAL_H
#define KVC_DURABILITY_INTERNAL_H

#include "internal.h"
#include <set>

/**
 * @file
 * @brief Observe based durability polling
 *
 * A durability poll consists of one or more entries, each a key with the
 * cas of the mutation to verify. Every round sends one OBSERVE request per
 * node holding a copy of any pending entry. Replies update per entry counts
 * for the round; an entry is done as soon as its counts meet the
 * thresholds, or when the active node reports a different version of the
 * document. Rounds repeat every `durability_interval` until all entries are
 * done or the deadline passes.
 */

namespace kvc {

class Request;

/** Numeric thresholds an observe poll must reach */
struct DurabilityThresholds {
    DurabilityThresholds() : persist_to(0), replicate_to(0), persist_master(false) {}

    /** Nodes (the active included) which must have persisted the mutation */
    unsigned persist_to;

    /** Replica nodes which must hold the mutation */
    unsigned replicate_to;

    /** The active node must have persisted the mutation */
    bool persist_master;
};

/**
 * Derive the thresholds for `req` on a bucket with `nreplicas` replicas.
 * Levels are expressed as their observe equivalent.
 *
 * @return KVC_ERR_DURABILITY_IMPOSSIBLE if the thresholds exceed the
 *  number of copies the bucket is configured for
 */
kvc_STATUS durability_thresholds(const DurabilityRequirement &req, unsigned nreplicas, DurabilityThresholds &out);

/** Whether durability for `req` is verified by polling */
bool durability_needs_poll(const Settings *settings, const DurabilityRequirement &req);

struct DurabilityEntry {
    DurabilityEntry() : cas(0), is_delete(false), rc(KVC_SUCCESS), done(false) {}

    std::string key;
    uint64_t cas;
    bool is_delete;
    kvc_STATUS rc;
    bool done;
    DurabilityInfo info;
};

class DurabilityPoll : public Operation {
  public:
    typedef std::function<void(DurabilityPoll &)> Completion;

    /**
     * @param deadline absolute deadline (see SystemClock)
     * @param completion invoked exactly once, unless the poll is aborted
     */
    DurabilityPoll(Instance *instance, const std::vector<DurabilityItem> &items, uint32_t collection_id,
                   const DurabilityRequirement &requirement, hrtime_t deadline, Completion completion);
    ~DurabilityPoll();

    /**
     * Validate the requirement against the current topology and begin
     * polling. On failure nothing is started and the caller still owns the
     * poll.
     *
     * @param track whether to register as a user visible operation
     */
    kvc_STATUS start(bool track, OperationHandle *handle = NULL);

    void cancel();

    /** Stop polling without invoking the completion. Deletes the poll */
    void abort();

    const std::vector<DurabilityEntry> &entries() const {
        return entries_;
    }

    /** First failure among the entries, or KVC_SUCCESS */
    kvc_STATUS rc() const;

  private:
    void poll();
    void on_deadline();
    void handle_observe(Request &req, const mc::Response &resp);
    void update_entry(DurabilityEntry &ent, bool is_primary, const mc::ObserveEntry &obs);
    bool satisfied(const DurabilityEntry &ent) const;
    void entry_done(DurabilityEntry &ent, kvc_STATUS rc);
    void round_done();
    void finish(kvc_STATUS pending_rc, bool notify);

    std::vector<DurabilityEntry> entries_;
    uint32_t collection_id_;
    DurabilityRequirement requirement_;
    DurabilityThresholds thresholds_;
    hrtime_t deadline_;
    Completion completion_;
    std::set<Request *> outstanding_;

    /** Primary node per entry for the current round */
    std::vector<int> primaries_;
    unsigned nremaining_;
    unsigned round_;
    bool finished_;
    BoundedRetry interval_;
    io::Timer<DurabilityPoll, &DurabilityPoll::on_deadline> deadline_timer_;
};

} // namespace kvc

#endif
