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

#include "durability_internal.h"
#include "request.h"

#define LOGARGS(poll, lvl) (poll)->instance()->settings(), "durability", KVC_LOG_##lvl, __FILE__, __LINE__
#define LOGFMT "(DSET=%p) "
#define LOGID(poll) (void *)(poll)

using namespace kvc;

kvc_STATUS kvc::durability_thresholds(const DurabilityRequirement &req, unsigned nreplicas, DurabilityThresholds &out)
{
    out = DurabilityThresholds();
    unsigned total = nreplicas + 1;
    unsigned majority = total / 2 + 1;

    switch (req.kind()) {
        case DurabilityRequirement::KIND_NONE:
            return KVC_SUCCESS;
        case DurabilityRequirement::KIND_OBSERVE:
            out.persist_to = req.persist_to();
            out.replicate_to = req.replicate_to();
            break;
        case DurabilityRequirement::KIND_LEVEL:
            switch (req.level()) {
                case DURABILITY_LEVEL_MAJORITY:
                    out.replicate_to = majority - 1;
                    break;
                case DURABILITY_LEVEL_MAJORITY_AND_PERSIST_TO_ACTIVE:
                    out.replicate_to = majority - 1;
                    out.persist_master = true;
                    break;
                case DURABILITY_LEVEL_PERSIST_TO_MAJORITY:
                    out.persist_to = majority;
                    break;
                default:
                    return KVC_ERR_INVALID_ARGUMENT;
            }
            break;
    }

    if (out.persist_to > total || out.replicate_to > nreplicas) {
        return KVC_ERR_DURABILITY_IMPOSSIBLE;
    }
    return KVC_SUCCESS;
}

bool kvc::durability_needs_poll(const Settings *settings, const DurabilityRequirement &req)
{
    switch (req.kind()) {
        case DurabilityRequirement::KIND_OBSERVE:
            return true;
        case DurabilityRequirement::KIND_LEVEL:
            return !settings->enable_sync_durability;
        default:
            return false;
    }
}

DurabilityPoll::DurabilityPoll(Instance *instance, const std::vector<DurabilityItem> &items, uint32_t collection_id,
                               const DurabilityRequirement &requirement, hrtime_t deadline, Completion completion)
    : Operation(instance), collection_id_(collection_id), requirement_(requirement), deadline_(deadline),
      completion_(completion), nremaining_(0), round_(0), finished_(false),
      interval_(instance->iotable(), instance->clock(), deadline, instance->settings()->durability_interval,
                instance->settings()->durability_interval),
      deadline_timer_(instance->iotable(), this)
{
    for (size_t ii = 0; ii < items.size(); ++ii) {
        DurabilityEntry ent;
        ent.key = items[ii].key;
        ent.cas = items[ii].cas;
        ent.is_delete = items[ii].is_delete;
        entries_.push_back(ent);
    }
}

DurabilityPoll::~DurabilityPoll()
{
    deadline_timer_.cancel();
    interval_.cancel();
}

kvc_STATUS DurabilityPoll::rc() const
{
    for (size_t ii = 0; ii < entries_.size(); ++ii) {
        if (entries_[ii].rc != KVC_SUCCESS) {
            return entries_[ii].rc;
        }
    }
    return KVC_SUCCESS;
}

kvc_STATUS DurabilityPoll::start(bool should_track, OperationHandle *handle)
{
    if (entries_.empty() || requirement_.is_none()) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    for (size_t ii = 0; ii < entries_.size(); ++ii) {
        if (entries_[ii].key.empty()) {
            return KVC_ERR_EMPTY_KEY;
        }
    }

    std::shared_ptr<const Topology> topo = instance_->router()->snapshot();
    if (!topo) {
        return KVC_ERR_TOPOLOGY_NOT_READY;
    }
    kvc_STATUS rc = durability_thresholds(requirement_, topo->num_replicas(), thresholds_);
    if (rc != KVC_SUCCESS) {
        return rc;
    }

    if (should_track) {
        track(handle);
    }
    nremaining_ = static_cast<unsigned>(entries_.size());
    hrtime_t now = instance_->clock()->now();
    deadline_timer_.rearm(now >= deadline_ ? 0 : static_cast<uint32_t>(KVC_NS2US(deadline_ - now)));
    kvc_log(LOGARGS(this, DEBUG), LOGFMT "Polling %lu keys. PersistTo=%u, ReplicateTo=%u, PersistMaster=%d",
            LOGID(this), (unsigned long)entries_.size(), thresholds_.persist_to, thresholds_.replicate_to,
            thresholds_.persist_master);
    poll();
    return KVC_SUCCESS;
}

/** One round: a single OBSERVE per node holding a copy of a pending entry */
void DurabilityPoll::poll()
{
    round_++;
    std::shared_ptr<const Topology> topo = instance_->router()->snapshot();
    std::map<int, mc::Command> commands;
    primaries_.assign(entries_.size(), Topology::NO_NODE);
    if (!topo) {
        round_done();
        return;
    }

    for (size_t ii = 0; ii < entries_.size(); ++ii) {
        DurabilityEntry &ent = entries_[ii];
        if (ent.done) {
            continue;
        }
        ent.info = DurabilityInfo();
        ent.info.polled = true;

        uint16_t vbid = vbucket_for_key(ent.key, topo->num_partitions());
        primaries_[ii] = topo->vbserver(vbid, 0);
        for (unsigned ix = 0; ix <= topo->num_replicas(); ++ix) {
            int node = topo->vbserver(vbid, ix);
            if (node == Topology::NO_NODE) {
                continue;
            }
            mc::Command &cmd = commands[node];
            cmd.type = mc::OP_OBSERVE;
            cmd.collection_id = collection_id_;
            cmd.observe.push_back(mc::ObserveKey(ent.key, vbid));
        }
    }

    hrtime_t now = instance_->clock()->now();
    uint32_t timeout = now >= deadline_ ? 1 : static_cast<uint32_t>(KVC_NS2US(deadline_ - now));
    std::shared_ptr<RetryStrategy> failfast(new FailFastRetryStrategy());

    for (std::map<int, mc::Command>::iterator it = commands.begin(); it != commands.end(); ++it) {
        Request *req = new Request(instance_, it->second, timeout ? timeout : 1, failfast,
                                   std::bind(&DurabilityPoll::handle_observe, this, std::placeholders::_1,
                                             std::placeholders::_2));
        req->set_target_node(it->first);
        req->set_internal(true);
        kvc_STATUS rc = req->start();
        if (rc != KVC_SUCCESS) {
            kvc_log(LOGARGS(this, WARN), LOGFMT "Cannot schedule observe for node %d: %s", LOGID(this), it->first,
                    kvc_strerror_short(rc));
            delete req;
            continue;
        }
        outstanding_.insert(req);
    }

    kvc_log(LOGARGS(this, TRACE), LOGFMT "Round %u: %lu requests, %u keys pending", LOGID(this), round_,
            (unsigned long)outstanding_.size(), nremaining_);
    if (outstanding_.empty()) {
        round_done();
    }
}

void DurabilityPoll::update_entry(DurabilityEntry &ent, bool is_primary, const mc::ObserveEntry &obs)
{
    bool found = obs.status == mc::OBSERVE_FOUND_PERSISTED || obs.status == mc::OBSERVE_FOUND_NOT_PERSISTED;
    DurabilityInfo &info = ent.info;

    if (is_primary) {
        if (ent.is_delete ? found : (!found || obs.cas != ent.cas)) {
            kvc_log(LOGARGS(this, WARN), LOGFMT "Document %s changed on the active node (status=0x%x)", LOGID(this),
                    ent.key.c_str(), obs.status);
            entry_done(ent, KVC_ERR_DURABILITY_CONFLICT);
            return;
        }
        info.exists_master = found;
        if (obs.status == mc::OBSERVE_FOUND_PERSISTED || obs.status == mc::OBSERVE_PERSISTED_DELETED) {
            info.npersisted++;
            info.persisted_master = true;
        }
        return;
    }

    // Cas only grows. A replica ahead of the mutation has seen a newer one
    if (obs.cas > ent.cas) {
        kvc_log(LOGARGS(this, WARN), LOGFMT "Document %s changed on a replica (status=0x%x)", LOGID(this),
                ent.key.c_str(), obs.status);
        entry_done(ent, KVC_ERR_DURABILITY_CONFLICT);
        return;
    }

    if (ent.is_delete) {
        if (obs.status == mc::OBSERVE_NOT_FOUND || obs.status == mc::OBSERVE_PERSISTED_DELETED) {
            info.nreplicated++;
        }
        if (obs.status == mc::OBSERVE_PERSISTED_DELETED) {
            info.npersisted++;
        }
    } else if (found && obs.cas == ent.cas) {
        info.nreplicated++;
        if (obs.status == mc::OBSERVE_FOUND_PERSISTED) {
            info.npersisted++;
        }
    }
}

bool DurabilityPoll::satisfied(const DurabilityEntry &ent) const
{
    if (ent.info.npersisted < thresholds_.persist_to || ent.info.nreplicated < thresholds_.replicate_to) {
        return false;
    }
    return !thresholds_.persist_master || ent.info.persisted_master;
}

void DurabilityPoll::entry_done(DurabilityEntry &ent, kvc_STATUS rc)
{
    ent.done = true;
    ent.rc = rc;
    nremaining_--;
}

void DurabilityPoll::handle_observe(Request &req, const mc::Response &resp)
{
    outstanding_.erase(&req);
    if (finished_) {
        return;
    }

    if (resp.rc == KVC_SUCCESS) {
        int node = req.target_node();
        for (size_t ii = 0; ii < resp.observe.size(); ++ii) {
            const mc::ObserveEntry &obs = resp.observe[ii];
            for (size_t jj = 0; jj < entries_.size(); ++jj) {
                DurabilityEntry &ent = entries_[jj];
                if (ent.done || ent.key != obs.key) {
                    continue;
                }
                update_entry(ent, primaries_[jj] == node, obs);
                if (!ent.done && satisfied(ent)) {
                    entry_done(ent, KVC_SUCCESS);
                }
            }
        }
    } else {
        kvc_log(LOGARGS(this, DEBUG), LOGFMT "Observe on %s failed: %s", LOGID(this), req.context().endpoint.c_str(),
                kvc_strerror_short(resp.rc));
    }

    if (nremaining_ == 0) {
        finish(KVC_SUCCESS, true);
    } else if (outstanding_.empty()) {
        round_done();
    }
}

void DurabilityPoll::round_done()
{
    if (finished_) {
        return;
    }
    if (nremaining_ == 0) {
        finish(KVC_SUCCESS, true);
        return;
    }
    if (!interval_.schedule(std::bind(&DurabilityPoll::poll, this))) {
        finish(KVC_ERR_DURABILITY_TIMEOUT, true);
    }
}

void DurabilityPoll::on_deadline()
{
    kvc_log(LOGARGS(this, INFO), LOGFMT "Deadline reached after %u rounds. %u keys not durable", LOGID(this), round_,
            nremaining_);
    finish(KVC_ERR_DURABILITY_TIMEOUT, true);
}

void DurabilityPoll::cancel()
{
    finish(KVC_ERR_REQUEST_CANCELED, true);
}

void DurabilityPoll::abort()
{
    finish(KVC_ERR_REQUEST_CANCELED, false);
}

void DurabilityPoll::finish(kvc_STATUS pending_rc, bool notify)
{
    if (finished_) {
        return;
    }
    finished_ = true;
    deadline_timer_.cancel();
    interval_.cancel();

    for (size_t ii = 0; ii < entries_.size(); ++ii) {
        if (!entries_[ii].done) {
            entries_[ii].done = true;
            entries_[ii].rc = pending_rc;
        }
    }

    std::set<Request *> reqs;
    reqs.swap(outstanding_);
    for (std::set<Request *>::iterator it = reqs.begin(); it != reqs.end(); ++it) {
        (*it)->cancel();
    }

    untrack();
    if (notify && completion_) {
        completion_(*this);
    }
    delete this;
}

kvc_STATUS Instance::durability_poll(const CmdDurabilityPoll &cmd, DurabilityCallback callback,
                                     OperationHandle *handle)
{
    if (cmd.durability.is_none()) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    uint32_t timeout = effective_timeout(settings_, cmd.timeout, cmd.durability);
    hrtime_t deadline = clock_->now() + KVC_US2NS(timeout);

    DurabilityPoll *poll = new DurabilityPoll(this, cmd.items, cmd.collection_id, cmd.durability, deadline,
                                              [callback](DurabilityPoll &p) {
                                                  RespDurability resp;
                                                  resp.ctx.rc = p.rc();
                                                  for (size_t ii = 0; ii < p.entries().size(); ++ii) {
                                                      const DurabilityEntry &ent = p.entries()[ii];
                                                      RespDurabilityEntry out;
                                                      out.key = ent.key;
                                                      out.rc = ent.rc;
                                                      out.cas = ent.cas;
                                                      out.info = ent.info;
                                                      resp.entries.push_back(out);
                                                  }
                                                  callback(resp);
                                              });
    kvc_STATUS rc = poll->start(true, handle);
    if (rc != KVC_SUCCESS) {
        delete poll;
    }
    return rc;
}
