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

#ifndef KVC_REQUEST_H
#define KVC_REQUEST_H

#include "internal.h"

namespace kvc {

class DurabilityPoll;

/**
 * @brief One key/value command on its way through the cluster
 *
 * A request is routed, obtains an endpoint from the pool, is written, and
 * either completes with the decoded response or is retried as its retry
 * strategy decides. Mutations with an observe based durability requirement
 * additionally go through a DurabilityPoll before completing.
 *
 * The completion is invoked exactly once, after which the request deletes
 * itself. A request never invokes its completion from within start().
 */
class Request : public mc::PendingOp, public Operation {
  public:
    enum State {
        CREATED,
        DISPATCHED,
        RETRYING,
        OBSERVING,
        COMPLETED,
        TIMED_OUT,
        CANCELLED
    };

    typedef std::function<void(Request &, const mc::Response &)> Completion;

    /**
     * @param timeout in microseconds. 0 picks the instance default for the
     *  command and its durability requirement
     * @param strategy NULL uses the instance's default strategy
     */
    Request(Instance *instance, const mc::Command &cmd, uint32_t timeout,
            const std::shared_ptr<RetryStrategy> &strategy, Completion completion);
    ~Request();

    /** Send to a specific node instead of routing by key */
    void set_target_node(int ix) {
        target_node_ = ix;
    }
    int target_node() const {
        return target_node_;
    }

    /** Must be called before start() */
    void set_durability(const DurabilityRequirement &durability) {
        durability_ = durability;
    }

    /** Internal requests are not visible to Instance::wait() or cancel() */
    void set_internal(bool internal) {
        internal_ = internal;
    }

    /**
     * Validate and schedule. On failure the request was not scheduled and
     * must be deleted by the caller.
     */
    kvc_STATUS start(OperationHandle *handle = NULL);

    void cancel();

    State state() const {
        return state_;
    }
    const mc::Command &command() const {
        return cmd_;
    }
    const KeyValueErrorContext &context() const {
        return ctx_;
    }
    uint16_t vbid() const {
        return vbid_;
    }
    const DurabilityInfo &durability_info() const {
        return durability_info_;
    }

    /** Fill the fields common to all responses */
    void fill(const mc::Response &resp, RespBase &out) const;
    MutationToken token(const mc::Response &resp) const;

    static const char *state_name(State state);

    // mc::PendingOp
    void handle_response(mc::Server *server, const mc::Frame &frame);
    void handle_failure(mc::Server *server, kvc_STATUS err);

  private:
    void dispatch();
    void send(mc::Server *server);
    static void on_pool_ready(io::Endpoint *endpoint, kvc_STATUS err, void *arg);
    void retry(RetryReason reason, kvc_STATUS rc);
    void on_deadline();
    void start_durability();
    void durability_done(DurabilityPoll &poll);
    void finish(State state, kvc_STATUS rc);
    uint32_t remaining() const;

    mc::Command cmd_;
    uint32_t timeout_;
    std::shared_ptr<RetryStrategy> strategy_;
    Completion completion_;
    DurabilityRequirement durability_;
    DurabilityInfo durability_info_;
    mc::Response response_;
    KeyValueErrorContext ctx_;

    State state_;
    hrtime_t deadline_;
    int target_node_;
    uint16_t vbid_;
    unsigned attempts_;
    bool internal_;
    bool completed_;

    io::PoolRequest *pool_request_;
    mc::Server *server_;
    uint32_t opaque_;
    DurabilityPoll *poll_;

    io::Timer<Request, &Request::on_deadline> deadline_timer_;
    io::Timer<Request, &Request::dispatch> dispatch_timer_;
};

} // namespace kvc

#endif
