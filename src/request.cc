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

#include "request.h"
#include "operations/durability_internal.h"

#define LOGARGS(req, lvl) (req)->instance()->settings(), "request", KVC_LOG_##lvl, __FILE__, __LINE__
#define LOGFMT "(REQ=%p, KEY=%.*s) "
#define LOGID(req) (void *)(req), (int)(req)->command().key.size(), (req)->command().key.c_str()

using namespace kvc;

Request::Request(Instance *instance, const mc::Command &cmd, uint32_t timeout,
                 const std::shared_ptr<RetryStrategy> &strategy, Completion completion)
    : Operation(instance), cmd_(cmd), timeout_(timeout), strategy_(strategy), completion_(completion),
      state_(CREATED), deadline_(0), target_node_(Topology::NO_NODE), vbid_(0), attempts_(0), internal_(false),
      completed_(false), pool_request_(NULL), server_(NULL), opaque_(0), poll_(NULL),
      deadline_timer_(instance->iotable(), this), dispatch_timer_(instance->iotable(), this)
{
    if (!strategy_) {
        strategy_ = instance->default_retry_strategy();
    }
    ctx_.key = cmd.key;
    ctx_.collection_id = cmd.collection_id;
}

Request::~Request()
{
    deadline_timer_.cancel();
    dispatch_timer_.cancel();
}

const char *Request::state_name(State state)
{
    switch (state) {
        case CREATED:
            return "created";
        case DISPATCHED:
            return "dispatched";
        case RETRYING:
            return "retrying";
        case OBSERVING:
            return "observing";
        case COMPLETED:
            return "completed";
        case TIMED_OUT:
            return "timed_out";
        case CANCELLED:
            return "cancelled";
    }
    return "unknown";
}

uint32_t Request::remaining() const
{
    hrtime_t now = instance_->clock()->now();
    if (now >= deadline_) {
        return 0;
    }
    hrtime_t left = KVC_NS2US(deadline_ - now);
    return left > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(left);
}

kvc_STATUS Request::start(OperationHandle *handle)
{
    const Settings *settings = instance_->settings();
    kvc_STATUS rc = mc::validate_command(cmd_);
    if (rc != KVC_SUCCESS) {
        return rc;
    }

    if (!durability_.is_none()) {
        if (!cmd_.is_mutation()) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
        if (durability_needs_poll(settings, durability_)) {
            // Fail early when the requirement cannot possibly be met. The
            // check is repeated against the topology current at poll time
            std::shared_ptr<const Topology> topo = instance_->router()->snapshot();
            DurabilityThresholds thresholds;
            if (topo && (rc = durability_thresholds(durability_, topo->num_replicas(), thresholds)) != KVC_SUCCESS) {
                return rc;
            }
        }
    }

    timeout_ = effective_timeout(settings, timeout_, durability_);
    if (durability_.kind() == DurabilityRequirement::KIND_LEVEL && settings->enable_sync_durability) {
        uint32_t ms = timeout_ / 1000;
        cmd_.sync_level = durability_.level();
        cmd_.sync_timeout = static_cast<uint16_t>(ms > 0xffff ? 0xffff : ms);
    }

    deadline_ = instance_->clock()->now() + KVC_US2NS(timeout_);
    deadline_timer_.rearm(timeout_);
    if (!internal_) {
        track(handle);
    }
    kvc_log(LOGARGS(this, TRACE), LOGFMT "Scheduled. Timeout=%uus", LOGID(this), timeout_);
    dispatch_timer_.signal();
    return KVC_SUCCESS;
}

void Request::dispatch()
{
    if (completed_) {
        return;
    }

    std::shared_ptr<const Topology> topo;
    int node = Topology::NO_NODE;
    if (target_node_ != Topology::NO_NODE) {
        topo = instance_->router()->snapshot();
        if (topo && static_cast<size_t>(target_node_) < topo->num_nodes()) {
            node = target_node_;
        }
    } else {
        RouteResult route;
        if (instance_->router()->route(cmd_.key, route) == KVC_SUCCESS) {
            topo = route.snapshot;
            node = route.primary;
            vbid_ = route.vbid;
        }
    }
    if (node == Topology::NO_NODE) {
        retry(RETRY_REASON_TOPOLOGY_NOT_READY, KVC_ERR_TOPOLOGY_NOT_READY);
        return;
    }

    ctx_.endpoint = topo->node(node).endpoint(SERVICE_KV);
    pool_request_ = instance_->pool()->get(ctx_.endpoint, SERVICE_KV, remaining(), on_pool_ready, this);
    if (pool_request_ == NULL) {
        kvc_log(LOGARGS(this, ERROR), LOGFMT "Invalid endpoint address %s", LOGID(this), ctx_.endpoint.c_str());
        finish(COMPLETED, KVC_ERR_INVALID_ARGUMENT);
    }
}

void Request::on_pool_ready(io::Endpoint *endpoint, kvc_STATUS err, void *arg)
{
    Request *req = reinterpret_cast<Request *>(arg);
    req->pool_request_ = NULL;
    if (err == KVC_ERR_TIMEOUT) {
        req->finish(TIMED_OUT, KVC_ERR_TIMEOUT);
    } else if (err != KVC_SUCCESS) {
        req->retry(RETRY_REASON_ENDPOINT_NOT_AVAILABLE, KVC_ERR_CONNECT);
    } else {
        req->send(static_cast<mc::Server *>(endpoint));
    }
}

void Request::send(mc::Server *server)
{
    mc::Frame frame;
    kvc_STATUS rc = mc::encode_request(cmd_, vbid_, instance_->settings()->use_collections, frame);
    uint32_t opaque = 0;
    if (rc == KVC_SUCCESS) {
        opaque = server->send(frame, this);
    }
    instance_->pool()->put(server);

    if (rc != KVC_SUCCESS || opaque == 0) {
        finish(COMPLETED, rc != KVC_SUCCESS ? rc : KVC_ERR_INVALID_ARGUMENT);
        return;
    }
    server_ = server;
    opaque_ = opaque;
    ctx_.opaque = opaque;
    state_ = DISPATCHED;
}

void Request::handle_response(mc::Server *, const mc::Frame &frame)
{
    server_ = NULL;
    opaque_ = 0;
    ctx_.status_code = frame.status();

    switch (frame.status()) {
        case mc::STATUS_NOT_MY_VBUCKET:
            retry(RETRY_REASON_NOT_MY_VBUCKET, KVC_ERR_NOT_MY_VBUCKET);
            return;
        case mc::STATUS_ETMPFAIL:
        case mc::STATUS_EBUSY:
        case mc::STATUS_ENOMEM:
            retry(RETRY_REASON_KV_TEMPORARY_FAILURE, KVC_ERR_TEMPORARY_FAILURE);
            return;
        case mc::STATUS_SYNC_WRITE_IN_PROGRESS:
            retry(RETRY_REASON_KV_SYNC_WRITE_IN_PROGRESS, KVC_ERR_SYNC_WRITE_IN_PROGRESS);
            return;
        default:
            break;
    }

    response_ = mc::Response();
    mc::decode_response(cmd_, frame, instance_->settings()->use_collections, response_);
    ctx_.cas = response_.cas;
    if (response_.rc == KVC_ERR_PROTOCOL) {
        kvc_log(LOGARGS(this, ERROR), LOGFMT "Malformed response (OP=0x%x, RC=0x%x)", LOGID(this), frame.opcode,
                frame.status());
    }

    if (response_.rc == KVC_SUCCESS && durability_needs_poll(instance_->settings(), durability_)) {
        start_durability();
        return;
    }
    finish(COMPLETED, response_.rc);
}

void Request::handle_failure(mc::Server *, kvc_STATUS err)
{
    server_ = NULL;
    opaque_ = 0;
    if (err == KVC_ERR_PROTOCOL) {
        finish(COMPLETED, err);
        return;
    }
    retry(RETRY_REASON_SOCKET_CLOSED_WHILE_IN_FLIGHT, err);
}

void Request::retry(RetryReason reason, kvc_STATUS rc)
{
    RetryContext rctx;
    rctx.attempts = attempts_;
    rctx.idempotent = cmd_.is_idempotent();

    ctx_.last_retry_reason = reason;
    RetryAction action = strategy_->should_retry(rctx, reason);
    if (!action.retry) {
        if (reason == RETRY_REASON_SOCKET_CLOSED_WHILE_IN_FLIGHT && !rctx.idempotent) {
            // The server may or may not have applied the write
            rc = KVC_ERR_NETWORK_AMBIGUOUS;
        }
        kvc_log(LOGARGS(this, DEBUG), LOGFMT "Not retrying (%s). Attempts=%u", LOGID(this),
                retry_reason_name(reason), attempts_);
        finish(COMPLETED, rc);
        return;
    }

    attempts_++;
    ctx_.retry_attempts = attempts_;
    state_ = RETRYING;
    kvc_log(LOGARGS(this, DEBUG), LOGFMT "Retrying in %uus (%s). Attempt=%u", LOGID(this), action.delay,
            retry_reason_name(reason), attempts_);
    dispatch_timer_.rearm(action.delay);
}

void Request::on_deadline()
{
    kvc_STATUS rc = KVC_ERR_TIMEOUT;
    if (server_ && cmd_.is_mutation()) {
        // The write is on the wire; whether it was applied is unknown
        rc = KVC_ERR_AMBIGUOUS_TIMEOUT;
    }
    kvc_log(LOGARGS(this, INFO), LOGFMT "Timed out in state %s: %s", LOGID(this), state_name(state_),
            kvc_strerror_short(rc));
    finish(TIMED_OUT, rc);
}

void Request::start_durability()
{
    state_ = OBSERVING;
    deadline_timer_.cancel();

    std::vector<DurabilityItem> items;
    items.push_back(DurabilityItem(cmd_.key, response_.cas, cmd_.type == mc::OP_REMOVE));
    poll_ = new DurabilityPoll(instance_, items, cmd_.collection_id, durability_, deadline_,
                               std::bind(&Request::durability_done, this, std::placeholders::_1));
    kvc_STATUS rc = poll_->start(false);
    if (rc != KVC_SUCCESS) {
        delete poll_;
        poll_ = NULL;
        finish(COMPLETED, rc);
    }
}

void Request::durability_done(DurabilityPoll &poll)
{
    poll_ = NULL;
    const DurabilityEntry &ent = poll.entries().front();
    durability_info_ = ent.info;
    finish(ent.rc == KVC_ERR_DURABILITY_TIMEOUT ? TIMED_OUT : COMPLETED, ent.rc);
}

void Request::cancel()
{
    if (completed_) {
        return;
    }
    if (poll_) {
        poll_->abort();
        poll_ = NULL;
    }
    finish(CANCELLED, KVC_ERR_REQUEST_CANCELED);
}

void Request::finish(State state, kvc_STATUS rc)
{
    if (completed_) {
        return;
    }
    completed_ = true;
    state_ = state;
    deadline_timer_.cancel();
    dispatch_timer_.cancel();
    if (pool_request_) {
        instance_->pool()->cancel(pool_request_);
        pool_request_ = NULL;
    }
    if (server_) {
        server_->cancel(opaque_);
        server_ = NULL;
    }

    response_.rc = rc;
    ctx_.rc = rc;
    if (rc != KVC_SUCCESS) {
        kvc_log(LOGARGS(this, DEBUG), LOGFMT "Completed with %s (endpoint=%s, attempts=%u)", LOGID(this),
                kvc_strerror_short(rc), ctx_.endpoint.c_str(), attempts_);
    }
    untrack();
    completion_(*this, response_);
    delete this;
}

void Request::fill(const mc::Response &resp, RespBase &out) const
{
    out.ctx = ctx_;
    out.cas = resp.cas;
}

MutationToken Request::token(const mc::Response &resp) const
{
    MutationToken token;
    if (resp.has_token) {
        token.partition_id = vbid_;
        token.partition_uuid = resp.vbuuid;
        token.sequence_number = resp.seqno;
    }
    return token;
}
