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
#include <algorithm>
#include <map>
#include <set>

#define LOGARGS(op, lvl) (op)->instance()->settings(), "batch", KVC_LOG_##lvl, __FILE__, __LINE__
#define LOGFMT "(BATCH=%p) "
#define LOGID(op) (void *)(op)

namespace kvc {

/**
 * Probe many keys at once with a single OBSERVE per active node. Keys are
 * bucketed against one topology snapshot; while no snapshot is available,
 * or a partition has no active node, the whole batch is deferred and
 * bucketed again.
 *
 * When fetching, each found key is then read with its own GET once all
 * nodes have answered.
 */
class BatchExists : public Operation {
  public:
    BatchExists(Instance *instance, const CmdBatchExists &cmd, hrtime_t deadline, BatchExistsCallback callback,
                BatchGetCallback fetch_callback = BatchGetCallback())
        : Operation(instance), keys_(cmd.keys), collection_id_(cmd.collection_id), deadline_(deadline),
          callback_(callback), fetch_callback_(fetch_callback), finished_(false),
          defer_(instance->iotable(), instance->clock(), deadline, instance->settings()->batch_defer_delay,
                 instance->settings()->batch_defer_delay),
          start_timer_(instance->iotable(), this), deadline_timer_(instance->iotable(), this)
    {
    }

    ~BatchExists() {
        start_timer_.cancel();
        deadline_timer_.cancel();
        defer_.cancel();
    }

    kvc_STATUS start(OperationHandle *handle) {
        if (keys_.empty()) {
            return KVC_ERR_INVALID_ARGUMENT;
        }
        for (size_t ii = 0; ii < keys_.size(); ++ii) {
            if (keys_[ii].empty()) {
                return KVC_ERR_EMPTY_KEY;
            }
        }
        track(handle);
        deadline_timer_.rearm(remaining());
        start_timer_.signal();
        return KVC_SUCCESS;
    }

    void cancel() {
        finish(KVC_ERR_REQUEST_CANCELED);
    }

  private:
    uint32_t remaining() const {
        hrtime_t now = instance_->clock()->now();
        return now >= deadline_ ? 0 : static_cast<uint32_t>(KVC_NS2US(deadline_ - now));
    }

    void run() {
        if (finished_) {
            return;
        }
        std::map<int, std::vector<RoutedKey> > groups;
        std::shared_ptr<const Topology> topo;
        kvc_STATUS rc = instance_->router()->bucket_by_node(keys_, 0, groups, &topo);
        if (rc != KVC_SUCCESS || groups.count(Topology::NO_NODE)) {
            kvc_log(LOGARGS(this, DEBUG), LOGFMT "Topology not ready for %lu keys. Deferring", LOGID(this),
                    (unsigned long)keys_.size());
            ctx_.last_retry_reason = RETRY_REASON_TOPOLOGY_NOT_READY;
            ctx_.retry_attempts = defer_.attempts();
            if (!defer_.schedule(std::bind(&BatchExists::run, this))) {
                finish(KVC_ERR_TIMEOUT);
            }
            return;
        }

        for (std::map<int, std::vector<RoutedKey> >::iterator it = groups.begin(); it != groups.end(); ++it) {
            mc::Command cmd;
            cmd.type = mc::OP_OBSERVE;
            cmd.collection_id = collection_id_;
            for (size_t ii = 0; ii < it->second.size(); ++ii) {
                cmd.observe.push_back(mc::ObserveKey(it->second[ii].key, it->second[ii].vbid));
            }

            uint32_t timeout = remaining();
            Request *req = new Request(instance_, cmd, timeout ? timeout : 1, std::shared_ptr<RetryStrategy>(),
                                       std::bind(&BatchExists::handle_observe, this, std::placeholders::_1,
                                                 std::placeholders::_2));
            req->set_target_node(it->first);
            req->set_internal(true);
            rc = req->start();
            if (rc != KVC_SUCCESS) {
                delete req;
                finish(rc);
                return;
            }
            outstanding_.insert(req);
        }
        kvc_log(LOGARGS(this, TRACE), LOGFMT "Sent %lu keys to %lu nodes", LOGID(this), (unsigned long)keys_.size(),
                (unsigned long)outstanding_.size());
    }

    void handle_observe(Request &req, const mc::Response &resp) {
        outstanding_.erase(&req);
        if (finished_) {
            return;
        }
        if (resp.rc != KVC_SUCCESS) {
            ctx_ = req.context();
            finish(resp.rc);
            return;
        }
        for (size_t ii = 0; ii < resp.observe.size(); ++ii) {
            const mc::ObserveEntry &obs = resp.observe[ii];
            if (obs.status == mc::OBSERVE_FOUND_PERSISTED || obs.status == mc::OBSERVE_FOUND_NOT_PERSISTED) {
                found_.insert(obs.key);
            }
        }
        if (outstanding_.empty()) {
            if (fetch_callback_ && !found_.empty()) {
                fetch();
            } else {
                finish(KVC_SUCCESS);
            }
        }
    }

    void fetch() {
        kvc_log(LOGARGS(this, TRACE), LOGFMT "Fetching %lu of %lu keys", LOGID(this), (unsigned long)found_.size(),
                (unsigned long)keys_.size());
        for (std::set<std::string>::const_iterator it = found_.begin(); it != found_.end(); ++it) {
            mc::Command cmd;
            cmd.type = mc::OP_GET;
            cmd.key = *it;
            cmd.collection_id = collection_id_;

            uint32_t timeout = remaining();
            Request *req = new Request(instance_, cmd, timeout ? timeout : 1, std::shared_ptr<RetryStrategy>(),
                                       std::bind(&BatchExists::handle_get, this, *it, std::placeholders::_1,
                                                 std::placeholders::_2));
            req->set_internal(true);
            kvc_STATUS rc = req->start();
            if (rc != KVC_SUCCESS) {
                delete req;
                finish(rc);
                return;
            }
            outstanding_.insert(req);
        }
    }

    void handle_get(const std::string &key, Request &req, const mc::Response &resp) {
        outstanding_.erase(&req);
        if (finished_) {
            return;
        }
        if (resp.rc == KVC_SUCCESS) {
            BatchDocument &doc = fetched_[key];
            doc.key = key;
            doc.cas = resp.cas;
            doc.flags = resp.flags;
            doc.datatype = resp.datatype;
            doc.value = resp.body;
        } else if (resp.rc != KVC_ERR_DOCUMENT_NOT_FOUND) {
            ctx_ = req.context();
            finish(resp.rc);
            return;
        }
        if (outstanding_.empty()) {
            finish(KVC_SUCCESS);
        }
    }

    void on_deadline() {
        finish(KVC_ERR_TIMEOUT);
    }

    void finish(kvc_STATUS rc) {
        if (finished_) {
            return;
        }
        finished_ = true;
        start_timer_.cancel();
        deadline_timer_.cancel();
        defer_.cancel();

        std::set<Request *> reqs;
        reqs.swap(outstanding_);
        for (std::set<Request *>::iterator it = reqs.begin(); it != reqs.end(); ++it) {
            (*it)->cancel();
        }

        untrack();
        if (fetch_callback_) {
            RespBatchGet resp;
            resp.ctx = ctx_;
            resp.ctx.rc = rc;
            if (rc == KVC_SUCCESS) {
                for (std::map<std::string, BatchDocument>::const_iterator it = fetched_.begin(); it != fetched_.end();
                     ++it) {
                    resp.documents.push_back(it->second);
                }
            }
            fetch_callback_(resp);
        } else {
            RespBatchExists resp;
            resp.ctx = ctx_;
            resp.ctx.rc = rc;
            if (rc == KVC_SUCCESS) {
                resp.found.assign(found_.begin(), found_.end());
            }
            callback_(resp);
        }
        delete this;
    }

    std::vector<std::string> keys_;
    uint32_t collection_id_;
    hrtime_t deadline_;
    BatchExistsCallback callback_;
    BatchGetCallback fetch_callback_;
    KeyValueErrorContext ctx_;
    std::set<std::string> found_;
    std::map<std::string, BatchDocument> fetched_;
    std::set<Request *> outstanding_;
    bool finished_;
    BoundedRetry defer_;
    io::Timer<BatchExists, &BatchExists::run> start_timer_;
    io::Timer<BatchExists, &BatchExists::on_deadline> deadline_timer_;
};

} // namespace kvc

using namespace kvc;

kvc_STATUS Instance::batch_exists(const CmdBatchExists &cmd, BatchExistsCallback callback, OperationHandle *handle)
{
    uint32_t timeout = cmd.timeout ? cmd.timeout : settings_->operation_timeout;
    BatchExists *op = new BatchExists(this, cmd, clock_->now() + KVC_US2NS(timeout), callback);
    kvc_STATUS rc = op->start(handle);
    if (rc != KVC_SUCCESS) {
        delete op;
    }
    return rc;
}

kvc_STATUS Instance::batch_get_if_exists(const CmdBatchExists &cmd, BatchGetCallback callback,
                                         OperationHandle *handle)
{
    uint32_t timeout = cmd.timeout ? cmd.timeout : settings_->operation_timeout;
    BatchExists *op =
        new BatchExists(this, cmd, clock_->now() + KVC_US2NS(timeout), BatchExistsCallback(), callback);
    kvc_STATUS rc = op->start(handle);
    if (rc != KVC_SUCCESS) {
        delete op;
    }
    return rc;
}
