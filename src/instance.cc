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

#define LOGARGS(instance, lvl) (instance)->settings(), "instance", KVC_LOG_##lvl, __FILE__, __LINE__

using namespace kvc;

Instance::Instance()
    : settings_(NULL), iotable_(NULL), router_(NULL), pool_(NULL), clock_(NULL), next_handle_(1), waiting_(false)
{
}

kvc_STATUS Instance::create(Instance **instance, const CreateOptions &options)
{
    if (instance == NULL) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    *instance = NULL;

    Instance *obj = new Instance();
    obj->settings_ = new Settings();
    obj->settings_->bucket = options.bucket;
    if (options.logger) {
        obj->settings_->logger = options.logger;
    }

    obj->iotable_ = new io::Table(options.evbase, options.transport_factory);
    if (obj->iotable_->base() == NULL) {
        delete obj;
        return KVC_ERR_GENERIC;
    }
    obj->router_ = new Router();
    obj->pool_ = new io::Pool(obj->settings_, obj->iotable_);
    obj->pool_->set_endpoint_factory(SERVICE_KV, mc::Server::create);
    obj->retry_strategy_.reset(new BestEffortRetryStrategy(obj->settings_->retry_backoff_max));
    obj->clock_ = SystemClock::instance();

    kvc_log(LOGARGS(obj, INFO), "Instance created. Bucket=%s", options.bucket.empty() ? "<none>" : options.bucket.c_str());
    *instance = obj;
    return KVC_SUCCESS;
}

Instance::~Instance()
{
    while (!operations_.empty()) {
        Operation *op = operations_.begin()->second;
        op->cancel();
    }
    delete pool_;
    delete router_;
    delete iotable_;
    delete settings_;
}

kvc_STATUS Instance::cntl(const std::string &name, const std::string &value)
{
    kvc_STATUS rc = settings_->set(name, value);
    if (rc != KVC_SUCCESS) {
        kvc_log(LOGARGS(this, WARN), "Cannot set %s to \"%s\": %s", name.c_str(), value.c_str(),
                kvc_strerror_short(rc));
        return rc;
    }
    if (name == "retry_backoff_max") {
        retry_strategy_.reset(new BestEffortRetryStrategy(settings_->retry_backoff_max));
    }
    return KVC_SUCCESS;
}

bool Instance::update_topology(const std::shared_ptr<const Topology> &topology)
{
    if (!topology) {
        return false;
    }
    std::shared_ptr<const Topology> old = router_->snapshot();
    if (!router_->update(topology)) {
        kvc_log(LOGARGS(this, DEBUG), "Ignoring topology with revision %llu",
                (unsigned long long)topology->revision());
        return false;
    }
    kvc_log(LOGARGS(this, INFO), "Applied topology revision %llu (%lu nodes, %u partitions, %u replicas)",
            (unsigned long long)topology->revision(), (unsigned long)topology->num_nodes(),
            topology->num_partitions(), topology->num_replicas());

    if (old) {
        for (size_t ii = 0; ii < old->num_nodes(); ++ii) {
            const NodeInfo &node = old->node(ii);
            if (topology->node_index(node) == Topology::NO_NODE) {
                kvc_log(LOGARGS(this, INFO), "Node %s left the cluster. Draining connections",
                        node.endpoint(SERVICE_KV).c_str());
                pool_->drain(node.endpoint(SERVICE_KV), SERVICE_KV);
            }
        }
    }
    return true;
}

OperationHandle Instance::add_operation(Operation *op)
{
    OperationHandle handle = next_handle_++;
    operations_[handle] = op;
    return handle;
}

void Instance::remove_operation(OperationHandle handle)
{
    operations_.erase(handle);
    maybe_breakout();
}

void Instance::maybe_breakout()
{
    if (waiting_ && operations_.empty()) {
        iotable_->stop();
    }
}

void Instance::wait()
{
    if (operations_.empty()) {
        return;
    }
    waiting_ = true;
    iotable_->run();
    waiting_ = false;
}

kvc_STATUS Instance::cancel(OperationHandle handle)
{
    std::map<OperationHandle, Operation *>::iterator it = operations_.find(handle);
    if (it == operations_.end()) {
        return KVC_ERR_INVALID_ARGUMENT;
    }
    it->second->cancel();
    return KVC_SUCCESS;
}
