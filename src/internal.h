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

#ifndef KVC_INTERNAL_H
#define KVC_INTERNAL_H 1

#include "config_static.h"

#include <errno.h>
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <libkvcore/kvcore.h>
#include "kvcio/iotable.h"
#include "kvcio/timer-ng.h"
#include "kvcio/manager.h"
#include "mc/protocol.h"
#include "mc/codec.h"
#include "mcserver/mcserver.h"
#include "vbucket/router.h"
#include "settings.h"
#include "logging.h"
#include "backoff.h"

namespace kvc {

/**
 * Anything the instance keeps track of until it completes: plain requests,
 * batches and durability polls. Completion must call
 * Instance::remove_operation() exactly once if the operation was added.
 */
class Operation {
  public:
    explicit Operation(Instance *instance) : instance_(instance), handle_(0) {}
    virtual ~Operation() {}

    /** Complete with KVC_ERR_REQUEST_CANCELED unless already completed */
    virtual void cancel() = 0;

    OperationHandle handle() const {
        return handle_;
    }

    Instance *instance() const {
        return instance_;
    }

  protected:
    /** Register with the instance so that wait() and cancel() see it */
    void track(OperationHandle *handle) {
        handle_ = instance_->add_operation(this);
        if (handle) {
            *handle = handle_;
        }
    }

    /** Unregister, if registered. Safe to call more than once */
    void untrack() {
        if (handle_) {
            OperationHandle tmp = handle_;
            handle_ = 0;
            instance_->remove_operation(tmp);
        }
    }

    Instance *instance_;

  private:
    OperationHandle handle_;
};

/** Timeout to use for a command: its own, or the instance default */
inline uint32_t effective_timeout(const Settings *settings, uint32_t timeout, const DurabilityRequirement &durability)
{
    if (timeout) {
        return timeout;
    }
    return durability.is_none() ? settings->operation_timeout : settings->durability_timeout;
}

} // namespace kvc

#endif
