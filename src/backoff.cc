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

#include "backoff.h"

using namespace kvc;

Clock *SystemClock::instance()
{
    static SystemClock clock;
    return &clock;
}

BoundedRetry::BoundedRetry(io::Table *io, const Clock *clock, hrtime_t deadline, uint32_t initial, uint32_t ceiling,
                           const CancelToken &token)
    : clock_(clock), deadline_(deadline), next_delay_(initial), ceiling_(ceiling < initial ? initial : ceiling),
      attempts_(0), token_(token), timer_(io, this)
{
}

uint32_t BoundedRetry::remaining() const
{
    hrtime_t now = clock_->now();
    if (now >= deadline_) {
        return 0;
    }
    hrtime_t left = KVC_NS2US(deadline_ - now);
    return left > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(left);
}

bool BoundedRetry::schedule(const Action &action)
{
    if (token_.cancelled() || expired()) {
        return false;
    }
    uint32_t delay = next_delay_;
    uint32_t left = remaining();
    if (delay > left) {
        delay = left;
    }
    uint64_t doubled = static_cast<uint64_t>(next_delay_) * 2;
    next_delay_ = doubled > ceiling_ ? ceiling_ : static_cast<uint32_t>(doubled);
    attempts_++;
    action_ = action;
    timer_.rearm(delay);
    return true;
}

void BoundedRetry::cancel()
{
    timer_.cancel();
    action_ = Action();
}

void BoundedRetry::fire()
{
    Action action;
    action.swap(action_);
    if (token_.cancelled() || !action) {
        return;
    }
    action();
}
