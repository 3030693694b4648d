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

#ifndef KVC_BACKOFF_H
#define KVC_BACKOFF_H

#include "config_static.h"
#include "kvcio/timer-ng.h"
#include <functional>
#include <memory>

namespace kvc {

class Clock {
  public:
    virtual ~Clock() {}

    /** Monotonic time in nanoseconds */
    virtual hrtime_t now() const = 0;
};

class SystemClock : public Clock {
  public:
    hrtime_t now() const {
        return gethrtime();
    }

    static Clock *instance();
};

/**
 * Shared flag which stops a BoundedRetry from scheduling any further
 * attempt once set. Copies refer to the same flag.
 */
class CancelToken {
  public:
    CancelToken() : cancelled_(new bool(false)) {}

    void cancel() {
        *cancelled_ = true;
    }
    bool cancelled() const {
        return *cancelled_;
    }

  private:
    std::shared_ptr<bool> cancelled_;
};

/**
 * @brief Runs an action again after a delay, never past a deadline
 *
 * The delay starts at `initial` and doubles with every attempt up to
 * `ceiling`; a fixed delay is obtained by passing the same value for both.
 * The last delay before the deadline is shortened so that the action runs
 * no later than the deadline itself.
 */
class BoundedRetry {
  public:
    typedef std::function<void()> Action;

    /**
     * @param deadline absolute deadline in the clock's time base
     * @param initial first delay in microseconds
     * @param ceiling maximum delay in microseconds
     */
    BoundedRetry(io::Table *io, const Clock *clock, hrtime_t deadline, uint32_t initial, uint32_t ceiling,
                 const CancelToken &token = CancelToken());

    /**
     * Schedule `action`.
     * @return false if the deadline has passed or the token was cancelled;
     *  the action is not scheduled in that case
     */
    bool schedule(const Action &action);

    /** Drop a scheduled action */
    void cancel();

    bool expired() const {
        return clock_->now() >= deadline_;
    }

    /** Microseconds left until the deadline */
    uint32_t remaining() const;

    unsigned attempts() const {
        return attempts_;
    }

    hrtime_t deadline() const {
        return deadline_;
    }

  private:
    void fire();

    const Clock *clock_;
    hrtime_t deadline_;
    uint32_t next_delay_;
    uint32_t ceiling_;
    unsigned attempts_;
    CancelToken token_;
    Action action_;
    io::Timer<BoundedRetry, &BoundedRetry::fire> timer_;

    BoundedRetry(const BoundedRetry &);
    BoundedRetry &operator=(const BoundedRetry &);
};

} // namespace kvc

#endif
