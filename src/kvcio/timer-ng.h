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

#ifndef KVC_TIMER_NG_H
#define KVC_TIMER_NG_H

#include "iotable.h"
#include <event2/event.h>
#include <stdint.h>

namespace kvc {
namespace io {

/**
 * One-shot timer on the table's event loop. The callback is invoked with
 * `arg`; the timer may be rearmed or destroyed from within its callback.
 */
class SimpleTimer {
  public:
    typedef void (*Callback)(void *arg);

    SimpleTimer(Table *io, void *arg, Callback cb) : callback_(cb), arg_(arg) {
        event_ = evtimer_new(io->base(), &SimpleTimer::dispatch, this);
    }

    ~SimpleTimer() {
        if (event_) {
            event_free(event_);
        }
    }

    /** Fire after `usec` microseconds, replacing any previous schedule */
    void rearm(uint32_t usec) {
        struct timeval tv;
        tv.tv_sec = usec / 1000000;
        tv.tv_usec = usec % 1000000;
        evtimer_add(event_, &tv);
    }

    /** Arm the timer unless it is already pending */
    void arm_if_disarmed(uint32_t usec) {
        if (!is_armed()) {
            rearm(usec);
        }
    }

    /** Fire as soon as the loop regains control */
    void signal() {
        rearm(0);
    }

    void cancel() {
        evtimer_del(event_);
    }

    bool is_armed() const {
        return evtimer_pending(event_, NULL) != 0;
    }

  private:
    static void dispatch(evutil_socket_t, short, void *arg) {
        SimpleTimer *timer = reinterpret_cast<SimpleTimer *>(arg);
        timer->callback_(timer->arg_);
    }

    struct event *event_;
    Callback callback_;
    void *arg_;

    SimpleTimer(const SimpleTimer &);
    SimpleTimer &operator=(const SimpleTimer &);
};

/** Timer which invokes a member function of its owner */
template <typename T, void (T::*M)(void)> class Timer : public SimpleTimer {
  public:
    Timer(Table *io, T *owner) : SimpleTimer(io, owner, &Timer::invoke) {}

  private:
    static void invoke(void *arg) {
        (reinterpret_cast<T *>(arg)->*M)();
    }
};

} // namespace io
} // namespace kvc

#endif
