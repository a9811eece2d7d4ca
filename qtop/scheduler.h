#pragma once

#include "qtop/cancel.h"
#include "qtop/clock.h"
#include "qtop/types.h"

#include <cstdint>
#include <functional>
#include <map>

namespace qtop {

using TimerIdV1 = u64;

struct SchedulerRunV1 {
    u64 fired = 0;           // callbacks executed during run()
    bool cancelled = false;  // run() stopped because the token tripped
};

// Single-threaded cooperative timer scheduler.
//
// Timers fire in due-time order; equal due times fire in registration order.
// run() returns when no timers remain or when the cancel token trips. Waiting is
// done in slices of at most kMaxWaitSliceMs so a signal-driven cancel is observed
// promptly without any cross-thread wakeup.
class SchedulerV1 {
   public:
    static constexpr std::uint64_t kMaxWaitSliceMs = 100;

    explicit SchedulerV1(CancelTokenV1* cancel, ClockV1* clock = nullptr);

    // Scheduler stores a pointer to its own RealClockV1 fallback.
    SchedulerV1(const SchedulerV1&) = delete;
    SchedulerV1& operator=(const SchedulerV1&) = delete;
    SchedulerV1(SchedulerV1&&) = delete;
    SchedulerV1& operator=(SchedulerV1&&) = delete;

    // Repeating timer. The next due time is the previous due time plus interval_ms,
    // so callback duration does not cause drift. interval_ms must be non-zero.
    TimerIdV1 schedule_repeating(std::uint64_t interval_ms, std::function<void()> fn, bool fire_immediately = true);
    TimerIdV1 schedule_once(std::uint64_t delay_ms, std::function<void()> fn);

    // Safe to call from inside a timer callback (including the timer's own).
    bool cancel_timer(TimerIdV1 id);

    std::size_t pending() const { return timers_.size(); }
    ClockV1& clock() { return *clock_; }

    SchedulerRunV1 run();

   private:
    struct Timer {
        std::uint64_t due_ms = 0;
        std::uint64_t interval_ms = 0;  // 0 => one-shot
        std::function<void()> fn;
    };

    std::map<TimerIdV1, Timer>::iterator next_due_();

    CancelTokenV1* cancel_;
    RealClockV1 real_clock_;
    ClockV1* clock_;
    TimerIdV1 next_id_ = 1;
    std::map<TimerIdV1, Timer> timers_;
};

}  // namespace qtop
