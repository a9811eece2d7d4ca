#include "qtop/scheduler.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace qtop {

SchedulerV1::SchedulerV1(CancelTokenV1* cancel, ClockV1* clock) : cancel_(cancel), clock_(clock ? clock : &real_clock_) {
    if (!cancel_) throw std::runtime_error("SchedulerV1: null cancel token");
}

TimerIdV1 SchedulerV1::schedule_repeating(std::uint64_t interval_ms, std::function<void()> fn, bool fire_immediately) {
    if (interval_ms == 0) throw std::invalid_argument("schedule_repeating: interval_ms must be > 0");
    if (!fn) throw std::invalid_argument("schedule_repeating: empty callback");
    Timer t;
    t.interval_ms = interval_ms;
    t.due_ms = clock_->now_ms() + (fire_immediately ? 0 : interval_ms);
    t.fn = std::move(fn);
    const TimerIdV1 id = next_id_++;
    timers_.emplace(id, std::move(t));
    return id;
}

TimerIdV1 SchedulerV1::schedule_once(std::uint64_t delay_ms, std::function<void()> fn) {
    if (!fn) throw std::invalid_argument("schedule_once: empty callback");
    Timer t;
    t.interval_ms = 0;
    t.due_ms = clock_->now_ms() + delay_ms;
    t.fn = std::move(fn);
    const TimerIdV1 id = next_id_++;
    timers_.emplace(id, std::move(t));
    return id;
}

bool SchedulerV1::cancel_timer(TimerIdV1 id) { return timers_.erase(id) != 0; }

std::map<TimerIdV1, SchedulerV1::Timer>::iterator SchedulerV1::next_due_() {
    // Ids grow monotonically, so the first minimum in id order is the earliest registration.
    auto best = timers_.begin();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.due_ms < best->second.due_ms) best = it;
    }
    return best;
}

SchedulerRunV1 SchedulerV1::run() {
    SchedulerRunV1 r;
    for (;;) {
        if (cancel_->cancelled()) {
            r.cancelled = true;
            break;
        }
        if (timers_.empty()) break;

        auto it = next_due_();
        const std::uint64_t now = clock_->now_ms();
        if (it->second.due_ms > now) {
            clock_->sleep_ms(std::min<std::uint64_t>(kMaxWaitSliceMs, it->second.due_ms - now));
            continue;
        }

        // Copy the callback: it may cancel (erase) its own timer while running.
        std::function<void()> fn = it->second.fn;
        if (it->second.interval_ms == 0) {
            timers_.erase(it);
        } else {
            Timer& t = it->second;
            t.due_ms += t.interval_ms;
            if (t.due_ms <= now) {
                // Fell behind (e.g. the process was stopped): skip missed ticks, keep the phase.
                const std::uint64_t behind = now - t.due_ms;
                t.due_ms += (behind / t.interval_ms + 1) * t.interval_ms;
            }
        }
        fn();
        r.fired++;
    }
    return r;
}

}  // namespace qtop
