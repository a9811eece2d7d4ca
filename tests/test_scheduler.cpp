#include "qtop/scheduler.h"
#include "testkit.h"

#include <stdexcept>
#include <string>
#include <vector>

using qtop_test::FakeClock;
using qtop_test::fail;

int main() {
    // Repeating timer fires at 0, I, 2I ... until the callback cancels it.
    {
        FakeClock clk;
        clk.t_ms = 1000;
        qtop::CancelTokenV1 cancel;
        qtop::SchedulerV1 s(&cancel, &clk);
        std::vector<std::uint64_t> at;
        qtop::TimerIdV1 id = 0;
        id = s.schedule_repeating(10000, [&]() {
            at.push_back(clk.now_ms());
            if (at.size() == 3) s.cancel_timer(id);
        });
        const auto r = s.run();
        if (r.cancelled) return fail("run should end because no timers remain");
        if (r.fired != 3) return fail("expected 3 firings, got " + std::to_string(r.fired));
        if (at != std::vector<std::uint64_t>{1000, 11000, 21000}) return fail("unexpected firing times");
        if (s.pending() != 0) return fail("timer should be gone");
    }

    // fire_immediately=false delays the first tick by one interval.
    {
        FakeClock clk;
        qtop::CancelTokenV1 cancel;
        qtop::SchedulerV1 s(&cancel, &clk);
        std::uint64_t first = 0;
        qtop::TimerIdV1 id = 0;
        id = s.schedule_repeating(
            250,
            [&]() {
                first = clk.now_ms();
                s.cancel_timer(id);
            },
            /*fire_immediately=*/false);
        s.run();
        if (first != 250) return fail("delayed repeating timer should first fire at 250");
    }

    // Cancel token stops an otherwise endless loop; waits are sliced.
    {
        FakeClock clk;
        qtop::CancelTokenV1 cancel;
        clk.cancel = &cancel;
        clk.cancel_at_ms = 25000;
        clk.cancel_signo = 15;
        qtop::SchedulerV1 s(&cancel, &clk);
        int ticks = 0;
        s.schedule_repeating(10000, [&]() { ticks++; });
        const auto r = s.run();
        if (!r.cancelled) return fail("run should report cancellation");
        if (ticks != 3) return fail("expected ticks at 0, 10000, 20000; got " + std::to_string(ticks));
        if (cancel.signal() != 15) return fail("cancel should record the signal");
        // The 100 ms slice bounds how far past the cancel point the clock may run.
        if (clk.t_ms > 25000 + qtop::SchedulerV1::kMaxWaitSliceMs) return fail("cancel observed too late");
        if (s.pending() != 1) return fail("repeating timer stays registered after cancel");
    }

    // One-shots and ordering: earlier due first, ties in registration order.
    {
        FakeClock clk;
        qtop::CancelTokenV1 cancel;
        qtop::SchedulerV1 s(&cancel, &clk);
        std::string order;
        s.schedule_once(50, [&]() { order += "b"; });
        s.schedule_once(10, [&]() { order += "a"; });
        s.schedule_once(50, [&]() { order += "c"; });
        const qtop::TimerIdV1 dropped = s.schedule_once(20, [&]() { order += "x"; });
        if (!s.cancel_timer(dropped)) return fail("cancel of pending one-shot should succeed");
        if (s.cancel_timer(dropped)) return fail("second cancel should report false");
        const auto r = s.run();
        if (order != "abc") return fail("unexpected order: " + order);
        if (r.fired != 3) return fail("three one-shots should fire");
    }

    // Already-cancelled token: nothing runs.
    {
        FakeClock clk;
        qtop::CancelTokenV1 cancel;
        cancel.cancel();
        qtop::SchedulerV1 s(&cancel, &clk);
        bool ran = false;
        s.schedule_once(0, [&]() { ran = true; });
        const auto r = s.run();
        if (ran || !r.cancelled || r.fired != 0) return fail("pre-cancelled scheduler must not fire");
    }

    // A late wakeup skips missed ticks instead of bursting.
    {
        FakeClock clk;
        qtop::CancelTokenV1 cancel;
        qtop::SchedulerV1 s(&cancel, &clk);
        std::vector<std::uint64_t> at;
        qtop::TimerIdV1 id = 0;
        id = s.schedule_repeating(100, [&]() {
            at.push_back(clk.now_ms());
            if (at.size() == 1) clk.t_ms += 350;  // callback overran 3.5 intervals
            if (at.size() == 3) s.cancel_timer(id);
        });
        s.run();
        // One late tick at 350 (not 100, 200, 300 in a burst), then back on the 100 ms grid.
        if (at != std::vector<std::uint64_t>{0, 350, 400}) return fail("expected ticks at 0, 350, 400");
    }

    // Argument validation.
    {
        FakeClock clk;
        qtop::CancelTokenV1 cancel;
        qtop::SchedulerV1 s(&cancel, &clk);
        bool threw = false;
        try {
            s.schedule_repeating(0, []() {});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) return fail("zero interval should be rejected");
    }
    return 0;
}
