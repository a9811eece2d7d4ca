#pragma once

#include "qtop/health.h"
#include "qtop/log.h"
#include "qtop/metrics.h"
#include "qtop/scheduler.h"
#include "qtop/types.h"

#include <cstdint>
#include <optional>

namespace qtop {

constexpr std::uint64_t kMonitorIntervalMs = 10000;

// Periodic monitor task. start() registers a repeating timer on the scheduler
// that fires immediately and then every interval; stop() cancels it.
class MonitorV1 {
   public:
    MonitorV1(Logger* log, MetricsV1* metrics, HealthCheckerV1* health, std::uint64_t interval_ms = kMonitorIntervalMs);

    TimerIdV1 start(SchedulerV1* sched, u16 port);
    bool stop(SchedulerV1* sched);

    // One monitor pass: run health checks and report.
    void tick();

    u64 ticks() const { return ticks_; }
    bool running() const { return timer_.has_value(); }
    std::uint64_t interval_ms() const { return interval_ms_; }

   private:
    Logger* log_;
    MetricsV1* metrics_;
    HealthCheckerV1* health_;
    std::uint64_t interval_ms_;
    std::optional<TimerIdV1> timer_;
    u64 ticks_ = 0;
};

}  // namespace qtop
