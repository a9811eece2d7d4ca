#include "qtop/monitor.h"

#include <stdexcept>
#include <string>

namespace qtop {

MonitorV1::MonitorV1(Logger* log, MetricsV1* metrics, HealthCheckerV1* health, std::uint64_t interval_ms)
    : log_(log), metrics_(metrics), health_(health), interval_ms_(interval_ms) {
    if (!log_ || !metrics_ || !health_) throw std::runtime_error("MonitorV1: null dependency");
    if (interval_ms_ == 0) throw std::invalid_argument("MonitorV1: interval_ms must be > 0");
}

TimerIdV1 MonitorV1::start(SchedulerV1* sched, u16 port) {
    if (!sched) throw std::runtime_error("MonitorV1::start: null scheduler");
    if (timer_) throw std::runtime_error("MonitorV1::start: already running");
    log_->info("📊 Monitoring started on port " + std::to_string(port));
    timer_ = sched->schedule_repeating(interval_ms_, [this]() { tick(); }, /*fire_immediately=*/true);
    return *timer_;
}

bool MonitorV1::stop(SchedulerV1* sched) {
    if (!sched || !timer_) return false;
    const bool removed = sched->cancel_timer(*timer_);
    timer_.reset();
    return removed;
}

void MonitorV1::tick() {
    ticks_++;
    metrics_->counter_inc(kMetricMonitorTicks);

    const HealthStatusV1 st = health_->get_status();
    metrics_->gauge_set(kMetricHealthStatus, st.healthy ? 1.0 : 0.0);
    if (st.healthy) {
        log_->info("✅ All winding numbers verified");
        return;
    }
    for (const auto& c : st.checks) {
        if (!c.healthy) log_->warn("⚠️  Health check '" + c.name + "' failed: " + c.message);
    }
}

}  // namespace qtop
