#pragma once

#include "qtop/types.h"

#include <map>
#include <mutex>
#include <string>

namespace qtop {

// Metric names used by the verifier.
constexpr const char* kMetricCircuitsChecked = "qtop_circuits_checked_total";
constexpr const char* kMetricWindingViolations = "qtop_winding_violations_total";
constexpr const char* kMetricEmergencyShutdowns = "qtop_emergency_shutdowns_total";
constexpr const char* kMetricMonitorTicks = "qtop_monitor_ticks_total";
constexpr const char* kMetricAlertFailures = "qtop_alert_failures_total";
constexpr const char* kMetricHealthStatus = "qtop_health_status";

// In-process counters and gauges. Nothing is exported over the network; render_text()
// produces the Prometheus text exposition format for --dump-metrics.
class MetricsV1 {
   public:
    void counter_inc(const std::string& name, u64 n = 1);
    u64 counter(const std::string& name) const;

    void gauge_set(const std::string& name, double v);
    void gauge_add(const std::string& name, double delta);
    double gauge(const std::string& name) const;

    // Sorted by metric name; each metric is preceded by a "# TYPE" line.
    std::string render_text() const;

   private:
    mutable std::mutex mu_;
    std::map<std::string, u64> counters_;
    std::map<std::string, double> gauges_;
};

}  // namespace qtop
