#include "qtop/metrics.h"

#include <sstream>

namespace qtop {

void MetricsV1::counter_inc(const std::string& name, u64 n) {
    std::lock_guard<std::mutex> g(mu_);
    counters_[name] += n;
}

u64 MetricsV1::counter(const std::string& name) const {
    std::lock_guard<std::mutex> g(mu_);
    const auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

void MetricsV1::gauge_set(const std::string& name, double v) {
    std::lock_guard<std::mutex> g(mu_);
    gauges_[name] = v;
}

void MetricsV1::gauge_add(const std::string& name, double delta) {
    std::lock_guard<std::mutex> g(mu_);
    gauges_[name] += delta;
}

double MetricsV1::gauge(const std::string& name) const {
    std::lock_guard<std::mutex> g(mu_);
    const auto it = gauges_.find(name);
    return it == gauges_.end() ? 0.0 : it->second;
}

std::string MetricsV1::render_text() const {
    std::lock_guard<std::mutex> g(mu_);
    // Merge both maps so the output is sorted by name regardless of metric type.
    std::map<std::string, std::string> lines;
    for (const auto& kv : counters_) {
        std::ostringstream os;
        os << "# TYPE " << kv.first << " counter\n" << kv.first << " " << kv.second << "\n";
        lines[kv.first] = os.str();
    }
    for (const auto& kv : gauges_) {
        std::ostringstream os;
        os << "# TYPE " << kv.first << " gauge\n" << kv.first << " " << kv.second << "\n";
        lines[kv.first] = os.str();
    }
    std::string out;
    for (const auto& kv : lines) out += kv.second;
    return out;
}

}  // namespace qtop
