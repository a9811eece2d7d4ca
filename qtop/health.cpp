#include "qtop/health.h"

#include <algorithm>
#include <exception>

namespace qtop {

void HealthCheckerV1::add(const std::string& name, HealthCheckFnV1 fn) {
    for (auto& c : checks_) {
        if (c.first == name) {
            c.second = std::move(fn);
            return;
        }
    }
    checks_.emplace_back(name, std::move(fn));
}

bool HealthCheckerV1::remove(const std::string& name) {
    const auto it = std::find_if(checks_.begin(), checks_.end(), [&](const std::pair<std::string, HealthCheckFnV1>& c) { return c.first == name; });
    if (it == checks_.end()) return false;
    checks_.erase(it);
    return true;
}

HealthStatusV1 HealthCheckerV1::get_status() {
    HealthStatusV1 st;
    st.timestamp_ms = clock_ ? clock_->now_ms() : 0;
    for (const auto& c : checks_) {
        HealthCheckResultV1 r;
        r.name = c.first;
        r.timestamp_ms = st.timestamp_ms;
        try {
            const HealthCheckOutcomeV1 o = c.second();
            r.healthy = o.healthy;
            r.message = o.message;
        } catch (const std::exception& e) {
            if (log_) log_->error("Health check '" + c.first + "' failed: " + e.what());
            r.healthy = false;
            r.message = std::string("Check failed: ") + e.what();
        }
        if (!r.healthy) st.healthy = false;
        st.checks.push_back(std::move(r));
    }
    return st;
}

}  // namespace qtop
