#pragma once

#include "qtop/clock.h"
#include "qtop/log.h"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace qtop {

struct HealthCheckOutcomeV1 {
    bool healthy = true;
    std::string message;
};

struct HealthCheckResultV1 {
    std::string name;
    bool healthy = false;
    std::string message;
    std::uint64_t timestamp_ms = 0;
};

struct HealthStatusV1 {
    bool healthy = true;  // AND over all checks; true when none are registered
    std::vector<HealthCheckResultV1> checks;
    std::uint64_t timestamp_ms = 0;
};

using HealthCheckFnV1 = std::function<HealthCheckOutcomeV1()>;

class HealthCheckerV1 {
   public:
    HealthCheckerV1(Logger* log, ClockV1* clock) : log_(log), clock_(clock) {}

    // Registering an existing name replaces the check in place.
    void add(const std::string& name, HealthCheckFnV1 fn);
    bool remove(const std::string& name);
    std::size_t size() const { return checks_.size(); }

    // Runs every check in registration order. A check that throws is reported unhealthy.
    HealthStatusV1 get_status();

   private:
    Logger* log_;
    ClockV1* clock_;
    std::vector<std::pair<std::string, HealthCheckFnV1>> checks_;
};

}  // namespace qtop
