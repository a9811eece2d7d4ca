#pragma once

#include "qtop/alert.h"
#include "qtop/cancel.h"
#include "qtop/clock.h"
#include "qtop/config.h"
#include "qtop/log.h"
#include "qtop/metrics.h"

namespace qtop {

// Everything the dispatcher talks to. main() wires real implementations;
// tests substitute captured streams, fake clocks and in-memory sinks.
struct VerifierEnvV1 {
    Logger* out = nullptr;
    MetricsV1* metrics = nullptr;
    AlertSinkV1* alerts = nullptr;
    CancelTokenV1* cancel = nullptr;
    ClockV1* clock = nullptr;  // nullptr => real steady clock
    // Route SIGINT/SIGTERM to `cancel` while the monitor runs. The one-shot actions
    // have no cancellation hook, so signals keep their default action for them.
    bool install_signal_handlers = false;
};

// Runs the actions selected by cfg in the fixed order monitor -> check -> shutdown
// and returns the process exit status. With cfg.monitor set this only returns once
// env.cancel trips, and then returns 128 + signal (0 for a programmatic cancel)
// without running the later actions.
int run_verifier_v1(const VerifierConfigV1& cfg, const VerifierEnvV1& env);

}  // namespace qtop
