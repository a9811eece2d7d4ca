#include "qtop/dispatcher.h"

#include "qtop/health.h"
#include "qtop/monitor.h"
#include "qtop/scheduler.h"
#include "qtop/verifier.h"
#include "qtop/version.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace qtop {
namespace {

void print_block(Logger* out, std::string text) {
    while (!text.empty() && text.back() == '\n') text.pop_back();
    if (!text.empty()) out->info(text);
}

int run_monitor(const VerifierConfigV1& cfg, const VerifierEnvV1& env) {
    SchedulerV1 sched(env.cancel, env.clock);
    HealthCheckerV1 health(env.out, &sched.clock());
    if (!cfg.alert_url.empty()) {
        AlertSinkV1* sink = env.alerts;
        health.add("alert_sink", [sink]() {
            const StatusV1 st = sink->healthz();
            HealthCheckOutcomeV1 o;
            o.healthy = st.ok();
            o.message = st.ok() ? "reachable" : st.message();
            return o;
        });
    }

    std::optional<ScopedSignalCancelV1> signals;
    if (env.install_signal_handlers) signals.emplace(env.cancel);

    MonitorV1 monitor(env.out, env.metrics, &health);
    monitor.start(&sched, cfg.port);
    const SchedulerRunV1 r = sched.run();
    monitor.stop(&sched);
    signals.reset();

    if (!r.cancelled) throw std::runtime_error("monitor loop exited without cancellation");
    const int signo = env.cancel->signal();
    env.out->info("📊 Monitoring stopped after " + std::to_string(monitor.ticks()) + " tick(s)" +
                  (signo > 0 ? " (signal " + std::to_string(signo) + ")" : ""));
    return signo > 0 ? 128 + signo : 0;
}

}  // namespace

int run_verifier_v1(const VerifierConfigV1& cfg, const VerifierEnvV1& env) {
    if (!env.out || !env.metrics || !env.alerts || !env.cancel) throw std::runtime_error("run_verifier_v1: incomplete environment");

    if (cfg.show_help) {
        print_block(env.out, verifier_usage_v1());
        return 0;
    }
    if (cfg.show_version) {
        env.out->info(std::string(kVerifierName) + " " + kVerifierVersion);
        return 0;
    }

    env.out->info(std::string("🔍 Quantum Topological Winding Number Verifier v") + kVerifierVersion);
    env.out->info("⚛️  Starting verifier on port " + std::to_string(cfg.port));

    if (cfg.monitor) {
        env.out->info("📊 Starting monitoring mode...");
        return run_monitor(cfg, env);
    }

    VerifierV1 verifier(env.out, env.metrics, env.alerts);

    if (cfg.check_circuit) {
        env.out->info("🔍 Checking circuit " + std::to_string(*cfg.check_circuit) + "...");
        verifier.check_circuit(*cfg.check_circuit);
    }

    if (cfg.emergency_shutdown) {
        env.out->info("🚨 Emergency shutdown for circuit " + std::to_string(*cfg.emergency_shutdown) + "...");
        verifier.emergency_shutdown(*cfg.emergency_shutdown);
    }

    if (cfg.dump_metrics) print_block(env.out, env.metrics->render_text());
    return 0;
}

}  // namespace qtop
