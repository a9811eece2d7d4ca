#include "qtop/alert.h"
#include "qtop/alert_http.h"
#include "qtop/cancel.h"
#include "qtop/config.h"
#include "qtop/dispatcher.h"
#include "qtop/log.h"
#include "qtop/metrics.h"

#include <exception>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    qtop::VerifierConfigV1 cfg;
    try {
        cfg = qtop::parse_verifier_args_v1(argc, argv);
    } catch (const qtop::UsageErrorV1& e) {
        std::cerr << "error: " << e.what() << "\n\n" << qtop::verifier_usage_v1();
        return 2;
    }

    try {
        qtop::Logger out(std::cout);
        qtop::MetricsV1 metrics;
        qtop::CancelTokenV1 cancel;

        std::unique_ptr<qtop::AlertSinkV1> alerts;
        if (cfg.alert_url.empty()) {
            alerts = std::make_unique<qtop::NullAlertSinkV1>();
        } else {
            qtop::HttpAlertConfigV1 acfg;
            acfg.url = cfg.alert_url;
            acfg.token = cfg.alert_token;
            acfg.timeout_ms = cfg.alert_timeout_ms;
            alerts = std::make_unique<qtop::HttpAlertSinkV1>(acfg);
        }

        qtop::VerifierEnvV1 env;
        env.out = &out;
        env.metrics = &metrics;
        env.alerts = alerts.get();
        env.cancel = &cancel;
        env.install_signal_handlers = true;
        return qtop::run_verifier_v1(cfg, env);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
