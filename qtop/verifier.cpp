#include "qtop/verifier.h"

#include <stdexcept>
#include <string>

namespace qtop {

VerifierV1::VerifierV1(Logger* log, MetricsV1* metrics, AlertSinkV1* alerts) : log_(log), metrics_(metrics), alerts_(alerts) {
    if (!log_ || !metrics_ || !alerts_) throw std::runtime_error("VerifierV1: null dependency");
}

CircuitVerdictV1 VerifierV1::check_circuit(CircuitId id) {
    const std::string ids = std::to_string(id);
    log_->info("🔍 Checking winding number for circuit " + ids + "...");

    CircuitVerdictV1 v;
    v.circuit_id = id;
    v.valid = winding_number_valid_v1(id);
    metrics_->counter_inc(kMetricCircuitsChecked);

    if (v.valid) {
        log_->info("✅ Circuit " + ids + " winding number is valid");
    } else {
        log_->info("❌ Circuit " + ids + " winding number violation detected");
        metrics_->counter_inc(kMetricWindingViolations);
        AlertEventV1 ev;
        ev.kind = AlertKindV1::kViolation;
        ev.circuit_id = id;
        ev.message = "winding number violation detected";
        deliver_(ev);
    }
    return v;
}

void VerifierV1::emergency_shutdown(CircuitId id) {
    const std::string ids = std::to_string(id);
    log_->info("🚨 Emergency shutdown triggered for circuit " + ids);
    metrics_->counter_inc(kMetricEmergencyShutdowns);

    AlertEventV1 ev;
    ev.kind = AlertKindV1::kEmergencyShutdown;
    ev.circuit_id = id;
    ev.message = "emergency shutdown acknowledged";
    deliver_(ev);

    log_->info("✅ Circuit " + ids + " has been safely shut down");
}

void VerifierV1::deliver_(const AlertEventV1& ev) {
    const StatusV1 st = alerts_->send(ev);
    if (st.ok()) return;
    metrics_->counter_inc(kMetricAlertFailures);
    log_->warn(std::string("alert '") + alert_kind_name_v1(ev.kind) + "' for circuit " + std::to_string(ev.circuit_id) +
               " not delivered: " + st.message());
}

}  // namespace qtop
