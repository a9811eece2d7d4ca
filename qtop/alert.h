#pragma once

#include "qtop/status.h"
#include "qtop/types.h"

#include <string>
#include <vector>

namespace qtop {

enum class AlertKindV1 : u8 { kViolation = 1, kEmergencyShutdown = 2 };

const char* alert_kind_name_v1(AlertKindV1 k);

struct AlertEventV1 {
    AlertKindV1 kind = AlertKindV1::kViolation;
    CircuitId circuit_id = 0;
    std::string message;
};

// {"event":"<kind>","circuit_id":<id>,"message":"<escaped>"}
std::string alert_event_json_v1(const AlertEventV1& ev);

// Destination for verifier events. Delivery is a single attempt; callers log failures.
struct AlertSinkV1 {
    virtual ~AlertSinkV1() = default;
    virtual StatusV1 send(const AlertEventV1& ev) = 0;
    virtual StatusV1 healthz() = 0;
};

// Used when no --alert-url is configured.
struct NullAlertSinkV1 final : public AlertSinkV1 {
    StatusV1 send(const AlertEventV1&) override { return StatusV1::Ok(); }
    StatusV1 healthz() override { return StatusV1::Ok(); }
};

// Keeps every event in memory. Used by tests and for dry runs.
struct MemoryAlertSinkV1 final : public AlertSinkV1 {
    std::vector<AlertEventV1> events;
    bool fail_sends = false;

    StatusV1 send(const AlertEventV1& ev) override {
        if (fail_sends) return StatusV1::Error("memory sink configured to fail");
        events.push_back(ev);
        return StatusV1::Ok();
    }
    StatusV1 healthz() override { return fail_sends ? StatusV1::Error("memory sink configured to fail") : StatusV1::Ok(); }
};

}  // namespace qtop
