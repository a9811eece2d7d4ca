#pragma once

#include "qtop/types.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace qtop {

constexpr u16 kDefaultPort = 9090;
constexpr std::uint64_t kDefaultAlertTimeoutMs = 2000;

// Thrown for anything the caller typed wrong. main() maps it to exit status 2.
class UsageErrorV1 : public std::runtime_error {
   public:
    explicit UsageErrorV1(const std::string& msg) : std::runtime_error(msg) {}
};

struct VerifierConfigV1 {
    // Parsed and echoed only; no listener is ever bound to it.
    u16 port = kDefaultPort;
    bool monitor = false;
    std::optional<CircuitId> check_circuit;
    std::optional<CircuitId> emergency_shutdown;

    // Alert sink (disabled when alert_url is empty).
    std::string alert_url;
    std::string alert_token;
    std::uint64_t alert_timeout_ms = kDefaultAlertTimeoutMs;

    bool dump_metrics = false;
    bool show_help = false;
    bool show_version = false;
};

// Parse the qtop_verifier command line. Throws UsageErrorV1 on unknown options,
// missing or malformed values and repeated options.
VerifierConfigV1 parse_verifier_args_v1(int argc, const char* const* argv);

std::string verifier_usage_v1();

}  // namespace qtop
