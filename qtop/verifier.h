#pragma once

#include "qtop/alert.h"
#include "qtop/log.h"
#include "qtop/metrics.h"
#include "qtop/types.h"

namespace qtop {

// Placeholder winding-number rule: a circuit is valid iff its id is even.
// No real invariant is defined for circuits yet; this is the whole check.
inline bool winding_number_valid_v1(CircuitId id) { return id % 2 == 0; }

struct CircuitVerdictV1 {
    CircuitId circuit_id = 0;
    bool valid = false;
};

// The two one-shot verifier actions. Both are total over u64 and never fail;
// alert delivery problems are logged as warnings and counted.
class VerifierV1 {
   public:
    VerifierV1(Logger* log, MetricsV1* metrics, AlertSinkV1* alerts);

    CircuitVerdictV1 check_circuit(CircuitId id);
    void emergency_shutdown(CircuitId id);

   private:
    void deliver_(const AlertEventV1& ev);

    Logger* log_;
    MetricsV1* metrics_;
    AlertSinkV1* alerts_;
};

}  // namespace qtop
