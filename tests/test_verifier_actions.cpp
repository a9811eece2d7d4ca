#include "qtop/alert.h"
#include "qtop/log.h"
#include "qtop/metrics.h"
#include "qtop/verifier.h"
#include "testkit.h"

#include <limits>
#include <sstream>
#include <string>
#include <vector>

using qtop_test::contains;
using qtop_test::fail;
using qtop_test::lines_of;

int main() {
    // Parity rule over a spread of values including both ends of the range.
    {
        const qtop::u64 samples[] = {0, 1, 2, 3, 4, 7, 1000000, 1000001, std::numeric_limits<qtop::u64>::max() - 1,
                                     std::numeric_limits<qtop::u64>::max()};
        for (qtop::u64 n : samples) {
            if (qtop::winding_number_valid_v1(n) != (n % 2 == 0)) return fail("parity rule broken for " + std::to_string(n));
        }
    }

    // Even id: valid, no alert.
    {
        std::ostringstream os;
        qtop::Logger log(os);
        qtop::MetricsV1 m;
        qtop::MemoryAlertSinkV1 sink;
        qtop::VerifierV1 v(&log, &m, &sink);
        const auto verdict = v.check_circuit(4);
        if (!verdict.valid || verdict.circuit_id != 4) return fail("circuit 4 should be valid");
        const auto lines = lines_of(os.str());
        if (lines.size() != 2) return fail("check should print two lines, got:\n" + os.str());
        if (lines[0] != "🔍 Checking winding number for circuit 4...") return fail("line0: " + lines[0]);
        if (lines[1] != "✅ Circuit 4 winding number is valid") return fail("line1: " + lines[1]);
        if (!sink.events.empty()) return fail("valid circuit must not alert");
        if (m.counter(qtop::kMetricCircuitsChecked) != 1) return fail("checked counter");
        if (m.counter(qtop::kMetricWindingViolations) != 0) return fail("violation counter");
    }

    // Odd id: violation line, alert event, counters.
    {
        std::ostringstream os;
        qtop::Logger log(os);
        qtop::MetricsV1 m;
        qtop::MemoryAlertSinkV1 sink;
        qtop::VerifierV1 v(&log, &m, &sink);
        const qtop::u64 id = std::numeric_limits<qtop::u64>::max();
        const auto verdict = v.check_circuit(id);
        if (verdict.valid) return fail("u64 max is odd");
        if (!contains(os.str(), "❌ Circuit 18446744073709551615 winding number violation detected")) return fail("violation line:\n" + os.str());
        if (sink.events.size() != 1) return fail("violation should produce one alert");
        if (sink.events[0].kind != qtop::AlertKindV1::kViolation || sink.events[0].circuit_id != id) return fail("alert contents");
        if (m.counter(qtop::kMetricWindingViolations) != 1) return fail("violation counter");
    }

    // Shutdown always succeeds, for 0 and u64 max alike.
    {
        const qtop::u64 ids[] = {0, 7, std::numeric_limits<qtop::u64>::max()};
        for (qtop::u64 id : ids) {
            std::ostringstream os;
            qtop::Logger log(os);
            qtop::MetricsV1 m;
            qtop::MemoryAlertSinkV1 sink;
            qtop::VerifierV1 v(&log, &m, &sink);
            v.emergency_shutdown(id);
            const std::string s = std::to_string(id);
            const auto lines = lines_of(os.str());
            if (lines.size() != 2) return fail("shutdown should print two lines for " + s);
            if (lines[0] != "🚨 Emergency shutdown triggered for circuit " + s) return fail("line0: " + lines[0]);
            if (lines[1] != "✅ Circuit " + s + " has been safely shut down") return fail("line1: " + lines[1]);
            if (sink.events.size() != 1 || sink.events[0].kind != qtop::AlertKindV1::kEmergencyShutdown) return fail("shutdown alert");
            if (m.counter(qtop::kMetricEmergencyShutdowns) != 1) return fail("shutdown counter");
        }
    }

    // A failing sink is reported as a warning; the verdict and acknowledgement are unchanged.
    {
        std::ostringstream os;
        qtop::Logger log(os);
        qtop::MetricsV1 m;
        qtop::MemoryAlertSinkV1 sink;
        sink.fail_sends = true;
        qtop::VerifierV1 v(&log, &m, &sink);
        const auto verdict = v.check_circuit(9);
        v.emergency_shutdown(9);
        if (verdict.valid) return fail("9 is odd");
        const std::string out = os.str();
        if (!contains(out, "WARN: alert 'violation' for circuit 9 not delivered")) return fail("missing violation warning:\n" + out);
        if (!contains(out, "WARN: alert 'emergency_shutdown' for circuit 9 not delivered")) return fail("missing shutdown warning:\n" + out);
        if (!contains(out, "✅ Circuit 9 has been safely shut down")) return fail("shutdown must still be acknowledged");
        if (m.counter(qtop::kMetricAlertFailures) != 2) return fail("alert failure counter");
    }

    // A warn-level logger keeps only the delivery warning.
    {
        std::ostringstream os;
        qtop::Logger log(os, qtop::LogLevel::kWarn);
        qtop::MetricsV1 m;
        qtop::MemoryAlertSinkV1 sink;
        sink.fail_sends = true;
        qtop::VerifierV1 v(&log, &m, &sink);
        v.check_circuit(1);
        const auto lines = lines_of(os.str());
        if (lines.size() != 1 || lines[0].rfind("WARN: ", 0) != 0) return fail("only the warning should pass the filter:\n" + os.str());
    }
    return 0;
}
