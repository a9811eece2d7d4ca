#include "qtop/alert.h"
#include "qtop/alert_http.h"
#include "qtop/metrics.h"
#include "testkit.h"

#include <string>

using qtop_test::fail;

int main() {
    {
        qtop::MetricsV1 m;
        if (m.counter("missing") != 0 || m.gauge("missing") != 0.0) return fail("unknown metrics read as zero");
        m.counter_inc("zeta_total");
        m.counter_inc("zeta_total", 4);
        m.gauge_set("alpha", 2);
        m.gauge_add("alpha", -0.5);
        if (m.counter("zeta_total") != 5) return fail("counter sum");
        if (m.gauge("alpha") != 1.5) return fail("gauge arithmetic");
        const std::string want =
            "# TYPE alpha gauge\n"
            "alpha 1.5\n"
            "# TYPE zeta_total counter\n"
            "zeta_total 5\n";
        if (m.render_text() != want) return fail("render_text:\n" + m.render_text());
    }

    {
        qtop::AlertEventV1 ev;
        ev.kind = qtop::AlertKindV1::kViolation;
        ev.circuit_id = 18446744073709551615ULL;
        ev.message = "say \"hi\"\n\\ok\x01";
        const std::string want =
            "{\"event\":\"violation\",\"circuit_id\":18446744073709551615,\"message\":\"say \\\"hi\\\"\\n\\\\ok\\u0001\"}";
        if (qtop::alert_event_json_v1(ev) != want) return fail("alert json: " + qtop::alert_event_json_v1(ev));

        ev.kind = qtop::AlertKindV1::kEmergencyShutdown;
        ev.circuit_id = 0;
        ev.message = "";
        if (qtop::alert_event_json_v1(ev) != "{\"event\":\"emergency_shutdown\",\"circuit_id\":0,\"message\":\"\"}") return fail("shutdown json");
    }

    {
        if (qtop::url_origin_v1("http://host:8080/alerts/x") != "http://host:8080") return fail("origin with path");
        if (qtop::url_origin_v1("https://host") != "https://host") return fail("origin without path");
        if (qtop::url_origin_v1("http://host?x=1") != "http://host") return fail("origin with query");
    }

    // Nothing listens on port 9 (discard) locally: a single attempt must fail cleanly, not throw.
    {
        qtop::HttpAlertConfigV1 cfg;
        cfg.url = "http://127.0.0.1:9/alerts";
        cfg.timeout_ms = 500;
        qtop::HttpAlertSinkV1 sink(cfg);
        qtop::AlertEventV1 ev;
        ev.circuit_id = 1;
        if (sink.send(ev).ok()) return fail("send to a closed port should fail");
        if (sink.healthz().ok()) return fail("healthz on a closed port should fail");
    }
    return 0;
}
