#pragma once

#include "qtop/alert.h"
#include "qtop/status.h"

#include <cstdint>
#include <string>

namespace qtop {

struct HttpAlertConfigV1 {
    std::string url;              // events are POSTed here, e.g. "http://host:8080/alerts"
    std::string token;            // optional Bearer token
    std::uint64_t timeout_ms = 2000;
};

// "http://host:8080/alerts" -> "http://host:8080". Returns the input unchanged when it has no path.
std::string url_origin_v1(const std::string& url);

// Webhook alert sink over libcurl. Each call performs exactly one request.
class HttpAlertSinkV1 final : public AlertSinkV1 {
   public:
    explicit HttpAlertSinkV1(HttpAlertConfigV1 cfg);

    // POST alert_event_json_v1(ev) to cfg.url; any non-2xx response is an error.
    StatusV1 send(const AlertEventV1& ev) override;
    // GET <origin>/healthz; healthy on 2xx.
    StatusV1 healthz() override;

   private:
    HttpAlertConfigV1 cfg_;
};

}  // namespace qtop
