#include "qtop/alert.h"

#include <cstdio>
#include <string>

namespace qtop {
namespace {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char ch : s) {
        switch (ch) {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buf;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

}  // namespace

const char* alert_kind_name_v1(AlertKindV1 k) {
    switch (k) {
        case AlertKindV1::kViolation:
            return "violation";
        case AlertKindV1::kEmergencyShutdown:
            return "emergency_shutdown";
    }
    return "unknown";
}

std::string alert_event_json_v1(const AlertEventV1& ev) {
    std::string body;
    body.reserve(96 + ev.message.size());
    body += "{\"event\":\"";
    body += alert_kind_name_v1(ev.kind);
    body += "\",\"circuit_id\":";
    body += std::to_string(ev.circuit_id);
    body += ",\"message\":\"";
    body += json_escape(ev.message);
    body += "\"}";
    return body;
}

}  // namespace qtop
