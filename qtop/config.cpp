#include "qtop/config.h"

#include "qtop/parse.h"
#include "qtop/version.h"

#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace qtop {
namespace {

struct OptSpec {
    const char* long_name;
    const char* short_name;  // nullptr when there is no alias
    bool takes_value;
};

const std::vector<OptSpec>& option_table() {
    static const std::vector<OptSpec> kOpts = {
        {"--port", "-p", true},
        {"--monitor", "-m", false},
        {"--check-circuit", nullptr, true},
        {"--emergency-shutdown", nullptr, true},
        {"--alert-url", nullptr, true},
        {"--alert-token", nullptr, true},
        {"--alert-timeout-ms", nullptr, true},
        {"--dump-metrics", nullptr, false},
        {"--help", "-h", false},
        {"--version", "-V", false},
    };
    return kOpts;
}

const OptSpec* find_opt(const std::string& name) {
    for (const auto& o : option_table()) {
        if (name == o.long_name) return &o;
        if (o.short_name && name == o.short_name) return &o;
    }
    return nullptr;
}

template <typename T>
T value_or_throw(const ResultV1<T>& r, const std::string& opt) {
    if (!r.ok()) throw UsageErrorV1(r.status().with_context("invalid value for " + opt).message());
    return r.value();
}

void apply(VerifierConfigV1& cfg, const std::string& opt, const std::string& value) {
    if (opt == "--port") {
        cfg.port = value_or_throw(parse_u16_v1(value), opt);
    } else if (opt == "--check-circuit") {
        cfg.check_circuit = value_or_throw(parse_u64_v1(value), opt);
    } else if (opt == "--emergency-shutdown") {
        cfg.emergency_shutdown = value_or_throw(parse_u64_v1(value), opt);
    } else if (opt == "--alert-url") {
        if (value.rfind("http://", 0) != 0 && value.rfind("https://", 0) != 0) {
            throw UsageErrorV1("invalid value for --alert-url: expected an http:// or https:// URL");
        }
        cfg.alert_url = value;
    } else if (opt == "--alert-token") {
        cfg.alert_token = value;
    } else if (opt == "--alert-timeout-ms") {
        cfg.alert_timeout_ms = value_or_throw(parse_u64_v1(value), opt);
        if (cfg.alert_timeout_ms == 0) throw UsageErrorV1("invalid value for --alert-timeout-ms: must be > 0");
    } else if (opt == "--monitor") {
        cfg.monitor = true;
    } else if (opt == "--dump-metrics") {
        cfg.dump_metrics = true;
    } else if (opt == "--help") {
        cfg.show_help = true;
    } else if (opt == "--version") {
        cfg.show_version = true;
    }
}

}  // namespace

VerifierConfigV1 parse_verifier_args_v1(int argc, const char* const* argv) {
    VerifierConfigV1 cfg;
    std::set<std::string> seen;

    for (int i = 1; i < argc; i++) {
        const std::string arg(argv[i]);
        std::string name = arg;
        std::string inline_value;
        bool has_inline = false;
        const std::size_t eq = arg.find('=');
        if (arg.rfind("-", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
            has_inline = true;
        } else if (arg.size() > 2 && arg[0] == '-' && arg[1] != '-') {
            // Attached short value: "-p9090".
            const OptSpec* s = find_opt(arg.substr(0, 2));
            if (s && s->takes_value) {
                name = arg.substr(0, 2);
                inline_value = arg.substr(2);
                has_inline = true;
            }
        }

        const OptSpec* o = find_opt(name);
        if (!o) throw UsageErrorV1("unexpected argument '" + arg + "'");
        const std::string canon(o->long_name);
        if (!seen.insert(canon).second) throw UsageErrorV1("argument '" + canon + "' cannot be used multiple times");

        if (!o->takes_value) {
            if (has_inline) throw UsageErrorV1("unexpected value for flag '" + canon + "'");
            apply(cfg, canon, "");
            continue;
        }

        std::string value;
        if (has_inline) {
            value = inline_value;
        } else {
            if (i + 1 >= argc) throw UsageErrorV1("a value is required for '" + canon + "' but none was supplied");
            value = argv[++i];
        }
        apply(cfg, canon, value);
    }
    return cfg;
}

std::string verifier_usage_v1() {
    std::ostringstream os;
    os << kVerifierName << " " << kVerifierVersion << "\n"
       << kVerifierAbout << "\n\n"
       << "Usage: " << kVerifierName << " [OPTIONS]\n\n"
       << "Options:\n"
       << "  -p, --port <u16>                Port echoed at startup (default " << kDefaultPort << ")\n"
       << "  -m, --monitor                   Run the periodic monitor loop (does not return)\n"
       << "      --check-circuit <u64>       Check the winding number of a circuit\n"
       << "      --emergency-shutdown <u64>  Acknowledge an emergency shutdown of a circuit\n"
       << "      --alert-url <url>           POST violation/shutdown events to this URL\n"
       << "      --alert-token <token>       Bearer token for --alert-url\n"
       << "      --alert-timeout-ms <u64>    Alert request timeout (default " << kDefaultAlertTimeoutMs << ")\n"
       << "      --dump-metrics              Print metrics before exiting\n"
       << "  -h, --help                      Print help\n"
       << "  -V, --version                   Print version\n";
    return os.str();
}

}  // namespace qtop
