#include "qtop/parse.h"

#include <limits>

namespace qtop {

ResultV1<u64> parse_u64_v1(const std::string& s) {
    if (s.empty()) return StatusV1::Error("empty value, expected an unsigned integer");
    u64 v = 0;
    for (char ch : s) {
        if (ch < '0' || ch > '9') return StatusV1::Error("invalid digit found in '" + s + "'");
        const u64 d = static_cast<u64>(ch - '0');
        if (v > (std::numeric_limits<u64>::max() - d) / 10) return StatusV1::Error("number too large to fit in u64: '" + s + "'");
        v = v * 10 + d;
    }
    return v;
}

ResultV1<u16> parse_u16_v1(const std::string& s) {
    const ResultV1<u64> r = parse_u64_v1(s);
    if (!r.ok()) return r.status();
    if (r.value() > std::numeric_limits<u16>::max()) return StatusV1::Error("number too large to fit in u16: '" + s + "'");
    return static_cast<u16>(r.value());
}

}  // namespace qtop
