#pragma once

#include "qtop/status.h"
#include "qtop/types.h"

#include <string>

namespace qtop {

// Strict unsigned decimal parsing: ASCII digits only, no sign, no whitespace,
// no trailing characters, value within range. std::stoull is not used because it
// accepts "-1" (wrapping to u64 max), leading spaces and trailing garbage.
ResultV1<u64> parse_u64_v1(const std::string& s);
ResultV1<u16> parse_u16_v1(const std::string& s);

}  // namespace qtop
