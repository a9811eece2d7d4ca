#pragma once

#include <cstdint>

namespace qtop {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// Opaque circuit identifier supplied on the command line.
using CircuitId = u64;

}  // namespace qtop
