#pragma once

#include <cstdint>

namespace qtop {

// Time source for the scheduler. Tests substitute a fake that advances on sleep.
struct ClockV1 {
    virtual ~ClockV1() = default;
    virtual std::uint64_t now_ms() = 0;
    virtual void sleep_ms(std::uint64_t ms) = 0;
};

struct RealClockV1 final : public ClockV1 {
    std::uint64_t now_ms() override;
    void sleep_ms(std::uint64_t ms) override;
};

}  // namespace qtop
