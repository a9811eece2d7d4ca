#include "qtop/clock.h"

#include <chrono>
#include <thread>

namespace qtop {

std::uint64_t RealClockV1::now_ms() {
    using namespace std::chrono;
    const auto tp = steady_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(duration_cast<milliseconds>(tp).count());
}

void RealClockV1::sleep_ms(std::uint64_t ms) {
    if (ms == 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace qtop
