#pragma once
#include <cstdint>

namespace mz2d::sim {

// Monotonic simulation clock counted in ticks. Reading it has no side effects.
class TickClock {
public:
    std::uint64_t now() const { return ticks_; }
    std::uint64_t advance() { return ++ticks_; }
    void reset() { ticks_ = 0; }

private:
    std::uint64_t ticks_{0};
};

} // namespace mz2d::sim
