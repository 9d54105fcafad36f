#pragma once
#include "sim/Grid.h"
#include "mz2d/sim/status_codes.h"
#include <mutex>
#include <optional>

namespace mz2d::sim {

// Latest-intent buffer between the input backend and the tick loop.
// Producers may push from any thread; the simulation polls once per tick.
class InputQueue {
public:
    // Last write wins. Invalid directions are rejected and leave the queue untouched.
    StatusCode push(Direction dir);

    // Takes the most recent intent, if any.
    std::optional<Direction> poll();

    bool hasPending() const;
    void clear();

private:
    mutable std::mutex mtx_;
    std::optional<Direction> latest_{};
};

} // namespace mz2d::sim
