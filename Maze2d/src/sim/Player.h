#pragma once
#include "sim/Actor.h"
#include "mz2d/sim/status_codes.h"

namespace mz2d::sim {

class Player final : public Actor {
public:
    Player(const Maze& maze, const MotionModel& motion, Cell spawn, float speed, float radius);

    // Buffers the requested direction; it is committed by a later update().
    StatusCode handleInput(Direction dir);

    // Commits the buffered direction when centered and the target cell is open, then moves.
    void update();

    // Back to the spawn cell, stopped, with no buffered input.
    void reset();

    Direction pendingDirection() const { return pending_; }

private:
    Direction pending_{Direction::Stop};
};

} // namespace mz2d::sim
