#pragma once
#include "sim/Grid.h"
#include "sim/Maze.h"
#include "sim/Motion.h"
#include <raylib.h>

namespace mz2d::sim {

// Shared movement for the player and the ghosts: a continuous position that is
// advanced along the current direction without ever entering a wall cell.
class Actor {
public:
    Actor(const Maze& maze, const MotionModel& motion, Cell spawn, float speed, float radius);
    virtual ~Actor() = default;

    Vector2 position() const { return position_; }
    Direction direction() const { return direction_; }
    float speed() const { return speed_; }
    float radius() const { return radius_; }
    Cell spawnCell() const { return spawn_; }
    Cell cell() const { return motion_.worldToCell(position_); }

    bool isCentered() const { return motion_.isCentered(position_, centerTolerance_); }
    float centerTolerance() const { return centerTolerance_; }

    // Moves up to `speed` units along the current direction. Stops early, keeping
    // the direction, when the next step would enter a wall.
    void advance();

    // True when a step of `amount` units along `dir` keeps the actor out of walls.
    bool canStep(Direction dir, float amount) const;

    void placeAt(Cell c);

protected:
    void setDirection(Direction d) { direction_ = d; }
    void snapToCenter() { position_ = motion_.snapToCenter(position_); }

    const Maze& maze_;
    const MotionModel& motion_;

private:
    void stepBy(Direction dir, float amount);

    Cell spawn_;
    Vector2 position_{};
    Direction direction_{Direction::Stop};
    float speed_;
    float radius_;
    float centerTolerance_;
};

} // namespace mz2d::sim
