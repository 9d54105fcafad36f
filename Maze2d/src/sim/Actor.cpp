#include "sim/Actor.h"

namespace mz2d::sim {

Actor::Actor(const Maze& maze, const MotionModel& motion, Cell spawn, float speed, float radius)
    : maze_(maze),
      motion_(motion),
      spawn_(spawn),
      position_(motion.cellToWorld(spawn)),
      speed_(speed),
      radius_(radius),
      centerTolerance_(motion.toleranceFor(speed)) {}

void Actor::placeAt(Cell c) {
    position_ = motion_.cellToWorld(c);
}

bool Actor::canStep(Direction dir, float amount) const {
    if (dir == Direction::Stop) return false;
    // At a decision point the whole next cell decides; this keeps corners from being cut.
    if (isCentered() && maze_.isWall(neighbor(cell(), dir))) {
        return false;
    }
    Cell off = delta(dir);
    Vector2 next{ position_.x + off.col * amount, position_.y + off.row * amount };
    return !maze_.isWall(motion_.worldToCell(next));
}

void Actor::stepBy(Direction dir, float amount) {
    Cell off = delta(dir);
    position_.x += off.col * amount;
    position_.y += off.row * amount;
}

void Actor::advance() {
    if (direction_ == Direction::Stop) return;

    const int whole = static_cast<int>(speed_);
    for (int i = 0; i < whole; ++i) {
        if (!canStep(direction_, 1.0f)) return;
        stepBy(direction_, 1.0f);
    }
    const float frac = speed_ - static_cast<float>(whole);
    if (frac > 0.0f && canStep(direction_, frac)) {
        stepBy(direction_, frac);
    }
}

} // namespace mz2d::sim
