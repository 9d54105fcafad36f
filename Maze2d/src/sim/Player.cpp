#include "sim/Player.h"

namespace mz2d::sim {

Player::Player(const Maze& maze, const MotionModel& motion, Cell spawn, float speed, float radius)
    : Actor(maze, motion, spawn, speed, radius) {}

StatusCode Player::handleInput(Direction dir) {
    if (!isValidDirection(dir)) return StatusCode::INVALID_DIRECTION;
    pending_ = dir;
    return StatusCode::OK;
}

void Player::update() {
    if (pending_ != direction() && isCentered() && !maze_.isWall(neighbor(cell(), pending_))) {
        snapToCenter();
        setDirection(pending_);
    }
    advance();
}

void Player::reset() {
    placeAt(spawnCell());
    setDirection(Direction::Stop);
    pending_ = Direction::Stop;
}

} // namespace mz2d::sim
