#include "sim/Ghost.h"
#include <algorithm>
#include <iterator>

namespace mz2d::sim {

namespace {
Direction randomMoveDirection(RandomSource& rng) {
    constexpr std::size_t count = std::size(kMoveDirections);
    return kMoveDirections[std::min(rng.pick(count), count - 1)];
}
}

const char* to_string(GhostState s) noexcept {
    switch (s) {
        case GhostState::Normal: return "normal";
        case GhostState::Frightened: return "frightened";
        case GhostState::Dead: return "dead";
        default: return "invalid";
    }
}

Ghost::Ghost(const Maze& maze, const MotionModel& motion, Cell spawn, float speed, float radius,
             Color color, RandomSource& rng)
    : Actor(maze, motion, spawn, speed, radius), color_(color) {
    setDirection(randomMoveDirection(rng));
}

std::vector<Direction> Ghost::candidateDirections() const {
    const Cell here = cell();
    std::vector<Direction> open;
    for (const Cell& n : maze_.openNeighbors(here)) {
        open.push_back(directionBetween(here, n));
    }
    if (open.size() > 1) {
        const Direction back = opposite(direction());
        open.erase(std::remove(open.begin(), open.end(), back), open.end());
    }
    return open;
}

void Ghost::update(RandomSource& rng) {
    if (state_ == GhostState::Dead) return;
    if (isCentered()) {
        auto options = candidateDirections();
        if (!options.empty()) {
            snapToCenter();
            setDirection(options[std::min(rng.pick(options.size()), options.size() - 1)]);
        }
    }
    advance();
}

bool Ghost::frighten() {
    if (state_ != GhostState::Normal) return false;
    state_ = GhostState::Frightened;
    return true;
}

bool Ghost::calm() {
    if (state_ != GhostState::Frightened) return false;
    state_ = GhostState::Normal;
    return true;
}

bool Ghost::kill(std::uint64_t now, std::uint64_t delayTicks) {
    if (state_ != GhostState::Frightened) return false;
    state_ = GhostState::Dead;
    respawnAt_ = now + delayTicks;
    return true;
}

bool Ghost::tryRespawn(std::uint64_t now, RandomSource& rng) {
    if (state_ != GhostState::Dead || !respawnAt_ || now < *respawnAt_) return false;
    resetToSpawn(rng);
    return true;
}

void Ghost::resetToSpawn(RandomSource& rng) {
    placeAt(spawnCell());
    setDirection(randomMoveDirection(rng));
    state_ = GhostState::Normal;
    respawnAt_.reset();
}

} // namespace mz2d::sim
