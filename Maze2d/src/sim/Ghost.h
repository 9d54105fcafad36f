#pragma once
#include "sim/Actor.h"
#include "sim/RandomSource.h"
#include <cstdint>
#include <optional>
#include <vector>
#include <raylib.h>

namespace mz2d::sim {

enum class GhostState : std::uint8_t { Normal, Frightened, Dead };

const char* to_string(GhostState s) noexcept;

// Random-walk adversary. At every cell center it picks uniformly among the open
// directions, never reversing unless the cell is a dead end.
class Ghost final : public Actor {
public:
    Ghost(const Maze& maze, const MotionModel& motion, Cell spawn, float speed, float radius,
          Color color, RandomSource& rng);

    GhostState state() const { return state_; }
    bool isAlive() const { return state_ != GhostState::Dead; }
    bool isFrightened() const { return state_ == GhostState::Frightened; }
    Color color() const { return color_; }
    std::optional<std::uint64_t> respawnTick() const { return respawnAt_; }

    // Direction selection (when centered) followed by wall-constrained movement. No-op while dead.
    void update(RandomSource& rng);

    // Candidate directions at the current cell after the no-reverse rule.
    std::vector<Direction> candidateDirections() const;

    // Normal -> Frightened. Returns false for any other state.
    bool frighten();
    // Frightened -> Normal. Returns false for any other state.
    bool calm();
    // Frightened -> Dead with a respawn deadline at `now + delayTicks`.
    bool kill(std::uint64_t now, std::uint64_t delayTicks);
    // Dead -> Normal once the deadline is reached. Anything else is a no-op.
    bool tryRespawn(std::uint64_t now, RandomSource& rng);

    // Spawn cell, fresh random direction, alive and calm, pending respawn cancelled.
    void resetToSpawn(RandomSource& rng);

private:
    Color color_;
    GhostState state_{GhostState::Normal};
    std::optional<std::uint64_t> respawnAt_{};
};

} // namespace mz2d::sim
