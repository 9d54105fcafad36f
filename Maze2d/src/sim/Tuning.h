#pragma once
#include "sim/Maze.h"
#include <cstdint>
#include <string>

namespace mz2d::sim {

struct TuningValidation {
    bool valid{true};
    std::string message{};
};

// Gameplay constants. Durations are expressed in simulation ticks.
struct Tuning {
    int fps{60};
    int tileSize{64};
    float hudHeight{64.0f};
    float playerSpeed{3.0f};
    float ghostSpeed{2.6f};
    std::uint64_t powerDurationTicks{360};
    std::uint64_t respawnDelayTicks{90};
    ScoreTable scores{};
    int ghostEatScore{200};
    int startingLives{3};
    float collisionFactor{0.6f};
    float actorRadiusFactor{0.35f};
    float centerTolerance{0.5f};
    std::uint64_t rngSeed{0};

    float collisionDistance() const { return tileSize * collisionFactor; }
    float actorRadius() const { return tileSize * actorRadiusFactor; }

    TuningValidation validate() const;

    // Reads the "game.*" and "window.fps" keys of ConfigurationManager.
    static Tuning fromConfiguration();
};

// ceil(ms * fps / 1000), so a duration never rounds down to fewer ticks than it spans.
std::uint64_t msToTicks(std::int64_t ms, int fps);

} // namespace mz2d::sim
