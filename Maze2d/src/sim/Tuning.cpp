#include "sim/Tuning.h"
#include "services/configuration/ConfigurationManager.h"
#include "services/logger/LogManager.h"
#include <algorithm>
#include <limits>
#include <utility>

namespace mz2d::sim {

namespace {
// Values outside int range are clamped so validate() sees them instead of a wrapped number.
int readInt(const std::string& key, int def) {
    const std::int64_t raw = ConfigurationManager::getInt(key, def);
    constexpr std::int64_t lo = std::numeric_limits<int>::min();
    constexpr std::int64_t hi = std::numeric_limits<int>::max();
    if (raw < lo || raw > hi) {
        logging::LogManager::warn("tuning: {}={} out of range, clamped", key, raw);
        return static_cast<int>(std::clamp(raw, lo, hi));
    }
    return static_cast<int>(raw);
}
}

std::uint64_t msToTicks(std::int64_t ms, int fps) {
    if (ms <= 0 || fps <= 0) return 0;
    const auto num = static_cast<std::uint64_t>(ms) * static_cast<std::uint64_t>(fps);
    return (num + 999u) / 1000u;
}

TuningValidation Tuning::validate() const {
    TuningValidation v{};
    auto reject = [&](std::string msg) {
        v.valid = false;
        v.message = std::move(msg);
        return v;
    };
    if (fps <= 0) return reject("fps must be positive");
    if (tileSize <= 0 || tileSize % 2 != 0) return reject("tile size must be a positive even number");
    if (hudHeight < 0.0f) return reject("hud height must not be negative");
    if (playerSpeed <= 0.0f || ghostSpeed <= 0.0f) return reject("speeds must be positive");
    // A tick must not cross more than half a tile, or cell centers could be jumped.
    if (playerSpeed * 2.0f > tileSize || ghostSpeed * 2.0f > tileSize) return reject("speed exceeds half a tile per tick");
    if (collisionFactor <= 0.0f || collisionFactor >= 1.0f) return reject("collision factor must be within (0, 1)");
    if (actorRadiusFactor <= 0.0f || actorRadiusFactor > 0.5f) return reject("actor radius factor must be within (0, 0.5]");
    if (centerTolerance <= 0.0f || centerTolerance * 2.0f >= tileSize) return reject("center tolerance out of range");
    // A zero window would frighten ghosts while power mode already reads as expired.
    if (powerDurationTicks == 0) return reject("power duration must be at least one tick");
    if (startingLives <= 0) return reject("starting lives must be positive");
    if (scores.pellet < 0 || scores.powerPellet < 0 || ghostEatScore < 0) return reject("scores must not be negative");
    return v;
}

Tuning Tuning::fromConfiguration() {
    Tuning t{};
    t.fps = readInt("window.fps", t.fps);
    t.tileSize = readInt("game.tile_size", t.tileSize);
    t.hudHeight = static_cast<float>(ConfigurationManager::getDouble("game.hud_height", t.hudHeight));
    t.playerSpeed = static_cast<float>(ConfigurationManager::getDouble("game.player_speed", t.playerSpeed));
    t.ghostSpeed = static_cast<float>(ConfigurationManager::getDouble("game.ghost_speed", t.ghostSpeed));
    t.powerDurationTicks = msToTicks(ConfigurationManager::getInt("game.power_duration_ms", 6000), t.fps);
    t.respawnDelayTicks = msToTicks(ConfigurationManager::getInt("game.respawn_delay_ms", 1500), t.fps);
    t.scores.pellet = readInt("game.pellet_score", t.scores.pellet);
    t.scores.powerPellet = readInt("game.power_pellet_score", t.scores.powerPellet);
    t.ghostEatScore = readInt("game.ghost_eat_score", t.ghostEatScore);
    t.startingLives = readInt("game.starting_lives", t.startingLives);
    t.collisionFactor = static_cast<float>(ConfigurationManager::getDouble("game.collision_factor", t.collisionFactor));
    t.actorRadiusFactor = static_cast<float>(ConfigurationManager::getDouble("game.actor_radius_factor", t.actorRadiusFactor));
    t.centerTolerance = static_cast<float>(ConfigurationManager::getDouble("game.center_tolerance", t.centerTolerance));
    t.rngSeed = static_cast<std::uint64_t>(std::max<int64_t>(0, ConfigurationManager::getInt("game.rng_seed", 0)));
    logging::LogManager::debug("tuning: fps={} tile={} power={} ticks respawn={} ticks",
                               t.fps, t.tileSize, t.powerDurationTicks, t.respawnDelayTicks);
    return t;
}

} // namespace mz2d::sim
