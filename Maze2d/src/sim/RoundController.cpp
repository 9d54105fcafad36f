#include "sim/RoundController.h"
#include "services/logger/LogManager.h"
#include <raymath.h>
#include <algorithm>
#include <utility>

namespace mz2d::sim {

using logging::LogManager;

std::unique_ptr<RoundController> RoundController::create(const Tuning& tuning,
                                                         const LevelLayout& layout,
                                                         std::unique_ptr<RandomSource> rng,
                                                         StatusCode* outStatus) {
    auto fail = [&](StatusCode code) -> std::unique_ptr<RoundController> {
        if (outStatus) *outStatus = code;
        return nullptr;
    };

    TuningValidation tv = tuning.validate();
    if (!tv.valid) {
        LogManager::error("round: invalid tuning: {}", tv.message);
        return fail(StatusCode::INVALID_TUNING);
    }

    StatusCode layoutStatus = StatusCode::OK;
    auto maze = Maze::fromLayout(layout.rows, tuning.scores, &layoutStatus);
    if (!maze) {
        return fail(layoutStatus);
    }
    if (maze->isWall(layout.playerSpawn)) {
        LogManager::error("round: player spawn ({}, {}) is not an open cell", layout.playerSpawn.col, layout.playerSpawn.row);
        return fail(StatusCode::INVALID_LAYOUT);
    }
    for (const auto& spawn : layout.ghosts) {
        if (maze->isWall(spawn.cell)) {
            LogManager::error("round: ghost spawn ({}, {}) is not an open cell", spawn.cell.col, spawn.cell.row);
            return fail(StatusCode::INVALID_LAYOUT);
        }
    }
    if (!rng) {
        rng = std::make_unique<DefaultRandomSource>(tuning.rngSeed);
    }

    if (outStatus) *outStatus = StatusCode::OK;
    return std::make_unique<RoundController>(Token{}, tuning, layout, std::move(*maze), std::move(rng));
}

RoundController::RoundController(Token, const Tuning& tuning, const LevelLayout& layout, Maze maze, std::unique_ptr<RandomSource> rng)
    : tuning_(tuning),
      rng_(std::move(rng)),
      maze_(std::move(maze)),
      motion_(tuning.tileSize, tuning.hudHeight, tuning.centerTolerance),
      player_(maze_, motion_, layout.playerSpawn, tuning.playerSpeed, tuning.actorRadius()) {
    ghosts_.reserve(layout.ghosts.size());
    for (const auto& spawn : layout.ghosts) {
        ghosts_.emplace_back(maze_, motion_, spawn.cell, tuning.ghostSpeed, tuning.actorRadius(), spawn.color, *rng_);
    }
    session_.lives = tuning_.startingLives;
    LogManager::info("round: {}x{} maze, {} consumables, {} ghost(s)",
                     maze_.cols(), maze_.rows(), maze_.remainingCount(), ghosts_.size());
}

StatusCode RoundController::submitInput(Direction dir) {
    if (!isValidDirection(dir)) {
        LogManager::warn("round: rejected input value {}", static_cast<int>(dir));
        return StatusCode::INVALID_DIRECTION;
    }
    if (session_.gameOver) return StatusCode::GAME_OVER;
    return input_.push(dir);
}

void RoundController::tick() {
    if (session_.gameOver) return;
    clock_.advance();

    if (auto intent = input_.poll()) {
        (void)player_.handleInput(*intent); // validated by InputQueue::push
    }
    player_.update();

    updateGhosts();
    updatePowerMode();
    consumeAtPlayer();
    resolveCollisions();
    checkWin();
}

void RoundController::updateGhosts() {
    const std::uint64_t now = clock_.now();
    for (size_t i = 0; i < ghosts_.size(); ++i) {
        Ghost& ghost = ghosts_[i];
        if (ghost.tryRespawn(now, *rng_)) {
            LogManager::debug("round: ghost {} respawned at tick {}", i, now);
        }
        if (ghost.isAlive()) {
            ghost.update(*rng_);
        }
    }
}

void RoundController::updatePowerMode() {
    if (session_.powerExpiresAt == 0 || clock_.now() < session_.powerExpiresAt) return;
    session_.powerExpiresAt = 0;
    for (auto& ghost : ghosts_) {
        ghost.calm();
    }
    LogManager::debug("round: power-mode expired at tick {}", clock_.now());
}

void RoundController::consumeAtPlayer() {
    ConsumeResult result = maze_.consume(player_.cell());
    session_.score += result.score;
    if (result.powerPellet) {
        startPowerMode();
    }
}

void RoundController::startPowerMode() {
    session_.powerExpiresAt = clock_.now() + tuning_.powerDurationTicks;
    int affected = 0;
    for (auto& ghost : ghosts_) {
        if (ghost.frighten() || ghost.isFrightened()) ++affected;
    }
    LogManager::debug("round: power-mode until tick {} ({} ghost(s) frightened)", session_.powerExpiresAt, affected);
}

void RoundController::resolveCollisions() {
    const float threshold = tuning_.collisionDistance();
    for (size_t i = 0; i < ghosts_.size(); ++i) {
        Ghost& ghost = ghosts_[i];
        if (!ghost.isAlive()) continue;
        if (Vector2Distance(player_.position(), ghost.position()) >= threshold) continue;

        if (ghost.isFrightened()) {
            ghost.kill(clock_.now(), tuning_.respawnDelayTicks);
            session_.score += tuning_.ghostEatScore;
            LogManager::debug("round: ghost {} eaten, respawn at tick {}", i, clock_.now() + tuning_.respawnDelayTicks);
        } else {
            loseLife();
            return;
        }
    }
}

void RoundController::loseLife() {
    session_.lives = std::max(0, session_.lives - 1);
    if (session_.lives == 0) {
        session_.gameOver = true;
        LogManager::info("round: game over, final score {}", session_.score);
        return;
    }
    LogManager::info("round: life lost, {} remaining", session_.lives);
    resetRound();
}

void RoundController::resetRound() {
    player_.reset();
    for (auto& ghost : ghosts_) {
        ghost.resetToSpawn(*rng_);
    }
    session_.powerExpiresAt = 0;
    input_.clear();
}

void RoundController::checkWin() {
    if (maze_.remainingCount() != 0 || session_.win) return;
    session_.win = true;
    session_.gameOver = true;
    LogManager::info("round: maze cleared, score {}", session_.score);
}

void RoundController::restartGame() {
    maze_.restoreConsumables();
    session_ = Session{};
    session_.lives = tuning_.startingLives;
    clock_.reset();
    resetRound();
    LogManager::info("round: game restarted");
}

bool RoundController::powerActive() const {
    return session_.powerExpiresAt != 0 && clock_.now() < session_.powerExpiresAt;
}

std::uint64_t RoundController::powerTicksRemaining() const {
    return powerActive() ? session_.powerExpiresAt - clock_.now() : 0;
}

RenderSnapshot RoundController::snapshot() const {
    RenderSnapshot snap;
    snap.cols = maze_.cols();
    snap.rows = maze_.rows();
    snap.tileSize = motion_.tileSize();
    snap.hudHeight = motion_.hudHeight();
    snap.cells.reserve(static_cast<size_t>(snap.cols * snap.rows));
    for (int r = 0; r < snap.rows; ++r) {
        for (int c = 0; c < snap.cols; ++c) {
            snap.cells.push_back(maze_.kindAt(Cell{c, r}));
        }
    }
    snap.pellets.assign(maze_.pellets().begin(), maze_.pellets().end());
    snap.powerPellets.assign(maze_.powerPellets().begin(), maze_.powerPellets().end());

    snap.player = ActorView{ player_.position(), player_.radius(), player_.direction(), ActorLook::Player,
                             Color{255, 210, 0, 255}, player_.spawnCell() };
    snap.ghosts.reserve(ghosts_.size());
    for (const auto& ghost : ghosts_) {
        ActorLook look = ActorLook::GhostNormal;
        if (ghost.state() == GhostState::Frightened) look = ActorLook::GhostFrightened;
        else if (ghost.state() == GhostState::Dead) look = ActorLook::GhostDead;
        snap.ghosts.push_back(ActorView{ ghost.position(), ghost.radius(), ghost.direction(), look,
                                         ghost.color(), ghost.spawnCell() });
    }

    snap.score = session_.score;
    snap.lives = session_.lives;
    snap.powerActive = powerActive();
    snap.powerTicksRemaining = powerTicksRemaining();
    snap.powerSecondsRemaining = tuning_.fps > 0 ? static_cast<int>(snap.powerTicksRemaining / static_cast<std::uint64_t>(tuning_.fps)) : 0;
    snap.win = session_.win;
    snap.gameOver = session_.gameOver;
    snap.tick = clock_.now();
    return snap;
}

} // namespace mz2d::sim
