#pragma once
#include "sim/Ghost.h"
#include "sim/InputQueue.h"
#include "sim/Layout.h"
#include "sim/Maze.h"
#include "sim/Motion.h"
#include "sim/Player.h"
#include "sim/RandomSource.h"
#include "sim/RenderSnapshot.h"
#include "sim/TickClock.h"
#include "sim/Tuning.h"
#include "mz2d/sim/status_codes.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace mz2d::sim {

// Mutable per-game state owned by the round controller.
struct Session {
    int score{0};
    int lives{0};
    std::uint64_t powerExpiresAt{0}; // 0 = power-mode inactive
    bool win{false};
    bool gameOver{false};
};

// Drives one game: owns the maze, the actors and the session, and advances them
// in a fixed order once per tick.
class RoundController {
    struct Token { explicit Token() = default; };

public:
    static std::unique_ptr<RoundController> create(const Tuning& tuning,
                                                   const LevelLayout& layout,
                                                   std::unique_ptr<RandomSource> rng,
                                                   StatusCode* outStatus = nullptr);

    // Only reachable through create(), which validates its inputs first.
    RoundController(Token, const Tuning& tuning, const LevelLayout& layout, Maze maze, std::unique_ptr<RandomSource> rng);
    RoundController(const RoundController&) = delete;
    RoundController& operator=(const RoundController&) = delete;

    // Queues a direction intent for the next tick.
    StatusCode submitInput(Direction dir);

    // Advances the simulation by one step. Does nothing once the game is over.
    void tick();

    // Restores pellets, score, lives, positions and clears all timers.
    void restartGame();

    RenderSnapshot snapshot() const;

    const Session& session() const { return session_; }
    const Maze& maze() const { return maze_; }
    const MotionModel& motion() const { return motion_; }
    const Player& player() const { return player_; }
    const std::vector<Ghost>& ghosts() const { return ghosts_; }
    const Tuning& tuning() const { return tuning_; }
    std::uint64_t now() const { return clock_.now(); }
    InputQueue& input() { return input_; }

    bool powerActive() const;
    std::uint64_t powerTicksRemaining() const;

    // Test hooks
    Player& playerForTesting() { return player_; }
    Ghost& ghostForTesting(std::size_t index) { return ghosts_.at(index); }
    Session& sessionForTesting() { return session_; }

private:
    void updateGhosts();
    void updatePowerMode();
    void consumeAtPlayer();
    void startPowerMode();
    void resolveCollisions();
    void loseLife();
    void resetRound();
    void checkWin();

    Tuning tuning_;
    std::unique_ptr<RandomSource> rng_;
    Maze maze_;
    MotionModel motion_;
    Player player_;
    std::vector<Ghost> ghosts_{};
    Session session_{};
    TickClock clock_{};
    InputQueue input_{};
};

} // namespace mz2d::sim
