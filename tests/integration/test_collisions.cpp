// Player/ghost contact: eating, losing lives, resets and game over
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "sim/RoundController.h"
#include "sim_test_helpers.h"
#include <raymath.h>
#include <functional>

using namespace mz2d::sim;
using mz2d::sim::StatusCode;
using mz2d::testing::makeLayout;
using mz2d::testing::makeRound;
using mz2d::testing::runTicks;
using Catch::Matchers::WithinAbs;

namespace {
// One corridor from the player's start to a ghost five cells away, plus a sealed pellet so
// the board is never cleared.
LevelLayout corridor(bool powerPelletAtStart) {
    return makeLayout({
        "#######",
        powerPelletAtStart ? "#o    #" : "#     #",
        "#######",
        "#.#####",
        "#######",
    }, Cell{1, 1}, { Cell{5, 1} });
}

float ghostDistance(const RoundController& rc, size_t i = 0) {
    return Vector2Distance(rc.player().position(), rc.ghosts()[i].position());
}

int tickUntil(RoundController& rc, const std::function<bool()>& done, int maxTicks = 1000) {
    int n = 0;
    while (!done() && n < maxTicks) {
        rc.tick();
        ++n;
    }
    return n;
}
}

TEST_CASE("collision: a normal ghost costs exactly one life and resets positions", "[round][integration]") {
    auto rc = makeRound(corridor(false));
    REQUIRE(rc);
    // Blocked by the wall above, so it stays buffered until the reset clears it
    REQUIRE(rc->submitInput(Direction::Up) == StatusCode::OK);

    const float threshold = rc->tuning().collisionDistance();
    float before = ghostDistance(*rc);
    while (rc->session().lives == 3 && rc->now() < 1000) {
        before = ghostDistance(*rc);
        rc->tick();
    }
    REQUIRE(rc->session().lives == 2);
    REQUIRE_FALSE(rc->session().gameOver);
    REQUIRE(rc->session().score == 0);

    // The contact is detected on the first tick the gap drops below the threshold
    REQUIRE(before >= threshold);
    REQUIRE(before < threshold + rc->tuning().ghostSpeed + 2.0f);

    const Vector2 playerHome = rc->motion().cellToWorld(Cell{1, 1});
    const Vector2 ghostHome = rc->motion().cellToWorld(Cell{5, 1});
    REQUIRE(rc->player().position().x == playerHome.x);
    REQUIRE(rc->player().position().y == playerHome.y);
    REQUIRE(rc->player().direction() == Direction::Stop);
    REQUIRE(rc->player().pendingDirection() == Direction::Stop);
    REQUIRE(rc->ghosts()[0].position().x == ghostHome.x);
    REQUIRE(rc->ghosts()[0].position().y == ghostHome.y);
    REQUIRE_FALSE(rc->input().hasPending());
}

TEST_CASE("collision: a frightened ghost is eaten, stays harmless, then respawns", "[round][integration]") {
    Tuning t;
    auto rc = makeRound(corridor(true), t);
    REQUIRE(rc);

    rc->tick();
    REQUIRE(rc->session().score == 50);
    REQUIRE(rc->ghosts()[0].isFrightened());

    tickUntil(*rc, [&]{ return !rc->ghosts()[0].isAlive(); });
    REQUIRE(rc->ghosts()[0].state() == GhostState::Dead);
    REQUIRE(rc->session().lives == 3);
    REQUIRE(rc->session().score == 50 + t.ghostEatScore);
    REQUIRE(ghostDistance(*rc) < t.collisionDistance());

    const std::uint64_t killedAt = rc->now();
    REQUIRE(rc->ghosts()[0].respawnTick() == std::optional<std::uint64_t>{killedAt + t.respawnDelayTicks});

    // Still overlapping the player, but dead ghosts neither move nor collide
    runTicks(*rc, static_cast<int>(t.respawnDelayTicks) - 1);
    REQUIRE(rc->ghosts()[0].state() == GhostState::Dead);
    REQUIRE(rc->session().lives == 3);
    REQUIRE(rc->session().score == 50 + t.ghostEatScore);

    rc->tick();
    REQUIRE(rc->now() == killedAt + t.respawnDelayTicks);
    REQUIRE(rc->ghosts()[0].state() == GhostState::Normal);
    REQUIRE(rc->ghosts()[0].cell() == Cell{5, 1});
    // Power-mode is still running, but a respawned ghost comes back calm
    REQUIRE(rc->powerActive());

    tickUntil(*rc, [&]{ return rc->session().lives < 3; });
    REQUIRE(rc->session().lives == 2);
    REQUIRE_FALSE(rc->powerActive());
    REQUIRE(rc->session().powerExpiresAt == 0);
    REQUIRE(rc->session().score == 50 + t.ghostEatScore);
    // Round resets keep the board as it was
    REQUIRE(rc->maze().remainingCount() == 1);
}

TEST_CASE("collision: losing the last life ends the game without a reset", "[round][integration]") {
    Tuning t;
    t.startingLives = 1;
    auto rc = makeRound(corridor(false), t);
    REQUIRE(rc);

    tickUntil(*rc, [&]{ return rc->session().gameOver; });
    REQUIRE(rc->session().gameOver);
    REQUIRE_FALSE(rc->session().win);
    REQUIRE(rc->session().lives == 0);
    REQUIRE(ghostDistance(*rc) < t.collisionDistance());

    const std::uint64_t frozenAt = rc->now();
    const Vector2 ghostAt = rc->ghosts()[0].position();
    runTicks(*rc, 10);
    REQUIRE(rc->now() == frozenAt);
    REQUIRE(rc->ghosts()[0].position().x == ghostAt.x);
    REQUIRE(rc->submitInput(Direction::Right) == StatusCode::GAME_OVER);
    REQUIRE(rc->snapshot().gameOver);

    rc->restartGame();
    REQUIRE(rc->session().lives == 1);
    REQUIRE_FALSE(rc->session().gameOver);
    REQUIRE(rc->now() == 0);
    REQUIRE(rc->submitInput(Direction::Right) == StatusCode::OK);
}

TEST_CASE("collision: eating a frightened ghost on contact", "[round][integration]") {
    auto rc = makeRound(defaultLayout());
    REQUIRE(rc);
    Ghost& g = rc->ghostForTesting(0);
    REQUIRE(g.frighten());
    g.placeAt(Cell{3, 3});

    rc->tick();
    REQUIRE(rc->ghosts()[0].state() == GhostState::Dead);
    REQUIRE(rc->ghosts()[0].respawnTick() == std::optional<std::uint64_t>{1 + rc->tuning().respawnDelayTicks});
    REQUIRE(rc->session().lives == 3);
    REQUIRE(rc->session().score == 10 + 200);
}

TEST_CASE("collision: a dead ghost on the player is ignored", "[round][integration]") {
    auto rc = makeRound(defaultLayout());
    REQUIRE(rc);
    Ghost& g = rc->ghostForTesting(0);
    REQUIRE(g.frighten());
    REQUIRE(g.kill(0, 90));
    g.placeAt(Cell{3, 3});

    runTicks(*rc, 5);
    REQUIRE(rc->session().lives == 3);
    REQUIRE(rc->session().score == 10);
    REQUIRE(rc->ghosts()[0].state() == GhostState::Dead);
}

TEST_CASE("collision: a round reset cancels pending respawns", "[round][integration]") {
    auto rc = makeRound(defaultLayout());
    REQUIRE(rc);
    Ghost& eaten = rc->ghostForTesting(0);
    REQUIRE(eaten.frighten());
    REQUIRE(eaten.kill(0, 90));
    rc->ghostForTesting(1).placeAt(Cell{3, 3});

    rc->tick();
    REQUIRE(rc->session().lives == 2);
    REQUIRE(rc->ghosts()[0].state() == GhostState::Normal);
    REQUIRE_FALSE(rc->ghosts()[0].respawnTick().has_value());
    REQUIRE(rc->ghosts()[0].cell() == Cell{3, 1});
    REQUIRE(rc->ghosts()[1].cell() == Cell{3, 5});
}

TEST_CASE("collision: ghosts resolve in order within one tick", "[round][integration]") {
    auto rc = makeRound(defaultLayout());
    REQUIRE(rc);
    Ghost& frightened = rc->ghostForTesting(0);
    REQUIRE(frightened.frighten());
    frightened.placeAt(Cell{3, 3});
    rc->ghostForTesting(1).placeAt(Cell{3, 3});

    rc->tick();
    // The first ghost is eaten, the second still costs a life and resets the round
    REQUIRE(rc->session().score == 10 + 200);
    REQUIRE(rc->session().lives == 2);
    REQUIRE(rc->ghosts()[0].state() == GhostState::Normal);
    REQUIRE_FALSE(rc->ghosts()[0].respawnTick().has_value());
}
