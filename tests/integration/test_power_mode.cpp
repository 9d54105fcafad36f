// Power-mode window, ghost fright and its expiry
#include <catch2/catch_test_macros.hpp>
#include "sim/RoundController.h"
#include "sim_test_helpers.h"

using namespace mz2d::sim;
using mz2d::sim::StatusCode;
using mz2d::testing::makeLayout;
using mz2d::testing::makeRound;
using mz2d::testing::runTicks;

namespace {
// Player on a power pellet, a spare pellet, and two ghosts each sealed in its own cell
LevelLayout sealedGhosts() {
    return makeLayout({
        "#########",
        "#o#.# # #",
        "#########",
    }, Cell{1, 1}, { Cell{5, 1}, Cell{7, 1} });
}
}

TEST_CASE("power: frightens every ghost for exactly the configured ticks", "[round][integration]") {
    Tuning t;
    auto rc = makeRound(sealedGhosts(), t);
    REQUIRE(rc);

    rc->tick();
    REQUIRE(rc->session().score == 50);
    REQUIRE(rc->powerActive());
    REQUIRE(rc->powerTicksRemaining() == t.powerDurationTicks);
    REQUIRE(rc->snapshot().powerSecondsRemaining == 6);
    REQUIRE(rc->snapshot().ghosts[0].look == ActorLook::GhostFrightened);

    std::uint64_t frightenedTicks = 1;
    while (rc->ghosts()[0].isFrightened() && frightenedTicks < 1000) {
        rc->tick();
        // Both ghosts change state on the same tick
        REQUIRE(rc->ghosts()[0].state() == rc->ghosts()[1].state());
        REQUIRE(rc->powerActive() == rc->ghosts()[0].isFrightened());
        if (rc->ghosts()[0].isFrightened()) ++frightenedTicks;
    }
    REQUIRE(frightenedTicks == t.powerDurationTicks);
    REQUIRE(rc->now() == t.powerDurationTicks + 1);
    REQUIRE(rc->ghosts()[1].state() == GhostState::Normal);
    REQUIRE(rc->session().powerExpiresAt == 0);
    REQUIRE(rc->powerTicksRemaining() == 0);
    REQUIRE_FALSE(rc->snapshot().powerActive);
}

TEST_CASE("power: short windows follow the tuning", "[round][integration]") {
    Tuning t;
    t.powerDurationTicks = 5;
    auto rc = makeRound(sealedGhosts(), t);
    REQUIRE(rc);

    runTicks(*rc, 5);
    REQUIRE(rc->ghosts()[0].isFrightened());
    REQUIRE(rc->powerTicksRemaining() == 1);
    rc->tick();
    REQUIRE_FALSE(rc->ghosts()[0].isFrightened());
    REQUIRE_FALSE(rc->ghosts()[1].isFrightened());
}

TEST_CASE("power: dead ghosts are not frightened", "[round][integration]") {
    auto rc = makeRound(sealedGhosts());
    REQUIRE(rc);
    Ghost& sealed = rc->ghostForTesting(1);
    REQUIRE(sealed.frighten());
    REQUIRE(sealed.kill(0, 1000));

    rc->tick();
    REQUIRE(rc->ghosts()[0].isFrightened());
    REQUIRE(rc->ghosts()[1].state() == GhostState::Dead);
    REQUIRE(rc->snapshot().ghosts[1].look == ActorLook::GhostDead);
}

TEST_CASE("power: a second power pellet restarts the window", "[round][integration]") {
    auto rc = makeRound(makeLayout({ "#####", "#oo.#", "#####" }, Cell{1, 1}, {}));
    REQUIRE(rc);
    REQUIRE(rc->submitInput(Direction::Right) == StatusCode::OK);

    rc->tick();
    REQUIRE(rc->powerTicksRemaining() == 360);

    // x = 96 + 3 * ticks enters column 2 on tick 11
    runTicks(*rc, 9);
    REQUIRE(rc->now() == 10);
    REQUIRE(rc->powerTicksRemaining() == 351);
    rc->tick();
    REQUIRE(rc->session().score == 100);
    REQUIRE(rc->powerTicksRemaining() == 360);
    REQUIRE(rc->session().powerExpiresAt == 371);
}
