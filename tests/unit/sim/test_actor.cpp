#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "sim/Actor.h"

using namespace mz2d::sim;
using Catch::Matchers::WithinAbs;

namespace {
class SteeredActor : public Actor {
public:
    using Actor::Actor;
    void steer(Direction d) { setDirection(d); }
};

Maze corridor() {
    // Three open cells in a row, (1,1) to (3,1)
    auto maze = Maze::fromLayout({ "#####", "#   #", "#####" });
    REQUIRE(maze.has_value());
    return *maze;
}
}

TEST_CASE("actor: starts centered on its spawn cell, stopped", "[actor]") {
    Maze maze = corridor();
    MotionModel motion(64, 64.0f, 0.5f);
    SteeredActor a(maze, motion, Cell{1, 1}, 3.0f, 22.4f);

    REQUIRE(a.cell() == Cell{1, 1});
    REQUIRE(a.spawnCell() == Cell{1, 1});
    REQUIRE(a.direction() == Direction::Stop);
    REQUIRE(a.isCentered());

    a.advance();
    REQUIRE_THAT(a.position().x, WithinAbs(96.0, 1e-4));
}

TEST_CASE("actor: advances speed units per tick along its direction", "[actor]") {
    Maze maze = corridor();
    MotionModel motion(64, 64.0f, 0.5f);
    SteeredActor a(maze, motion, Cell{1, 1}, 3.0f, 22.4f);
    a.steer(Direction::Right);

    a.advance();
    REQUIRE_THAT(a.position().x, WithinAbs(99.0, 1e-4));
    REQUIRE_THAT(a.position().y, WithinAbs(96.0, 1e-4));
    a.advance();
    REQUIRE_THAT(a.position().x, WithinAbs(102.0, 1e-4));
}

TEST_CASE("actor: fractional speed moves whole steps plus the remainder", "[actor]") {
    Maze maze = corridor();
    MotionModel motion(64, 64.0f, 0.5f);
    SteeredActor a(maze, motion, Cell{1, 1}, 2.6f, 22.4f);
    a.steer(Direction::Right);

    a.advance();
    REQUIRE_THAT(a.position().x, WithinAbs(98.6, 1e-3));
    a.advance();
    REQUIRE_THAT(a.position().x, WithinAbs(101.2, 1e-3));
}

TEST_CASE("actor: halts in front of a wall but keeps its direction", "[actor]") {
    Maze maze = corridor();
    MotionModel motion(64, 64.0f, 0.5f);
    SteeredActor a(maze, motion, Cell{1, 1}, 3.0f, 22.4f);
    a.steer(Direction::Right);

    for (int i = 0; i < 100; ++i) {
        a.advance();
        REQUIRE_FALSE(maze.isWall(a.cell()));
    }
    REQUIRE(a.cell() == Cell{3, 1});
    REQUIRE(a.isCentered());
    REQUIRE(a.direction() == Direction::Right);

    const float x = a.position().x;
    a.advance();
    REQUIRE(a.position().x == x);
}

TEST_CASE("actor: a centered actor cannot step toward a wall cell", "[actor]") {
    Maze maze = corridor();
    MotionModel motion(64, 64.0f, 0.5f);
    SteeredActor a(maze, motion, Cell{2, 1}, 3.0f, 22.4f);

    REQUIRE_FALSE(a.canStep(Direction::Up, 1.0f));
    REQUIRE_FALSE(a.canStep(Direction::Down, 1.0f));
    REQUIRE(a.canStep(Direction::Left, 1.0f));
    REQUIRE(a.canStep(Direction::Right, 1.0f));
    REQUIRE_FALSE(a.canStep(Direction::Stop, 1.0f));

    a.steer(Direction::Up);
    a.advance();
    REQUIRE_THAT(a.position().y, WithinAbs(96.0, 1e-4));
    REQUIRE(a.direction() == Direction::Up);
}

TEST_CASE("actor: placeAt moves to a cell center", "[actor]") {
    Maze maze = corridor();
    MotionModel motion(64, 64.0f, 0.5f);
    SteeredActor a(maze, motion, Cell{1, 1}, 3.0f, 22.4f);
    a.placeAt(Cell{3, 1});
    REQUIRE(a.cell() == Cell{3, 1});
    REQUIRE_THAT(a.position().x, WithinAbs(224.0, 1e-4));
    REQUIRE(a.spawnCell() == Cell{1, 1});
}
