#include "sim/Grid.h"

namespace mz2d::sim {

bool isValidDirection(Direction d) noexcept {
    return static_cast<std::uint8_t>(d) <= static_cast<std::uint8_t>(Direction::Stop);
}

Direction opposite(Direction d) noexcept {
    switch (d) {
        case Direction::Up: return Direction::Down;
        case Direction::Down: return Direction::Up;
        case Direction::Left: return Direction::Right;
        case Direction::Right: return Direction::Left;
        case Direction::Stop: default: return Direction::Stop;
    }
}

Cell delta(Direction d) noexcept {
    switch (d) {
        case Direction::Up: return {0, -1};
        case Direction::Down: return {0, 1};
        case Direction::Left: return {-1, 0};
        case Direction::Right: return {1, 0};
        case Direction::Stop: default: return {0, 0};
    }
}

Cell neighbor(Cell c, Direction d) noexcept {
    Cell off = delta(d);
    return { c.col + off.col, c.row + off.row };
}

Direction directionBetween(Cell from, Cell to) noexcept {
    for (Direction d : kMoveDirections) {
        if (neighbor(from, d) == to) return d;
    }
    return Direction::Stop;
}

const char* to_string(Direction d) noexcept {
    switch (d) {
        case Direction::Up: return "up";
        case Direction::Down: return "down";
        case Direction::Left: return "left";
        case Direction::Right: return "right";
        case Direction::Stop: return "stop";
        default: return "invalid";
    }
}

} // namespace mz2d::sim
