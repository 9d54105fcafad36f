#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

namespace mz2d::sim {

// A discrete maze coordinate.
struct Cell {
    int col{0};
    int row{0};

    bool operator==(const Cell&) const = default;
};

struct CellHash {
    std::size_t operator()(const Cell& c) const noexcept {
        return std::hash<std::int64_t>{}((static_cast<std::int64_t>(c.col) << 32) ^ static_cast<std::uint32_t>(c.row));
    }
};

enum class Direction : std::uint8_t { Up, Down, Left, Right, Stop };

inline constexpr Direction kMoveDirections[] = { Direction::Up, Direction::Down, Direction::Left, Direction::Right };

// False for values outside the five enumerators (e.g. a cast from raw input).
bool isValidDirection(Direction d) noexcept;

Direction opposite(Direction d) noexcept;

// Unit offset of a direction; Stop maps to {0, 0}.
Cell delta(Direction d) noexcept;

Cell neighbor(Cell c, Direction d) noexcept;

// Direction leading from `from` to an orthogonally adjacent `to`; Stop otherwise.
Direction directionBetween(Cell from, Cell to) noexcept;

const char* to_string(Direction d) noexcept;

} // namespace mz2d::sim
