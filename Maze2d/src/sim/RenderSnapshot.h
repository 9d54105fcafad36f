#pragma once
#include "sim/Grid.h"
#include "sim/Maze.h"
#include <raylib.h>
#include <cstdint>
#include <vector>

namespace mz2d::sim {

enum class ActorLook : std::uint8_t { Player, GhostNormal, GhostFrightened, GhostDead };

struct ActorView {
    Vector2 position{};
    float radius{0.0f};
    Direction direction{Direction::Stop};
    ActorLook look{ActorLook::Player};
    Color color{WHITE};
    Cell spawn{};
};

// Read-only copy of everything a renderer needs for one frame.
struct RenderSnapshot {
    int cols{0};
    int rows{0};
    int tileSize{0};
    float hudHeight{0.0f};
    std::vector<CellKind> cells{};      // row-major, cols * rows
    std::vector<Cell> pellets{};
    std::vector<Cell> powerPellets{};

    ActorView player{};
    std::vector<ActorView> ghosts{};

    int score{0};
    int lives{0};
    bool powerActive{false};
    std::uint64_t powerTicksRemaining{0};
    int powerSecondsRemaining{0};
    bool win{false};
    bool gameOver{false};
    std::uint64_t tick{0};

    CellKind kindAt(Cell c) const {
        if (c.col < 0 || c.col >= cols || c.row < 0 || c.row >= rows) return CellKind::Wall;
        return cells[static_cast<size_t>(c.row * cols + c.col)];
    }
};

} // namespace mz2d::sim
