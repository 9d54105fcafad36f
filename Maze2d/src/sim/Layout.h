#pragma once
#include "sim/Grid.h"
#include <raylib.h>
#include <string>
#include <vector>

namespace mz2d::sim {

struct GhostSpawn {
    Cell cell{};
    Color color{WHITE};
};

// Built-in level: maze glyph rows plus actor spawn cells.
struct LevelLayout {
    std::vector<std::string> rows{};
    Cell playerSpawn{};
    std::vector<GhostSpawn> ghosts{};
};

// 7x7 board with two ghosts above and below the player's start.
const LevelLayout& defaultLayout();

} // namespace mz2d::sim
