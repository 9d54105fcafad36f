#pragma once
#include "sim/Grid.h"
#include "mz2d/sim/status_codes.h"
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace mz2d::sim {

enum class CellKind : std::uint8_t { Open, Wall };

struct ScoreTable {
    int pellet{10};
    int powerPellet{50};
};

struct ConsumeResult {
    int score{0};
    bool powerPellet{false};
};

using CellSet = std::unordered_set<Cell, CellHash>;

// Static wall topology plus the shrinking sets of pellets and power pellets.
//
// Layout glyphs: '#' wall, '.' pellet, 'o' power pellet, ' ' open floor.
// Everything outside the layout counts as wall.
class Maze {
public:
    static std::optional<Maze> fromLayout(const std::vector<std::string>& rows,
                                          ScoreTable scores = {},
                                          StatusCode* outStatus = nullptr);

    int cols() const { return cols_; }
    int rows() const { return rows_; }

    bool inBounds(Cell c) const;
    bool isWall(Cell c) const;
    CellKind kindAt(Cell c) const { return isWall(c) ? CellKind::Wall : CellKind::Open; }

    // Removes the consumable at `c` (if any) and reports its score. Repeat calls return zero.
    ConsumeResult consume(Cell c);

    int remainingCount() const { return static_cast<int>(pellets_.size() + powerPellets_.size()); }

    // Non-wall neighbors in Up, Down, Left, Right order.
    std::vector<Cell> openNeighbors(Cell c) const;

    const CellSet& pellets() const { return pellets_; }
    const CellSet& powerPellets() const { return powerPellets_; }
    bool hasPellet(Cell c) const { return pellets_.count(c) > 0; }
    bool hasPowerPellet(Cell c) const { return powerPellets_.count(c) > 0; }

    const ScoreTable& scores() const { return scores_; }

    // Puts every consumable from the layout back (full game restart only).
    void restoreConsumables();

private:
    Maze() = default;

    int cols_{0};
    int rows_{0};
    std::vector<CellKind> cells_{};
    CellSet pellets_{};
    CellSet powerPellets_{};
    CellSet initialPellets_{};
    CellSet initialPowerPellets_{};
    ScoreTable scores_{};
};

} // namespace mz2d::sim
