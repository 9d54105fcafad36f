#include "sim/Maze.h"
#include "services/logger/LogManager.h"
#include <string_view>

namespace mz2d::sim {

using logging::LogManager;

std::optional<Maze> Maze::fromLayout(const std::vector<std::string>& rows, ScoreTable scores, StatusCode* outStatus) {
    auto fail = [&](std::string_view why) -> std::optional<Maze> {
        LogManager::error("maze: rejected layout: {}", why);
        if (outStatus) *outStatus = StatusCode::INVALID_LAYOUT;
        return std::nullopt;
    };

    if (rows.empty() || rows.front().empty()) {
        return fail("layout is empty");
    }

    Maze maze;
    maze.rows_ = static_cast<int>(rows.size());
    maze.cols_ = static_cast<int>(rows.front().size());
    maze.scores_ = scores;
    maze.cells_.reserve(static_cast<size_t>(maze.rows_ * maze.cols_));

    for (int r = 0; r < maze.rows_; ++r) {
        const std::string& line = rows[static_cast<size_t>(r)];
        if (static_cast<int>(line.size()) != maze.cols_) {
            return fail("rows have different widths");
        }
        for (int c = 0; c < maze.cols_; ++c) {
            switch (line[static_cast<size_t>(c)]) {
                case '#':
                    maze.cells_.push_back(CellKind::Wall);
                    break;
                case '.':
                    maze.cells_.push_back(CellKind::Open);
                    maze.initialPellets_.insert(Cell{c, r});
                    break;
                case 'o':
                    maze.cells_.push_back(CellKind::Open);
                    maze.initialPowerPellets_.insert(Cell{c, r});
                    break;
                case ' ':
                    maze.cells_.push_back(CellKind::Open);
                    break;
                default:
                    return fail("unknown glyph");
            }
        }
    }

    maze.restoreConsumables();
    if (outStatus) *outStatus = StatusCode::OK;
    return maze;
}

bool Maze::inBounds(Cell c) const {
    return c.col >= 0 && c.col < cols_ && c.row >= 0 && c.row < rows_;
}

bool Maze::isWall(Cell c) const {
    if (!inBounds(c)) return true;
    return cells_[static_cast<size_t>(c.row * cols_ + c.col)] == CellKind::Wall;
}

ConsumeResult Maze::consume(Cell c) {
    if (pellets_.erase(c) > 0) {
        return ConsumeResult{ scores_.pellet, false };
    }
    if (powerPellets_.erase(c) > 0) {
        return ConsumeResult{ scores_.powerPellet, true };
    }
    return {};
}

std::vector<Cell> Maze::openNeighbors(Cell c) const {
    std::vector<Cell> out;
    out.reserve(4);
    for (Direction d : kMoveDirections) {
        Cell n = neighbor(c, d);
        if (!isWall(n)) out.push_back(n);
    }
    return out;
}

void Maze::restoreConsumables() {
    pellets_ = initialPellets_;
    powerPellets_ = initialPowerPellets_;
}

} // namespace mz2d::sim
