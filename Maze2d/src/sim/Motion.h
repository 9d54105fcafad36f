#pragma once
#include "sim/Grid.h"
#include <raylib.h>

namespace mz2d::sim {

// Conversions between cells and world (pixel) space. The maze is drawn below a
// HUD band, so row 0 starts at y = hudHeight.
class MotionModel {
public:
    MotionModel(int tileSize, float hudHeight, float centerTolerance);

    Vector2 cellToWorld(Cell c) const;
    Cell worldToCell(Vector2 pos) const;

    // Offset from the containing cell's center is below the default tolerance on both axes.
    bool isCentered(Vector2 pos) const { return isCentered(pos, centerTolerance_); }
    bool isCentered(Vector2 pos, float tolerance) const;

    Vector2 snapToCenter(Vector2 pos) const { return cellToWorld(worldToCell(pos)); }

    // Tolerance an actor moving `speed` units per tick needs so that one tick-start
    // position lands inside the window around every cell center it crosses.
    float toleranceFor(float speed) const;

    int tileSize() const { return tileSize_; }
    float hudHeight() const { return hudHeight_; }
    float centerTolerance() const { return centerTolerance_; }

private:
    int tileSize_;
    float hudHeight_;
    float centerTolerance_;
};

} // namespace mz2d::sim
