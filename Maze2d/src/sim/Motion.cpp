#include "sim/Motion.h"
#include <algorithm>
#include <cmath>

namespace mz2d::sim {

MotionModel::MotionModel(int tileSize, float hudHeight, float centerTolerance)
    : tileSize_(std::max(1, tileSize)), hudHeight_(hudHeight), centerTolerance_(centerTolerance) {}

Vector2 MotionModel::cellToWorld(Cell c) const {
    const float half = tileSize_ * 0.5f;
    return { c.col * static_cast<float>(tileSize_) + half,
             c.row * static_cast<float>(tileSize_) + half + hudHeight_ };
}

Cell MotionModel::worldToCell(Vector2 pos) const {
    const float t = static_cast<float>(tileSize_);
    return { static_cast<int>(std::floor(pos.x / t)),
             static_cast<int>(std::floor((pos.y - hudHeight_) / t)) };
}

bool MotionModel::isCentered(Vector2 pos, float tolerance) const {
    Vector2 center = snapToCenter(pos);
    return std::fabs(pos.x - center.x) < tolerance && std::fabs(pos.y - center.y) < tolerance;
}

float MotionModel::toleranceFor(float speed) const {
    // The window is open on both ends, so pad by a small epsilon to cover exact boundary hits.
    return std::max(centerTolerance_, speed * 0.5f + 1e-3f);
}

} // namespace mz2d::sim
