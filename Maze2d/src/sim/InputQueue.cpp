#include "sim/InputQueue.h"

namespace mz2d::sim {

StatusCode InputQueue::push(Direction dir) {
    if (!isValidDirection(dir)) return StatusCode::INVALID_DIRECTION;
    std::lock_guard<std::mutex> lock(mtx_);
    latest_ = dir;
    return StatusCode::OK;
}

std::optional<Direction> InputQueue::poll() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::optional<Direction> out = latest_;
    latest_.reset();
    return out;
}

bool InputQueue::hasPending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return latest_.has_value();
}

void InputQueue::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    latest_.reset();
}

} // namespace mz2d::sim
