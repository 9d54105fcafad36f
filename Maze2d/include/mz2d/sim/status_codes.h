#pragma once

// status_codes.h
// Result codes returned by the mutating simulation entry points.

#include <cstdint>

namespace mz2d::sim {

// Keep values stable; append only.
enum class StatusCode : std::uint32_t {
    OK = 0,
    INVALID_DIRECTION = 1,
    GAME_OVER = 2,
    INVALID_LAYOUT = 3,
    INVALID_TUNING = 4,
};

// Returns a stable null-terminated string literal for the status code.
const char* to_string(StatusCode code) noexcept;

} // namespace mz2d::sim
