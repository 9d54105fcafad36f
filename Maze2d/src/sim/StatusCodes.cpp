#include "mz2d/sim/status_codes.h"

namespace mz2d::sim {

const char* to_string(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK: return "OK";
        case StatusCode::INVALID_DIRECTION: return "INVALID_DIRECTION";
        case StatusCode::GAME_OVER: return "GAME_OVER";
        case StatusCode::INVALID_LAYOUT: return "INVALID_LAYOUT";
        case StatusCode::INVALID_TUNING: return "INVALID_TUNING";
        default: return "UNKNOWN_STATUS_CODE";
    }
}

} // namespace mz2d::sim
