#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace mz2d::cfgvalidate {
// Dotted keys with [a-z0-9_]+ segments, e.g. "game.player_speed".
bool isValidKey(const std::string& key);

// Scalars and arrays of strings are the only value shapes the manager stores.
bool isSupportedJson(const nlohmann::json& j);
}
