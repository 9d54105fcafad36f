#pragma once
#include <string>

namespace mz2d::paths {
// Resolves the config.json location: MZ2D_CONFIG_DIR, then the working
// directory and its parents, then ./config.json.
std::string configFilePath();
}
