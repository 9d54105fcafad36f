#include "paths.h"
#include <cstdlib>
#include <filesystem>

namespace mz2d::paths {
namespace {
	// The working directory plus this many parents are searched.
	constexpr int kParentSearchDepth = 5;
}

std::string configFilePath() {
	namespace fs = std::filesystem;
	if (const char* dir = std::getenv("MZ2D_CONFIG_DIR"); dir && *dir) {
		fs::path p(dir);
		std::error_code ec;
		fs::create_directories(p, ec);
		return (p / "config.json").string();
	}

	std::error_code ec;
	fs::path cwd = fs::current_path(ec);
	if (ec) cwd = fs::path(".");

	fs::path cur = cwd;
	for (int depth = 0; depth <= kParentSearchDepth; ++depth) {
		fs::path candidate = cur / "config.json";
		std::error_code existsEc;
		if (fs::is_regular_file(candidate, existsEc)) {
			return candidate.lexically_normal().string();
		}
		if (!cur.has_parent_path() || cur.parent_path() == cur) break;
		cur = cur.parent_path();
	}
	return (cwd / "config.json").string();
}
}
