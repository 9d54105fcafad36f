#pragma once
#include <cstdint>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace mz2d::jsonio {

// Files larger than this are treated as unreadable.
inline constexpr std::uintmax_t kMaxConfigBytes = 1u * 1024u * 1024u; // 1 MiB

// Returns nullopt when the file is missing, oversized, or not valid JSON.
std::optional<nlohmann::json> readJson(const std::string& path);

// Writes to a sibling temp file and renames it over the target.
bool writeJsonAtomic(const std::string& path, const nlohmann::json& j);
}
