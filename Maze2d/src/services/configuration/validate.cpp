#include "validate.h"
using nlohmann::json;

namespace mz2d::cfgvalidate {
bool isValidKey(const std::string& key) {
	if (key.empty()) return false;
	if (key.front() == '.' || key.back() == '.') return false;
	bool prevDot = false;
	for (char c : key) {
		if (c == '.') {
			if (prevDot) return false;
			prevDot = true;
			continue;
		}
		prevDot = false;
		if (!(c == '_' || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))) return false;
	}
	return true;
}

bool isSupportedJson(const json& j) {
	if (j.is_boolean() || j.is_string() || j.is_number()) return true;
	if (j.is_array()) {
		for (const auto& e : j) if (!e.is_string()) return false;
		return true;
	}
	return false;
}
}
