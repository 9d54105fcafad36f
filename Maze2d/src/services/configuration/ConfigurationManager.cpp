#include "ConfigurationManager.h"
#include "paths.h"
#include "json_io.h"
#include "validate.h"
#include "services/logger/LogManager.h"
#include <nlohmann/json.hpp>
using nlohmann::json;
#include <filesystem>
#include <cstdlib>
#include <string_view>
#include <cctype>
#include <cerrno>
#include <mutex>
#include <map>
#include <utility>
#include <algorithm>

#if !defined(_WIN32)
extern "C" char **environ;
#endif

namespace mz2d {
namespace {
	static constexpr int kCurrentConfigVersion = 1;

	using logging::LogManager;

	json& cfg() {
		static json c;
		return c;
	}

	std::mutex& mtx() {
		static std::mutex m;
		return m;
	}

	std::map<int, std::function<void()>>& subscribers() {
		static std::map<int, std::function<void()>> subs;
		return subs;
	}

	int& next_sub_id() {
		static int id = 1;
		return id;
	}

	std::vector<ConfigurationManager::OnConfigReloadedHook>& reload_hooks() {
		static std::vector<ConfigurationManager::OnConfigReloadedHook> hooks;
		return hooks;
	}

	// Navigate JSON by dotted path; returns pointer if found else nullptr
	const json* get_by_path(const json& j, const std::string& path) {
		const json* cur = &j;
		size_t start = 0;
		while (start <= path.size()) {
			size_t dot = path.find('.', start);
			std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
			if (!cur->is_object()) return nullptr;
			auto it = cur->find(key);
			if (it == cur->end()) return nullptr;
			if (dot == std::string::npos) {
				return &(*it);
			}
			cur = &(*it);
			start = dot + 1;
		}
		return nullptr;
	}

	// Ensure objects exist along path and return reference to leaf slot
	json& ensure_json_path(json& j, const std::string& path) {
		json* cur = &j;
		size_t start = 0;
		while (start <= path.size()) {
			size_t dot = path.find('.', start);
			std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
			if (!cur->is_object()) {
				*cur = json::object();
			}
			cur = &((*cur)[key]);
			if (dot == std::string::npos) break;
			start = dot + 1;
		}
		return *cur;
	}

	json default_document() {
		json c = json::object();
		ensure_json_path(c, "version") = kCurrentConfigVersion;
		ensure_json_path(c, "window.fps") = 60;
		ensure_json_path(c, "logging.level") = "info";
		ensure_json_path(c, "logging.pattern") = "[%H:%M:%S] [%l] %v";
		ensure_json_path(c, "game.tile_size") = 64;
		ensure_json_path(c, "game.hud_height") = 64;
		ensure_json_path(c, "game.player_speed") = 3.0;
		ensure_json_path(c, "game.ghost_speed") = 2.6;
		ensure_json_path(c, "game.power_duration_ms") = 6000;
		ensure_json_path(c, "game.respawn_delay_ms") = 1500;
		ensure_json_path(c, "game.pellet_score") = 10;
		ensure_json_path(c, "game.power_pellet_score") = 50;
		ensure_json_path(c, "game.ghost_eat_score") = 200;
		ensure_json_path(c, "game.starting_lives") = 3;
		ensure_json_path(c, "game.collision_factor") = 0.6;
		ensure_json_path(c, "game.actor_radius_factor") = 0.35;
		ensure_json_path(c, "game.center_tolerance") = 0.5;
		ensure_json_path(c, "game.rng_seed") = 0;
		return c;
	}

	// Fill keys missing from a loaded document with their defaults.
	void merge_defaults(json& target, const json& defaults) {
		for (auto it = defaults.begin(); it != defaults.end(); ++it) {
			auto existing = target.find(it.key());
			if (existing == target.end()) {
				target[it.key()] = it.value();
			} else if (it.value().is_object() && existing->is_object()) {
				merge_defaults(*existing, it.value());
			}
		}
	}

	// Drop leaf values of shapes the getters cannot represent (objects inside sections, mixed arrays).
	size_t drop_unsupported(json& section, const std::string& prefix) {
		size_t dropped = 0;
		for (auto it = section.begin(); it != section.end();) {
			if (!it.value().is_object() && !cfgvalidate::isSupportedJson(it.value())) {
				LogManager::warn("config: ignoring unsupported value at '{}{}'", prefix, it.key());
				it = section.erase(it);
				++dropped;
			} else {
				++it;
			}
		}
		return dropped;
	}

	bool starts_with(std::string_view s, std::string_view pfx) {
		return s.size() >= pfx.size() && 0 == s.compare(0, pfx.size(), pfx);
	}

	std::string normalize_key(std::string key) {
		if (key.find("::") == std::string::npos) return key;
		std::string out; out.reserve(key.size());
		for (size_t i = 0; i < key.size(); ++i) {
			if (key[i] == ':' && i + 1 < key.size() && key[i + 1] == ':') {
				out.push_back('.');
				++i;
			} else {
				out.push_back(key[i]);
			}
		}
		return out;
	}

	std::string to_lower(std::string s) {
		for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
		return s;
	}

	bool is_integer(const std::string& v) {
		if (v.empty()) return false;
		size_t i = (v[0] == '-' || v[0] == '+') ? 1 : 0;
		if (i >= v.size()) return false;
		for (; i < v.size(); ++i) if (!std::isdigit(static_cast<unsigned char>(v[i]))) return false;
		return true;
	}

	bool parse_bool(std::string v, bool& out) {
		v = to_lower(std::move(v));
		if (v == "true" || v == "yes" || v == "on") { out = true; return true; }
		if (v == "false" || v == "no" || v == "off") { out = false; return true; }
		return false;
	}

	json parse_env_value(const std::string& v) {
		bool b;
		if (parse_bool(v, b)) return json(b);
		if (is_integer(v)) {
			char* end = nullptr;
			errno = 0;
			long long n = std::strtoll(v.c_str(), &end, 10);
			if (errno == 0 && end && *end == '\0') return json(n);
		}
		if (!v.empty()) {
			char* end = nullptr;
			double d = std::strtod(v.c_str(), &end);
			if (end && *end == '\0') return json(d);
		}
		return json(v);
	}

	std::string map_env_key_to_config_key(std::string_view key) {
		// GAME__PLAYER_SPEED -> game.player_speed
		std::string out;
		out.reserve(key.size());
		for (size_t i = 0; i < key.size(); ++i) {
			if (key[i] == '_' && i + 1 < key.size() && key[i + 1] == '_') {
				out.push_back('.');
				++i;
			} else {
				out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(key[i]))));
			}
		}
		return out;
	}

	size_t apply_env_overrides(json& j) {
#if defined(_WIN32)
		char** envp = _environ;
#else
		char** envp = environ;
#endif
		if (!envp) return 0;
		const std::string prefix = "MZ2D_";
		size_t count = 0;
		for (char** e = envp; *e; ++e) {
			std::string_view entry(*e);
			size_t eq = entry.find('=');
			if (eq == std::string_view::npos) continue;
			std::string_view name = entry.substr(0, eq);
			std::string_view value = entry.substr(eq + 1);
			if (!starts_with(name, prefix)) continue;
			std::string_view suffix = name.substr(prefix.size());
			// Only hierarchical names; skips control vars like MZ2D_CONFIG_DIR.
			if (suffix.find("__") == std::string_view::npos) continue;
			std::string key = map_env_key_to_config_key(suffix);
			if (!cfgvalidate::isValidKey(key)) {
				LogManager::warn("config: ignoring environment override '{}'", name);
				continue;
			}
			ensure_json_path(j, key) = parse_env_value(std::string(value));
			++count;
		}
		return count;
	}

	void backup_file(const std::filesystem::path& p) {
		std::error_code ec;
		std::filesystem::path bak = p;
		bak += ".bak";
		std::filesystem::remove(bak, ec);
		ec.clear();
		std::filesystem::rename(p, bak, ec);
		if (ec) {
			LogManager::warn("config: could not back up '{}': {}", p.string(), ec.message());
		}
	}

	enum class MigrateResult { Ok, Migrated, Fallback };

	MigrateResult migrate_if_needed(const std::string& path, json& j) {
		int version = 0;
		if (auto it = j.find("version"); it != j.end() && it->is_number_integer()) {
			version = it->get<int>();
		}
		if (version > kCurrentConfigVersion) {
			return MigrateResult::Fallback;
		}
		if (version < kCurrentConfigVersion) {
			backup_file(path);
			j["version"] = kCurrentConfigVersion;
			if (!jsonio::writeJsonAtomic(path, j)) {
				LogManager::warn("config: failed to write migrated file '{}'", path);
			}
			return MigrateResult::Migrated;
		}
		return MigrateResult::Ok;
	}
}

void ConfigurationManager::loadOrDefault() {
	json& c = cfg();
	c = default_document();
	size_t overrides = apply_env_overrides(c);
	if (overrides > 0) {
		LogManager::debug("config: applied {} environment override(s)", overrides);
	}
}

bool ConfigurationManager::load() {
	auto path = paths::configFilePath();
	auto j = jsonio::readJson(path);
	if (!j || !j->is_object()) {
		std::error_code ec;
		std::filesystem::path p(path);
		if (std::filesystem::exists(p, ec)) {
			LogManager::warn("config: '{}' is unreadable, using defaults", path);
			backup_file(p);
		}
		loadOrDefault();
		return false;
	}
	MigrateResult mr = migrate_if_needed(path, *j);
	if (mr == MigrateResult::Fallback) {
		LogManager::warn("config: '{}' has a newer version than supported, using defaults", path);
		loadOrDefault();
		return false;
	}
	merge_defaults(*j, default_document());
	for (auto it = j->begin(); it != j->end(); ++it) {
		if (it.value().is_object()) {
			drop_unsupported(it.value(), it.key() + ".");
		}
	}
	cfg() = std::move(*j);
	size_t overrides = apply_env_overrides(cfg());
	LogManager::info("config: loaded '{}' ({} override(s))", path, overrides);

	for (const auto& hook : reload_hooks()) {
		if (hook.callback) {
			hook.callback();
		}
	}
	return true;
}

bool ConfigurationManager::save() {
	auto path = paths::configFilePath();
	bool ok = jsonio::writeJsonAtomic(path, cfg());
	if (!ok) {
		LogManager::error("config: failed to save '{}'", path);
		return false;
	}
	std::map<int, std::function<void()>> copy;
	{
		std::lock_guard<std::mutex> lock(mtx());
		copy = subscribers();
	}
	for (auto& [id, cb] : copy) {
		if (cb) cb();
	}
	return true;
}

bool ConfigurationManager::getBool(const std::string& key, bool defaultValue) {
	const json* v = get_by_path(cfg(), normalize_key(key));
	if (v && v->is_boolean()) return v->get<bool>();
	return defaultValue;
}

int64_t ConfigurationManager::getInt(const std::string& key, int64_t defaultValue) {
	const json* v = get_by_path(cfg(), normalize_key(key));
	if (v && (v->is_number_integer() || v->is_number_unsigned())) return v->get<int64_t>();
	return defaultValue;
}

double ConfigurationManager::getDouble(const std::string& key, double defaultValue) {
	const json* v = get_by_path(cfg(), normalize_key(key));
	if (v && v->is_number()) return v->get<double>();
	return defaultValue;
}

std::string ConfigurationManager::getString(const std::string& key, const std::string& defaultValue) {
	const json* v = get_by_path(cfg(), normalize_key(key));
	if (v && v->is_string()) return v->get<std::string>();
	return defaultValue;
}

void ConfigurationManager::set(const std::string& key, bool value) { ensure_json_path(cfg(), normalize_key(key)) = value; }
void ConfigurationManager::set(const std::string& key, int64_t value) { ensure_json_path(cfg(), normalize_key(key)) = value; }
void ConfigurationManager::set(const std::string& key, double value) { ensure_json_path(cfg(), normalize_key(key)) = value; }
void ConfigurationManager::set(const std::string& key, const std::string& value) { ensure_json_path(cfg(), normalize_key(key)) = value; }

int ConfigurationManager::subscribeOnChange(const std::function<void()>& cb) {
	std::lock_guard<std::mutex> lock(mtx());
	int id = next_sub_id()++;
	subscribers()[id] = cb;
	return id;
}

void ConfigurationManager::unsubscribe(int id) {
	std::lock_guard<std::mutex> lock(mtx());
	subscribers().erase(id);
}

std::string ConfigurationManager::exportCompact() {
	return cfg().dump();
}

const json& ConfigurationManager::raw() {
	return cfg();
}

void ConfigurationManager::pushReloadHook(const OnConfigReloadedHook& hook) {
	if (!hook.callback) {
		return;
	}
	auto& hooks = reload_hooks();
	const bool exists = std::any_of(hooks.begin(), hooks.end(), [&](const OnConfigReloadedHook& existing) {
		return !existing.name.empty() && existing.name == hook.name;
	});
	if (exists) {
		return;
	}
	hooks.push_back(hook);
}
}
