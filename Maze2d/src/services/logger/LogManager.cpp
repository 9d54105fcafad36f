#include "LogManager.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace mz2d::logging {
namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_mtx;

    // Recent lines, kept across shutdown so a re-init does not lose them.
    constexpr size_t kDefaultHistoryCapacity = 2000;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> g_history;
    size_t g_history_capacity = kDefaultHistoryCapacity;

    // Caller holds g_mtx.
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> history_locked() {
        if (!g_history) g_history = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(g_history_capacity);
        return g_history;
    }

    // Swaps in an empty ring of the given capacity. Caller holds g_mtx.
    void replace_history_locked(size_t cap) {
        auto fresh = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(cap);
        if (g_logger && g_history) {
            fresh->set_level(g_history->level());
            auto& sinks = g_logger->sinks();
            std::replace(sinks.begin(), sinks.end(), spdlog::sink_ptr(g_history), spdlog::sink_ptr(fresh));
        }
        g_history = std::move(fresh);
        g_history_capacity = cap;
    }

    // Caller holds g_mtx.
    Status init_locked(const Config& cfg, void (*apply)(const Config&)) {
        if (g_logger) return Status::already_initialized;
        try {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            auto history_sink = history_locked();
            std::vector<spdlog::sink_ptr> sinks{ console_sink, history_sink };
            g_logger = std::make_shared<spdlog::logger>(cfg.name, sinks.begin(), sinks.end());
            spdlog::register_logger(g_logger);
            apply(cfg);
            return Status::ok;
        } catch (const spdlog::spdlog_ex&) {
            g_logger.reset();
            return Status::error;
        }
    }
}

std::shared_ptr<spdlog::logger>& LogManager::logger() { return g_logger; }

int LogManager::to_spd(Level lvl) {
    using spd = spdlog::level::level_enum;
    switch (lvl) {
        case Level::trace: return (int)spd::trace;
        case Level::debug: return (int)spd::debug;
        case Level::info: return (int)spd::info;
        case Level::warn: return (int)spd::warn;
        case Level::err: return (int)spd::err;
        case Level::critical: return (int)spd::critical;
        case Level::off: default: return (int)spd::off;
    }
}

void LogManager::apply_config(const Config& cfg) {
    if (!g_logger) return;
    g_logger->set_level((spdlog::level::level_enum)to_spd(cfg.level));
    g_logger->set_pattern(cfg.pattern);
}

Status LogManager::init(const Config& cfg) {
    std::lock_guard<std::mutex> lock(g_mtx);
    return init_locked(cfg, &LogManager::apply_config);
}

bool LogManager::isInitialized() {
    std::lock_guard<std::mutex> lock(g_mtx);
    return (bool)g_logger;
}

Status LogManager::reconfigure(const Config& cfg) {
    std::lock_guard<std::mutex> lock(g_mtx);
    if (!g_logger) return Status::not_initialized;
    try { apply_config(cfg); return Status::ok; } catch (const spdlog::spdlog_ex&) { return Status::error; }
}

Status LogManager::shutdown() {
    std::lock_guard<std::mutex> lock(g_mtx);
    if (!g_logger) return Status::not_initialized;
    spdlog::drop(g_logger->name());
    g_logger.reset();
    return Status::ok;
}

void LogManager::log_string(Level lvl, std::string_view message) {
    std::shared_ptr<spdlog::logger> local;
    {
        std::lock_guard<std::mutex> lock(g_mtx);
        if (!g_logger) {
            (void)init_locked(Config{}, &LogManager::apply_config);
        }
        local = g_logger;
    }
    if (!local) return;
    switch (lvl) {
        case Level::trace: local->trace("{}", message); break;
        case Level::debug: local->debug("{}", message); break;
        case Level::info:  local->info("{}", message); break;
        case Level::warn:  local->warn("{}", message); break;
        case Level::err:   local->error("{}", message); break;
        case Level::critical: local->critical("{}", message); break;
        case Level::off: default: break;
    }
}

std::optional<Level> parse_level(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "trace") return Level::trace;
    if (lower == "debug") return Level::debug;
    if (lower == "info") return Level::info;
    if (lower == "warn" || lower == "warning") return Level::warn;
    if (lower == "error" || lower == "err") return Level::err;
    if (lower == "critical") return Level::critical;
    if (lower == "off") return Level::off;
    return std::nullopt;
}

std::vector<LogLine> read_log_lines_snapshot(size_t max_lines) {
    std::vector<LogLine> out;
    if (max_lines == 0) return out;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> history;
    {
        std::lock_guard<std::mutex> lock(g_mtx);
        history = g_history;
    }
    if (!history) return out;
    auto raw = history->last_raw(max_lines);
    out.reserve(raw.size());
    for (const auto& msg : raw) {
        Level lvl = Level::info;
        switch (msg.level) {
            case spdlog::level::trace: lvl = Level::trace; break;
            case spdlog::level::debug: lvl = Level::debug; break;
            case spdlog::level::info: lvl = Level::info; break;
            case spdlog::level::warn: lvl = Level::warn; break;
            case spdlog::level::err: lvl = Level::err; break;
            case spdlog::level::critical: lvl = Level::critical; break;
            default: lvl = Level::info; break;
        }
        out.push_back(LogLine{ lvl, std::string(msg.payload.data(), msg.payload.size()) });
    }
    return out;
}

const char* level_to_label(Level l) {
    switch (l) {
        case Level::trace: return "TRACE";
        case Level::debug: return "DEBUG";
        case Level::info: return "INFO";
        case Level::warn: return "WARN";
        case Level::err: return "ERROR";
        case Level::critical: return "CRIT";
        case Level::off: default: return "OFF";
    }
}

void clear_log_buffer() {
    std::lock_guard<std::mutex> lock(g_mtx);
    replace_history_locked(g_history_capacity);
}

void set_log_buffer_capacity(size_t cap) {
    std::lock_guard<std::mutex> lock(g_mtx);
    replace_history_locked(cap);
}

} // namespace mz2d::logging
