#pragma once

#include <sstream>
#include <string>

namespace reefradar {
namespace log {

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

// Process-wide threshold. Messages below it are discarded.
void set_level(Level level);
Level level();

// Parses "debug" / "info" / "warn" / "error" / "off"; unknown values map to Info.
Level level_from_string(const std::string& value);

// Reads REEFRADAR_LOG_LEVEL when set.
void init_from_environment();

bool enabled(Level level);

// Writes one line "[level] [tag] message" to stderr. Thread-safe.
void write(Level level, const char* tag, const std::string& message);

template <typename... Args>
void emit(Level lvl, const char* tag, Args&&... args) {
    if (!enabled(lvl)) return;
    std::ostringstream oss;
    (oss << ... << args);
    write(lvl, tag, oss.str());
}

}  // namespace log
}  // namespace reefradar

#define REEFRADAR_LOG_DEBUG(tag, ...) ::reefradar::log::emit(::reefradar::log::Level::Debug, tag, __VA_ARGS__)
#define REEFRADAR_LOG_INFO(tag, ...) ::reefradar::log::emit(::reefradar::log::Level::Info, tag, __VA_ARGS__)
#define REEFRADAR_LOG_WARN(tag, ...) ::reefradar::log::emit(::reefradar::log::Level::Warn, tag, __VA_ARGS__)
#define REEFRADAR_LOG_ERROR(tag, ...) ::reefradar::log::emit(::reefradar::log::Level::Error, tag, __VA_ARGS__)
