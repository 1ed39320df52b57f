#include "reefradar/Log.h"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace reefradar {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_write_mutex;

const char* level_tag(Level level) {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warn:
            return "warn";
        case Level::Error:
            return "error";
        case Level::Off:
            return "off";
    }
    return "info";
}

}  // namespace

void set_level(Level level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

Level level_from_string(const std::string& value) {
    if (value == "debug") return Level::Debug;
    if (value == "info") return Level::Info;
    if (value == "warn" || value == "warning") return Level::Warn;
    if (value == "error") return Level::Error;
    if (value == "off") return Level::Off;
    return Level::Info;
}

void init_from_environment() {
    if (const char* env = std::getenv("REEFRADAR_LOG_LEVEL")) {
        set_level(level_from_string(env));
    }
}

bool enabled(Level lvl) {
    return lvl != Level::Off && static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

void write(Level lvl, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fprintf(stderr, "[%s] [%s] %s\n", level_tag(lvl), tag ? tag : "reefradar", message.c_str());
    std::fflush(stderr);
}

}  // namespace log
}  // namespace reefradar
