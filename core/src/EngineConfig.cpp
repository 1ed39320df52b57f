#include "reefradar/EngineConfig.h"
#include "reefradar/Errors.h"

#include <cstdlib>
#include <string>

namespace reefradar {

namespace {

// Parses a non-negative decimal integer; rejects signs, blanks and trailing text.
unsigned long long parse_count(const char* name, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ReefError(ErrorCode::ProcessingFailed,
                        std::string("Invalid value for ") + name + ": '" + value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ReefError(ErrorCode::ProcessingFailed,
                        std::string("Value out of range for ") + name + ": '" + value + "'");
    }
}

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

}  // namespace

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    if (const char* path = env_or_null("REEFRADAR_DB_PATH")) {
        config.databasePath = path;
    }
    if (const char* timeout = env_or_null("REEFRADAR_EMBED_TIMEOUT_MS")) {
        const auto ms = parse_count("REEFRADAR_EMBED_TIMEOUT_MS", timeout);
        if (ms == 0) {
            throw ReefError(ErrorCode::ProcessingFailed, "REEFRADAR_EMBED_TIMEOUT_MS must be positive");
        }
        config.embedTimeout = std::chrono::milliseconds(static_cast<long long>(ms));
    }
    if (const char* perCall = env_or_null("REEFRADAR_WINDOWS_PER_CALL")) {
        config.windowsPerCall = static_cast<std::size_t>(parse_count("REEFRADAR_WINDOWS_PER_CALL", perCall));
    }
    if (const char* topK = env_or_null("REEFRADAR_TOP_K")) {
        const auto k = parse_count("REEFRADAR_TOP_K", topK);
        if (k == 0) {
            throw ReefError(ErrorCode::ProcessingFailed, "REEFRADAR_TOP_K must be positive");
        }
        config.topK = static_cast<std::size_t>(k);
    }
    return config;
}

}  // namespace reefradar
