#include "reefradar/Utility.h"
#include "reefradar/Errors.h"

#include <chrono>
#include <ctime>

namespace reefradar {

std::string category_to_string(HealthCategory category) {
    switch (category) {
        case HealthCategory::Healthy:
            return "healthy";
        case HealthCategory::Degraded:
            return "degraded";
        case HealthCategory::RestoredEarly:
            return "restored_early";
        case HealthCategory::RestoredMid:
            return "restored_mid";
    }
    return "healthy";
}

HealthCategory category_from_string(const std::string& value) {
    if (value == "healthy") {
        return HealthCategory::Healthy;
    }
    if (value == "degraded") {
        return HealthCategory::Degraded;
    }
    if (value == "restored_early") {
        return HealthCategory::RestoredEarly;
    }
    if (value == "restored_mid") {
        return HealthCategory::RestoredMid;
    }
    throw ReefError(ErrorCode::ProcessingFailed, "Unknown health category: " + value);
}

char category_to_site_code(HealthCategory category) {
    switch (category) {
        case HealthCategory::Healthy:
            return 'H';
        case HealthCategory::Degraded:
            return 'D';
        case HealthCategory::RestoredEarly:
            return 'R';
        case HealthCategory::RestoredMid:
            return 'M';
    }
    return 'H';
}

HealthCategory category_from_site_code(char code) {
    switch (code) {
        case 'H':
            return HealthCategory::Healthy;
        case 'D':
            return HealthCategory::Degraded;
        case 'R':
            return HealthCategory::RestoredEarly;
        case 'M':
            return HealthCategory::RestoredMid;
        default:
            break;
    }
    throw ReefError(ErrorCode::ProcessingFailed, std::string("Unknown site type code: ") + code);
}

std::size_t category_index(HealthCategory category) {
    return static_cast<std::size_t>(category);
}

std::string utc_timestamp_now() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

}  // namespace reefradar
