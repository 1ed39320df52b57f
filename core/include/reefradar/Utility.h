#pragma once

#include "reefradar/ReefTypes.h"

#include <string>

namespace reefradar {

std::string category_to_string(HealthCategory category);
HealthCategory category_from_string(const std::string& value);

// One-letter site-type codes used by the reference metadata: H, D, R, M.
char category_to_site_code(HealthCategory category);
HealthCategory category_from_site_code(char code);

std::size_t category_index(HealthCategory category);

// Current UTC time as ISO-8601 with second precision, e.g. "2026-10-19T08:30:00Z".
std::string utc_timestamp_now();

}
