#pragma once

#include "reefradar/CoreContract.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace reefradar {

/**
 * EngineConfig: runtime options of ReefEngine
 *
 * Environment variables read by from_environment():
 *   REEFRADAR_DB_PATH            SQLite database path (unset/empty = no store)
 *   REEFRADAR_EMBED_TIMEOUT_MS   embedding source deadline in milliseconds (> 0)
 *   REEFRADAR_WINDOWS_PER_CALL   windows per source call (0 = one call)
 *   REEFRADAR_TOP_K              number of similar sites reported (> 0)
 */
struct EngineConfig {
    std::string databasePath;
    std::chrono::milliseconds embedTimeout{contract::DEFAULT_EMBED_TIMEOUT_MS};
    std::size_t windowsPerCall{0};
    std::size_t topK{contract::DEFAULT_TOP_K};
    std::size_t maxReferencePoints{contract::MAX_REFERENCE_POINTS};
    bool emitProcessedAudio{false};

    /**
     * Defaults overridden by the variables above.
     * @throws ReefError(ProcessingFailed) on a malformed or out-of-range value
     */
    static EngineConfig from_environment();
};

}  // namespace reefradar
