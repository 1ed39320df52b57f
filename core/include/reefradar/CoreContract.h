#pragma once

/**
 * CoreContract.h - ReefRadar Core System Constants
 *
 * This file defines all contract-level constants for the ReefRadar system.
 * These constants are PART OF THE SYSTEM CONTRACT and should NOT be changed
 * without understanding the implications for:
 *   - Compatibility with the embedding model's input window
 *   - Compatibility of stored reference embeddings
 *   - Reproducibility of synthetic embeddings and classifications
 *
 * VERSION: 1.0.0
 */

#include <cstddef>
#include <cstdint>

namespace reefradar {
namespace contract {

// ============================================================================
// Audio Timeline Constants
// ============================================================================

/**
 * TARGET_SAMPLE_RATE_HZ - Canonical sample rate of normalized audio
 *
 * The embedding model consumes 32 kHz mono audio. Every stream is resampled
 * to this rate before slicing.
 */
constexpr int TARGET_SAMPLE_RATE_HZ = 32000;

/**
 * WINDOW_SECONDS / WINDOW_SAMPLES - Embedding window
 *
 * One embedding is produced per 5.0 s window: 32000 * 5.0 = 160,000 samples.
 */
constexpr double WINDOW_SECONDS = 5.0;
constexpr std::size_t WINDOW_SAMPLES = 160000;

static_assert(WINDOW_SAMPLES == static_cast<std::size_t>(TARGET_SAMPLE_RATE_HZ * WINDOW_SECONDS),
              "WINDOW_SAMPLES must equal TARGET_SAMPLE_RATE_HZ * WINDOW_SECONDS");

/**
 * A trailing partial window is zero-padded into a full window only when it
 * holds strictly more than PARTIAL_WINDOW_MIN_SAMPLES samples.
 */
constexpr std::size_t PARTIAL_WINDOW_MIN_SAMPLES = WINDOW_SAMPLES / 2;

// ============================================================================
// Duration Policy
// ============================================================================

/**
 * Duration bounds, measured at the native rate before any resampling.
 *
 *   - MIN_DURATION_SEC: one full embedding window
 *   - MAX_DURATION_SEC: cost bound (10 minutes)
 */
constexpr double MIN_DURATION_SEC = 5.0;
constexpr double MAX_DURATION_SEC = 600.0;

// ============================================================================
// PCM Full-Scale Constants
// ============================================================================

constexpr double PCM16_FULL_SCALE = 32768.0;
constexpr double PCM32_FULL_SCALE = 2147483648.0;

// Processed audio is written back as 16-bit PCM with this scale.
constexpr double PCM16_WRITE_SCALE = 32767.0;

// ============================================================================
// Embedding Constants
// ============================================================================

/**
 * EMBEDDING_DIM - Dimension of every embedding in the system
 *
 * Reference embeddings, learned embeddings and synthetic embeddings all share
 * this dimension.
 */
constexpr std::size_t EMBEDDING_DIM = 1280;

/**
 * Synthetic embeddings are split into SYNTHETIC_FEATURE_COUNT equal blocks
 * (RMS, peak, zero-crossing rate, spectral centroid).
 */
constexpr std::size_t SYNTHETIC_FEATURE_COUNT = 4;
constexpr std::size_t SYNTHETIC_BLOCK_SIZE = EMBEDDING_DIM / SYNTHETIC_FEATURE_COUNT;

/**
 * SYNTHETIC_NOISE_STDDEV - Standard deviation of seeded per-entry noise
 */
constexpr double SYNTHETIC_NOISE_STDDEV = 0.1;

/**
 * SYNTHETIC_SEED_SCALE - RMS is multiplied by this before being folded into
 * the 31-bit generator seed.
 */
constexpr double SYNTHETIC_SEED_SCALE = 1e6;
constexpr std::uint64_t SYNTHETIC_SEED_MODULUS = 2147483648ULL;

// Spectral centroid is reported relative to the Nyquist frequency.
constexpr double SYNTHETIC_CENTROID_SCALE_HZ = TARGET_SAMPLE_RATE_HZ / 2.0;

// Guards the spectral magnitude normalization against an all-zero window.
constexpr double SPECTRUM_EPS = 1e-10;

// ============================================================================
// Classification Policy
// ============================================================================

/**
 * EMPTY_CATEGORY_SCORE - Score assigned to a category without reference sites
 *
 * Keeps all four categories represented in sparse corpora. This value is
 * inherited policy, not a statistically derived prior.
 */
constexpr double EMPTY_CATEGORY_SCORE = 0.1;

/**
 * Placeholder distribution returned while the reference corpus is empty.
 * Order: healthy, degraded, restored_early, restored_mid.
 */
constexpr double PLACEHOLDER_PROBABILITIES[4] = {0.65, 0.15, 0.10, 0.10};

/**
 * DEFAULT_TOP_K - Number of nearest reference sites returned by default
 */
constexpr std::size_t DEFAULT_TOP_K = 3;

/**
 * MAX_REFERENCE_POINTS - Reference sites projected alongside the query
 */
constexpr std::size_t MAX_REFERENCE_POINTS = 10;

// ============================================================================
// Embedding Source
// ============================================================================

/**
 * DEFAULT_EMBED_TIMEOUT_MS - Upper bound on one embedding source round trip
 *
 * After this deadline the pipeline abandons the source and falls back to
 * synthetic embeddings.
 */
constexpr int DEFAULT_EMBED_TIMEOUT_MS = 30000;

// ============================================================================
// Version Tracking
// ============================================================================

/**
 * CORE_CONTRACT_VERSION - Semantic version of this contract
 *
 * Increment when:
 *   - Major: Breaking changes to constants (stored embeddings incompatible)
 *   - Minor: New constants added (backward compatible)
 *   - Patch: Documentation or non-functional changes
 *
 * This version is stored in the database schema_version table.
 */
constexpr const char* CORE_CONTRACT_VERSION = "1.0.0";

} // namespace contract
} // namespace reefradar
