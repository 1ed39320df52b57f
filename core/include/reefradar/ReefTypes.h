#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace reefradar {

// ========== Decoded Audio ==========
enum class SampleFormat {
    Pcm,      // integer amplitudes as stored in the container (8-bit widened to signed)
    Float     // already-normalized float amplitudes supplied by a host
};

struct AudioBuffer {
    int sampleRate{0};                  // Hz, > 0
    int channelCount{0};                // > 0
    int bitDepth{16};                   // 8, 16 or 32
    SampleFormat format{SampleFormat::Pcm};
    std::vector<float> samples;         // interleaved, size % channelCount == 0

    std::size_t frame_count() const {
        return channelCount > 0 ? samples.size() / static_cast<std::size_t>(channelCount) : 0;
    }

    double duration_seconds() const {
        return sampleRate > 0 ? static_cast<double>(frame_count()) / static_cast<double>(sampleRate) : 0.0;
    }

    // Deinterleaved copy of one channel column.
    std::vector<float> channel(std::size_t index) const;
};

// Mono float amplitudes in [-1, 1].
using NormalizedSamples = std::vector<float>;

// Exactly contract::WINDOW_SAMPLES samples of NormalizedSamples.
using Window = std::vector<float>;

using Embedding = std::vector<double>;

// ========== Reference Corpus ==========
// Declaration order is the classification tie-break priority.
enum class HealthCategory {
    Healthy,
    Degraded,
    RestoredEarly,
    RestoredMid
};

constexpr std::array<HealthCategory, 4> kCategoryPriority = {
    HealthCategory::Healthy,
    HealthCategory::Degraded,
    HealthCategory::RestoredEarly,
    HealthCategory::RestoredMid,
};

struct ReferenceSite {
    std::string siteId;                 // unique, e.g. "aus_H1"
    std::string country;
    HealthCategory category{HealthCategory::Healthy};
    Embedding meanEmbedding;
};

using Corpus = std::vector<ReferenceSite>;

// ========== Classification Output ==========
struct CategoryProbability {
    HealthCategory category{HealthCategory::Healthy};
    double probability{0.0};
};

struct ClassificationResult {
    HealthCategory label{HealthCategory::Healthy};
    double confidence{0.0};
    std::array<CategoryProbability, 4> probabilities{};   // in kCategoryPriority order
    bool placeholder{false};                              // empty-corpus fallback

    double probability_of(HealthCategory category) const;
};

struct SimilarSite {
    std::string siteId;
    std::string country;
    HealthCategory category{HealthCategory::Healthy};
    double similarity{0.0};             // cosine, [-1, 1]
};

struct Projection2D {
    double x{0.0};
    double y{0.0};
};

struct ReferencePoint {
    std::string siteId;
    HealthCategory category{HealthCategory::Healthy};
    Projection2D position;
};

struct Visualization {
    Projection2D query;
    std::vector<ReferencePoint> referencePoints;   // at most contract::MAX_REFERENCE_POINTS
};

struct EmbeddingSummary {
    std::size_t dimension{0};
    std::size_t windowCount{0};
    std::string aggregation{"mean"};
    bool synthetic{false};
};

// ========== Pipeline Request / Result ==========
// Analysis option flags.
enum AnalysisOptions : uint32_t {
    // Attach the normalized 32 kHz stream, re-encoded as 16-bit mono WAV, to the result.
    AnalyzeEmitProcessedAudio = 1u << 0,
    // Skip recording the outcome in the reference store even when one is configured.
    AnalyzeSkipStore = 1u << 1,
};

struct AnalysisRequest {
    std::string analysisId;
    std::string uploadId;
    std::vector<std::uint8_t> audioBytes;    // WAV container
    uint32_t options{0};                     // AnalysisOptions bitset
};

struct AnalysisResult {
    std::string analysisId;
    std::string uploadId;

    // Native audio properties
    int originalSampleRate{0};
    int originalChannels{0};
    int originalBitDepth{0};
    double originalDurationSeconds{0.0};

    // After normalization/resampling
    double processedDurationSeconds{0.0};
    std::size_t windowCount{0};

    ClassificationResult classification;
    std::vector<SimilarSite> similarSites;
    Visualization visualization;
    EmbeddingSummary embedding;

    std::string caveats;
    std::string completedAt;                  // ISO-8601 UTC

    std::vector<std::uint8_t> processedAudio; // only with AnalyzeEmitProcessedAudio
};

enum class AnalysisStatus {
    Complete,
    Failed
};

}  // namespace reefradar
