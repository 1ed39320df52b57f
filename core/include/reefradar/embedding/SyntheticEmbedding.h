#pragma once

#include "../CoreContract.h"
#include "../ReefTypes.h"

#include <cstddef>
#include <cstdint>

namespace reefradar {
namespace embedding {

// Gross signal statistics of one window.
struct WindowStatistics {
    double rms{0.0};
    double peak{0.0};
    std::size_t zeroCrossings{0};
    double zeroCrossingRate{0.0};       // zeroCrossings / window length
    double spectralCentroidHz{0.0};     // magnitude-weighted mean frequency
};

/**
 * SyntheticEmbeddingGenerator: deterministic stand-in for the learned model
 *
 * The embedding is a pure function of the window content:
 *   - statistics: RMS, peak |x|, zero-crossing rate, spectral centroid
 *   - seed: floor(|RMS * 1e6|) mod 2^31
 *   - four contiguous blocks of dimension/4 entries, filled with
 *     feature + N(0, 0.1^2) from the seeded generator, in the order
 *     RMS, peak, zero-crossing rate, centroid / Nyquist
 *
 * Results must be flagged synthetic: they cluster by loudness and brightness
 * only and carry none of the learned model's discriminative power.
 */
class SyntheticEmbeddingGenerator {
public:
    SyntheticEmbeddingGenerator() = default;
    explicit SyntheticEmbeddingGenerator(std::size_t dimension, int sampleRate = contract::TARGET_SAMPLE_RATE_HZ);

    Embedding synthesize(const Window& window) const;

    WindowStatistics statistics(const Window& window) const;

    static std::uint32_t seed_for(double rms);

    std::size_t dimension() const { return dimension_; }

private:
    std::size_t dimension_{contract::EMBEDDING_DIM};
    int sampleRate_{contract::TARGET_SAMPLE_RATE_HZ};
};

// Magnitude-weighted mean frequency of the real FFT of x (FFTW r2c).
double spectral_centroid(const std::vector<float>& x, int sampleRate);

}  // namespace embedding
}  // namespace reefradar
