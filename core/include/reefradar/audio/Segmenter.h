#pragma once

#include "../CoreContract.h"
#include "../ReefTypes.h"

#include <cstddef>
#include <vector>

namespace reefradar {
namespace audio {

struct SegmenterPolicy {
    double minDurationSec{contract::MIN_DURATION_SEC};
    double maxDurationSec{contract::MAX_DURATION_SEC};
    int targetSampleRate{contract::TARGET_SAMPLE_RATE_HZ};
    std::size_t windowSamples{contract::WINDOW_SAMPLES};
};

struct PreparedAudio {
    NormalizedSamples samples;          // mono, [-1, 1], at targetSampleRate
    std::vector<Window> windows;        // each exactly windowSamples long
    std::size_t fullWindows{0};
    bool paddedTail{false};             // last window is a zero-padded remainder
    double nativeDurationSeconds{0.0};
    double processedDurationSeconds{0.0};
};

/**
 * Segmenter: duration gate, downmix, normalization, resampling, windowing
 *
 * prepare() runs the steps in order:
 *   1. duration at the native rate must lie in [minDurationSec, maxDurationSec]
 *      (checked before any resampling work)
 *   2. mean downmix to mono
 *   3. amplitude normalization to [-1, 1]
 *   4. linear resampling to targetSampleRate
 *   5. slicing into non-overlapping windows
 */
class Segmenter {
public:
    Segmenter() = default;
    explicit Segmenter(SegmenterPolicy policy);

    /**
     * @throws ReefError(InvalidFormat) for a buffer without channels or rate
     * @throws ReefError(AudioTooShort) below the minimum duration, or when no
     *         full window survives resampling
     * @throws ReefError(AudioTooLong) above the maximum duration
     */
    PreparedAudio prepare(const AudioBuffer& buffer) const;

    // Step 1 alone. Returns the native duration in seconds.
    double validate_duration(const AudioBuffer& buffer) const;

    /**
     * Steps 2 and 3: mean across channels, then
     *   8-bit and 16-bit PCM / 32768, 32-bit PCM / 2^31, Float unchanged,
     *   any other depth / max|x| when max|x| > 0.
     */
    static NormalizedSamples downmix_and_normalize(const AudioBuffer& buffer);

    /**
     * Step 5. Full windows, plus one zero-padded window when the remainder is
     * longer than half a window.
     * @throws ReefError(AudioTooShort) when no full window fits
     */
    std::vector<Window> slice(const NormalizedSamples& samples, bool* paddedTail = nullptr) const;

    const SegmenterPolicy& policy() const { return policy_; }

private:
    SegmenterPolicy policy_{};
};

}  // namespace audio
}  // namespace reefradar
