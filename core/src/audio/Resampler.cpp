#include "reefradar/audio/Resampler.h"
#include "reefradar/Errors.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

namespace reefradar {
namespace audio {

std::vector<float> resample_linear(const std::vector<float>& samples, int sourceRate, int targetRate) {
    if (sourceRate == targetRate) return samples;
    if (sourceRate <= 0 || targetRate <= 0) {
        throw ReefError(ErrorCode::ProcessingFailed,
                        "resample_linear: invalid rates " + std::to_string(sourceRate) + " -> " +
                        std::to_string(targetRate));
    }

    const std::size_t n = samples.size();
    if (n == 0) return {};

    const double duration = static_cast<double>(n) / static_cast<double>(sourceRate);
    const std::size_t outLen = static_cast<std::size_t>(std::floor(duration * static_cast<double>(targetRate)));

    std::vector<float> out(outLen, 0.0f);
    if (n == 1) {
        std::fill(out.begin(), out.end(), samples[0]);
        return out;
    }

    const std::size_t maxIdx = n - 2;
    for (std::size_t i = 0; i < outLen; ++i) {
        const double p = static_cast<double>(i) * static_cast<double>(sourceRate) / static_cast<double>(targetRate);
        const std::size_t idx = std::min(static_cast<std::size_t>(p), maxIdx);
        const double frac = p - static_cast<double>(idx);
        const double a = samples[idx];
        const double b = samples[idx + 1];
        out[i] = static_cast<float>(a * (1.0 - frac) + b * frac);
    }
    return out;
}

}  // namespace audio
}  // namespace reefradar
