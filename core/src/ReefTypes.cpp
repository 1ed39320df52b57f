#include "reefradar/ReefTypes.h"

namespace reefradar {

std::vector<float> AudioBuffer::channel(std::size_t index) const {
    const std::size_t channels = static_cast<std::size_t>(channelCount);
    if (channels == 0 || index >= channels) return {};
    const std::size_t frames = frame_count();
    std::vector<float> column(frames);
    for (std::size_t f = 0; f < frames; ++f) column[f] = samples[f * channels + index];
    return column;
}

double ClassificationResult::probability_of(HealthCategory category) const {
    for (const auto& p : probabilities) {
        if (p.category == category) return p.probability;
    }
    return 0.0;
}

}  // namespace reefradar
