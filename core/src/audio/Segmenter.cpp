#include "reefradar/audio/Segmenter.h"
#include "reefradar/audio/Resampler.h"
#include "reefradar/Errors.h"
#include "reefradar/Log.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace reefradar {
namespace audio {

namespace {

constexpr const char* kTag = "segmenter";

std::string format_seconds(double seconds) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", seconds);
    return buf;
}

}  // namespace

Segmenter::Segmenter(SegmenterPolicy policy) : policy_(policy) {}

double Segmenter::validate_duration(const AudioBuffer& buffer) const {
    if (buffer.channelCount <= 0 || buffer.sampleRate <= 0) {
        throw ReefError(ErrorCode::InvalidFormat,
                        "Invalid audio: " + std::to_string(buffer.channelCount) + " channel(s) at " +
                        std::to_string(buffer.sampleRate) + " Hz.");
    }

    const double duration = static_cast<double>(buffer.samples.size()) /
                            static_cast<double>(buffer.channelCount) /
                            static_cast<double>(buffer.sampleRate);

    if (duration < policy_.minDurationSec) {
        throw ReefError(ErrorCode::AudioTooShort,
                        "Audio too short: " + format_seconds(duration) + "s. Minimum required is " +
                        format_seconds(policy_.minDurationSec) + "s.");
    }
    if (duration > policy_.maxDurationSec) {
        throw ReefError(ErrorCode::AudioTooLong,
                        "Audio too long: " + format_seconds(duration) + "s. Maximum allowed is " +
                        format_seconds(policy_.maxDurationSec) +
                        "s. Consider splitting the audio into shorter segments.");
    }
    return duration;
}

NormalizedSamples Segmenter::downmix_and_normalize(const AudioBuffer& buffer) {
    const std::size_t channels = static_cast<std::size_t>(std::max(1, buffer.channelCount));
    const std::size_t frames = buffer.samples.size() / channels;

    std::vector<double> mono(frames, 0.0);
    if (channels == 1) {
        for (std::size_t f = 0; f < frames; ++f) mono[f] = buffer.samples[f];
    } else {
        for (std::size_t f = 0; f < frames; ++f) {
            double acc = 0.0;
            for (std::size_t c = 0; c < channels; ++c) acc += buffer.samples[f * channels + c];
            mono[f] = acc / static_cast<double>(channels);
        }
    }

    double scale = 1.0;
    if (buffer.format == SampleFormat::Float) {
        scale = 1.0;
    } else if (buffer.bitDepth == 8 || buffer.bitDepth == 16) {
        // 8-bit samples are already widened into the 16-bit range.
        scale = contract::PCM16_FULL_SCALE;
    } else if (buffer.bitDepth == 32) {
        scale = contract::PCM32_FULL_SCALE;
    } else {
        double peak = 0.0;
        for (double v : mono) peak = std::max(peak, std::abs(v));
        if (peak > 0.0) scale = peak;
    }

    NormalizedSamples out(frames);
    for (std::size_t f = 0; f < frames; ++f) out[f] = static_cast<float>(mono[f] / scale);
    return out;
}

std::vector<Window> Segmenter::slice(const NormalizedSamples& samples, bool* paddedTail) const {
    const std::size_t W = policy_.windowSamples;
    const std::size_t fullWindows = (W > 0) ? samples.size() / W : 0;
    if (paddedTail) *paddedTail = false;

    if (fullWindows == 0) {
        const double seconds = static_cast<double>(samples.size()) / static_cast<double>(policy_.targetSampleRate);
        throw ReefError(ErrorCode::AudioTooShort,
                        "Audio too short after processing: " + format_seconds(seconds) +
                        "s. Need at least one full " +
                        format_seconds(static_cast<double>(W) / policy_.targetSampleRate) + "s window.");
    }

    std::vector<Window> windows;
    windows.reserve(fullWindows + 1);
    for (std::size_t w = 0; w < fullWindows; ++w) {
        const auto begin = samples.begin() + static_cast<std::ptrdiff_t>(w * W);
        windows.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(W));
    }

    const std::size_t remainder = samples.size() - fullWindows * W;
    if (remainder > W / 2) {
        Window tail(W, 0.0f);
        std::copy(samples.end() - static_cast<std::ptrdiff_t>(remainder), samples.end(), tail.begin());
        windows.push_back(std::move(tail));
        if (paddedTail) *paddedTail = true;
    } else if (remainder > 0) {
        REEFRADAR_LOG_DEBUG(kTag, "dropping ", remainder, " trailing sample(s)");
    }
    return windows;
}

PreparedAudio Segmenter::prepare(const AudioBuffer& buffer) const {
    PreparedAudio prepared;
    prepared.nativeDurationSeconds = validate_duration(buffer);

    NormalizedSamples mono = downmix_and_normalize(buffer);
    if (buffer.channelCount > 1) {
        REEFRADAR_LOG_DEBUG(kTag, "downmixed ", buffer.channelCount, " channels to mono");
    }

    if (buffer.sampleRate != policy_.targetSampleRate) {
        REEFRADAR_LOG_INFO(kTag, "resampling from ", buffer.sampleRate, " Hz to ", policy_.targetSampleRate, " Hz");
        mono = resample_linear(mono, buffer.sampleRate, policy_.targetSampleRate);
    }

    prepared.processedDurationSeconds =
        static_cast<double>(mono.size()) / static_cast<double>(policy_.targetSampleRate);
    prepared.windows = slice(mono, &prepared.paddedTail);
    prepared.fullWindows = prepared.windows.size() - (prepared.paddedTail ? 1 : 0);
    prepared.samples = std::move(mono);

    REEFRADAR_LOG_INFO(kTag, "processed ", format_seconds(prepared.processedDurationSeconds), "s into ",
                       prepared.windows.size(), " window(s)", prepared.paddedTail ? " (last padded)" : "");
    return prepared;
}

}  // namespace audio
}  // namespace reefradar
