#pragma once

#include "../ReefTypes.h"

#include <cstdint>
#include <vector>

namespace reefradar {
namespace audio {

/**
 * WavCodec: RIFF/WAVE reader and writer for the PCM subset used by ReefRadar
 *
 * Supported on decode: PCM, 8/16/32 bits per sample, any channel count.
 * 8-bit samples are unsigned with a 128 offset and are widened to signed
 * values in [-128, 127]. 16/32-bit samples are little-endian signed integers.
 * The fmt audio-format tag is not checked, so IEEE-float data (tag 3) is
 * read as 32-bit integer PCM.
 *
 * Encode always emits mono 16-bit PCM with the canonical 44-byte header.
 */
class WavCodec {
public:
    WavCodec() = default;

    /**
     * Decode a WAV container held in memory.
     * @param bytes Complete file contents
     * @return AudioBuffer with interleaved integer amplitudes
     * @throws ReefError(InvalidFormat) on missing RIFF/WAVE markers, a missing
     *         fmt chunk, or an unsupported bit depth
     */
    AudioBuffer decode(const std::vector<std::uint8_t>& bytes) const;

    /**
     * Encode mono 16-bit PCM.
     * @param sampleRate Sample rate written to the header
     * @param samples Mono samples
     * @return Complete file contents
     */
    std::vector<std::uint8_t> encode(int sampleRate, const std::vector<int16_t>& samples) const;
};

/**
 * Convert normalized [-1, 1] floats to 16-bit PCM: x * 32767, truncated toward
 * zero and clamped to the int16 range.
 */
std::vector<int16_t> to_pcm16(const std::vector<float>& normalized);

}  // namespace audio
}  // namespace reefradar
