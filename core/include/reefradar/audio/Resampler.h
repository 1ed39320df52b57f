#pragma once

#include <vector>

namespace reefradar {
namespace audio {

/**
 * Linear-interpolation sample-rate conversion.
 *
 * Output length is floor(len / sourceRate * targetRate). Output sample i reads
 * the source at p = i * sourceRate / targetRate with idx = floor(p) clamped to
 * [0, len - 2] and frac = p - idx:
 *
 *     out[i] = (1 - frac) * in[idx] + frac * in[idx + 1]
 *
 * evaluated in double precision and stored as float. Identity when the rates
 * are equal.
 */
std::vector<float> resample_linear(const std::vector<float>& samples, int sourceRate, int targetRate);

}  // namespace audio
}  // namespace reefradar
