#include "reefradar/embedding/SyntheticEmbedding.h"
#include "reefradar/Errors.h"
#include "reefradar/VectorMath.h"

#include <fftw3.h>

#include <cmath>
#include <memory>
#include <mutex>
#include <random>

namespace reefradar {
namespace embedding {

namespace {

// The FFTW planner is not thread-safe; plan creation and destruction are
// serialized while fftw_execute runs unlocked.
std::mutex& planner_mutex() {
    static std::mutex m;
    return m;
}

struct FftwFree {
    void operator()(void* p) const { fftw_free(p); }
};

class RealForwardPlan {
public:
    RealForwardPlan(int n, double* in, fftw_complex* out) {
        std::lock_guard<std::mutex> lock(planner_mutex());
        plan_ = fftw_plan_dft_r2c_1d(n, in, out, FFTW_ESTIMATE);
    }
    ~RealForwardPlan() {
        if (plan_) {
            std::lock_guard<std::mutex> lock(planner_mutex());
            fftw_destroy_plan(plan_);
        }
    }
    RealForwardPlan(const RealForwardPlan&) = delete;
    RealForwardPlan& operator=(const RealForwardPlan&) = delete;

    bool valid() const { return plan_ != nullptr; }
    void execute() const { fftw_execute(plan_); }

private:
    fftw_plan plan_{nullptr};
};

}  // namespace

double spectral_centroid(const std::vector<float>& x, int sampleRate) {
    const std::size_t n = x.size();
    if (n < 2 || sampleRate <= 0) return 0.0;
    const std::size_t bins = n / 2 + 1;

    std::unique_ptr<double, FftwFree> in(static_cast<double*>(fftw_malloc(sizeof(double) * n)));
    std::unique_ptr<fftw_complex, FftwFree> out(static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * bins)));
    if (!in || !out) {
        throw ReefError(ErrorCode::ProcessingFailed, "spectral_centroid: FFT buffer allocation failed");
    }

    RealForwardPlan plan(static_cast<int>(n), in.get(), out.get());
    if (!plan.valid()) {
        throw ReefError(ErrorCode::ProcessingFailed, "spectral_centroid: FFT plan creation failed");
    }
    for (std::size_t i = 0; i < n; ++i) in.get()[i] = x[i];
    plan.execute();

    const double binHz = static_cast<double>(sampleRate) / static_cast<double>(n);
    double magSum = 0.0;
    double weighted = 0.0;
    for (std::size_t k = 0; k < bins; ++k) {
        const double re = out.get()[k][0];
        const double im = out.get()[k][1];
        const double mag = std::sqrt(re * re + im * im);
        magSum += mag;
        weighted += static_cast<double>(k) * binHz * mag;
    }
    return weighted / (magSum + contract::SPECTRUM_EPS);
}

SyntheticEmbeddingGenerator::SyntheticEmbeddingGenerator(std::size_t dimension, int sampleRate)
    : dimension_(dimension), sampleRate_(sampleRate) {}

WindowStatistics SyntheticEmbeddingGenerator::statistics(const Window& window) const {
    WindowStatistics s;
    s.rms = rms(window);
    s.peak = peak_abs(window);
    s.zeroCrossings = zero_crossings(window);
    s.zeroCrossingRate = window.empty() ? 0.0
                                        : static_cast<double>(s.zeroCrossings) / static_cast<double>(window.size());
    s.spectralCentroidHz = spectral_centroid(window, sampleRate_);
    return s;
}

std::uint32_t SyntheticEmbeddingGenerator::seed_for(double rmsValue) {
    const double scaled = std::floor(std::abs(rmsValue * contract::SYNTHETIC_SEED_SCALE));
    const double folded = std::fmod(scaled, static_cast<double>(contract::SYNTHETIC_SEED_MODULUS));
    return static_cast<std::uint32_t>(folded);
}

Embedding SyntheticEmbeddingGenerator::synthesize(const Window& window) const {
    const WindowStatistics s = statistics(window);
    const double features[contract::SYNTHETIC_FEATURE_COUNT] = {
        s.rms,
        s.peak,
        s.zeroCrossingRate,
        s.spectralCentroidHz / (static_cast<double>(sampleRate_) / 2.0),
    };

    std::mt19937 rng(seed_for(s.rms));
    std::normal_distribution<double> noise(0.0, contract::SYNTHETIC_NOISE_STDDEV);

    const std::size_t block = dimension_ / contract::SYNTHETIC_FEATURE_COUNT;
    Embedding embedding(dimension_, 0.0);
    for (std::size_t f = 0; f < contract::SYNTHETIC_FEATURE_COUNT; ++f) {
        for (std::size_t i = 0; i < block; ++i) embedding[f * block + i] = features[f] + noise(rng);
    }
    return embedding;
}

}  // namespace embedding
}  // namespace reefradar
