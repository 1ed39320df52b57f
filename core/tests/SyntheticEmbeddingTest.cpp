#include "reefradar/embedding/SyntheticEmbedding.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace reefradar;
using namespace reefradar::test_support;
using embedding::SyntheticEmbeddingGenerator;

namespace {

double block_mean(const Embedding& e, std::size_t block, std::size_t blockSize) {
    double sum = 0.0;
    for (std::size_t i = 0; i < blockSize; ++i) sum += e[block * blockSize + i];
    return sum / static_cast<double>(blockSize);
}

Window sine_window(std::size_t n, double frequencyHz, int sampleRate, double amplitude) {
    Window w(n);
    for (std::size_t i = 0; i < n; ++i) {
        w[i] = static_cast<float>(amplitude * std::sin(2.0 * kPi * frequencyHz * static_cast<double>(i) / sampleRate));
    }
    return w;
}

}  // namespace

TEST(SyntheticEmbeddingTest, SeedIsFloorOfScaledRmsModulo31Bits) {
    EXPECT_EQ(SyntheticEmbeddingGenerator::seed_for(0.0), 0u);
    EXPECT_EQ(SyntheticEmbeddingGenerator::seed_for(0.5), 500000u);
    EXPECT_EQ(SyntheticEmbeddingGenerator::seed_for(-0.5), 500000u);
    EXPECT_EQ(SyntheticEmbeddingGenerator::seed_for(3000.0), 852516352u);
}

TEST(SyntheticEmbeddingTest, SameWindowGivesIdenticalEmbedding) {
    SyntheticEmbeddingGenerator generator;
    const Window w = sine_window(4000, 440.0, contract::TARGET_SAMPLE_RATE_HZ, 0.3);
    const Embedding a = generator.synthesize(w);
    const Embedding b = generator.synthesize(w);
    ASSERT_EQ(a.size(), contract::EMBEDDING_DIM);
    EXPECT_EQ(a, b);
}

TEST(SyntheticEmbeddingTest, DifferentLoudnessGivesDifferentEmbedding) {
    SyntheticEmbeddingGenerator generator;
    const Embedding quiet = generator.synthesize(sine_window(4000, 440.0, contract::TARGET_SAMPLE_RATE_HZ, 0.1));
    const Embedding loud = generator.synthesize(sine_window(4000, 440.0, contract::TARGET_SAMPLE_RATE_HZ, 0.8));
    EXPECT_NE(quiet, loud);
}

TEST(SyntheticEmbeddingTest, StatisticsOfAlternatingSignal) {
    SyntheticEmbeddingGenerator generator;
    const Window w = {1.0f, -1.0f, 1.0f, -1.0f, 1.0f, -1.0f, 1.0f, -1.0f};
    const auto s = generator.statistics(w);
    EXPECT_DOUBLE_EQ(s.rms, 1.0);
    EXPECT_DOUBLE_EQ(s.peak, 1.0);
    EXPECT_EQ(s.zeroCrossings, 7u);
    EXPECT_DOUBLE_EQ(s.zeroCrossingRate, 7.0 / 8.0);
    // All energy sits in the Nyquist bin.
    EXPECT_NEAR(s.spectralCentroidHz, contract::TARGET_SAMPLE_RATE_HZ / 2.0, 1e-3);
}

TEST(SyntheticEmbeddingTest, CentroidOfPureToneIsItsFrequency) {
    const int rate = contract::TARGET_SAMPLE_RATE_HZ;
    const Window w = sine_window(static_cast<std::size_t>(rate), 1000.0, rate, 0.5);
    EXPECT_NEAR(embedding::spectral_centroid(w, rate), 1000.0, 5.0);
}

TEST(SyntheticEmbeddingTest, SilenceHasZeroCentroid) {
    EXPECT_DOUBLE_EQ(embedding::spectral_centroid(Window(1024, 0.0f), contract::TARGET_SAMPLE_RATE_HZ), 0.0);
}

TEST(SyntheticEmbeddingTest, BlocksCarryFeaturesInOrder) {
    // Constant 0.5: rms 0.5, peak 0.5, no crossings, all energy at DC.
    SyntheticEmbeddingGenerator generator;
    const Embedding e = generator.synthesize(Window(2048, 0.5f));
    const std::size_t block = contract::SYNTHETIC_BLOCK_SIZE;
    EXPECT_NEAR(block_mean(e, 0, block), 0.5, 0.03);
    EXPECT_NEAR(block_mean(e, 1, block), 0.5, 0.03);
    EXPECT_NEAR(block_mean(e, 2, block), 0.0, 0.03);
    EXPECT_NEAR(block_mean(e, 3, block), 0.0, 0.03);
}

TEST(SyntheticEmbeddingTest, HonorsConfiguredDimension) {
    SyntheticEmbeddingGenerator generator(64);
    EXPECT_EQ(generator.dimension(), 64u);
    EXPECT_EQ(generator.synthesize(Window(512, 0.1f)).size(), 64u);
}
