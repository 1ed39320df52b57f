#include "reefradar/audio/WavCodec.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

#include <string>

using namespace reefradar;
using namespace reefradar::test_support;
using audio::WavCodec;

TEST(WavCodecTest, EncodeThenDecodePreservesPcm16Samples) {
    const std::vector<int16_t> samples = {0, 1000, -1000, 32767, -32768, 7};
    WavCodec codec;
    const auto bytes = codec.encode(32000, samples);
    ASSERT_EQ(bytes.size(), 44u + samples.size() * 2);

    const AudioBuffer decoded = codec.decode(bytes);
    EXPECT_EQ(decoded.sampleRate, 32000);
    EXPECT_EQ(decoded.channelCount, 1);
    EXPECT_EQ(decoded.bitDepth, 16);
    EXPECT_EQ(decoded.format, SampleFormat::Pcm);
    ASSERT_EQ(decoded.samples.size(), samples.size());
    for (std::size_t i = 0; i < samples.size(); ++i) {
        EXPECT_EQ(decoded.samples[i], static_cast<float>(samples[i])) << "sample " << i;
    }
}

TEST(WavCodecTest, EightBitSamplesAreWidenedAroundMidpoint) {
    const auto bytes = make_wav(8000, 1, 8, {0, 128, 255, 64});
    const AudioBuffer decoded = WavCodec().decode(bytes);
    ASSERT_EQ(decoded.samples.size(), 4u);
    EXPECT_EQ(decoded.bitDepth, 8);
    EXPECT_FLOAT_EQ(decoded.samples[0], -128.0f);
    EXPECT_FLOAT_EQ(decoded.samples[1], 0.0f);
    EXPECT_FLOAT_EQ(decoded.samples[2], 127.0f);
    EXPECT_FLOAT_EQ(decoded.samples[3], -64.0f);
}

TEST(WavCodecTest, ThirtyTwoBitSamplesAreSignedLittleEndian) {
    const auto bytes = make_wav(48000, 1, 32, pcm32_bytes({65536, -65536, 0}));
    const AudioBuffer decoded = WavCodec().decode(bytes);
    ASSERT_EQ(decoded.samples.size(), 3u);
    EXPECT_EQ(decoded.bitDepth, 32);
    EXPECT_FLOAT_EQ(decoded.samples[0], 65536.0f);
    EXPECT_FLOAT_EQ(decoded.samples[1], -65536.0f);
    EXPECT_FLOAT_EQ(decoded.samples[2], 0.0f);
}

TEST(WavCodecTest, FloatFormatTagIsReadAsIntegerPcm) {
    std::vector<std::uint8_t> fmt = fmt_body(48000, 1, 32);
    fmt[0] = 3;
    const auto bytes = riff({RawChunk{"fmt ", fmt}, RawChunk{"data", pcm32_bytes({65536, -2})}});
    const AudioBuffer decoded = WavCodec().decode(bytes);
    ASSERT_EQ(decoded.samples.size(), 2u);
    EXPECT_EQ(decoded.format, SampleFormat::Pcm);
    EXPECT_FLOAT_EQ(decoded.samples[0], 65536.0f);
    EXPECT_FLOAT_EQ(decoded.samples[1], -2.0f);
}

TEST(WavCodecTest, StereoIsInterleaved) {
    const auto bytes = make_wav(44100, 2, 16, pcm16_bytes({100, -100, 200, -200}));
    const AudioBuffer decoded = WavCodec().decode(bytes);
    EXPECT_EQ(decoded.channelCount, 2);
    EXPECT_EQ(decoded.frame_count(), 2u);
    const auto left = decoded.channel(0);
    const auto right = decoded.channel(1);
    ASSERT_EQ(left.size(), 2u);
    EXPECT_FLOAT_EQ(left[1], 200.0f);
    EXPECT_FLOAT_EQ(right[1], -200.0f);
}

TEST(WavCodecTest, UnknownChunksBeforeFormatAndDataAreSkipped) {
    const auto bytes = riff({
        RawChunk{"LIST", {'I', 'N', 'F', 'O', 0, 0}},
        RawChunk{"fmt ", fmt_body(16000, 1, 16)},
        RawChunk{"fact", {1, 0, 0, 0}},
        RawChunk{"data", pcm16_bytes({5, 6, 7})},
    });
    const AudioBuffer decoded = WavCodec().decode(bytes);
    EXPECT_EQ(decoded.sampleRate, 16000);
    ASSERT_EQ(decoded.samples.size(), 3u);
    EXPECT_FLOAT_EQ(decoded.samples[2], 7.0f);
}

TEST(WavCodecTest, RejectsMissingContainerMarkers) {
    std::vector<std::uint8_t> bytes = make_wav(16000, 1, 16, pcm16_bytes({1, 2}));
    bytes[8] = 'X';  // "WAVE" -> "XAVE"
    EXPECT_EQ(error_code_of([&] { WavCodec().decode(bytes); }), ErrorCode::InvalidFormat);

    const std::vector<std::uint8_t> tiny = {'R', 'I', 'F', 'F'};
    EXPECT_EQ(error_code_of([&] { WavCodec().decode(tiny); }), ErrorCode::InvalidFormat);
}

TEST(WavCodecTest, RejectsDataBeforeFormat) {
    const auto bytes = riff({
        RawChunk{"data", pcm16_bytes({1, 2})},
        RawChunk{"fmt ", fmt_body(16000, 1, 16)},
    });
    try {
        WavCodec().decode(bytes);
        FAIL() << "expected InvalidFormat";
    } catch (const ReefError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidFormat);
        EXPECT_NE(std::string(e.what()).find("missing format chunk"), std::string::npos);
    }
}

TEST(WavCodecTest, RejectsMissingDataChunk) {
    const auto bytes = riff({RawChunk{"fmt ", fmt_body(16000, 1, 16)}});
    EXPECT_EQ(error_code_of([&] { WavCodec().decode(bytes); }), ErrorCode::InvalidFormat);
}

TEST(WavCodecTest, RejectsUnsupportedBitDepth) {
    const auto bytes = make_wav(44100, 1, 24, std::vector<std::uint8_t>(30, 0));
    try {
        WavCodec().decode(bytes);
        FAIL() << "expected InvalidFormat";
    } catch (const ReefError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidFormat);
        EXPECT_NE(std::string(e.what()).find("24-bit"), std::string::npos);
    }
}

TEST(WavCodecTest, RejectsZeroChannels) {
    const auto bytes = make_wav(16000, 0, 16, pcm16_bytes({1, 2}));
    EXPECT_EQ(error_code_of([&] { WavCodec().decode(bytes); }), ErrorCode::InvalidFormat);
}

TEST(WavCodecTest, TruncatedDataChunkKeepsCompleteFrames) {
    // Declares 100 bytes but only 5 follow: two full 16-bit frames survive.
    const auto bytes = riff({
        RawChunk{"fmt ", fmt_body(16000, 1, 16)},
        RawChunk{"data", {1, 0, 2, 0, 3}, 100},
    });
    const AudioBuffer decoded = WavCodec().decode(bytes);
    ASSERT_EQ(decoded.samples.size(), 2u);
    EXPECT_FLOAT_EQ(decoded.samples[0], 1.0f);
    EXPECT_FLOAT_EQ(decoded.samples[1], 2.0f);
}

TEST(WavCodecTest, ToPcm16TruncatesAndClamps) {
    const auto pcm = audio::to_pcm16({0.0f, 1.0f, -1.0f, 0.5f, -0.5f, 2.0f, -2.0f});
    ASSERT_EQ(pcm.size(), 7u);
    EXPECT_EQ(pcm[0], 0);
    EXPECT_EQ(pcm[1], 32767);
    EXPECT_EQ(pcm[2], -32767);
    EXPECT_EQ(pcm[3], 16383);
    EXPECT_EQ(pcm[4], -16383);
    EXPECT_EQ(pcm[5], 32767);
    EXPECT_EQ(pcm[6], -32768);
}
