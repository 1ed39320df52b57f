#pragma once

#include "reefradar/Errors.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace reefradar {
namespace test_support {

constexpr double kPi = 3.14159265358979323846;

inline void put_u16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
}

inline void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
}

inline void put_tag(std::vector<std::uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

struct RawChunk {
    std::string id;                     // four characters
    std::vector<std::uint8_t> body;
    std::uint32_t declaredSize{0};      // 0 = body.size()
};

inline std::vector<std::uint8_t> fmt_body(int sampleRate, int channels, int bitDepth) {
    std::vector<std::uint8_t> body;
    const int blockAlign = channels * bitDepth / 8;
    put_u16(body, 1);
    put_u16(body, static_cast<std::uint16_t>(channels));
    put_u32(body, static_cast<std::uint32_t>(sampleRate));
    put_u32(body, static_cast<std::uint32_t>(sampleRate * blockAlign));
    put_u16(body, static_cast<std::uint16_t>(blockAlign));
    put_u16(body, static_cast<std::uint16_t>(bitDepth));
    return body;
}

// RIFF/WAVE container holding the given chunks in order.
inline std::vector<std::uint8_t> riff(const std::vector<RawChunk>& chunks) {
    std::vector<std::uint8_t> payload;
    for (const auto& c : chunks) {
        put_tag(payload, c.id.c_str());
        put_u32(payload, c.declaredSize ? c.declaredSize : static_cast<std::uint32_t>(c.body.size()));
        payload.insert(payload.end(), c.body.begin(), c.body.end());
    }
    std::vector<std::uint8_t> out;
    put_tag(out, "RIFF");
    put_u32(out, static_cast<std::uint32_t>(4 + payload.size()));
    put_tag(out, "WAVE");
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

inline std::vector<std::uint8_t> make_wav(int sampleRate, int channels, int bitDepth,
                                          const std::vector<std::uint8_t>& data) {
    return riff({RawChunk{"fmt ", fmt_body(sampleRate, channels, bitDepth)}, RawChunk{"data", data}});
}

inline std::vector<std::uint8_t> pcm16_bytes(const std::vector<std::int16_t>& samples) {
    std::vector<std::uint8_t> out;
    out.reserve(samples.size() * 2);
    for (std::int16_t s : samples) put_u16(out, static_cast<std::uint16_t>(s));
    return out;
}

inline std::vector<std::uint8_t> pcm32_bytes(const std::vector<std::int32_t>& samples) {
    std::vector<std::uint8_t> out;
    out.reserve(samples.size() * 4);
    for (std::int32_t s : samples) put_u32(out, static_cast<std::uint32_t>(s));
    return out;
}

// Unsigned 8-bit silence (every byte 128).
inline std::vector<std::uint8_t> silence_wav8(int sampleRate, double seconds, int channels = 1) {
    const std::size_t frames = static_cast<std::size_t>(std::llround(seconds * sampleRate));
    return make_wav(sampleRate, channels, 8, std::vector<std::uint8_t>(frames * channels, 128));
}

// 16-bit sine, identical on every channel.
inline std::vector<std::uint8_t> sine_wav16(int sampleRate, double seconds, double frequencyHz,
                                            double amplitude, int channels = 1) {
    const std::size_t frames = static_cast<std::size_t>(std::llround(seconds * sampleRate));
    std::vector<std::int16_t> samples;
    samples.reserve(frames * channels);
    for (std::size_t i = 0; i < frames; ++i) {
        const double v = amplitude * std::sin(2.0 * kPi * frequencyHz * static_cast<double>(i) / sampleRate);
        for (int c = 0; c < channels; ++c) samples.push_back(static_cast<std::int16_t>(std::lround(v * 32767.0)));
    }
    return make_wav(sampleRate, channels, 16, pcm16_bytes(samples));
}

// Runs fn and returns the code of the ReefError it throws.
template <typename Fn>
ErrorCode error_code_of(Fn&& fn) {
    try {
        std::forward<Fn>(fn)();
    } catch (const ReefError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected a ReefError";
    return ErrorCode::ProcessingFailed;
}

// SQLite file under the temp directory, removed with its WAL side files.
class TempDatabase {
  public:
    explicit TempDatabase(const std::string& stem) {
        const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = (std::filesystem::temp_directory_path() /
                 (stem + "_" + std::to_string(::getpid()) + "_" + std::to_string(tick) + ".db")).string();
        remove_files();
    }
    ~TempDatabase() { remove_files(); }

    TempDatabase(const TempDatabase&) = delete;
    TempDatabase& operator=(const TempDatabase&) = delete;

    const std::string& path() const { return path_; }

  private:
    void remove_files() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            std::filesystem::remove(path_ + suffix, ec);
        }
    }

    std::string path_;
};

}  // namespace test_support
}  // namespace reefradar
