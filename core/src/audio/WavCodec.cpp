#include "reefradar/audio/WavCodec.h"
#include "reefradar/CoreContract.h"
#include "reefradar/Errors.h"
#include "reefradar/Log.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>

namespace reefradar {
namespace audio {

namespace {

constexpr const char* kTag = "wav";

constexpr std::size_t kRiffHeaderSize = 12;   // "RIFF" + size + "WAVE"
constexpr std::size_t kChunkHeaderSize = 8;   // id + size
constexpr std::size_t kFmtMinSize = 16;

uint16_t read_u16le(const std::uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32le(const std::uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void write_u16le(std::vector<std::uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

void write_u32le(std::vector<std::uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

void write_tag(std::vector<std::uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

bool tag_equals(const std::uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

struct FormatChunk {
    uint16_t audioFormat{0};
    uint16_t channels{0};
    uint32_t sampleRate{0};
    uint16_t bitsPerSample{0};
};

std::vector<float> decode_payload(const std::uint8_t* data, std::size_t size, int bitDepth) {
    std::vector<float> out;
    switch (bitDepth) {
        case 8: {
            out.resize(size);
            for (std::size_t i = 0; i < size; ++i) out[i] = static_cast<float>(static_cast<int>(data[i]) - 128);
            break;
        }
        case 16: {
            const std::size_t n = size / 2;
            out.resize(n);
            for (std::size_t i = 0; i < n; ++i) {
                out[i] = static_cast<float>(static_cast<int16_t>(read_u16le(data + 2 * i)));
            }
            break;
        }
        case 32: {
            const std::size_t n = size / 4;
            out.resize(n);
            for (std::size_t i = 0; i < n; ++i) {
                out[i] = static_cast<float>(static_cast<int32_t>(read_u32le(data + 4 * i)));
            }
            break;
        }
        default:
            break;
    }
    return out;
}

}  // namespace

AudioBuffer WavCodec::decode(const std::vector<std::uint8_t>& bytes) const {
    if (bytes.size() < kRiffHeaderSize ||
        !tag_equals(bytes.data(), "RIFF") ||
        !tag_equals(bytes.data() + 8, "WAVE")) {
        throw ReefError(ErrorCode::InvalidFormat,
                        "Not a valid WAV file (missing container/format marker). "
                        "Please upload a standard WAV audio file.");
    }

    const std::size_t total = bytes.size();
    std::size_t pos = kRiffHeaderSize;
    bool haveFormat = false;
    FormatChunk fmt;

    while (pos + kChunkHeaderSize <= total) {
        const std::uint8_t* header = bytes.data() + pos;
        const std::size_t chunkSize = read_u32le(header + 4);
        const std::size_t bodyStart = pos + kChunkHeaderSize;
        const std::size_t available = total - bodyStart;

        if (tag_equals(header, "fmt ")) {
            if (chunkSize < kFmtMinSize || available < kFmtMinSize) {
                throw ReefError(ErrorCode::InvalidFormat, "Invalid WAV file: truncated format chunk.");
            }
            const std::uint8_t* body = bytes.data() + bodyStart;
            fmt.audioFormat = read_u16le(body);
            fmt.channels = read_u16le(body + 2);
            fmt.sampleRate = read_u32le(body + 4);
            // byte rate (4) and block align (2) are derived, not trusted
            fmt.bitsPerSample = read_u16le(body + 14);
            haveFormat = true;
        } else if (tag_equals(header, "data")) {
            if (!haveFormat) {
                throw ReefError(ErrorCode::InvalidFormat,
                                "Invalid WAV file: missing format chunk. "
                                "The file may be corrupted or in an unsupported format.");
            }
            const int bits = fmt.bitsPerSample;
            if (bits != 8 && bits != 16 && bits != 32) {
                throw ReefError(ErrorCode::InvalidFormat,
                                "Unsupported bit depth: " + std::to_string(bits) +
                                "-bit. Supported formats: 8-bit, 16-bit, 32-bit PCM.");
            }
            if (fmt.channels == 0 || fmt.sampleRate == 0 ||
                fmt.sampleRate > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
                throw ReefError(ErrorCode::InvalidFormat,
                                "Invalid WAV file: format chunk declares " + std::to_string(fmt.channels) +
                                " channel(s) at " + std::to_string(fmt.sampleRate) + " Hz.");
            }

            std::size_t dataSize = std::min(chunkSize, available);
            if (dataSize < chunkSize) {
                REEFRADAR_LOG_WARN(kTag, "data chunk declares ", chunkSize, " bytes but only ", dataSize,
                                   " are present");
            }
            const std::size_t frameBytes = static_cast<std::size_t>(fmt.channels) * static_cast<std::size_t>(bits / 8);
            if (dataSize % frameBytes != 0) {
                REEFRADAR_LOG_WARN(kTag, "dropping ", dataSize % frameBytes, " trailing byte(s) of a partial frame");
                dataSize -= dataSize % frameBytes;
            }

            AudioBuffer buffer;
            buffer.sampleRate = static_cast<int>(fmt.sampleRate);
            buffer.channelCount = fmt.channels;
            buffer.bitDepth = bits;
            buffer.format = SampleFormat::Pcm;
            buffer.samples = decode_payload(bytes.data() + bodyStart, dataSize, bits);

            REEFRADAR_LOG_DEBUG(kTag, "decoded ", buffer.frame_count(), " frames, ", buffer.channelCount,
                                " channel(s), ", buffer.sampleRate, " Hz, ", bits, "-bit");
            return buffer;
        } else {
            REEFRADAR_LOG_DEBUG(kTag, "skipping chunk '", std::string(header, header + 4), "' (", chunkSize, " bytes)");
        }

        if (chunkSize > available) break;
        pos = bodyStart + chunkSize;
    }

    if (!haveFormat) {
        throw ReefError(ErrorCode::InvalidFormat,
                        "Invalid WAV file: missing format chunk. "
                        "The file may be corrupted or in an unsupported format.");
    }
    throw ReefError(ErrorCode::InvalidFormat, "Invalid WAV file: missing data chunk.");
}

std::vector<std::uint8_t> WavCodec::encode(int sampleRate, const std::vector<int16_t>& samples) const {
    constexpr uint16_t kChannels = 1;
    constexpr uint16_t kBitsPerSample = 16;
    constexpr uint16_t kBlockAlign = kChannels * kBitsPerSample / 8;

    const uint32_t rate = static_cast<uint32_t>(sampleRate);
    const uint32_t byteRate = rate * kBlockAlign;
    const uint32_t dataSize = static_cast<uint32_t>(samples.size() * kBlockAlign);

    std::vector<std::uint8_t> out;
    out.reserve(44 + dataSize);

    write_tag(out, "RIFF");
    write_u32le(out, 36 + dataSize);
    write_tag(out, "WAVE");

    write_tag(out, "fmt ");
    write_u32le(out, 16);
    write_u16le(out, 1);  // PCM
    write_u16le(out, kChannels);
    write_u32le(out, rate);
    write_u32le(out, byteRate);
    write_u16le(out, kBlockAlign);
    write_u16le(out, kBitsPerSample);

    write_tag(out, "data");
    write_u32le(out, dataSize);
    for (int16_t s : samples) write_u16le(out, static_cast<uint16_t>(s));

    return out;
}

std::vector<int16_t> to_pcm16(const std::vector<float>& normalized) {
    std::vector<int16_t> out(normalized.size());
    for (std::size_t i = 0; i < normalized.size(); ++i) {
        double v = std::trunc(static_cast<double>(normalized[i]) * contract::PCM16_WRITE_SCALE);
        v = std::clamp(v, -32768.0, 32767.0);
        out[i] = static_cast<int16_t>(v);
    }
    return out;
}

}  // namespace audio
}  // namespace reefradar
