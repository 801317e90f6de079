#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

// Canonical 44-byte RIFF/WAVE container for 16-bit linear PCM, in memory.
namespace wav {

constexpr size_t header_size = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(header_size + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + header_size, samples.data(), data_size);
    }

    return out;
}

struct Decoded {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    std::vector<int16_t> samples; // interleaved
};

// Accepts only the canonical layout written by encode(): PCM, 16-bit, fmt at 12, data at 36.
inline std::optional<Decoded> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < header_size) return std::nullopt;

    auto tag = [&bytes](size_t pos) {
        return std::string_view(reinterpret_cast<const char*>(bytes.data() + pos), 4);
    };
    auto r16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };

    if (tag(0) != "RIFF" || tag(8) != "WAVE" || tag(12) != "fmt " || tag(36) != "data") {
        return std::nullopt;
    }
    if (r32(16) != 16 || r16(20) != 1 || r16(34) != 16) return std::nullopt;

    Decoded d;
    d.channels = r16(22);
    d.sample_rate = r32(24);
    uint32_t data_size = r32(40);
    if (d.channels == 0 || d.sample_rate == 0) return std::nullopt;
    if (data_size > bytes.size() - header_size || data_size % 2 != 0) return std::nullopt;

    d.samples.resize(data_size / sizeof(int16_t));
    if (data_size > 0) {
        std::memcpy(d.samples.data(), bytes.data() + header_size, data_size);
    }
    return d;
}

} // namespace wav
