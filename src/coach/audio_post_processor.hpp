#pragma once

#include "error.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

struct RawAudio {
    std::vector<int16_t> samples; // interleaved
    uint32_t sample_rate = 0;
    uint16_t channels = 0;

    double duration_seconds() const;
};

struct EncodedAudio {
    std::vector<uint8_t> bytes;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    std::string content_type = "audio/wav";
};

struct PostProcessConfig {
    bool compress = true;
    uint32_t target_sample_rate = 22050;
};

// Downmix + resample + WAV wrap. Stateless; safe to call from any thread.
class AudioPostProcessor {
public:
    explicit AudioPostProcessor(PostProcessConfig config = {});

    std::expected<EncodedAudio, CoachError> process(const RawAudio& input) const;

    static std::expected<RawAudio, CoachError> decode(const EncodedAudio& encoded);

    static std::vector<int16_t> downmix(const std::vector<int16_t>& interleaved, uint16_t channels);
    static std::vector<int16_t> resample(const std::vector<int16_t>& mono,
                                         uint32_t from_rate, uint32_t to_rate);

    const PostProcessConfig& config() const { return config_; }

private:
    PostProcessConfig config_;
};
