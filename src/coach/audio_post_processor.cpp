#include "audio_post_processor.hpp"

#include "wav_codec.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

double RawAudio::duration_seconds() const {
    if (sample_rate == 0 || channels == 0) return 0.0;
    return static_cast<double>(samples.size() / channels) / sample_rate;
}

AudioPostProcessor::AudioPostProcessor(PostProcessConfig config) : config_(config) {}

std::expected<EncodedAudio, CoachError> AudioPostProcessor::process(const RawAudio& input) const {
    if (input.channels == 0) {
        return std::unexpected(CoachError{ErrorCode::UnsupportedFormat, "channel count is 0"});
    }
    if (input.sample_rate == 0) {
        return std::unexpected(CoachError{ErrorCode::UnsupportedFormat, "sample rate is 0"});
    }
    if (input.samples.empty()) {
        return std::unexpected(CoachError{ErrorCode::UnsupportedFormat, "no sample data"});
    }
    if (input.samples.size() % input.channels != 0) {
        return std::unexpected(CoachError{
            ErrorCode::UnsupportedFormat,
            std::format("{} samples do not divide into {} channels", input.samples.size(), input.channels)});
    }

    if (!config_.compress) {
        return EncodedAudio{
            .bytes = wav::encode(input.samples, input.sample_rate, input.channels),
            .sample_rate = input.sample_rate,
            .channels = input.channels,
        };
    }

    if (config_.target_sample_rate == 0) {
        return std::unexpected(CoachError{ErrorCode::EncodingError, "target sample rate is 0"});
    }

    auto mono = downmix(input.samples, input.channels);
    auto resampled = resample(mono, input.sample_rate, config_.target_sample_rate);
    if (resampled.empty()) {
        return std::unexpected(CoachError{ErrorCode::EncodingError, "resampling produced no samples"});
    }
    if (resampled.size() * sizeof(int16_t) > std::numeric_limits<uint32_t>::max() - 36) {
        return std::unexpected(CoachError{ErrorCode::EncodingError, "recording exceeds WAV size limit"});
    }

    return EncodedAudio{
        .bytes = wav::encode(resampled, config_.target_sample_rate, 1),
        .sample_rate = config_.target_sample_rate,
        .channels = 1,
    };
}

std::expected<RawAudio, CoachError> AudioPostProcessor::decode(const EncodedAudio& encoded) {
    auto d = wav::decode(encoded.bytes);
    if (!d) {
        return std::unexpected(CoachError{ErrorCode::UnsupportedFormat, "not a canonical 16-bit PCM WAV"});
    }
    return RawAudio{
        .samples = std::move(d->samples),
        .sample_rate = d->sample_rate,
        .channels = d->channels,
    };
}

std::vector<int16_t> AudioPostProcessor::downmix(const std::vector<int16_t>& interleaved,
                                                 uint16_t channels) {
    if (channels <= 1) return interleaved;

    std::vector<int16_t> mono;
    mono.reserve(interleaved.size() / channels);
    for (size_t i = 0; i + channels <= interleaved.size(); i += channels) {
        int32_t sum = 0;
        for (uint16_t c = 0; c < channels; ++c) sum += interleaved[i + c];
        mono.push_back(static_cast<int16_t>(sum / channels));
    }
    return mono;
}

std::vector<int16_t> AudioPostProcessor::resample(const std::vector<int16_t>& mono,
                                                  uint32_t from_rate, uint32_t to_rate) {
    if (from_rate == to_rate || mono.empty()) return mono;

    // Linear interpolation between neighbouring input samples.
    double ratio = static_cast<double>(to_rate) / static_cast<double>(from_rate);
    auto out_size = static_cast<size_t>(std::floor(static_cast<double>(mono.size()) * ratio));
    std::vector<int16_t> out;
    out.reserve(out_size);

    for (size_t i = 0; i < out_size; ++i) {
        double src = static_cast<double>(i) / ratio;
        auto idx = static_cast<size_t>(src);
        double frac = src - static_cast<double>(idx);
        double a = mono[std::min(idx, mono.size() - 1)];
        double b = mono[std::min(idx + 1, mono.size() - 1)];
        double v = a + (b - a) * frac;
        out.push_back(static_cast<int16_t>(std::lround(v)));
    }
    return out;
}
