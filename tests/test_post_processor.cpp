#include <catch2/catch_test_macros.hpp>

#include "audio_post_processor.hpp"
#include "wav_codec.hpp"

#include <cstdint>
#include <vector>

TEST_CASE("AudioPostProcessor", "[post]") {
    AudioPostProcessor post;

    SECTION("RejectsZeroChannels") {
        auto r = post.process(RawAudio{{1, 2, 3}, 44100, 0});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::UnsupportedFormat);
    }

    SECTION("RejectsZeroRate") {
        auto r = post.process(RawAudio{{1, 2, 3}, 0, 1});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::UnsupportedFormat);
    }

    SECTION("RejectsEmptyData") {
        auto r = post.process(RawAudio{{}, 44100, 1});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::UnsupportedFormat);
    }

    SECTION("RejectsRaggedFrames") {
        auto r = post.process(RawAudio{{1, 2, 3}, 44100, 2});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::UnsupportedFormat);
    }

    SECTION("TooShortToResample") {
        auto r = post.process(RawAudio{{42}, 44100, 1});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::EncodingError);
    }

    SECTION("StereoToMonoAtTargetRate") {
        std::vector<int16_t> stereo;
        for (int i = 0; i < 4410; ++i) {
            stereo.push_back(static_cast<int16_t>(i));
            stereo.push_back(static_cast<int16_t>(i + 2));
        }
        auto r = post.process(RawAudio{stereo, 44100, 2});
        REQUIRE(r.has_value());
        REQUIRE(r->sample_rate == 22050);
        REQUIRE(r->channels == 1);
        REQUIRE(r->content_type == "audio/wav");

        auto decoded = wav::decode(r->bytes);
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->sample_rate == 22050);
        REQUIRE(decoded->channels == 1);
        REQUIRE(decoded->samples.size() == 2205);
        // Halving the rate keeps every other averaged frame.
        REQUIRE(decoded->samples[0] == 1);
        REQUIRE(decoded->samples[1] == 3);
        REQUIRE(decoded->samples[10] == 21);
    }

    SECTION("ProcessingIsIdempotent") {
        std::vector<int16_t> mono(8820);
        for (size_t i = 0; i < mono.size(); ++i) mono[i] = static_cast<int16_t>(static_cast<int>((i * 37) % 2000) - 1000);

        auto first = post.process(RawAudio{mono, 44100, 1});
        REQUIRE(first.has_value());
        auto raw = AudioPostProcessor::decode(*first);
        REQUIRE(raw.has_value());
        auto second = post.process(*raw);
        REQUIRE(second.has_value());
        REQUIRE(second->bytes == first->bytes);
    }

    SECTION("PassthroughWhenCompressionOff") {
        AudioPostProcessor raw_post(PostProcessConfig{.compress = false});
        std::vector<int16_t> stereo = {1, 2, 3, 4, 5, 6};
        auto r = raw_post.process(RawAudio{stereo, 48000, 2});
        REQUIRE(r.has_value());
        REQUIRE(r->sample_rate == 48000);
        REQUIRE(r->channels == 2);
        REQUIRE(r->bytes == wav::encode(stereo, 48000, 2));
    }

    SECTION("DecodeRejectsGarbage") {
        auto r = AudioPostProcessor::decode(EncodedAudio{.bytes = std::vector<uint8_t>(64, 0x11)});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::UnsupportedFormat);
    }

    SECTION("Duration") {
        RawAudio audio{std::vector<int16_t>(88200, 0), 44100, 2};
        REQUIRE(audio.duration_seconds() == 1.0);
        REQUIRE(RawAudio{}.duration_seconds() == 0.0);
    }
}

TEST_CASE("AudioPostProcessor helpers", "[post]") {

    SECTION("DownmixAverages") {
        auto mono = AudioPostProcessor::downmix({100, 200, -100, -300}, 2);
        REQUIRE(mono == std::vector<int16_t>{150, -200});
    }

    SECTION("DownmixMonoUnchanged") {
        std::vector<int16_t> in = {5, 6, 7};
        REQUIRE(AudioPostProcessor::downmix(in, 1) == in);
    }

    SECTION("DownmixNoOverflow") {
        auto mono = AudioPostProcessor::downmix({32767, 32767, -32768, -32768}, 2);
        REQUIRE(mono == std::vector<int16_t>{32767, -32768});
    }

    SECTION("ResampleSameRate") {
        std::vector<int16_t> in = {1, 2, 3};
        REQUIRE(AudioPostProcessor::resample(in, 16000, 16000) == in);
    }

    SECTION("ResampleDown") {
        std::vector<int16_t> in = {0, 10, 20, 30, 40, 50, 60, 70, 80, 90};
        auto out = AudioPostProcessor::resample(in, 44100, 22050);
        REQUIRE(out == std::vector<int16_t>{0, 20, 40, 60, 80});
    }

    SECTION("ResampleUpInterpolates") {
        std::vector<int16_t> in = {0, 100};
        auto out = AudioPostProcessor::resample(in, 8000, 16000);
        REQUIRE(out == std::vector<int16_t>{0, 50, 100, 100});
    }
}
