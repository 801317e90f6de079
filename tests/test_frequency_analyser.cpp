#include <catch2/catch_test_macros.hpp>

#include "frequency_analyser.hpp"

#include <cmath>
#include <cstdint>
#include <numbers>
#include <vector>

namespace {

// Sine centred on analyser bin `bin` for a 256-point frame.
std::vector<int16_t> tone(size_t bin, size_t count, double amplitude = 16000.0) {
    std::vector<int16_t> out(count);
    for (size_t i = 0; i < count; ++i) {
        double phase = 2.0 * std::numbers::pi * static_cast<double>(bin * i) / 256.0;
        out[i] = static_cast<int16_t>(std::lround(amplitude * std::sin(phase)));
    }
    return out;
}

} // namespace

TEST_CASE("FrequencyAnalyser", "[analyser]") {
    FrequencyAnalyser analyser;

    SECTION("BinCount") {
        REQUIRE(analyser.bin_count() == 128);
        REQUIRE(analyser.analyse(tone(16, 256)).size() == 128);
    }

    SECTION("SilenceIsFloor") {
        std::vector<int16_t> silence(256, 0);
        auto bins = analyser.analyse(silence);
        for (auto b : bins) REQUIRE(b == 0);

        auto lv = FrequencyAnalyser::levels(bins);
        REQUIRE(lv.volume_level == 0);
        REQUIRE(lv.noise_level == 0);
    }

    SECTION("ToneConcentratesInItsBin") {
        auto bins = analyser.analyse(tone(16, 256));
        REQUIRE(bins[16] > 200);
        REQUIRE(bins[64] < 50);
        REQUIRE(bins[100] < 50);
    }

    SECTION("TwoTonesPeakInTheirBins") {
        auto a = tone(5, 256, 8000.0);
        auto b = tone(40, 256, 8000.0);
        for (size_t i = 0; i < a.size(); ++i) a[i] = static_cast<int16_t>(a[i] + b[i]);

        auto bins = analyser.analyse(a);
        REQUIRE(bins[5] > 200);
        REQUIRE(bins[40] > 200);
        REQUIRE(bins[22] < 50);
        REQUIRE(bins[100] < 50);
    }

    SECTION("ShortInputIsPadded") {
        auto bins = analyser.analyse(tone(16, 10));
        REQUIRE(bins.size() == 128);
    }

    SECTION("SmoothingCarriesOver") {
        analyser.analyse(tone(16, 256));
        std::vector<int16_t> silence(256, 0);
        auto bins = analyser.analyse(silence);
        REQUIRE(bins[16] > 0);
    }

    SECTION("ResetDropsHistory") {
        analyser.analyse(tone(16, 256));
        analyser.reset();
        std::vector<int16_t> silence(256, 0);
        auto bins = analyser.analyse(silence);
        REQUIRE(bins[16] == 0);
    }

    SECTION("LevelsFromBins") {
        std::vector<uint8_t> full(128, 255);
        auto lv = FrequencyAnalyser::levels(full);
        REQUIRE(lv.volume_level == 100);
        REQUIRE(lv.noise_level == 100);

        // Only the lowest eighth carries energy.
        std::vector<uint8_t> low(128, 0);
        std::fill(low.begin(), low.begin() + 16, uint8_t(255));
        lv = FrequencyAnalyser::levels(low);
        REQUIRE(lv.noise_level == 100);
        REQUIRE(lv.volume_level == 13);
    }

    SECTION("LevelsOfEmptyInput") {
        auto lv = FrequencyAnalyser::levels(std::vector<uint8_t>{});
        REQUIRE(lv.volume_level == 0);
        REQUIRE(lv.noise_level == 0);
    }

    SECTION("VisualizationDecimates") {
        std::vector<uint8_t> bins(128);
        for (size_t i = 0; i < bins.size(); ++i) bins[i] = static_cast<uint8_t>(i);
        auto vis = analyser.visualization(bins);
        REQUIRE(vis.size() == 32);
        REQUIRE(vis[0] == 0);
        REQUIRE(vis[1] == 4);
        REQUIRE(vis[31] == 124);
    }
}

TEST_CASE("FrequencyAnalyser frame sizes", "[analyser]") {
    SECTION("LargerFrameScalesBins") {
        FrequencyAnalyser analyser({.fft_size = 1024});
        REQUIRE(analyser.bin_count() == 512);

        // Same period as bin 16 of a 256-point frame.
        auto bins = analyser.analyse(tone(16, 1024));
        REQUIRE(bins[64] > 200);
        REQUIRE(bins[16] < 50);
        REQUIRE(bins[300] < 50);
    }

    SECTION("SizeRoundsUpToPowerOfTwo") {
        FrequencyAnalyser analyser({.fft_size = 200});
        REQUIRE(analyser.fft_size() == 256);
        REQUIRE(analyser.bin_count() == 128);

        auto bins = analyser.analyse(tone(16, 256));
        REQUIRE(bins.size() == 128);
        REQUIRE(bins[16] > 200);
    }
}
