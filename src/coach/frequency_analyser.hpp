#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

struct AnalyserConfig {
    size_t fft_size = 256; // rounded up to a power of two
    double smoothing = 0.7;
    double min_decibels = -100.0;
    double max_decibels = -30.0;
    size_t visualization_stride = 4;
    size_t visualization_bins = 32;
};

struct SignalLevels {
    int volume_level = 0; // mean of all bins, 0..100
    int noise_level = 0;  // mean of the lowest eighth of bins, 0..100
};

// Byte-scaled magnitude spectrum of the most recent fft_size samples, with
// exponential smoothing between successive frames.
class FrequencyAnalyser {
public:
    explicit FrequencyAnalyser(AnalyserConfig config = {});

    // Uses the trailing fft_size samples; shorter input is zero-padded at the front.
    std::vector<uint8_t> analyse(std::span<const int16_t> samples);
    void reset();

    size_t fft_size() const { return config_.fft_size; }
    size_t bin_count() const { return config_.fft_size / 2; }

    static SignalLevels levels(std::span<const uint8_t> bins);
    std::vector<uint8_t> visualization(std::span<const uint8_t> bins) const;

private:
    AnalyserConfig config_;
    std::vector<double> window_;
    std::vector<double> smoothed_;
};
