#include "frequency_analyser.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <numbers>
#include <numeric>
#include <utility>

namespace {

AnalyserConfig with_power_of_two_size(AnalyserConfig config) {
    size_t size = 2;
    while (size < config.fft_size) size <<= 1;
    config.fft_size = size;
    return config;
}

// In-place iterative radix-2 Cooley-Tukey; the size must be a power of two.
void fft(std::vector<std::complex<double>>& data) {
    const size_t n = data.size();
    for (size_t i = 1, j = 0; i < n; ++i) {
        size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) j ^= bit;
        j ^= bit;
        if (i < j) std::swap(data[i], data[j]);
    }

    for (size_t len = 2; len <= n; len <<= 1) {
        double angle = -2.0 * std::numbers::pi / static_cast<double>(len);
        std::complex<double> step(std::cos(angle), std::sin(angle));
        for (size_t start = 0; start < n; start += len) {
            std::complex<double> w(1.0, 0.0);
            for (size_t k = 0; k < len / 2; ++k) {
                auto even = data[start + k];
                auto odd = data[start + k + len / 2] * w;
                data[start + k] = even + odd;
                data[start + k + len / 2] = even - odd;
                w *= step;
            }
        }
    }
}

} // namespace

FrequencyAnalyser::FrequencyAnalyser(AnalyserConfig config)
    : config_(with_power_of_two_size(config)), window_(config_.fft_size), smoothed_(config_.fft_size / 2, 0.0) {
    const double n = static_cast<double>(config_.fft_size);
    for (size_t i = 0; i < config_.fft_size; ++i) {
        double x = static_cast<double>(i) / n;
        window_[i] = 0.42 - 0.5 * std::cos(2.0 * std::numbers::pi * x) +
                     0.08 * std::cos(4.0 * std::numbers::pi * x);
    }
}

std::vector<uint8_t> FrequencyAnalyser::analyse(std::span<const int16_t> samples) {
    const size_t n = config_.fft_size;
    std::vector<std::complex<double>> frame(n);

    size_t take = std::min(samples.size(), n);
    auto tail = samples.subspan(samples.size() - take);
    for (size_t i = 0; i < take; ++i) {
        frame[n - take + i] = (static_cast<double>(tail[i]) / 32768.0) * window_[n - take + i];
    }

    fft(frame);

    std::vector<uint8_t> bins(bin_count());
    const double range = config_.max_decibels - config_.min_decibels;
    for (size_t k = 0; k < bins.size(); ++k) {
        double magnitude = std::abs(frame[k]) / static_cast<double>(n);
        smoothed_[k] = config_.smoothing * smoothed_[k] + (1.0 - config_.smoothing) * magnitude;

        double db = smoothed_[k] > 0.0 ? 20.0 * std::log10(smoothed_[k]) : config_.min_decibels;
        double scaled = 255.0 * (db - config_.min_decibels) / range;
        bins[k] = static_cast<uint8_t>(std::clamp(scaled, 0.0, 255.0));
    }
    return bins;
}

void FrequencyAnalyser::reset() {
    std::fill(smoothed_.begin(), smoothed_.end(), 0.0);
}

SignalLevels FrequencyAnalyser::levels(std::span<const uint8_t> bins) {
    SignalLevels out;
    if (bins.empty()) return out;

    auto to_level = [](double avg) {
        return std::min(100, static_cast<int>(std::lround(avg / 255.0 * 100.0)));
    };

    double all = std::accumulate(bins.begin(), bins.end(), 0.0) / static_cast<double>(bins.size());
    size_t low_count = std::max<size_t>(1, bins.size() / 8);
    double low = std::accumulate(bins.begin(), bins.begin() + low_count, 0.0) /
                 static_cast<double>(low_count);

    out.volume_level = to_level(all);
    out.noise_level = to_level(low);
    return out;
}

std::vector<uint8_t> FrequencyAnalyser::visualization(std::span<const uint8_t> bins) const {
    std::vector<uint8_t> out;
    out.reserve(config_.visualization_bins);
    for (size_t i = 0; i < bins.size() && out.size() < config_.visualization_bins;
         i += config_.visualization_stride) {
        out.push_back(bins[i]);
    }
    return out;
}
