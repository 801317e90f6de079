#include "audio_quality_monitor.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {

double mean(const std::deque<int>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

void push_bounded(std::deque<int>& values, int v, size_t limit) {
    values.push_back(v);
    while (values.size() > limit) values.pop_front();
}

} // namespace

std::string_view to_string(QualityIssue issue) {
    switch (issue) {
        case QualityIssue::LowVolume: return "low-volume";
        case QualityIssue::HighNoise: return "high-noise";
        case QualityIssue::Clipping: return "clipping";
        case QualityIssue::Interrupted: return "interrupted";
    }
    return "unknown";
}

bool QualityInfo::has(QualityIssue issue) const {
    return std::find(issues.begin(), issues.end(), issue) != issues.end();
}

AudioQualityMonitor::AudioQualityMonitor(QualityThresholds thresholds)
    : thresholds_(thresholds) {}

QualityInfo AudioQualityMonitor::observe(int volume_level, int noise_level, double tick_seconds) {
    const auto& t = thresholds_;

    push_bounded(volume_history_, volume_level, t.volume_window);

    // Only readings above the floor minimum count towards background noise.
    if (noise_level > t.noise_floor_min) {
        push_bounded(noise_floor_, noise_level, t.noise_window);
    }

    if (volume_level < t.silence_level) {
        silence_seconds_ += tick_seconds;
        // Tolerance absorbs the drift of summing fractional tick lengths.
        if (silence_seconds_ + 1e-9 >= t.silence_seconds) {
            ++interruptions_;
            silence_seconds_ = 0.0;
        }
    } else {
        silence_seconds_ = 0.0;
    }

    double volume_avg = mean(volume_history_);
    double noise_avg = mean(noise_floor_);

    QualityInfo info;
    if (volume_avg < t.low_volume) {
        info.issues.push_back(QualityIssue::LowVolume);
    }
    if (noise_avg > t.high_noise) {
        info.issues.push_back(QualityIssue::HighNoise);
    }
    auto loud = std::count_if(volume_history_.begin(), volume_history_.end(),
                              [&t](int v) { return v > t.clipping_level; });
    if (static_cast<size_t>(loud) >= t.clipping_count) {
        info.issues.push_back(QualityIssue::Clipping);
    }
    if (interruptions_ > t.interruption_limit) {
        info.issues.push_back(QualityIssue::Interrupted);
    }

    info.is_good = info.issues.empty();
    info.noise_level = static_cast<int>(std::lround(noise_avg));
    info.volume_level = static_cast<int>(std::lround(volume_avg));
    return info;
}

void AudioQualityMonitor::reset() {
    volume_history_.clear();
    noise_floor_.clear();
    silence_seconds_ = 0.0;
    interruptions_ = 0;
}
