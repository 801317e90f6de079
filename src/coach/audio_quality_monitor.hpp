#pragma once

#include <cstddef>
#include <deque>
#include <string_view>
#include <vector>

enum class QualityIssue { LowVolume, HighNoise, Clipping, Interrupted };

std::string_view to_string(QualityIssue issue);

struct QualityInfo {
    bool is_good = true;
    int noise_level = 0;  // 0..100
    int volume_level = 0; // 0..100
    std::vector<QualityIssue> issues;

    bool has(QualityIssue issue) const;
};

// Product-tunable warning thresholds. Levels are on the 0..100 scale.
struct QualityThresholds {
    size_t volume_window = 5;
    size_t noise_window = 10;
    double low_volume = 20.0;
    double high_noise = 30.0;
    double clipping_level = 95.0;
    size_t clipping_count = 3;
    double silence_level = 10.0;
    double silence_seconds = 2.0;
    int interruption_limit = 2;
    double noise_floor_min = 5.0;
};

// Classifies one polling tick at a time from a short trailing history of
// volume and low-band noise readings.
class AudioQualityMonitor {
public:
    explicit AudioQualityMonitor(QualityThresholds thresholds = {});

    QualityInfo observe(int volume_level, int noise_level, double tick_seconds);
    void reset();

    int interruptions() const { return interruptions_; }
    const QualityThresholds& thresholds() const { return thresholds_; }

private:
    QualityThresholds thresholds_;
    std::deque<int> volume_history_;
    std::deque<int> noise_floor_;
    double silence_seconds_ = 0.0;
    int interruptions_ = 0;
};
