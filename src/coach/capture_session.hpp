#pragma once

#include "audio_post_processor.hpp"
#include "audio_quality_monitor.hpp"
#include "error.hpp"
#include "frame_channel.hpp"
#include "frequency_analyser.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

enum class RecordingStatus { Inactive, Recording, Paused, Completed };

std::string_view to_string(RecordingStatus status);

struct VisualizationFrame {
    double elapsed_seconds = 0.0;
    int volume_level = 0;
    std::vector<uint8_t> bins;
};

struct RecordingState {
    RecordingStatus status = RecordingStatus::Inactive;
    double elapsed_seconds = 0.0;
    std::optional<QualityInfo> quality;
    std::optional<EncodedAudio> recording;
};

struct CaptureConfig {
    double max_seconds = 180.0;
    double quality_check_hz = 10.0; // 0 disables the feed
    double visualization_hz = 30.0; // 0 disables the feed
    bool visualize = true;
    size_t channel_capacity = 128;
};

// Owns one recording attempt against a single device: the state machine,
// the captured samples and the live quality/visualization feeds.
// Driven by a single polling loop calling tick(); not safe for concurrent writers.
class CaptureSession {
public:
    using Clock = std::chrono::steady_clock;

    CaptureSession(RingBuffer& ring_buf, AudioCapture& capture, CaptureConfig config,
                   QualityThresholds thresholds = {}, PostProcessConfig post = {},
                   AnalyserConfig analyser = {});

    std::expected<void, CoachError> start(Clock::time_point now = Clock::now());
    std::expected<void, CoachError> pause(Clock::time_point now = Clock::now());
    std::expected<void, CoachError> resume(Clock::time_point now = Clock::now());
    std::expected<EncodedAudio, CoachError> stop(Clock::time_point now = Clock::now());
    void cancel();
    void clear();

    // Polling step. Returns the post-processing error when the duration limit
    // triggers an automatic stop that fails to encode.
    std::expected<void, CoachError> tick(Clock::time_point now = Clock::now());

    // Pull side of the live feeds. Both restart empty on every start().
    std::optional<VisualizationFrame> next_frame() { return frames_.pop(); }
    std::optional<QualityInfo> next_quality() { return qualities_.pop(); }

    const RecordingState& state() const { return state_; }
    RecordingStatus status() const { return state_.status; }
    double elapsed_seconds() const { return state_.elapsed_seconds; }
    size_t captured_samples() const { return samples_.size(); }

    // Uncompressed capture, available after stop() even when post-processing failed.
    std::optional<EncodedAudio> raw_recording() const;

    const CaptureConfig& config() const { return config_; }

private:
    void drain_ring(bool keep);
    void advance_clock(Clock::time_point now);
    void check_quality(const std::vector<uint8_t>& bins);
    void emit_frame(const std::vector<uint8_t>& bins);
    std::vector<int16_t> recent_mono() const;
    void reset_buffers();

    RingBuffer& ring_buf_;
    AudioCapture& capture_;
    CaptureConfig config_;
    AudioQualityMonitor monitor_;
    FrequencyAnalyser analyser_;
    AudioPostProcessor post_;
    size_t fft_size_;

    RecordingState state_;
    CaptureFormat format_;
    std::vector<int16_t> samples_;

    Clock::time_point last_tick_;
    std::optional<Clock::time_point> next_quality_;
    std::optional<Clock::time_point> next_frame_;

    FrameChannel<VisualizationFrame> frames_;
    FrameChannel<QualityInfo> qualities_;
};
