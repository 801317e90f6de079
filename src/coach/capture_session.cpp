#include "capture_session.hpp"

#include "wav_codec.hpp"

#include <algorithm>
#include <print>

namespace {

using TimePoint = CaptureSession::Clock::time_point;

// A feed at 0 Hz or below is disabled and never scheduled.
std::optional<TimePoint> first_due(TimePoint now, double hz) {
    if (hz <= 0.0) return std::nullopt;
    return now + std::chrono::duration_cast<CaptureSession::Clock::duration>(
                     std::chrono::duration<double>(1.0 / hz));
}

// Advances a due time by one period, skipping ahead when the loop fell behind.
void reschedule(std::optional<TimePoint>& due, TimePoint now, double hz) {
    if (!due) return;
    auto next = first_due(*due, hz);
    due = (next && *next > now) ? next : first_due(now, hz);
}

CoachError bad_transition(std::string_view op, RecordingStatus from) {
    return {ErrorCode::InvalidStateTransition,
            std::string(op) + " is not valid while " + std::string(to_string(from))};
}

} // namespace

std::string_view to_string(RecordingStatus status) {
    switch (status) {
        case RecordingStatus::Inactive: return "inactive";
        case RecordingStatus::Recording: return "recording";
        case RecordingStatus::Paused: return "paused";
        case RecordingStatus::Completed: return "completed";
    }
    return "unknown";
}

CaptureSession::CaptureSession(RingBuffer& ring_buf, AudioCapture& capture, CaptureConfig config,
                               QualityThresholds thresholds, PostProcessConfig post,
                               AnalyserConfig analyser)
    : ring_buf_(ring_buf), capture_(capture), config_(config),
      monitor_(thresholds), analyser_(analyser), post_(post),
      fft_size_(analyser_.fft_size()),
      frames_(config.channel_capacity), qualities_(config.channel_capacity) {}

std::expected<void, CoachError> CaptureSession::start(Clock::time_point now) {
    if (state_.status == RecordingStatus::Recording || state_.status == RecordingStatus::Paused) {
        return std::unexpected(bad_transition("start", state_.status));
    }

    reset_buffers();
    state_ = RecordingState{};

    ring_buf_.reset();
    if (!capture_.start()) {
        std::println(stderr, "capture: failed to open audio device");
        return std::unexpected(CoachError{ErrorCode::DeviceUnavailable, "failed to open audio device"});
    }

    format_ = capture_.format();
    samples_.reserve(static_cast<size_t>(config_.max_seconds * format_.sample_rate) * format_.channels);

    last_tick_ = now;
    next_quality_ = first_due(now, config_.quality_check_hz);
    next_frame_ = first_due(now, config_.visualization_hz);
    state_.status = RecordingStatus::Recording;
    return {};
}

std::expected<void, CoachError> CaptureSession::pause(Clock::time_point now) {
    if (state_.status != RecordingStatus::Recording) {
        return std::unexpected(bad_transition("pause", state_.status));
    }
    drain_ring(true);
    advance_clock(now);
    state_.status = RecordingStatus::Paused;
    return {};
}

std::expected<void, CoachError> CaptureSession::resume(Clock::time_point now) {
    if (state_.status != RecordingStatus::Paused) {
        return std::unexpected(bad_transition("resume", state_.status));
    }
    // Audio that arrived during the pause is not part of the recording.
    drain_ring(false);
    last_tick_ = now;
    next_quality_ = first_due(now, config_.quality_check_hz);
    next_frame_ = first_due(now, config_.visualization_hz);
    state_.status = RecordingStatus::Recording;
    return {};
}

std::expected<EncodedAudio, CoachError> CaptureSession::stop(Clock::time_point now) {
    if (state_.status != RecordingStatus::Recording && state_.status != RecordingStatus::Paused) {
        return std::unexpected(bad_transition("stop", state_.status));
    }

    if (state_.status == RecordingStatus::Recording) {
        drain_ring(true);
        advance_clock(now);
    }
    capture_.stop();
    state_.status = RecordingStatus::Completed;

    auto encoded = post_.process(RawAudio{samples_, format_.sample_rate, format_.channels});
    if (!encoded) {
        std::println(stderr, "capture: post-processing failed: {}", encoded.error().message);
        return std::unexpected(CoachError{ErrorCode::EncodingError, encoded.error().message});
    }

    state_.recording = *encoded;
    return std::move(*encoded);
}

void CaptureSession::cancel() {
    if (state_.status == RecordingStatus::Inactive) return;

    if (state_.status != RecordingStatus::Completed) {
        capture_.stop();
    }
    ring_buf_.reset();
    reset_buffers();
    state_ = RecordingState{};
}

void CaptureSession::clear() {
    if (state_.status == RecordingStatus::Recording || state_.status == RecordingStatus::Paused) {
        cancel();
        return;
    }
    reset_buffers();
    state_ = RecordingState{};
}

std::expected<void, CoachError> CaptureSession::tick(Clock::time_point now) {
    if (state_.status == RecordingStatus::Paused) {
        drain_ring(false);
        return {};
    }
    if (state_.status != RecordingStatus::Recording) return {};

    drain_ring(true);
    advance_clock(now);

    bool quality_due = next_quality_ && now >= *next_quality_;
    bool frame_due = config_.visualize && next_frame_ && now >= *next_frame_;

    // Both feeds read the same analyser frame for this tick.
    if (quality_due || frame_due) {
        auto bins = analyser_.analyse(recent_mono());
        if (quality_due) {
            check_quality(bins);
            reschedule(next_quality_, now, config_.quality_check_hz);
        }
        if (frame_due) {
            emit_frame(bins);
            reschedule(next_frame_, now, config_.visualization_hz);
        }
    }

    if (state_.elapsed_seconds >= config_.max_seconds) {
        auto result = stop(now);
        if (!result) return std::unexpected(result.error());
    }
    return {};
}

std::optional<EncodedAudio> CaptureSession::raw_recording() const {
    if (samples_.empty()) return std::nullopt;
    return EncodedAudio{
        .bytes = wav::encode(samples_, format_.sample_rate, format_.channels),
        .sample_rate = format_.sample_rate,
        .channels = format_.channels,
    };
}

void CaptureSession::drain_ring(bool keep) {
    auto chunk = ring_buf_.drain_all();
    if (keep) {
        samples_.insert(samples_.end(), chunk.begin(), chunk.end());
    }
}

void CaptureSession::advance_clock(Clock::time_point now) {
    if (now > last_tick_) {
        state_.elapsed_seconds += std::chrono::duration<double>(now - last_tick_).count();
    }
    last_tick_ = now;
}

void CaptureSession::check_quality(const std::vector<uint8_t>& bins) {
    auto levels = FrequencyAnalyser::levels(bins);
    auto info = monitor_.observe(levels.volume_level, levels.noise_level, 1.0 / config_.quality_check_hz);
    state_.quality = info;
    qualities_.push(std::move(info));
}

void CaptureSession::emit_frame(const std::vector<uint8_t>& bins) {
    frames_.push(VisualizationFrame{
        .elapsed_seconds = state_.elapsed_seconds,
        .volume_level = FrequencyAnalyser::levels(bins).volume_level,
        .bins = analyser_.visualization(bins),
    });
}

std::vector<int16_t> CaptureSession::recent_mono() const {
    size_t channels = std::max<uint16_t>(format_.channels, 1);
    size_t want = std::min(samples_.size() / channels, fft_size_) * channels;
    std::vector<int16_t> tail(samples_.end() - static_cast<std::ptrdiff_t>(want), samples_.end());
    return AudioPostProcessor::downmix(tail, format_.channels);
}

void CaptureSession::reset_buffers() {
    samples_.clear();
    monitor_.reset();
    analyser_.reset();
    frames_.clear();
    qualities_.clear();
}
