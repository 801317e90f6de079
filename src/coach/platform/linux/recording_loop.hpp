#pragma once

#include "capture_session.hpp"
#include "config.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <expected>
#include <optional>

// Drives one interactive recording from the terminal:
// Enter stops, "p" + Enter toggles pause, SIGINT/SIGTERM stop.
class RecordingLoop {
public:
    explicit RecordingLoop(const Config& config, bool verbose = false);
    ~RecordingLoop();

    RecordingLoop(const RecordingLoop&) = delete;
    RecordingLoop& operator=(const RecordingLoop&) = delete;

    bool init();

    // Blocks until the recording completes. On an encoding failure the
    // uncompressed capture is returned instead when there is one.
    std::expected<EncodedAudio, CoachError> run();

    double elapsed_seconds() const { return session_.elapsed_seconds(); }

private:
    void on_stdin();
    void on_timer();
    void report_quality(const QualityInfo& info);
    void draw_meter();
    std::expected<EncodedAudio, CoachError> finish();

    void log(const std::string& msg);

    bool verbose_;
    bool visualize_;

    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    CaptureSession session_;

    std::optional<VisualizationFrame> last_frame_;
    std::vector<QualityIssue> last_issues_;
    std::optional<std::expected<EncodedAudio, CoachError>> result_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;

    std::atomic<bool> running_{false};
};
