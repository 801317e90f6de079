#include <catch2/catch_test_macros.hpp>

#include "capture_session.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"
#include "wav_codec.hpp"

#include <chrono>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Stands in for the device thread: tests push samples into the ring by hand.
class FakeCapture : public AudioCapture {
public:
    FakeCapture(RingBuffer& ring, CaptureFormat format) : ring_(ring), format_(format) {}

    bool start() override {
        if (fail_start) return false;
        capturing_ = true;
        ++starts;
        return true;
    }
    void stop() override {
        capturing_ = false;
        ++stops;
    }
    bool is_capturing() const override { return capturing_; }
    CaptureFormat format() const override { return format_; }

    void feed(size_t count, int16_t value = 1000) {
        std::vector<int16_t> chunk(count, value);
        ring_.write(chunk);
    }

    bool fail_start = false;
    int starts = 0;
    int stops = 0;

private:
    RingBuffer& ring_;
    CaptureFormat format_;
    bool capturing_ = false;
};

CaptureConfig test_config() {
    return CaptureConfig{.max_seconds = 10.0, .quality_check_hz = 10.0, .visualization_hz = 30.0};
}

} // namespace

TEST_CASE("CaptureSession state machine", "[capture]") {
    RingBuffer ring(64000);
    FakeCapture capture(ring, CaptureFormat{16000, 1});
    CaptureSession session(ring, capture, test_config(), {},
                           PostProcessConfig{.compress = false});
    auto t0 = CaptureSession::Clock::now();

    SECTION("InitialStateInactive") {
        REQUIRE(session.status() == RecordingStatus::Inactive);
        REQUIRE(session.elapsed_seconds() == 0.0);
        REQUIRE_FALSE(session.state().recording.has_value());
    }

    SECTION("StartRecords") {
        REQUIRE(session.start(t0).has_value());
        REQUIRE(session.status() == RecordingStatus::Recording);
        REQUIRE(capture.starts == 1);
    }

    SECTION("DoubleStartRejected") {
        REQUIRE(session.start(t0).has_value());
        auto again = session.start(t0 + 10ms);
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == ErrorCode::InvalidStateTransition);
        REQUIRE(capture.starts == 1);
    }

    SECTION("StartWhilePausedRejected") {
        REQUIRE(session.start(t0).has_value());
        REQUIRE(session.pause(t0 + 10ms).has_value());
        REQUIRE(session.start(t0 + 20ms).error().code == ErrorCode::InvalidStateTransition);
    }

    SECTION("InvalidTransitionsFromInactive") {
        REQUIRE(session.pause(t0).error().code == ErrorCode::InvalidStateTransition);
        REQUIRE(session.resume(t0).error().code == ErrorCode::InvalidStateTransition);
        REQUIRE(session.stop(t0).error().code == ErrorCode::InvalidStateTransition);
        REQUIRE(session.status() == RecordingStatus::Inactive);
    }

    SECTION("ResumeWhileRecordingRejected") {
        REQUIRE(session.start(t0).has_value());
        REQUIRE(session.resume(t0 + 10ms).error().code == ErrorCode::InvalidStateTransition);
        REQUIRE(session.status() == RecordingStatus::Recording);
    }

    SECTION("DeviceUnavailable") {
        capture.fail_start = true;
        auto r = session.start(t0);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::DeviceUnavailable);
        REQUIRE(session.status() == RecordingStatus::Inactive);
    }

    SECTION("StopProducesRecording") {
        REQUIRE(session.start(t0).has_value());
        capture.feed(8000, 123);
        auto audio = session.stop(t0 + 500ms);
        REQUIRE(audio.has_value());
        REQUIRE(session.status() == RecordingStatus::Completed);
        REQUIRE(capture.stops == 1);
        REQUIRE(session.state().recording.has_value());

        auto decoded = wav::decode(audio->bytes);
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->sample_rate == 16000);
        REQUIRE(decoded->samples.size() == 8000);
        REQUIRE(decoded->samples.front() == 123);
    }

    SECTION("StopWithoutAudioIsEncodingError") {
        REQUIRE(session.start(t0).has_value());
        auto audio = session.stop(t0 + 100ms);
        REQUIRE_FALSE(audio.has_value());
        REQUIRE(audio.error().code == ErrorCode::EncodingError);
        REQUIRE(session.status() == RecordingStatus::Completed);
        REQUIRE_FALSE(session.raw_recording().has_value());
    }

    SECTION("ElapsedFrozenWhilePaused") {
        REQUIRE(session.start(t0).has_value());
        REQUIRE(session.tick(t0 + 500ms).has_value());
        REQUIRE(session.elapsed_seconds() == 0.5);

        REQUIRE(session.pause(t0 + 1s).has_value());
        REQUIRE(session.status() == RecordingStatus::Paused);
        REQUIRE(session.tick(t0 + 3s).has_value());
        REQUIRE(session.elapsed_seconds() == 1.0);

        REQUIRE(session.resume(t0 + 5s).has_value());
        REQUIRE(session.tick(t0 + 5500ms).has_value());
        REQUIRE(session.elapsed_seconds() == 1.5);
    }

    SECTION("AudioWhilePausedDiscarded") {
        REQUIRE(session.start(t0).has_value());
        capture.feed(100);
        REQUIRE(session.tick(t0 + 10ms).has_value());
        REQUIRE(session.pause(t0 + 20ms).has_value());

        capture.feed(200);
        REQUIRE(session.tick(t0 + 30ms).has_value());
        capture.feed(300);
        REQUIRE(session.resume(t0 + 40ms).has_value());
        REQUIRE(session.captured_samples() == 100);

        capture.feed(50);
        auto audio = session.stop(t0 + 50ms);
        REQUIRE(audio.has_value());
        REQUIRE(wav::decode(audio->bytes)->samples.size() == 150);
    }

    SECTION("StopWhilePaused") {
        REQUIRE(session.start(t0).has_value());
        capture.feed(160);
        REQUIRE(session.pause(t0 + 1s).has_value());
        auto audio = session.stop(t0 + 4s);
        REQUIRE(audio.has_value());
        REQUIRE(session.elapsed_seconds() == 1.0);
    }

    SECTION("CancelDiscardsEverything") {
        REQUIRE(session.start(t0).has_value());
        capture.feed(1000);
        REQUIRE(session.tick(t0 + 100ms).has_value());
        session.cancel();
        REQUIRE(session.status() == RecordingStatus::Inactive);
        REQUIRE(session.captured_samples() == 0);
        REQUIRE(session.elapsed_seconds() == 0.0);
        REQUIRE(capture.stops == 1);
        REQUIRE(ring.available() == 0);
    }

    SECTION("ClearAfterCompletion") {
        REQUIRE(session.start(t0).has_value());
        capture.feed(1000);
        REQUIRE(session.stop(t0 + 100ms).has_value());
        session.clear();
        REQUIRE(session.status() == RecordingStatus::Inactive);
        REQUIRE_FALSE(session.state().recording.has_value());
        REQUIRE(capture.stops == 1);
    }

    SECTION("RestartAfterCompletion") {
        REQUIRE(session.start(t0).has_value());
        capture.feed(1000);
        REQUIRE(session.stop(t0 + 100ms).has_value());

        REQUIRE(session.start(t0 + 1s).has_value());
        REQUIRE(session.status() == RecordingStatus::Recording);
        REQUIRE(session.captured_samples() == 0);
        REQUIRE(session.elapsed_seconds() == 0.0);
    }
}

TEST_CASE("CaptureSession limits and feeds", "[capture]") {
    RingBuffer ring(64000);
    FakeCapture capture(ring, CaptureFormat{16000, 2});
    auto t0 = CaptureSession::Clock::now();

    SECTION("AutoStopAtMaxDuration") {
        auto cfg = test_config();
        cfg.max_seconds = 1.0;
        CaptureSession session(ring, capture, cfg, {}, PostProcessConfig{.target_sample_rate = 8000});

        REQUIRE(session.start(t0).has_value());
        capture.feed(32000);
        REQUIRE(session.tick(t0 + 900ms).has_value());
        REQUIRE(session.status() == RecordingStatus::Recording);

        REQUIRE(session.tick(t0 + 1100ms).has_value());
        REQUIRE(session.status() == RecordingStatus::Completed);
        REQUIRE(capture.stops == 1);

        // Stereo 16 kHz in, mono 8 kHz out.
        auto& rec = session.state().recording;
        REQUIRE(rec.has_value());
        REQUIRE(rec->sample_rate == 8000);
        REQUIRE(rec->channels == 1);
        REQUIRE(wav::decode(rec->bytes)->samples.size() == 8000);
    }

    SECTION("AutoStopEncodingFailureSurfaces") {
        auto cfg = test_config();
        cfg.max_seconds = 1.0;
        CaptureSession session(ring, capture, cfg);

        REQUIRE(session.start(t0).has_value());
        auto r = session.tick(t0 + 2s);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::EncodingError);
        REQUIRE(session.status() == RecordingStatus::Completed);
    }

    SECTION("RawRecordingKeepsCaptureFormat") {
        CaptureSession session(ring, capture, test_config());
        REQUIRE(session.start(t0).has_value());
        capture.feed(400);
        REQUIRE(session.stop(t0 + 100ms).has_value());

        auto raw = session.raw_recording();
        REQUIRE(raw.has_value());
        REQUIRE(raw->sample_rate == 16000);
        REQUIRE(raw->channels == 2);
        REQUIRE(wav::decode(raw->bytes)->samples.size() == 400);
    }

    SECTION("QualityFeedFlagsSilence") {
        CaptureSession session(ring, capture, test_config());
        REQUIRE(session.start(t0).has_value());
        capture.feed(3200, 0);

        REQUIRE(session.tick(t0 + 50ms).has_value());
        REQUIRE_FALSE(session.next_quality().has_value());

        REQUIRE(session.tick(t0 + 100ms).has_value());
        auto q = session.next_quality();
        REQUIRE(q.has_value());
        REQUIRE(q->has(QualityIssue::LowVolume));
        REQUIRE(q->volume_level == 0);
        REQUIRE(session.state().quality.has_value());
        REQUIRE_FALSE(session.next_quality().has_value());
    }

    SECTION("VisualizationFrames") {
        CaptureSession session(ring, capture, test_config());
        REQUIRE(session.start(t0).has_value());
        capture.feed(3200, 500);

        REQUIRE(session.tick(t0 + 40ms).has_value());
        auto frame = session.next_frame();
        REQUIRE(frame.has_value());
        REQUIRE(frame->bins.size() == 32);
        REQUIRE(frame->elapsed_seconds == 0.04);
    }

    SECTION("VisualizationDisabled") {
        auto cfg = test_config();
        cfg.visualize = false;
        CaptureSession session(ring, capture, cfg);
        REQUIRE(session.start(t0).has_value());
        capture.feed(3200, 500);
        REQUIRE(session.tick(t0 + 200ms).has_value());
        REQUIRE_FALSE(session.next_frame().has_value());
        REQUIRE(session.next_quality().has_value());
    }

    SECTION("ZeroRateQualityFeedDisabled") {
        auto cfg = test_config();
        cfg.quality_check_hz = 0.0;
        CaptureSession session(ring, capture, cfg);
        REQUIRE(session.start(t0).has_value());
        capture.feed(3200, 0);

        for (int i = 1; i <= 20; ++i) {
            REQUIRE(session.tick(t0 + i * 100ms).has_value());
        }
        REQUIRE_FALSE(session.next_quality().has_value());
        REQUIRE_FALSE(session.state().quality.has_value());
        REQUIRE(session.next_frame().has_value());
    }

    SECTION("ZeroRateVisualizationFeedDisabled") {
        auto cfg = test_config();
        cfg.visualization_hz = 0.0;
        CaptureSession session(ring, capture, cfg);
        REQUIRE(session.start(t0).has_value());
        capture.feed(3200, 500);

        REQUIRE(session.tick(t0 + 10ms).has_value());
        REQUIRE_FALSE(session.next_quality().has_value());
        REQUIRE_FALSE(session.next_frame().has_value());

        REQUIRE(session.tick(t0 + 100ms).has_value());
        REQUIRE(session.next_quality().has_value());
        REQUIRE_FALSE(session.next_frame().has_value());

        REQUIRE(session.pause(t0 + 150ms).has_value());
        REQUIRE(session.resume(t0 + 200ms).has_value());
        REQUIRE(session.tick(t0 + 210ms).has_value());
        REQUIRE_FALSE(session.next_frame().has_value());
    }

    SECTION("FeedsRestartOnStart") {
        CaptureSession session(ring, capture, test_config());
        REQUIRE(session.start(t0).has_value());
        capture.feed(3200, 0);
        REQUIRE(session.tick(t0 + 100ms).has_value());
        session.cancel();

        REQUIRE(session.start(t0 + 1s).has_value());
        REQUIRE_FALSE(session.next_quality().has_value());
        REQUIRE_FALSE(session.next_frame().has_value());
    }

    SECTION("StatusNames") {
        REQUIRE(to_string(RecordingStatus::Inactive) == "inactive");
        REQUIRE(to_string(RecordingStatus::Recording) == "recording");
        REQUIRE(to_string(RecordingStatus::Paused) == "paused");
        REQUIRE(to_string(RecordingStatus::Completed) == "completed");
    }
}
