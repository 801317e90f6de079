#pragma once

#include "analysis_cache.hpp"
#include "audio_post_processor.hpp"
#include "config.hpp"
#include "error.hpp"
#include "metrics_aggregator.hpp"
#include "speech_types.hpp"
#include "storage/metrics_store.hpp"
#include "transcription/backend.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct SessionReport {
    std::string session_id;
    SpeechMetrics metrics;
    Feedback feedback;
    std::vector<std::string> new_achievements;
    std::optional<SessionComparison> comparison; // against the previous stored session
    bool from_cache = false;
    bool persisted = false;
    bool already_recorded = false; // session id was aggregated by an earlier call
};

// Runs a finished recording through transcription, analysis and aggregation.
// Aggregation is a read-modify-write on the user document guarded by the
// store's version check; conflicting writers are retried a bounded number of times.
// When the retries run out the call fails with AggregationConflict and can be
// repeated with the same session id: a session is stored and counted once.
class CoachCore {
public:
    static constexpr int max_commit_attempts = 3;

    CoachCore(Config config, bool verbose, TranscriptionBackend& backend, MetricsStore& store);

    CoachCore(const CoachCore&) = delete;
    CoachCore& operator=(const CoachCore&) = delete;

    static std::string new_session_id();

    std::expected<SessionReport, CoachError>
        process_recording(const std::string& session_id, const EncodedAudio& audio, double recording_seconds,
                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Same, under a freshly generated session id.
    std::expected<SessionReport, CoachError>
        process_recording(const EncodedAudio& audio, double recording_seconds,
                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    std::expected<ProgressSummary, CoachError> progress();
    std::expected<UserMetrics, CoachError> user_metrics();
    std::vector<SessionRecord> history(int limit);

    const Config& config() const { return config_; }
    AnalysisCache& cache() { return cache_; }

private:
    std::expected<SpeechMetrics, CoachError> analyse(const EncodedAudio& audio, bool& from_cache);
    std::expected<void, CoachError> commit(SessionReport& report, const SessionSample& sample,
                                           std::chrono::system_clock::time_point now);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    TranscriptionBackend& backend_;
    MetricsStore& store_;
    AnalysisCache cache_;
};
