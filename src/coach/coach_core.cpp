#include "coach_core.hpp"

#include "achievement_evaluator.hpp"
#include "transcript_analyzer.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <random>

CoachCore::CoachCore(Config config, bool verbose, TranscriptionBackend& backend, MetricsStore& store)
    : config_(std::move(config)), verbose_(verbose),
      backend_(backend), store_(store),
      cache_(config_.cache.capacity, std::chrono::seconds(config_.cache.ttl_seconds)) {}

std::string CoachCore::new_session_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return std::format("{:016x}", rng());
}

std::expected<SessionReport, CoachError>
CoachCore::process_recording(const EncodedAudio& audio, double recording_seconds,
                             std::chrono::system_clock::time_point now) {
    return process_recording(new_session_id(), audio, recording_seconds, now);
}

std::expected<SessionReport, CoachError>
CoachCore::process_recording(const std::string& session_id, const EncodedAudio& audio,
                             double recording_seconds, std::chrono::system_clock::time_point now) {
    SessionReport report;
    report.session_id = session_id;

    auto metrics = analyse(audio, report.from_cache);
    if (!metrics) return std::unexpected(metrics.error());
    report.metrics = std::move(*metrics);
    report.feedback = analysis::feedback(report.metrics, config_.analysis.feedback);

    log(std::format("Analysed {} words, {:.0f} wpm, {} fillers, clarity {:.0f}",
                    report.metrics.word_count, report.metrics.words_per_minute.value_or(0.0),
                    report.metrics.filler_words.count, report.metrics.clarity_score));

    if (!store_.is_open()) {
        log("Metrics store unavailable, session not recorded");
        return report;
    }

    auto sample = SessionSample::from_metrics(report.metrics, report.session_id);
    if (recording_seconds > 0.0) sample.duration_seconds = recording_seconds;

    // A repeated call may find its own row from an earlier attempt.
    for (const auto& previous : store_.recent_sessions(config_.storage.user_id, 2)) {
        if (previous.session_id == report.session_id) continue;
        report.comparison = aggregation::compare_sessions(
            sample, SessionSample::from_metrics(previous.metrics, previous.session_id));
        break;
    }

    auto committed = commit(report, sample, now);
    if (!committed) return std::unexpected(committed.error());
    return report;
}

std::expected<ProgressSummary, CoachError> CoachCore::progress() {
    auto metrics = user_metrics();
    if (!metrics) return std::unexpected(metrics.error());
    return aggregation::summarize_progress(*metrics);
}

std::expected<UserMetrics, CoachError> CoachCore::user_metrics() {
    auto loaded = store_.load_user(config_.storage.user_id);
    if (!loaded) {
        return std::unexpected(CoachError{ErrorCode::StorageError, "failed to load user metrics"});
    }
    return std::move(loaded->metrics);
}

std::vector<SessionRecord> CoachCore::history(int limit) {
    return store_.recent_sessions(config_.storage.user_id, limit);
}

std::expected<SpeechMetrics, CoachError> CoachCore::analyse(const EncodedAudio& audio, bool& from_cache) {
    AnalysisCache::Key key{audio.bytes.size(), audio.content_type};
    if (auto cached = cache_.get(key)) {
        log("Using cached analysis");
        from_cache = true;
        return std::move(*cached);
    }

    auto transcript = backend_.transcribe(audio.bytes, config_.backend.language);
    if (!transcript) {
        log("Transcription failed: " + transcript.error().message);
        return std::unexpected(transcript.error());
    }

    auto start = std::chrono::steady_clock::now();
    auto metrics = analysis::analyze(*transcript, config_.analysis);
    auto elapsed = std::chrono::steady_clock::now() - start;
    metrics.processing_time_ms += std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

    cache_.put(key, metrics);
    return metrics;
}

std::expected<void, CoachError>
CoachCore::commit(SessionReport& report, const SessionSample& sample,
                  std::chrono::system_clock::time_point now) {
    auto week = aggregation::iso_week_id(now);

    for (int attempt = 1; attempt <= max_commit_attempts; ++attempt) {
        auto loaded = store_.load_user(config_.storage.user_id);
        if (!loaded) {
            return std::unexpected(CoachError{ErrorCode::StorageError, "failed to load user metrics"});
        }

        const auto& seen = loaded->metrics.recorded_sessions;
        if (std::find(seen.begin(), seen.end(), sample.session_id) != seen.end()) {
            log("Session " + sample.session_id + " already recorded");
            report.already_recorded = true;
            report.persisted = true;
            return {};
        }

        auto updated = aggregation::record_session(std::move(loaded->metrics), sample, now);
        auto earned = achievements::detect(updated);
        achievements::unlock(updated, earned, now);

        switch (store_.commit_session(sample.session_id, week, report.metrics, updated, loaded->version)) {
            case SaveResult::Saved:
                for (const auto& id : earned) log("Achievement unlocked: " + id);
                report.new_achievements = std::move(earned);
                report.persisted = true;
                return {};
            case SaveResult::Conflict:
                log(std::format("User metrics changed concurrently, retrying ({}/{})",
                                attempt, max_commit_attempts));
                break;
            case SaveResult::Failed:
                return std::unexpected(CoachError{ErrorCode::StorageError, "failed to store session"});
        }
    }

    return std::unexpected(CoachError{ErrorCode::AggregationConflict,
                                      "user metrics kept changing during update"});
}

void CoachCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[speak-coach] {}", msg);
    }
}
