#pragma once

#include "speech_types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

struct WeeklyAggregate {
    double words_per_minute = 0.0;
    double filler_word_percentage = 0.0;
    double clarity_score = 0.0;
    int total_sessions = 0;
};

struct Achievement {
    std::string id;
    std::string title;
    std::string description;
    std::chrono::system_clock::time_point achieved_at;
};

// Longitudinal record for one user. Only the aggregator and the achievement
// evaluator write to it.
struct UserMetrics {
    std::string user_id;
    int session_count = 0;
    double total_speaking_time = 0.0; // seconds
    double avg_words_per_minute = 0.0;
    double avg_filler_word_percentage = 0.0;
    double avg_clarity_score = 0.0;
    std::map<std::string, WeeklyAggregate> weekly_progress; // keyed by ISO week id
    std::vector<Achievement> achievements;
    std::vector<std::string> recorded_sessions; // most recent last, bounded
    std::chrono::system_clock::time_point last_updated{};
};

// The per-session values folded into the running means.
struct SessionSample {
    std::string session_id;
    double words_per_minute = 0.0;
    double filler_word_percentage = 0.0;
    double clarity_score = 0.0;
    double duration_seconds = 0.0;

    static SessionSample from_metrics(const SpeechMetrics& metrics, std::string session_id);
};

struct Trend {
    double current = 0.0;
    double previous = 0.0;
    double change_percent = 0.0;
};

struct ProgressSummary {
    Trend words_per_minute;
    Trend filler_word_percentage;
    Trend clarity_score;
    int total_sessions = 0;
    double practice_minutes = 0.0;

    std::vector<std::string> labels;
    std::vector<double> weekly_words_per_minute;
    std::vector<double> weekly_filler_word_percentage;
    std::vector<double> weekly_clarity_score;
};

struct SessionComparison {
    Trend words_per_minute;
    Trend filler_word_percentage;
    Trend clarity_score;
    bool improvement = false;
};

namespace aggregation {

constexpr size_t max_recorded_sessions = 1000;
constexpr size_t chart_weeks = 6;

std::string iso_week_id(std::chrono::system_clock::time_point when);

// Id of the ISO week following week_id, or an empty string if week_id is malformed.
std::string next_week_id(const std::string& week_id);

double incremental_mean(double mean, int count, double value);

// Folds one completed session into the user's weekly and lifetime statistics.
// Replaying a session id that was already recorded returns the input unchanged.
UserMetrics record_session(UserMetrics metrics, const SessionSample& session,
                           std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

ProgressSummary summarize_progress(const UserMetrics& metrics);

SessionComparison compare_sessions(const SessionSample& current, const SessionSample& previous);

} // namespace aggregation
