#include "metrics_aggregator.hpp"

#include <algorithm>
#include <cstdio>
#include <format>

SessionSample SessionSample::from_metrics(const SpeechMetrics& metrics, std::string session_id) {
    return {
        .session_id = std::move(session_id),
        .words_per_minute = metrics.words_per_minute.value_or(0.0),
        .filler_word_percentage = metrics.filler_words.percentage,
        .clarity_score = metrics.clarity_score,
        .duration_seconds = metrics.duration_seconds,
    };
}

namespace aggregation {

namespace {

double percent_change(double current, double previous) {
    if (previous == 0.0) return 0.0;
    return (current - previous) / previous * 100.0;
}

Trend trend(double current, double previous) {
    return {current, previous, percent_change(current, previous)};
}

} // namespace

std::string iso_week_id(std::chrono::system_clock::time_point when) {
    using namespace std::chrono;

    auto day = floor<days>(when);
    unsigned iso_weekday = weekday{day}.iso_encoding(); // Monday = 1 .. Sunday = 7

    // The ISO year is the year containing this week's Thursday.
    sys_days thursday = day + days{4 - static_cast<int>(iso_weekday)};
    year_month_day ymd{thursday};
    sys_days jan1{ymd.year() / January / 1};
    int week = static_cast<int>((thursday - jan1).count() / 7) + 1;

    return std::format("{:04}-{:02}", static_cast<int>(ymd.year()), week);
}

std::string next_week_id(const std::string& week_id) {
    using namespace std::chrono;

    int y = 0;
    int w = 0;
    if (std::sscanf(week_id.c_str(), "%d-%d", &y, &w) != 2 || w < 1 || w > 53) return {};

    sys_days jan4{year{y} / January / 4};
    sys_days week1_monday = jan4 - days{static_cast<int>(weekday{jan4}.iso_encoding()) - 1};
    sys_days next_monday = week1_monday + days{7 * w};
    return iso_week_id(next_monday);
}

double incremental_mean(double mean, int count, double value) {
    if (count <= 0) return value;
    return (mean * count + value) / (count + 1);
}

UserMetrics record_session(UserMetrics metrics, const SessionSample& session,
                           std::chrono::system_clock::time_point now) {
    if (!session.session_id.empty()) {
        auto& seen = metrics.recorded_sessions;
        if (std::find(seen.begin(), seen.end(), session.session_id) != seen.end()) {
            return metrics;
        }
        seen.push_back(session.session_id);
        if (seen.size() > max_recorded_sessions) {
            seen.erase(seen.begin(), seen.begin() + static_cast<std::ptrdiff_t>(seen.size() - max_recorded_sessions));
        }
    }

    auto& week = metrics.weekly_progress[iso_week_id(now)];
    int n = std::max(week.total_sessions, 0);
    week.words_per_minute = incremental_mean(week.words_per_minute, n, session.words_per_minute);
    week.filler_word_percentage = incremental_mean(week.filler_word_percentage, n, session.filler_word_percentage);
    week.clarity_score = incremental_mean(week.clarity_score, n, session.clarity_score);
    week.total_sessions = n + 1;

    int total = std::max(metrics.session_count, 0);
    metrics.avg_words_per_minute = incremental_mean(metrics.avg_words_per_minute, total, session.words_per_minute);
    metrics.avg_filler_word_percentage =
        incremental_mean(metrics.avg_filler_word_percentage, total, session.filler_word_percentage);
    metrics.avg_clarity_score = incremental_mean(metrics.avg_clarity_score, total, session.clarity_score);
    metrics.session_count = total + 1;
    metrics.total_speaking_time += std::max(session.duration_seconds, 0.0);
    metrics.last_updated = now;

    return metrics;
}

ProgressSummary summarize_progress(const UserMetrics& metrics) {
    ProgressSummary summary;
    summary.total_sessions = metrics.session_count;
    summary.practice_minutes = metrics.total_speaking_time / 60.0;

    const auto& weeks = metrics.weekly_progress;
    WeeklyAggregate current;
    WeeklyAggregate previous;
    if (!weeks.empty()) {
        auto last = std::prev(weeks.end());
        current = last->second;
        if (last != weeks.begin()) previous = std::prev(last)->second;
    }

    summary.words_per_minute = trend(current.words_per_minute, previous.words_per_minute);
    summary.filler_word_percentage = trend(current.filler_word_percentage, previous.filler_word_percentage);
    summary.clarity_score = trend(current.clarity_score, previous.clarity_score);

    size_t skip = weeks.size() > chart_weeks ? weeks.size() - chart_weeks : 0;
    for (auto it = std::next(weeks.begin(), static_cast<std::ptrdiff_t>(skip)); it != weeks.end(); ++it) {
        auto dash = it->first.find('-');
        summary.labels.push_back("Week " + (dash == std::string::npos ? it->first : it->first.substr(dash + 1)));
        summary.weekly_words_per_minute.push_back(it->second.words_per_minute);
        summary.weekly_filler_word_percentage.push_back(it->second.filler_word_percentage);
        summary.weekly_clarity_score.push_back(it->second.clarity_score);
    }
    return summary;
}

SessionComparison compare_sessions(const SessionSample& current, const SessionSample& previous) {
    SessionComparison c;
    c.words_per_minute = trend(current.words_per_minute, previous.words_per_minute);
    c.filler_word_percentage = trend(current.filler_word_percentage, previous.filler_word_percentage);
    c.clarity_score = trend(current.clarity_score, previous.clarity_score);

    // Filler and clarity movements count double; fewer fillers is better.
    int score = (c.words_per_minute.change_percent > 0 ? 1 : -1) +
                (c.filler_word_percentage.change_percent < 0 ? 2 : -2) +
                (c.clarity_score.change_percent > 0 ? 2 : -2);
    c.improvement = score > 0;
    return c;
}

} // namespace aggregation
