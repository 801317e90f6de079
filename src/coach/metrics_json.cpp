#include "metrics_json.hpp"

using json = nlohmann::json;

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_millis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

json trend_json(const Trend& t) {
    return {{"current", t.current}, {"previous", t.previous}, {"trend", t.change_percent}};
}

} // namespace

void to_json(json& j, const WordTiming& w) {
    j = {{"word", w.word}, {"startTime", w.start_time}, {"endTime", w.end_time}};
    if (w.confidence) j["confidence"] = *w.confidence;
}

void from_json(const json& j, WordTiming& w) {
    w.word = j.value("word", "");
    w.start_time = j.value("startTime", 0.0);
    w.end_time = j.value("endTime", 0.0);
    if (j.contains("confidence") && j["confidence"].is_number()) {
        w.confidence = j["confidence"].get<double>();
    }
}

void to_json(json& j, const FillerOccurrence& f) {
    j = {{"word", f.word}, {"timestamp", f.timestamp}};
}

void from_json(const json& j, FillerOccurrence& f) {
    f.word = j.value("word", "");
    f.timestamp = j.value("timestamp", 0.0);
}

void to_json(json& j, const Pause& p) {
    j = {
        {"startTime", p.start_time},
        {"endTime", p.end_time},
        {"durationSeconds", p.duration_seconds},
        {"wordBefore", p.word_before},
        {"wordAfter", p.word_after},
    };
}

void from_json(const json& j, Pause& p) {
    p.start_time = j.value("startTime", 0.0);
    p.end_time = j.value("endTime", 0.0);
    p.duration_seconds = j.value("durationSeconds", 0.0);
    p.word_before = j.value("wordBefore", "");
    p.word_after = j.value("wordAfter", "");
}

void to_json(json& j, const RapidWord& r) {
    j = {{"word", r.word}, {"startTime", r.start_time}, {"endTime", r.end_time}, {"wpm", r.words_per_minute}};
}

void from_json(const json& j, RapidWord& r) {
    r.word = j.value("word", "");
    r.start_time = j.value("startTime", 0.0);
    r.end_time = j.value("endTime", 0.0);
    r.words_per_minute = j.value("wpm", 0.0);
}

void to_json(json& j, const Sentence& s) {
    j = {{"text", s.text}, {"startTime", s.start_time}, {"endTime", s.end_time},
         {"wordsPerMinute", s.words_per_minute ? json(*s.words_per_minute) : json(nullptr)}};
}

void from_json(const json& j, Sentence& s) {
    s.text = j.value("text", "");
    s.start_time = j.value("startTime", 0.0);
    s.end_time = j.value("endTime", 0.0);
    s.words_per_minute.reset();
    if (j.contains("wordsPerMinute") && j["wordsPerMinute"].is_number()) {
        s.words_per_minute = j["wordsPerMinute"].get<double>();
    }
}

void to_json(json& j, const SpeechMetrics& m) {
    j = {
        {"transcript", m.transcript},
        {"confidence", m.confidence},
        {"durationSeconds", m.duration_seconds},
        {"wordCount", m.word_count},
        {"wordsPerMinute", m.words_per_minute ? json(*m.words_per_minute) : json(nullptr)},
        {"fillerWords", {
            {"count", m.filler_words.count},
            {"percentage", m.filler_words.percentage},
            {"words", m.filler_words.occurrences},
        }},
        {"clarityScore", m.clarity_score},
        {"pauses", m.pauses},
        {"rapidWords", m.rapid_words},
        {"sentences", m.sentences},
        {"processingTimeMs", m.processing_time_ms},
    };
}

void from_json(const json& j, SpeechMetrics& m) {
    m.transcript = j.value("transcript", "");
    m.confidence = j.value("confidence", 0.0);
    m.duration_seconds = j.value("durationSeconds", 0.0);
    m.word_count = j.value("wordCount", 0);
    m.words_per_minute.reset();
    if (j.contains("wordsPerMinute") && j["wordsPerMinute"].is_number()) {
        m.words_per_minute = j["wordsPerMinute"].get<double>();
    }
    m.filler_words = {};
    if (j.contains("fillerWords") && j["fillerWords"].is_object()) {
        const auto& f = j["fillerWords"];
        m.filler_words.count = f.value("count", 0);
        m.filler_words.percentage = f.value("percentage", 0.0);
        if (f.contains("words")) {
            m.filler_words.occurrences = f["words"].get<std::vector<FillerOccurrence>>();
        }
    }
    m.clarity_score = j.value("clarityScore", 0.0);
    m.pauses = j.contains("pauses") ? j["pauses"].get<std::vector<Pause>>() : std::vector<Pause>{};
    m.rapid_words = j.contains("rapidWords") ? j["rapidWords"].get<std::vector<RapidWord>>()
                                             : std::vector<RapidWord>{};
    m.sentences = j.contains("sentences") ? j["sentences"].get<std::vector<Sentence>>()
                                          : std::vector<Sentence>{};
    m.processing_time_ms = j.value("processingTimeMs", int64_t{0});
}

void to_json(json& j, const Feedback& f) {
    j = {
        {"pace", f.pace ? json(std::string(to_string(*f.pace))) : json(nullptr)},
        {"positive", f.positive},
        {"improvement", f.improvement},
        {"suggestions", f.suggestions},
        {"encouragement", f.encouragement},
    };
}

void to_json(json& j, const WeeklyAggregate& w) {
    j = {
        {"wordsPerMinute", w.words_per_minute},
        {"fillerWordPercentage", w.filler_word_percentage},
        {"clarityScore", w.clarity_score},
        {"totalSessions", w.total_sessions},
    };
}

void from_json(const json& j, WeeklyAggregate& w) {
    w.words_per_minute = j.value("wordsPerMinute", 0.0);
    w.filler_word_percentage = j.value("fillerWordPercentage", 0.0);
    w.clarity_score = j.value("clarityScore", 0.0);
    w.total_sessions = j.value("totalSessions", 0);
}

void to_json(json& j, const Achievement& a) {
    j = {
        {"id", a.id},
        {"title", a.title},
        {"description", a.description},
        {"achievedAt", to_millis(a.achieved_at)},
    };
}

void from_json(const json& j, Achievement& a) {
    a.id = j.value("id", "");
    a.title = j.value("title", "");
    a.description = j.value("description", "");
    a.achieved_at = from_millis(j.value("achievedAt", int64_t{0}));
}

void to_json(json& j, const UserMetrics& m) {
    j = {
        {"userId", m.user_id},
        {"sessionCount", m.session_count},
        {"totalSpeakingTime", m.total_speaking_time},
        {"avgWordsPerMinute", m.avg_words_per_minute},
        {"avgFillerWordPercentage", m.avg_filler_word_percentage},
        {"avgClarityScore", m.avg_clarity_score},
        {"weeklyProgress", m.weekly_progress},
        {"achievements", m.achievements},
        {"recordedSessions", m.recorded_sessions},
        {"lastUpdated", to_millis(m.last_updated)},
    };
}

void from_json(const json& j, UserMetrics& m) {
    m.user_id = j.value("userId", "");
    m.session_count = j.value("sessionCount", 0);
    m.total_speaking_time = j.value("totalSpeakingTime", 0.0);
    m.avg_words_per_minute = j.value("avgWordsPerMinute", 0.0);
    m.avg_filler_word_percentage = j.value("avgFillerWordPercentage", 0.0);
    m.avg_clarity_score = j.value("avgClarityScore", 0.0);
    m.weekly_progress.clear();
    if (j.contains("weeklyProgress") && j["weeklyProgress"].is_object()) {
        for (auto& [week, data] : j["weeklyProgress"].items()) {
            m.weekly_progress[week] = data.get<WeeklyAggregate>();
        }
    }
    m.achievements = j.contains("achievements") ? j["achievements"].get<std::vector<Achievement>>()
                                                : std::vector<Achievement>{};
    m.recorded_sessions = j.contains("recordedSessions")
                              ? j["recordedSessions"].get<std::vector<std::string>>()
                              : std::vector<std::string>{};
    m.last_updated = from_millis(j.value("lastUpdated", int64_t{0}));
}

void to_json(json& j, const ProgressSummary& p) {
    j = {
        {"wordsPerMinute", trend_json(p.words_per_minute)},
        {"fillerWordPercentage", trend_json(p.filler_word_percentage)},
        {"clarityScore", trend_json(p.clarity_score)},
        {"totalSessions", p.total_sessions},
        {"totalPracticingTime", p.practice_minutes},
        {"weeklyData", {
            {"labels", p.labels},
            {"wordsPerMinute", p.weekly_words_per_minute},
            {"fillerWordPercentage", p.weekly_filler_word_percentage},
            {"clarityScore", p.weekly_clarity_score},
        }},
    };
}
