#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct WordTiming {
    std::string word;
    double start_time = 0.0; // seconds
    double end_time = 0.0;
    std::optional<double> confidence;
};

struct TranscriptAlternative {
    std::string transcript;
    double confidence = 0.0;
};

// What the transcription collaborator hands back. Words are ordered by start time.
struct TranscriptionResult {
    std::string transcript;
    double confidence = 0.0;
    std::vector<WordTiming> words;
    std::vector<TranscriptAlternative> alternatives;
    std::string language;
    int64_t processing_ms = 0;
};

struct FillerOccurrence {
    std::string word;
    double timestamp = 0.0;
};

struct FillerAnalysis {
    int count = 0;
    double percentage = 0.0;
    std::vector<FillerOccurrence> occurrences;
};

struct Pause {
    double start_time = 0.0;
    double end_time = 0.0;
    double duration_seconds = 0.0;
    std::string word_before;
    std::string word_after;
};

struct RapidWord {
    std::string word;
    double start_time = 0.0;
    double end_time = 0.0;
    double words_per_minute = 0.0;
};

struct Sentence {
    std::string text;
    double start_time = 0.0;
    double end_time = 0.0;
    std::optional<double> words_per_minute;
};

struct SpeechMetrics {
    std::string transcript;
    double confidence = 0.0;
    double duration_seconds = 0.0;
    int word_count = 0;
    std::optional<double> words_per_minute;
    FillerAnalysis filler_words;
    double clarity_score = 0.0;
    std::vector<Pause> pauses;
    std::vector<RapidWord> rapid_words;
    std::vector<Sentence> sentences;
    int64_t processing_time_ms = 0;
};

enum class SpeakingPace { Slow, Moderate, Fast };

std::string_view to_string(SpeakingPace pace);

// Coaching notes derived from one session's metrics.
struct Feedback {
    std::optional<SpeakingPace> pace; // unset when no speaking rate is known
    std::vector<std::string> positive;
    std::vector<std::string> improvement;
    std::vector<std::string> suggestions;
    std::string encouragement;
};
