#pragma once

#include "speech_types.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Weighted composite used for the clarity score. Weights need not sum to 1;
// they are normalised over the components that are available.
struct ClarityPolicy {
    double confidence_weight = 0.4;
    double filler_weight = 0.35;
    double pace_weight = 0.25;
    double ideal_wpm_min = 140.0;
    double ideal_wpm_max = 170.0;
    double pace_tolerance_wpm = 60.0;    // deviation outside the band that scores zero
    double filler_ceiling_percent = 20.0; // filler rate that scores zero
};

// Bands used to turn metrics into coaching notes.
struct FeedbackPolicy {
    double slow_wpm = 120.0;
    double fast_wpm = 160.0;
    double low_filler_percent = 2.0;
    double moderate_filler_percent = 5.0;
    double few_pauses_per_minute = 2.0;
    double many_pauses_per_minute = 8.0;
    double excellent_clarity = 85.0;
    double good_clarity = 70.0;
};

struct AnalysisConfig {
    double pause_threshold_seconds = 1.5;
    double rapid_wpm_threshold = 180.0;
    std::vector<std::string> filler_lexicon = default_filler_lexicon();
    ClarityPolicy clarity;
    FeedbackPolicy feedback;

    static std::vector<std::string> default_filler_lexicon();
};

// Pure functions over a transcript and its word timings. None of them throw
// on missing data; they fall back to empty results or std::nullopt.
namespace analysis {

std::vector<std::string> tokenize(std::string_view text);

std::optional<double> speaking_rate(std::span<const WordTiming> words);
std::optional<double> segment_rate(std::span<const WordTiming> words);

FillerAnalysis find_fillers(std::string_view transcript, std::span<const WordTiming> words,
                            std::span<const std::string> lexicon, int total_words);

std::vector<Pause> find_pauses(std::span<const WordTiming> words, double threshold_seconds = 1.5);
std::vector<RapidWord> find_rapid_words(std::span<const WordTiming> words, double threshold_wpm = 180.0);
// Sentences are split on terminal punctuation and aligned to the timings in
// transcript order; each carries its own speaking rate.
std::vector<Sentence> detect_sentences(std::string_view transcript, std::span<const WordTiming> words);

double clarity_score(double confidence, double filler_percentage,
                     std::optional<double> words_per_minute, const ClarityPolicy& policy);

SpeechMetrics analyze(const TranscriptionResult& result, const AnalysisConfig& config = {});

SpeakingPace classify_pace(double words_per_minute, const FeedbackPolicy& policy = {});
Feedback feedback(const SpeechMetrics& metrics, const FeedbackPolicy& policy = {});

} // namespace analysis
