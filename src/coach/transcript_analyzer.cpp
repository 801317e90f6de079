#include "transcript_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <map>

std::string_view to_string(SpeakingPace pace) {
    switch (pace) {
        case SpeakingPace::Slow: return "slow";
        case SpeakingPace::Moderate: return "moderate";
        case SpeakingPace::Fast: return "fast";
    }
    return "unknown";
}

std::vector<std::string> AnalysisConfig::default_filler_lexicon() {
    return {"um", "uh", "like", "so", "you know", "i mean", "actually", "basically",
            "kind of", "sort of", "just", "totally", "literally", "anyway", "uhm",
            "hmm", "ah", "er"};
}

namespace analysis {

namespace {

std::string normalize(std::string_view token) {
    auto keep = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };

    size_t begin = 0;
    size_t end = token.size();
    while (begin < end && !keep(token[begin])) ++begin;
    while (end > begin && !keep(token[end - 1])) --end;

    std::string out(token.substr(begin, end - begin));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<std::vector<std::string>> compile_lexicon(std::span<const std::string> lexicon) {
    std::vector<std::vector<std::string>> phrases;
    for (const auto& entry : lexicon) {
        auto tokens = tokenize(entry);
        if (!tokens.empty()) phrases.push_back(std::move(tokens));
    }
    // Longest phrases first so "you know" wins over a bare "you".
    std::stable_sort(phrases.begin(), phrases.end(),
                     [](const auto& a, const auto& b) { return a.size() > b.size(); });
    return phrases;
}

double rate(size_t count, double start, double end) {
    double minutes = (end - start) / 60.0;
    return static_cast<double>(count) / minutes;
}

} // namespace

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i > start) {
            auto token = normalize(text.substr(start, i - start));
            if (!token.empty()) tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

std::optional<double> speaking_rate(std::span<const WordTiming> words) {
    return segment_rate(words);
}

std::optional<double> segment_rate(std::span<const WordTiming> words) {
    if (words.empty()) return std::nullopt;
    double start = words.front().start_time;
    double end = words.back().end_time;
    if (end - start <= 0.0) return std::nullopt;
    return rate(words.size(), start, end);
}

FillerAnalysis find_fillers(std::string_view transcript, std::span<const WordTiming> words,
                            std::span<const std::string> lexicon, int total_words) {
    FillerAnalysis result;
    auto tokens = tokenize(transcript);
    auto phrases = compile_lexicon(lexicon);

    std::vector<std::string> timed;
    timed.reserve(words.size());
    for (const auto& w : words) timed.push_back(normalize(w.word));

    size_t cursor = 0;
    auto timestamp_for = [&](const std::string& first, size_t token_index) {
        if (words.empty()) return 0.0;
        for (size_t k = cursor; k < timed.size(); ++k) {
            if (timed[k] == first) {
                cursor = k + 1;
                return words[k].start_time;
            }
        }
        // No aligned timing; fall back to the word at the same position.
        return words[std::min(token_index, words.size() - 1)].start_time;
    };

    size_t i = 0;
    while (i < tokens.size()) {
        const std::vector<std::string>* match = nullptr;
        for (const auto& phrase : phrases) {
            if (i + phrase.size() > tokens.size()) continue;
            if (std::equal(phrase.begin(), phrase.end(), tokens.begin() + static_cast<std::ptrdiff_t>(i))) {
                match = &phrase;
                break;
            }
        }

        if (!match) {
            ++i;
            continue;
        }

        std::string text = (*match)[0];
        for (size_t p = 1; p < match->size(); ++p) text += " " + (*match)[p];

        result.occurrences.push_back({text, timestamp_for((*match)[0], i)});
        i += match->size();
    }

    result.count = static_cast<int>(result.occurrences.size());
    if (total_words > 0) {
        result.percentage = static_cast<double>(result.count) / total_words * 100.0;
    }
    return result;
}

std::vector<Pause> find_pauses(std::span<const WordTiming> words, double threshold_seconds) {
    std::vector<Pause> pauses;
    for (size_t i = 0; i + 1 < words.size(); ++i) {
        const auto& current = words[i];
        const auto& next = words[i + 1];
        double gap = next.start_time - current.end_time;
        if (gap > threshold_seconds) {
            pauses.push_back({
                .start_time = current.end_time,
                .end_time = next.start_time,
                .duration_seconds = gap,
                .word_before = current.word,
                .word_after = next.word,
            });
        }
    }
    return pauses;
}

std::vector<RapidWord> find_rapid_words(std::span<const WordTiming> words, double threshold_wpm) {
    std::vector<RapidWord> rapid;
    if (words.size() < 3) return rapid;

    for (size_t i = 1; i + 1 < words.size(); ++i) {
        double start = words[i - 1].start_time;
        double end = words[i + 1].end_time;
        if (end - start <= 0.0) continue;

        double wpm = rate(3, start, end);
        if (wpm > threshold_wpm) {
            rapid.push_back({words[i].word, words[i].start_time, words[i].end_time, wpm});
        }
    }
    return rapid;
}

std::vector<Sentence> detect_sentences(std::string_view transcript, std::span<const WordTiming> words) {
    std::vector<Sentence> sentences;

    // Split after runs of terminal punctuation.
    std::vector<std::string> parts;
    std::string current;
    for (size_t i = 0; i < transcript.size(); ++i) {
        char c = transcript[i];
        current.push_back(c);
        bool terminal = c == '.' || c == '!' || c == '?';
        bool boundary = i + 1 == transcript.size() ||
                        std::isspace(static_cast<unsigned char>(transcript[i + 1]));
        if (terminal && boundary) {
            parts.push_back(std::move(current));
            current.clear();
        }
    }
    parts.push_back(std::move(current));

    size_t word_index = 0;
    for (auto& part : parts) {
        auto tokens = tokenize(part);
        if (tokens.empty()) continue;

        auto first = part.find_first_not_of(" \t\r\n");
        auto last = part.find_last_not_of(" \t\r\n");
        Sentence s{.text = part.substr(first, last - first + 1)};

        if (!words.empty() && word_index < words.size()) {
            size_t end_index = std::min(word_index + tokens.size(), words.size());
            auto segment = words.subspan(word_index, end_index - word_index);
            s.start_time = segment.front().start_time;
            s.end_time = segment.back().end_time;
            s.words_per_minute = segment_rate(segment);
        }
        word_index += tokens.size();
        sentences.push_back(std::move(s));
    }
    return sentences;
}

double clarity_score(double confidence, double filler_percentage,
                     std::optional<double> words_per_minute, const ClarityPolicy& policy) {
    double weighted = 0.0;
    double weight = 0.0;

    weighted += policy.confidence_weight * std::clamp(confidence, 0.0, 1.0);
    weight += policy.confidence_weight;

    if (policy.filler_ceiling_percent > 0.0) {
        double filler = 1.0 - filler_percentage / policy.filler_ceiling_percent;
        weighted += policy.filler_weight * std::clamp(filler, 0.0, 1.0);
        weight += policy.filler_weight;
    }

    if (words_per_minute && policy.pace_tolerance_wpm > 0.0) {
        double wpm = *words_per_minute;
        double deviation = 0.0;
        if (wpm < policy.ideal_wpm_min) deviation = policy.ideal_wpm_min - wpm;
        else if (wpm > policy.ideal_wpm_max) deviation = wpm - policy.ideal_wpm_max;
        double pace = 1.0 - deviation / policy.pace_tolerance_wpm;
        weighted += policy.pace_weight * std::clamp(pace, 0.0, 1.0);
        weight += policy.pace_weight;
    }

    if (weight <= 0.0) return 0.0;
    return std::clamp(100.0 * weighted / weight, 0.0, 100.0);
}

SpeechMetrics analyze(const TranscriptionResult& result, const AnalysisConfig& config) {
    SpeechMetrics m;
    m.transcript = result.transcript;
    m.confidence = result.confidence;
    m.processing_time_ms = result.processing_ms;

    std::span<const WordTiming> words(result.words);
    m.word_count = words.empty() ? static_cast<int>(tokenize(result.transcript).size())
                                 : static_cast<int>(words.size());
    if (m.word_count == 0) return m;

    m.duration_seconds = words.empty() ? 0.0 : words.back().end_time;
    m.words_per_minute = speaking_rate(words);
    m.filler_words = find_fillers(result.transcript, words, config.filler_lexicon, m.word_count);
    m.pauses = find_pauses(words, config.pause_threshold_seconds);
    m.rapid_words = find_rapid_words(words, config.rapid_wpm_threshold);
    m.sentences = detect_sentences(result.transcript, words);
    m.clarity_score = clarity_score(result.confidence, m.filler_words.percentage,
                                    m.words_per_minute, config.clarity);
    return m;
}

SpeakingPace classify_pace(double words_per_minute, const FeedbackPolicy& policy) {
    if (words_per_minute < policy.slow_wpm) return SpeakingPace::Slow;
    if (words_per_minute > policy.fast_wpm) return SpeakingPace::Fast;
    return SpeakingPace::Moderate;
}

Feedback feedback(const SpeechMetrics& metrics, const FeedbackPolicy& policy) {
    Feedback fb;
    fb.encouragement = "With practice, you can continue to refine your speaking skills "
                       "and deliver even more impactful speeches.";

    // Nothing was said; there is nothing to grade.
    if (metrics.word_count == 0) {
        fb.positive.push_back("Thank you for recording your speech.");
        return fb;
    }

    if (metrics.words_per_minute) {
        double wpm = *metrics.words_per_minute;
        fb.pace = classify_pace(wpm, policy);
        switch (*fb.pace) {
            case SpeakingPace::Moderate:
                fb.positive.push_back(
                    std::format("Your speaking pace is well-balanced at {:.0f} words per minute.", wpm));
                break;
            case SpeakingPace::Slow:
                fb.improvement.push_back(
                    std::format("Your speaking pace is a bit slow at {:.0f} words per minute.", wpm));
                fb.suggestions.push_back("Try to increase your speaking rate slightly to improve engagement.");
                break;
            case SpeakingPace::Fast:
                fb.improvement.push_back(
                    std::format("Your speaking pace is a bit fast at {:.0f} words per minute.", wpm));
                fb.suggestions.push_back("Consider slowing down slightly to improve clarity and allow "
                                         "listeners to better process your message.");
                break;
        }
    }

    const auto& fillers = metrics.filler_words;
    if (fillers.percentage <= policy.low_filler_percent) {
        fb.positive.push_back(
            "You used very few filler words, which makes your speech sound confident and polished.");
    } else if (fillers.percentage <= policy.moderate_filler_percent) {
        fb.positive.push_back("You used a reasonable amount of filler words.");
    } else {
        fb.improvement.push_back(
            std::format("You used filler words at a rate of {:.1f}% of your total words.", fillers.percentage));

        // On a tie the filler that reached the count first wins.
        std::map<std::string, int> counts;
        std::string most_common;
        int best = 0;
        for (const auto& o : fillers.occurrences) {
            int n = ++counts[o.word];
            if (n > best) {
                best = n;
                most_common = o.word;
            }
        }
        if (!most_common.empty()) {
            fb.improvement.push_back(
                std::format("Your most frequently used filler word was \"{}\".", most_common));
            fb.suggestions.push_back("Try to replace filler words with brief pauses to sound more confident.");
        }
    }

    if (metrics.duration_seconds > 0.0) {
        double per_minute = static_cast<double>(metrics.pauses.size()) / metrics.duration_seconds * 60.0;
        if (per_minute < policy.few_pauses_per_minute) {
            fb.improvement.push_back("You had very few pauses in your speech.");
            fb.suggestions.push_back("Consider adding strategic pauses to emphasize key points and give "
                                     "listeners time to process information.");
        } else if (per_minute > policy.many_pauses_per_minute) {
            fb.improvement.push_back("Your speech contained many pauses.");
            fb.suggestions.push_back(
                "Try to use pauses more strategically and keep your thoughts more connected.");
        } else {
            fb.positive.push_back("You used pauses effectively throughout your speech.");
        }
    }

    double clarity = metrics.clarity_score;
    if (clarity >= policy.excellent_clarity) {
        fb.positive.push_back(std::format("Your overall clarity score is excellent at {:.0f}/100.", clarity));
    } else if (clarity >= policy.good_clarity) {
        fb.positive.push_back(std::format("Your overall clarity score is good at {:.0f}/100.", clarity));
    } else {
        fb.improvement.push_back(
            std::format("Your overall clarity score is {:.0f}/100, which has room for improvement.", clarity));
        fb.suggestions.push_back(
            "Focus on reducing filler words and using a more consistent pace to improve clarity.");
    }

    if (fb.positive.empty()) fb.positive.push_back("Thank you for recording your speech.");
    return fb;
}

} // namespace analysis
