#include "lan_backend.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <curl/curl.h>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

CoachError failure(std::string message) {
    return {ErrorCode::TranscriptionFailed, std::move(message)};
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

WordTiming parse_word(const json& w) {
    WordTiming t;
    t.word = trim(w.value("word", ""));
    t.start_time = w.value("start", 0.0);
    t.end_time = w.value("end", 0.0);
    if (w.contains("probability") && w["probability"].is_number()) {
        t.confidence = w["probability"].get<double>();
    }
    return t;
}

} // namespace

std::expected<TranscriptionResult, CoachError> parse_transcription_response(const json& j) {
    if (j.contains("error")) {
        const auto& e = j["error"];
        std::string msg = e.is_string() ? e.get<std::string>()
                        : e.is_object() ? e.value("message", e.dump())
                                        : e.dump();
        return std::unexpected(failure("server error: " + msg));
    }
    if (!j.contains("text")) {
        return std::unexpected(failure("unexpected response: " + j.dump()));
    }

    TranscriptionResult r;
    r.transcript = trim(j["text"].get<std::string>());
    r.language = j.value("language", "");

    // OpenAI puts words at the top level; whisper.cpp nests them per segment.
    if (j.contains("words") && j["words"].is_array()) {
        for (const auto& w : j["words"]) r.words.push_back(parse_word(w));
    }

    bool top_level_words = !r.words.empty();

    std::vector<double> segment_confidences;
    if (j.contains("segments") && j["segments"].is_array()) {
        for (const auto& seg : j["segments"]) {
            if (!top_level_words && seg.contains("words") && seg["words"].is_array()) {
                for (const auto& w : seg["words"]) r.words.push_back(parse_word(w));
            }
            if (seg.contains("avg_logprob") && seg["avg_logprob"].is_number()) {
                segment_confidences.push_back(std::exp(seg["avg_logprob"].get<double>()));
            }
        }
    }

    std::erase_if(r.words, [](const WordTiming& w) { return w.word.empty(); });
    std::stable_sort(r.words.begin(), r.words.end(),
                     [](const WordTiming& a, const WordTiming& b) { return a.start_time < b.start_time; });

    std::vector<double> word_confidences;
    for (const auto& w : r.words) {
        if (w.confidence) word_confidences.push_back(*w.confidence);
    }

    auto mean = [](const std::vector<double>& v) {
        double sum = 0.0;
        for (double x : v) sum += x;
        return sum / static_cast<double>(v.size());
    };
    if (!word_confidences.empty()) {
        r.confidence = mean(word_confidences);
    } else if (!segment_confidences.empty()) {
        r.confidence = mean(segment_confidences);
    }
    r.confidence = std::clamp(r.confidence, 0.0, 1.0);

    if (j.contains("alternatives") && j["alternatives"].is_array()) {
        for (const auto& a : j["alternatives"]) {
            if (!a.is_object()) continue;
            r.alternatives.push_back({trim(a.value("transcript", "")),
                                      std::clamp(a.value("confidence", 0.0), 0.0, 1.0)});
        }
    }

    return r;
}

LanBackend::LanBackend(std::string url, std::string api_format, std::string api_key)
    : url_(std::move(url)), api_format_(std::move(api_format)), api_key_(std::move(api_key)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::expected<TranscriptionResult, CoachError>
LanBackend::transcribe(std::span<const uint8_t> wav, const std::string& language) {
    if (wav.empty()) {
        return std::unexpected(failure("empty audio"));
    }

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(failure("curl_easy_init failed"));
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav.data()), wav.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    add_field(mime, "response_format", "verbose_json");
    if (!language.empty()) add_field(mime, "language", language);

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";
        add_field(mime, "model", "whisper-1");
        add_field(mime, "timestamp_granularities[]", "word");
        add_field(mime, "timestamp_granularities[]", "segment");
    } else {
        // whisper.cpp server
        endpoint = url_ + "/inference";
        add_field(mime, "temperature", "0.0");
        add_field(mime, "split_on_word", "true");
        add_field(mime, "max_len", "1");
    }

    std::string response_body;
    curl_slist* headers = nullptr;
    if (!api_key_.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + api_key_).c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto elapsed = std::chrono::steady_clock::now() - start;

    if (res != CURLE_OK) {
        return std::unexpected(failure(std::string("curl error: ") + curl_easy_strerror(res)));
    }

    try {
        auto parsed = parse_transcription_response(json::parse(response_body));
        if (!parsed) return parsed;
        parsed->processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        if (parsed->language.empty()) parsed->language = language;
        return parsed;
    } catch (const json::exception& e) {
        return std::unexpected(failure(std::format("HTTP {}: JSON parse error: {}", status, e.what())));
    }
}
