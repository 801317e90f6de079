#pragma once

#include "audio_post_processor.hpp"
#include "audio_quality_monitor.hpp"
#include "capture_session.hpp"
#include "transcript_analyzer.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Backend {
        std::string type = "lan"; // "lan" or "none"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string api_key;
        std::string language = "en";
    } backend;

    struct Audio {
        uint32_t sample_rate = 44100;
        uint16_t channels = 1;
        uint32_t max_seconds = 180;
        double quality_check_hz = 10.0;
        double visualization_hz = 30.0;
        bool visualize = true;
        bool compress = true;
        uint32_t target_sample_rate = 22050;

        // Computed from max_seconds and the capture format (no independent config key).
        size_t ring_buffer_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate * channels;
        }

        CaptureConfig capture() const;
        PostProcessConfig post_process() const;
    } audio;

    QualityThresholds quality;
    AnalysisConfig analysis;

    struct Storage {
        std::string db_path; // empty = <data dir>/metrics.db
        std::string user_id = "local";
    } storage;

    struct Cache {
        size_t capacity = 32;
        uint32_t ttl_seconds = 3600;
    } cache;

    static Config load(const std::string& path);
    static Config load_default();
};
