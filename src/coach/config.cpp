#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Overwrites target only when the key is present.
template <typename T>
void read(const json& obj, const char* key, T& target) {
    if (obj.contains(key)) target = obj[key].get<T>();
}

} // namespace

CaptureConfig Config::Audio::capture() const {
    return {
        .max_seconds = static_cast<double>(max_seconds),
        .quality_check_hz = quality_check_hz,
        .visualization_hz = visualization_hz,
        .visualize = visualize,
    };
}

PostProcessConfig Config::Audio::post_process() const {
    return {.compress = compress, .target_sample_rate = target_sample_rate};
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    // Parse into a scratch copy so a type error halfway through leaves pure defaults.
    Config parsed;
    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read(b, "type", parsed.backend.type);
            read(b, "url", parsed.backend.url);
            read(b, "api_format", parsed.backend.api_format);
            read(b, "api_key", parsed.backend.api_key);
            read(b, "language", parsed.backend.language);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read(a, "sample_rate", parsed.audio.sample_rate);
            read(a, "channels", parsed.audio.channels);
            read(a, "max_seconds", parsed.audio.max_seconds);
            read(a, "quality_check_hz", parsed.audio.quality_check_hz);
            read(a, "visualization_hz", parsed.audio.visualization_hz);
            read(a, "visualize", parsed.audio.visualize);
            read(a, "compress", parsed.audio.compress);
            read(a, "target_sample_rate", parsed.audio.target_sample_rate);
        }

        if (j.contains("quality")) {
            auto& q = j["quality"];
            read(q, "volume_window", parsed.quality.volume_window);
            read(q, "noise_window", parsed.quality.noise_window);
            read(q, "low_volume", parsed.quality.low_volume);
            read(q, "high_noise", parsed.quality.high_noise);
            read(q, "clipping_level", parsed.quality.clipping_level);
            read(q, "clipping_count", parsed.quality.clipping_count);
            read(q, "silence_level", parsed.quality.silence_level);
            read(q, "silence_seconds", parsed.quality.silence_seconds);
            read(q, "interruption_limit", parsed.quality.interruption_limit);
            read(q, "noise_floor_min", parsed.quality.noise_floor_min);
        }

        if (j.contains("analysis")) {
            auto& an = j["analysis"];
            read(an, "pause_threshold_seconds", parsed.analysis.pause_threshold_seconds);
            read(an, "rapid_wpm_threshold", parsed.analysis.rapid_wpm_threshold);
            read(an, "filler_words", parsed.analysis.filler_lexicon);

            if (an.contains("clarity")) {
                auto& c = an["clarity"];
                auto& p = parsed.analysis.clarity;
                read(c, "confidence_weight", p.confidence_weight);
                read(c, "filler_weight", p.filler_weight);
                read(c, "pace_weight", p.pace_weight);
                read(c, "ideal_wpm_min", p.ideal_wpm_min);
                read(c, "ideal_wpm_max", p.ideal_wpm_max);
                read(c, "pace_tolerance_wpm", p.pace_tolerance_wpm);
                read(c, "filler_ceiling_percent", p.filler_ceiling_percent);
            }

            if (an.contains("feedback")) {
                auto& f = an["feedback"];
                auto& p = parsed.analysis.feedback;
                read(f, "slow_wpm", p.slow_wpm);
                read(f, "fast_wpm", p.fast_wpm);
                read(f, "low_filler_percent", p.low_filler_percent);
                read(f, "moderate_filler_percent", p.moderate_filler_percent);
                read(f, "few_pauses_per_minute", p.few_pauses_per_minute);
                read(f, "many_pauses_per_minute", p.many_pauses_per_minute);
                read(f, "excellent_clarity", p.excellent_clarity);
                read(f, "good_clarity", p.good_clarity);
            }
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            read(s, "db_path", parsed.storage.db_path);
            read(s, "user_id", parsed.storage.user_id);
        }

        if (j.contains("cache")) {
            auto& c = j["cache"];
            read(c, "capacity", parsed.cache.capacity);
            read(c, "ttl_seconds", parsed.cache.ttl_seconds);
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
