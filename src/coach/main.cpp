#include "coach_core.hpp"
#include "config.hpp"
#include "metrics_json.hpp"
#include "platform/linux/recording_loop.hpp"
#include "platform/platform_paths.hpp"
#include "storage/metrics_store.hpp"
#include "transcription/lan_backend.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int max_session_retries = 2;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  record              Record from the default input and analyse the speech");
    std::println(stderr, "  analyze FILE.wav    Analyse an existing 16-bit PCM WAV recording");
    std::println(stderr, "  progress            Show weekly trends and practice totals");
    std::println(stderr, "  history [N]         Show the last N analysed sessions (default 10)");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -o, --output PATH   Write the processed recording to PATH (record)");
    std::println(stderr, "  --no-transcribe     Record only, skip transcription and analysis");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -h, --help          Show this help");
}

std::string default_db_path() {
    auto dir = platform::data_dir();
    if (dir.empty()) return "/tmp/speak-coach/metrics.db";
    return (fs::path(dir) / "metrics.db").string();
}

bool write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

std::optional<std::vector<uint8_t>> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

json report_json(const SessionReport& report) {
    json j = {
        {"sessionId", report.session_id},
        {"metrics", report.metrics},
        {"feedback", report.feedback},
        {"newAchievements", report.new_achievements},
        {"fromCache", report.from_cache},
        {"persisted", report.persisted},
    };
    if (report.comparison) {
        auto trend = [](const Trend& t) {
            return json{{"current", t.current}, {"previous", t.previous}, {"trend", t.change_percent}};
        };
        j["comparison"] = {
            {"wordsPerMinute", trend(report.comparison->words_per_minute)},
            {"fillerWordPercentage", trend(report.comparison->filler_word_percentage)},
            {"clarityScore", trend(report.comparison->clarity_score)},
            {"improvement", report.comparison->improvement},
        };
    }
    return j;
}

int fail(const CoachError& err) {
    std::println(stderr, "Error ({}): {}", to_string(err.code), err.message);
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool transcribe = true;
    std::string config_path;
    std::string output_path;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--output" || arg == "-o") {
            if (i + 1 < argc) output_path = argv[++i];
        } else if (arg == "--no-transcribe") {
            transcribe = false;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            positional.push_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        usage(argv[0]);
        return 1;
    }
    const std::string command = positional.front();

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (config.backend.type == "none") transcribe = false;

    if (command != "record" && command != "analyze" && command != "progress" && command != "history") {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Capture first so a recording is never lost to a storage or backend problem.
    std::optional<EncodedAudio> audio;
    double recording_seconds = 0.0;

    if (command == "record") {
        RecordingLoop loop(config, verbose);
        if (!loop.init()) {
            std::println(stderr, "Failed to initialize recording loop");
            return 1;
        }
        auto recorded = loop.run();
        if (!recorded) return fail(recorded.error());
        recording_seconds = loop.elapsed_seconds();
        audio = std::move(*recorded);

        std::println(stderr, "Recorded {:.1f}s ({} bytes, {} Hz)", recording_seconds,
                     audio->bytes.size(), audio->sample_rate);

        if (!output_path.empty()) {
            if (!write_file(output_path, audio->bytes)) {
                std::println(stderr, "Failed to write {}", output_path);
                return 1;
            }
            std::println(stderr, "Saved recording to {}", output_path);
        }
        if (!transcribe) return 0;
    } else if (command == "analyze") {
        if (positional.size() < 2) {
            std::println(stderr, "analyze needs a WAV file");
            return 1;
        }
        if (!transcribe) {
            std::println(stderr, "analyze requires transcription");
            return 1;
        }
        auto bytes = read_file(positional[1]);
        if (!bytes) {
            std::println(stderr, "Failed to read {}", positional[1]);
            return 1;
        }

        auto raw = AudioPostProcessor::decode(EncodedAudio{.bytes = std::move(*bytes)});
        if (!raw) return fail(raw.error());
        recording_seconds = raw->duration_seconds();

        auto processed = AudioPostProcessor(config.audio.post_process()).process(*raw);
        if (!processed) return fail(processed.error());
        audio = std::move(*processed);
    }

    if (config.backend.type != "lan" && audio) {
        std::println(stderr, "Unknown backend type: {}", config.backend.type);
        return 1;
    }

    auto db_path = config.storage.db_path.empty() ? default_db_path() : config.storage.db_path;
    MetricsStore store;
    if (!store.open(db_path)) {
        std::println(stderr, "Warning: metrics DB failed to open, sessions will not be recorded");
        if (!audio) return 1;
    }

    LanBackend backend(config.backend.url, config.backend.api_format, config.backend.api_key);
    CoachCore core(config, verbose, backend, store);

    if (audio) {
        // Repeating with the same session id cannot count the recording twice.
        auto session_id = CoachCore::new_session_id();
        auto report = core.process_recording(session_id, *audio, recording_seconds);
        for (int retry = 1; !report && report.error().code == ErrorCode::AggregationConflict &&
                            retry <= max_session_retries; ++retry) {
            std::println(stderr, "Metrics were updated elsewhere, retrying ({}/{})", retry, max_session_retries);
            report = core.process_recording(session_id, *audio, recording_seconds);
        }
        if (!report) return fail(report.error());
        std::println("{}", report_json(*report).dump(2));
        return 0;
    }

    if (command == "progress") {
        auto summary = core.progress();
        if (!summary) return fail(summary.error());
        std::println("{}", json(*summary).dump(2));
        return 0;
    }

    int limit = positional.size() > 1 ? std::atoi(positional[1].c_str()) : 10;
    if (limit <= 0) limit = 10;

    json entries = json::array();
    for (const auto& rec : core.history(limit)) {
        entries.push_back({
            {"id", rec.id},
            {"sessionId", rec.session_id},
            {"timestamp", rec.timestamp},
            {"week", rec.week_id},
            {"metrics", rec.metrics},
        });
    }
    std::println("{}", entries.dump(2));
    return 0;
}
