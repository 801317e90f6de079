#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "transcription/lan_backend.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

using Catch::Approx;
using json = nlohmann::json;

TEST_CASE("parse_transcription_response", "[transcribe]") {

    SECTION("OpenAiTopLevelWords") {
        auto j = json::parse(R"({
            "text": "  Hello there.  ",
            "language": "english",
            "words": [
                {"word": "there.", "start": 0.6, "end": 1.0},
                {"word": "Hello", "start": 0.0, "end": 0.5}
            ],
            "segments": [
                {"text": "Hello there.", "avg_logprob": -0.1,
                 "words": [{"word": "ignored", "start": 5.0, "end": 6.0}]}
            ]
        })");

        auto r = parse_transcription_response(j);
        REQUIRE(r.has_value());
        REQUIRE(r->transcript == "Hello there.");
        REQUIRE(r->language == "english");
        REQUIRE(r->words.size() == 2);
        REQUIRE(r->words[0].word == "Hello");
        REQUIRE(r->words[1].word == "there.");
        REQUIRE(r->confidence == Approx(std::exp(-0.1)));
    }

    SECTION("WhisperCppSegmentWords") {
        auto j = json::parse(R"({
            "text": "um so",
            "segments": [
                {"words": [{"word": " um", "start": 0.0, "end": 0.3, "probability": 0.6},
                           {"word": " ", "start": 0.3, "end": 0.3, "probability": 0.1}]},
                {"words": [{"word": " so", "start": 0.4, "end": 0.7, "probability": 0.8}]}
            ]
        })");

        auto r = parse_transcription_response(j);
        REQUIRE(r.has_value());
        REQUIRE(r->words.size() == 2);
        REQUIRE(r->words[0].word == "um");
        REQUIRE(r->words[0].confidence.has_value());
        REQUIRE(r->words[1].start_time == 0.4);
        REQUIRE(r->confidence == Approx(0.7));
    }

    SECTION("TextOnly") {
        auto r = parse_transcription_response(json{{"text", "just text"}});
        REQUIRE(r.has_value());
        REQUIRE(r->transcript == "just text");
        REQUIRE(r->words.empty());
        REQUIRE(r->confidence == 0.0);
        REQUIRE(r->alternatives.empty());
    }

    SECTION("Alternatives") {
        auto j = json::parse(R"({
            "text": "recognize speech",
            "alternatives": [
                {"transcript": " wreck a nice beach ", "confidence": 0.3},
                "not an object",
                {"transcript": "recognise speech", "confidence": 1.7}
            ]
        })");

        auto r = parse_transcription_response(j);
        REQUIRE(r.has_value());
        REQUIRE(r->alternatives.size() == 2);
        REQUIRE(r->alternatives[0].transcript == "wreck a nice beach");
        REQUIRE(r->alternatives[0].confidence == Approx(0.3));
        REQUIRE(r->alternatives[1].confidence == 1.0);
    }

    SECTION("StringError") {
        auto r = parse_transcription_response(json{{"error", "model not loaded"}});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::TranscriptionFailed);
        REQUIRE(r.error().message.find("model not loaded") != std::string::npos);
    }

    SECTION("ObjectError") {
        auto r = parse_transcription_response(json::parse(R"({"error": {"message": "bad key", "type": "auth"}})"));
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().message.find("bad key") != std::string::npos);
    }

    SECTION("MissingText") {
        auto r = parse_transcription_response(json{{"segments", json::array()}});
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::TranscriptionFailed);
    }
}

TEST_CASE("LanBackend", "[transcribe]") {
    SECTION("EmptyAudioRejected") {
        LanBackend backend("http://127.0.0.1:9");
        auto r = backend.transcribe({}, "en");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == ErrorCode::TranscriptionFailed);
    }
}
