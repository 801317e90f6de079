#pragma once

#include "backend.hpp"

#include <nlohmann/json.hpp>
#include <string>

class LanBackend : public TranscriptionBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    explicit LanBackend(std::string url, std::string api_format = "whisper.cpp",
                        std::string api_key = {});
    ~LanBackend() override;

    LanBackend(const LanBackend&) = delete;
    LanBackend& operator=(const LanBackend&) = delete;

    std::expected<TranscriptionResult, CoachError>
        transcribe(std::span<const uint8_t> wav, const std::string& language) override;

private:
    std::string url_;
    std::string api_format_;
    std::string api_key_;
};

// Maps a verbose_json response from either server flavour onto TranscriptionResult.
std::expected<TranscriptionResult, CoachError> parse_transcription_response(const nlohmann::json& j);
