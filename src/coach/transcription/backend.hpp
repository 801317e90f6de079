#pragma once

#include "../error.hpp"
#include "../speech_types.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

// External speech-to-text service. Receives a WAV container, returns the
// transcript with word-level timing. An empty transcript is a valid result.
class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;
    virtual std::expected<TranscriptionResult, CoachError>
        transcribe(std::span<const uint8_t> wav, const std::string& language) = 0;
};
