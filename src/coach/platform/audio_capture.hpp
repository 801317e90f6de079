#pragma once

#include <cstdint>

struct CaptureFormat {
    uint32_t sample_rate = 44100;
    uint16_t channels = 1;
};

// Live input device. Implementations push interleaved S16 samples into a RingBuffer
// from their own thread once start() succeeds.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
    virtual CaptureFormat format() const = 0;
};
