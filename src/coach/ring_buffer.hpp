#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of PCM samples.
// Producer (device thread) calls write(). Consumer (polling loop) calls read()/drain_all().
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually written. Samples beyond capacity are dropped.
    size_t write(std::span<const int16_t> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t to_write = std::min(samples.size(), capacity_ - (w - r));
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::copy_n(samples.begin(), first, buf_.begin() + offset);
        std::copy_n(samples.begin() + first, to_write - first, buf_.begin());

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Producer: native-endian 16-bit samples from a byte buffer with any alignment.
    // A trailing odd byte is ignored. Returns samples actually written.
    size_t write_bytes(std::span<const uint8_t> bytes) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t to_write = std::min(bytes.size() / sizeof(int16_t), capacity_ - (w - r));
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, bytes.data(), first * sizeof(int16_t));
        std::memcpy(buf_.data(), bytes.data() + first * sizeof(int16_t), (to_write - first) * sizeof(int16_t));

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: returns samples actually read.
    size_t read(std::span<int16_t> dest) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(dest.size(), w - r);
        if (to_read == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::copy_n(buf_.begin() + offset, first, dest.begin());
        std::copy_n(buf_.begin(), to_read - first, dest.begin() + first);

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    std::vector<int16_t> drain_all() {
        std::vector<int16_t> samples(available());
        if (samples.empty()) return samples;
        samples.resize(read(samples));
        return samples;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }

    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
};
