#pragma once

#include "speech_types.hpp"

#include <chrono>
#include <cstddef>
#include <list>
#include <map>
#include <optional>
#include <string>
#include <utility>

// Bounded, time-expiring memo of analysis results keyed by recording size and
// content type. Owned by whoever drives the pipeline; there is no global instance.
class AnalysisCache {
public:
    using Clock = std::chrono::steady_clock;
    using Key = std::pair<size_t, std::string>;

    AnalysisCache(size_t capacity, Clock::duration ttl)
        : capacity_(capacity), ttl_(ttl) {}

    std::optional<SpeechMetrics> get(const Key& key, Clock::time_point now = Clock::now()) {
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;

        auto entry = it->second;
        if (now - entry->stored_at > ttl_) {
            lru_.erase(entry);
            index_.erase(it);
            return std::nullopt;
        }

        lru_.splice(lru_.begin(), lru_, entry);
        return entry->metrics;
    }

    void put(const Key& key, SpeechMetrics metrics, Clock::time_point now = Clock::now()) {
        if (capacity_ == 0) return;

        if (auto it = index_.find(key); it != index_.end()) {
            lru_.erase(it->second);
            index_.erase(it);
        }

        lru_.push_front(Entry{key, std::move(metrics), now});
        index_[key] = lru_.begin();

        while (lru_.size() > capacity_) {
            index_.erase(lru_.back().key);
            lru_.pop_back();
        }
    }

    size_t size() const { return lru_.size(); }

    void clear() {
        lru_.clear();
        index_.clear();
    }

private:
    struct Entry {
        Key key;
        SpeechMetrics metrics;
        Clock::time_point stored_at;
    };

    size_t capacity_;
    Clock::duration ttl_;
    std::list<Entry> lru_;
    std::map<Key, std::list<Entry>::iterator> index_;
};
