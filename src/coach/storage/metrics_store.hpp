#pragma once

#include "../metrics_aggregator.hpp"
#include "../speech_types.hpp"

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct SessionRecord {
    int64_t id = 0;
    std::string session_id;
    std::string user_id;
    std::string timestamp;
    std::string week_id;
    SpeechMetrics metrics;
};

// A user document together with the version it was read at.
struct VersionedUserMetrics {
    UserMetrics metrics;
    int64_t version = 0; // 0 = no document stored yet
};

enum class SaveResult { Saved, Conflict, Failed };

class MetricsStore {
public:
    MetricsStore();
    virtual ~MetricsStore();

    MetricsStore(const MetricsStore&) = delete;
    MetricsStore& operator=(const MetricsStore&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // A session id that is already stored is ignored and still reports success.
    bool insert_session(const std::string& session_id, const std::string& user_id,
                        const std::string& week_id, const SpeechMetrics& metrics);
    std::vector<SessionRecord> recent_sessions(const std::string& user_id, int limit = 10);

    // Missing documents come back as an empty UserMetrics at version 0.
    virtual std::optional<VersionedUserMetrics> load_user(const std::string& user_id);

    // Conditional write: succeeds only if the stored version still equals expected_version.
    SaveResult save_user(const UserMetrics& metrics, int64_t expected_version);

    // Stores the session row and the updated user document in one transaction.
    // Nothing is written unless the user document is still at expected_version.
    SaveResult commit_session(const std::string& session_id, const std::string& week_id,
                              const SpeechMetrics& session, const UserMetrics& user,
                              int64_t expected_version);

private:
    bool create_tables();
    bool exec(const char* sql, const char* what);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_session_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* load_user_stmt_ = nullptr;
    sqlite3_stmt* insert_user_stmt_ = nullptr;
    sqlite3_stmt* update_user_stmt_ = nullptr;
};
