#include "metrics_store.hpp"

#include "../metrics_json.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

MetricsStore::MetricsStore() = default;

MetricsStore::~MetricsStore() {
    close();
}

bool MetricsStore::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    if (!create_tables()) {
        close();
        return false;
    }

    struct Prepared {
        const char* sql;
        sqlite3_stmt** stmt;
        const char* name;
    };
    const Prepared statements[] = {
        {"INSERT OR IGNORE INTO sessions (session_id, user_id, week_id, metrics) VALUES (?, ?, ?, ?)",
         &insert_session_stmt_, "insert session"},
        {"SELECT id, session_id, user_id, timestamp, week_id, metrics FROM sessions "
         "WHERE user_id = ? ORDER BY id DESC LIMIT ?",
         &recent_stmt_, "recent"},
        {"SELECT document, version FROM user_metrics WHERE user_id = ?",
         &load_user_stmt_, "load user"},
        {"INSERT OR IGNORE INTO user_metrics (user_id, document, version) VALUES (?, ?, 1)",
         &insert_user_stmt_, "insert user"},
        {"UPDATE user_metrics SET document = ?, version = version + 1, "
         "updated_at = strftime('%Y-%m-%dT%H:%M:%f','now') WHERE user_id = ? AND version = ?",
         &update_user_stmt_, "update user"},
    };

    for (const auto& s : statements) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare {} failed: {}", s.name, sqlite3_errmsg(db_));
            close();
            return false;
        }
    }

    return true;
}

void MetricsStore::close() {
    for (auto* stmt : {&insert_session_stmt_, &recent_stmt_, &load_user_stmt_,
                       &insert_user_stmt_, &update_user_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool MetricsStore::insert_session(const std::string& session_id, const std::string& user_id,
                                  const std::string& week_id, const SpeechMetrics& metrics) {
    if (!insert_session_stmt_) return false;

    auto doc = json(metrics).dump();

    sqlite3_reset(insert_session_stmt_);
    sqlite3_bind_text(insert_session_stmt_, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_session_stmt_, 2, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_session_stmt_, 3, week_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_session_stmt_, 4, doc.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_session_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert session failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<SessionRecord> MetricsStore::recent_sessions(const std::string& user_id, int limit) {
    std::vector<SessionRecord> records;
    if (!recent_stmt_) return records;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_text(recent_stmt_, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(recent_stmt_, 2, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        SessionRecord r;
        r.id = sqlite3_column_int64(recent_stmt_, 0);
        r.session_id = get_text(recent_stmt_, 1);
        r.user_id = get_text(recent_stmt_, 2);
        r.timestamp = get_text(recent_stmt_, 3);
        r.week_id = get_text(recent_stmt_, 4);
        try {
            r.metrics = json::parse(get_text(recent_stmt_, 5)).get<SpeechMetrics>();
        } catch (const json::exception& e) {
            std::println(stderr, "db: session {} has unreadable metrics: {}", r.id, e.what());
            continue;
        }
        records.push_back(std::move(r));
    }

    return records;
}

std::optional<VersionedUserMetrics> MetricsStore::load_user(const std::string& user_id) {
    if (!load_user_stmt_) return std::nullopt;

    sqlite3_reset(load_user_stmt_);
    sqlite3_bind_text(load_user_stmt_, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);

    VersionedUserMetrics out;
    out.metrics.user_id = user_id;

    int rc = sqlite3_step(load_user_stmt_);
    if (rc == SQLITE_DONE) return out;
    if (rc != SQLITE_ROW) {
        std::println(stderr, "db: load user failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }

    auto* text = sqlite3_column_text(load_user_stmt_, 0);
    std::string doc = text ? reinterpret_cast<const char*>(text) : "{}";
    out.version = sqlite3_column_int64(load_user_stmt_, 1);
    // End the read transaction so a later write does not start from a stale snapshot.
    sqlite3_reset(load_user_stmt_);

    try {
        out.metrics = json::parse(doc).get<UserMetrics>();
    } catch (const json::exception& e) {
        std::println(stderr, "db: user document for {} is unreadable: {}", user_id, e.what());
        return std::nullopt;
    }
    out.metrics.user_id = user_id;
    return out;
}

SaveResult MetricsStore::save_user(const UserMetrics& metrics, int64_t expected_version) {
    if (!insert_user_stmt_ || !update_user_stmt_) return SaveResult::Failed;

    auto doc = json(metrics).dump();

    if (expected_version == 0) {
        sqlite3_reset(insert_user_stmt_);
        sqlite3_bind_text(insert_user_stmt_, 1, metrics.user_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_user_stmt_, 2, doc.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(insert_user_stmt_) != SQLITE_DONE) {
            std::println(stderr, "db: insert user failed: {}", sqlite3_errmsg(db_));
            return SaveResult::Failed;
        }
        // INSERT OR IGNORE: a concurrent writer created the document first.
        return sqlite3_changes(db_) == 1 ? SaveResult::Saved : SaveResult::Conflict;
    }

    sqlite3_reset(update_user_stmt_);
    sqlite3_bind_text(update_user_stmt_, 1, doc.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(update_user_stmt_, 2, metrics.user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(update_user_stmt_, 3, expected_version);
    if (sqlite3_step(update_user_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: update user failed: {}", sqlite3_errmsg(db_));
        return SaveResult::Failed;
    }
    return sqlite3_changes(db_) == 1 ? SaveResult::Saved : SaveResult::Conflict;
}

SaveResult MetricsStore::commit_session(const std::string& session_id, const std::string& week_id,
                                        const SpeechMetrics& session, const UserMetrics& user,
                                        int64_t expected_version) {
    if (!db_) return SaveResult::Failed;
    if (!exec("BEGIN IMMEDIATE;", "begin")) return SaveResult::Failed;

    if (!insert_session(session_id, user.user_id, week_id, session)) {
        exec("ROLLBACK;", "rollback");
        return SaveResult::Failed;
    }

    auto result = save_user(user, expected_version);
    if (result != SaveResult::Saved) {
        exec("ROLLBACK;", "rollback");
        return result;
    }

    if (!exec("COMMIT;", "commit")) {
        exec("ROLLBACK;", "rollback");
        return SaveResult::Failed;
    }
    return SaveResult::Saved;
}

bool MetricsStore::exec(const char* sql, const char* what) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "db: {} failed: {}", what, err ? err : sqlite3_errmsg(db_));
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool MetricsStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            user_id TEXT NOT NULL,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            week_id TEXT NOT NULL,
            metrics TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS sessions_user ON sessions (user_id, id);
        CREATE UNIQUE INDEX IF NOT EXISTS sessions_session_id ON sessions (session_id);
        CREATE TABLE IF NOT EXISTS user_metrics (
            user_id TEXT PRIMARY KEY,
            document TEXT NOT NULL,
            version INTEGER NOT NULL,
            updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now'))
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create tables failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
