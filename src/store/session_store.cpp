/*
 * convoflow C++ - Session Store Implementation
 */
#include <convoflow/store/session_store.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/utils.hpp>

namespace convoflow {

static std::string column_string(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

SessionStore::SessionStore() : db_(nullptr) {}

SessionStore::~SessionStore() {
    close();
}

bool SessionStore::open(const std::string& db_path) {
    if (db_) {
        close();
    }

    if (!create_parent_directory(db_path)) {
        set_error("failed to create parent directory for '" + db_path + "'");
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        return false;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error(std::string("failed to open database '") + db_path + "': " +
                  (db_ ? sqlite3_errmsg(db_) : "out of memory"));
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    exec_sql("PRAGMA journal_mode=WAL");
    exec_sql("PRAGMA synchronous=NORMAL");
    exec_sql("PRAGMA busy_timeout=5000");

    if (!init_tables()) {
        LOG_ERROR("[SessionStore] Failed to initialize tables");
        close();
        return false;
    }

    LOG_INFO("[SessionStore] Database opened: %s", db_path.c_str());
    return true;
}

void SessionStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SessionStore::set_error(const std::string& error) {
    last_error_ = error;
}

void SessionStore::set_error_from_db(const char* what) {
    last_error_ = std::string(what) + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open");
}

bool SessionStore::exec_sql(const std::string& sql) {
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        set_error(err_msg ? err_msg : "unknown SQL error");
        LOG_ERROR("[SessionStore] SQL error: %s\n  Query: %s", last_error_.c_str(), sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool SessionStore::init_tables() {
    bool ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS sessions ("
        "  id TEXT PRIMARY KEY,"
        "  backend TEXT DEFAULT '',"
        "  transcript TEXT NOT NULL,"
        "  message_count INTEGER DEFAULT 0,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;

    exec_sql("CREATE INDEX IF NOT EXISTS idx_sessions_updated ON sessions(updated_at)");
    LOG_DEBUG("[SessionStore] Tables initialized");
    return true;
}

bool SessionStore::save(const std::string& id, const std::string& backend, const Json& envelopes) {
    if (!db_) {
        set_error("database not open");
        return false;
    }
    if (id.empty()) {
        set_error("session id must not be empty");
        return false;
    }
    if (!envelopes.is_array()) {
        set_error("transcript must be an array of envelopes");
        return false;
    }

    int64_t now = current_timestamp_ms();
    std::string transcript = envelopes.dump();

    // Keep created_at of an existing row
    const char* sql =
        "INSERT INTO sessions (id, backend, transcript, message_count, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET "
        "  backend = excluded.backend,"
        "  transcript = excluded.transcript,"
        "  message_count = excluded.message_count,"
        "  updated_at = excluded.updated_at";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("save prepare failed");
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        return false;
    }

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, backend.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, transcript.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, static_cast<int>(envelopes.size()));
    sqlite3_bind_int64(stmt, 5, now);
    sqlite3_bind_int64(stmt, 6, now);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db("save step failed");
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        return false;
    }

    LOG_DEBUG("[SessionStore] Saved session id=%s messages=%zu", id.c_str(), envelopes.size());
    return true;
}

bool SessionStore::load(const std::string& id, SavedSession& out) {
    if (!db_) {
        set_error("database not open");
        return false;
    }

    const char* sql =
        "SELECT id, backend, transcript, message_count, created_at, updated_at "
        "FROM sessions WHERE id = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("load prepare failed");
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc == SQLITE_DONE) {
            set_error("no saved session named '" + id + "'");
        } else {
            set_error_from_db("load step failed");
        }
        return false;
    }

    SavedSession session;
    session.id = column_string(stmt, 0);
    session.backend = column_string(stmt, 1);
    std::string transcript = column_string(stmt, 2);
    session.message_count = sqlite3_column_int(stmt, 3);
    session.created_at = sqlite3_column_int64(stmt, 4);
    session.updated_at = sqlite3_column_int64(stmt, 5);
    sqlite3_finalize(stmt);

    Json parsed = Json::parse(transcript, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        set_error("stored transcript for '" + id + "' is not a JSON array");
        LOG_WARN("[SessionStore] %s", last_error_.c_str());
        return false;
    }
    session.envelopes = parsed;

    out = session;
    return true;
}

std::vector<SessionSummary> SessionStore::list() {
    std::vector<SessionSummary> results;
    if (!db_) return results;

    const char* sql =
        "SELECT id, backend, message_count, updated_at "
        "FROM sessions ORDER BY updated_at DESC, id ASC";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("list prepare failed");
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        return results;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SessionSummary summary;
        summary.id = column_string(stmt, 0);
        summary.backend = column_string(stmt, 1);
        summary.message_count = sqlite3_column_int(stmt, 2);
        summary.updated_at = sqlite3_column_int64(stmt, 3);
        results.push_back(summary);
    }
    sqlite3_finalize(stmt);
    return results;
}

bool SessionStore::remove(const std::string& id) {
    if (!db_) {
        set_error("database not open");
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM sessions WHERE id = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("remove prepare failed");
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db("remove step failed");
        LOG_ERROR("[SessionStore] %s", last_error_.c_str());
        return false;
    }

    if (sqlite3_changes(db_) == 0) {
        set_error("no saved session named '" + id + "'");
        return false;
    }
    LOG_DEBUG("[SessionStore] Removed session id=%s", id.c_str());
    return true;
}

} // namespace convoflow
