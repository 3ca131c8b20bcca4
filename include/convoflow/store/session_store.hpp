/*
 * convoflow C++ - Session SQLite Store
 *
 * Keeps saved conversations as transcript envelopes (see core/transcript.hpp)
 * in a single 'sessions' table. One row per session id; saving again
 * replaces the transcript and keeps the original creation time.
 */
#ifndef convoflow_STORE_SESSION_STORE_HPP
#define convoflow_STORE_SESSION_STORE_HPP

#include <convoflow/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <sqlite3.h>

namespace convoflow {

struct SavedSession {
    std::string id;
    std::string backend;        // Backend active when the session was saved
    Json envelopes;             // Array of transcript envelopes
    int message_count;
    int64_t created_at;         // unix ms
    int64_t updated_at;         // unix ms

    SavedSession() : envelopes(Json::array()), message_count(0), created_at(0), updated_at(0) {}
};

// Row of list(): everything but the transcript itself
struct SessionSummary {
    std::string id;
    std::string backend;
    int message_count;
    int64_t updated_at;

    SessionSummary() : message_count(0), updated_at(0) {}
};

class SessionStore {
public:
    SessionStore();
    ~SessionStore();

    bool open(const std::string& db_path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool save(const std::string& id, const std::string& backend, const Json& envelopes);

    // False when the id is unknown or the stored transcript is unreadable
    bool load(const std::string& id, SavedSession& out);

    // Most recently updated first
    std::vector<SessionSummary> list();

    // True if a row was deleted
    bool remove(const std::string& id);

    std::string last_error() const { return last_error_; }

private:
    sqlite3* db_;
    std::string last_error_;

    bool init_tables();
    bool exec_sql(const std::string& sql);
    void set_error(const std::string& error);
    void set_error_from_db(const char* what);

    SessionStore(const SessionStore&);
    SessionStore& operator=(const SessionStore&);
};

} // namespace convoflow

#endif // convoflow_STORE_SESSION_STORE_HPP
