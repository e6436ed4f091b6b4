/*
 * chatgate - Durable session index
 *
 * sqlite3 database holding the metadata of every registered session and
 * its recent note revisions. Each mutation runs in its own transaction and
 * is committed before the call returns.
 */
#ifndef CHATGATE_SESSION_STORE_HPP
#define CHATGATE_SESSION_STORE_HPP

#include <chatgate/session/session.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>

namespace chatgate {

class SessionStore {
public:
    SessionStore();
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // ":memory:" is accepted for tests
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;

    bool ensure_schema();

    // Insert or replace, revisions included
    bool save(const SessionMetadata& metadata);
    bool remove(const std::string& id);
    bool load(const std::string& id, SessionMetadata& out);
    std::vector<SessionMetadata> load_all();

    std::string last_error() const;

private:
    bool exec(const std::string& sql);
    bool load_revisions(const std::string& id, std::vector<NoteRevision>& out);
    void set_error(const std::string& error);
    void set_error_from_db();

    sqlite3* db_;
    std::string last_error_;
    mutable std::mutex mutex_;
};

} // namespace chatgate

#endif // CHATGATE_SESSION_STORE_HPP
