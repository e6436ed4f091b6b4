/*
 * chatgate - Durable session index implementation
 */
#include <chatgate/session/store.hpp>
#include <chatgate/core/logger.hpp>

namespace chatgate {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// Rolls back unless commit() succeeded
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db), active_(false) {
        active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    ~Transaction() {
        if (active_ && sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            LOG_ERROR("store.rollback.failed error=%s", sqlite3_errmsg(db_));
        }
    }

    bool begun() const { return active_; }

    bool commit() {
        if (!active_) return false;
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) return false;
        active_ = false;
        return true;
    }

private:
    sqlite3* db_;
    bool active_;
};

} // namespace

SessionStore::SessionStore() : db_(nullptr) {}

SessionStore::~SessionStore() {
    close();
}

bool SessionStore::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA foreign_keys=ON");
    sqlite3_busy_timeout(db_, 5000);

    LOG_INFO("store.open path=%s", db_path.c_str());
    return true;
}

void SessionStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SessionStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool SessionStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    if (!exec(
        "CREATE TABLE IF NOT EXISTS sessions ("
        "  id TEXT PRIMARY KEY,"
        "  name TEXT NOT NULL,"
        "  note TEXT NOT NULL DEFAULT '',"
        "  phone_number TEXT,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ")"
    )) return false;

    if (!exec(
        "CREATE TABLE IF NOT EXISTS note_revisions ("
        "  session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,"
        "  seq INTEGER NOT NULL,"
        "  timestamp INTEGER NOT NULL,"
        "  author TEXT,"
        "  before_text TEXT NOT NULL,"
        "  after_text TEXT NOT NULL,"
        "  PRIMARY KEY (session_id, seq)"
        ")"
    )) return false;

    return true;
}

bool SessionStore::save(const SessionMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    Transaction tx(db_);
    if (!tx.begun()) {
        set_error_from_db();
        return false;
    }

    const char* upsert =
        "INSERT OR REPLACE INTO sessions (id, name, note, phone_number, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, upsert, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, metadata.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, metadata.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, metadata.note.c_str(), -1, SQLITE_TRANSIENT);
    if (metadata.phone_number.empty()) {
        sqlite3_bind_null(stmt, 4);
    } else {
        sqlite3_bind_text(stmt, 4, metadata.phone_number.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt, 5, metadata.created_at);
    sqlite3_bind_int64(stmt, 6, metadata.updated_at);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }

    stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM note_revisions WHERE session_id = ?",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, metadata.id.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }

    const char* insert_rev =
        "INSERT INTO note_revisions (session_id, seq, timestamp, author, before_text, after_text) "
        "VALUES (?, ?, ?, ?, ?, ?)";
    for (size_t i = 0; i < metadata.revisions.size(); ++i) {
        const NoteRevision& rev = metadata.revisions[i];
        stmt = nullptr;
        if (sqlite3_prepare_v2(db_, insert_rev, -1, &stmt, nullptr) != SQLITE_OK) {
            set_error_from_db();
            return false;
        }
        sqlite3_bind_text(stmt, 1, metadata.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(i));
        sqlite3_bind_int64(stmt, 3, rev.timestamp);
        sqlite3_bind_text(stmt, 4, rev.author.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, rev.before.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, rev.after.c_str(), -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            set_error_from_db();
            return false;
        }
    }

    if (!tx.commit()) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool SessionStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    Transaction tx(db_);
    if (!tx.begun()) {
        set_error_from_db();
        return false;
    }

    const char* statements[] = {
        "DELETE FROM note_revisions WHERE session_id = ?",
        "DELETE FROM sessions WHERE id = ?"
    };
    for (size_t i = 0; i < 2; ++i) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, statements[i], -1, &stmt, nullptr) != SQLITE_OK) {
            set_error_from_db();
            return false;
        }
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            set_error_from_db();
            return false;
        }
    }

    if (!tx.commit()) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool SessionStore::load_revisions(const std::string& id, std::vector<NoteRevision>& out) {
    const char* sql =
        "SELECT timestamp, author, before_text, after_text FROM note_revisions "
        "WHERE session_id = ? ORDER BY seq";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        NoteRevision rev;
        rev.timestamp = sqlite3_column_int64(stmt, 0);
        rev.author = column_text(stmt, 1);
        rev.before = column_text(stmt, 2);
        rev.after = column_text(stmt, 3);
        out.push_back(rev);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool SessionStore::load(const std::string& id, SessionMetadata& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    const char* sql =
        "SELECT id, name, note, phone_number, created_at, updated_at FROM sessions WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        out = SessionMetadata();
        out.id = column_text(stmt, 0);
        out.name = column_text(stmt, 1);
        out.note = column_text(stmt, 2);
        out.phone_number = column_text(stmt, 3);
        out.created_at = sqlite3_column_int64(stmt, 4);
        out.updated_at = sqlite3_column_int64(stmt, 5);
        found = true;
    }
    sqlite3_finalize(stmt);

    if (!found) {
        set_error("Session not found: " + id);
        return false;
    }
    return load_revisions(id, out.revisions);
}

std::vector<SessionMetadata> SessionStore::load_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionMetadata> result;
    if (!db_) {
        set_error("Database not open");
        return result;
    }

    const char* sql =
        "SELECT id, name, note, phone_number, created_at, updated_at FROM sessions "
        "ORDER BY created_at, id";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return result;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        SessionMetadata m;
        m.id = column_text(stmt, 0);
        m.name = column_text(stmt, 1);
        m.note = column_text(stmt, 2);
        m.phone_number = column_text(stmt, 3);
        m.created_at = sqlite3_column_int64(stmt, 4);
        m.updated_at = sqlite3_column_int64(stmt, 5);
        result.push_back(m);
    }
    sqlite3_finalize(stmt);

    for (size_t i = 0; i < result.size(); ++i) {
        if (!load_revisions(result[i].id, result[i].revisions)) {
            LOG_WARN("store.revisions.load_failed id=%s error=%s",
                     result[i].id.c_str(), last_error_.c_str());
        }
    }
    return result;
}

std::string SessionStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool SessionStore::exec(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        set_error(errmsg ? errmsg : "Unknown error");
        if (errmsg) sqlite3_free(errmsg);
        LOG_WARN("store.exec.failed error=%s", last_error_.c_str());
        return false;
    }
    return true;
}

void SessionStore::set_error(const std::string& error) {
    last_error_ = error;
}

void SessionStore::set_error_from_db() {
    if (db_) {
        last_error_ = sqlite3_errmsg(db_);
    } else {
        last_error_ = "Database not open";
    }
}

} // namespace chatgate
