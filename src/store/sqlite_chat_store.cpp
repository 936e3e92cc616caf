#include "sqlite_chat_store.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace multichat {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static const char* role_to_column(Role role) {
    return role_to_string(role);
}

static Role role_from_column(const std::string& s) {
    if (s == "assistant") return Role::Assistant;
    if (s == "system") return Role::System;
    return Role::User;
}

// Escape LIKE wildcards so the query is matched literally.
static std::string like_pattern(const std::string& query) {
    std::string out = "%";
    for (char c : query) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    out += '%';
    return out;
}

// Columns: seq, id, session_id, role, content, failed, outdated, created_at
static StoredMessage message_from_stmt(sqlite3_stmt* stmt) {
    StoredMessage msg;
    msg.seq = sqlite3_column_int64(stmt, 0);
    if (auto* v = sqlite3_column_text(stmt, 1)) msg.id         = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(stmt, 2)) msg.session_id = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(stmt, 3)) msg.role       = role_from_column(reinterpret_cast<const char*>(v));
    if (auto* v = sqlite3_column_text(stmt, 4)) msg.content    = reinterpret_cast<const char*>(v);
    msg.failed     = sqlite3_column_int(stmt, 5) != 0;
    msg.outdated   = sqlite3_column_int(stmt, 6) != 0;
    msg.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
    return msg;
}

static constexpr const char* kMessageColumns =
    "seq, id, session_id, role, content, failed, outdated, created_at";

SqliteChatStore::SqliteChatStore(const std::string& path) : path_(path) {
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteChatStore: failed to open database: " + err);
    }

    // Production tasks save from worker threads while the UI reads
    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (const std::runtime_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteChatStore::~SqliteChatStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteChatStore::exec_or_throw(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw std::runtime_error("SqliteChatStore: " + msg);
    }
}

void SqliteChatStore::init_schema() {
    exec_or_throw(
        "CREATE TABLE IF NOT EXISTS sessions ("
        "  id         TEXT PRIMARY KEY,"
        "  title      TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");");

    exec_or_throw(
        "CREATE TABLE IF NOT EXISTS messages ("
        "  seq        INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  id         TEXT UNIQUE NOT NULL,"
        "  session_id TEXT NOT NULL REFERENCES sessions(id) ON DELETE CASCADE,"
        "  role       TEXT NOT NULL,"
        "  content    TEXT NOT NULL,"
        "  failed     INTEGER NOT NULL DEFAULT 0,"
        "  outdated   INTEGER NOT NULL DEFAULT 0,"
        "  created_at INTEGER NOT NULL"
        ");");

    exec_or_throw(
        "CREATE INDEX IF NOT EXISTS messages_session_seq "
        "ON messages(session_id, seq);");
}

bool SqliteChatStore::ensure_session(const std::string& session_id, const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "INSERT OR IGNORE INTO sessions (id, title, created_at, updated_at) "
        "VALUES (?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    auto now = static_cast<int64_t>(epoch_millis());
    sqlite3_bind_text(g.stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, title.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 3, now);
    sqlite3_bind_int64(g.stmt, 4, now);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

bool SqliteChatStore::session_exists(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "SELECT 1 FROM sessions WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(g.stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    return sqlite3_step(g.stmt) == SQLITE_ROW;
}

StoredMessage SqliteChatStore::insert_message(const std::string& session_id, Role role,
                                              const std::string& content, bool failed) {
    // Must be called with mutex_ already held.
    StoredMessage msg;
    msg.id = generate_id();
    msg.session_id = session_id;
    msg.role = role;
    msg.content = content;
    msg.failed = failed;
    msg.created_at = epoch_millis();

    {
        StmtGuard g;
        const char* sql =
            "INSERT INTO messages (id, session_id, role, content, failed, outdated, created_at) "
            "VALUES (?, ?, ?, ?, ?, 0, ?);";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
        }
        sqlite3_bind_text(g.stmt, 1, msg.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 3, role_to_column(role), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 4, content.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(g.stmt, 5, failed ? 1 : 0);
        sqlite3_bind_int64(g.stmt, 6, static_cast<int64_t>(msg.created_at));
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            throw std::runtime_error("SqliteChatStore: cannot save message for session " +
                                     session_id + ": " + sqlite3_errmsg(db_));
        }
    }
    msg.seq = sqlite3_last_insert_rowid(db_);

    StmtGuard g;
    const char* touch = "UPDATE sessions SET updated_at = ? WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, touch, -1, &g.stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int64(g.stmt, 1, static_cast<int64_t>(msg.created_at));
        sqlite3_bind_text(g.stmt, 2, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_step(g.stmt);
    }
    return msg;
}

StoredMessage SqliteChatStore::record_user_message(const std::string& session_id,
                                                   const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_message(session_id, Role::User, content, false);
}

StoredMessage SqliteChatStore::save_assistant_response(const std::string& session_id,
                                                       const std::string& content,
                                                       bool failed) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_message(session_id, Role::Assistant, content, failed);
}

MessagePage SqliteChatStore::query_page(const std::string& session_id, int64_t before_seq,
                                        uint32_t limit) {
    // Must be called with mutex_ already held.
    MessagePage page;
    if (limit == 0) return page;

    std::string sql = std::string("SELECT ") + kMessageColumns +
        " FROM messages WHERE session_id = ? AND seq < ?"
        " ORDER BY seq DESC LIMIT ?;";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 2, before_seq);
    // One extra row tells us whether anything older remains
    sqlite3_bind_int64(g.stmt, 3, static_cast<int64_t>(limit) + 1);

    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        page.messages.push_back(message_from_stmt(g.stmt));
    }

    if (page.messages.size() > limit) {
        page.messages.pop_back();
        page.has_more = true;
    }
    std::reverse(page.messages.begin(), page.messages.end());
    return page;
}

MessagePage SqliteChatStore::recent_messages(const std::string& session_id, uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_page(session_id, std::numeric_limits<int64_t>::max(), limit);
}

MessagePage SqliteChatStore::messages_before(const std::string& session_id,
                                             int64_t before_seq,
                                             uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_page(session_id, before_seq, limit);
}

std::vector<StoredMessage> SqliteChatStore::search_messages(const std::string& session_id,
                                                            const std::string& query,
                                                            uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<StoredMessage> results;
    if (query.empty() || limit == 0) return results;

    std::string sql = std::string("SELECT ") + kMessageColumns +
        " FROM messages WHERE session_id = ? AND content LIKE ? ESCAPE '\\'"
        " ORDER BY seq DESC LIMIT ?;";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    std::string pattern = like_pattern(query);
    sqlite3_bind_text(g.stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, pattern.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 3, static_cast<int64_t>(limit));

    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        results.push_back(message_from_stmt(g.stmt));
    }
    return results;
}

std::vector<SessionInfo> SqliteChatStore::list_sessions(uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SessionInfo> sessions;
    const char* sql =
        "SELECT s.id, s.title, s.updated_at,"
        "       (SELECT COUNT(*) FROM messages m WHERE m.session_id = s.id)"
        " FROM sessions s ORDER BY s.updated_at DESC, s.rowid DESC LIMIT ?;";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(g.stmt, 1, static_cast<int64_t>(limit));

    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        SessionInfo info;
        if (auto* v = sqlite3_column_text(g.stmt, 0)) info.id    = reinterpret_cast<const char*>(v);
        if (auto* v = sqlite3_column_text(g.stmt, 1)) info.title = reinterpret_cast<const char*>(v);
        info.updated_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 2));
        info.message_count = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 3));
        sessions.push_back(std::move(info));
    }
    return sessions;
}

bool SqliteChatStore::delete_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "DELETE FROM sessions WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteChatStore: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

} // namespace multichat
