/*
 * engram - Memory SQLite Store Implementation
 */
#include <engram/memory/store.hpp>
#include <engram/embedding/vector.hpp>
#include <engram/core/logger.hpp>

namespace engram {

// Every SELECT reads these columns from "memories m" in this order
static const char* MEMORY_COLUMNS =
    "m.id, m.agent_handle, m.path_scope, m.content, m.category, m.embedding, "
    "m.confidence, m.access_count, m.last_accessed_at, m.supersedes_id, "
    "m.superseded_by_id, m.supersession_reason, m.status, m.source_session_id, "
    "m.source_message_id, m.created_at, m.updated_at";

static void bind_text_or_null(sqlite3_stmt* stmt, int idx, const std::string& value) {
    if (value.empty()) {
        sqlite3_bind_null(stmt, idx);
    } else {
        sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
}

static std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

static std::string escape_like(const std::string& s) {
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' || s[i] == '_' || s[i] == '\\') out += '\\';
        out += s[i];
    }
    return out;
}

MemoryStore::MemoryStore() : db_(nullptr) {}

MemoryStore::~MemoryStore() {
    close();
}

bool MemoryStore::open(const std::string& db_path) {
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

    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA foreign_keys=ON");

    LOG_DEBUG("Memory store opened: %s", db_path.c_str());
    return true;
}

void MemoryStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool MemoryStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool MemoryStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    // Session/message ids are provenance owned elsewhere; only the version
    // chain is a real foreign key here.
    if (!exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id TEXT PRIMARY KEY,"
        "  agent_handle TEXT,"
        "  path_scope TEXT,"
        "  content TEXT NOT NULL,"
        "  category TEXT NOT NULL DEFAULT 'fact',"
        "  embedding BLOB,"
        "  source_session_id TEXT,"
        "  source_message_id TEXT,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  confidence REAL DEFAULT 1.0,"
        "  last_accessed_at INTEGER,"
        "  access_count INTEGER DEFAULT 0,"
        "  supersedes_id TEXT REFERENCES memories(id) ON DELETE SET NULL,"
        "  superseded_by_id TEXT REFERENCES memories(id) ON DELETE SET NULL,"
        "  supersession_reason TEXT,"
        "  status TEXT NOT NULL DEFAULT 'active'"
        "    CHECK (status IN ('active','superseded','archived','forgotten'))"
        ")"
    )) return false;

    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_agent ON memories(agent_handle, status)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_path ON memories(path_scope, status)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_status ON memories(status)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_category ON memories(category)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_supersedes ON memories(supersedes_id)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_superseded_by ON memories(superseded_by_id)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_created ON memories(created_at DESC)")) return false;
    if (!exec("CREATE INDEX IF NOT EXISTS idx_memories_accessed ON memories(last_accessed_at DESC)")) return false;

    return true;
}

bool MemoryStore::insert(const Memory& memory) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }
    return insert_locked(memory);
}

bool MemoryStore::insert_locked(const Memory& m) {
    const char* sql =
        "INSERT INTO memories (id, agent_handle, path_scope, content, category, embedding, "
        "  source_session_id, source_message_id, created_at, updated_at, confidence, "
        "  last_accessed_at, access_count, supersedes_id, superseded_by_id, "
        "  supersession_reason, status) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }

    std::string category = memory_category_to_string(m.category);
    std::string status = memory_status_to_string(m.status);

    sqlite3_bind_text(stmt, 1, m.id.c_str(), -1, SQLITE_TRANSIENT);
    bind_text_or_null(stmt, 2, m.agent_handle);
    bind_text_or_null(stmt, 3, m.path_scope);
    sqlite3_bind_text(stmt, 4, m.content.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, category.c_str(), -1, SQLITE_TRANSIENT);
    if (m.has_embedding()) {
        std::string blob = encode_vector(m.embedding);
        sqlite3_bind_blob(stmt, 6, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    bind_text_or_null(stmt, 7, m.source_session_id);
    bind_text_or_null(stmt, 8, m.source_message_id);
    sqlite3_bind_int64(stmt, 9, m.created_at);
    sqlite3_bind_int64(stmt, 10, m.updated_at);
    sqlite3_bind_double(stmt, 11, m.confidence);
    if (m.last_accessed_at > 0) {
        sqlite3_bind_int64(stmt, 12, m.last_accessed_at);
    } else {
        sqlite3_bind_null(stmt, 12);
    }
    sqlite3_bind_int64(stmt, 13, m.access_count);
    bind_text_or_null(stmt, 14, m.supersedes_id);
    bind_text_or_null(stmt, 15, m.superseded_by_id);
    bind_text_or_null(stmt, 16, m.supersession_reason);
    sqlite3_bind_text(stmt, 17, status.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

void MemoryStore::read_row(sqlite3_stmt* stmt, Memory& out) {
    out.id = column_string(stmt, 0);
    out.agent_handle = column_string(stmt, 1);
    out.path_scope = column_string(stmt, 2);
    out.content = column_string(stmt, 3);

    std::string category = column_string(stmt, 4);
    if (!parse_memory_category(category, out.category)) {
        out.category = MemoryCategory::FACT;
    }

    out.embedding.clear();
    if (sqlite3_column_type(stmt, 5) == SQLITE_BLOB) {
        const void* blob = sqlite3_column_blob(stmt, 5);
        int bytes = sqlite3_column_bytes(stmt, 5);
        if (!decode_vector(blob, static_cast<size_t>(bytes), out.embedding)) {
            LOG_WARN("Memory %s has an undecodable embedding (%d bytes)", out.id.c_str(), bytes);
        }
    }

    out.confidence = sqlite3_column_type(stmt, 6) == SQLITE_NULL ? 1.0 : sqlite3_column_double(stmt, 6);
    out.access_count = sqlite3_column_int64(stmt, 7);
    out.last_accessed_at = sqlite3_column_int64(stmt, 8);
    out.supersedes_id = column_string(stmt, 9);
    out.superseded_by_id = column_string(stmt, 10);
    out.supersession_reason = column_string(stmt, 11);

    std::string status = column_string(stmt, 12);
    if (!parse_memory_status(status, out.status)) {
        out.status = MemoryStatus::ACTIVE;
    }

    out.source_session_id = column_string(stmt, 13);
    out.source_message_id = column_string(stmt, 14);
    out.created_at = sqlite3_column_int64(stmt, 15);
    out.updated_at = sqlite3_column_int64(stmt, 16);
}

bool MemoryStore::select_rows(sqlite3_stmt* stmt, std::vector<Memory>& out) {
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Memory m;
        read_row(stmt, m);
        out.push_back(m);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool MemoryStore::get(const std::string& id, Memory& out, bool& found) {
    std::lock_guard<std::mutex> lock(mutex_);
    found = false;
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS + " FROM memories m WHERE m.id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<Memory> rows;
    if (!select_rows(stmt, rows)) return false;
    if (!rows.empty()) {
        out = rows[0];
        found = true;
    }
    return true;
}

bool MemoryStore::find_by_prefix(const std::string& prefix, std::vector<Memory>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS +
        " FROM memories m WHERE m.id LIKE ? ESCAPE '\\' ORDER BY m.created_at DESC";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    std::string pattern = escape_like(prefix) + "%";
    sqlite3_bind_text(stmt, 1, pattern.c_str(), -1, SQLITE_TRANSIENT);

    return select_rows(stmt, out);
}

bool MemoryStore::list_active(const std::string& agent, int limit, int offset,
                              std::vector<Memory>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS +
        " FROM memories m WHERE m.status = 'active'"
        " AND (?1 IS NULL OR m.agent_handle = ?1)"
        " ORDER BY m.created_at DESC, m.rowid DESC LIMIT ?2 OFFSET ?3";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text_or_null(stmt, 1, agent);
    sqlite3_bind_int(stmt, 2, limit > 0 ? limit : -1);
    sqlite3_bind_int(stmt, 3, offset > 0 ? offset : 0);

    return select_rows(stmt, out);
}

bool MemoryStore::stats(const std::string& agent, MemoryStats& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out = MemoryStats();
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    const char* sql =
        "SELECT category, COUNT(*) FROM memories"
        " WHERE status = 'active' AND (?1 IS NULL OR agent_handle = ?1)"
        " GROUP BY category";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text_or_null(stmt, 1, agent);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::string name = column_string(stmt, 0);
        int64_t n = sqlite3_column_int64(stmt, 1);
        out.total += n;

        MemoryCategory category;
        if (!parse_memory_category(name, category)) category = MemoryCategory::FACT;
        switch (category) {
            case MemoryCategory::PREFERENCE: out.preference += n; break;
            case MemoryCategory::FACT: out.fact += n; break;
            case MemoryCategory::CORRECTION: out.correction += n; break;
            case MemoryCategory::PATTERN: out.pattern += n; break;
        }
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    return true;
}

bool MemoryStore::transition(const std::string& id, MemoryStatus from, MemoryStatus to,
                             int64_t now, int& changed) {
    std::lock_guard<std::mutex> lock(mutex_);
    changed = 0;
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    const char* sql = "UPDATE memories SET status = ?1, updated_at = ?2 WHERE id = ?3 AND status = ?4";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }

    std::string to_str = memory_status_to_string(to);
    std::string from_str = memory_status_to_string(from);
    sqlite3_bind_text(stmt, 1, to_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, now);
    sqlite3_bind_text(stmt, 3, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, from_str.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    changed = sqlite3_changes(db_);
    return true;
}

bool MemoryStore::forget_active(const std::string& agent, int64_t now, int& changed) {
    std::lock_guard<std::mutex> lock(mutex_);
    changed = 0;
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    const char* sql =
        "UPDATE memories SET status = 'forgotten', updated_at = ?2"
        " WHERE status = 'active' AND (?1 IS NULL OR agent_handle = ?1)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text_or_null(stmt, 1, agent);
    sqlite3_bind_int64(stmt, 2, now);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    changed = sqlite3_changes(db_);
    return true;
}

// Both updates must hit exactly one active row, otherwise the caller rolls back
bool MemoryStore::link_locked(const std::string& old_id, const std::string& new_id,
                              const std::string& reason, int64_t now) {
    sqlite3_stmt* stmt = nullptr;
    const char* retire_sql =
        "UPDATE memories SET status = 'superseded', superseded_by_id = ?1,"
        " supersession_reason = ?2, updated_at = ?3"
        " WHERE id = ?4 AND status = 'active'";
    if (sqlite3_prepare_v2(db_, retire_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, new_id.c_str(), -1, SQLITE_TRANSIENT);
    bind_text_or_null(stmt, 2, reason);
    sqlite3_bind_int64(stmt, 3, now);
    sqlite3_bind_text(stmt, 4, old_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    if (sqlite3_changes(db_) != 1) {
        set_error("memory " + old_id + " is not active");
        return false;
    }

    const char* link_sql =
        "UPDATE memories SET supersedes_id = ?1, updated_at = ?2"
        " WHERE id = ?3 AND status = 'active'";
    if (sqlite3_prepare_v2(db_, link_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, old_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, now);
    sqlite3_bind_text(stmt, 3, new_id.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        set_error_from_db();
        return false;
    }
    if (sqlite3_changes(db_) != 1) {
        set_error("memory " + new_id + " is not active");
        return false;
    }
    return true;
}

bool MemoryStore::supersede(const std::string& old_id, const std::string& new_id,
                            const std::string& reason, int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    if (!begin_immediate()) return false;
    if (!link_locked(old_id, new_id, reason, now)) {
        rollback();
        return false;
    }
    return commit();
}

bool MemoryStore::insert_superseding(const std::string& old_id, const Memory& replacement,
                                     const std::string& reason, int64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    if (!begin_immediate()) return false;
    if (!insert_locked(replacement) ||
        !link_locked(old_id, replacement.id, reason, now)) {
        rollback();
        return false;
    }
    return commit();
}

bool MemoryStore::search_candidates(const std::string& agent, const std::string& path,
                                    std::vector<Memory>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    std::string sql = std::string("SELECT ") + MEMORY_COLUMNS +
        " FROM memories m WHERE m.status = 'active' AND m.embedding IS NOT NULL"
        " AND (?1 IS NULL OR m.agent_handle = ?1 OR m.agent_handle IS NULL)"
        " AND (?2 IS NULL OR m.path_scope = ?2 OR m.path_scope IS NULL)"
        " ORDER BY m.created_at DESC, m.rowid DESC";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    bind_text_or_null(stmt, 1, agent);
    bind_text_or_null(stmt, 2, path);

    return select_rows(stmt, out);
}

bool MemoryStore::record_access(const std::vector<std::string>& ids, int64_t now) {
    if (ids.empty()) return true;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    if (!begin_immediate()) return false;

    const char* sql =
        "UPDATE memories SET last_accessed_at = ?1, access_count = access_count + 1 WHERE id = ?2";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        rollback();
        return false;
    }

    for (size_t i = 0; i < ids.size(); ++i) {
        sqlite3_reset(stmt);
        sqlite3_bind_int64(stmt, 1, now);
        sqlite3_bind_text(stmt, 2, ids[i].c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            set_error_from_db();
            sqlite3_finalize(stmt);
            rollback();
            return false;
        }
    }
    sqlite3_finalize(stmt);
    return commit();
}

bool MemoryStore::history(const std::string& id, std::vector<Memory>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error("Database not open");
        return false;
    }

    std::string sql = std::string(
        "WITH RECURSIVE chain(id, depth) AS ("
        "  SELECT id, 0 FROM memories WHERE id = ?1"
        "  UNION ALL"
        "  SELECT p.supersedes_id, c.depth + 1 FROM memories p JOIN chain c ON p.id = c.id"
        "  WHERE p.supersedes_id IS NOT NULL AND c.depth < 100"
        ") SELECT ") + MEMORY_COLUMNS +
        " FROM memories m JOIN chain ON m.id = chain.id ORDER BY chain.depth";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        return false;
    }
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    return select_rows(stmt, out);
}

std::string MemoryStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::thread::id, std::string>::const_iterator it =
        errors_.find(std::this_thread::get_id());
    return it != errors_.end() ? it->second : std::string();
}

bool MemoryStore::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        set_error(err ? err : "unknown error");
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

bool MemoryStore::begin_immediate() {
    return exec("BEGIN IMMEDIATE");
}

bool MemoryStore::commit() {
    if (!exec("COMMIT")) {
        std::string err = errors_[std::this_thread::get_id()];
        rollback();
        set_error(err);
        return false;
    }
    return true;
}

void MemoryStore::rollback() {
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
        LOG_ERROR("ROLLBACK failed: %s", err ? err : "unknown error");
    }
    if (err) sqlite3_free(err);
}

void MemoryStore::set_error(const std::string& error) {
    errors_[std::this_thread::get_id()] = error;
}

void MemoryStore::set_error_from_db() {
    set_error(db_ ? sqlite3_errmsg(db_) : "Database not open");
}

} // namespace engram
