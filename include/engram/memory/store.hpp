/*
 * engram - Memory SQLite Store
 *
 * Row-level persistence for memories. The connection is shared by the
 * caller thread and the formation worker, so every public method takes the
 * store mutex. Multi-row changes run inside BEGIN IMMEDIATE / COMMIT.
 * Errors are kept per calling thread so one thread's failure never
 * replaces the message another thread is about to read.
 */
#ifndef ENGRAM_MEMORY_STORE_HPP
#define ENGRAM_MEMORY_STORE_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <sqlite3.h>

namespace engram {

class MemoryStore {
public:
    MemoryStore();
    ~MemoryStore();

    bool open(const std::string& db_path);
    void close();
    bool is_open() const;

    bool ensure_schema();

    bool insert(const Memory& memory);

    // Returns false only on a database error; found reports whether the row exists
    bool get(const std::string& id, Memory& out, bool& found);

    // All rows whose id starts with prefix, any status
    bool find_by_prefix(const std::string& prefix, std::vector<Memory>& out);

    // Active rows, newest first. Empty agent = every agent. limit <= 0 = no limit.
    bool list_active(const std::string& agent, int limit, int offset, std::vector<Memory>& out);

    bool stats(const std::string& agent, MemoryStats& out);

    // Status change guarded by the expected current status; changed is 0 or 1
    bool transition(const std::string& id, MemoryStatus from, MemoryStatus to,
                    int64_t now, int& changed);

    // Forget every active row of agent (all agents when empty)
    bool forget_active(const std::string& agent, int64_t now, int& changed);

    // Link two existing active rows as old -> new in one transaction
    bool supersede(const std::string& old_id, const std::string& new_id,
                   const std::string& reason, int64_t now);

    // Insert replacement and supersede old_id in one transaction
    bool insert_superseding(const std::string& old_id, const Memory& replacement,
                            const std::string& reason, int64_t now);

    // Active rows with an embedding, scoped "specific or global", newest first
    bool search_candidates(const std::string& agent, const std::string& path,
                           std::vector<Memory>& out);

    bool record_access(const std::vector<std::string>& ids, int64_t now);

    // id followed by the memories it replaced, newest first
    bool history(const std::string& id, std::vector<Memory>& out);

    // Error of the calling thread's most recent failed call
    std::string last_error() const;

private:
    sqlite3* db_;
    std::map<std::thread::id, std::string> errors_;   // requires mutex_
    mutable std::mutex mutex_;

    MemoryStore(const MemoryStore&);
    MemoryStore& operator=(const MemoryStore&);

    bool exec(const std::string& sql);
    void set_error(const std::string& error);
    void set_error_from_db();

    bool begin_immediate();
    bool commit();
    void rollback();

    bool insert_locked(const Memory& memory);
    bool link_locked(const std::string& old_id, const std::string& new_id,
                     const std::string& reason, int64_t now);
    bool select_rows(sqlite3_stmt* stmt, std::vector<Memory>& out);
    static void read_row(sqlite3_stmt* stmt, Memory& out);
};

} // namespace engram

#endif // ENGRAM_MEMORY_STORE_HPP
