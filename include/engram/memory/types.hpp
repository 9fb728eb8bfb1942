/*
 * engram - Memory Types
 *
 * Data structures for the semantic memory store.
 */
#ifndef ENGRAM_MEMORY_TYPES_HPP
#define ENGRAM_MEMORY_TYPES_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace engram {

enum class MemoryCategory {
    PREFERENCE,
    FACT,
    CORRECTION,
    PATTERN
};

inline std::string memory_category_to_string(MemoryCategory c) {
    switch (c) {
        case MemoryCategory::PREFERENCE: return "preference";
        case MemoryCategory::FACT: return "fact";
        case MemoryCategory::CORRECTION: return "correction";
        case MemoryCategory::PATTERN: return "pattern";
    }
    return "fact";
}

// Strict parse; returns false for anything but the four category names
inline bool parse_memory_category(const std::string& s, MemoryCategory& out) {
    if (s == "preference") { out = MemoryCategory::PREFERENCE; return true; }
    if (s == "fact") { out = MemoryCategory::FACT; return true; }
    if (s == "correction") { out = MemoryCategory::CORRECTION; return true; }
    if (s == "pattern") { out = MemoryCategory::PATTERN; return true; }
    return false;
}

enum class MemoryStatus {
    ACTIVE,
    SUPERSEDED,
    ARCHIVED,     // terminal, entered only through MemoryManager::archive
    FORGOTTEN     // terminal soft delete
};

inline std::string memory_status_to_string(MemoryStatus s) {
    switch (s) {
        case MemoryStatus::ACTIVE: return "active";
        case MemoryStatus::SUPERSEDED: return "superseded";
        case MemoryStatus::ARCHIVED: return "archived";
        case MemoryStatus::FORGOTTEN: return "forgotten";
    }
    return "active";
}

inline bool parse_memory_status(const std::string& s, MemoryStatus& out) {
    if (s == "active") { out = MemoryStatus::ACTIVE; return true; }
    if (s == "superseded") { out = MemoryStatus::SUPERSEDED; return true; }
    if (s == "archived") { out = MemoryStatus::ARCHIVED; return true; }
    if (s == "forgotten") { out = MemoryStatus::FORGOTTEN; return true; }
    return false;
}

// A stored memory. Empty agent_handle / path_scope mean global / unscoped.
// Timestamps are unix ms.
struct Memory {
    std::string id;
    std::string agent_handle;
    std::string path_scope;
    std::string content;
    MemoryCategory category;
    std::vector<float> embedding;   // empty = absent
    double confidence;
    int64_t access_count;
    int64_t last_accessed_at;       // 0 = never
    std::string supersedes_id;
    std::string superseded_by_id;
    std::string supersession_reason;
    MemoryStatus status;
    std::string source_session_id;
    std::string source_message_id;
    int64_t created_at;
    int64_t updated_at;

    Memory()
        : category(MemoryCategory::FACT)
        , confidence(1.0)
        , access_count(0)
        , last_accessed_at(0)
        , status(MemoryStatus::ACTIVE)
        , created_at(0)
        , updated_at(0)
    {}

    bool has_embedding() const { return !embedding.empty(); }
};

struct SearchOptions {
    std::string agent_handle;   // matches this agent plus global memories
    std::string path_scope;     // matches this path plus unscoped memories
    double threshold;
    int limit;
    bool record_access;         // bump access_count / last_accessed_at on hits

    SearchOptions()
        : threshold(0.5)
        , limit(10)
        , record_access(true)
    {}
};

struct SearchResult {
    Memory memory;
    double similarity;

    SearchResult() : similarity(0) {}
};

// Active-record counts
struct MemoryStats {
    int64_t total;
    int64_t preference;
    int64_t fact;
    int64_t correction;
    int64_t pattern;

    MemoryStats() : total(0), preference(0), fact(0), correction(0), pattern(0) {}
};

struct FormationConfig {
    double duplicate_threshold;   // candidates below this are new
    double exact_threshold;       // at or above this counts as no material change
    int candidate_limit;

    FormationConfig()
        : duplicate_threshold(0.85)
        , exact_threshold(0.95)
        , candidate_limit(3)
    {}
};

struct QueueSettings {
    int capacity;
    int shutdown_timeout_ms;

    QueueSettings() : capacity(100), shutdown_timeout_ms(5000) {}
};

enum class ContextScope {
    AGENT,    // only the agent's own memories (plus global)
    GLOBAL,
    HYBRID    // search everything, rank by similarity
};

struct ContextConfig {
    ContextScope scope;
    double threshold;
    int max_memories;

    ContextConfig() : scope(ContextScope::HYBRID), threshold(0.5), max_memories(10) {}
};

// Overall memory configuration
struct MemoryConfig {
    std::string db_path;
    SearchOptions search;
    FormationConfig formation;
    QueueSettings queue;
    ContextConfig context;

    MemoryConfig() : db_path("~/.local/share/engram/memory.db") {}
};

} // namespace engram

#endif // ENGRAM_MEMORY_TYPES_HPP
