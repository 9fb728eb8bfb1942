/*
 * engram - Memory Manager
 *
 * Caller-facing memory operations: validation, defaults, embedding on
 * create, id prefix resolution, lifecycle transitions and search. Errors are
 * returned as MemoryResult values for the caller to display.
 */
#ifndef ENGRAM_MEMORY_MANAGER_HPP
#define ENGRAM_MEMORY_MANAGER_HPP

#include "types.hpp"
#include "errors.hpp"
#include "store.hpp"
#include "search.hpp"
#include "../core/config.hpp"
#include "../embedding/provider.hpp"
#include <string>
#include <vector>
#include <memory>

namespace engram {

class MemoryManager {
public:
    // embedder is optional and not owned
    MemoryManager(const MemoryConfig& config, EmbeddingProvider* embedder);
    ~MemoryManager();

    bool initialize();
    void shutdown();
    bool is_initialized() const;

    // Validates content, assigns id / timestamps / defaults and embeds when a
    // provider is configured. An embedding failure is logged and leaves the
    // memory without a vector. A pre-filled embedding is kept as is.
    MemoryResult<Memory> create(const Memory& draft);

    // Exact id lookup; records an access
    MemoryResult<Memory> get(const std::string& id);

    // Exact id first, then unique prefix; records an access
    MemoryResult<Memory> get_by_prefix(const std::string& prefix);

    MemoryResult<std::vector<Memory> > list(const std::string& agent, int limit, int offset);
    MemoryResult<int64_t> count(const std::string& agent);
    MemoryResult<MemoryStats> stats(const std::string& agent);

    // Soft delete. Forgetting a forgotten memory succeeds without change.
    MemoryResult<Memory> forget(const std::string& id_or_prefix);

    // Forget every active memory of agent (all when empty); returns the count
    MemoryResult<int> clear(const std::string& agent);

    // Both memories must exist and be active; returns the updated old memory
    MemoryResult<Memory> supersede(const std::string& old_id, const std::string& new_id,
                                   const std::string& reason);

    // Create from draft and supersede old_id in one transaction; returns the new memory
    MemoryResult<Memory> replace(const std::string& old_id, const Memory& draft,
                                 const std::string& reason);

    // Lifecycle hook for the archived status; nothing calls it automatically
    MemoryResult<Memory> archive(const std::string& id_or_prefix);

    // Version chain ending at the memory, newest first
    MemoryResult<std::vector<Memory> > history(const std::string& id_or_prefix);

    SearchOutcome search(const std::string& query, const SearchOptions& opts);

    MemorySearch& searcher() { return search_; }
    EmbeddingProvider* embedder() const { return embedder_; }
    const MemoryConfig& config() const { return config_; }
    std::string last_error() const { return last_error_; }

private:
    MemoryConfig config_;
    EmbeddingProvider* embedder_;
    std::unique_ptr<MemoryStore> store_;
    MemorySearch search_;
    bool initialized_;
    std::string last_error_;

    MemoryResult<Memory> resolve(const std::string& id_or_prefix);
    MemoryResult<Memory> materialize(const Memory& draft);
    MemoryResult<Memory> with_access(const Memory& m);
    MemoryResult<Memory> reload(const std::string& id);
};

// Reads the "memory" section with defaults for missing keys
MemoryConfig load_memory_config(const Config& cfg);

ContextScope parse_context_scope(const std::string& s);

} // namespace engram

#endif // ENGRAM_MEMORY_MANAGER_HPP
