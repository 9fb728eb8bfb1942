/*
 * engram - Prompt memory context
 *
 * Retrieves memories relevant to a query and renders them as a section
 * for a system prompt.
 */
#ifndef ENGRAM_MEMORY_CONTEXT_HPP
#define ENGRAM_MEMORY_CONTEXT_HPP

#include "types.hpp"
#include "errors.hpp"
#include "manager.hpp"
#include <string>
#include <vector>

namespace engram {

struct MemoryContext {
    std::vector<SearchResult> memories;
    std::string section;        // empty when nothing was retrieved

    bool empty() const { return section.empty(); }
};

// Without an embedding provider the context is empty, not an error
MemoryResult<MemoryContext> build_memory_context(MemoryManager& manager,
                                                 const std::string& agent_handle,
                                                 const std::string& path_scope,
                                                 const std::string& query,
                                                 const ContextConfig& cfg);

std::string format_memory_section(const std::vector<SearchResult>& results,
                                  const std::string& agent_handle);

std::string inject_memory_context(const std::string& system_prompt, const MemoryContext& ctx);

} // namespace engram

#endif // ENGRAM_MEMORY_CONTEXT_HPP
