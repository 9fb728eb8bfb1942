#include <engram/memory/context.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <sstream>

namespace engram {

MemoryResult<MemoryContext> build_memory_context(MemoryManager& manager,
                                                 const std::string& agent_handle,
                                                 const std::string& path_scope,
                                                 const std::string& query,
                                                 const ContextConfig& cfg) {
    MemoryContext ctx;
    if (!manager.searcher().available() || trim(query).empty()) {
        return MemoryResult<MemoryContext>::ok(ctx);
    }

    SearchOptions opts;
    opts.agent_handle = cfg.scope == ContextScope::AGENT ? agent_handle : std::string();
    opts.path_scope = path_scope;
    opts.threshold = cfg.threshold > 0 ? cfg.threshold : 0.5;
    opts.limit = cfg.max_memories > 0 ? cfg.max_memories : 10;

    SearchOutcome found = manager.search(query, opts);
    if (!found.success) {
        return MemoryResult<MemoryContext>::fail_from(found);
    }

    ctx.memories = found.value;
    ctx.section = format_memory_section(ctx.memories, agent_handle);
    LOG_DEBUG("Memory context: %zu memories for agent '%s'", ctx.memories.size(), agent_handle.c_str());
    return MemoryResult<MemoryContext>::ok(ctx);
}

std::string format_memory_section(const std::vector<SearchResult>& results,
                                  const std::string& agent_handle) {
    if (results.empty()) return "";

    std::ostringstream ss;
    ss << "<user_context>\n";
    ss << "The following memories were retrieved from previous interactions with this user.\n";
    ss << "Use this context to provide more personalized and contextual responses.\n\n";

    for (size_t i = 0; i < results.size(); ++i) {
        const Memory& m = results[i].memory;
        ss << (i + 1) << ". [" << memory_category_to_string(m.category) << "] " << m.content << "\n";

        std::vector<std::string> meta;
        if (!m.agent_handle.empty() && m.agent_handle != agent_handle) {
            meta.push_back("from: " + m.agent_handle);
        }
        if (!m.path_scope.empty()) {
            meta.push_back("path: " + m.path_scope);
        }
        if (!meta.empty()) {
            ss << "   (" << join(meta, ", ") << ")\n";
        }
    }

    ss << "</user_context>\n";
    return ss.str();
}

std::string inject_memory_context(const std::string& system_prompt, const MemoryContext& ctx) {
    if (ctx.section.empty()) {
        return system_prompt;
    }
    return system_prompt + "\n\n" + ctx.section;
}

} // namespace engram
