/*
 * engram - Memory Manager Implementation
 */
#include <engram/memory/manager.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

namespace engram {

typedef MemoryResult<Memory> MemoryOutcome;

MemoryManager::MemoryManager(const MemoryConfig& config, EmbeddingProvider* embedder)
    : config_(config)
    , embedder_(embedder)
    , store_(new MemoryStore())
    , search_(*store_, embedder)
    , initialized_(false)
{
}

MemoryManager::~MemoryManager() {
    shutdown();
}

bool MemoryManager::initialize() {
    if (initialized_) return true;

    std::string db_path = resolve_user_path(config_.db_path);
    if (db_path.empty()) {
        last_error_ = "memory database path is empty";
        return false;
    }

    if (db_path != ":memory:") {
        std::string db_dir = dirname(db_path);
        if (!is_directory(db_dir) && !mkdir_p(db_dir)) {
            last_error_ = "cannot create directory " + db_dir;
            return false;
        }
    }

    if (!store_->open(db_path)) {
        last_error_ = "failed to open database: " + store_->last_error();
        return false;
    }

    if (!store_->ensure_schema()) {
        last_error_ = "failed to create schema: " + store_->last_error();
        store_->close();
        return false;
    }

    LOG_DEBUG("Memory manager ready (db=%s, embedder=%s)", db_path.c_str(),
              embedder_ ? embedder_->name().c_str() : "none");
    initialized_ = true;
    return true;
}

void MemoryManager::shutdown() {
    if (store_) {
        store_->close();
    }
    initialized_ = false;
}

bool MemoryManager::is_initialized() const {
    return initialized_;
}

MemoryOutcome MemoryManager::materialize(const Memory& draft) {
    Memory m = draft;
    m.content = trim(draft.content);
    if (m.content.empty()) {
        return MemoryOutcome::fail(MemoryError::VALIDATION, "memory content is empty");
    }
    if (m.confidence < 0.0 || m.confidence > 1.0) {
        return MemoryOutcome::fail(MemoryError::VALIDATION, "confidence must be within [0, 1]");
    }

    int64_t now = current_timestamp_ms();
    if (m.id.empty()) m.id = generate_uuid();
    m.status = MemoryStatus::ACTIVE;
    m.access_count = 0;
    m.last_accessed_at = 0;
    m.superseded_by_id.clear();
    m.supersession_reason.clear();
    m.created_at = now;
    m.updated_at = now;

    if (!m.has_embedding() && embedder_) {
        EmbeddingResult r = embedder_->embed(m.content);
        if (r.success) {
            m.embedding = r.vector;
        } else {
            LOG_WARN("Embedding failed, storing memory without vector: %s", r.error.c_str());
        }
    }
    return MemoryOutcome::ok(m);
}

MemoryOutcome MemoryManager::create(const Memory& draft) {
    MemoryOutcome m = materialize(draft);
    if (!m.success) return m;

    if (!m.value.supersedes_id.empty()) {
        return MemoryOutcome::fail(MemoryError::VALIDATION,
                                   "use replace() to create a superseding memory");
    }

    if (!store_->insert(m.value)) {
        return MemoryOutcome::fail(MemoryError::STORAGE, store_->last_error());
    }

    LOG_DEBUG("Created memory %s [%s]", short_id(m.value.id).c_str(),
              memory_category_to_string(m.value.category).c_str());
    return m;
}

MemoryOutcome MemoryManager::reload(const std::string& id) {
    Memory m;
    bool found = false;
    if (!store_->get(id, m, found)) {
        return MemoryOutcome::fail(MemoryError::STORAGE, store_->last_error());
    }
    if (!found) {
        return MemoryOutcome::fail(MemoryError::NOT_FOUND, "memory not found: " + id);
    }
    return MemoryOutcome::ok(m);
}

MemoryOutcome MemoryManager::resolve(const std::string& id_or_prefix) {
    std::string key = trim(id_or_prefix);
    if (key.empty()) {
        return MemoryOutcome::fail(MemoryError::VALIDATION, "memory id is empty");
    }

    MemoryOutcome exact = reload(key);
    if (exact.success || exact.code != MemoryError::NOT_FOUND) {
        return exact;
    }

    std::vector<Memory> matches;
    if (!store_->find_by_prefix(key, matches)) {
        return MemoryOutcome::fail(MemoryError::STORAGE, store_->last_error());
    }
    if (matches.empty()) {
        return MemoryOutcome::fail(MemoryError::NOT_FOUND, "memory not found: " + key);
    }
    if (matches.size() > 1) {
        return MemoryOutcome::fail(MemoryError::AMBIGUOUS_ID,
                                   "ambiguous prefix: " + std::to_string(matches.size()) +
                                   " memories match");
    }
    return MemoryOutcome::ok(matches[0]);
}

MemoryOutcome MemoryManager::with_access(const Memory& m) {
    Memory out = m;
    int64_t now = current_timestamp_ms();
    std::vector<std::string> ids(1, m.id);
    if (store_->record_access(ids, now)) {
        out.access_count += 1;
        out.last_accessed_at = now;
    } else {
        LOG_WARN("Failed to record access for %s: %s", m.id.c_str(), store_->last_error().c_str());
    }
    return MemoryOutcome::ok(out);
}

MemoryOutcome MemoryManager::get(const std::string& id) {
    MemoryOutcome m = reload(trim(id));
    if (!m.success) return m;
    return with_access(m.value);
}

MemoryOutcome MemoryManager::get_by_prefix(const std::string& prefix) {
    MemoryOutcome m = resolve(prefix);
    if (!m.success) return m;
    return with_access(m.value);
}

MemoryResult<std::vector<Memory> > MemoryManager::list(const std::string& agent, int limit, int offset) {
    std::vector<Memory> out;
    if (!store_->list_active(agent, limit, offset, out)) {
        return MemoryResult<std::vector<Memory> >::fail(MemoryError::STORAGE, store_->last_error());
    }
    return MemoryResult<std::vector<Memory> >::ok(out);
}

MemoryResult<int64_t> MemoryManager::count(const std::string& agent) {
    MemoryResult<MemoryStats> s = stats(agent);
    if (!s.success) return MemoryResult<int64_t>::fail_from(s);
    return MemoryResult<int64_t>::ok(s.value.total);
}

MemoryResult<MemoryStats> MemoryManager::stats(const std::string& agent) {
    MemoryStats s;
    if (!store_->stats(agent, s)) {
        return MemoryResult<MemoryStats>::fail(MemoryError::STORAGE, store_->last_error());
    }
    return MemoryResult<MemoryStats>::ok(s);
}

MemoryOutcome MemoryManager::forget(const std::string& id_or_prefix) {
    MemoryOutcome m = resolve(id_or_prefix);
    if (!m.success) return m;

    switch (m.value.status) {
        case MemoryStatus::FORGOTTEN:
            return m;
        case MemoryStatus::SUPERSEDED:
            // Forgetting would leave superseded_by_id on a non-superseded row
            return MemoryOutcome::fail(MemoryError::VALIDATION,
                                       "memory " + short_id(m.value.id) + " was superseded by " +
                                       short_id(m.value.superseded_by_id) + "; forget that one instead");
        default:
            break;
    }

    int changed = 0;
    if (!store_->transition(m.value.id, m.value.status, MemoryStatus::FORGOTTEN,
                            current_timestamp_ms(), changed)) {
        return MemoryOutcome::fail(MemoryError::STORAGE, store_->last_error());
    }
    if (changed == 0) {
        return MemoryOutcome::fail(MemoryError::STORAGE,
                                   "memory " + short_id(m.value.id) + " changed concurrently");
    }

    LOG_DEBUG("Forgot memory %s", short_id(m.value.id).c_str());
    return reload(m.value.id);
}

MemoryResult<int> MemoryManager::clear(const std::string& agent) {
    int changed = 0;
    if (!store_->forget_active(agent, current_timestamp_ms(), changed)) {
        return MemoryResult<int>::fail(MemoryError::STORAGE, store_->last_error());
    }
    LOG_DEBUG("Cleared %d memories%s%s", changed,
              agent.empty() ? "" : " for ", agent.c_str());
    return MemoryResult<int>::ok(changed);
}

MemoryOutcome MemoryManager::supersede(const std::string& old_id, const std::string& new_id,
                                       const std::string& reason) {
    if (old_id == new_id) {
        return MemoryOutcome::fail(MemoryError::VALIDATION, "a memory cannot supersede itself");
    }

    MemoryOutcome old_mem = reload(old_id);
    if (!old_mem.success) return old_mem;
    MemoryOutcome new_mem = reload(new_id);
    if (!new_mem.success) return new_mem;

    if (old_mem.value.status != MemoryStatus::ACTIVE) {
        return MemoryOutcome::fail(MemoryError::VALIDATION,
                                   "memory " + short_id(old_id) + " is " +
                                   memory_status_to_string(old_mem.value.status));
    }
    if (new_mem.value.status != MemoryStatus::ACTIVE) {
        return MemoryOutcome::fail(MemoryError::VALIDATION,
                                   "memory " + short_id(new_id) + " is " +
                                   memory_status_to_string(new_mem.value.status));
    }

    if (!store_->supersede(old_id, new_id, reason, current_timestamp_ms())) {
        return MemoryOutcome::fail(MemoryError::STORAGE, store_->last_error());
    }

    LOG_DEBUG("Memory %s superseded by %s", short_id(old_id).c_str(), short_id(new_id).c_str());
    return reload(old_id);
}

MemoryOutcome MemoryManager::replace(const std::string& old_id, const Memory& draft,
                                     const std::string& reason) {
    MemoryOutcome old_mem = reload(old_id);
    if (!old_mem.success) return old_mem;
    if (old_mem.value.status != MemoryStatus::ACTIVE) {
        return MemoryOutcome::fail(MemoryError::VALIDATION,
                                   "memory " + short_id(old_id) + " is " +
                                   memory_status_to_string(old_mem.value.status));
    }

    MemoryOutcome m = materialize(draft);
    if (!m.success) return m;
    m.value.supersedes_id = old_id;

    if (!store_->insert_superseding(old_id, m.value, reason, m.value.created_at)) {
        return MemoryOutcome::fail(MemoryError::STORAGE, store_->last_error());
    }

    LOG_DEBUG("Memory %s replaced by %s", short_id(old_id).c_str(), short_id(m.value.id).c_str());
    return m;
}

MemoryOutcome MemoryManager::archive(const std::string& id_or_prefix) {
    MemoryOutcome m = resolve(id_or_prefix);
    if (!m.success) return m;

    if (m.value.status == MemoryStatus::ARCHIVED) {
        return m;
    }
    if (m.value.status != MemoryStatus::ACTIVE) {
        return MemoryOutcome::fail(MemoryError::VALIDATION,
                                   "only active memories can be archived; " + short_id(m.value.id) +
                                   " is " + memory_status_to_string(m.value.status));
    }

    int changed = 0;
    if (!store_->transition(m.value.id, MemoryStatus::ACTIVE, MemoryStatus::ARCHIVED,
                            current_timestamp_ms(), changed)) {
        return MemoryOutcome::fail(MemoryError::STORAGE, store_->last_error());
    }
    if (changed == 0) {
        return MemoryOutcome::fail(MemoryError::STORAGE,
                                   "memory " + short_id(m.value.id) + " changed concurrently");
    }
    return reload(m.value.id);
}

MemoryResult<std::vector<Memory> > MemoryManager::history(const std::string& id_or_prefix) {
    MemoryOutcome m = resolve(id_or_prefix);
    if (!m.success) return MemoryResult<std::vector<Memory> >::fail_from(m);

    std::vector<Memory> chain;
    if (!store_->history(m.value.id, chain)) {
        return MemoryResult<std::vector<Memory> >::fail(MemoryError::STORAGE, store_->last_error());
    }
    return MemoryResult<std::vector<Memory> >::ok(chain);
}

SearchOutcome MemoryManager::search(const std::string& query, const SearchOptions& opts) {
    return search_.search(query, opts);
}

ContextScope parse_context_scope(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "agent") return ContextScope::AGENT;
    if (v == "global") return ContextScope::GLOBAL;
    return ContextScope::HYBRID;
}

MemoryConfig load_memory_config(const Config& cfg) {
    MemoryConfig mc;
    mc.db_path = cfg.get_string("memory.db_path", mc.db_path);

    mc.search.threshold = cfg.get_double("memory.search.threshold", mc.search.threshold);
    mc.search.limit = static_cast<int>(cfg.get_int("memory.search.limit", mc.search.limit));

    mc.formation.duplicate_threshold =
        cfg.get_double("memory.formation.duplicate_threshold", mc.formation.duplicate_threshold);
    mc.formation.exact_threshold =
        cfg.get_double("memory.formation.exact_threshold", mc.formation.exact_threshold);
    mc.formation.candidate_limit =
        static_cast<int>(cfg.get_int("memory.formation.candidate_limit", mc.formation.candidate_limit));

    mc.queue.capacity = static_cast<int>(cfg.get_int("memory.queue.capacity", mc.queue.capacity));
    mc.queue.shutdown_timeout_ms =
        static_cast<int>(cfg.get_int("memory.queue.shutdown_timeout_ms", mc.queue.shutdown_timeout_ms));

    mc.context.scope = parse_context_scope(cfg.get_string("memory.context.scope", "hybrid"));
    mc.context.threshold = cfg.get_double("memory.context.threshold", mc.context.threshold);
    mc.context.max_memories =
        static_cast<int>(cfg.get_int("memory.context.max_memories", mc.context.max_memories));

    if (mc.formation.exact_threshold < mc.formation.duplicate_threshold) {
        LOG_WARN("memory.formation.exact_threshold (%.2f) is below duplicate_threshold (%.2f)",
                 mc.formation.exact_threshold, mc.formation.duplicate_threshold);
    }
    return mc;
}

} // namespace engram
