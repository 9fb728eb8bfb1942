/*
 * engram - Memory Formation Implementation
 */
#include <engram/memory/formation.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <algorithm>
#include <stdexcept>

namespace engram {

namespace {

const char* const SKIP_REASON = "already remembered";
const char* const SUPERSEDE_REASON = "updated via memory formation";

FormationEvent failed(const std::string& reason) {
    FormationEvent e;
    e.type = FormationEventType::FAILED;
    e.reason = reason;
    return e;
}

// Index of id among the candidates, or -1
int find_candidate(const std::vector<SearchResult>& matches, const std::string& id) {
    if (id.empty()) return -1;
    for (size_t i = 0; i < matches.size(); ++i) {
        if (matches[i].memory.id == id) return static_cast<int>(i);
    }
    return -1;
}

} // namespace

FormationPipeline::FormationPipeline(MemoryManager& manager, MemoryClassifier* classifier,
                                     const FormationConfig& config)
    : manager_(manager)
    , classifier_(classifier)
    , config_(config)
{
}

void FormationPipeline::add_listener(FormationListener* listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void FormationPipeline::remove_listener(FormationListener* listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void FormationPipeline::notify(const FormationEvent& event) {
    std::vector<FormationListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = listeners_;
    }

    for (size_t i = 0; i < listeners.size(); ++i) {
        try {
            listeners[i]->on_formation(event);
        } catch (const std::exception& e) {
            LOG_WARN("Formation listener threw exception: %s", e.what());
        } catch (...) {
            LOG_WARN("Formation listener threw unknown exception");
        }
    }
}

FormationEvent FormationPipeline::process(const FormationCandidate& candidate,
                                          const std::string& request_id) {
    int64_t started = current_timestamp_ms();

    FormationEvent event;
    try {
        event = run(candidate);
    } catch (const std::exception& e) {
        LOG_ERROR("Memory formation threw exception: %s", e.what());
        event = failed(e.what());
    } catch (...) {
        LOG_ERROR("Memory formation threw unknown exception");
        event = failed("unknown error");
    }

    event.request_id = request_id;
    event.content = candidate.content;
    event.elapsed_ms = current_timestamp_ms() - started;

    if (event.type == FormationEventType::FAILED) {
        LOG_WARN("Memory formation failed: %s", event.reason.c_str());
    } else {
        LOG_DEBUG("Memory formation %s: %s (%lldms)",
                  formation_event_type_to_string(event.type),
                  short_id(event.memory_id).c_str(),
                  static_cast<long long>(event.elapsed_ms));
    }

    notify(event);
    return event;
}

FormationEvent FormationPipeline::run(const FormationCandidate& candidate) {
    std::string content = trim(candidate.content);
    if (content.empty()) {
        return failed("memory content is empty");
    }
    if (!manager_.searcher().available()) {
        return failed("embedding provider unavailable");
    }

    // 1. Category
    MemoryCategory category = MemoryCategory::FACT;
    if (candidate.has_category) {
        category = candidate.category;
    } else if (classifier_) {
        ClassifyResult c = classifier_->classify(content);
        if (!c.success) {
            return failed("classification failed: " + c.error);
        }
        category = c.category;
    }

    // 2. Duplicate probe, without touching access bookkeeping
    MemoryResult<std::vector<float> > vec = manager_.searcher().embed(content);
    if (!vec.success) {
        return failed("embedding failed: " + vec.error);
    }

    SearchOptions probe;
    probe.agent_handle = candidate.agent_handle;
    probe.path_scope = candidate.path_scope;
    probe.threshold = config_.duplicate_threshold;
    probe.limit = config_.candidate_limit > 0 ? config_.candidate_limit : 3;
    probe.record_access = false;

    SearchOutcome matches = manager_.searcher().search_vector(vec.value, probe);
    if (!matches.success) {
        return failed("duplicate search failed: " + matches.error);
    }

    // 3. Decision
    if (matches.value.empty()) {
        return create_new(candidate, category, vec.value, 0);
    }

    const SearchResult& best = matches.value[0];

    if (!classifier_) {
        if (best.similarity >= config_.exact_threshold) {
            FormationEvent e;
            e.type = FormationEventType::SKIPPED;
            e.memory_id = best.memory.id;
            e.reason = SKIP_REASON;
            e.similarity = best.similarity;
            return e;
        }
        return replace_existing(candidate, category, vec.value, best, SUPERSEDE_REASON);
    }

    std::vector<JudgeCandidate> existing;
    for (size_t i = 0; i < matches.value.size(); ++i) {
        JudgeCandidate jc;
        jc.id = matches.value[i].memory.id;
        jc.content = matches.value[i].memory.content;
        jc.similarity = matches.value[i].similarity;
        existing.push_back(jc);
    }

    JudgeResult verdict = classifier_->judge(content, existing);
    if (!verdict.success) {
        return failed("dedup judgement failed: " + verdict.error);
    }

    int idx = find_candidate(matches.value, verdict.target_id);
    if (idx < 0 && verdict.action != JudgeAction::NEW) {
        if (!verdict.target_id.empty()) {
            LOG_DEBUG("Classifier named unknown target %s, using best match",
                      verdict.target_id.c_str());
        }
        idx = 0;
    }

    switch (verdict.action) {
        case JudgeAction::NEW:
            return create_new(candidate, category, vec.value, best.similarity);

        case JudgeAction::DUPLICATE: {
            FormationEvent e;
            e.type = FormationEventType::SKIPPED;
            e.memory_id = matches.value[idx].memory.id;
            e.reason = verdict.reason.empty() ? SKIP_REASON : verdict.reason;
            e.similarity = matches.value[idx].similarity;
            return e;
        }

        case JudgeAction::SUPERSEDE:
            return replace_existing(candidate, category, vec.value, matches.value[idx],
                                    verdict.reason.empty() ? SUPERSEDE_REASON : verdict.reason);
    }
    return failed("unknown dedup action");
}

FormationEvent FormationPipeline::create_new(const FormationCandidate& candidate,
                                             MemoryCategory category,
                                             const std::vector<float>& embedding,
                                             double best_similarity) {
    Memory draft;
    draft.content = candidate.content;
    draft.category = category;
    draft.agent_handle = candidate.agent_handle;
    draft.path_scope = candidate.path_scope;
    draft.source_session_id = candidate.source_session_id;
    draft.source_message_id = candidate.source_message_id;
    draft.embedding = embedding;

    MemoryResult<Memory> created = manager_.create(draft);
    if (!created.success) {
        return failed("store failed: " + created.error);
    }

    FormationEvent e;
    e.type = FormationEventType::CREATED;
    e.memory_id = created.value.id;
    e.similarity = best_similarity;
    return e;
}

FormationEvent FormationPipeline::replace_existing(const FormationCandidate& candidate,
                                                   MemoryCategory category,
                                                   const std::vector<float>& embedding,
                                                   const SearchResult& target,
                                                   const std::string& reason) {
    Memory draft;
    draft.content = candidate.content;
    draft.category = category;
    draft.agent_handle = candidate.agent_handle;
    draft.path_scope = candidate.path_scope;
    draft.source_session_id = candidate.source_session_id;
    draft.source_message_id = candidate.source_message_id;
    draft.embedding = embedding;

    MemoryResult<Memory> created = manager_.replace(target.memory.id, draft, reason);
    if (!created.success) {
        return failed("supersede failed: " + created.error);
    }

    FormationEvent e;
    e.type = FormationEventType::SUPERSEDED;
    e.memory_id = created.value.id;
    e.superseded_id = target.memory.id;
    e.reason = reason;
    e.similarity = target.similarity;
    return e;
}

} // namespace engram
