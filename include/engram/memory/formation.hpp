/*
 * engram - Memory formation
 *
 * Reconciles one candidate memory against the store: create it, skip it as
 * already known, or create it as the replacement of an existing memory.
 * Failures never escape process(); they become FAILED events.
 */
#ifndef ENGRAM_MEMORY_FORMATION_HPP
#define ENGRAM_MEMORY_FORMATION_HPP

#include "types.hpp"
#include "manager.hpp"
#include "../classifier/classifier.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>

namespace engram {

enum class FormationEventType {
    CREATED,
    SKIPPED,
    SUPERSEDED,
    FAILED
};

inline const char* formation_event_type_to_string(FormationEventType t) {
    switch (t) {
        case FormationEventType::CREATED: return "created";
        case FormationEventType::SKIPPED: return "skipped";
        case FormationEventType::SUPERSEDED: return "superseded";
        case FormationEventType::FAILED: return "failed";
    }
    return "failed";
}

// Candidate handed to the pipeline by a conversation runner
struct FormationCandidate {
    std::string content;
    MemoryCategory category;
    bool has_category;          // false = let the classifier decide
    std::string agent_handle;
    std::string path_scope;
    std::string source_session_id;
    std::string source_message_id;

    FormationCandidate() : category(MemoryCategory::FACT), has_category(false) {}
};

struct FormationEvent {
    FormationEventType type;
    std::string request_id;
    std::string content;
    std::string memory_id;       // created memory, or the existing one on skip
    std::string superseded_id;
    std::string reason;
    double similarity;           // best match, 0 when none
    int64_t elapsed_ms;

    FormationEvent() : type(FormationEventType::FAILED), similarity(0), elapsed_ms(0) {}
};

class FormationListener {
public:
    virtual ~FormationListener() {}
    virtual void on_formation(const FormationEvent& event) = 0;
};

class FormationPipeline {
public:
    // classifier may be null; neither dependency is owned
    FormationPipeline(MemoryManager& manager, MemoryClassifier* classifier,
                      const FormationConfig& config);

    void add_listener(FormationListener* listener);
    void remove_listener(FormationListener* listener);

    // Run one formation and deliver the event to every listener
    FormationEvent process(const FormationCandidate& candidate, const std::string& request_id);

    // Deliver an event produced outside process() (queue overflow, shutdown)
    void notify(const FormationEvent& event);

    const FormationConfig& config() const { return config_; }

private:
    MemoryManager& manager_;
    MemoryClassifier* classifier_;
    FormationConfig config_;

    mutable std::mutex listeners_mutex_;
    std::vector<FormationListener*> listeners_;

    FormationEvent run(const FormationCandidate& candidate);
    FormationEvent create_new(const FormationCandidate& candidate, MemoryCategory category,
                              const std::vector<float>& embedding, double best_similarity);
    FormationEvent replace_existing(const FormationCandidate& candidate, MemoryCategory category,
                                    const std::vector<float>& embedding, const SearchResult& target,
                                    const std::string& reason);
};

} // namespace engram

#endif // ENGRAM_MEMORY_FORMATION_HPP
