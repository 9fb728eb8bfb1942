/*
 * engram - Memory classifier capability
 *
 * Categorizes candidate memories and judges whether a candidate adds
 * nothing, replaces, or sits beside the existing memories it resembles.
 */
#ifndef ENGRAM_CLASSIFIER_CLASSIFIER_HPP
#define ENGRAM_CLASSIFIER_CLASSIFIER_HPP

#include "../memory/types.hpp"
#include <string>
#include <vector>

namespace engram {

struct ClassifyResult {
    bool success;
    MemoryCategory category;
    double confidence;
    std::string error;

    ClassifyResult() : success(false), category(MemoryCategory::FACT), confidence(0) {}

    static ClassifyResult ok(MemoryCategory c, double confidence) {
        ClassifyResult r;
        r.success = true;
        r.category = c;
        r.confidence = confidence;
        return r;
    }

    static ClassifyResult fail(const std::string& err) {
        ClassifyResult r;
        r.error = err;
        return r;
    }
};

enum class JudgeAction {
    NEW,        // unrelated information
    DUPLICATE,  // no material change
    SUPERSEDE   // updates an existing memory
};

inline const char* judge_action_to_string(JudgeAction a) {
    switch (a) {
        case JudgeAction::NEW: return "new";
        case JudgeAction::DUPLICATE: return "duplicate";
        case JudgeAction::SUPERSEDE: return "supersede";
    }
    return "new";
}

// An existing memory offered to judge()
struct JudgeCandidate {
    std::string id;
    std::string content;
    double similarity;

    JudgeCandidate() : similarity(0) {}
};

struct JudgeResult {
    bool success;
    JudgeAction action;
    std::string target_id;  // memory to supersede, or the duplicate
    std::string reason;
    std::string error;

    JudgeResult() : success(false), action(JudgeAction::NEW) {}

    static JudgeResult ok(JudgeAction action, const std::string& target, const std::string& reason) {
        JudgeResult r;
        r.success = true;
        r.action = action;
        r.target_id = target;
        r.reason = reason;
        return r;
    }

    static JudgeResult fail(const std::string& err) {
        JudgeResult r;
        r.error = err;
        return r;
    }
};

class MemoryClassifier {
public:
    virtual ~MemoryClassifier() {}

    virtual std::string name() const = 0;

    // Cheap reachability probe
    virtual bool is_available() { return true; }

    virtual ClassifyResult classify(const std::string& content) = 0;

    virtual JudgeResult judge(const std::string& content,
                              const std::vector<JudgeCandidate>& existing) = 0;
};

} // namespace engram

#endif // ENGRAM_CLASSIFIER_CLASSIFIER_HPP
