/*
 * engram - Memory error taxonomy
 */
#ifndef ENGRAM_MEMORY_ERRORS_HPP
#define ENGRAM_MEMORY_ERRORS_HPP

#include <string>

namespace engram {

enum class MemoryError {
    NONE,
    NOT_FOUND,
    AMBIGUOUS_ID,
    PROVIDER_UNAVAILABLE,
    VALIDATION,
    STORAGE
};

inline const char* memory_error_to_string(MemoryError e) {
    switch (e) {
        case MemoryError::NONE: return "ok";
        case MemoryError::NOT_FOUND: return "not found";
        case MemoryError::AMBIGUOUS_ID: return "ambiguous id";
        case MemoryError::PROVIDER_UNAVAILABLE: return "provider unavailable";
        case MemoryError::VALIDATION: return "validation error";
        case MemoryError::STORAGE: return "storage error";
    }
    return "unknown";
}

// Outcome of a caller-facing memory operation
template<typename T>
struct MemoryResult {
    bool success;
    T value;
    MemoryError code;
    std::string error;

    MemoryResult() : success(false), value(), code(MemoryError::NONE) {}

    static MemoryResult ok(const T& v) {
        MemoryResult r;
        r.success = true;
        r.value = v;
        return r;
    }

    static MemoryResult fail(MemoryError code, const std::string& err) {
        MemoryResult r;
        r.success = false;
        r.code = code;
        r.error = err;
        return r;
    }

    // Re-wrap another result's failure
    template<typename U>
    static MemoryResult fail_from(const MemoryResult<U>& other) {
        return fail(other.code, other.error);
    }
};

} // namespace engram

#endif // ENGRAM_MEMORY_ERRORS_HPP
