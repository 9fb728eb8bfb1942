/*
 * engram - Embedding Provider Interface
 *
 * Text -> fixed-length vector. The memory core treats a provider as an
 * optional dependency: a null provider pointer is a valid configuration.
 */
#ifndef ENGRAM_EMBEDDING_PROVIDER_HPP
#define ENGRAM_EMBEDDING_PROVIDER_HPP

#include <string>
#include <vector>

namespace engram {

struct EmbeddingResult {
    bool success;
    std::vector<float> vector;
    std::string error;

    EmbeddingResult() : success(false) {}

    static EmbeddingResult ok(const std::vector<float>& v) {
        EmbeddingResult r;
        r.success = true;
        r.vector = v;
        return r;
    }

    static EmbeddingResult fail(const std::string& err) {
        EmbeddingResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// Implementations must be safe to call from the caller thread and the
// formation queue worker concurrently.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() {}

    // Short provider id ("ollama", "openai", ...)
    virtual std::string name() const = 0;

    virtual std::string model() const = 0;

    // Dimension of every vector this provider returns
    virtual int dimension() const = 0;

    virtual EmbeddingResult embed(const std::string& text) = 0;

    // Release held resources; embed() fails afterwards
    virtual void close() {}
};

} // namespace engram

#endif // ENGRAM_EMBEDDING_PROVIDER_HPP
