/*
 * engram - Ollama embedding provider (POST /api/embed)
 */
#ifndef ENGRAM_EMBEDDING_OLLAMA_HPP
#define ENGRAM_EMBEDDING_OLLAMA_HPP

#include "provider.hpp"
#include "../core/http_client.hpp"
#include <mutex>

namespace engram {

class OllamaEmbedder : public EmbeddingProvider {
public:
    OllamaEmbedder(const std::string& host,
                   const std::string& model,
                   int dimension,
                   long timeout_ms);

    std::string name() const override { return "ollama"; }
    std::string model() const override { return model_; }
    int dimension() const override { return dimension_; }

    EmbeddingResult embed(const std::string& text) override;
    void close() override;

    static const char* DEFAULT_HOST;
    static const char* DEFAULT_MODEL;
    static const int DEFAULT_DIMENSION = 768;

private:
    std::string host_;
    std::string model_;
    int dimension_;
    bool closed_;
    HttpClient http_;
    std::mutex mutex_;
};

// Turns an /api/embed response body into a vector of the expected dimension
EmbeddingResult parse_ollama_embeddings(const Json& body, int dimension);

} // namespace engram

#endif // ENGRAM_EMBEDDING_OLLAMA_HPP
