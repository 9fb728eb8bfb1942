/*
 * engram - OpenAI-compatible embedding provider
 *
 * Also serves Voyage AI, which speaks the same /v1/embeddings format.
 */
#ifndef ENGRAM_EMBEDDING_OPENAI_HPP
#define ENGRAM_EMBEDDING_OPENAI_HPP

#include "provider.hpp"
#include "../core/http_client.hpp"
#include <mutex>

namespace engram {

class OpenAIEmbedder : public EmbeddingProvider {
public:
    OpenAIEmbedder(const std::string& provider_name,
                   const std::string& endpoint,
                   const std::string& api_key,
                   const std::string& model,
                   int dimension,
                   long timeout_ms);

    std::string name() const override { return name_; }
    std::string model() const override { return model_; }
    int dimension() const override { return dimension_; }

    EmbeddingResult embed(const std::string& text) override;
    void close() override;

private:
    std::string name_;
    std::string endpoint_;
    std::string api_key_;
    std::string model_;
    int dimension_;
    bool closed_;
    HttpClient http_;
    std::mutex mutex_;
};

// Reads data[0].embedding from a /v1/embeddings response body. An API error
// object's message is used when the embedding is missing.
EmbeddingResult parse_openai_embeddings(const std::string& provider_name,
                                        const Json& body, int dimension);

} // namespace engram

#endif // ENGRAM_EMBEDDING_OPENAI_HPP
