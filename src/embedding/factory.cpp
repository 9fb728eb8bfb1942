#include <engram/embedding/factory.hpp>
#include <engram/embedding/ollama.hpp>
#include <engram/embedding/openai.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <cstdlib>

namespace engram {

static std::string env_or(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    return (v && v[0]) ? std::string(v) : def;
}

EmbeddingSettings load_embedding_settings(const Config& cfg) {
    EmbeddingSettings s;
    s.provider = to_lower(cfg.get_string("embedding.provider", "ollama"));
    s.model = cfg.get_string("embedding.model", "");
    s.host = cfg.get_string("embedding.host", "");
    s.api_key = cfg.get_string("embedding.api_key", "");
    s.dimension = static_cast<int>(cfg.get_int("embedding.dimension", 0));
    s.timeout_ms = static_cast<long>(cfg.get_int("embedding.timeout_ms", 30000));

    if (s.api_key.empty()) {
        if (s.provider == "openai") {
            s.api_key = env_or("OPENAI_API_KEY", "");
        } else if (s.provider == "voyage") {
            s.api_key = env_or("VOYAGE_API_KEY", "");
        }
    }
    return s;
}

std::unique_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingSettings& s) {
    if (s.provider == "ollama") {
        return std::unique_ptr<EmbeddingProvider>(
            new OllamaEmbedder(s.host, s.model, s.dimension, s.timeout_ms));
    }

    if (s.provider == "openai") {
        return std::unique_ptr<EmbeddingProvider>(new OpenAIEmbedder(
            "openai",
            s.host.empty() ? "https://api.openai.com/v1/embeddings" : s.host,
            s.api_key,
            s.model.empty() ? "text-embedding-3-small" : s.model,
            s.dimension > 0 ? s.dimension : 1536,
            s.timeout_ms));
    }

    if (s.provider == "voyage") {
        return std::unique_ptr<EmbeddingProvider>(new OpenAIEmbedder(
            "voyage",
            s.host.empty() ? "https://api.voyageai.com/v1/embeddings" : s.host,
            s.api_key,
            s.model.empty() ? "voyage-2" : s.model,
            s.dimension > 0 ? s.dimension : 1024,
            s.timeout_ms));
    }

    if (s.provider != "none" && !s.provider.empty()) {
        LOG_WARN("Unknown embedding provider '%s'; semantic search disabled", s.provider.c_str());
    }
    return std::unique_ptr<EmbeddingProvider>();
}

} // namespace engram
