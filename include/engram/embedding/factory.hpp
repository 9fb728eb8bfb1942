#ifndef ENGRAM_EMBEDDING_FACTORY_HPP
#define ENGRAM_EMBEDDING_FACTORY_HPP

#include "provider.hpp"
#include "../core/config.hpp"
#include <memory>

namespace engram {

struct EmbeddingSettings {
    std::string provider;   // ollama | openai | voyage | none
    std::string model;
    std::string host;       // ollama host or full endpoint URL
    std::string api_key;
    int dimension;          // 0 = provider default
    long timeout_ms;

    EmbeddingSettings() : provider("ollama"), dimension(0), timeout_ms(30000) {}
};

// Reads the "embedding" section; API keys fall back to OPENAI_API_KEY /
// VOYAGE_API_KEY.
EmbeddingSettings load_embedding_settings(const Config& cfg);

// Null when the provider is "none" or unknown
std::unique_ptr<EmbeddingProvider> create_embedding_provider(const EmbeddingSettings& settings);

} // namespace engram

#endif // ENGRAM_EMBEDDING_FACTORY_HPP
