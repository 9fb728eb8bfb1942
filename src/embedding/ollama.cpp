#include <engram/embedding/ollama.hpp>
#include <engram/core/logger.hpp>

namespace engram {

EmbeddingResult parse_ollama_embeddings(const Json& body, int dimension) {
    const Json& first = body["embeddings"][0];
    if (!first.is_array() || first.size() == 0) {
        return EmbeddingResult::fail("ollama embed: no embeddings returned");
    }

    std::vector<float> vec;
    vec.reserve(first.size());
    const std::vector<Json>& values = first.as_array();
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i].is_number()) {
            return EmbeddingResult::fail("ollama embed: non-numeric embedding value");
        }
        vec.push_back(static_cast<float>(values[i].as_number()));
    }

    if (static_cast<int>(vec.size()) != dimension) {
        return EmbeddingResult::fail("ollama embed: expected dimension " +
                                     std::to_string(dimension) + ", got " +
                                     std::to_string(vec.size()));
    }
    return EmbeddingResult::ok(vec);
}

const char* OllamaEmbedder::DEFAULT_HOST = "http://localhost:11434";
const char* OllamaEmbedder::DEFAULT_MODEL = "nomic-embed-text";

OllamaEmbedder::OllamaEmbedder(const std::string& host,
                               const std::string& model,
                               int dimension,
                               long timeout_ms)
    : host_(host.empty() ? DEFAULT_HOST : host)
    , model_(model.empty() ? DEFAULT_MODEL : model)
    , dimension_(dimension > 0 ? dimension : DEFAULT_DIMENSION)
    , closed_(false)
{
    while (!host_.empty() && host_[host_.size() - 1] == '/') {
        host_.erase(host_.size() - 1);
    }
    http_.set_timeout(timeout_ms);
    LOG_DEBUG("Ollama embedder: host=%s model=%s dim=%d",
              host_.c_str(), model_.c_str(), dimension_);
}

EmbeddingResult OllamaEmbedder::embed(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return EmbeddingResult::fail("ollama embedder is closed");
    }

    Json input = Json::array();
    input.push(text);
    Json request = Json::object();
    request.set("model", model_);
    request.set("input", input);

    HttpResponse resp = http_.post_json(host_ + "/api/embed", request);
    if (!resp.ok()) {
        return EmbeddingResult::fail("ollama embed: " + resp.error);
    }

    std::string err;
    Json body = resp.json(err);
    if (!err.empty()) {
        return EmbeddingResult::fail("ollama embed: " + err);
    }

    return parse_ollama_embeddings(body, dimension_);
}

void OllamaEmbedder::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

} // namespace engram
