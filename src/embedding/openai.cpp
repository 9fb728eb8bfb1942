#include <engram/embedding/openai.hpp>
#include <engram/core/logger.hpp>

namespace engram {

EmbeddingResult parse_openai_embeddings(const std::string& provider_name,
                                        const Json& body, int dimension) {
    const Json& embedding = body["data"][0]["embedding"];
    if (!embedding.is_array() || embedding.size() == 0) {
        std::string detail = body["error"].get_string("message");
        return EmbeddingResult::fail(provider_name + " embed: " +
                                     (detail.empty() ? "no embedding in response" : detail));
    }

    std::vector<float> vec;
    vec.reserve(embedding.size());
    const std::vector<Json>& values = embedding.as_array();
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i].is_number()) {
            return EmbeddingResult::fail(provider_name + " embed: non-numeric embedding value");
        }
        vec.push_back(static_cast<float>(values[i].as_number()));
    }

    if (static_cast<int>(vec.size()) != dimension) {
        return EmbeddingResult::fail(provider_name + " embed: expected dimension " +
                                     std::to_string(dimension) + ", got " +
                                     std::to_string(vec.size()));
    }
    return EmbeddingResult::ok(vec);
}

OpenAIEmbedder::OpenAIEmbedder(const std::string& provider_name,
                               const std::string& endpoint,
                               const std::string& api_key,
                               const std::string& model,
                               int dimension,
                               long timeout_ms)
    : name_(provider_name)
    , endpoint_(endpoint)
    , api_key_(api_key)
    , model_(model)
    , dimension_(dimension)
    , closed_(false)
{
    http_.set_timeout(timeout_ms);
    if (api_key_.empty()) {
        LOG_WARN("%s embedder has no API key; embedding requests will fail", name_.c_str());
    }
}

EmbeddingResult OpenAIEmbedder::embed(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return EmbeddingResult::fail(name_ + " embedder is closed");
    }
    if (api_key_.empty()) {
        return EmbeddingResult::fail(name_ + " embed: missing API key");
    }

    Json input = Json::array();
    input.push(text);
    Json request = Json::object();
    request.set("model", model_);
    request.set("input", input);

    HttpHeaders headers;
    headers["Authorization"] = "Bearer " + api_key_;

    HttpResponse resp = http_.post_json(endpoint_, request, headers);
    if (!resp.ok()) {
        return EmbeddingResult::fail(name_ + " embed: " + resp.error);
    }

    std::string err;
    Json body = resp.json(err);
    if (!err.empty()) {
        return EmbeddingResult::fail(name_ + " embed: " + err);
    }

    return parse_openai_embeddings(name_, body, dimension_);
}

void OpenAIEmbedder::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

} // namespace engram
