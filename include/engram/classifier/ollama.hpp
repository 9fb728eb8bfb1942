/*
 * engram - Small-model classifier over the Ollama chat API
 */
#ifndef ENGRAM_CLASSIFIER_OLLAMA_HPP
#define ENGRAM_CLASSIFIER_OLLAMA_HPP

#include "classifier.hpp"
#include "../core/config.hpp"
#include "../core/http_client.hpp"
#include <memory>
#include <mutex>

namespace engram {

class OllamaClassifier : public MemoryClassifier {
public:
    OllamaClassifier(const std::string& host, const std::string& model, long timeout_ms);

    std::string name() const override { return "ollama:" + model_; }

    bool is_available() override;
    ClassifyResult classify(const std::string& content) override;
    JudgeResult judge(const std::string& content,
                      const std::vector<JudgeCandidate>& existing) override;

    static const char* DEFAULT_HOST;
    static const char* DEFAULT_MODEL;

private:
    std::string host_;
    std::string model_;
    HttpClient http_;
    std::mutex mutex_;

    // Single-turn chat constrained to JSON output; returns the parsed reply
    bool chat_json(const std::string& prompt, Json& out, std::string& error);
};

// Unwraps message.content of an /api/chat body into a JSON object
bool parse_chat_reply(const Json& body, Json& out, std::string& error);

// Unknown categories fall back to fact
ClassifyResult parse_category_reply(const Json& reply);

// Unknown actions are errors
JudgeResult parse_judge_reply(const Json& reply);

// Reads the "classifier" section; null when disabled
std::unique_ptr<MemoryClassifier> create_classifier(const Config& cfg);

} // namespace engram

#endif // ENGRAM_CLASSIFIER_OLLAMA_HPP
