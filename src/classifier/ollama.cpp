#include <engram/classifier/ollama.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <sstream>

namespace engram {

const char* OllamaClassifier::DEFAULT_HOST = "http://localhost:11434";
const char* OllamaClassifier::DEFAULT_MODEL = "ministral-3:3b";

static const char* CATEGORIZE_PROMPT =
    "Assign the following piece of information to exactly one category.\n\n"
    "Categories:\n"
    "- \"preference\": likes, dislikes and style choices (\"User prefers tabs\")\n"
    "- \"fact\": facts about the user, project or environment (\"Project uses PostgreSQL\")\n"
    "- \"correction\": corrections of earlier assistant behavior (\"don't do that again\")\n"
    "- \"pattern\": recurring behavior (\"User usually asks for tests\")\n\n"
    "Content: ";

static const char* CATEGORIZE_SUFFIX =
    "\n\nReply with JSON only:\n"
    "{\"category\": \"preference|fact|correction|pattern\", \"confidence\": 0.0-1.0}";

static const char* JUDGE_PROMPT =
    "Compare a new memory with existing memories and decide what to do with it.\n\n"
    "New memory: ";

static const char* JUDGE_SUFFIX =
    "\nDecide:\n"
    "- \"new\": the new memory is unrelated new information\n"
    "- \"duplicate\": it says the same thing as an existing memory\n"
    "- \"supersede\": it changes or replaces an existing memory on the same topic\n\n"
    "Reply with JSON only:\n"
    "{\"action\": \"new|duplicate|supersede\", \"reason\": \"short explanation\", "
    "\"target_id\": \"id of the existing memory concerned\"}";

bool parse_chat_reply(const Json& body, Json& out, std::string& error) {
    const Json& content = body["message"]["content"];
    if (!content.is_string()) {
        error = "chat response has no message content";
        return false;
    }
    try {
        out = Json::parse(content.as_string());
    } catch (const std::exception& e) {
        error = std::string("model returned invalid JSON: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        error = "model reply is not a JSON object";
        return false;
    }
    return true;
}

ClassifyResult parse_category_reply(const Json& reply) {
    std::string name = to_lower(trim(reply.get_string("category")));
    MemoryCategory category;
    if (!parse_memory_category(name, category)) {
        LOG_DEBUG("Classifier returned category '%s'; using fact", name.c_str());
        category = MemoryCategory::FACT;
    }
    double confidence = reply.get_double("confidence", 0.0);
    if (confidence < 0.0) confidence = 0.0;
    if (confidence > 1.0) confidence = 1.0;
    return ClassifyResult::ok(category, confidence);
}

JudgeResult parse_judge_reply(const Json& reply) {
    std::string action = to_lower(trim(reply.get_string("action")));
    std::string reason = reply.get_string("reason");
    std::string target = trim(reply.get_string("target_id"));

    if (action == "new") {
        return JudgeResult::ok(JudgeAction::NEW, "", reason);
    }
    if (action == "duplicate") {
        return JudgeResult::ok(JudgeAction::DUPLICATE, target, reason);
    }
    if (action == "supersede") {
        return JudgeResult::ok(JudgeAction::SUPERSEDE, target, reason);
    }
    return JudgeResult::fail("judge: unknown action '" + action + "'");
}

OllamaClassifier::OllamaClassifier(const std::string& host, const std::string& model, long timeout_ms)
    : host_(host.empty() ? DEFAULT_HOST : host)
    , model_(model.empty() ? DEFAULT_MODEL : model)
{
    while (!host_.empty() && host_[host_.size() - 1] == '/') {
        host_.erase(host_.size() - 1);
    }
    http_.set_timeout(timeout_ms);
}

bool OllamaClassifier::is_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    HttpResponse resp = http_.get(host_ + "/api/tags");
    if (!resp.ok()) {
        LOG_DEBUG("Classifier unavailable: %s", resp.error.c_str());
        return false;
    }
    return true;
}

bool OllamaClassifier::chat_json(const std::string& prompt, Json& out, std::string& error) {
    Json message = Json::object();
    message.set("role", "user");
    message.set("content", prompt);
    Json messages = Json::array();
    messages.push(message);

    Json options = Json::object();
    options.set("temperature", 0.1);

    Json request = Json::object();
    request.set("model", model_);
    request.set("messages", messages);
    request.set("stream", false);
    request.set("format", "json");
    request.set("options", options);

    HttpResponse resp;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resp = http_.post_json(host_ + "/api/chat", request);
    }
    if (!resp.ok()) {
        error = resp.error;
        return false;
    }

    std::string err;
    Json body = resp.json(err);
    if (!err.empty()) {
        error = err;
        return false;
    }

    return parse_chat_reply(body, out, error);
}

ClassifyResult OllamaClassifier::classify(const std::string& content) {
    Json reply;
    std::string error;
    if (!chat_json(std::string(CATEGORIZE_PROMPT) + content + CATEGORIZE_SUFFIX, reply, error)) {
        return ClassifyResult::fail("categorize: " + error);
    }

    return parse_category_reply(reply);
}

JudgeResult OllamaClassifier::judge(const std::string& content,
                                    const std::vector<JudgeCandidate>& existing) {
    if (existing.empty()) {
        return JudgeResult::ok(JudgeAction::NEW, "", "no existing memories");
    }

    std::ostringstream prompt;
    prompt << JUDGE_PROMPT << content << "\n\nExisting memories:\n";
    for (size_t i = 0; i < existing.size(); ++i) {
        prompt << "- [" << existing[i].id << "] " << existing[i].content << "\n";
    }
    prompt << JUDGE_SUFFIX;

    Json reply;
    std::string error;
    if (!chat_json(prompt.str(), reply, error)) {
        return JudgeResult::fail("judge: " + error);
    }

    return parse_judge_reply(reply);
}

std::unique_ptr<MemoryClassifier> create_classifier(const Config& cfg) {
    if (!cfg.get_bool("classifier.enabled", true)) {
        return std::unique_ptr<MemoryClassifier>();
    }
    return std::unique_ptr<MemoryClassifier>(new OllamaClassifier(
        cfg.get_string("classifier.host", OllamaClassifier::DEFAULT_HOST),
        cfg.get_string("classifier.model", OllamaClassifier::DEFAULT_MODEL),
        static_cast<long>(cfg.get_int("classifier.timeout_ms", 30000))));
}

} // namespace engram
