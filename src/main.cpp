/*
 * engram - Semantic memory command line
 *
 * Usage:
 *   engram [--config <file>] [--verbose] <command> [args]
 *
 * Configuration is read from ~/.config/engram/config.json unless --config
 * names another file.
 */

#include <engram/core/logger.hpp>
#include <engram/core/config.hpp>
#include <engram/core/json.hpp>
#include <engram/core/utils.hpp>
#include <engram/embedding/factory.hpp>
#include <engram/classifier/ollama.hpp>
#include <engram/memory/manager.hpp>
#include <engram/memory/formation.hpp>
#include <engram/memory/queue.hpp>
#include <engram/memory/context.hpp>

#include <iostream>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <map>
#include <memory>
#include <curl/curl.h>

namespace engram {

static const char* APP_VERSION = "0.1.0";
static const char* APP_NAME = "engram";
static const char* DEFAULT_CONFIG_PATH = "~/.config/engram/config.json";
static const int FORMATION_WAIT_MS = 120000;

// Parsed command arguments: positionals plus "-x value" options and switches
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    bool has(const std::string& key) const { return options.count(key) > 0; }

    std::string get(const std::string& key, const std::string& def = "") const {
        std::map<std::string, std::string>::const_iterator it = options.find(key);
        return it != options.end() ? it->second : def;
    }

    std::string text() const { return trim(join(positional, " ")); }
};

// Options that take a value; everything else starting with '-' is a switch
static bool option_takes_value(const char* arg) {
    static const char* const VALUE_OPTS[] = {
        "-a", "--agent", "-n", "--limit", "--offset", "-t", "--threshold",
        "-c", "--category", "-p", "--path", NULL
    };
    for (int i = 0; VALUE_OPTS[i]; ++i) {
        if (strcmp(arg, VALUE_OPTS[i]) == 0) return true;
    }
    return false;
}

// Map long spellings onto the short key used by the commands
static std::string option_key(const std::string& arg) {
    if (arg == "--agent") return "-a";
    if (arg == "--limit") return "-n";
    if (arg == "--threshold") return "-t";
    if (arg == "--category") return "-c";
    if (arg == "--path") return "-p";
    if (arg == "--force") return "-f";
    return arg;
}

static Json memory_to_json(const Memory& m) {
    Json j = Json::object();
    j.set("id", m.id);
    j.set("content", m.content);
    j.set("category", memory_category_to_string(m.category));
    j.set("status", memory_status_to_string(m.status));
    j.set("agent_handle", m.agent_handle);
    j.set("path_scope", m.path_scope);
    j.set("confidence", m.confidence);
    j.set("access_count", m.access_count);
    j.set("last_accessed_at", m.last_accessed_at);
    j.set("has_embedding", m.has_embedding());
    if (!m.supersedes_id.empty()) j.set("supersedes_id", m.supersedes_id);
    if (!m.superseded_by_id.empty()) j.set("superseded_by_id", m.superseded_by_id);
    if (!m.supersession_reason.empty()) j.set("supersession_reason", m.supersession_reason);
    if (!m.source_session_id.empty()) j.set("source_session_id", m.source_session_id);
    if (!m.source_message_id.empty()) j.set("source_message_id", m.source_message_id);
    j.set("created_at", m.created_at);
    j.set("updated_at", m.updated_at);
    return j;
}

static bool confirm(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    answer = to_lower(trim(answer));
    return answer == "y" || answer == "yes";
}

static int report_failure(MemoryError code, const std::string& error) {
    std::cerr << "Error: " << error;
    if (code == MemoryError::PROVIDER_UNAVAILABLE) {
        std::cerr << " (configure embedding.provider)";
    }
    std::cerr << "\n";
    return 1;
}

// Collects the event of a single formation run for `remember`
class OutcomeCollector : public FormationListener {
public:
    OutcomeCollector() : received_(false) {}

    void on_formation(const FormationEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        event_ = event;
        received_ = true;
    }

    bool get(FormationEvent& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out = event_;
        return received_;
    }

private:
    std::mutex mutex_;
    FormationEvent event_;
    bool received_;
};

class Application {
public:
    static Application& instance() {
        static Application app;
        return app;
    }

    // Returns false when the process should exit with exit_code()
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }

private:
    Application() : curl_initialized_(false), exit_code_(0) {}
    Application(const Application&);
    Application& operator=(const Application&);

    Config config_;
    MemoryConfig memory_config_;
    std::unique_ptr<EmbeddingProvider> embedder_;
    std::unique_ptr<MemoryClassifier> classifier_;
    std::unique_ptr<MemoryManager> manager_;
    std::string command_;
    CommandArgs args_;
    bool curl_initialized_;
    int exit_code_;

    bool parse_command_args(int argc, char* argv[], int first);

    int cmd_list();
    int cmd_search();
    int cmd_show();
    int cmd_store();
    int cmd_remember();
    int cmd_forget();
    int cmd_stats();
    int cmd_clear();
    int cmd_history();
    int cmd_context();
};

static void print_usage(const char* prog) {
    std::cout << APP_NAME << " - semantic memory store\n\n"
              << "Usage: " << prog << " [--config <file>] [--verbose] <command> [args]\n\n"
              << "Commands:\n"
              << "  list [-a agent] [-n limit] [--offset n] [--json]\n"
              << "  search <query> [-a agent] [-t threshold] [-n limit] [--json]\n"
              << "  show <id-or-prefix> [--json]\n"
              << "  store <content> [-a agent] [-c category] [-p path]\n"
              << "  remember <content> [-a agent] [-c category] [-p path]\n"
              << "  forget <id-or-prefix> [-f]\n"
              << "  stats [-a agent]\n"
              << "  clear [-a agent] [-f]\n"
              << "  history <id-or-prefix>\n"
              << "  context <query> [-a agent] [-p path]\n\n"
              << "Categories: preference, fact, correction, pattern\n";
}

bool Application::parse_command_args(int argc, char* argv[], int first) {
    for (int i = first; i < argc; ++i) {
        const char* arg = argv[i];
        if (arg[0] == '-' && arg[1] != '\0') {
            if (option_takes_value(arg)) {
                if (i + 1 >= argc) {
                    std::cerr << "Error: option " << arg << " requires a value\n";
                    return false;
                }
                args_.options[option_key(arg)] = argv[++i];
            } else {
                args_.options[option_key(arg)] = "1";
            }
        } else {
            args_.positional.push_back(arg);
        }
    }
    return true;
}

bool Application::init(int argc, char* argv[]) {
    std::string config_file;
    bool explicit_config = false;
    bool verbose = false;

    int i = 1;
    for (; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "--version") == 0) {
            std::cout << APP_NAME << " v" << APP_VERSION << "\n";
            return false;
        }
        if (strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
            continue;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a path\n";
                exit_code_ = 1;
                return false;
            }
            config_file = argv[++i];
            explicit_config = true;
            continue;
        }
        break;
    }

    if (i >= argc) {
        print_usage(argv[0]);
        exit_code_ = 1;
        return false;
    }
    command_ = argv[i];
    if (!parse_command_args(argc, argv, i + 1)) {
        exit_code_ = 1;
        return false;
    }

    // Initialize libcurl globally (before any provider creates a handle)
    curl_global_init(CURL_GLOBAL_ALL);
    curl_initialized_ = true;

    if (!explicit_config) {
        config_file = resolve_user_path(DEFAULT_CONFIG_PATH);
    }
    if (explicit_config || path_exists(config_file)) {
        if (!config_.load_file(config_file)) {
            std::cerr << "Error: cannot load config " << config_file << ": "
                      << config_.last_error() << "\n";
            exit_code_ = 1;
            return false;
        }
        LOG_DEBUG("Loaded config from %s", config_file.c_str());
    }

    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
    if (verbose) {
        Logger::instance().set_level(LogLevel::DEBUG);
    }

    memory_config_ = load_memory_config(config_);
    embedder_ = create_embedding_provider(load_embedding_settings(config_));
    classifier_ = create_classifier(config_);

    manager_.reset(new MemoryManager(memory_config_, embedder_.get()));
    if (!manager_->initialize()) {
        std::cerr << "Error: " << manager_->last_error() << "\n";
        exit_code_ = 1;
        return false;
    }
    return true;
}

int Application::run() {
    if (command_ == "list") return cmd_list();
    if (command_ == "search") return cmd_search();
    if (command_ == "show") return cmd_show();
    if (command_ == "store") return cmd_store();
    if (command_ == "remember") return cmd_remember();
    if (command_ == "forget") return cmd_forget();
    if (command_ == "stats") return cmd_stats();
    if (command_ == "clear") return cmd_clear();
    if (command_ == "history") return cmd_history();
    if (command_ == "context") return cmd_context();

    std::cerr << "Error: unknown command '" << command_ << "'\n";
    return 1;
}

void Application::shutdown() {
    if (manager_) {
        manager_->shutdown();
    }
    manager_.reset();
    classifier_.reset();
    if (embedder_) {
        embedder_->close();
    }
    embedder_.reset();
    if (curl_initialized_) {
        curl_global_cleanup();
        curl_initialized_ = false;
    }
}

// ============================================================================
// Commands
// ============================================================================

int Application::cmd_list() {
    int limit = atoi(args_.get("-n", "50").c_str());
    int offset = atoi(args_.get("--offset", "0").c_str());

    MemoryResult<std::vector<Memory> > r = manager_->list(args_.get("-a"), limit, offset);
    if (!r.success) return report_failure(r.code, r.error);

    if (args_.has("--json")) {
        Json arr = Json::array();
        for (size_t i = 0; i < r.value.size(); ++i) arr.push(memory_to_json(r.value[i]));
        std::cout << arr.dump(2) << "\n";
        return 0;
    }

    if (r.value.empty()) {
        std::cout << "No memories.\n";
        return 0;
    }
    for (size_t i = 0; i < r.value.size(); ++i) {
        const Memory& m = r.value[i];
        std::cout << short_id(m.id) << "  [" << memory_category_to_string(m.category) << "] "
                  << truncate_safe(m.content, 80);
        if (!m.agent_handle.empty()) std::cout << "  (" << m.agent_handle << ")";
        std::cout << "\n";
    }
    return 0;
}

int Application::cmd_search() {
    std::string query = args_.text();
    if (query.empty()) {
        std::cerr << "Error: search requires a query\n";
        return 1;
    }

    SearchOptions opts;
    opts.agent_handle = args_.get("-a");
    opts.threshold = atof(args_.get("-t", "0.3").c_str());
    opts.limit = atoi(args_.get("-n", "10").c_str());

    SearchOutcome r = manager_->search(query, opts);
    if (!r.success) return report_failure(r.code, r.error);

    if (args_.has("--json")) {
        Json arr = Json::array();
        for (size_t i = 0; i < r.value.size(); ++i) {
            Json item = Json::object();
            item.set("memory", memory_to_json(r.value[i].memory));
            item.set("similarity", r.value[i].similarity);
            arr.push(item);
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }

    if (r.value.empty()) {
        std::cout << "No matching memories.\n";
        return 0;
    }
    for (size_t i = 0; i < r.value.size(); ++i) {
        const Memory& m = r.value[i].memory;
        char score[16];
        snprintf(score, sizeof(score), "%.2f", r.value[i].similarity);
        std::cout << score << "  " << short_id(m.id) << "  ["
                  << memory_category_to_string(m.category) << "] "
                  << truncate_safe(m.content, 80) << "\n";
    }
    return 0;
}

int Application::cmd_show() {
    if (args_.positional.empty()) {
        std::cerr << "Error: show requires an id\n";
        return 1;
    }
    MemoryResult<Memory> r = manager_->get_by_prefix(args_.positional[0]);
    if (!r.success) return report_failure(r.code, r.error);

    const Memory& m = r.value;
    if (args_.has("--json")) {
        std::cout << memory_to_json(m).dump(2) << "\n";
        return 0;
    }

    std::cout << "ID:        " << m.id << "\n"
              << "Content:   " << m.content << "\n"
              << "Category:  " << memory_category_to_string(m.category) << "\n"
              << "Status:    " << memory_status_to_string(m.status) << "\n"
              << "Agent:     " << (m.agent_handle.empty() ? "(global)" : m.agent_handle) << "\n";
    if (!m.path_scope.empty()) std::cout << "Path:      " << m.path_scope << "\n";
    std::cout << "Accessed:  " << m.access_count << " times, last "
              << format_timestamp_ms(m.last_accessed_at) << "\n"
              << "Created:   " << format_timestamp_ms(m.created_at) << "\n"
              << "Embedding: " << (m.has_embedding() ? std::to_string(m.embedding.size()) + " dims" : "none") << "\n";
    if (!m.supersedes_id.empty()) std::cout << "Supersedes: " << short_id(m.supersedes_id) << "\n";
    if (!m.superseded_by_id.empty()) {
        std::cout << "Superseded by: " << short_id(m.superseded_by_id)
                  << " (" << m.supersession_reason << ")\n";
    }
    return 0;
}

int Application::cmd_store() {
    Memory draft;
    draft.content = args_.text();
    draft.agent_handle = args_.get("-a");
    draft.path_scope = args_.get("-p");

    if (args_.has("-c")) {
        if (!parse_memory_category(args_.get("-c"), draft.category)) {
            std::cerr << "Error: invalid category '" << args_.get("-c")
                      << "' (preference, fact, correction, pattern)\n";
            return 1;
        }
    } else if (classifier_ && !trim(draft.content).empty() && classifier_->is_available()) {
        ClassifyResult c = classifier_->classify(draft.content);
        if (c.success) {
            draft.category = c.category;
        } else {
            LOG_WARN("Category detection failed, using fact: %s", c.error.c_str());
        }
    }

    MemoryResult<Memory> r = manager_->create(draft);
    if (!r.success) return report_failure(r.code, r.error);

    std::cout << "Stored as " << memory_category_to_string(r.value.category) << ": "
              << short_id(r.value.id) << "\n";
    if (!r.value.has_embedding()) {
        std::cout << "(no embedding; this memory will not appear in search)\n";
    }
    return 0;
}

int Application::cmd_remember() {
    FormationCandidate candidate;
    candidate.content = args_.text();
    candidate.agent_handle = args_.get("-a");
    candidate.path_scope = args_.get("-p");
    if (args_.has("-c")) {
        if (!parse_memory_category(args_.get("-c"), candidate.category)) {
            std::cerr << "Error: invalid category '" << args_.get("-c") << "'\n";
            return 1;
        }
        candidate.has_category = true;
    }

    MemoryClassifier* classifier = classifier_ && classifier_->is_available() ? classifier_.get() : NULL;
    FormationPipeline pipeline(*manager_, classifier, memory_config_.formation);
    OutcomeCollector outcome;
    FormationQueue queue(pipeline, static_cast<size_t>(memory_config_.queue.capacity));
    queue.on_formation(&outcome);
    queue.set_status_sink([](const QueueStatus& st) {
        LOG_DEBUG("[%s] %s", st.request_id.c_str(), st.message.c_str());
    });

    queue.start();
    queue.submit(candidate);
    if (!queue.wait_for_formations(FORMATION_WAIT_MS)) {
        LOG_WARN("Formation still running after %d ms", FORMATION_WAIT_MS);
    }
    queue.stop(memory_config_.queue.shutdown_timeout_ms);

    FormationEvent event;
    if (!outcome.get(event)) {
        std::cerr << "Error: formation did not complete\n";
        return 1;
    }

    switch (event.type) {
        case FormationEventType::CREATED:
            std::cout << "Remembered: " << short_id(event.memory_id) << "\n";
            return 0;
        case FormationEventType::SKIPPED:
            std::cout << "Already remembered as " << short_id(event.memory_id)
                      << " (" << event.reason << ")\n";
            return 0;
        case FormationEventType::SUPERSEDED:
            std::cout << "Updated: " << short_id(event.superseded_id) << " -> "
                      << short_id(event.memory_id) << " (" << event.reason << ")\n";
            return 0;
        case FormationEventType::FAILED:
            break;
    }
    std::cerr << "Error: " << event.reason << "\n";
    return 1;
}

int Application::cmd_forget() {
    if (args_.positional.empty()) {
        std::cerr << "Error: forget requires an id\n";
        return 1;
    }

    if (!args_.has("-f")) {
        MemoryResult<Memory> target = manager_->get_by_prefix(args_.positional[0]);
        if (!target.success) return report_failure(target.code, target.error);
        std::cout << "[" << memory_category_to_string(target.value.category) << "] "
                  << target.value.content << "\n";
        if (!confirm("Forget this memory?")) {
            std::cout << "Cancelled.\n";
            return 0;
        }
    }

    MemoryResult<Memory> r = manager_->forget(args_.positional[0]);
    if (!r.success) return report_failure(r.code, r.error);
    std::cout << "Forgot " << short_id(r.value.id) << "\n";
    return 0;
}

int Application::cmd_stats() {
    MemoryResult<MemoryStats> r = manager_->stats(args_.get("-a"));
    if (!r.success) return report_failure(r.code, r.error);

    std::cout << "Active memories: " << r.value.total << "\n"
              << "  preference: " << r.value.preference << "\n"
              << "  fact:       " << r.value.fact << "\n"
              << "  correction: " << r.value.correction << "\n"
              << "  pattern:    " << r.value.pattern << "\n"
              << "Embedding provider: " << (embedder_ ? embedder_->name() + " (" + embedder_->model() + ")" : "none") << "\n";
    return 0;
}

int Application::cmd_clear() {
    std::string agent = args_.get("-a");

    if (!args_.has("-f")) {
        MemoryResult<int64_t> n = manager_->count(agent);
        if (!n.success) return report_failure(n.code, n.error);
        if (n.value == 0) {
            std::cout << "No memories to clear.\n";
            return 0;
        }
        std::string scope = agent.empty() ? "" : " for " + agent;
        if (!confirm("Forget " + std::to_string(n.value) + " memories" + scope + "?")) {
            std::cout << "Cancelled.\n";
            return 0;
        }
    }

    MemoryResult<int> r = manager_->clear(agent);
    if (!r.success) return report_failure(r.code, r.error);
    std::cout << "Forgot " << r.value << " memories\n";
    return 0;
}

int Application::cmd_history() {
    if (args_.positional.empty()) {
        std::cerr << "Error: history requires an id\n";
        return 1;
    }
    MemoryResult<std::vector<Memory> > r = manager_->history(args_.positional[0]);
    if (!r.success) return report_failure(r.code, r.error);

    for (size_t i = 0; i < r.value.size(); ++i) {
        const Memory& m = r.value[i];
        std::cout << short_id(m.id) << "  " << format_timestamp_ms(m.created_at) << "  "
                  << memory_status_to_string(m.status) << "  " << m.content << "\n";
        if (!m.supersession_reason.empty()) {
            std::cout << "          reason: " << m.supersession_reason << "\n";
        }
    }
    return 0;
}

int Application::cmd_context() {
    std::string query = args_.text();
    if (query.empty()) {
        std::cerr << "Error: context requires a query\n";
        return 1;
    }

    MemoryResult<MemoryContext> r = build_memory_context(*manager_, args_.get("-a"), args_.get("-p"),
                                                         query, memory_config_.context);
    if (!r.success) return report_failure(r.code, r.error);
    if (r.value.empty()) {
        std::cout << "No relevant memories.\n";
        return 0;
    }
    std::cout << r.value.section;
    return 0;
}

} // namespace engram

int main(int argc, char* argv[]) {
    engram::Application& app = engram::Application::instance();

    if (!app.init(argc, argv)) {
        app.shutdown();
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();
    return result;
}
