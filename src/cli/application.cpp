/*
 * convoflow C++ - Application Implementation
 */
#include <convoflow/cli/application.hpp>
#include <convoflow/cli/console_sink.hpp>
#include <convoflow/core/interrupt.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/transcript.hpp>
#include <convoflow/core/utils.hpp>
#include <convoflow/plugins/llamacpp/llamacpp.hpp>
#include <convoflow/plugins/scripted/scripted.hpp>

#include <iostream>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <curl/curl.h>

namespace convoflow {

constexpr const char* AppInfo::NAME;
constexpr const char* AppInfo::VERSION;

const char* AppInfo::default_system_prompt() {
    return
        "You are a helpful assistant working with a developer in a terminal. "
        "Keep responses concise unless asked for detail.";
}

// ============================================================================
// Utility Functions
// ============================================================================

static void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - streaming conversation shell with context compaction\n\n"
              << "Usage: " << prog << " [options] [config.json]\n\n"
              << "Options:\n"
              << "  -h, --help       Show this help message\n"
              << "  -v, --version    Show version\n"
              << "  --config <path>  Configuration file (default: config.json)\n"
              << "  --offline        Use the built-in echo backend instead of a server\n";
}

static void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

static std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = getenv("HOME");
    if (!home || home[0] == '\0') return path.substr(1);
    return std::string(home) + path.substr(1);
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().on_interrupt_signal();
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , offline_(false)
    , config_explicit_(false)
    , config_file_("config.json")
    , curl_initialized_(false)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            running_.store(false);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            running_.store(false);
            return false;
        }
        if (strcmp(argv[i], "--offline") == 0) {
            offline_ = true;
            continue;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        if (argv[i][0] != '-') {
            config_file_ = std::string(argv[i]);
            config_explicit_ = true;
            continue;
        }
        std::cerr << "Unknown option: " << argv[i] << "\n";
        print_usage(argv[0]);
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
    if (!isatty(STDERR_FILENO)) {
        Logger::instance().set_colors(false);
    }
}

void Application::setup_backends() {
    std::shared_ptr<ScriptedBackend> offline(new ScriptedBackend("offline"));
    registry_.add(offline);

    std::shared_ptr<LlamaCppBackend> llamacpp(new LlamaCppBackend());
    if (llamacpp->init(config_)) {
        registry_.add(llamacpp);
    } else {
        LOG_WARN("llama.cpp backend not available, check the llamacpp section of %s",
                 config_file_.c_str());
    }

    LOG_INFO("Registered %zu backend(s): %s", registry_.size(), join(registry_.names(), ", ").c_str());
}

void Application::setup_session() {
    SessionConfig session_config = SessionConfig::from_config(config_);
    if (session_config.system_prompt.empty()) {
        session_config.system_prompt = AppInfo::default_system_prompt();
    }

    std::string backend = offline_ ? "offline" : config_.get_string("session.backend", "llamacpp");

    std::unique_ptr<InterruptWaiter> waiter;
    if (isatty(STDIN_FILENO)) {
        std::unique_ptr<KeyboardSource> keys(new TerminalKeyboard());
        waiter.reset(new KeyboardWaiter(std::move(keys), config_.get_int("session.tick_ms", 1000)));
    } else {
        waiter.reset(new HostWakeWaiter());
    }
    LOG_DEBUG("Interrupt substrate: %s", waiter->name());

    session_.reset(new Session(registry_, backend, std::move(waiter), session_config));
    LOG_INFO("Session %s on backend '%s' (compaction at %lld tokens)",
             session_->id().c_str(), session_->current_backend_name().c_str(),
             static_cast<long long>(session_->threshold()));
}

void Application::setup_store() {
    std::string path = expand_home(config_.get_string("store.path", "~/.convoflow/sessions.db"));
    if (!store_.open(path)) {
        LOG_WARN("Session store unavailable (%s); /save and /load are disabled",
                 store_.last_error().c_str());
    }
}

bool Application::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before threads start)
    if (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) {
        curl_initialized_ = true;
    } else {
        LOG_ERROR("curl_global_init failed");
        return false;
    }

    if (!parse_args(argc, argv)) {
        return false;
    }

    std::string error;
    if (!config_.load_file(config_file_, &error)) {
        if (config_explicit_) {
            LOG_ERROR("Failed to load config from %s: %s", config_file_.c_str(), error.c_str());
            return false;
        }
        LOG_WARN("No config at %s, using defaults", config_file_.c_str());
    } else {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }

    setup_logging();
    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    setup_backends();
    setup_session();
    setup_store();

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    return true;
}

void Application::on_interrupt_signal() {
    if (session_ && session_->is_streaming()) {
        session_->interrupt();
    } else {
        stop();
    }
}

int Application::run() {
    ConsoleSink sink(stdout, isatty(STDOUT_FILENO) != 0);
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION
              << " - backend '" << session_->current_backend_name()
              << "'. Type /help for commands, ESC cancels a response.\n";

    std::string line;
    while (running_.load()) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        line = trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (!handle_command(line)) {
                std::cout << "Unknown command: " << line << " (try /help)\n";
            }
            continue;
        }
        run_prompt(line, sink);
    }
    std::cout << "\n";
    return 0;
}

void Application::run_prompt(const std::string& text, ConsoleSink& sink) {
    session_->reset_interrupt();
    sink.begin_prompt(session_->token_tracker(), session_->context_tokens());

    PromptOutcome outcome = session_->prompt(text, sink);
    if (outcome.compacted) {
        LOG_INFO("History was compacted during this response (%d stream(s))", outcome.attempts);
    }
    if (!outcome.success) {
        LOG_DEBUG("Prompt ended in state %s: %s", session_state_name(outcome.state), outcome.error.c_str());
    }
}

bool Application::handle_command(const std::string& line) {
    std::string cmd = line;
    std::string arg;
    size_t space = line.find(' ');
    if (space != std::string::npos) {
        cmd = line.substr(0, space);
        arg = trim(line.substr(space + 1));
    }

    if (cmd == "/quit" || cmd == "/exit") {
        stop();
    } else if (cmd == "/help") {
        print_help();
    } else if (cmd == "/compact") {
        cmd_compact();
    } else if (cmd == "/backend") {
        cmd_backend(arg);
    } else if (cmd == "/backends") {
        cmd_backends();
    } else if (cmd == "/tokens") {
        cmd_tokens();
    } else if (cmd == "/clear") {
        cmd_clear();
    } else if (cmd == "/save") {
        cmd_save(arg);
    } else if (cmd == "/load") {
        cmd_load(arg);
    } else if (cmd == "/sessions") {
        cmd_sessions();
    } else {
        return false;
    }
    return true;
}

void Application::print_help() {
    std::cout << "Commands:\n"
              << "  /compact          Summarize older turns now\n"
              << "  /backend <name>   Switch backend\n"
              << "  /backends         List backends\n"
              << "  /tokens           Show token usage\n"
              << "  /clear            Forget the conversation\n"
              << "  /save <id>        Save the conversation\n"
              << "  /load <id>        Restore a saved conversation\n"
              << "  /sessions         List saved conversations\n"
              << "  /quit             Exit\n";
}

void Application::cmd_compact() {
    CompactionOutcome outcome = session_->compact();
    if (!outcome.success) {
        std::cout << "Compaction failed: " << outcome.error << "\n";
        return;
    }
    printf("Compacted %zu turn(s), kept %zu: %lld -> %lld tokens (%.1f%% saved)\n",
           outcome.turns_summarized, outcome.turns_kept,
           static_cast<long long>(outcome.original_tokens),
           static_cast<long long>(outcome.compacted_tokens),
           outcome.compression_ratio);
    for (size_t i = 0; i < outcome.warnings.size(); ++i) {
        std::cout << "Warning: " << outcome.warnings[i] << "\n";
    }
}

void Application::cmd_backend(const std::string& name) {
    if (name.empty()) {
        std::cout << "Current backend: " << session_->current_backend_name() << "\n";
        return;
    }
    SwitchResult result = session_->switch_backend(name);
    if (result.success) {
        std::cout << "Switched to " << name << " (compaction at " << session_->threshold() << " tokens)\n";
    } else {
        std::cout << "Cannot switch: " << result.error << "\n";
    }
}

void Application::cmd_backends() {
    std::string current = session_->current_backend_name();
    std::vector<std::string> names = session_->available_backends();
    for (size_t i = 0; i < names.size(); ++i) {
        std::cout << (names[i] == current ? " * " : "   ") << names[i] << "\n";
    }
}

void Application::cmd_tokens() {
    TokenTracker t = session_->token_tracker();
    printf("input %lld, output %lld, cache read %lld, cache creation %lld (total %lld)\n",
           static_cast<long long>(t.input_tokens), static_cast<long long>(t.output_tokens),
           static_cast<long long>(t.cache_read_input_tokens),
           static_cast<long long>(t.cache_creation_input_tokens),
           static_cast<long long>(t.total()));
    printf("context %lld of %lld before compaction\n",
           static_cast<long long>(session_->context_tokens()),
           static_cast<long long>(session_->threshold()));
}

void Application::cmd_clear() {
    std::string error;
    if (session_->clear_history(&error)) {
        std::cout << "Conversation cleared.\n";
    } else {
        std::cout << "Cannot clear: " << error << "\n";
    }
}

void Application::cmd_save(const std::string& id) {
    if (!store_.is_open()) {
        std::cout << "Session store is not available.\n";
        return;
    }
    std::string key = id.empty() ? session_->id() : id;
    std::vector<Json> envelopes = messages_to_envelopes(session_->history());
    Json array = Json::array();
    for (size_t i = 0; i < envelopes.size(); ++i) {
        array.push_back(envelopes[i]);
    }
    if (store_.save(key, session_->current_backend_name(), array)) {
        std::cout << "Saved " << envelopes.size() << " message(s) as '" << key << "'\n";
    } else {
        std::cout << "Save failed: " << store_.last_error() << "\n";
    }
}

void Application::cmd_load(const std::string& id) {
    if (!store_.is_open()) {
        std::cout << "Session store is not available.\n";
        return;
    }
    if (id.empty()) {
        std::cout << "Usage: /load <id>\n";
        return;
    }

    SavedSession saved;
    if (!store_.load(id, saved)) {
        std::cout << "Load failed: " << store_.last_error() << "\n";
        return;
    }

    std::vector<Json> envelopes;
    for (size_t i = 0; i < saved.envelopes.size(); ++i) {
        envelopes.push_back(saved.envelopes[i]);
    }
    RestoreResult result = session_->restore_messages(envelopes);
    if (!result.success) {
        std::cout << "Restore failed: " << result.error << "\n";
        return;
    }
    std::cout << "Restored " << result.restored << " message(s) (" << result.turns << " turn(s))";
    if (result.dropped > 0) {
        std::cout << ", dropped " << result.dropped;
    }
    std::cout << "\n";
}

void Application::cmd_sessions() {
    if (!store_.is_open()) {
        std::cout << "Session store is not available.\n";
        return;
    }
    std::vector<SessionSummary> sessions = store_.list();
    if (sessions.empty()) {
        std::cout << "No saved sessions.\n";
        return;
    }
    for (size_t i = 0; i < sessions.size(); ++i) {
        std::cout << "  " << sessions[i].id << "  " << sessions[i].message_count << " message(s)  "
                  << sessions[i].backend << "  " << format_timestamp_ms(sessions[i].updated_at) << "\n";
    }
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");
    session_.reset();
    store_.close();

    if (curl_initialized_) {
        curl_global_cleanup();
        curl_initialized_ = false;
    }
    LOG_INFO("Goodbye!");
}

} // namespace convoflow
