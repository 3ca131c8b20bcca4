/*
 * convoflow C++ - Application
 *
 * Interactive front end: loads the config, registers backends, owns the
 * Session and the SessionStore and runs the read-prompt loop.
 */
#ifndef convoflow_CLI_APPLICATION_HPP
#define convoflow_CLI_APPLICATION_HPP

#include <convoflow/core/config.hpp>
#include <convoflow/core/session.hpp>
#include <convoflow/store/session_store.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace convoflow {

struct AppInfo {
    static constexpr const char* NAME = "convoflow";
    static constexpr const char* VERSION = "0.3.0";

    static const char* default_system_prompt();
};

class ConsoleSink;

class Application {
public:
    static Application& instance();

    // False for --help/--version or fatal errors; is_running() tells which.
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    void stop() { running_.store(false); }
    bool is_running() const { return running_.load(); }

    // SIGINT: cancels the response in flight, or quits when idle.
    void on_interrupt_signal();

    Config& config() { return config_; }
    Session* session() { return session_.get(); }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    void setup_backends();
    void setup_session();
    void setup_store();

    // True if the line was a command
    bool handle_command(const std::string& line);
    void run_prompt(const std::string& text, ConsoleSink& sink);

    void cmd_compact();
    void cmd_backend(const std::string& name);
    void cmd_backends();
    void cmd_tokens();
    void cmd_clear();
    void cmd_save(const std::string& id);
    void cmd_load(const std::string& id);
    void cmd_sessions();
    void print_help();

    std::atomic<bool> running_;
    bool offline_;
    bool config_explicit_;
    std::string config_file_;

    Config config_;
    BackendRegistry registry_;
    std::unique_ptr<Session> session_;
    SessionStore store_;
    bool curl_initialized_;
};

} // namespace convoflow

#endif // convoflow_CLI_APPLICATION_HPP
