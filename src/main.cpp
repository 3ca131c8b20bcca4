/*
 * convoflow C++ - Streaming conversation shell
 *
 * Usage:
 *   ./convoflow [--offline] [config.json]
 */
#include <convoflow/cli/application.hpp>

int main(int argc, char* argv[]) {
    convoflow::Application& app = convoflow::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        int code = app.is_running() ? 1 : 0;
        app.shutdown();
        return code;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
