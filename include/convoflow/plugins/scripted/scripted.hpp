/*
 * convoflow C++ - Scripted backend
 *
 * Replays prepared event sequences instead of calling a model. Each opened
 * stream takes the next script from the queue; with the queue empty it
 * echoes the prompt back. Events are produced on the stream's own thread
 * with optional delays, so the session loop sees them arrive the same way
 * it would from a network backend.
 *
 * Used by the test suite and by the CLI's offline mode.
 */
#ifndef convoflow_PLUGINS_SCRIPTED_HPP
#define convoflow_PLUGINS_SCRIPTED_HPP

#include <convoflow/ai/ai.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace convoflow {

struct ScriptStep {
    BackendEvent event;
    int delay_ms;               // wait before producing the event
    bool hold_until_cancel;     // produce nothing, block until the stream is cancelled

    ScriptStep() : delay_ms(0), hold_until_cancel(false) {}

    static ScriptStep emit(const BackendEvent& event, int delay_ms = 0) {
        ScriptStep s;
        s.event = event;
        s.delay_ms = delay_ms;
        return s;
    }
    static ScriptStep hold() {
        ScriptStep s;
        s.hold_until_cancel = true;
        return s;
    }
};

typedef std::vector<ScriptStep> Script;

// Shared by the adapter and every agent it creates
struct ScriptQueue {
    std::mutex mutex;
    std::deque<Script> scripts;
    std::vector<StreamRequest> requests;
    int streams_opened;

    ScriptQueue() : streams_opened(0) {}
};

class ScriptedBackend : public BackendAdapter {
public:
    ScriptedBackend(const std::string& name = "scripted", int64_t context_window = 200000);

    std::string name() const override { return name_; }
    int64_t context_window() const override { return context_window_; }
    std::unique_ptr<BackendAgent> create_agent() override;

    void push_script(const Script& script);
    size_t pending_scripts() const;

    int streams_opened() const;
    std::vector<StreamRequest> requests() const;

private:
    std::string name_;
    int64_t context_window_;
    std::shared_ptr<ScriptQueue> queue_;
};

// Echo reply used when no script is queued.
Script make_echo_script(const StreamRequest& request);

} // namespace convoflow

#endif // convoflow_PLUGINS_SCRIPTED_HPP
