#include <convoflow/plugins/scripted/scripted.hpp>
#include <convoflow/ai/queued_stream.hpp>
#include <convoflow/core/compaction_hook.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/token_tracker.hpp>
#include <convoflow/core/wake.hpp>

#include <thread>

namespace convoflow {

// ============================================================================
// ScriptedStream
// ============================================================================

namespace {

class ScriptedStream : public QueuedAgentStream {
public:
    ScriptedStream(const Script& script, int64_t estimated_input, CompactionHook* hook, WakeSignal& wake)
        : QueuedAgentStream(wake)
        , script_(script)
        , estimated_input_(estimated_input)
        , hook_(hook)
    {
        thread_ = std::thread(&ScriptedStream::produce, this);
    }

    ~ScriptedStream() override {
        stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void produce() {
        if (hook_ && !hook_->allow_request(estimated_input_)) {
            deliver(BackendEvent::make_error("request would exceed the context threshold",
                                             CancelReason::COMPACTION));
            mark_done();
            return;
        }

        for (size_t i = 0; i < script_.size(); ++i) {
            const ScriptStep& step = script_[i];
            if (step.delay_ms > 0 && wait_cancelled(step.delay_ms)) break;
            if (step.hold_until_cancel) {
                wait_cancelled(-1);
                break;
            }
            if (!deliver(step.event) || step.event.is_terminal()) break;
        }
        mark_done();
    }

    Script script_;
    int64_t estimated_input_;
    CompactionHook* hook_;
    std::thread thread_;
};

class ScriptedAgent : public BackendAgent {
public:
    explicit ScriptedAgent(std::shared_ptr<ScriptQueue> queue) : queue_(queue) {}

    std::unique_ptr<AgentStream> stream(const StreamRequest& request,
                                        CompactionHook* hook,
                                        WakeSignal& wake) override {
        Script script;
        int stream_no;
        {
            std::lock_guard<std::mutex> lock(queue_->mutex);
            stream_no = ++queue_->streams_opened;
            queue_->requests.push_back(request);
            if (!queue_->scripts.empty()) {
                script = queue_->scripts.front();
                queue_->scripts.pop_front();
            }
        }
        if (script.empty()) {
            script = make_echo_script(request);
        }
        LOG_DEBUG("[Scripted] Stream %d: %zu step(s), %zu message(s) of history",
                  stream_no, script.size(), request.history.size());

        int64_t estimate = estimate_history_tokens(request.history) + estimate_tokens(request.system_prompt);
        return std::unique_ptr<AgentStream>(new ScriptedStream(script, estimate, hook, wake));
    }

private:
    std::shared_ptr<ScriptQueue> queue_;
};

} // namespace

// ============================================================================
// ScriptedBackend
// ============================================================================

ScriptedBackend::ScriptedBackend(const std::string& name, int64_t context_window)
    : name_(name)
    , context_window_(context_window)
    , queue_(std::make_shared<ScriptQueue>())
{}

std::unique_ptr<BackendAgent> ScriptedBackend::create_agent() {
    return std::unique_ptr<BackendAgent>(new ScriptedAgent(queue_));
}

void ScriptedBackend::push_script(const Script& script) {
    std::lock_guard<std::mutex> lock(queue_->mutex);
    queue_->scripts.push_back(script);
}

size_t ScriptedBackend::pending_scripts() const {
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->scripts.size();
}

int ScriptedBackend::streams_opened() const {
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->streams_opened;
}

std::vector<StreamRequest> ScriptedBackend::requests() const {
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->requests;
}

Script make_echo_script(const StreamRequest& request) {
    std::string prompt;
    if (!request.history.empty()) {
        prompt = request.history.back().text();
    }
    std::string reply = "Echo: " + prompt;
    int64_t input = estimate_history_tokens(request.history) + estimate_tokens(request.system_prompt);
    int64_t output = estimate_tokens(reply);

    Script script;
    script.push_back(ScriptStep::emit(BackendEvent::make_usage(UsageUpdate::start(0, input))));
    script.push_back(ScriptStep::emit(BackendEvent::make_text(reply)));
    script.push_back(ScriptStep::emit(BackendEvent::make_final(UsageUpdate::delta(0, input, output))));
    return script;
}

} // namespace convoflow
