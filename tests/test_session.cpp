#include <convoflow/core/session.hpp>
#include <convoflow/plugins/scripted/scripted.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>

using namespace convoflow;

namespace {

// Records chunks and calls Session::interrupt() when the trigger chunk shows up
class InterruptingSink : public OutputSink {
public:
    InterruptingSink(ChunkType trigger) : session_(nullptr), trigger_(trigger) {}

    void attach(Session* session) { session_ = session; }

    void emit(const StreamChunk& chunk) override {
        collected_.emit(chunk);
        if (session_ && chunk.type == trigger_) {
            session_->interrupt();
        }
    }

    CollectingSink& collected() { return collected_; }

private:
    Session* session_;
    ChunkType trigger_;
    CollectingSink collected_;
};

SessionConfig unbatched_config() {
    SessionConfig config;
    config.text_batch_chars = 1;
    config.text_batch_ms = 0;
    return config;
}

struct Fixture {
    std::shared_ptr<ScriptedBackend> backend;
    std::shared_ptr<ScriptedBackend> other;
    BackendRegistry registry;
    std::unique_ptr<Session> session;

    explicit Fixture(int64_t window = 200000, const SessionConfig& config = unbatched_config(),
                     std::unique_ptr<InterruptWaiter> waiter = std::unique_ptr<InterruptWaiter>())
        : backend(new ScriptedBackend("scripted", window))
        , other(new ScriptedBackend("other", 8000))
    {
        registry.add(backend);
        registry.add(other);
        session.reset(new Session(registry, "scripted", std::move(waiter), config));
    }
};

// Keyboard that reports ESC once `armed` is set
class EscapeAfterKeyboard : public KeyboardSource {
public:
    explicit EscapeAfterKeyboard(std::atomic<bool>* armed) : armed_(armed), sent_(false) {}

    int poll_key(int timeout_ms) override {
        (void)timeout_ms;
        if (sent_ || !armed_->load()) return -1;
        sent_ = true;
        return KeyboardWaiter::KEY_ESCAPE;
    }

private:
    std::atomic<bool>* armed_;
    bool sent_;
};

// Sets a flag the first time a chunk of the given type is emitted
class ArmingSink : public OutputSink {
public:
    ArmingSink(ChunkType trigger, std::atomic<bool>* armed) : trigger_(trigger), armed_(armed) {}

    void emit(const StreamChunk& chunk) override {
        collected_.emit(chunk);
        if (chunk.type == trigger_) armed_->store(true);
    }

    CollectingSink& collected() { return collected_; }

private:
    ChunkType trigger_;
    std::atomic<bool>* armed_;
    CollectingSink collected_;
};

Script simple_reply(const std::string& text, int64_t input, int64_t output) {
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_usage(UsageUpdate::start(0, input))));
    s.push_back(ScriptStep::emit(BackendEvent::make_text(text)));
    s.push_back(ScriptStep::emit(BackendEvent::make_final(UsageUpdate::delta(0, input, output))));
    return s;
}

size_t terminal_count(const std::vector<StreamChunk>& chunks) {
    size_t n = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].is_terminal()) ++n;
    }
    return n;
}

bool wait_until(std::function<bool()> cond, int timeout_ms = 5000) {
    for (int waited = 0; waited < timeout_ms; waited += 5) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}

} // namespace

// ============================================================================
// Basic prompting
// ============================================================================

TEST(SessionTest, EchoWhenNoScriptQueued) {
    Fixture f;
    CollectingSink sink;

    PromptOutcome outcome = f.session->prompt("hello there", sink);
    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(SessionState::COMPLETED, outcome.state);
    EXPECT_EQ(1, outcome.attempts);
    EXPECT_EQ("Echo: hello there", sink.text());

    std::vector<StreamChunk> chunks = sink.chunks();
    ASSERT_FALSE(chunks.empty());
    EXPECT_EQ(ChunkType::DONE, chunks.back().type);
    EXPECT_EQ(1u, terminal_count(chunks));

    std::vector<FlatMessage> messages = f.session->messages();
    ASSERT_EQ(2u, messages.size());
    EXPECT_EQ("user", messages[0].role);
    EXPECT_EQ("hello there", messages[0].content);
    EXPECT_EQ("assistant", messages[1].role);
    EXPECT_EQ("Echo: hello there", messages[1].content);
    EXPECT_EQ(SessionState::COMPLETED, f.session->state());
    EXPECT_FALSE(f.session->is_streaming());
}

TEST(SessionTest, TurnTokensAccumulateAcrossCalls) {
    Fixture f;
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_usage(UsageUpdate::start(0, 500))));
    s.push_back(ScriptStep::emit(BackendEvent::make_usage(UsageUpdate::delta(0, 500, 50))));
    s.push_back(ScriptStep::emit(BackendEvent::make_text("done")));
    s.push_back(ScriptStep::emit(BackendEvent::make_final(UsageUpdate::delta(1, 520, 80))));
    f.backend->push_script(s);

    int64_t before = f.session->token_tracker().total();
    CollectingSink sink;
    ASSERT_TRUE(f.session->prompt("count tokens", sink).success);

    EXPECT_EQ(before + 1150, f.session->token_tracker().total());
    std::vector<ConversationTurn> turns = f.session->turns();
    ASSERT_EQ(1u, turns.size());
    EXPECT_EQ(1150, turns[0].tokens);

    // The last token update before Done carries the committed totals
    std::vector<StreamChunk> chunks = sink.chunks();
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(ChunkType::TOKEN_UPDATE, chunks[chunks.size() - 2].type);
    EXPECT_EQ(1150, chunks[chunks.size() - 2].tokens.total());
}

TEST(SessionTest, ToolExchangeBecomesPairedHistory) {
    Fixture f;
    Json params = Json::object();
    params["file_path"] = "src/auth.rs";

    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_usage(UsageUpdate::start(0, 100))));
    s.push_back(ScriptStep::emit(BackendEvent::make_text("Let me fix that.")));
    s.push_back(ScriptStep::emit(BackendEvent::make_tool_call(ToolCall("Edit", "c1", params))));
    s.push_back(ScriptStep::emit(BackendEvent::make_tool_result(ToolResult("c1", true, "3 tests passed"))));
    s.push_back(ScriptStep::emit(BackendEvent::make_text("Fixed.")));
    s.push_back(ScriptStep::emit(BackendEvent::make_final(UsageUpdate::delta(0, 100, 30))));
    f.backend->push_script(s);

    CollectingSink sink;
    ASSERT_TRUE(f.session->prompt("Fix the auth bug", sink).success);
    EXPECT_EQ(1u, sink.count(ChunkType::TOOL_CALL));
    EXPECT_EQ(1u, sink.count(ChunkType::TOOL_RESULT));

    std::vector<ConversationMessage> history = f.session->history();
    ASSERT_EQ(4u, history.size());
    EXPECT_EQ(MessageRole::USER, history[0].role);
    EXPECT_EQ(MessageRole::ASSISTANT, history[1].role);
    ASSERT_EQ(2u, history[1].content.size());
    EXPECT_EQ(ContentType::TEXT, history[1].content[0].type);
    EXPECT_EQ(ContentType::TOOL_USE, history[1].content[1].type);
    EXPECT_EQ(MessageRole::USER, history[2].role);
    EXPECT_EQ(ContentType::TOOL_RESULT, history[2].content[0].type);
    EXPECT_EQ("Fixed.", history[3].text());
    EXPECT_EQ(MessageRole::ASSISTANT, history[3].role);

    std::vector<FlatMessage> flat = f.session->messages();
    EXPECT_EQ("[non-text content]", flat[2].content);

    std::vector<ConversationTurn> turns = f.session->turns();
    ASSERT_EQ(1u, turns.size());
    EXPECT_EQ("Fix the auth bug", turns[0].user_message);
    EXPECT_EQ("Let me fix that.Fixed.", turns[0].assistant_response);
    ASSERT_EQ(1u, turns[0].tool_calls.size());
    ASSERT_EQ(1u, turns[0].tool_results.size());
    EXPECT_TRUE(turns[0].tool_results[0].success);
}

TEST(SessionTest, InBandToolErrorMarksResultFailed) {
    Fixture f;
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_tool_call(ToolCall("Bash", "b1", Json::object()))));
    s.push_back(ScriptStep::emit(BackendEvent::make_tool_result(
        ToolResult("b1", true, "{\"success\": false, \"error\": \"permission denied\"}"))));
    s.push_back(ScriptStep::emit(BackendEvent::make_final_without_usage("It failed.")));
    f.backend->push_script(s);

    CollectingSink sink;
    ASSERT_TRUE(f.session->prompt("run it", sink).success);

    std::vector<StreamChunk> chunks = sink.chunks();
    bool saw_failed_result = false;
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].type == ChunkType::TOOL_RESULT) {
            saw_failed_result = !chunks[i].tool_result.success;
        }
    }
    EXPECT_TRUE(saw_failed_result);
    EXPECT_TRUE(f.session->turns()[0].has_failed_result());
}

TEST(SessionTest, OrphanToolResultIsAnError) {
    Fixture f;
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_tool_result(ToolResult("ghost", true, "?"))));
    s.push_back(ScriptStep::emit(BackendEvent::make_final_without_usage("never seen")));
    f.backend->push_script(s);

    CollectingSink sink;
    PromptOutcome outcome = f.session->prompt("hi", sink);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(SessionState::ERRORED, outcome.state);
    EXPECT_NE(std::string::npos, outcome.error.find("has no matching tool call"));

    std::vector<StreamChunk> chunks = sink.chunks();
    ASSERT_FALSE(chunks.empty());
    EXPECT_EQ(ChunkType::ERROR, chunks.back().type);
    EXPECT_EQ(1u, terminal_count(chunks));
    EXPECT_TRUE(f.session->turns().empty());
}

TEST(SessionTest, BackendErrorEndsWithErrorChunk) {
    Fixture f;
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_text("partial")));
    s.push_back(ScriptStep::emit(BackendEvent::make_error("upstream 500")));
    f.backend->push_script(s);

    CollectingSink sink;
    PromptOutcome outcome = f.session->prompt("hi", sink);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ("upstream 500", outcome.error);
    EXPECT_EQ(ChunkType::ERROR, sink.chunks().back().type);
    EXPECT_EQ(0, f.session->token_tracker().total());
}

TEST(SessionTest, ScriptWithoutTerminalEventFails) {
    Fixture f;
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_text("and then nothing")));
    f.backend->push_script(s);

    CollectingSink sink;
    PromptOutcome outcome = f.session->prompt("hi", sink);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ("stream ended without a final response", outcome.error);
    EXPECT_EQ(1u, terminal_count(sink.chunks()));
}

TEST(SessionTest, TextIsBatched) {
    SessionConfig config;
    config.text_batch_chars = 1000;
    config.text_batch_ms = 60000;
    Fixture f(200000, config);

    Script s;
    for (int i = 0; i < 10; ++i) {
        s.push_back(ScriptStep::emit(BackendEvent::make_text("tok ")));
    }
    s.push_back(ScriptStep::emit(BackendEvent::make_final_without_usage()));
    f.backend->push_script(s);

    CollectingSink sink;
    ASSERT_TRUE(f.session->prompt("stream please", sink).success);
    EXPECT_EQ(1u, sink.count(ChunkType::TEXT));
    EXPECT_EQ(std::string("tok tok tok tok tok tok tok tok tok tok "), sink.text());
}

// ============================================================================
// Interrupts
// ============================================================================

TEST(SessionTest, InterruptKeepsPartialResponse) {
    Fixture f;
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_usage(UsageUpdate::start(0, 200))));
    s.push_back(ScriptStep::emit(BackendEvent::make_text("partial answer")));
    s.push_back(ScriptStep::hold());
    f.backend->push_script(s);

    InterruptingSink sink(ChunkType::TEXT);
    sink.attach(f.session.get());
    f.session->queue_input("follow-up question");

    PromptOutcome outcome = f.session->prompt("long question", sink);
    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(SessionState::INTERRUPTED, outcome.state);

    std::vector<StreamChunk> chunks = sink.collected().chunks();
    ASSERT_GE(chunks.size(), 3u);
    EXPECT_EQ(ChunkType::DONE, chunks[chunks.size() - 1].type);
    EXPECT_EQ(ChunkType::INTERRUPTED, chunks[chunks.size() - 2].type);
    ASSERT_EQ(1u, chunks[chunks.size() - 2].queued_inputs.size());
    EXPECT_EQ("follow-up question", chunks[chunks.size() - 2].queued_inputs[0]);
    EXPECT_EQ(ChunkType::TOKEN_UPDATE, chunks[chunks.size() - 3].type);
    EXPECT_EQ(1u, terminal_count(chunks));
    EXPECT_EQ(0u, sink.collected().count(ChunkType::ERROR));

    std::vector<FlatMessage> messages = f.session->messages();
    ASSERT_EQ(2u, messages.size());
    EXPECT_EQ("long question", messages[0].content);
    EXPECT_EQ("partial answer", messages[1].content);

    // Usage seen before the interrupt stays counted
    EXPECT_EQ(200, f.session->token_tracker().input_tokens);
}

TEST(SessionTest, InterruptDropsUnansweredToolCall) {
    Fixture f;
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_tool_call(ToolCall("Bash", "slow", Json::object()))));
    s.push_back(ScriptStep::hold());
    f.backend->push_script(s);

    InterruptingSink sink(ChunkType::TOOL_CALL);
    sink.attach(f.session.get());

    PromptOutcome outcome = f.session->prompt("run the slow thing", sink);
    EXPECT_EQ(SessionState::INTERRUPTED, outcome.state);

    std::vector<ConversationMessage> history = f.session->history();
    ASSERT_EQ(1u, history.size());
    EXPECT_EQ(MessageRole::USER, history[0].role);
    ASSERT_EQ(1u, f.session->turns().size());
    EXPECT_TRUE(f.session->turns()[0].tool_calls.empty());
}

TEST(SessionTest, InterruptFromAnotherThread) {
    Fixture f;
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_text("working")));
    s.push_back(ScriptStep::hold());
    f.backend->push_script(s);

    CollectingSink sink;
    PromptOutcome outcome;
    std::thread runner([&]() { outcome = f.session->prompt("go", sink); });

    ASSERT_TRUE(wait_until([&]() { return sink.count(ChunkType::TEXT) > 0; }));
    EXPECT_TRUE(f.session->is_streaming());
    f.session->interrupt();
    runner.join();

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(SessionState::INTERRUPTED, outcome.state);
    EXPECT_TRUE(f.session->is_interrupted());
    EXPECT_EQ(ChunkType::DONE, sink.chunks().back().type);

    f.session->reset_interrupt();
    EXPECT_FALSE(f.session->is_interrupted());

    // The next prompt works normally
    CollectingSink next;
    ASSERT_TRUE(f.session->prompt("again", next).success);
    EXPECT_EQ("Echo: again", next.text());
}

TEST(SessionTest, InterruptAtAnyMomentEndsThePrompt) {
    Fixture f;
    for (int i = 0; i < 200; ++i) {
        Script s;
        s.push_back(ScriptStep::hold());
        f.backend->push_script(s);

        CollectingSink sink;
        std::atomic<bool> finished(false);
        PromptOutcome outcome;
        std::thread runner([&]() {
            outcome = f.session->prompt("go " + std::to_string(i), sink);
            finished = true;
        });

        ASSERT_TRUE(wait_until([&]() { return f.session->is_streaming() || finished.load(); }));
        std::this_thread::sleep_for(std::chrono::microseconds((i % 10) * 20));
        f.session->interrupt();

        bool returned = wait_until([&]() { return finished.load(); }, 2000);
        if (!returned) {
            // Unstick the loop so the thread can be joined
            f.session->interrupt();
        }
        runner.join();
        ASSERT_TRUE(returned) << "prompt did not return after interrupt, iteration " << i;
        EXPECT_EQ(SessionState::INTERRUPTED, outcome.state);
    }
}

TEST(SessionTest, EscapeKeyInterruptsHoldingStream) {
    std::atomic<bool> armed(false);
    std::unique_ptr<InterruptWaiter> waiter(new KeyboardWaiter(
        std::unique_ptr<KeyboardSource>(new EscapeAfterKeyboard(&armed)), 0, KeyboardWaiter::KEY_ESCAPE, 1));
    Fixture f(200000, unbatched_config(), std::move(waiter));

    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_usage(UsageUpdate::start(0, 120))));
    s.push_back(ScriptStep::emit(BackendEvent::make_text("half of the answer")));
    s.push_back(ScriptStep::hold());
    f.backend->push_script(s);

    ArmingSink sink(ChunkType::TEXT, &armed);
    PromptOutcome outcome = f.session->prompt("explain the build", sink);
    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(SessionState::INTERRUPTED, outcome.state);
    EXPECT_TRUE(f.session->is_interrupted());

    std::vector<StreamChunk> chunks = sink.collected().chunks();
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(ChunkType::INTERRUPTED, chunks[chunks.size() - 2].type);
    EXPECT_EQ(ChunkType::DONE, chunks[chunks.size() - 1].type);
    EXPECT_EQ(1u, terminal_count(chunks));
    EXPECT_EQ(0u, sink.collected().count(ChunkType::ERROR));

    std::vector<FlatMessage> messages = f.session->messages();
    ASSERT_EQ(2u, messages.size());
    EXPECT_EQ("explain the build", messages[0].content);
    EXPECT_EQ("half of the answer", messages[1].content);
    EXPECT_EQ(120, f.session->context_tokens());
}

TEST(SessionTest, OperationsRejectedWhileStreaming) {
    Fixture f;
    Script s;
    s.push_back(ScriptStep::emit(BackendEvent::make_text("busy")));
    s.push_back(ScriptStep::hold());
    f.backend->push_script(s);

    CollectingSink sink;
    std::thread runner([&]() { f.session->prompt("go", sink); });
    ASSERT_TRUE(wait_until([&]() { return sink.count(ChunkType::TEXT) > 0; }));

    SwitchResult sw = f.session->switch_backend("other");
    EXPECT_FALSE(sw.success);
    EXPECT_EQ("cannot switch backend while a response is streaming", sw.error);
    EXPECT_EQ("scripted", f.session->current_backend_name());

    CompactionOutcome co = f.session->compact();
    EXPECT_FALSE(co.success);

    std::string error;
    EXPECT_FALSE(f.session->clear_history(&error));
    EXPECT_FALSE(error.empty());

    RestoreResult rr = f.session->restore_messages(std::vector<Json>());
    EXPECT_FALSE(rr.success);

    f.session->interrupt();
    runner.join();
}

// ============================================================================
// Compaction
// ============================================================================

TEST(SessionTest, CompactWithoutTurnsFails) {
    Fixture f;
    CompactionOutcome outcome = f.session->compact();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ("nothing to compact", outcome.error);
}

TEST(SessionTest, ManualCompactReplacesHistory) {
    Fixture f;
    std::string long_text(2000, 'w');
    for (int i = 0; i < 5; ++i) {
        f.backend->push_script(simple_reply("Answer " + std::to_string(i) + ". " + long_text, 100, 500));
        CollectingSink sink;
        ASSERT_TRUE(f.session->prompt("Question " + std::to_string(i), sink).success);
    }

    CompactionOutcome outcome = f.session->compact();
    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(2u, outcome.turns_summarized);
    EXPECT_EQ(3u, outcome.turns_kept);
    EXPECT_GT(outcome.compression_ratio, 0.0);
    EXPECT_LE(outcome.compression_ratio, 100.0);
    EXPECT_LT(outcome.compacted_tokens, outcome.original_tokens);

    std::vector<FlatMessage> messages = f.session->messages();
    ASSERT_FALSE(messages.empty());
    EXPECT_EQ(CONTINUATION_MESSAGE, messages.back().content);
    EXPECT_EQ(3u, f.session->turns().size());

    // Token state is recomputed from the new history
    TokenTracker t = f.session->token_tracker();
    EXPECT_EQ(estimate_history_tokens(f.session->history()), t.input_tokens);
    EXPECT_EQ(0, t.output_tokens);
}

TEST(SessionTest, CompactionRetryThenSecondBreachFails) {
    SessionConfig config = unbatched_config();
    Fixture f(1000, config);   // threshold 900

    for (int i = 0; i < 4; ++i) {
        f.backend->push_script(simple_reply("Short answer " + std::to_string(i), 100, 10));
        CollectingSink sink;
        ASSERT_TRUE(f.session->prompt("Question " + std::to_string(i), sink).success);
    }
    // Totals add up every request, the context is the latest request alone
    EXPECT_EQ(400, f.session->token_tracker().context_input());
    EXPECT_EQ(100, f.session->context_tokens());

    // First attempt breaches, retry after compaction succeeds
    Script breach;
    breach.push_back(ScriptStep::emit(BackendEvent::make_usage(UsageUpdate::start(0, 950))));
    breach.push_back(ScriptStep::hold());
    f.backend->push_script(breach);
    f.backend->push_script(simple_reply("Retried answer", 50, 5));

    CollectingSink sink;
    PromptOutcome outcome = f.session->prompt("Please summarize everything", sink);
    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(2, outcome.attempts);
    EXPECT_TRUE(outcome.compacted);
    EXPECT_EQ(SessionState::COMPLETED, outcome.state);
    EXPECT_GE(sink.count(ChunkType::STATUS), 2u);
    EXPECT_EQ(1u, terminal_count(sink.chunks()));
    EXPECT_EQ("Retried answer", sink.text());

    std::vector<StreamRequest> requests = f.backend->requests();
    ASSERT_EQ(6u, requests.size());
    const std::vector<ConversationMessage>& retried = requests[5].history;
    ASSERT_GE(retried.size(), 2u);
    EXPECT_EQ("Please summarize everything", retried.back().text());
    EXPECT_EQ(CONTINUATION_MESSAGE, retried[retried.size() - 2].text());

    std::vector<FlatMessage> messages = f.session->messages();
    EXPECT_EQ("Retried answer", messages.back().content);
    EXPECT_EQ("Please summarize everything", messages[messages.size() - 2].content);

    // Now both attempts breach
    Script breach_again;
    breach_again.push_back(ScriptStep::emit(BackendEvent::make_usage(UsageUpdate::start(0, 5000))));
    breach_again.push_back(ScriptStep::hold());
    f.backend->push_script(breach_again);
    f.backend->push_script(breach_again);

    CollectingSink failing;
    PromptOutcome failed = f.session->prompt("One more thing", failing);
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(2, failed.attempts);
    EXPECT_EQ("context window still exceeds threshold after compaction", failed.error);
    EXPECT_EQ(ChunkType::ERROR, failing.chunks().back().type);
    EXPECT_EQ(1u, terminal_count(failing.chunks()));
}

TEST(SessionTest, OversizedContextCompactsBeforePrompt) {
    Fixture f(1000);

    for (int i = 0; i < 3; ++i) {
        f.backend->push_script(simple_reply("ok " + std::to_string(i), 50, 5));
        CollectingSink sink;
        ASSERT_TRUE(f.session->prompt("q" + std::to_string(i), sink).success);
    }

    // Final usage alone pushes the total past the threshold without tripping the hook
    Script big;
    big.push_back(ScriptStep::emit(BackendEvent::make_text("big")));
    big.push_back(ScriptStep::emit(BackendEvent::make_final(UsageUpdate::delta(0, 950, 5))));
    f.backend->push_script(big);
    CollectingSink sink;
    ASSERT_TRUE(f.session->prompt("q3", sink).success);
    EXPECT_EQ(950, f.session->context_tokens());

    CollectingSink next;
    PromptOutcome outcome = f.session->prompt("q4", next);
    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_TRUE(outcome.compacted);
    EXPECT_EQ(1, outcome.attempts);
    ASSERT_FALSE(next.chunks().empty());
    EXPECT_EQ(ChunkType::STATUS, next.chunks().front().type);
}

TEST(SessionTest, RequestsBelowThresholdNeverCompact) {
    Fixture f(1000);   // threshold 900

    for (int i = 0; i < 4; ++i) {
        int64_t input = 300 + 10 * i;
        f.backend->push_script(simple_reply("answer " + std::to_string(i), input, 20));
        CollectingSink sink;
        PromptOutcome outcome = f.session->prompt("question " + std::to_string(i), sink);
        ASSERT_TRUE(outcome.success) << outcome.error;
        EXPECT_FALSE(outcome.compacted) << "prompt " << i;
        EXPECT_EQ(1, outcome.attempts) << "prompt " << i;
        EXPECT_EQ(0u, sink.count(ChunkType::STATUS));
        EXPECT_EQ(input, f.session->context_tokens());
    }

    // Summed over the session the inputs are well past the threshold
    EXPECT_EQ(1260, f.session->token_tracker().input_tokens);
    EXPECT_EQ(4u, f.session->turns().size());
    EXPECT_EQ(4u, f.backend->requests().size());
}

// ============================================================================
// Backends, restore, clear
// ============================================================================

TEST(SessionTest, SwitchBackend) {
    Fixture f;
    EXPECT_EQ("scripted", f.session->current_backend_name());
    EXPECT_EQ(180000, f.session->threshold());

    std::vector<std::string> names = f.session->available_backends();
    ASSERT_EQ(2u, names.size());
    EXPECT_EQ("scripted", names[0]);
    EXPECT_EQ("other", names[1]);

    SwitchResult unknown = f.session->switch_backend("nope");
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ("unknown backend: nope", unknown.error);

    SwitchResult ok = f.session->switch_backend("other");
    ASSERT_TRUE(ok.success);
    EXPECT_EQ("other", f.session->current_backend_name());
    EXPECT_EQ(7200, f.session->threshold());

    CollectingSink sink;
    ASSERT_TRUE(f.session->prompt("hi", sink).success);
    EXPECT_EQ(1, f.other->streams_opened());
    EXPECT_EQ(0, f.backend->streams_opened());
}

TEST(SessionTest, UnknownInitialBackendFallsBackToFirst) {
    std::shared_ptr<ScriptedBackend> only(new ScriptedBackend("only"));
    BackendRegistry registry;
    registry.add(only);
    Session session(registry, "missing", std::unique_ptr<InterruptWaiter>());
    EXPECT_EQ("only", session.current_backend_name());
}

TEST(SessionTest, NoBackendIsAnError) {
    BackendRegistry empty;
    Session session(empty, "x", std::unique_ptr<InterruptWaiter>());
    CollectingSink sink;
    PromptOutcome outcome = session.prompt("hi", sink);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(ChunkType::ERROR, sink.chunks().back().type);
}

TEST(SessionTest, RestoreMessagesDropsUnsupportedRoles) {
    Fixture f;
    CollectingSink warmup;
    ASSERT_TRUE(f.session->prompt("warm up", warmup).success);
    ASSERT_GT(f.session->token_tracker().total(), 0);

    std::vector<Json> envelopes;
    envelopes.push_back(Json::parse(R"({"type":"user","message":{"role":"user","content":"What is 2+2?"}})"));
    envelopes.push_back(Json::parse(R"({"type":"assistant","message":{"role":"assistant","content":[{"type":"thinking","thinking":"hmm"},{"type":"text","text":"4"}]}})"));
    envelopes.push_back(Json::parse(R"({"type":"system","message":{"role":"system","content":"be nice"}})"));
    envelopes.push_back(Json::parse(R"({"role":"tool","content":"ignored"})"));
    envelopes.push_back(Json::parse(R"({"role":"user","content":"And 3+3?"})"));

    RestoreResult result = f.session->restore_messages(envelopes);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(3u, result.restored);
    EXPECT_EQ(2u, result.dropped);
    EXPECT_EQ(2u, result.turns);

    std::vector<FlatMessage> messages = f.session->messages();
    ASSERT_EQ(3u, messages.size());
    EXPECT_EQ("user", messages[0].role);
    EXPECT_EQ("What is 2+2?", messages[0].content);
    EXPECT_EQ("assistant", messages[1].role);
    EXPECT_EQ("4", messages[1].content);
    EXPECT_EQ("And 3+3?", messages[2].content);

    EXPECT_EQ(0, f.session->token_tracker().total());
}

TEST(SessionTest, RestoreRejectsMalformedTranscript) {
    Fixture f;
    std::vector<Json> envelopes;
    envelopes.push_back(Json::parse(R"({"type":"user","message":{"role":"user","content":[{"type":"text","text":5}]}})"));

    RestoreResult result = f.session->restore_messages(envelopes);
    EXPECT_FALSE(result.success);
    EXPECT_NE(std::string::npos, result.error.find("invalid transcript"));
}

TEST(SessionTest, ClearHistory) {
    Fixture f;
    CollectingSink sink;
    ASSERT_TRUE(f.session->prompt("remember this", sink).success);
    ASSERT_FALSE(f.session->messages().empty());

    std::string error;
    ASSERT_TRUE(f.session->clear_history(&error));
    EXPECT_TRUE(f.session->messages().empty());
    EXPECT_TRUE(f.session->turns().empty());
    EXPECT_EQ(0, f.session->token_tracker().total());
    EXPECT_EQ(SessionState::IDLE, f.session->state());
}

TEST(SessionTest, SystemPromptIsSentWithEveryRequest) {
    SessionConfig config = unbatched_config();
    config.system_prompt = "You are terse.";
    Fixture f(200000, config);

    CollectingSink sink;
    ASSERT_TRUE(f.session->prompt("hi", sink).success);
    std::vector<StreamRequest> requests = f.backend->requests();
    ASSERT_EQ(1u, requests.size());
    EXPECT_EQ("You are terse.", requests[0].system_prompt);
    ASSERT_EQ(1u, requests[0].history.size());
    EXPECT_EQ("hi", requests[0].history[0].text());
}
