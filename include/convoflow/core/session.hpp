/*
 * convoflow C++ - Session
 *
 * Owns one conversation: message history, completed turns, the token
 * ledger, the active backend and the interrupt flag.
 *
 * prompt() streams one answer into an OutputSink:
 *
 *   Idle -> Streaming -> Completed | Interrupted | CompactionTriggered | Errored
 *
 * While streaming, the loop checks the interrupt flag before every event,
 * and blocks in the InterruptWaiter when the stream has nothing ready. When
 * the compaction hook cancels the stream, the history is compacted and the
 * prompt is retried once on the shorter history.
 *
 * Locking: mutex_ is held for the whole of prompt() and for the other
 * mutating operations; state_mutex_ only guards messages_/turns_ for short
 * reads and commits, so sink callbacks may call the accessors.
 */
#ifndef convoflow_CORE_SESSION_HPP
#define convoflow_CORE_SESSION_HPP

#include <convoflow/ai/ai.hpp>
#include <convoflow/core/chunk.hpp>
#include <convoflow/core/compactor.hpp>
#include <convoflow/core/interrupt.hpp>
#include <convoflow/core/token_tracker.hpp>
#include <convoflow/core/wake.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace convoflow {

class Config;

// ============================================================================
// Session configuration and results
// ============================================================================

struct SessionConfig {
    double threshold_ratio;          // Fraction of the context window that triggers compaction
    size_t text_batch_chars;         // BatchingSink size limit
    int64_t text_batch_ms;           // BatchingSink age limit
    std::string system_prompt;
    CompactorConfig compactor;

    SessionConfig()
        : threshold_ratio(0.9)
        , text_batch_chars(64)
        , text_batch_ms(50) {}

    static SessionConfig from_config(const Config& cfg);
};

enum class SessionState {
    IDLE,
    STREAMING,
    COMPLETED,
    INTERRUPTED,
    COMPACTION_TRIGGERED,
    ERRORED
};

const char* session_state_name(SessionState state);

struct PromptOutcome {
    bool success;
    std::string error;
    SessionState state;
    int attempts;                    // streams opened (2 after a compaction retry)
    bool compacted;

    PromptOutcome() : success(false), state(SessionState::IDLE), attempts(0), compacted(false) {}

    static PromptOutcome ok(SessionState state) {
        PromptOutcome o;
        o.success = true;
        o.state = state;
        return o;
    }
    static PromptOutcome fail(const std::string& err) {
        PromptOutcome o;
        o.success = false;
        o.error = err;
        o.state = SessionState::ERRORED;
        return o;
    }
};

struct CompactionOutcome {
    bool success;
    std::string error;
    int64_t original_tokens;
    int64_t compacted_tokens;
    double compression_ratio;        // percent, 0-100
    size_t turns_summarized;
    size_t turns_kept;
    std::vector<std::string> warnings;

    CompactionOutcome()
        : success(false)
        , original_tokens(0)
        , compacted_tokens(0)
        , compression_ratio(0.0)
        , turns_summarized(0)
        , turns_kept(0) {}

    static CompactionOutcome fail(const std::string& err) {
        CompactionOutcome o;
        o.error = err;
        return o;
    }
};

struct SwitchResult {
    bool success;
    std::string error;

    SwitchResult() : success(false) {}

    static SwitchResult ok() {
        SwitchResult r;
        r.success = true;
        return r;
    }
    static SwitchResult fail(const std::string& err) {
        SwitchResult r;
        r.error = err;
        return r;
    }
};

struct RestoreResult {
    bool success;
    std::string error;
    size_t restored;
    size_t dropped;
    size_t turns;

    RestoreResult() : success(false), restored(0), dropped(0), turns(0) {}

    static RestoreResult fail(const std::string& err) {
        RestoreResult r;
        r.error = err;
        return r;
    }
};

// Role/text view of one history message
struct FlatMessage {
    std::string role;
    std::string content;
};

// ============================================================================
// Backend registry
// ============================================================================

class BackendRegistry {
public:
    // A later adapter with the same name replaces the earlier one.
    void add(std::shared_ptr<BackendAdapter> adapter);

    std::shared_ptr<BackendAdapter> find(const std::string& name) const;

    // Registration order
    std::vector<std::string> names() const;

    bool empty() const { return adapters_.empty(); }
    size_t size() const { return adapters_.size(); }

private:
    std::vector<std::shared_ptr<BackendAdapter>> adapters_;
};

// ============================================================================
// Session
// ============================================================================

class Session {
public:
    // Falls back to the first registered backend when `initial_backend` is unknown.
    Session(const BackendRegistry& registry,
            const std::string& initial_backend,
            std::unique_ptr<InterruptWaiter> waiter,
            const SessionConfig& config = SessionConfig());
    ~Session();

    PromptOutcome prompt(const std::string& input, OutputSink& sink);

    void interrupt();
    void reset_interrupt();
    bool is_interrupted() const { return interrupted_.load(); }

    // Input typed while a response streams; handed back in the Interrupted chunk.
    void queue_input(const std::string& text);

    CompactionOutcome compact();

    SwitchResult switch_backend(const std::string& name);
    std::string current_backend_name() const;
    std::vector<std::string> available_backends() const;

    RestoreResult restore_messages(const std::vector<Json>& envelopes);
    bool clear_history(std::string* error = nullptr);

    // Totals summed over every backend call
    TokenTracker token_tracker() const;
    // Input side of the latest backend call; compared against threshold()
    int64_t context_tokens() const;
    std::vector<FlatMessage> messages() const;
    std::vector<ConversationMessage> history() const;
    std::vector<ConversationTurn> turns() const;

    bool is_streaming() const { return streaming_.load(); }
    SessionState state() const { return state_.load(); }
    int64_t threshold() const;
    const std::string& id() const { return id_; }
    const SessionConfig& config() const { return config_; }

private:
    enum class StreamOutcome {
        COMPLETED,
        INTERRUPTED,
        COMPACTION,
        FAILED
    };

    StreamOutcome run_stream(const std::string& input, int64_t threshold, OutputSink& out,
                             std::string& error);

    // Compacts turns_/messages_ and resets the ledger. Caller holds mutex_.
    CompactionResult compact_locked();

    void commit_turn(const ConversationTurn& turn, const std::vector<ConversationMessage>& messages);
    std::vector<std::string> drain_queued_inputs();

    Session(const Session&);
    Session& operator=(const Session&);

    std::string id_;
    SessionConfig config_;
    BackendRegistry registry_;
    std::shared_ptr<BackendAdapter> backend_;
    std::unique_ptr<BackendAgent> agent_;
    std::unique_ptr<InterruptWaiter> waiter_;
    Compactor compactor_;
    std::shared_ptr<TokenLedger> ledger_;
    WakeSignal wake_;

    std::mutex mutex_;
    mutable std::mutex state_mutex_;
    std::vector<ConversationMessage> messages_;
    std::vector<ConversationTurn> turns_;

    std::mutex queue_mutex_;
    std::vector<std::string> queued_inputs_;

    std::atomic<bool> interrupted_;
    std::atomic<bool> streaming_;
    std::atomic<SessionState> state_;
};

} // namespace convoflow

#endif // convoflow_CORE_SESSION_HPP
