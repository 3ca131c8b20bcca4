/*
 * convoflow C++ - Token accounting
 *
 *   TokenTracker          - session-cumulative counters (a plain value)
 *   TurnTokenAccumulator  - per-turn accumulation across several backend calls
 *   TokenLedger           - tracker + accumulator behind one short-held mutex,
 *                           shared by the session loop and the compaction hook
 *   OutputTokenTracker    - display counter for streamed output tokens
 */
#ifndef convoflow_CORE_TOKEN_TRACKER_HPP
#define convoflow_CORE_TOKEN_TRACKER_HPP

#include <convoflow/ai/ai.hpp>
#include <convoflow/core/json.hpp>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

namespace convoflow {

struct TokenTracker {
    int64_t input_tokens;
    int64_t output_tokens;
    int64_t cache_read_input_tokens;
    int64_t cache_creation_input_tokens;

    TokenTracker()
        : input_tokens(0)
        , output_tokens(0)
        , cache_read_input_tokens(0)
        , cache_creation_input_tokens(0) {}

    // input + output + cache_read + cache_creation
    int64_t total() const;

    // Input side including cache, which is what counts against the window
    int64_t context_input() const;

    // input - 90% of cache reads (cached prefix is billed at a discount)
    int64_t effective_tokens() const;

    void add(const TokenTracker& other);

    bool operator==(const TokenTracker& o) const {
        return input_tokens == o.input_tokens && output_tokens == o.output_tokens &&
               cache_read_input_tokens == o.cache_read_input_tokens &&
               cache_creation_input_tokens == o.cache_creation_input_tokens;
    }
    bool operator!=(const TokenTracker& o) const { return !(*this == o); }

    Json to_json() const;
};

// ceil(chars / 4)
int64_t estimate_tokens(const std::string& text);
int64_t estimate_message_tokens(const ConversationMessage& message);
int64_t estimate_history_tokens(const std::vector<ConversationMessage>& history);

// Token count at which compaction must run: context_window * ratio (ratio clamped to (0, 1]).
int64_t compaction_threshold(int64_t context_window, double ratio);

// ============================================================================
// TurnTokenAccumulator
//
// One user turn may issue several backend calls (tool loops). Each call is
// opened by a CALL_START update and grows through DELTA updates; it is
// committed into the turn total only when the next call starts or the turn
// finalizes.
// ============================================================================

class TurnTokenAccumulator {
public:
    TurnTokenAccumulator();

    void reset();

    void apply(const UsageUpdate& usage);

    // Final usage of the call `usage.call_index`. Updates the open call if it
    // is the same call, otherwise commits it and records the final call on
    // its own. Leaves nothing open.
    void apply_final(const UsageUpdate& usage);

    // Commit whatever call is open.
    void finalize();

    // committed + open call
    TokenTracker totals() const;
    const TokenTracker& committed() const { return committed_; }
    bool has_open_call() const { return call_open_; }

    // Running counts of the most recent call, open or committed
    const TokenTracker& latest_call() const { return latest_; }
    bool has_calls() const { return has_latest_; }

private:
    void open_call(const UsageUpdate& usage);
    void commit_open_call();

    TokenTracker committed_;
    TokenTracker open_;
    TokenTracker latest_;
    int open_call_index_;
    bool call_open_;
    bool has_latest_;
};

// ============================================================================
// TokenLedger
//
// Two views of the same usage stream. cumulative() sums every call and is
// what the TokenUpdate chunks report. current_context() is the input side of
// the latest call only: each request already carries the whole conversation,
// so that single value is the context size and is what compaction compares.
// ============================================================================

class TokenLedger {
public:
    TokenLedger();

    // Start accounting a new turn on top of the current base.
    void begin_turn();

    // Apply a usage update; returns the cumulative snapshot (base + turn).
    // `current_context` receives the context size after the update.
    TokenTracker apply(const UsageUpdate& usage, int64_t* current_context = nullptr);

    // Commit the turn (optionally with final usage) into the base.
    // Returns the new cumulative snapshot; `turn_total` receives the turn's own total.
    TokenTracker commit_turn(const UsageUpdate* final_usage, int64_t* turn_total = nullptr);

    // Forget the in-flight turn; the base and the context size from before
    // the turn are kept.
    void discard_turn();

    // Replace the base (compaction, restore, clear) and drop the in-flight turn.
    // The context size restarts at the base's input side.
    void reset(const TokenTracker& base);

    TokenTracker cumulative() const;
    TokenTracker base() const;
    int64_t current_context() const;

private:
    mutable std::mutex mutex_;
    TokenTracker base_;
    TurnTokenAccumulator turn_;
    int64_t current_context_;
    int64_t turn_start_context_;
};

// ============================================================================
// OutputTokenTracker
//
// Output tokens shown while streaming. Within one API segment an estimate
// (from streamed characters) is shown until the backend's authoritative
// count arrives; segments are summed into a cumulative base so the display
// never goes backwards when a tool loop starts a new call.
// ============================================================================

class OutputTokenTracker {
public:
    OutputTokenTracker();

    void add_streamed_text(const std::string& text);
    void set_authoritative(int64_t output_tokens);
    void start_new_segment();
    void reset();

    int64_t display_tokens() const;
    int64_t cumulative_base() const { return cumulative_base_; }

private:
    int64_t segment_value() const;

    size_t segment_chars_;
    int64_t estimated_;
    int64_t authoritative_;
    int64_t cumulative_base_;
};

} // namespace convoflow

#endif // convoflow_CORE_TOKEN_TRACKER_HPP
