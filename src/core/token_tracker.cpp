#include <convoflow/core/token_tracker.hpp>

#include <algorithm>

namespace convoflow {

// ============================================================================
// TokenTracker
// ============================================================================

int64_t TokenTracker::total() const {
    return input_tokens + output_tokens + cache_read_input_tokens + cache_creation_input_tokens;
}

int64_t TokenTracker::context_input() const {
    return input_tokens + cache_read_input_tokens + cache_creation_input_tokens;
}

int64_t TokenTracker::effective_tokens() const {
    int64_t discount = static_cast<int64_t>(static_cast<double>(cache_read_input_tokens) * 0.9);
    return std::max<int64_t>(0, input_tokens - discount);
}

void TokenTracker::add(const TokenTracker& other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    cache_read_input_tokens += other.cache_read_input_tokens;
    cache_creation_input_tokens += other.cache_creation_input_tokens;
}

Json TokenTracker::to_json() const {
    Json j = Json::object();
    j["input_tokens"] = input_tokens;
    j["output_tokens"] = output_tokens;
    j["cache_read_input_tokens"] = cache_read_input_tokens;
    j["cache_creation_input_tokens"] = cache_creation_input_tokens;
    j["total_tokens"] = total();
    return j;
}

int64_t estimate_tokens(const std::string& text) {
    return static_cast<int64_t>((text.size() + 3) / 4);
}

int64_t estimate_message_tokens(const ConversationMessage& message) {
    return static_cast<int64_t>((message.char_count() + 3) / 4);
}

int64_t estimate_history_tokens(const std::vector<ConversationMessage>& history) {
    int64_t total = 0;
    for (size_t i = 0; i < history.size(); ++i) {
        total += estimate_message_tokens(history[i]);
    }
    return total;
}

int64_t compaction_threshold(int64_t context_window, double ratio) {
    if (context_window <= 0) return 0;
    if (ratio <= 0.0 || ratio > 1.0) ratio = 1.0;
    return static_cast<int64_t>(static_cast<double>(context_window) * ratio);
}

// ============================================================================
// TurnTokenAccumulator
// ============================================================================

TurnTokenAccumulator::TurnTokenAccumulator()
    : open_call_index_(-1)
    , call_open_(false)
    , has_latest_(false)
{}

void TurnTokenAccumulator::reset() {
    committed_ = TokenTracker();
    open_ = TokenTracker();
    latest_ = TokenTracker();
    open_call_index_ = -1;
    call_open_ = false;
    has_latest_ = false;
}

void TurnTokenAccumulator::open_call(const UsageUpdate& usage) {
    open_ = TokenTracker();
    open_.input_tokens = usage.input_tokens;
    open_.output_tokens = usage.output_tokens;
    open_.cache_read_input_tokens = usage.cache_read_tokens;
    open_.cache_creation_input_tokens = usage.cache_creation_tokens;
    open_call_index_ = usage.call_index;
    call_open_ = true;
    latest_ = open_;
    has_latest_ = true;
}

void TurnTokenAccumulator::commit_open_call() {
    if (!call_open_) return;
    committed_.add(open_);
    open_ = TokenTracker();
    open_call_index_ = -1;
    call_open_ = false;
}

static void merge_running(TokenTracker& call, const UsageUpdate& usage) {
    // Running counts within one call only grow
    call.input_tokens = std::max(call.input_tokens, usage.input_tokens);
    call.output_tokens = std::max(call.output_tokens, usage.output_tokens);
    call.cache_read_input_tokens = std::max(call.cache_read_input_tokens, usage.cache_read_tokens);
    call.cache_creation_input_tokens = std::max(call.cache_creation_input_tokens, usage.cache_creation_tokens);
}

void TurnTokenAccumulator::apply(const UsageUpdate& usage) {
    if (usage.phase == UsagePhase::CALL_START) {
        commit_open_call();
        open_call(usage);
        return;
    }

    if (!call_open_ || usage.call_index != open_call_index_) {
        // Delta for a call whose start was not reported
        commit_open_call();
        open_call(usage);
        return;
    }
    merge_running(open_, usage);
    latest_ = open_;
}

void TurnTokenAccumulator::apply_final(const UsageUpdate& usage) {
    if (call_open_ && usage.call_index == open_call_index_) {
        merge_running(open_, usage);
        latest_ = open_;
    } else {
        commit_open_call();
        open_call(usage);
    }
    commit_open_call();
}

void TurnTokenAccumulator::finalize() {
    commit_open_call();
}

TokenTracker TurnTokenAccumulator::totals() const {
    TokenTracker t = committed_;
    if (call_open_) {
        t.add(open_);
    }
    return t;
}

// ============================================================================
// TokenLedger
// ============================================================================

TokenLedger::TokenLedger()
    : current_context_(0)
    , turn_start_context_(0)
{}

void TokenLedger::begin_turn() {
    std::lock_guard<std::mutex> lock(mutex_);
    turn_.reset();
    turn_start_context_ = current_context_;
}

TokenTracker TokenLedger::apply(const UsageUpdate& usage, int64_t* current_context) {
    std::lock_guard<std::mutex> lock(mutex_);
    turn_.apply(usage);
    current_context_ = turn_.latest_call().context_input();
    if (current_context) *current_context = current_context_;
    TokenTracker snapshot = base_;
    snapshot.add(turn_.totals());
    return snapshot;
}

TokenTracker TokenLedger::commit_turn(const UsageUpdate* final_usage, int64_t* turn_total) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (final_usage) {
        turn_.apply_final(*final_usage);
    } else {
        turn_.finalize();
    }
    if (turn_.has_calls()) {
        current_context_ = turn_.latest_call().context_input();
    }
    TokenTracker turn = turn_.totals();
    if (turn_total) *turn_total = turn.total();
    base_.add(turn);
    turn_.reset();
    return base_;
}

void TokenLedger::discard_turn() {
    std::lock_guard<std::mutex> lock(mutex_);
    turn_.reset();
    current_context_ = turn_start_context_;
}

void TokenLedger::reset(const TokenTracker& base) {
    std::lock_guard<std::mutex> lock(mutex_);
    base_ = base;
    turn_.reset();
    current_context_ = base.context_input();
    turn_start_context_ = current_context_;
}

TokenTracker TokenLedger::cumulative() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TokenTracker snapshot = base_;
    snapshot.add(turn_.totals());
    return snapshot;
}

TokenTracker TokenLedger::base() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_;
}

int64_t TokenLedger::current_context() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_context_;
}

// ============================================================================
// OutputTokenTracker
// ============================================================================

OutputTokenTracker::OutputTokenTracker()
    : segment_chars_(0)
    , estimated_(0)
    , authoritative_(0)
    , cumulative_base_(0)
{}

void OutputTokenTracker::add_streamed_text(const std::string& text) {
    segment_chars_ += text.size();
    estimated_ = static_cast<int64_t>((segment_chars_ + 3) / 4);
}

void OutputTokenTracker::set_authoritative(int64_t output_tokens) {
    authoritative_ = std::max(authoritative_, output_tokens);
}

int64_t OutputTokenTracker::segment_value() const {
    return std::max(estimated_, authoritative_);
}

void OutputTokenTracker::start_new_segment() {
    cumulative_base_ += segment_value();
    segment_chars_ = 0;
    estimated_ = 0;
    authoritative_ = 0;
}

void OutputTokenTracker::reset() {
    segment_chars_ = 0;
    estimated_ = 0;
    authoritative_ = 0;
    cumulative_base_ = 0;
}

int64_t OutputTokenTracker::display_tokens() const {
    return cumulative_base_ + segment_value();
}

} // namespace convoflow
