#include <convoflow/core/session.hpp>
#include <convoflow/core/compaction_hook.hpp>
#include <convoflow/core/config.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/transcript.hpp>
#include <convoflow/core/utils.hpp>

#include <cstdio>
#include <set>

namespace convoflow {

static const int MAX_STREAM_ATTEMPTS = 2;

SessionConfig SessionConfig::from_config(const Config& cfg) {
    SessionConfig c;
    c.threshold_ratio = cfg.get_double("compaction.threshold_ratio", c.threshold_ratio);
    c.text_batch_chars = static_cast<size_t>(cfg.get_int("session.text_batch_chars",
                                                         static_cast<int64_t>(c.text_batch_chars)));
    c.text_batch_ms = cfg.get_int("session.text_batch_ms", c.text_batch_ms);
    c.system_prompt = cfg.get_string("session.system_prompt", "");
    c.compactor = CompactorConfig::from_config(cfg);
    return c;
}

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "idle";
        case SessionState::STREAMING: return "streaming";
        case SessionState::COMPLETED: return "completed";
        case SessionState::INTERRUPTED: return "interrupted";
        case SessionState::COMPACTION_TRIGGERED: return "compaction_triggered";
        case SessionState::ERRORED: return "errored";
        default: return "unknown";
    }
}

// ============================================================================
// BackendRegistry
// ============================================================================

void BackendRegistry::add(std::shared_ptr<BackendAdapter> adapter) {
    if (!adapter) return;
    for (size_t i = 0; i < adapters_.size(); ++i) {
        if (adapters_[i]->name() == adapter->name()) {
            adapters_[i] = adapter;
            return;
        }
    }
    adapters_.push_back(adapter);
}

std::shared_ptr<BackendAdapter> BackendRegistry::find(const std::string& name) const {
    for (size_t i = 0; i < adapters_.size(); ++i) {
        if (adapters_[i]->name() == name) {
            return adapters_[i];
        }
    }
    return std::shared_ptr<BackendAdapter>();
}

std::vector<std::string> BackendRegistry::names() const {
    std::vector<std::string> out;
    for (size_t i = 0; i < adapters_.size(); ++i) {
        out.push_back(adapters_[i]->name());
    }
    return out;
}

// ============================================================================
// In-flight turn
//
// Everything a stream produces is buffered here and only reaches the session
// history when the turn completes or is interrupted.
// ============================================================================

namespace {

struct InFlightTurn {
    std::string span;                           // assistant text since the last tool block
    std::string response;                       // all assistant text of the turn
    std::vector<ConversationMessage> messages;
    std::vector<ToolCall> calls;
    std::vector<ToolResult> results;
    std::set<std::string> unanswered;           // tool_use ids still waiting for a result

    void add_block(MessageRole role, const ContentBlock& block) {
        if (messages.empty() || messages.back().role != role) {
            ConversationMessage m;
            m.role = role;
            messages.push_back(m);
        }
        messages.back().content.push_back(block);
    }

    void flush_span() {
        if (span.empty()) return;
        add_block(MessageRole::ASSISTANT, ContentBlock::make_text(span));
        span.clear();
    }

    bool knows_call(const std::string& id) const {
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i].id == id) return true;
        }
        return false;
    }

    // Tool calls that never got a result cannot stay in history
    void drop_unanswered() {
        if (unanswered.empty()) return;

        std::vector<ToolCall> kept_calls;
        for (size_t i = 0; i < calls.size(); ++i) {
            if (!unanswered.count(calls[i].id)) kept_calls.push_back(calls[i]);
        }
        calls = kept_calls;

        std::vector<ConversationMessage> kept_messages;
        for (size_t m = 0; m < messages.size(); ++m) {
            ConversationMessage msg;
            msg.role = messages[m].role;
            for (size_t b = 0; b < messages[m].content.size(); ++b) {
                const ContentBlock& block = messages[m].content[b];
                if (block.type == ContentType::TOOL_USE && unanswered.count(block.id)) continue;
                msg.content.push_back(block);
            }
            if (!msg.content.empty()) kept_messages.push_back(msg);
        }
        messages = kept_messages;

        LOG_DEBUG("[Session] Dropped %zu unanswered tool call(s)", unanswered.size());
        unanswered.clear();
    }

    ConversationTurn to_turn(const std::string& input) const {
        ConversationTurn turn;
        turn.user_message = input;
        turn.tool_calls = calls;
        turn.tool_results = results;
        turn.assistant_response = response;
        turn.timestamp = current_timestamp_ms();
        return turn;
    }
};

class StreamingScope {
public:
    StreamingScope(std::atomic<bool>& flag, InterruptWaiter* waiter)
        : flag_(flag), waiter_(waiter) {
        flag_ = true;
        if (waiter_) waiter_->begin();
    }
    ~StreamingScope() {
        if (waiter_) waiter_->end();
        flag_ = false;
    }

private:
    std::atomic<bool>& flag_;
    InterruptWaiter* waiter_;
};

} // namespace

// ============================================================================
// Session
// ============================================================================

Session::Session(const BackendRegistry& registry,
                 const std::string& initial_backend,
                 std::unique_ptr<InterruptWaiter> waiter,
                 const SessionConfig& config)
    : id_(generate_uuid())
    , config_(config)
    , registry_(registry)
    , waiter_(std::move(waiter))
    , compactor_(config.compactor)
    , ledger_(std::make_shared<TokenLedger>())
    , interrupted_(false)
    , streaming_(false)
    , state_(SessionState::IDLE)
{
    if (!waiter_) {
        waiter_.reset(new HostWakeWaiter());
    }

    backend_ = registry_.find(initial_backend);
    if (!backend_ && !registry_.empty()) {
        std::string fallback = registry_.names().front();
        LOG_WARN("[Session] Unknown backend '%s', using '%s'", initial_backend.c_str(), fallback.c_str());
        backend_ = registry_.find(fallback);
    }
    if (backend_) {
        agent_ = backend_->create_agent();
        LOG_INFO("[Session] Session %s using backend '%s' (context window %lld, waiter %s)",
                 id_.c_str(), backend_->name().c_str(),
                 static_cast<long long>(backend_->context_window()), waiter_->name());
    } else {
        LOG_ERROR("[Session] No backends registered");
    }
}

Session::~Session() {}

int64_t Session::threshold() const {
    if (!backend_) return 0;
    return compaction_threshold(backend_->context_window(), config_.threshold_ratio);
}

void Session::interrupt() {
    interrupted_ = true;
    wake_.notify();
}

void Session::reset_interrupt() {
    interrupted_ = false;
}

void Session::queue_input(const std::string& text) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queued_inputs_.push_back(text);
}

std::vector<std::string> Session::drain_queued_inputs() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    std::vector<std::string> out;
    out.swap(queued_inputs_);
    return out;
}

void Session::commit_turn(const ConversationTurn& turn, const std::vector<ConversationMessage>& messages) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ConversationTurn t = turn;
    t.previous_error = !turns_.empty() && turns_.back().has_failed_result();
    messages_.insert(messages_.end(), messages.begin(), messages.end());
    turns_.push_back(t);
}

// ============================================================================
// Prompt
// ============================================================================

PromptOutcome Session::prompt(const std::string& input, OutputSink& sink) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!backend_ || !agent_) {
        sink.emit(StreamChunk::make_error("no backend available"));
        return PromptOutcome::fail("no backend available");
    }

    interrupted_ = false;
    StreamingScope scope(streaming_, waiter_.get());
    state_ = SessionState::STREAMING;

    BatchingSink out(sink, config_.text_batch_chars, config_.text_batch_ms);
    int64_t limit = threshold();

    bool has_turns;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        has_turns = !turns_.empty();
    }

    PromptOutcome outcome;

    // Already over the threshold from earlier turns: compact before sending anything
    int64_t context = ledger_->current_context();
    if (limit > 0 && has_turns && context >= limit) {
        LOG_INFO("[Session] Context at %lld of %lld tokens before prompt, compacting first",
                 static_cast<long long>(context),
                 static_cast<long long>(limit));
        out.emit(StreamChunk::make_status("Context window nearly full, compacting conversation..."));
        CompactionResult cr = compact_locked();
        if (!cr.success) {
            state_ = SessionState::ERRORED;
            out.emit(StreamChunk::make_error("Compaction failed: " + cr.error));
            return PromptOutcome::fail(cr.error);
        }
        outcome.compacted = true;
    }

    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        messages_.push_back(ConversationMessage::user(input));
    }

    for (int attempt = 1; attempt <= MAX_STREAM_ATTEMPTS; ++attempt) {
        std::string stream_error;
        StreamOutcome result = run_stream(input, limit, out, stream_error);
        outcome.attempts = attempt;

        if (result == StreamOutcome::COMPLETED || result == StreamOutcome::INTERRUPTED) {
            PromptOutcome done = PromptOutcome::ok(result == StreamOutcome::COMPLETED
                                                       ? SessionState::COMPLETED
                                                       : SessionState::INTERRUPTED);
            done.attempts = outcome.attempts;
            done.compacted = outcome.compacted;
            state_ = done.state;
            return done;
        }
        if (result == StreamOutcome::FAILED) {
            state_ = SessionState::ERRORED;
            outcome.success = false;
            outcome.state = SessionState::ERRORED;
            outcome.error = stream_error;
            return outcome;
        }

        state_ = SessionState::COMPACTION_TRIGGERED;
        if (attempt == MAX_STREAM_ATTEMPTS) {
            std::string err = "context window still exceeds threshold after compaction";
            LOG_ERROR("[Session] %s", err.c_str());
            state_ = SessionState::ERRORED;
            out.emit(StreamChunk::make_error(err));
            outcome.error = err;
            outcome.state = SessionState::ERRORED;
            return outcome;
        }

        out.emit(StreamChunk::make_status("Context window threshold reached, compacting conversation..."));

        // The prompt was never answered: take it out, compact, and put it back at the end
        {
            std::lock_guard<std::mutex> state_lock(state_mutex_);
            if (!messages_.empty() && messages_.back().role == MessageRole::USER &&
                messages_.back().text() == input) {
                messages_.pop_back();
            }
        }

        CompactionResult cr = compact_locked();

        {
            std::lock_guard<std::mutex> state_lock(state_mutex_);
            messages_.push_back(ConversationMessage::user(input));
        }

        if (!cr.success) {
            state_ = SessionState::ERRORED;
            out.emit(StreamChunk::make_error("Compaction failed: " + cr.error));
            outcome.error = cr.error;
            outcome.state = SessionState::ERRORED;
            return outcome;
        }
        outcome.compacted = true;

        char buf[160];
        snprintf(buf, sizeof(buf), "Compacted %zu turn(s): %lld -> %lld tokens (%.0f%% reduction)",
                 cr.metrics.turns_summarized,
                 static_cast<long long>(cr.metrics.original_tokens),
                 static_cast<long long>(cr.metrics.compacted_tokens),
                 cr.metrics.compression_ratio * 100.0);
        out.emit(StreamChunk::make_status(buf));
        for (size_t i = 0; i < cr.warnings.size(); ++i) {
            out.emit(StreamChunk::make_status(cr.warnings[i]));
        }
        out.emit(StreamChunk::make_token_update(ledger_->cumulative(), ledger_->current_context()));
        state_ = SessionState::STREAMING;
    }

    // Not reached: the last attempt always returns
    return outcome;
}

Session::StreamOutcome Session::run_stream(const std::string& input, int64_t limit, OutputSink& out,
                                           std::string& error) {
    ledger_->begin_turn();
    CompactionHook hook(ledger_, limit);

    StreamRequest request;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        request.history = messages_;
    }
    request.system_prompt = config_.system_prompt;

    std::unique_ptr<AgentStream> stream = agent_->stream(request, &hook, wake_);
    if (!stream) {
        ledger_->discard_turn();
        error = "backend '" + backend_->name() + "' could not open a stream";
        out.emit(StreamChunk::make_error(error));
        return StreamOutcome::FAILED;
    }

    InFlightTurn turn;

    for (;;) {
        // Read before checking the flag so an interrupt() between the two
        // still wakes the wait below
        uint64_t seen = wake_.generation();

        // Interrupt has priority over anything the stream has ready
        if (interrupted_) {
            stream->cancel(CancelReason::USER_INTERRUPT);
            out.flush();

            turn.flush_span();
            turn.drop_unanswered();
            int64_t turn_total = 0;
            TokenTracker totals = ledger_->commit_turn(nullptr, &turn_total);
            ConversationTurn t = turn.to_turn(input);
            t.tokens = turn_total;
            commit_turn(t, turn.messages);

            LOG_INFO("[Session] Interrupted after %zu chars of response", turn.response.size());
            out.emit(StreamChunk::make_token_update(totals, ledger_->current_context()));
            out.emit(StreamChunk::make_interrupted(drain_queued_inputs()));
            out.emit(StreamChunk::make_done());
            return StreamOutcome::INTERRUPTED;
        }

        BackendEvent ev;
        if (!stream->try_next(ev)) {
            if (stream->finished()) {
                ledger_->discard_turn();
                error = "stream ended without a final response";
                out.emit(StreamChunk::make_error(error));
                return StreamOutcome::FAILED;
            }

            WaitResult w = waiter_->wait(wake_, seen);
            if (w == WaitResult::CANCEL_KEY) {
                interrupted_ = true;
            } else if (w == WaitResult::TICK) {
                out.flush();
                out.emit(StreamChunk::make_token_update(ledger_->cumulative(), ledger_->current_context()));
            }
            continue;
        }

        switch (ev.type) {
            case BackendEventType::TEXT:
                turn.span += ev.text;
                turn.response += ev.text;
                out.emit(StreamChunk::make_text(ev.text));
                break;

            case BackendEventType::TOOL_CALL:
                turn.flush_span();
                turn.add_block(MessageRole::ASSISTANT, ContentBlock::make_tool_use(ev.tool_call));
                turn.calls.push_back(ev.tool_call);
                turn.unanswered.insert(ev.tool_call.id);
                out.emit(StreamChunk::make_tool_call(ev.tool_call));
                break;

            case BackendEventType::TOOL_RESULT: {
                ToolResult result = ev.tool_result;
                if (!turn.knows_call(result.tool_use_id)) {
                    error = "tool result '" + result.tool_use_id + "' has no matching tool call";
                    LOG_ERROR("[Session] %s", error.c_str());
                    stream->cancel(CancelReason::NONE);
                    ledger_->discard_turn();
                    out.emit(StreamChunk::make_error(error));
                    return StreamOutcome::FAILED;
                }
                if (output_reports_error(result.output)) {
                    result.success = false;
                }
                turn.flush_span();
                turn.add_block(MessageRole::USER, ContentBlock::make_tool_result(result));
                turn.results.push_back(result);
                turn.unanswered.erase(result.tool_use_id);
                out.emit(StreamChunk::make_tool_result(result));
                break;
            }

            case BackendEventType::USAGE: {
                TokenTracker snapshot;
                bool cancel = hook.on_usage(ev.usage, snapshot);
                out.emit(StreamChunk::make_token_update(snapshot, ledger_->current_context()));
                if (cancel) {
                    // The stream answers with ERROR(COMPACTION)
                    stream->cancel(CancelReason::COMPACTION);
                }
                break;
            }

            case BackendEventType::FINAL_RESPONSE: {
                if (!ev.text.empty()) {
                    turn.span += ev.text;
                    turn.response += ev.text;
                    out.emit(StreamChunk::make_text(ev.text));
                }
                turn.flush_span();
                turn.drop_unanswered();

                int64_t turn_total = 0;
                TokenTracker totals = ledger_->commit_turn(ev.has_usage ? &ev.usage : nullptr, &turn_total);
                ConversationTurn t = turn.to_turn(input);
                t.tokens = turn_total;
                commit_turn(t, turn.messages);

                LOG_DEBUG("[Session] Turn complete: %zu tool call(s), %lld tokens",
                          t.tool_calls.size(), static_cast<long long>(turn_total));
                out.emit(StreamChunk::make_token_update(totals, ledger_->current_context()));
                out.emit(StreamChunk::make_done());
                return StreamOutcome::COMPLETED;
            }

            case BackendEventType::ERROR:
                out.flush();
                if (ev.cancel_reason == CancelReason::COMPACTION && hook.compaction_needed()) {
                    // Keep what was measured so a failed compaction is retried next prompt
                    ledger_->commit_turn(nullptr);
                    LOG_INFO("[Session] Stream cancelled for compaction");
                    return StreamOutcome::COMPACTION;
                }
                if (ev.cancel_reason == CancelReason::USER_INTERRUPT && interrupted_) {
                    break;
                }
                LOG_ERROR("[Session] Backend error: %s", ev.text.c_str());
                ledger_->discard_turn();
                error = ev.text.empty() ? std::string("backend error") : ev.text;
                out.emit(StreamChunk::make_error(error));
                return StreamOutcome::FAILED;
        }
    }
}

// ============================================================================
// Compaction
// ============================================================================

CompactionResult Session::compact_locked() {
    std::vector<ConversationTurn> turns;
    std::vector<ConversationMessage> history;
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        turns = turns_;
        history = messages_;
    }

    CompactionResult result = compactor_.compact(turns, history);
    if (!result.success) {
        LOG_WARN("[Session] Compaction failed, token state left unchanged: %s", result.error.c_str());
        return result;
    }

    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        messages_ = result.messages;
        turns_ = result.kept_turns;
    }

    TokenTracker base;
    base.input_tokens = estimate_history_tokens(result.messages);
    ledger_->reset(base);
    return result;
}

CompactionOutcome Session::compact() {
    if (streaming_) {
        return CompactionOutcome::fail("cannot compact while a response is streaming");
    }
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return CompactionOutcome::fail("session is busy");
    }

    CompactionResult cr = compact_locked();
    if (!cr.success) {
        return CompactionOutcome::fail(cr.error);
    }

    CompactionOutcome o;
    o.success = true;
    o.original_tokens = cr.metrics.original_tokens;
    o.compacted_tokens = cr.metrics.compacted_tokens;
    o.compression_ratio = cr.metrics.compression_ratio * 100.0;
    o.turns_summarized = cr.metrics.turns_summarized;
    o.turns_kept = cr.metrics.turns_kept;
    o.warnings = cr.warnings;
    return o;
}

// ============================================================================
// Backends
// ============================================================================

SwitchResult Session::switch_backend(const std::string& name) {
    if (streaming_) {
        return SwitchResult::fail("cannot switch backend while a response is streaming");
    }
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return SwitchResult::fail("session is busy");
    }

    std::shared_ptr<BackendAdapter> next = registry_.find(name);
    if (!next) {
        return SwitchResult::fail("unknown backend: " + name);
    }
    std::unique_ptr<BackendAgent> agent = next->create_agent();
    if (!agent) {
        return SwitchResult::fail("backend '" + name + "' could not create an agent");
    }

    backend_ = next;
    agent_ = std::move(agent);
    LOG_INFO("[Session] Switched to backend '%s' (context window %lld)",
             name.c_str(), static_cast<long long>(backend_->context_window()));
    return SwitchResult::ok();
}

std::string Session::current_backend_name() const {
    return backend_ ? backend_->name() : std::string();
}

std::vector<std::string> Session::available_backends() const {
    return registry_.names();
}

// ============================================================================
// History
// ============================================================================

RestoreResult Session::restore_messages(const std::vector<Json>& envelopes) {
    if (streaming_) {
        return RestoreResult::fail("cannot restore while a response is streaming");
    }
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return RestoreResult::fail("session is busy");
    }

    ParseResult parsed = parse_envelopes(envelopes);
    if (!parsed.success) {
        return RestoreResult::fail(parsed.error);
    }

    std::vector<ConversationTurn> turns = convert_messages_to_turns(parsed.messages);
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        messages_ = parsed.messages;
        turns_ = turns;
    }
    ledger_->reset(TokenTracker());

    RestoreResult r;
    r.success = true;
    r.restored = parsed.messages.size();
    r.dropped = parsed.dropped;
    r.turns = turns.size();
    LOG_INFO("[Session] Restored %zu message(s) into %zu turn(s), %zu dropped",
             r.restored, r.turns, r.dropped);
    return r;
}

bool Session::clear_history(std::string* error) {
    if (streaming_) {
        if (error) *error = "cannot clear history while a response is streaming";
        return false;
    }
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        if (error) *error = "session is busy";
        return false;
    }

    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        messages_.clear();
        turns_.clear();
    }
    drain_queued_inputs();
    ledger_->reset(TokenTracker());
    state_ = SessionState::IDLE;
    LOG_INFO("[Session] History cleared");
    return true;
}

TokenTracker Session::token_tracker() const {
    return ledger_->cumulative();
}

int64_t Session::context_tokens() const {
    return ledger_->current_context();
}

std::vector<FlatMessage> Session::messages() const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    std::vector<FlatMessage> out;
    for (size_t i = 0; i < messages_.size(); ++i) {
        FlatMessage f;
        f.role = role_to_string(messages_[i].role);
        f.content = messages_[i].text();
        if (f.content.empty()) {
            f.content = "[non-text content]";
        }
        out.push_back(f);
    }
    return out;
}

std::vector<ConversationMessage> Session::history() const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    return messages_;
}

std::vector<ConversationTurn> Session::turns() const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    return turns_;
}

} // namespace convoflow
