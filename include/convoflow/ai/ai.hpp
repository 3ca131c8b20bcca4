/*
 * convoflow C++ - Backend interface
 *
 * Messages in backend-native form plus the adapter / agent / stream
 * abstractions every model backend implements:
 *
 *   BackendAdapter  - {name, context_window(), create_agent()}
 *   BackendAgent    - opens one AgentStream per request
 *   AgentStream     - yields BackendEvents, cancellable at any time
 *
 * Streams are produced on the backend's own thread and consumed by the
 * session loop; a stream notifies the session's WakeSignal whenever a new
 * event becomes available.
 */
#ifndef convoflow_AI_AI_HPP
#define convoflow_AI_AI_HPP

#include <convoflow/core/json.hpp>
#include <convoflow/core/turn.hpp>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace convoflow {

class WakeSignal;
class CompactionHook;

// ============================================================================
// Messages
// ============================================================================

enum class MessageRole {
    SYSTEM,
    USER,
    ASSISTANT
};

std::string role_to_string(MessageRole role);

// Returns false for roles the session does not keep (tool, function, ...).
bool string_to_role(const std::string& str, MessageRole& out);

enum class ContentType {
    TEXT,
    TOOL_USE,
    TOOL_RESULT
};

struct ContentBlock {
    ContentType type;
    std::string text;       // TEXT body, TOOL_RESULT output
    std::string id;         // TOOL_USE id, TOOL_RESULT tool_use_id
    std::string name;       // TOOL_USE tool name
    Json input;             // TOOL_USE parameters
    bool is_error;          // TOOL_RESULT failure flag

    ContentBlock() : type(ContentType::TEXT), input(Json::object()), is_error(false) {}

    static ContentBlock make_text(const std::string& text);
    static ContentBlock make_tool_use(const ToolCall& call);
    static ContentBlock make_tool_result(const ToolResult& result);
};

struct ConversationMessage {
    MessageRole role;
    std::vector<ContentBlock> content;

    ConversationMessage() : role(MessageRole::USER) {}

    static ConversationMessage user(const std::string& text);
    static ConversationMessage assistant(const std::string& text);
    static ConversationMessage system(const std::string& text);

    // Concatenated TEXT blocks
    std::string text() const;
    // Characters across all blocks (tool payloads included), for token estimates
    size_t char_count() const;
    bool has_tool_blocks() const;
};

// ============================================================================
// Stream events
// ============================================================================

// Why a stream was cancelled. Carried on the terminal ERROR event so the
// session never has to guess from an error message.
enum class CancelReason {
    NONE,
    COMPACTION,
    USER_INTERRUPT
};

const char* cancel_reason_name(CancelReason reason);

enum class UsagePhase {
    CALL_START,     // first report of a backend call: carries its input tokens
    DELTA           // running output count of the current call
};

struct UsageUpdate {
    UsagePhase phase;
    int call_index;         // backend call number within one stream, from 0
    int64_t input_tokens;
    int64_t output_tokens;
    int64_t cache_read_tokens;
    int64_t cache_creation_tokens;

    UsageUpdate()
        : phase(UsagePhase::DELTA)
        , call_index(0)
        , input_tokens(0)
        , output_tokens(0)
        , cache_read_tokens(0)
        , cache_creation_tokens(0) {}

    static UsageUpdate start(int call, int64_t input, int64_t cache_read = 0, int64_t cache_creation = 0);
    static UsageUpdate delta(int call, int64_t input, int64_t output);
};

enum class BackendEventType {
    TEXT,
    TOOL_CALL,
    TOOL_RESULT,
    USAGE,
    FINAL_RESPONSE,
    ERROR
};

struct BackendEvent {
    BackendEventType type;
    std::string text;               // TEXT delta, FINAL_RESPONSE remainder, ERROR message
    ToolCall tool_call;
    ToolResult tool_result;
    UsageUpdate usage;              // USAGE, and FINAL_RESPONSE when has_usage
    bool has_usage;
    CancelReason cancel_reason;     // ERROR only

    BackendEvent()
        : type(BackendEventType::TEXT)
        , has_usage(false)
        , cancel_reason(CancelReason::NONE) {}

    static BackendEvent make_text(const std::string& text);
    static BackendEvent make_tool_call(const ToolCall& call);
    static BackendEvent make_tool_result(const ToolResult& result);
    static BackendEvent make_usage(const UsageUpdate& usage);
    // Final usage reports the totals of the call identified by usage.call_index
    static BackendEvent make_final(const UsageUpdate& usage, const std::string& text = "");
    static BackendEvent make_final_without_usage(const std::string& text = "");
    static BackendEvent make_error(const std::string& message, CancelReason reason = CancelReason::NONE);

    bool is_terminal() const {
        return type == BackendEventType::FINAL_RESPONSE || type == BackendEventType::ERROR;
    }
};

// ============================================================================
// Backend abstractions
// ============================================================================

struct StreamRequest {
    std::vector<ConversationMessage> history;   // ends with the prompt being answered
    std::string system_prompt;
};

class AgentStream {
public:
    virtual ~AgentStream() {}

    // Pop the next ready event without blocking.
    virtual bool try_next(BackendEvent& out) = 0;

    // True once the terminal event has been handed out and nothing else will arrive.
    virtual bool finished() const = 0;

    // Abort the request. Undelivered events are dropped and the stream ends
    // with an ERROR event carrying `reason`. Safe to call more than once.
    virtual void cancel(CancelReason reason) = 0;
};

class BackendAgent {
public:
    virtual ~BackendAgent() {}

    // `hook` (may be null) is consulted before each backend request;
    // `wake` must be notified whenever an event becomes available.
    virtual std::unique_ptr<AgentStream> stream(const StreamRequest& request,
                                                CompactionHook* hook,
                                                WakeSignal& wake) = 0;
};

class BackendAdapter {
public:
    virtual ~BackendAdapter() {}

    virtual std::string name() const = 0;
    virtual int64_t context_window() const = 0;
    virtual std::unique_ptr<BackendAgent> create_agent() = 0;
};

} // namespace convoflow

#endif // convoflow_AI_AI_HPP
