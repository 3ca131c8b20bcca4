#include <convoflow/ai/ai.hpp>

namespace convoflow {

std::string role_to_string(MessageRole role) {
    switch (role) {
        case MessageRole::SYSTEM: return "system";
        case MessageRole::USER: return "user";
        case MessageRole::ASSISTANT: return "assistant";
        default: return "user";
    }
}

bool string_to_role(const std::string& str, MessageRole& out) {
    if (str == "user") { out = MessageRole::USER; return true; }
    if (str == "assistant") { out = MessageRole::ASSISTANT; return true; }
    if (str == "system") { out = MessageRole::SYSTEM; return true; }
    return false;
}

const char* cancel_reason_name(CancelReason reason) {
    switch (reason) {
        case CancelReason::COMPACTION: return "compaction";
        case CancelReason::USER_INTERRUPT: return "user_interrupt";
        default: return "none";
    }
}

// ============================================================================
// ContentBlock / ConversationMessage
// ============================================================================

ContentBlock ContentBlock::make_text(const std::string& text) {
    ContentBlock b;
    b.type = ContentType::TEXT;
    b.text = text;
    return b;
}

ContentBlock ContentBlock::make_tool_use(const ToolCall& call) {
    ContentBlock b;
    b.type = ContentType::TOOL_USE;
    b.id = call.id;
    b.name = call.tool;
    b.input = call.parameters;
    return b;
}

ContentBlock ContentBlock::make_tool_result(const ToolResult& result) {
    ContentBlock b;
    b.type = ContentType::TOOL_RESULT;
    b.id = result.tool_use_id;
    b.text = result.output;
    b.is_error = !result.success;
    return b;
}

static ConversationMessage text_message(MessageRole role, const std::string& text) {
    ConversationMessage m;
    m.role = role;
    m.content.push_back(ContentBlock::make_text(text));
    return m;
}

ConversationMessage ConversationMessage::user(const std::string& text) {
    return text_message(MessageRole::USER, text);
}

ConversationMessage ConversationMessage::assistant(const std::string& text) {
    return text_message(MessageRole::ASSISTANT, text);
}

ConversationMessage ConversationMessage::system(const std::string& text) {
    return text_message(MessageRole::SYSTEM, text);
}

std::string ConversationMessage::text() const {
    std::string out;
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i].type != ContentType::TEXT) continue;
        if (!out.empty()) out += "\n";
        out += content[i].text;
    }
    return out;
}

size_t ConversationMessage::char_count() const {
    size_t total = 0;
    for (size_t i = 0; i < content.size(); ++i) {
        const ContentBlock& b = content[i];
        total += b.text.size();
        if (b.type == ContentType::TOOL_USE) {
            total += b.name.size() + b.input.dump().size();
        }
    }
    return total;
}

bool ConversationMessage::has_tool_blocks() const {
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i].type != ContentType::TEXT) return true;
    }
    return false;
}

// ============================================================================
// Usage / events
// ============================================================================

UsageUpdate UsageUpdate::start(int call, int64_t input, int64_t cache_read, int64_t cache_creation) {
    UsageUpdate u;
    u.phase = UsagePhase::CALL_START;
    u.call_index = call;
    u.input_tokens = input;
    u.cache_read_tokens = cache_read;
    u.cache_creation_tokens = cache_creation;
    return u;
}

UsageUpdate UsageUpdate::delta(int call, int64_t input, int64_t output) {
    UsageUpdate u;
    u.phase = UsagePhase::DELTA;
    u.call_index = call;
    u.input_tokens = input;
    u.output_tokens = output;
    return u;
}

BackendEvent BackendEvent::make_text(const std::string& text) {
    BackendEvent e;
    e.type = BackendEventType::TEXT;
    e.text = text;
    return e;
}

BackendEvent BackendEvent::make_tool_call(const ToolCall& call) {
    BackendEvent e;
    e.type = BackendEventType::TOOL_CALL;
    e.tool_call = call;
    return e;
}

BackendEvent BackendEvent::make_tool_result(const ToolResult& result) {
    BackendEvent e;
    e.type = BackendEventType::TOOL_RESULT;
    e.tool_result = result;
    return e;
}

BackendEvent BackendEvent::make_usage(const UsageUpdate& usage) {
    BackendEvent e;
    e.type = BackendEventType::USAGE;
    e.usage = usage;
    e.has_usage = true;
    return e;
}

BackendEvent BackendEvent::make_final(const UsageUpdate& usage, const std::string& text) {
    BackendEvent e;
    e.type = BackendEventType::FINAL_RESPONSE;
    e.usage = usage;
    e.has_usage = true;
    e.text = text;
    return e;
}

BackendEvent BackendEvent::make_final_without_usage(const std::string& text) {
    BackendEvent e;
    e.type = BackendEventType::FINAL_RESPONSE;
    e.text = text;
    return e;
}

BackendEvent BackendEvent::make_error(const std::string& message, CancelReason reason) {
    BackendEvent e;
    e.type = BackendEventType::ERROR;
    e.text = message;
    e.cancel_reason = reason;
    return e;
}

} // namespace convoflow
