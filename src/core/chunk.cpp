#include <convoflow/core/chunk.hpp>
#include <convoflow/core/utils.hpp>

namespace convoflow {

static const size_t MAX_PARAMS_PREVIEW = 200;
static const size_t MAX_RESULT_PREVIEW = 500;

const char* chunk_type_name(ChunkType type) {
    switch (type) {
        case ChunkType::TEXT: return "text";
        case ChunkType::TOOL_CALL: return "tool_call";
        case ChunkType::TOOL_RESULT: return "tool_result";
        case ChunkType::STATUS: return "status";
        case ChunkType::INTERRUPTED: return "interrupted";
        case ChunkType::TOKEN_UPDATE: return "token_update";
        case ChunkType::DONE: return "done";
        case ChunkType::ERROR: return "error";
        default: return "unknown";
    }
}

// ============================================================================
// StreamChunk factories
// ============================================================================

StreamChunk StreamChunk::make_text(const std::string& text) {
    StreamChunk c;
    c.type = ChunkType::TEXT;
    c.text = text;
    return c;
}

StreamChunk StreamChunk::make_tool_call(const ToolCall& call) {
    StreamChunk c;
    c.type = ChunkType::TOOL_CALL;
    c.tool_call.id = call.id;
    c.tool_call.tool = call.tool;
    c.tool_call.preview = call.tool + "(" + truncate_safe(call.parameters.dump(), MAX_PARAMS_PREVIEW) + ")";
    return c;
}

StreamChunk StreamChunk::make_tool_result(const ToolResult& result) {
    StreamChunk c;
    c.type = ChunkType::TOOL_RESULT;
    c.tool_result.tool_use_id = result.tool_use_id;
    c.tool_result.success = result.success;
    c.tool_result.preview = truncate_safe(result.output, MAX_RESULT_PREVIEW);
    return c;
}

StreamChunk StreamChunk::make_status(const std::string& message) {
    StreamChunk c;
    c.type = ChunkType::STATUS;
    c.text = message;
    return c;
}

StreamChunk StreamChunk::make_interrupted(const std::vector<std::string>& queued) {
    StreamChunk c;
    c.type = ChunkType::INTERRUPTED;
    c.queued_inputs = queued;
    return c;
}

StreamChunk StreamChunk::make_token_update(const TokenTracker& tokens, int64_t context_tokens) {
    StreamChunk c;
    c.type = ChunkType::TOKEN_UPDATE;
    c.tokens = tokens;
    c.context_tokens = context_tokens;
    return c;
}

StreamChunk StreamChunk::make_done() {
    StreamChunk c;
    c.type = ChunkType::DONE;
    return c;
}

StreamChunk StreamChunk::make_error(const std::string& message) {
    StreamChunk c;
    c.type = ChunkType::ERROR;
    c.text = message;
    return c;
}

// ============================================================================
// Sinks
// ============================================================================

void CallbackSink::emit(const StreamChunk& chunk) {
    if (callback_) {
        callback_(chunk);
    }
}

void CollectingSink::emit(const StreamChunk& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.push_back(chunk);
}

std::vector<StreamChunk> CollectingSink::chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

std::string CollectingSink::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (size_t i = 0; i < chunks_.size(); ++i) {
        if (chunks_[i].type == ChunkType::TEXT) {
            out += chunks_[i].text;
        }
    }
    return out;
}

size_t CollectingSink::count(ChunkType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (size_t i = 0; i < chunks_.size(); ++i) {
        if (chunks_[i].type == type) ++n;
    }
    return n;
}

void CollectingSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.clear();
}

BatchingSink::BatchingSink(OutputSink& target, size_t max_chars, int64_t max_age_ms)
    : target_(target)
    , max_chars_(max_chars)
    , max_age_ms_(max_age_ms)
    , pending_since_(0)
{}

void BatchingSink::emit(const StreamChunk& chunk) {
    if (chunk.type != ChunkType::TEXT) {
        flush();
        target_.emit(chunk);
        return;
    }

    if (chunk.text.empty()) return;
    if (pending_.empty()) {
        pending_since_ = monotonic_ms();
    }
    pending_ += chunk.text;

    if (pending_.size() >= max_chars_ || monotonic_ms() - pending_since_ >= max_age_ms_) {
        flush();
    }
}

void BatchingSink::flush() {
    if (pending_.empty()) return;
    StreamChunk c = StreamChunk::make_text(pending_);
    pending_.clear();
    target_.emit(c);
}

} // namespace convoflow
