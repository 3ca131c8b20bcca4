/*
 * convoflow C++ - Stream chunks and output sinks
 *
 * A prompt streams StreamChunks to an OutputSink. Every prompt ends with
 * exactly one terminal chunk (DONE or ERROR). Text is batched by
 * BatchingSink so that consumers are not called once per token.
 */
#ifndef convoflow_CORE_CHUNK_HPP
#define convoflow_CORE_CHUNK_HPP

#include <convoflow/core/token_tracker.hpp>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

namespace convoflow {

enum class ChunkType {
    TEXT,
    TOOL_CALL,
    TOOL_RESULT,
    STATUS,
    INTERRUPTED,
    TOKEN_UPDATE,
    DONE,
    ERROR
};

const char* chunk_type_name(ChunkType type);

struct ToolCallInfo {
    std::string id;
    std::string tool;
    std::string preview;        // "tool(params)", params capped at 200 chars
};

struct ToolResultInfo {
    std::string tool_use_id;
    bool success;
    std::string preview;        // output capped at 500 chars

    ToolResultInfo() : success(true) {}
};

struct StreamChunk {
    ChunkType type;
    std::string text;                       // TEXT, STATUS, ERROR
    ToolCallInfo tool_call;
    ToolResultInfo tool_result;
    std::vector<std::string> queued_inputs; // INTERRUPTED
    TokenTracker tokens;                    // TOKEN_UPDATE (cumulative)
    int64_t context_tokens;                 // TOKEN_UPDATE (latest call's input side)

    StreamChunk() : type(ChunkType::TEXT), context_tokens(0) {}

    static StreamChunk make_text(const std::string& text);
    static StreamChunk make_tool_call(const ToolCall& call);
    static StreamChunk make_tool_result(const ToolResult& result);
    static StreamChunk make_status(const std::string& message);
    static StreamChunk make_interrupted(const std::vector<std::string>& queued);
    static StreamChunk make_token_update(const TokenTracker& tokens, int64_t context_tokens = 0);
    static StreamChunk make_done();
    static StreamChunk make_error(const std::string& message);

    bool is_terminal() const { return type == ChunkType::DONE || type == ChunkType::ERROR; }
};

// ============================================================================
// Sinks
// ============================================================================

class OutputSink {
public:
    virtual ~OutputSink() {}
    virtual void emit(const StreamChunk& chunk) = 0;
    // Push out anything held back. Called before every non-text chunk.
    virtual void flush() {}
};

typedef std::function<void(const StreamChunk&)> ChunkCallback;

class CallbackSink : public OutputSink {
public:
    explicit CallbackSink(ChunkCallback callback) : callback_(callback) {}
    void emit(const StreamChunk& chunk) override;

private:
    ChunkCallback callback_;
};

// Records every chunk; used by tests and by hosts that poll.
class CollectingSink : public OutputSink {
public:
    void emit(const StreamChunk& chunk) override;

    std::vector<StreamChunk> chunks() const;
    std::string text() const;
    size_t count(ChunkType type) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<StreamChunk> chunks_;
};

// Coalesces consecutive TEXT chunks until `max_chars` are buffered or the
// oldest buffered text is `max_age_ms` old. Any other chunk flushes first,
// so ordering is preserved.
class BatchingSink : public OutputSink {
public:
    BatchingSink(OutputSink& target, size_t max_chars = 64, int64_t max_age_ms = 50);

    void emit(const StreamChunk& chunk) override;
    void flush() override;

    size_t pending_chars() const { return pending_.size(); }

private:
    OutputSink& target_;
    size_t max_chars_;
    int64_t max_age_ms_;
    std::string pending_;
    int64_t pending_since_;
};

} // namespace convoflow

#endif // convoflow_CORE_CHUNK_HPP
