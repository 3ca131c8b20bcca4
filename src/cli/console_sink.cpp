#include <convoflow/cli/console_sink.hpp>

namespace convoflow {

static const char* ANSI_RESET = "\033[0m";
static const char* ANSI_DIM = "\033[2m";
static const char* ANSI_RED = "\033[31m";
static const char* ANSI_GREEN = "\033[32m";
static const char* ANSI_YELLOW = "\033[33m";
static const char* ANSI_CYAN = "\033[36m";

ConsoleSink::ConsoleSink(FILE* out, bool colors)
    : out_(out)
    , colors_(colors)
    , mid_line_(false)
    , baseline_output_(0)
    , context_tokens_(0)
{}

const char* ConsoleSink::color(const char* code) const {
    return colors_ ? code : "";
}

void ConsoleSink::begin_prompt(const TokenTracker& session_tokens, int64_t context_tokens) {
    baseline_output_ = session_tokens.output_tokens;
    last_tokens_ = session_tokens;
    context_tokens_ = context_tokens;
    output_.reset();
    mid_line_ = false;
}

void ConsoleSink::end_text_line() {
    if (mid_line_) {
        fputc('\n', out_);
        mid_line_ = false;
    }
}

void ConsoleSink::emit(const StreamChunk& chunk) {
    switch (chunk.type) {
        case ChunkType::TEXT:
            fputs(chunk.text.c_str(), out_);
            if (!chunk.text.empty()) {
                mid_line_ = chunk.text[chunk.text.size() - 1] != '\n';
            }
            output_.add_streamed_text(chunk.text);
            break;

        case ChunkType::TOOL_CALL:
            end_text_line();
            fprintf(out_, "%s  -> %s%s\n", color(ANSI_CYAN), chunk.tool_call.preview.c_str(), color(ANSI_RESET));
            output_.start_new_segment();
            break;

        case ChunkType::TOOL_RESULT:
            end_text_line();
            if (chunk.tool_result.success) {
                fprintf(out_, "%s  ✓ %s%s\n", color(ANSI_GREEN), chunk.tool_result.preview.c_str(), color(ANSI_RESET));
            } else {
                fprintf(out_, "%s  ✗ %s%s\n", color(ANSI_RED), chunk.tool_result.preview.c_str(), color(ANSI_RESET));
            }
            break;

        case ChunkType::STATUS:
            end_text_line();
            fprintf(out_, "%s[%s]%s\n", color(ANSI_DIM), chunk.text.c_str(), color(ANSI_RESET));
            break;

        case ChunkType::INTERRUPTED:
            end_text_line();
            fprintf(out_, "%s[interrupted]%s\n", color(ANSI_YELLOW), color(ANSI_RESET));
            for (size_t i = 0; i < chunk.queued_inputs.size(); ++i) {
                fprintf(out_, "%s  queued: %s%s\n", color(ANSI_DIM), chunk.queued_inputs[i].c_str(), color(ANSI_RESET));
            }
            break;

        case ChunkType::TOKEN_UPDATE:
            last_tokens_ = chunk.tokens;
            context_tokens_ = chunk.context_tokens;
            output_.set_authoritative(chunk.tokens.output_tokens - baseline_output_ - output_.cumulative_base());
            break;

        case ChunkType::DONE:
            end_text_line();
            fprintf(out_, "%s[%lld output tokens, context %lld]%s\n", color(ANSI_DIM),
                    static_cast<long long>(output_.display_tokens()),
                    static_cast<long long>(context_tokens_),
                    color(ANSI_RESET));
            break;

        case ChunkType::ERROR:
            end_text_line();
            fprintf(out_, "%sError: %s%s\n", color(ANSI_RED), chunk.text.c_str(), color(ANSI_RESET));
            break;
    }
    fflush(out_);
}

void ConsoleSink::flush() {
    fflush(out_);
}

} // namespace convoflow
