/*
 * convoflow C++ - Console output sink
 *
 * Renders stream chunks on a terminal: text as it arrives, tool activity
 * on its own lines, and a token footer when the response ends.
 */
#ifndef convoflow_CLI_CONSOLE_SINK_HPP
#define convoflow_CLI_CONSOLE_SINK_HPP

#include <convoflow/core/chunk.hpp>
#include <convoflow/core/token_tracker.hpp>
#include <cstdio>

namespace convoflow {

class ConsoleSink : public OutputSink {
public:
    explicit ConsoleSink(FILE* out = stdout, bool colors = true);

    // Call before each prompt with the session's token counters so the
    // footer shows this response only.
    void begin_prompt(const TokenTracker& session_tokens, int64_t context_tokens);

    void emit(const StreamChunk& chunk) override;
    void flush() override;

    int64_t output_tokens() const { return output_.display_tokens(); }
    const TokenTracker& last_tokens() const { return last_tokens_; }
    int64_t context_tokens() const { return context_tokens_; }

private:
    void end_text_line();
    const char* color(const char* code) const;

    FILE* out_;
    bool colors_;
    bool mid_line_;
    int64_t baseline_output_;
    TokenTracker last_tokens_;
    int64_t context_tokens_;
    OutputTokenTracker output_;
};

} // namespace convoflow

#endif // convoflow_CLI_CONSOLE_SINK_HPP
