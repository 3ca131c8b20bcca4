/*
 * convoflow C++ - Llama.cpp backend
 *
 * Streams chat completions from a llama.cpp server (or any server with the
 * OpenAI-compatible API) at <url>/v1/chat/completions with "stream": true.
 *
 * Config:
 *   llamacpp.url          - Server URL (default: http://localhost:8080)
 *   llamacpp.model        - Model name (optional)
 *   llamacpp.api_key      - API key if server requires authentication (optional)
 *   llamacpp.context_size - Context window in tokens (default: 4096)
 *   llamacpp.max_tokens   - Response limit, 0 for the server default
 */
#ifndef convoflow_PLUGINS_LLAMACPP_HPP
#define convoflow_PLUGINS_LLAMACPP_HPP

#include <convoflow/ai/ai.hpp>
#include <convoflow/core/json.hpp>
#include <string>

namespace convoflow {

class Config;

struct LlamaCppSettings {
    std::string server_url;
    std::string api_key;
    std::string model;
    int64_t context_size;
    int64_t max_tokens;

    LlamaCppSettings()
        : server_url("http://localhost:8080")
        , model("local-model")
        , context_size(4096)
        , max_tokens(0) {}
};

// One parsed "data:" payload of the completion stream
struct LlamaCppDelta {
    std::string content;
    std::string finish_reason;
    bool has_usage;
    int64_t prompt_tokens;
    int64_t completion_tokens;
    bool done;                  // the "[DONE]" sentinel
    std::string error;

    LlamaCppDelta() : has_usage(false), prompt_tokens(0), completion_tokens(0), done(false) {}
};

// False when the payload is not JSON.
bool parse_stream_chunk(const std::string& payload, LlamaCppDelta& out);

// OpenAI-compatible request body for `request`
Json build_chat_request(const StreamRequest& request, const LlamaCppSettings& settings);

class LlamaCppBackend : public BackendAdapter {
public:
    LlamaCppBackend();

    bool init(const Config& cfg);
    bool is_initialized() const { return initialized_; }
    const LlamaCppSettings& settings() const { return settings_; }

    std::string name() const override { return "llamacpp"; }
    int64_t context_window() const override { return settings_.context_size; }
    std::unique_ptr<BackendAgent> create_agent() override;

private:
    LlamaCppSettings settings_;
    bool initialized_;
};

} // namespace convoflow

#endif // convoflow_PLUGINS_LLAMACPP_HPP
