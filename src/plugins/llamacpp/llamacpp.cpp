#include <convoflow/plugins/llamacpp/llamacpp.hpp>
#include <convoflow/ai/queued_stream.hpp>
#include <convoflow/core/compaction_hook.hpp>
#include <convoflow/core/config.hpp>
#include <convoflow/core/http_client.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/token_tracker.hpp>

#include <map>
#include <thread>

namespace convoflow {

// ============================================================================
// Wire format
// ============================================================================

bool parse_stream_chunk(const std::string& payload, LlamaCppDelta& out) {
    out = LlamaCppDelta();

    if (payload == "[DONE]") {
        out.done = true;
        return true;
    }

    Json j = Json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }

    if (j.contains("error")) {
        const Json& err = j["error"];
        if (err.is_object()) {
            out.error = err.value("message", std::string("server error"));
        } else if (err.is_string()) {
            out.error = err.get<std::string>();
        } else {
            out.error = "server error";
        }
        return true;
    }

    if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
        const Json& choice = j["choices"][0];
        if (choice.contains("delta") && choice["delta"].is_object()) {
            const Json& delta = choice["delta"];
            if (delta.contains("content") && delta["content"].is_string()) {
                out.content = delta["content"].get<std::string>();
            }
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            out.finish_reason = choice["finish_reason"].get<std::string>();
        }
    }

    if (j.contains("usage") && j["usage"].is_object()) {
        const Json& usage = j["usage"];
        out.has_usage = true;
        out.prompt_tokens = usage.value("prompt_tokens", static_cast<int64_t>(0));
        out.completion_tokens = usage.value("completion_tokens", static_cast<int64_t>(0));
    }
    return true;
}

static Json convert_message(const ConversationMessage& msg, Json& tool_messages) {
    Json m = Json::object();
    m["role"] = role_to_string(msg.role);

    std::string text;
    Json tool_calls = Json::array();
    for (size_t i = 0; i < msg.content.size(); ++i) {
        const ContentBlock& block = msg.content[i];
        if (block.type == ContentType::TEXT) {
            text += block.text;
        } else if (block.type == ContentType::TOOL_USE) {
            Json call = Json::object();
            call["id"] = block.id;
            call["type"] = "function";
            Json func = Json::object();
            func["name"] = block.name;
            func["arguments"] = block.input.dump();
            call["function"] = func;
            tool_calls.push_back(call);
        } else if (block.type == ContentType::TOOL_RESULT) {
            Json result = Json::object();
            result["role"] = "tool";
            result["tool_call_id"] = block.id;
            result["content"] = block.text;
            tool_messages.push_back(result);
        }
    }

    m["content"] = text;
    if (!tool_calls.empty()) {
        m["tool_calls"] = tool_calls;
    }
    return m;
}

Json build_chat_request(const StreamRequest& request, const LlamaCppSettings& settings) {
    Json body = Json::object();
    body["model"] = settings.model;
    body["stream"] = true;
    Json stream_options = Json::object();
    stream_options["include_usage"] = true;
    body["stream_options"] = stream_options;
    if (settings.max_tokens > 0) {
        body["max_tokens"] = settings.max_tokens;
    }

    Json msgs = Json::array();
    if (!request.system_prompt.empty()) {
        Json sys = Json::object();
        sys["role"] = "system";
        sys["content"] = request.system_prompt;
        msgs.push_back(sys);
    }
    for (size_t i = 0; i < request.history.size(); ++i) {
        Json tool_messages = Json::array();
        Json m = convert_message(request.history[i], tool_messages);
        // A user message made only of tool results becomes "tool" messages
        bool only_results = !tool_messages.empty() && m["content"].get<std::string>().empty() &&
                            !m.contains("tool_calls");
        if (!only_results) {
            msgs.push_back(m);
        }
        for (size_t t = 0; t < tool_messages.size(); ++t) {
            msgs.push_back(tool_messages[t]);
        }
    }
    body["messages"] = msgs;
    return body;
}

// ============================================================================
// Stream
// ============================================================================

namespace {

class LlamaCppStream : public QueuedAgentStream {
public:
    LlamaCppStream(const LlamaCppSettings& settings, const StreamRequest& request,
                   CompactionHook* hook, WakeSignal& wake)
        : QueuedAgentStream(wake)
        , settings_(settings)
        , request_(request)
        , hook_(hook)
    {
        thread_ = std::thread(&LlamaCppStream::run, this);
    }

    ~LlamaCppStream() override {
        stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void run() {
        int64_t estimate = estimate_history_tokens(request_.history) + estimate_tokens(request_.system_prompt);
        if (hook_ && !hook_->allow_request(estimate)) {
            deliver(BackendEvent::make_error("request would exceed the context threshold",
                                             CancelReason::COMPACTION));
            mark_done();
            return;
        }

        std::string endpoint = settings_.server_url + "/v1/chat/completions";
        std::string body = build_chat_request(request_, settings_).dump();
        LOG_DEBUG("[LlamaCpp] Streaming request to %s (%zu bytes, ~%lld tokens)",
                  endpoint.c_str(), body.size(), static_cast<long long>(estimate));

        // Provisional call start; the server's own prompt count replaces it when it arrives
        deliver(BackendEvent::make_usage(UsageUpdate::start(0, estimate)));

        std::map<std::string, std::string> headers;
        headers["Content-Type"] = "application/json";
        if (!settings_.api_key.empty()) {
            headers["Authorization"] = "Bearer " + settings_.api_key;
        }

        SseLineBuffer sse;
        std::string text;
        UsageUpdate usage = UsageUpdate::delta(0, estimate, 0);
        bool has_usage = false;
        bool final_sent = false;
        std::string stream_error;

        HttpClient http;
        HttpResponse response = http.post_stream(endpoint, body, headers,
            [&](const char* data, size_t len) -> bool {
                std::vector<std::string> payloads = sse.feed(data, len);
                for (size_t i = 0; i < payloads.size(); ++i) {
                    if (!handle_payload(payloads[i], text, usage, has_usage, final_sent, stream_error)) {
                        return false;
                    }
                }
                return true;
            },
            [this]() -> bool { return is_cancelled(); });

        if (response.aborted || is_cancelled()) {
            // cancel() already queued the terminal event
            mark_done();
            return;
        }

        std::vector<std::string> rest = sse.finish();
        for (size_t i = 0; i < rest.size() && !final_sent; ++i) {
            handle_payload(rest[i], text, usage, has_usage, final_sent, stream_error);
        }

        if (!stream_error.empty()) {
            LOG_ERROR("[LlamaCpp] Server reported: %s", stream_error.c_str());
            deliver(BackendEvent::make_error(stream_error));
        } else if (response.status_code == 0) {
            LOG_ERROR("[LlamaCpp] HTTP request failed: %s", response.error.c_str());
            deliver(BackendEvent::make_error("HTTP request failed: " + response.error));
        } else if (response.status_code != 200) {
            std::string message = "API error";
            Json err = response.json();
            if (err.is_object() && err.contains("error") && err["error"].is_object()) {
                message = err["error"].value("message", message);
            }
            LOG_ERROR("[LlamaCpp] API error: %s (HTTP %d)", message.c_str(), response.status_code);
            deliver(BackendEvent::make_error(message + " (HTTP " + std::to_string(response.status_code) + ")"));
        } else if (!final_sent) {
            send_final(text, usage, has_usage);
        }
        mark_done();
    }

    // False stops the transfer
    bool handle_payload(const std::string& payload, std::string& text, UsageUpdate& usage,
                        bool& has_usage, bool& final_sent, std::string& stream_error) {
        LlamaCppDelta delta;
        if (!parse_stream_chunk(payload, delta)) {
            LOG_DEBUG("[LlamaCpp] Skipping unparsable chunk: %.200s", payload.c_str());
            return true;
        }
        if (!delta.error.empty()) {
            stream_error = delta.error;
            return false;
        }
        if (!delta.content.empty()) {
            text += delta.content;
            deliver(BackendEvent::make_text(delta.content));
        }
        if (delta.has_usage) {
            usage = UsageUpdate::delta(0, delta.prompt_tokens, delta.completion_tokens);
            has_usage = true;
            if (!deliver(BackendEvent::make_usage(usage))) return false;
        }
        if (delta.done) {
            send_final(text, usage, has_usage);
            final_sent = true;
            return false;
        }
        return !is_cancelled();
    }

    void send_final(const std::string& text, UsageUpdate usage, bool has_usage) {
        if (!has_usage) {
            usage.output_tokens = estimate_tokens(text);
        }
        LOG_DEBUG("[LlamaCpp] Response complete: %zu chars, %lld in / %lld out",
                  text.size(), static_cast<long long>(usage.input_tokens),
                  static_cast<long long>(usage.output_tokens));
        deliver(BackendEvent::make_final(usage));
    }

    LlamaCppSettings settings_;
    StreamRequest request_;
    CompactionHook* hook_;
    std::thread thread_;
};

class LlamaCppAgent : public BackendAgent {
public:
    explicit LlamaCppAgent(const LlamaCppSettings& settings) : settings_(settings) {}

    std::unique_ptr<AgentStream> stream(const StreamRequest& request,
                                        CompactionHook* hook,
                                        WakeSignal& wake) override {
        return std::unique_ptr<AgentStream>(new LlamaCppStream(settings_, request, hook, wake));
    }

private:
    LlamaCppSettings settings_;
};

} // namespace

// ============================================================================
// LlamaCppBackend
// ============================================================================

LlamaCppBackend::LlamaCppBackend()
    : initialized_(false)
{}

bool LlamaCppBackend::init(const Config& cfg) {
    settings_.server_url = cfg.get_string("llamacpp.url", "http://localhost:8080");
    settings_.api_key = cfg.get_string("llamacpp.api_key", "");

    std::string model = cfg.get_string("llamacpp.model", "");
    if (!model.empty()) {
        settings_.model = model;
    }

    settings_.context_size = cfg.get_int("llamacpp.context_size", 4096);
    settings_.max_tokens = cfg.get_int("llamacpp.max_tokens", 0);

    // Remove trailing slash from URL
    while (!settings_.server_url.empty() && settings_.server_url[settings_.server_url.length() - 1] == '/') {
        settings_.server_url = settings_.server_url.substr(0, settings_.server_url.length() - 1);
    }

    if (settings_.context_size <= 0) {
        LOG_ERROR("[LlamaCpp] llamacpp.context_size must be positive (got %lld)",
                  static_cast<long long>(settings_.context_size));
        return false;
    }

    LOG_INFO("[LlamaCpp] Backend initialized with server: %s, model: %s, context: %lld tokens",
             settings_.server_url.c_str(), settings_.model.c_str(),
             static_cast<long long>(settings_.context_size));
    initialized_ = true;
    return true;
}

std::unique_ptr<BackendAgent> LlamaCppBackend::create_agent() {
    return std::unique_ptr<BackendAgent>(new LlamaCppAgent(settings_));
}

} // namespace convoflow
