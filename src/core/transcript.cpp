#include <convoflow/core/transcript.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/token_tracker.hpp>
#include <convoflow/core/utils.hpp>

#include <set>

namespace convoflow {

// ============================================================================
// Writing
// ============================================================================

static Json block_to_json(const ContentBlock& block) {
    Json j = Json::object();
    switch (block.type) {
        case ContentType::TEXT:
            j["type"] = "text";
            j["text"] = block.text;
            break;
        case ContentType::TOOL_USE:
            j["type"] = "tool_use";
            j["id"] = block.id;
            j["name"] = block.name;
            j["input"] = block.input;
            break;
        case ContentType::TOOL_RESULT:
            j["type"] = "tool_result";
            j["tool_use_id"] = block.id;
            j["content"] = block.text;
            j["is_error"] = block.is_error;
            break;
    }
    return j;
}

Json message_to_envelope(const ConversationMessage& message) {
    std::string role = role_to_string(message.role);

    Json content = Json::array();
    for (size_t i = 0; i < message.content.size(); ++i) {
        content.push_back(block_to_json(message.content[i]));
    }

    Json inner = Json::object();
    inner["role"] = role;
    inner["content"] = content;

    Json envelope = Json::object();
    envelope["type"] = role;
    envelope["message"] = inner;
    return envelope;
}

std::vector<Json> messages_to_envelopes(const std::vector<ConversationMessage>& messages) {
    std::vector<Json> out;
    for (size_t i = 0; i < messages.size(); ++i) {
        if (messages[i].role == MessageRole::SYSTEM) continue;
        out.push_back(message_to_envelope(messages[i]));
    }
    return out;
}

// ============================================================================
// Reading
// ============================================================================

// tool_result content is either a string or a list of text blocks
static std::string tool_result_text(const Json& content) {
    if (content.is_string()) return content.get<std::string>();
    if (!content.is_array()) return "";

    std::string out;
    for (size_t i = 0; i < content.size(); ++i) {
        const Json& part = content[i];
        if (part.is_string()) {
            out += part.get<std::string>();
        } else if (part.is_object() && part.value("type", "") == "text") {
            out += part.value("text", "");
        }
    }
    return out;
}

static bool json_to_block(const Json& j, ContentBlock& out) {
    if (j.is_string()) {
        out = ContentBlock::make_text(j.get<std::string>());
        return true;
    }
    if (!j.is_object()) return false;

    std::string type = j.value("type", "");
    if (type == "text") {
        out = ContentBlock::make_text(j.value("text", ""));
        return true;
    }
    if (type == "tool_use") {
        ContentBlock b;
        b.type = ContentType::TOOL_USE;
        b.id = j.value("id", "");
        b.name = j.value("name", "");
        b.input = j.contains("input") ? j["input"] : Json::object();
        out = b;
        return true;
    }
    if (type == "tool_result") {
        ContentBlock b;
        b.type = ContentType::TOOL_RESULT;
        b.id = j.value("tool_use_id", "");
        b.text = j.contains("content") ? tool_result_text(j["content"]) : std::string();
        b.is_error = j.value("is_error", false);
        out = b;
        return true;
    }
    // thinking, image, document, ...
    return false;
}

bool envelope_to_message(const Json& envelope, ConversationMessage& out) {
    if (!envelope.is_object()) return false;

    // Bare {"role", "content"} messages are accepted as well
    const Json& inner = envelope.contains("message") ? envelope["message"] : envelope;
    if (!inner.is_object()) return false;

    std::string role_name = inner.value("role", envelope.value("type", ""));
    MessageRole role;
    if (!string_to_role(role_name, role) || role == MessageRole::SYSTEM) {
        return false;
    }

    ConversationMessage msg;
    msg.role = role;

    if (inner.contains("content")) {
        const Json& content = inner["content"];
        if (content.is_string()) {
            msg.content.push_back(ContentBlock::make_text(content.get<std::string>()));
        } else if (content.is_array()) {
            for (size_t i = 0; i < content.size(); ++i) {
                ContentBlock block;
                if (json_to_block(content[i], block)) {
                    msg.content.push_back(block);
                }
            }
        }
    }

    if (msg.content.empty()) return false;
    out = msg;
    return true;
}

ParseResult parse_envelopes(const std::vector<Json>& envelopes) {
    ParseResult result;
    try {
        for (size_t i = 0; i < envelopes.size(); ++i) {
            ConversationMessage msg;
            if (envelope_to_message(envelopes[i], msg)) {
                result.messages.push_back(msg);
            } else {
                result.dropped++;
            }
        }
    } catch (const Json::exception& e) {
        return ParseResult::fail(std::string("invalid transcript: ") + e.what());
    }

    if (result.dropped > 0) {
        LOG_DEBUG("[Transcript] Dropped %zu unsupported envelope(s)", result.dropped);
    }
    result.success = true;
    return result;
}

ParseResult parse_envelope_array(const std::string& text) {
    Json doc = Json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return ParseResult::fail("transcript is not valid JSON");
    }
    if (!doc.is_array()) {
        return ParseResult::fail("transcript must be a JSON array");
    }

    std::vector<Json> envelopes;
    for (size_t i = 0; i < doc.size(); ++i) {
        envelopes.push_back(doc[i]);
    }
    return parse_envelopes(envelopes);
}

// ============================================================================
// Turns
// ============================================================================

static void drop_unpaired(ConversationTurn& turn) {
    std::set<std::string> call_ids;
    std::set<std::string> result_ids;
    for (size_t i = 0; i < turn.tool_calls.size(); ++i) call_ids.insert(turn.tool_calls[i].id);
    for (size_t i = 0; i < turn.tool_results.size(); ++i) result_ids.insert(turn.tool_results[i].tool_use_id);

    std::vector<ToolCall> calls;
    for (size_t i = 0; i < turn.tool_calls.size(); ++i) {
        if (result_ids.count(turn.tool_calls[i].id)) calls.push_back(turn.tool_calls[i]);
    }
    std::vector<ToolResult> results;
    for (size_t i = 0; i < turn.tool_results.size(); ++i) {
        if (call_ids.count(turn.tool_results[i].tool_use_id)) results.push_back(turn.tool_results[i]);
    }

    size_t dropped = (turn.tool_calls.size() - calls.size()) + (turn.tool_results.size() - results.size());
    if (dropped > 0) {
        LOG_WARN("[Transcript] Dropped %zu unpaired tool block(s) while rebuilding turns", dropped);
    }
    turn.tool_calls = calls;
    turn.tool_results = results;
}

std::vector<ConversationTurn> convert_messages_to_turns(const std::vector<ConversationMessage>& messages) {
    std::vector<ConversationTurn> turns;
    ConversationTurn current;
    bool open = false;
    bool last_failed = false;

    for (size_t m = 0; m < messages.size(); ++m) {
        const ConversationMessage& msg = messages[m];

        if (msg.role == MessageRole::USER) {
            std::string text;
            for (size_t i = 0; i < msg.content.size(); ++i) {
                const ContentBlock& b = msg.content[i];
                if (b.type == ContentType::TOOL_RESULT) {
                    if (open) {
                        ToolResult r(b.id, !b.is_error, b.text);
                        current.tool_results.push_back(r);
                    }
                } else if (b.type == ContentType::TEXT) {
                    text += b.text;
                }
            }

            if (!text.empty()) {
                if (open) {
                    drop_unpaired(current);
                    last_failed = current.has_failed_result();
                    turns.push_back(current);
                }
                current = ConversationTurn();
                current.user_message = text;
                current.previous_error = last_failed;
                open = true;
            }
        } else if (msg.role == MessageRole::ASSISTANT && open) {
            for (size_t i = 0; i < msg.content.size(); ++i) {
                const ContentBlock& b = msg.content[i];
                if (b.type == ContentType::TOOL_USE) {
                    current.tool_calls.push_back(ToolCall(b.name, b.id, b.input));
                } else if (b.type == ContentType::TEXT) {
                    if (!current.assistant_response.empty()) current.assistant_response += "\n";
                    current.assistant_response += b.text;
                }
            }
        }
    }

    if (open) {
        drop_unpaired(current);
        turns.push_back(current);
    }

    int64_t now = current_timestamp_ms();
    for (size_t i = 0; i < turns.size(); ++i) {
        turns[i].tokens = estimate_tokens(turns[i].user_message) + estimate_tokens(turns[i].assistant_response);
        // Distinct timestamps keep the turns ordered
        turns[i].timestamp = now + static_cast<int64_t>(i);
    }
    return turns;
}

} // namespace convoflow
