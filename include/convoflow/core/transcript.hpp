/*
 * convoflow C++ - Transcript (de)serialization
 *
 * The turn-shaped data a persistence collaborator stores and hands back.
 * One envelope per message:
 *
 *   {"type": "user" | "assistant",
 *    "message": {"role": "...", "content": [blocks] | "text"}}
 *
 * Blocks: text, tool_use, tool_result, thinking (skipped on read). Other
 * roles and block kinds are dropped without error.
 */
#ifndef convoflow_CORE_TRANSCRIPT_HPP
#define convoflow_CORE_TRANSCRIPT_HPP

#include <convoflow/ai/ai.hpp>
#include <convoflow/core/json.hpp>
#include <string>
#include <vector>

namespace convoflow {

struct ParseResult {
    bool success;
    std::string error;
    std::vector<ConversationMessage> messages;
    size_t dropped;             // envelopes with an unsupported role or no usable content

    ParseResult() : success(false), dropped(0) {}

    static ParseResult fail(const std::string& err) {
        ParseResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

Json message_to_envelope(const ConversationMessage& message);

// Returns false when the envelope's role is not user/assistant or it
// carries nothing the session keeps. Malformed JSON types throw
// nlohmann::json exceptions; parse_envelopes catches them.
bool envelope_to_message(const Json& envelope, ConversationMessage& out);

ParseResult parse_envelopes(const std::vector<Json>& envelopes);

// A JSON array of envelopes, as stored by SessionStore
ParseResult parse_envelope_array(const std::string& text);

// System messages are not part of a transcript and are skipped.
std::vector<Json> messages_to_envelopes(const std::vector<ConversationMessage>& messages);

// Rebuild turns from a flat history: a user text message opens a turn,
// assistant tool_use blocks and user tool_result blocks attach to it, and
// assistant text becomes its response. Unpaired calls/results are dropped.
std::vector<ConversationTurn> convert_messages_to_turns(const std::vector<ConversationMessage>& messages);

} // namespace convoflow

#endif // convoflow_CORE_TRANSCRIPT_HPP
