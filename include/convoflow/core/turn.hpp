/*
 * convoflow C++ - Conversation turns
 *
 * A turn is one user message plus everything the assistant produced in
 * answer to it: tool calls, their results and the final text. Turns are
 * the unit the compactor works on.
 */
#ifndef convoflow_CORE_TURN_HPP
#define convoflow_CORE_TURN_HPP

#include <convoflow/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace convoflow {

struct ToolCall {
    std::string tool;           // "Edit", "Write", "Bash", "WebSearch", ...
    std::string id;             // Backend-assigned call id
    Json parameters;

    ToolCall() : parameters(Json::object()) {}
    ToolCall(const std::string& t, const std::string& i, const Json& params)
        : tool(t), id(i), parameters(params) {}

    // "file_path" (or "path" / "notebook_path") parameter, empty if absent
    std::string file_path() const;
    // Last component of file_path()
    std::string filename() const;

    bool modifies_files() const;
    bool is_search() const;
    bool is_shell() const;
};

struct ToolResult {
    std::string tool_use_id;    // Id of the ToolCall this answers
    bool success;
    std::string output;
    std::string error;

    ToolResult() : success(true) {}
    ToolResult(const std::string& id, bool ok, const std::string& out)
        : tool_use_id(id), success(ok), output(out) {}
};

struct ConversationTurn {
    std::string user_message;
    std::vector<ToolCall> tool_calls;
    std::vector<ToolResult> tool_results;
    std::string assistant_response;
    int64_t tokens;
    int64_t timestamp;          // unix ms
    bool previous_error;        // the turn before this one ended with a failed tool result

    ConversationTurn() : tokens(0), timestamp(0), previous_error(false) {}

    bool has_failed_result() const;
    bool has_successful_result() const;
};

// Every result must answer a call of the same turn and every call must have
// a result. Returns an empty string when the pairing holds, else a description
// of the first orphan found.
std::string check_tool_pairing(const ConversationTurn& turn);

// A tool output that reports failure in-band: a JSON object with
// "success": false or a non-empty "error" field.
bool output_reports_error(const std::string& output);

} // namespace convoflow

#endif // convoflow_CORE_TURN_HPP
