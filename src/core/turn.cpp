#include <convoflow/core/turn.hpp>
#include <convoflow/core/utils.hpp>

#include <set>

namespace convoflow {

// ============================================================================
// Tool vocabulary
// ============================================================================

static bool name_in(const std::string& tool, const char* const* names) {
    std::string lower = to_lower(tool);
    for (size_t i = 0; names[i]; ++i) {
        if (lower == names[i]) return true;
    }
    return false;
}

static const char* const FILE_TOOLS[] = { "edit", "write", "multiedit", "notebookedit", nullptr };
static const char* const SEARCH_TOOLS[] = { "websearch", "web_search", "webfetch", "web_fetch", nullptr };
static const char* const SHELL_TOOLS[] = { "bash", "shell", "exec", nullptr };

std::string ToolCall::file_path() const {
    static const char* const keys[] = { "file_path", "path", "notebook_path" };
    if (!parameters.is_object()) return "";
    for (size_t i = 0; i < sizeof(keys) / sizeof(keys[0]); ++i) {
        Json::const_iterator it = parameters.find(keys[i]);
        if (it != parameters.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

std::string ToolCall::filename() const {
    std::string path = file_path();
    if (path.empty()) return "";
    return path_basename(path);
}

bool ToolCall::modifies_files() const { return name_in(tool, FILE_TOOLS); }

bool ToolCall::is_search() const { return name_in(tool, SEARCH_TOOLS); }

bool ToolCall::is_shell() const { return name_in(tool, SHELL_TOOLS); }

// ============================================================================
// ConversationTurn
// ============================================================================

bool ConversationTurn::has_failed_result() const {
    for (size_t i = 0; i < tool_results.size(); ++i) {
        if (!tool_results[i].success) return true;
    }
    return false;
}

bool ConversationTurn::has_successful_result() const {
    for (size_t i = 0; i < tool_results.size(); ++i) {
        if (tool_results[i].success) return true;
    }
    return false;
}

std::string check_tool_pairing(const ConversationTurn& turn) {
    std::set<std::string> call_ids;
    for (size_t i = 0; i < turn.tool_calls.size(); ++i) {
        call_ids.insert(turn.tool_calls[i].id);
    }

    std::set<std::string> answered;
    for (size_t i = 0; i < turn.tool_results.size(); ++i) {
        const std::string& id = turn.tool_results[i].tool_use_id;
        if (call_ids.find(id) == call_ids.end()) {
            return "orphan tool result '" + id + "' has no matching tool call";
        }
        answered.insert(id);
    }

    for (size_t i = 0; i < turn.tool_calls.size(); ++i) {
        if (answered.find(turn.tool_calls[i].id) == answered.end()) {
            return "tool call '" + turn.tool_calls[i].id + "' (" + turn.tool_calls[i].tool +
                   ") has no result";
        }
    }
    return "";
}

bool output_reports_error(const std::string& output) {
    std::string body = trim(output);
    if (body.empty() || body[0] != '{') return false;

    Json parsed = Json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return false;

    Json::const_iterator ok = parsed.find("success");
    if (ok != parsed.end() && ok->is_boolean() && !ok->get<bool>()) {
        return true;
    }
    Json::const_iterator err = parsed.find("error");
    if (err != parsed.end()) {
        if (err->is_string()) return !err->get<std::string>().empty();
        if (err->is_boolean()) return err->get<bool>();
        if (!err->is_null()) return true;
    }
    return false;
}

} // namespace convoflow
