#include <convoflow/core/preservation_context.hpp>
#include <convoflow/core/utils.hpp>

#include <algorithm>

namespace convoflow {

const char* build_status_name(BuildStatus status) {
    switch (status) {
        case BuildStatus::PASSING: return "passing";
        case BuildStatus::FAILING: return "failing";
        default: return "unknown";
    }
}

static const size_t MAX_GOALS = 3;
static const size_t MAX_GOAL_CHARS = 100;
static const size_t MAX_ERROR_CHARS = 100;
static const size_t MAX_INTENT_CHARS = 200;

static const char* const GOAL_PHRASES[] = {
    "help me", "i want to", "i need to", "please", nullptr
};

static bool is_goal_message(const std::string& lower) {
    for (size_t i = 0; GOAL_PHRASES[i]; ++i) {
        if (lower.find(GOAL_PHRASES[i]) != std::string::npos) return true;
    }
    return false;
}

static std::string goal_text(const std::string& message) {
    std::string text = trim(message);
    size_t period = text.find('.');
    if (period != std::string::npos) {
        text = text.substr(0, period);
    }
    return trim(truncate_safe(text, MAX_GOAL_CHARS));
}

static void add_unique(std::vector<std::string>& list, const std::string& value) {
    if (value.empty()) return;
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

static void update_build_status(const ToolResult& result, BuildStatus& status) {
    std::string lower = to_lower(result.output);
    bool mentions_failure = lower.find("fail") != std::string::npos ||
                            lower.find("error") != std::string::npos;
    bool mentions_test = lower.find("test") != std::string::npos;
    bool mentions_build = lower.find("build") != std::string::npos;

    if (mentions_failure && (mentions_test || mentions_build || !result.success)) {
        status = BuildStatus::FAILING;
    } else if (mentions_test &&
               (lower.find("pass") != std::string::npos || lower.find("success") != std::string::npos)) {
        status = BuildStatus::PASSING;
    }
}

PreservationContext PreservationContext::extract_from_turns(const std::vector<ConversationTurn>& turns) {
    PreservationContext ctx;
    std::vector<std::string> goals;

    for (size_t t = 0; t < turns.size(); ++t) {
        const ConversationTurn& turn = turns[t];

        for (size_t i = 0; i < turn.tool_calls.size(); ++i) {
            add_unique(ctx.active_files, turn.tool_calls[i].filename());
        }

        for (size_t i = 0; i < turn.tool_results.size(); ++i) {
            const ToolResult& r = turn.tool_results[i];
            bool failed = !r.success || output_reports_error(r.output);
            if (failed) {
                std::string source = r.output.empty() ? r.error : r.output;
                std::string line = truncate_safe(first_line(source), MAX_ERROR_CHARS);
                if (!line.empty()) {
                    ctx.error_states.push_back(line);
                }
            }
            update_build_status(r, ctx.build_status);
        }

        if (!turn.user_message.empty() && is_goal_message(to_lower(turn.user_message))) {
            add_unique(goals, goal_text(turn.user_message));
        }
    }

    if (goals.size() > MAX_GOALS) {
        goals.erase(goals.begin(), goals.end() - MAX_GOALS);
    }
    ctx.current_goals = goals;

    ctx.last_user_intent = "Continue conversation";
    for (size_t t = turns.size(); t > 0; --t) {
        const std::string& msg = turns[t - 1].user_message;
        if (!trim(msg).empty()) {
            ctx.last_user_intent = truncate_safe(msg, MAX_INTENT_CHARS);
            break;
        }
    }

    return ctx;
}

std::string PreservationContext::format_for_summary() const {
    std::string out;
    out += "Active files: " + (active_files.empty() ? std::string("none") : join(active_files, ", "));
    out += "\nGoals: " + (current_goals.empty() ? std::string("none") : join(current_goals, "; "));
    out += "\nBuild: ";
    out += build_status_name(build_status);
    if (!error_states.empty()) {
        out += "\nErrors: " + join(error_states, "; ");
    }
    if (!last_user_intent.empty()) {
        out += "\nLast request: " + last_user_intent;
    }
    return out;
}

Json PreservationContext::to_json() const {
    Json j = Json::object();
    j["active_files"] = active_files;
    j["current_goals"] = current_goals;
    j["error_states"] = error_states;
    j["build_status"] = build_status_name(build_status);
    j["last_user_intent"] = last_user_intent;
    return j;
}

} // namespace convoflow
