/*
 * convoflow C++ - Preservation Context
 *
 * The facts a conversation needs to continue after its older turns have
 * been summarized away: files in play, the user's current goals, recent
 * failures, the build status and what the user asked for last.
 *
 * Always extracted fresh from the whole conversation.
 */
#ifndef convoflow_CORE_PRESERVATION_CONTEXT_HPP
#define convoflow_CORE_PRESERVATION_CONTEXT_HPP

#include <convoflow/core/json.hpp>
#include <convoflow/core/turn.hpp>
#include <string>
#include <vector>

namespace convoflow {

enum class BuildStatus {
    PASSING,
    FAILING,
    UNKNOWN
};

// "passing", "failing", "unknown"
const char* build_status_name(BuildStatus status);

struct PreservationContext {
    std::vector<std::string> active_files;      // unique, first-seen order
    std::vector<std::string> current_goals;     // at most 3, chronological
    std::vector<std::string> error_states;
    BuildStatus build_status;
    std::string last_user_intent;

    PreservationContext() : build_status(BuildStatus::UNKNOWN) {}

    static PreservationContext extract_from_turns(const std::vector<ConversationTurn>& turns);

    // "Active files: a, b\nGoals: g1; g2\nBuild: passing"
    // followed by "Errors: ..." and "Last request: ..." lines when present.
    std::string format_for_summary() const;

    Json to_json() const;
};

} // namespace convoflow

#endif // convoflow_CORE_PRESERVATION_CONTEXT_HPP
