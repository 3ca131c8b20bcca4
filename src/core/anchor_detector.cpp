#include <convoflow/core/anchor_detector.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/utils.hpp>

namespace convoflow {

const char* anchor_type_name(AnchorType type) {
    switch (type) {
        case AnchorType::ERROR_RESOLUTION: return "ErrorResolution";
        case AnchorType::TASK_COMPLETION: return "TaskCompletion";
        case AnchorType::FEATURE_MILESTONE: return "FeatureMilestone";
        case AnchorType::USER_CHECKPOINT: return "UserCheckpoint";
        default: return "Unknown";
    }
}

double anchor_type_weight(AnchorType type) {
    switch (type) {
        case AnchorType::ERROR_RESOLUTION: return 0.9;
        case AnchorType::TASK_COMPLETION: return 0.8;
        case AnchorType::FEATURE_MILESTONE: return 0.75;
        case AnchorType::USER_CHECKPOINT: return 0.7;
        default: return 0.7;
    }
}

// ============================================================================
// Turn predicates
// ============================================================================

static bool contains_any(const std::string& lower_text, const char* const* needles) {
    for (size_t i = 0; needles[i]; ++i) {
        if (lower_text.find(needles[i]) != std::string::npos) return true;
    }
    return false;
}

static const char* const PASS_TERMS[] = { "pass", "success", nullptr };

static const char* const SYNTHESIS_MARKERS[] = {
    "based on", "according to", "the search results", "the results show", "i found that", nullptr
};

static const char* const MILESTONE_KEYWORDS[] = {
    "installed", "built", "compiled", "completed", "successfully", nullptr
};

static const size_t MIN_SEARCH_RESULT_CHARS = 100;

bool has_test_success(const ConversationTurn& turn) {
    for (size_t i = 0; i < turn.tool_results.size(); ++i) {
        const ToolResult& r = turn.tool_results[i];
        if (!r.success) continue;
        std::string lower = to_lower(r.output);
        if (lower.find("test") != std::string::npos && contains_any(lower, PASS_TERMS)) {
            return true;
        }
    }
    return false;
}

bool has_file_modification(const ConversationTurn& turn) {
    for (size_t i = 0; i < turn.tool_calls.size(); ++i) {
        if (turn.tool_calls[i].modifies_files()) return true;
    }
    return false;
}

static bool has_search_call(const ConversationTurn& turn) {
    for (size_t i = 0; i < turn.tool_calls.size(); ++i) {
        if (turn.tool_calls[i].is_search()) return true;
    }
    return false;
}

static bool has_shell_call(const ConversationTurn& turn) {
    for (size_t i = 0; i < turn.tool_calls.size(); ++i) {
        if (turn.tool_calls[i].is_shell()) return true;
    }
    return false;
}

static bool is_error_resolution(const ConversationTurn& turn) {
    return turn.previous_error && has_file_modification(turn) && has_test_success(turn);
}

static bool is_code_completion(const ConversationTurn& turn) {
    return !turn.previous_error && has_file_modification(turn) && has_test_success(turn);
}

static bool is_search_synthesis(const ConversationTurn& turn) {
    if (!has_search_call(turn)) return false;

    bool substantial = false;
    for (size_t i = 0; i < turn.tool_results.size(); ++i) {
        const ToolResult& r = turn.tool_results[i];
        if (r.success && r.output.size() > MIN_SEARCH_RESULT_CHARS) {
            substantial = true;
            break;
        }
    }
    return substantial && contains_any(to_lower(turn.assistant_response), SYNTHESIS_MARKERS);
}

static bool is_shell_milestone(const ConversationTurn& turn) {
    if (!has_shell_call(turn)) return false;
    for (size_t i = 0; i < turn.tool_results.size(); ++i) {
        const ToolResult& r = turn.tool_results[i];
        if (r.success && contains_any(to_lower(r.output), MILESTONE_KEYWORDS)) {
            return true;
        }
    }
    return false;
}

static AnchorPattern make_pattern(const char* name, AnchorType type, double confidence,
                                  double weight, const char* description, TurnPredicate matches) {
    AnchorPattern p;
    p.name = name;
    p.type = type;
    p.confidence = confidence;
    p.weight = weight;
    p.description = description;
    p.matches = matches;
    return p;
}

// ============================================================================
// AnchorDetector
// ============================================================================

std::vector<AnchorPattern> AnchorDetector::default_patterns() {
    std::vector<AnchorPattern> patterns;
    patterns.push_back(make_pattern("error_resolution", AnchorType::ERROR_RESOLUTION, 0.95, 0.9,
                                    "Build error fixed and tests now pass", is_error_resolution));
    patterns.push_back(make_pattern("code_completion", AnchorType::TASK_COMPLETION, 0.92, 0.8,
                                    "File changes implemented and tests pass", is_code_completion));
    patterns.push_back(make_pattern("search_synthesis", AnchorType::TASK_COMPLETION, 0.85, 0.75,
                                    "Web search results synthesized into an answer", is_search_synthesis));
    patterns.push_back(make_pattern("shell_milestone", AnchorType::TASK_COMPLETION, 0.88, 0.8,
                                    "Bash milestone reached", is_shell_milestone));
    return patterns;
}

AnchorDetector::AnchorDetector(double min_confidence)
    : min_confidence_(min_confidence)
    , patterns_(default_patterns())
{}

void AnchorDetector::add_pattern(const AnchorPattern& pattern) {
    patterns_.push_back(pattern);
}

bool AnchorDetector::detect(const ConversationTurn& turn, size_t turn_index, AnchorPoint& out) const {
    for (size_t i = 0; i < patterns_.size(); ++i) {
        const AnchorPattern& p = patterns_[i];
        if (!p.matches || !p.matches(turn)) continue;

        // First match decides; a gated-out match does not fall through
        if (p.confidence < min_confidence_) {
            LOG_DEBUG("[AnchorDetector] Turn %zu matched '%s' below min confidence (%.2f < %.2f)",
                      turn_index, p.name.c_str(), p.confidence, min_confidence_);
            return false;
        }

        out = AnchorPoint();
        out.turn_index = turn_index;
        out.type = p.type;
        out.weight = p.weight;
        out.confidence = p.confidence;
        out.description = p.description;
        out.timestamp = turn.timestamp;
        out.synthetic = false;
        return true;
    }
    return false;
}

std::vector<AnchorPoint> AnchorDetector::detect_historical_anchors(const std::vector<ConversationTurn>& turns) const {
    std::vector<AnchorPoint> anchors;
    for (size_t i = 0; i < turns.size(); ++i) {
        AnchorPoint anchor;
        if (detect(turns[i], i, anchor)) {
            LOG_DEBUG("[AnchorDetector] %s anchor at turn %zu (confidence %.2f)",
                      anchor_type_name(anchor.type), i, anchor.confidence);
            anchors.push_back(anchor);
        }
    }
    return anchors;
}

AnchorPoint AnchorDetector::synthetic_checkpoint(const std::vector<ConversationTurn>& turns) {
    AnchorPoint anchor;
    anchor.turn_index = turns.empty() ? 0 : turns.size() - 1;
    anchor.type = AnchorType::USER_CHECKPOINT;
    anchor.weight = anchor_type_weight(AnchorType::USER_CHECKPOINT);
    anchor.confidence = 0.8;
    anchor.description = "Synthetic checkpoint (no natural anchors detected)";
    anchor.timestamp = turns.empty() ? 0 : turns.back().timestamp;
    anchor.synthetic = true;
    return anchor;
}

} // namespace convoflow
