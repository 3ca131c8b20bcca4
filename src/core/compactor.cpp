#include <convoflow/core/compactor.hpp>
#include <convoflow/core/config.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/token_tracker.hpp>
#include <convoflow/core/utils.hpp>

#include <cstdio>
#include <stdexcept>

namespace convoflow {

const char* const CONTINUATION_MESSAGE =
    "This session is being continued from a previous conversation that ran out of context.";

const char* migration_strategy_name(MigrationStrategy strategy) {
    switch (strategy) {
        case MigrationStrategy::ANCHOR_POINT_ONLY: return "AnchorPointOnly";
        case MigrationStrategy::LEGACY_FALLBACK: return "LegacyFallback";
        default: return "Unknown";
    }
}

CompactorConfig CompactorConfig::from_config(const Config& cfg) {
    CompactorConfig c;
    c.anchor_min_confidence = cfg.get_double("compaction.anchor_min_confidence", c.anchor_min_confidence);
    c.min_compression_ratio = cfg.get_double("compaction.min_compression_ratio", c.min_compression_ratio);
    return c;
}

Compactor::Compactor() {}

Compactor::Compactor(const CompactorConfig& config)
    : config_(config)
{}

size_t Compactor::tail_size(size_t turn_count) {
    if (turn_count >= 4) return 3;
    if (turn_count == 3) return 2;
    return turn_count;
}

// ============================================================================
// Analysis
// ============================================================================

ConversationFlow Compactor::analyze(const std::vector<ConversationTurn>& turns) const {
    ConversationFlow flow;
    flow.turns = turns;

    AnchorDetector detector(config_.anchor_min_confidence);
    flow.anchor_points = detector.detect_historical_anchors(turns);

    if (flow.anchor_points.empty() && !turns.empty()) {
        flow.synthetic_anchor = AnchorDetector::synthetic_checkpoint(turns);
        flow.has_synthetic_anchor = true;
        flow.anchor_points.push_back(flow.synthetic_anchor);
        flow.migration_strategy = MigrationStrategy::LEGACY_FALLBACK;
    } else {
        flow.migration_strategy = MigrationStrategy::ANCHOR_POINT_ONLY;
    }

    for (size_t i = 0; i < turns.size(); ++i) {
        flow.total_tokens += turns[i].tokens;
    }

    flow.preservation_context = PreservationContext::extract_from_turns(turns);
    return flow;
}

// ============================================================================
// Summary generation
// ============================================================================

static std::string first_sentence(const std::string& text) {
    std::string trimmed = trim(text);
    size_t period = trimmed.find('.');
    if (period == std::string::npos) return trimmed;
    return trimmed.substr(0, period);
}

std::string Compactor::turn_to_outcome(const ConversationTurn& turn, bool is_anchor) const {
    if (is_anchor) {
        return "[ANCHOR] " + truncate_safe(turn.assistant_response, config_.max_anchor_chars);
    }

    std::vector<std::string> files;
    for (size_t i = 0; i < turn.tool_calls.size(); ++i) {
        const ToolCall& call = turn.tool_calls[i];
        if (!call.modifies_files()) continue;
        std::string name = call.filename();
        if (!name.empty()) {
            files.push_back(name);
        }
    }

    // Only a tool result that succeeded earns the check mark; plain chat gets the cross
    bool ok = turn.has_successful_result();

    std::string line = ok ? "\xE2\x9C\x93 " : "\xE2\x9C\x97 ";
    if (!files.empty()) {
        line += "Modified " + join(files, ", ") + ": ";
    }
    line += truncate_safe(first_sentence(turn.assistant_response), config_.max_outcome_chars);
    return line;
}

// ============================================================================
// History rebuild
// ============================================================================

void Compactor::append_turn_messages(const ConversationTurn& turn, std::vector<ConversationMessage>& out) {
    out.push_back(ConversationMessage::user(turn.user_message));

    if (!turn.tool_calls.empty()) {
        ConversationMessage use;
        use.role = MessageRole::ASSISTANT;
        for (size_t i = 0; i < turn.tool_calls.size(); ++i) {
            use.content.push_back(ContentBlock::make_tool_use(turn.tool_calls[i]));
        }
        out.push_back(use);

        ConversationMessage results;
        results.role = MessageRole::USER;
        for (size_t i = 0; i < turn.tool_results.size(); ++i) {
            results.content.push_back(ContentBlock::make_tool_result(turn.tool_results[i]));
        }
        out.push_back(results);
    }

    if (!turn.assistant_response.empty()) {
        out.push_back(ConversationMessage::assistant(turn.assistant_response));
    }
}

std::vector<ConversationMessage> Compactor::rebuild_history(const std::vector<ConversationTurn>& kept,
                                                            const std::string& summary) {
    std::vector<ConversationMessage> messages;
    for (size_t i = 0; i < kept.size(); ++i) {
        append_turn_messages(kept[i], messages);
    }
    messages.push_back(ConversationMessage::user(summary));
    messages.push_back(ConversationMessage::user(CONTINUATION_MESSAGE));
    return messages;
}

// ============================================================================
// Compaction
// ============================================================================

CompactionResult Compactor::compact(const std::vector<ConversationTurn>& turns,
                                    const std::vector<ConversationMessage>& original_history) const {
    if (turns.empty()) {
        return CompactionResult::fail("nothing to compact");
    }

    for (size_t i = 0; i < turns.size(); ++i) {
        std::string orphan = check_tool_pairing(turns[i]);
        if (!orphan.empty()) {
            LOG_ERROR("[Compactor] Turn %zu failed pairing check: %s", i, orphan.c_str());
            return CompactionResult::fail("turn " + std::to_string(i) + ": " + orphan);
        }
    }

    try {
        ConversationFlow flow = analyze(turns);
        const AnchorPoint& boundary_anchor = flow.anchor_points.back();

        size_t n = turns.size();
        size_t kept_start = n - tail_size(n);
        size_t boundary = boundary_anchor.turn_index < kept_start ? boundary_anchor.turn_index : kept_start;

        LOG_DEBUG("[Compactor] %zu turns, %zu anchor(s), strategy %s, boundary %zu",
                  n, flow.anchor_points.size(), migration_strategy_name(flow.migration_strategy), boundary);

        std::vector<std::string> outcomes;
        for (size_t i = 0; i < boundary; ++i) {
            bool is_anchor = false;
            if (!flow.has_synthetic_anchor) {
                for (size_t a = 0; a < flow.anchor_points.size(); ++a) {
                    if (flow.anchor_points[a].turn_index == i) {
                        is_anchor = true;
                        break;
                    }
                }
            }
            outcomes.push_back(turn_to_outcome(turns[i], is_anchor));
        }

        CompactionResult result;
        result.kept_turns.assign(turns.begin() + boundary, turns.end());

        if (outcomes.empty()) {
            result.summary = "No turns summarized.";
        } else {
            result.summary = flow.preservation_context.format_for_summary() +
                             "\n\nKey outcomes:\n" + join(outcomes, "\n");
        }

        result.messages = rebuild_history(result.kept_turns, result.summary);

        std::vector<ConversationMessage> before = original_history;
        if (before.empty()) {
            for (size_t i = 0; i < turns.size(); ++i) {
                append_turn_messages(turns[i], before);
            }
        }

        CompactionMetrics& m = result.metrics;
        m.original_tokens = estimate_history_tokens(before);
        m.compacted_tokens = estimate_history_tokens(result.messages);
        if (m.compacted_tokens > m.original_tokens) {
            LOG_WARN("[Compactor] Compacted history (%lld tokens) is larger than the original (%lld), capping",
                     static_cast<long long>(m.compacted_tokens), static_cast<long long>(m.original_tokens));
            m.compacted_tokens = m.original_tokens;
        }
        if (m.original_tokens > 0) {
            m.compression_ratio = clamp(1.0 - static_cast<double>(m.compacted_tokens) /
                                              static_cast<double>(m.original_tokens), 0.0, 1.0);
        }
        m.turns_summarized = boundary;
        m.turns_kept = result.kept_turns.size();

        if (m.compression_ratio < config_.min_compression_ratio) {
            char buf[160];
            snprintf(buf, sizeof(buf),
                     "Compression ratio below %.0f%% (%.1f%%) - consider starting fresh conversation",
                     config_.min_compression_ratio * 100.0, m.compression_ratio * 100.0);
            LOG_WARN("[Compactor] %s", buf);
            result.warnings.push_back(buf);
        }

        result.anchor = boundary_anchor;
        result.has_anchor = true;
        result.anchors = flow.anchor_points;
        result.migration_strategy = flow.migration_strategy;
        result.success = true;

        LOG_INFO("[Compactor] Compacted %zu turns into summary, kept %zu (%lld -> %lld tokens)",
                 m.turns_summarized, m.turns_kept,
                 static_cast<long long>(m.original_tokens), static_cast<long long>(m.compacted_tokens));
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("[Compactor] Compaction failed: %s", e.what());
        return CompactionResult::fail(std::string("compaction failed: ") + e.what());
    }
}

} // namespace convoflow
