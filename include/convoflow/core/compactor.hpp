/*
 * convoflow C++ - Compactor
 *
 * Replaces older conversation turns with a condensed summary:
 *
 *   1. keep the most recent 2-3 turns verbatim
 *   2. detect anchors over the whole conversation (synthetic checkpoint
 *      at the last turn when there are none)
 *   3. extract the preservation context from all turns
 *   4. boundary = most recent anchor, pulled back to the kept tail
 *   5. one outcome line per summarized turn, anchors in full
 *   6. rebuild the message history and measure it
 *
 * Compaction is all-or-nothing: on failure the result carries an error
 * and the caller's state must stay as it was.
 */
#ifndef convoflow_CORE_COMPACTOR_HPP
#define convoflow_CORE_COMPACTOR_HPP

#include <convoflow/ai/ai.hpp>
#include <convoflow/core/anchor_detector.hpp>
#include <convoflow/core/preservation_context.hpp>
#include <string>
#include <vector>

namespace convoflow {

class Config;

// Appended after the summary so the model knows the history was cut.
extern const char* const CONTINUATION_MESSAGE;

enum class MigrationStrategy {
    ANCHOR_POINT_ONLY,      // boundary from a natural anchor
    LEGACY_FALLBACK         // no natural anchor, synthetic checkpoint used
};

const char* migration_strategy_name(MigrationStrategy strategy);

// ============================================================================
// Compactor Configuration
// ============================================================================

struct CompactorConfig {
    double anchor_min_confidence;    // Minimum pattern confidence for an anchor (default: 0.9)
    double min_compression_ratio;    // Below this a warning is attached (default: 0.6)
    size_t max_outcome_chars;        // First-sentence limit per summarized turn
    size_t max_anchor_chars;         // Assistant text kept for an anchor turn

    CompactorConfig()
        : anchor_min_confidence(0.9)
        , min_compression_ratio(0.6)
        , max_outcome_chars(150)
        , max_anchor_chars(500) {}

    // compaction.anchor_min_confidence, compaction.min_compression_ratio
    static CompactorConfig from_config(const Config& cfg);
};

struct CompactionMetrics {
    int64_t original_tokens;
    int64_t compacted_tokens;
    double compression_ratio;        // 1 - compacted/original, in [0, 1]
    size_t turns_summarized;
    size_t turns_kept;

    CompactionMetrics()
        : original_tokens(0)
        , compacted_tokens(0)
        , compression_ratio(0.0)
        , turns_summarized(0)
        , turns_kept(0) {}
};

// Working set of one compaction pass
struct ConversationFlow {
    std::vector<ConversationTurn> turns;
    std::vector<AnchorPoint> anchor_points;     // natural anchors, or the single synthetic one
    int64_t total_tokens;
    PreservationContext preservation_context;
    MigrationStrategy migration_strategy;
    bool has_synthetic_anchor;
    AnchorPoint synthetic_anchor;

    ConversationFlow()
        : total_tokens(0)
        , migration_strategy(MigrationStrategy::ANCHOR_POINT_ONLY)
        , has_synthetic_anchor(false) {}
};

struct CompactionResult {
    bool success;
    std::string error;

    std::vector<ConversationTurn> kept_turns;
    std::vector<ConversationMessage> messages;  // rebuilt history
    std::string summary;
    CompactionMetrics metrics;
    AnchorPoint anchor;                         // boundary anchor
    bool has_anchor;
    std::vector<AnchorPoint> anchors;
    MigrationStrategy migration_strategy;
    std::vector<std::string> warnings;

    CompactionResult()
        : success(false)
        , has_anchor(false)
        , migration_strategy(MigrationStrategy::ANCHOR_POINT_ONLY) {}

    static CompactionResult fail(const std::string& err) {
        CompactionResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// ============================================================================
// Compactor
// ============================================================================

class Compactor {
public:
    Compactor();
    explicit Compactor(const CompactorConfig& config);

    const CompactorConfig& config() const { return config_; }

    // Anchors, preservation context and strategy for `turns`.
    ConversationFlow analyze(const std::vector<ConversationTurn>& turns) const;

    // `original_history` is the message history being replaced; its token
    // estimate is the "before" side of the metrics. When empty it is
    // rebuilt from `turns`.
    CompactionResult compact(const std::vector<ConversationTurn>& turns,
                             const std::vector<ConversationMessage>& original_history) const;

    // Number of most recent turns never summarized: 3 from four turns up,
    // 2 for three turns, all of them below that.
    static size_t tail_size(size_t turn_count);

    // Kept turns as message pairs, then the summary, then CONTINUATION_MESSAGE.
    static std::vector<ConversationMessage> rebuild_history(const std::vector<ConversationTurn>& kept,
                                                            const std::string& summary);

    // Messages for one turn: user text, tool use / tool result exchange, assistant text.
    static void append_turn_messages(const ConversationTurn& turn,
                                     std::vector<ConversationMessage>& out);

    std::string turn_to_outcome(const ConversationTurn& turn, bool is_anchor) const;

private:
    CompactorConfig config_;
};

} // namespace convoflow

#endif // convoflow_CORE_COMPACTOR_HPP
