/*
 * convoflow C++ - Anchor Detector
 *
 * Finds milestone turns ("anchors") that make good compaction boundaries.
 * Detection is an ordered list of independent patterns; each pattern is a
 * predicate over one turn plus the anchor it yields. The first matching
 * pattern whose confidence passes the detector's minimum wins.
 */
#ifndef convoflow_CORE_ANCHOR_DETECTOR_HPP
#define convoflow_CORE_ANCHOR_DETECTOR_HPP

#include <convoflow/core/turn.hpp>
#include <functional>
#include <string>
#include <vector>

namespace convoflow {

enum class AnchorType {
    ERROR_RESOLUTION,
    TASK_COMPLETION,
    FEATURE_MILESTONE,
    USER_CHECKPOINT
};

const char* anchor_type_name(AnchorType type);

// ErrorResolution 0.9, TaskCompletion 0.8, FeatureMilestone 0.75, UserCheckpoint 0.7
double anchor_type_weight(AnchorType type);

struct AnchorPoint {
    size_t turn_index;
    AnchorType type;
    double weight;
    double confidence;
    std::string description;
    int64_t timestamp;
    bool synthetic;

    AnchorPoint()
        : turn_index(0)
        , type(AnchorType::USER_CHECKPOINT)
        , weight(0.7)
        , confidence(0.0)
        , timestamp(0)
        , synthetic(false) {}
};

typedef std::function<bool(const ConversationTurn&)> TurnPredicate;

struct AnchorPattern {
    std::string name;
    AnchorType type;
    double confidence;
    double weight;
    std::string description;
    TurnPredicate matches;
};

class AnchorDetector {
public:
    explicit AnchorDetector(double min_confidence = 0.9);

    // ErrorResolution, TaskCompletion (code), TaskCompletion (search),
    // TaskCompletion (shell milestone), in that order.
    static std::vector<AnchorPattern> default_patterns();

    // Appended after the existing patterns.
    void add_pattern(const AnchorPattern& pattern);

    bool detect(const ConversationTurn& turn, size_t turn_index, AnchorPoint& out) const;

    // Every anchor in the conversation, ordered by turn index.
    std::vector<AnchorPoint> detect_historical_anchors(const std::vector<ConversationTurn>& turns) const;

    // UserCheckpoint at the last turn (confidence 0.8). `turns` must not be empty.
    static AnchorPoint synthetic_checkpoint(const std::vector<ConversationTurn>& turns);

    double min_confidence() const { return min_confidence_; }
    const std::vector<AnchorPattern>& patterns() const { return patterns_; }

private:
    double min_confidence_;
    std::vector<AnchorPattern> patterns_;
};

// A successful result whose output mentions tests passing or succeeding.
bool has_test_success(const ConversationTurn& turn);

bool has_file_modification(const ConversationTurn& turn);

} // namespace convoflow

#endif // convoflow_CORE_ANCHOR_DETECTOR_HPP
