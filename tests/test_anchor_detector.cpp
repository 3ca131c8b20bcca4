#include <convoflow/core/anchor_detector.hpp>
#include <gtest/gtest.h>

using namespace convoflow;

namespace {

ConversationTurn make_turn(const std::string& user, const std::string& tool, const std::string& output,
                           bool success = true, const std::string& response = "Done.") {
    ConversationTurn t;
    t.user_message = user;
    Json params = Json::object();
    params["file_path"] = "src/auth.rs";
    t.tool_calls.push_back(ToolCall(tool, "call_1", params));
    t.tool_results.push_back(ToolResult("call_1", success, output));
    t.assistant_response = response;
    t.timestamp = 1700000000000LL;
    return t;
}

ConversationTurn plain_turn(const std::string& user) {
    ConversationTurn t;
    t.user_message = user;
    t.assistant_response = "Sure.";
    return t;
}

std::string long_search_output() {
    return std::string(150, 'x') + " rust async runtimes compared";
}

} // namespace

TEST(AnchorDetectorTest, CodeCompletionIsTaskCompletion) {
    AnchorDetector detector;
    ConversationTurn t = make_turn("Fix auth", "Edit", "Tests passed: 12 ok");

    AnchorPoint anchor;
    ASSERT_TRUE(detector.detect(t, 3, anchor));
    EXPECT_EQ(AnchorType::TASK_COMPLETION, anchor.type);
    EXPECT_EQ(3u, anchor.turn_index);
    EXPECT_DOUBLE_EQ(0.92, anchor.confidence);
    EXPECT_DOUBLE_EQ(0.8, anchor.weight);
    EXPECT_EQ(t.timestamp, anchor.timestamp);
    EXPECT_FALSE(anchor.synthetic);
}

TEST(AnchorDetectorTest, ErrorResolutionNeedsPreviousError) {
    AnchorDetector detector;
    ConversationTurn t = make_turn("Fix the build", "Write", "All tests pass");
    t.previous_error = true;

    AnchorPoint anchor;
    ASSERT_TRUE(detector.detect(t, 0, anchor));
    EXPECT_EQ(AnchorType::ERROR_RESOLUTION, anchor.type);
    EXPECT_DOUBLE_EQ(0.95, anchor.confidence);
    EXPECT_DOUBLE_EQ(0.9, anchor.weight);
}

TEST(AnchorDetectorTest, FileEditWithoutPassingTestsIsNoAnchor) {
    AnchorDetector detector;
    AnchorPoint anchor;

    EXPECT_FALSE(detector.detect(make_turn("Edit", "Edit", "File written"), 0, anchor));
    EXPECT_FALSE(detector.detect(make_turn("Edit", "Edit", "test failed", false), 0, anchor));
    // Passing tests without a file change
    EXPECT_FALSE(detector.detect(make_turn("Run", "Read", "tests pass"), 0, anchor));
}

TEST(AnchorDetectorTest, FailedResultDoesNotCountAsTestSuccess) {
    ConversationTurn t = make_turn("Fix", "Edit", "test success", false);
    EXPECT_FALSE(has_test_success(t));
    EXPECT_TRUE(has_file_modification(t));
}

TEST(AnchorDetectorTest, SearchSynthesisGatedByDefaultMinimum) {
    ConversationTurn t = make_turn("What runtimes exist?", "WebSearch", long_search_output(), true,
                                   "Based on the search results, tokio is the most common.");

    AnchorPoint anchor;
    AnchorDetector strict;
    EXPECT_FALSE(strict.detect(t, 0, anchor));

    AnchorDetector relaxed(0.8);
    ASSERT_TRUE(relaxed.detect(t, 0, anchor));
    EXPECT_EQ(AnchorType::TASK_COMPLETION, anchor.type);
    EXPECT_DOUBLE_EQ(0.85, anchor.confidence);
    EXPECT_DOUBLE_EQ(0.75, anchor.weight);
}

TEST(AnchorDetectorTest, SearchWithShortOutputOrNoMarkerIsNoAnchor) {
    AnchorDetector relaxed(0.8);
    AnchorPoint anchor;

    ConversationTurn short_output = make_turn("q", "WebSearch", "tiny", true, "Based on the results, yes.");
    EXPECT_FALSE(relaxed.detect(short_output, 0, anchor));

    ConversationTurn no_marker = make_turn("q", "WebSearch", long_search_output(), true, "Tokio.");
    EXPECT_FALSE(relaxed.detect(no_marker, 0, anchor));
}

TEST(AnchorDetectorTest, ShellMilestone) {
    ConversationTurn t = make_turn("Install deps", "Bash", "Successfully installed requests-2.31");

    AnchorPoint anchor;
    EXPECT_FALSE(AnchorDetector().detect(t, 0, anchor));

    ASSERT_TRUE(AnchorDetector(0.85).detect(t, 0, anchor));
    EXPECT_DOUBLE_EQ(0.88, anchor.confidence);
    EXPECT_EQ(AnchorType::TASK_COMPLETION, anchor.type);
}

TEST(AnchorDetectorTest, GatedMatchDoesNotFallThrough) {
    AnchorDetector detector;
    AnchorPattern weak;
    weak.name = "weak";
    weak.type = AnchorType::FEATURE_MILESTONE;
    weak.confidence = 0.5;
    weak.weight = 0.75;
    weak.matches = [](const ConversationTurn& t) { return t.user_message == "milestone"; };

    AnchorPattern strong = weak;
    strong.name = "strong";
    strong.confidence = 0.99;

    detector.add_pattern(weak);
    detector.add_pattern(strong);

    AnchorPoint anchor;
    EXPECT_FALSE(detector.detect(plain_turn("milestone"), 0, anchor));
}

TEST(AnchorDetectorTest, CustomPatternAppendedAfterDefaults) {
    AnchorDetector detector;
    size_t before = detector.patterns().size();

    AnchorPattern checkpoint;
    checkpoint.name = "manual_checkpoint";
    checkpoint.type = AnchorType::USER_CHECKPOINT;
    checkpoint.confidence = 0.95;
    checkpoint.weight = 0.7;
    checkpoint.description = "User asked for a checkpoint";
    checkpoint.matches = [](const ConversationTurn& t) { return t.user_message == "/checkpoint"; };
    detector.add_pattern(checkpoint);

    ASSERT_EQ(before + 1, detector.patterns().size());
    EXPECT_EQ("manual_checkpoint", detector.patterns().back().name);

    AnchorPoint anchor;
    ASSERT_TRUE(detector.detect(plain_turn("/checkpoint"), 5, anchor));
    EXPECT_EQ(AnchorType::USER_CHECKPOINT, anchor.type);
    EXPECT_EQ("User asked for a checkpoint", anchor.description);
}

TEST(AnchorDetectorTest, HistoricalAnchorsInTurnOrder) {
    std::vector<ConversationTurn> turns;
    turns.push_back(plain_turn("hello"));
    turns.push_back(make_turn("Fix auth", "Edit", "test passed"));
    turns.push_back(plain_turn("thanks"));
    turns.push_back(make_turn("Add logging", "MultiEdit", "tests: success"));

    std::vector<AnchorPoint> anchors = AnchorDetector().detect_historical_anchors(turns);
    ASSERT_EQ(2u, anchors.size());
    EXPECT_EQ(1u, anchors[0].turn_index);
    EXPECT_EQ(3u, anchors[1].turn_index);
}

TEST(AnchorDetectorTest, SyntheticCheckpointAtLastTurn) {
    std::vector<ConversationTurn> turns;
    turns.push_back(plain_turn("a"));
    turns.push_back(plain_turn("b"));
    turns.back().timestamp = 42;

    AnchorPoint anchor = AnchorDetector::synthetic_checkpoint(turns);
    EXPECT_EQ(1u, anchor.turn_index);
    EXPECT_EQ(AnchorType::USER_CHECKPOINT, anchor.type);
    EXPECT_DOUBLE_EQ(0.8, anchor.confidence);
    EXPECT_DOUBLE_EQ(0.7, anchor.weight);
    EXPECT_EQ(42, anchor.timestamp);
    EXPECT_TRUE(anchor.synthetic);
}

TEST(AnchorDetectorTest, TypeNamesAndWeights) {
    EXPECT_STREQ("ErrorResolution", anchor_type_name(AnchorType::ERROR_RESOLUTION));
    EXPECT_STREQ("UserCheckpoint", anchor_type_name(AnchorType::USER_CHECKPOINT));
    EXPECT_DOUBLE_EQ(0.9, anchor_type_weight(AnchorType::ERROR_RESOLUTION));
    EXPECT_DOUBLE_EQ(0.8, anchor_type_weight(AnchorType::TASK_COMPLETION));
    EXPECT_DOUBLE_EQ(0.75, anchor_type_weight(AnchorType::FEATURE_MILESTONE));
    EXPECT_DOUBLE_EQ(0.7, anchor_type_weight(AnchorType::USER_CHECKPOINT));
}
