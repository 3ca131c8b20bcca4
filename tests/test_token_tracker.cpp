#include <convoflow/core/compaction_hook.hpp>
#include <convoflow/core/token_tracker.hpp>
#include <gtest/gtest.h>

using namespace convoflow;

static UsageUpdate final_usage(int call, int64_t input, int64_t output) {
    return UsageUpdate::delta(call, input, output);
}

TEST(TokenTrackerTest, TotalsAndCacheDiscount) {
    TokenTracker t;
    t.input_tokens = 1000;
    t.output_tokens = 200;
    t.cache_read_input_tokens = 500;
    t.cache_creation_input_tokens = 100;

    EXPECT_EQ(1800, t.total());
    EXPECT_EQ(1600, t.context_input());
    EXPECT_EQ(550, t.effective_tokens());

    Json j = t.to_json();
    EXPECT_EQ(1800, j["total_tokens"].get<int64_t>());
}

TEST(TokenTrackerTest, EffectiveTokensNeverNegative) {
    TokenTracker t;
    t.input_tokens = 10;
    t.cache_read_input_tokens = 1000;
    EXPECT_EQ(0, t.effective_tokens());
}

TEST(TokenTrackerTest, EstimateRoundsUp) {
    EXPECT_EQ(0, estimate_tokens(""));
    EXPECT_EQ(1, estimate_tokens("a"));
    EXPECT_EQ(1, estimate_tokens("abcd"));
    EXPECT_EQ(2, estimate_tokens("abcde"));

    std::vector<ConversationMessage> history;
    history.push_back(ConversationMessage::user("abcdefgh"));
    history.push_back(ConversationMessage::assistant("abc"));
    EXPECT_EQ(3, estimate_history_tokens(history));
}

TEST(TokenTrackerTest, CompactionThreshold) {
    EXPECT_EQ(180000, compaction_threshold(200000, 0.9));
    EXPECT_EQ(4096, compaction_threshold(4096, 0.0));
    EXPECT_EQ(4096, compaction_threshold(4096, 1.5));
    EXPECT_EQ(0, compaction_threshold(0, 0.9));
}

TEST(TurnTokenAccumulatorTest, TwoCallsInOneTurn) {
    TurnTokenAccumulator acc;
    acc.apply(UsageUpdate::start(0, 500));
    acc.apply(UsageUpdate::delta(0, 500, 50));
    acc.apply_final(final_usage(1, 520, 80));

    EXPECT_FALSE(acc.has_open_call());
    EXPECT_EQ(1020, acc.totals().input_tokens);
    EXPECT_EQ(130, acc.totals().output_tokens);
    EXPECT_EQ(1150, acc.totals().total());
}

TEST(TurnTokenAccumulatorTest, DeltasWithinACallDoNotDoubleCount) {
    TurnTokenAccumulator acc;
    acc.apply(UsageUpdate::start(0, 300));
    acc.apply(UsageUpdate::delta(0, 300, 10));
    acc.apply(UsageUpdate::delta(0, 300, 25));
    acc.apply(UsageUpdate::delta(0, 300, 40));

    EXPECT_TRUE(acc.has_open_call());
    EXPECT_EQ(340, acc.totals().total());
    EXPECT_EQ(0, acc.committed().total());

    acc.finalize();
    EXPECT_EQ(340, acc.committed().total());
}

TEST(TurnTokenAccumulatorTest, NewCallStartCommitsPrevious) {
    TurnTokenAccumulator acc;
    acc.apply(UsageUpdate::start(0, 100));
    acc.apply(UsageUpdate::delta(0, 100, 20));
    acc.apply(UsageUpdate::start(1, 150, 50, 0));

    EXPECT_EQ(120, acc.committed().total());
    EXPECT_EQ(320, acc.totals().total());
    EXPECT_EQ(50, acc.totals().cache_read_input_tokens);
}

TEST(TurnTokenAccumulatorTest, FinalForOpenCallMergesIt) {
    TurnTokenAccumulator acc;
    acc.apply(UsageUpdate::start(0, 200));
    acc.apply_final(final_usage(0, 200, 60));
    EXPECT_EQ(260, acc.totals().total());
}

TEST(TokenLedgerTest, CommitAddsTurnToCumulative) {
    TokenLedger ledger;
    ledger.begin_turn();
    ledger.apply(UsageUpdate::start(0, 500));
    TokenTracker mid = ledger.apply(UsageUpdate::delta(0, 500, 50));
    EXPECT_EQ(550, mid.total());
    EXPECT_EQ(0, ledger.base().total());

    UsageUpdate fin = final_usage(1, 520, 80);
    int64_t turn_total = 0;
    TokenTracker after = ledger.commit_turn(&fin, &turn_total);
    EXPECT_EQ(1150, turn_total);
    EXPECT_EQ(1150, after.total());
    EXPECT_EQ(1150, ledger.cumulative().total());
}

TEST(TokenLedgerTest, DiscardKeepsBase) {
    TokenLedger ledger;
    TokenTracker base;
    base.input_tokens = 1000;
    ledger.reset(base);

    ledger.begin_turn();
    ledger.apply(UsageUpdate::start(0, 400));
    EXPECT_EQ(1400, ledger.cumulative().input_tokens);

    ledger.discard_turn();
    EXPECT_EQ(1000, ledger.cumulative().input_tokens);
}

TEST(TokenLedgerTest, ContextIsTheLatestCallNotTheSum) {
    TokenLedger ledger;
    ledger.begin_turn();

    int64_t context = 0;
    ledger.apply(UsageUpdate::start(0, 300), &context);
    EXPECT_EQ(300, context);
    ledger.apply(UsageUpdate::start(1, 340, 20, 0), &context);
    EXPECT_EQ(360, context);
    EXPECT_EQ(640, ledger.cumulative().input_tokens);

    UsageUpdate fin = final_usage(1, 350, 30);
    ledger.commit_turn(&fin);
    EXPECT_EQ(370, ledger.current_context());

    // Next turn reports its own full context; the earlier one is not added again
    ledger.begin_turn();
    ledger.apply(UsageUpdate::start(0, 410), &context);
    EXPECT_EQ(410, context);
    EXPECT_EQ(1060, ledger.cumulative().input_tokens);
}

TEST(TokenLedgerTest, DiscardAndResetRestoreContext) {
    TokenLedger ledger;
    ledger.begin_turn();
    ledger.apply(UsageUpdate::start(0, 500));
    ledger.commit_turn(nullptr);
    EXPECT_EQ(500, ledger.current_context());

    ledger.begin_turn();
    ledger.apply(UsageUpdate::start(0, 900));
    EXPECT_EQ(900, ledger.current_context());
    ledger.discard_turn();
    EXPECT_EQ(500, ledger.current_context());

    TokenTracker base;
    base.input_tokens = 120;
    ledger.reset(base);
    EXPECT_EQ(120, ledger.current_context());
}

TEST(CompactionHookTest, CancelsWhenCallContextReachesThreshold) {
    std::shared_ptr<TokenLedger> ledger(new TokenLedger());
    CompactionHook hook(ledger, 1000);
    ledger->begin_turn();

    TokenTracker snapshot;
    EXPECT_FALSE(hook.on_usage(UsageUpdate::start(0, 600), snapshot));
    EXPECT_EQ(600, snapshot.input_tokens);

    // Two calls of 600 + 650 sum past the threshold, but neither context does
    EXPECT_FALSE(hook.on_usage(UsageUpdate::start(1, 650), snapshot));
    EXPECT_FALSE(hook.compaction_needed());
    EXPECT_EQ(1250, snapshot.context_input());

    EXPECT_TRUE(hook.on_usage(UsageUpdate::start(2, 1000), snapshot));
    EXPECT_TRUE(hook.compaction_needed());
}

TEST(CompactionHookTest, PreRequestCheckUsesCurrentContext) {
    std::shared_ptr<TokenLedger> ledger(new TokenLedger());
    ledger->begin_turn();
    ledger->apply(UsageUpdate::start(0, 700));
    ledger->commit_turn(nullptr);
    ledger->begin_turn();
    ledger->apply(UsageUpdate::start(0, 720));
    ledger->commit_turn(nullptr);

    CompactionHook hook(ledger, 1000);
    EXPECT_TRUE(hook.allow_request(100));
    EXPECT_FALSE(hook.compaction_needed());
}

TEST(CompactionHookTest, CacheCountsTowardTheThreshold) {
    std::shared_ptr<TokenLedger> ledger(new TokenLedger());
    CompactionHook hook(ledger, 1000);
    ledger->begin_turn();

    TokenTracker snapshot;
    EXPECT_TRUE(hook.on_usage(UsageUpdate::start(0, 100, 850, 100), snapshot));
}

TEST(CompactionHookTest, PreRequestCheck) {
    std::shared_ptr<TokenLedger> ledger(new TokenLedger());
    CompactionHook hook(ledger, 1000);

    EXPECT_TRUE(hook.allow_request(999));
    EXPECT_FALSE(hook.compaction_needed());
    EXPECT_FALSE(hook.allow_request(1000));
    EXPECT_TRUE(hook.compaction_needed());
}

TEST(CompactionHookTest, ZeroThresholdNeverTriggers) {
    std::shared_ptr<TokenLedger> ledger(new TokenLedger());
    CompactionHook hook(ledger, 0);
    TokenTracker snapshot;
    EXPECT_FALSE(hook.on_usage(UsageUpdate::start(0, 1000000), snapshot));
    EXPECT_TRUE(hook.allow_request(1000000));
}

TEST(OutputTokenTrackerTest, DisplayNeverRegresses) {
    OutputTokenTracker out;
    out.add_streamed_text(std::string(40, 'x'));
    EXPECT_EQ(10, out.display_tokens());

    out.set_authoritative(8);
    EXPECT_EQ(10, out.display_tokens());

    out.set_authoritative(15);
    EXPECT_EQ(15, out.display_tokens());

    out.start_new_segment();
    EXPECT_EQ(15, out.cumulative_base());
    EXPECT_EQ(15, out.display_tokens());

    out.add_streamed_text("abcd");
    EXPECT_EQ(16, out.display_tokens());

    out.reset();
    EXPECT_EQ(0, out.display_tokens());
}
