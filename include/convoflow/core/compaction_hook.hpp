/*
 * convoflow C++ - Compaction Hook
 *
 * Attached to one in-flight stream. Every usage update goes through the
 * hook, which folds it into the shared TokenLedger and decides whether the
 * context of the latest call (input plus cache) has reached the threshold. Adapters also
 * ask it before issuing a request, so an oversized prompt is never sent.
 *
 * The hook only records its decision; the caller cancels the stream with
 * CancelReason::COMPACTION. A stream error counts as a compaction cancel only
 * when both the reason and compaction_needed() agree.
 */
#ifndef convoflow_CORE_COMPACTION_HOOK_HPP
#define convoflow_CORE_COMPACTION_HOOK_HPP

#include <convoflow/core/token_tracker.hpp>
#include <atomic>
#include <memory>

namespace convoflow {

class CompactionHook {
public:
    CompactionHook(std::shared_ptr<TokenLedger> ledger, int64_t threshold);

    // Fold a usage update into the ledger. `snapshot` receives the new
    // cumulative totals. Returns true if the request must be cancelled.
    bool on_usage(const UsageUpdate& usage, TokenTracker& snapshot);

    // Pre-request check with the adapter's estimate of the payload size.
    // Returns false if the request must not be sent.
    bool allow_request(int64_t estimated_input_tokens);

    bool compaction_needed() const { return triggered_.load(); }
    int64_t threshold() const { return threshold_; }

private:
    bool breaches(int64_t projected);

    std::shared_ptr<TokenLedger> ledger_;
    int64_t threshold_;
    std::atomic<bool> triggered_;
};

} // namespace convoflow

#endif // convoflow_CORE_COMPACTION_HOOK_HPP
