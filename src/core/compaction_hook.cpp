#include <convoflow/core/compaction_hook.hpp>
#include <convoflow/core/logger.hpp>

#include <algorithm>

namespace convoflow {

CompactionHook::CompactionHook(std::shared_ptr<TokenLedger> ledger, int64_t threshold)
    : ledger_(ledger)
    , threshold_(threshold)
    , triggered_(false)
{}

bool CompactionHook::breaches(int64_t projected) {
    if (threshold_ <= 0 || projected < threshold_) {
        return false;
    }
    if (!triggered_.exchange(true)) {
        LOG_INFO("[CompactionHook] Projected input %lld reached threshold %lld, cancelling request",
                 static_cast<long long>(projected), static_cast<long long>(threshold_));
    }
    return true;
}

bool CompactionHook::on_usage(const UsageUpdate& usage, TokenTracker& snapshot) {
    int64_t context = 0;
    snapshot = ledger_->apply(usage, &context);
    return breaches(context);
}

bool CompactionHook::allow_request(int64_t estimated_input_tokens) {
    int64_t known = ledger_->current_context();
    int64_t projected = std::max(known, estimated_input_tokens);
    LOG_DEBUG("[CompactionHook] Pre-request check: known=%lld estimated=%lld threshold=%lld",
              static_cast<long long>(known), static_cast<long long>(estimated_input_tokens),
              static_cast<long long>(threshold_));
    return !breaches(projected);
}

} // namespace convoflow
