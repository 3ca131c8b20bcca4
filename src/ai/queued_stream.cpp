#include <convoflow/ai/queued_stream.hpp>

#include <chrono>

namespace convoflow {

QueuedAgentStream::QueuedAgentStream(WakeSignal& wake)
    : wake_(wake)
    , cancelled_(false)
    , terminal_queued_(false)
    , terminal_delivered_(false)
    , producer_done_(false)
{}

bool QueuedAgentStream::try_next(BackendEvent& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ready_.empty()) return false;
    out = ready_.front();
    ready_.pop_front();
    if (out.is_terminal()) {
        terminal_delivered_ = true;
    }
    return true;
}

bool QueuedAgentStream::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.empty() && (terminal_delivered_ || producer_done_);
}

void QueuedAgentStream::cancel(CancelReason reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || terminal_delivered_) return;
        cancelled_ = true;
        ready_.clear();
        ready_.push_back(BackendEvent::make_error("request cancelled", reason));
        terminal_queued_ = true;
    }
    cv_.notify_all();
    wake_.notify();
}

bool QueuedAgentStream::deliver(const BackendEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_ || terminal_queued_) return false;
        ready_.push_back(event);
        if (event.is_terminal()) {
            terminal_queued_ = true;
        }
    }
    wake_.notify();
    return true;
}

void QueuedAgentStream::mark_done() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        producer_done_ = true;
    }
    wake_.notify();
}

void QueuedAgentStream::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool QueuedAgentStream::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool QueuedAgentStream::wait_cancelled(int64_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms < 0) {
        cv_.wait(lock, [this]() { return cancelled_; });
        return true;
    }
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() { return cancelled_; });
}

} // namespace convoflow
