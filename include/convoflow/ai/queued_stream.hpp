/*
 * convoflow C++ - Queued agent stream
 *
 * AgentStream base for backends that produce events on a thread of their
 * own. The producer calls deliver(); the session loop pops with
 * try_next(). cancel() drops whatever was not handed out yet and queues the
 * terminal ERROR with the cancel reason.
 *
 * Subclasses own the producer thread and must call stop() and join it in
 * their destructor.
 */
#ifndef convoflow_AI_QUEUED_STREAM_HPP
#define convoflow_AI_QUEUED_STREAM_HPP

#include <convoflow/ai/ai.hpp>
#include <convoflow/core/wake.hpp>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace convoflow {

class QueuedAgentStream : public AgentStream {
public:
    explicit QueuedAgentStream(WakeSignal& wake);

    bool try_next(BackendEvent& out) override;
    bool finished() const override;
    void cancel(CancelReason reason) override;

protected:
    // Returns false once the stream was cancelled or already holds its terminal event.
    bool deliver(const BackendEvent& event);

    // The producer has nothing more to say.
    void mark_done();

    // Tell the producer to quit without queuing anything.
    void stop();

    bool is_cancelled() const;

    // Block until cancelled or timeout_ms elapsed (negative: no timeout).
    // Returns true if cancelled.
    bool wait_cancelled(int64_t timeout_ms);

private:
    WakeSignal& wake_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<BackendEvent> ready_;
    bool cancelled_;
    bool terminal_queued_;
    bool terminal_delivered_;
    bool producer_done_;
};

} // namespace convoflow

#endif // convoflow_AI_QUEUED_STREAM_HPP
