#ifndef convoflow_CORE_WAKE_HPP
#define convoflow_CORE_WAKE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace convoflow {

// Generation-counted notify primitive. Producers (stream threads, interrupt())
// call notify(); the session loop records generation() before polling the
// stream and waits only if nothing happened since, so a notification that
// lands between the poll and the wait is never lost.
class WakeSignal {
public:
    WakeSignal() : generation_(0) {}

    uint64_t generation() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++generation_;
        }
        cv_.notify_all();
    }

    // Block until the generation moves past `seen`.
    void wait(uint64_t seen) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (generation_ == seen) {
            cv_.wait(lock);
        }
    }

    // Returns false if timeout_ms elapsed without a notification.
    bool wait_for(uint64_t seen, int64_t timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this, seen]() { return generation_ != seen; });
    }

private:
    WakeSignal(const WakeSignal&);
    WakeSignal& operator=(const WakeSignal&);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t generation_;
};

} // namespace convoflow

#endif // convoflow_CORE_WAKE_HPP
