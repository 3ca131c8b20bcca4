#include <convoflow/core/interrupt.hpp>
#include <convoflow/core/logger.hpp>
#include <convoflow/core/utils.hpp>

#include <poll.h>
#include <unistd.h>

namespace convoflow {

WaitResult HostWakeWaiter::wait(WakeSignal& wake, uint64_t seen) {
    wake.wait(seen);
    return WaitResult::READY;
}

// ============================================================================
// Terminal
// ============================================================================

TerminalRawMode::TerminalRawMode() : active_(false) {
    if (!isatty(STDIN_FILENO)) return;
    if (tcgetattr(STDIN_FILENO, &original_) != 0) return;

    struct termios raw = original_;
    raw.c_lflag &= ~(ICANON | ECHO);
    // Non-blocking reads; poll() decides when a byte is there
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0) {
        active_ = true;
    } else {
        LOG_WARN("[Keyboard] Could not switch terminal to raw mode");
    }
}

TerminalRawMode::~TerminalRawMode() {
    restore();
}

void TerminalRawMode::restore() {
    if (active_) {
        tcsetattr(STDIN_FILENO, TCSANOW, &original_);
        active_ = false;
    }
}

void TerminalKeyboard::begin() {
    raw_mode_.reset(new TerminalRawMode());
}

void TerminalKeyboard::end() {
    raw_mode_.reset();
}

int TerminalKeyboard::poll_key(int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int rc = poll(&pfd, 1, timeout_ms);
    if (rc <= 0 || !(pfd.revents & POLLIN)) {
        return -1;
    }

    unsigned char c;
    if (read(STDIN_FILENO, &c, 1) != 1) {
        return -1;
    }
    return c;
}

// ============================================================================
// KeyboardWaiter
// ============================================================================

const int KeyboardWaiter::KEY_ESCAPE;
const int KeyboardWaiter::KEY_CTRL_C;

KeyboardWaiter::KeyboardWaiter(std::unique_ptr<KeyboardSource> keys,
                               int64_t tick_ms, int cancel_key, int64_t slice_ms)
    : keys_(std::move(keys))
    , tick_ms_(tick_ms)
    , cancel_key_(cancel_key)
    , slice_ms_(slice_ms > 0 ? slice_ms : 20)
    , last_tick_(0)
{}

void KeyboardWaiter::begin() {
    last_tick_ = monotonic_ms();
    if (keys_) keys_->begin();
}

void KeyboardWaiter::end() {
    if (keys_) keys_->end();
}

WaitResult KeyboardWaiter::wait(WakeSignal& wake, uint64_t seen) {
    for (;;) {
        if (wake.wait_for(seen, slice_ms_)) {
            return WaitResult::READY;
        }

        if (keys_) {
            int key = keys_->poll_key(0);
            if (key == cancel_key_ || key == KEY_CTRL_C) {
                LOG_DEBUG("[Keyboard] Cancel key %d pressed", key);
                return WaitResult::CANCEL_KEY;
            }
        }

        int64_t now = monotonic_ms();
        if (tick_ms_ > 0 && now - last_tick_ >= tick_ms_) {
            last_tick_ = now;
            return WaitResult::TICK;
        }
    }
}

} // namespace convoflow
