/*
 * convoflow C++ - Interrupt waiters
 *
 * While a stream has nothing ready, the session loop blocks in an
 * InterruptWaiter. Whichever source is ready first wins:
 *
 *   HostWakeWaiter  - the stream's wake signal only. Hosts cancel by calling
 *                     Session::interrupt(), which fires the same signal.
 *   KeyboardWaiter  - the wake signal, a keyboard source (ESC / Ctrl+C
 *                     cancel) and a periodic status tick.
 */
#ifndef convoflow_CORE_INTERRUPT_HPP
#define convoflow_CORE_INTERRUPT_HPP

#include <convoflow/core/wake.hpp>
#include <memory>
#include <termios.h>
#include <cstdint>

namespace convoflow {

enum class WaitResult {
    READY,          // the wake signal fired (stream event or interrupt())
    CANCEL_KEY,     // the user pressed the cancel key
    TICK            // status tick elapsed with nothing else to do
};

class InterruptWaiter {
public:
    virtual ~InterruptWaiter() {}

    virtual const char* name() const = 0;

    // Called around each stream.
    virtual void begin() {}
    virtual void end() {}

    // Block until `wake` moves past generation `seen` or another source fires.
    virtual WaitResult wait(WakeSignal& wake, uint64_t seen) = 0;
};

class HostWakeWaiter : public InterruptWaiter {
public:
    const char* name() const override { return "host"; }
    WaitResult wait(WakeSignal& wake, uint64_t seen) override;
};

// ============================================================================
// Keyboard
// ============================================================================

class KeyboardSource {
public:
    virtual ~KeyboardSource() {}

    virtual void begin() {}
    virtual void end() {}

    // Next key code, or -1 if none arrived within timeout_ms.
    virtual int poll_key(int timeout_ms) = 0;
};

// Canonical mode and echo off for as long as it lives.
class TerminalRawMode {
public:
    TerminalRawMode();
    ~TerminalRawMode();

    void restore();
    bool is_active() const { return active_; }

private:
    TerminalRawMode(const TerminalRawMode&);
    TerminalRawMode& operator=(const TerminalRawMode&);

    struct termios original_;
    bool active_;
};

// Reads single bytes from stdin; raw mode is on between begin() and end().
class TerminalKeyboard : public KeyboardSource {
public:
    void begin() override;
    void end() override;
    int poll_key(int timeout_ms) override;

private:
    std::unique_ptr<TerminalRawMode> raw_mode_;
};

class KeyboardWaiter : public InterruptWaiter {
public:
    static const int KEY_ESCAPE = 27;
    static const int KEY_CTRL_C = 3;

    KeyboardWaiter(std::unique_ptr<KeyboardSource> keys,
                   int64_t tick_ms = 1000,
                   int cancel_key = KEY_ESCAPE,
                   int64_t slice_ms = 20);

    const char* name() const override { return "keyboard"; }
    void begin() override;
    void end() override;
    WaitResult wait(WakeSignal& wake, uint64_t seen) override;

private:
    std::unique_ptr<KeyboardSource> keys_;
    int64_t tick_ms_;
    int cancel_key_;
    int64_t slice_ms_;
    int64_t last_tick_;
};

} // namespace convoflow

#endif // convoflow_CORE_INTERRUPT_HPP
