#pragma once

namespace platform {

// RAII guard for single-keystroke input.
// Constructor saves the current mode and turns off canonical mode and echo
// (signals stay enabled so Ctrl-C still interrupts). Destructor restores it.
// A no-op when stdin is not a terminal.
struct RawModeGuard {
    RawModeGuard();
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Poll stdin for input readability with a timeout (-1 waits forever).
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Read one byte from stdin, waiting at most timeout_ms (-1 waits forever).
// Returns false on timeout, EOF or error.
bool read_byte(char& out, int timeout_ms = -1);

} // namespace platform
