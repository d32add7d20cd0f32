#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>

namespace platform {

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
};

RawModeGuard::RawModeGuard() {
    struct termios current;
    if (tcgetattr(STDIN_FILENO, &current) != 0) return;  // not a tty

    impl_ = new Impl{current};
    struct termios raw = current;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSANOW, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSANOW, &impl_->old_term);
        delete impl_;
    }
}

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    int ret;
    do {
        ret = poll(&pfd, 1, timeout_ms);
    } while (ret < 0 && errno == EINTR);
    return ret > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

// ── read_byte ────────────────────────────────────────────────

bool read_byte(char& out, int timeout_ms) {
    if (!poll_stdin(timeout_ms)) return false;
    ssize_t n;
    do {
        n = read(STDIN_FILENO, &out, 1);
    } while (n < 0 && errno == EINTR);
    return n == 1;
}

} // namespace platform
