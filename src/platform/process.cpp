#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <cerrno>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Reap a child nobody waited for so it does not linger as a zombie.
    if (pid_ > 0) {
        int status;
        waitpid(pid_, &status, 0);
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0) {
            int status;
            waitpid(pid_, &status, 0);
        }
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;

    if (ret < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args) {
    ProcessHandle handle;

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child: stdio is inherited so interactive tools keep the terminal.
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    handle.pid_ = pid;
    return handle;
}

int run(const std::string& program, const std::vector<std::string>& args) {
    auto handle = spawn(program, args);
    if (!handle.valid()) return -1;

    // Ctrl-C belongs to the child while it runs; we only report how it ended.
    struct sigaction ignore {}, old_int {}, old_quit {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGINT, &ignore, &old_int);
    sigaction(SIGQUIT, &ignore, &old_quit);

    int code = handle.wait();

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGQUIT, &old_quit, nullptr);
    return code;
}

} // namespace platform
