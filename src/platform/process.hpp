#pragma once

#include <string>
#include <vector>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns the exit code, 128 + signal
    // number if it was killed, or -1 if the handle is invalid.
    int wait();

private:
    int pid_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args);
};

// Spawn a child process that inherits stdin, stdout and stderr.
// An exec failure in the child surfaces as exit code 127.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args);

// Spawn and wait. Convenience for blocking, user-facing commands.
int run(const std::string& program, const std::vector<std::string>& args);

} // namespace platform
