#pragma once

#include <string>
#include <vector>

namespace platform {

// A child process sharing this process's stdin/stdout/stderr. Move-only.
// The child is not reaped on destruction; call wait().
class ProcessHandle {
public:
    ProcessHandle() = default;

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    bool valid() const { return pid_ > 0; }

    // Block until the child exits. Returns its exit code, 128+N when killed
    // by signal N, or -1 if the handle is invalid.
    int wait();

private:
    int pid_ = -1;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args);
};

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args);

// Run a command line through /bin/sh -c and wait for it, the way system(3)
// does: SIGINT and SIGQUIT go to the command, not to us. Returns the exit
// code, or 127 if the shell could not be started.
int run_shell(const std::string& command);

} // namespace platform
