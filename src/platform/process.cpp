#include "process.hpp"
#include <core/log.hpp>

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform {

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept : pid_(other.pid_) {
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;

    int status = 0;
    pid_t ret;
    do {
        ret = ::waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;

    if (ret < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args) {
    ProcessHandle handle;

    // argv is built before fork: the child must not allocate
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        volt_logf(LogLevel::Error, "fork failed: {}", std::strerror(errno));
        return handle;
    }

    if (pid == 0) {
        // Ignored signals survive exec
        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGQUIT, SIG_DFL);
        ::execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        ::_exit(127);
    }

    handle.pid_ = pid;
    return handle;
}

int run_shell(const std::string& command) {
    struct sigaction ignore {};
    struct sigaction old_int {};
    struct sigaction old_quit {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGINT, &ignore, &old_int);
    ::sigaction(SIGQUIT, &ignore, &old_quit);

    auto proc = spawn("/bin/sh", {"-c", command});
    int code = proc.valid() ? proc.wait() : 127;

    ::sigaction(SIGINT, &old_int, nullptr);
    ::sigaction(SIGQUIT, &old_quit, nullptr);
    return code;
}

} // namespace platform
