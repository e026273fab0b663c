#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>

extern char** environ;

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_output();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    out_fd_ = other.out_fd_;
    reaped_ = other.reaped_;
    status_ = other.status_;
    other.pid_ = -1;
    other.out_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_output();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        reaped_ = other.reaped_;
        status_ = other.status_;
        other.pid_ = -1;
        other.out_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::close_output() {
    if (out_fd_ >= 0) {
        close(out_fd_);
        out_fd_ = -1;
    }
}

void ProcessHandle::record_status(int raw_status) {
    reaped_ = true;
    if (WIFEXITED(raw_status)) {
        status_ = WEXITSTATUS(raw_status);
    } else if (WIFSIGNALED(raw_status)) {
        status_ = 128 + WTERMSIG(raw_status);
    } else {
        status_ = -1;
    }
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    if (reaped_) return status_;

    int status;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);

    if (ret == pid_) {
        record_status(status);
    } else {
        reaped_ = true;
        status_ = -1;
    }
    return status_;
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    for (int elapsed = 0; elapsed < grace_ms; elapsed += 100) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            record_status(status);
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    wait();
}

ReadStatus ProcessHandle::read_output(std::string& out, int timeout_ms) {
    if (out_fd_ < 0) return ReadStatus::Eof;

    struct pollfd pfd;
    pfd.fd = out_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int pr = poll(&pfd, 1, timeout_ms);
    if (pr == 0) return ReadStatus::Timeout;
    if (pr < 0) {
        return errno == EINTR ? ReadStatus::Timeout : ReadStatus::Error;
    }

    char buf[OUTPUT_READ_BUF_SIZE];
    ssize_t n = read(out_fd_, buf, sizeof(buf));
    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
        return ReadStatus::Data;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return ReadStatus::Timeout;
    close_output();
    return n == 0 ? ReadStatus::Eof : ReadStatus::Error;
}

// ── spawn ────────────────────────────────────────────────────

static std::vector<std::string> build_environment(
        const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (overrides.count(key)) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overrides) {
        env.push_back(k + "=" + v);
    }
    return env;
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    int fds[2] = {-1, -1};
    if (options.capture_output && pipe(fds) != 0) return handle;

    // Everything the child needs is prepared before fork().
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(options.env);
    std::vector<const char*> envp;
    for (const auto& e : env_storage) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        if (options.capture_output) {
            close(fds[0]);
            close(fds[1]);
        }
        return handle;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (options.capture_output) {
            close(fds[0]);
            dup2(fds[1], STDOUT_FILENO);
            dup2(fds[1], STDERR_FILENO);
            close(fds[1]);
        }

        // Default dispositions so the child can be terminated normally.
        signal(SIGTERM, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGHUP, SIG_DFL);
        // SIG_IGN survives exec
        signal(SIGPIPE, SIG_DFL);

        execvpe(program.c_str(), const_cast<char* const*>(argv.data()),
                const_cast<char* const*>(envp.data()));

        const char* reason = strerror(errno);
        const char prefix[] = "exec failed: ";
        ssize_t ignored = write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
        ignored = write(STDERR_FILENO, program.c_str(), program.size());
        ignored = write(STDERR_FILENO, ": ", 2);
        ignored = write(STDERR_FILENO, reason, strlen(reason));
        ignored = write(STDERR_FILENO, "\n", 1);
        (void)ignored;
        _exit(EXEC_FAILED_STATUS);
    }

    // Parent
    if (options.capture_output) {
        close(fds[1]);
        fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        handle.out_fd_ = fds[0];
    }
    handle.pid_ = pid;
    return handle;
}

} // namespace platform
