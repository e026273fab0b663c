#pragma once

#include <map>
#include <string>
#include <vector>

namespace platform {

struct SpawnOptions {
    // Added to (or replacing entries of) the parent's environment.
    std::map<std::string, std::string> env;
    // Merge the child's stdout and stderr into one pipe readable via read_output().
    bool capture_output = true;
};

enum class ReadStatus { Data, Timeout, Eof, Error };

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

    // True if the process is still running.
    bool running();

    // Wait for the process to exit and return its status: the exit code,
    // or 128 + N when killed by signal N. Repeated calls return the same value.
    int wait();

    // SIGTERM, then SIGKILL if still alive after grace_ms. Reaps the child.
    void terminate(int grace_ms = 2000);

    // Read whatever output is available, waiting at most timeout_ms.
    // Appends to `out` on Data.
    ReadStatus read_output(std::string& out, int timeout_ms);

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    int out_fd_ = -1;
    bool reaped_ = false;
    int status_ = -1;

    void close_output();
    void record_status(int raw_status);

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const SpawnOptions& options);
};

// Spawn a child process with stdin closed. Returns an invalid handle if the
// pipe or fork fails; exec failures surface as exit status 127 with a
// message on the output pipe.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options = {});

} // namespace platform
