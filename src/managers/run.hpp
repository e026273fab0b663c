#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class RunOutcome {
    Success,
    Failure,
    SkippedNoFiles,
    SkippedAlreadyRunning,
    Aborted,                // external termination: no notification
};

enum class RunState {
    Idle,
    Scanning,
    NoFiles,
    Locking,
    Busy,
    Dispatching,
    Monitoring,
    Notifying,
};

enum class ErrorKind {
    None,
    NoWork,
    AlreadyRunning,
    ResolutionFallback,
    DispatchFailure,
    NotificationFailure,
    UnexpectedFault,
};

enum class FileStatus {
    Pending,        // discovered, nothing seen in the client output yet
    Queued,         // client reported it started sending
    Transferred,    // client reported it finished sending
};

enum class SendResult { Sent, Suppressed, DeliveryFailed };

struct CandidateFile {
    fs::path path;
    std::time_t mtime = 0;
    FileStatus status = FileStatus::Pending;

    std::string name() const { return path.filename().string(); }
};

// One invocation of the transfer client.
struct TransferJob {
    std::string target_address;
    std::string destination_label;
    std::string started_at;                 // ISO timestamp
    std::string ended_at;                   // ISO timestamp
    std::vector<std::string> output_lines;
    int exit_status = -1;
    bool started = false;                   // child was spawned
    bool aborted = false;                   // stopped by external termination
    std::string error_detail;               // set on failure

    bool succeeded() const { return started && !aborted && exit_status == 0; }
};

// One pass of scan → lock → dispatch → monitor → notify.
struct Run {
    std::string start_time;                 // ISO timestamp
    std::string watch_dir;
    std::string device_address;
    std::string destination_label;
    std::vector<CandidateFile> files;
    RunOutcome outcome = RunOutcome::SkippedNoFiles;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_detail;
    long duration_secs = 0;
    int exit_status = 0;                    // status for a fire-and-exit invocation
    SendResult notification = SendResult::Suppressed;
    bool notified = false;                  // Notifier was invoked
};

const char* to_string(RunOutcome outcome);
const char* to_string(RunState state);
const char* to_string(ErrorKind kind);
const char* to_string(FileStatus status);
const char* to_string(SendResult result);
