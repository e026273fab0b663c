#pragma once

#include "run.hpp"
#include <core/types.hpp>
#include <functional>
#include <string>
#include <vector>

// Runs the external transfer client for one Run and supervises it to exit.
//
// The client is started as `transfer_client ADDRESS SEQUENCE` with
// SHARE_NAME set to the destination label. Its merged stdout/stderr is read
// line by line as it arrives; every line is timestamped into the log and
// kept on the job. There is no timeout and no retry: the call returns when
// the client exits, or when a termination signal asks us to stop it.
class TransferDispatcher {
public:
    struct Hooks {
        std::function<void(int pid)> on_started;
        std::function<void(const std::string&)> on_line;
    };

    explicit TransferDispatcher(const DeviceConfig& device);

    TransferJob dispatch(const std::string& target_address,
                         const std::string& destination_label,
                         const Hooks& hooks = {}) const;

    // Command line that dispatch() runs (program first).
    std::vector<std::string> command_line(const std::string& target_address) const;

private:
    DeviceConfig device_;
};

// Update per-file status from one line of client output:
//   Start sending "<name>"  -> Queued
//   Done sending "<name>"   -> Transferred
// Names are matched by basename. Returns true if a file changed.
bool apply_transfer_progress(const std::string& line, std::vector<CandidateFile>& files);

// Last `max_lines` non-empty lines of output, newline-joined.
std::string output_tail(const std::vector<std::string>& lines, int max_lines);
