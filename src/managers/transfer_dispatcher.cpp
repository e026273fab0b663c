#include "transfer_dispatcher.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <platform/signals.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <regex>

TransferDispatcher::TransferDispatcher(const DeviceConfig& device)
    : device_(device) {}

std::vector<std::string> TransferDispatcher::command_line(const std::string& target_address) const {
    return {device_.transfer_client, target_address, device_.sequence};
}

// Split complete lines off the front of `pending`, leaving any partial line.
static void drain_lines(std::string& pending, std::vector<std::string>& out) {
    size_t start = 0;
    size_t nl;
    while ((nl = pending.find('\n', start)) != std::string::npos) {
        std::string line = pending.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(std::move(line));
        start = nl + 1;
    }
    pending.erase(0, start);
}

TransferJob TransferDispatcher::dispatch(const std::string& target_address,
                                         const std::string& destination_label,
                                         const Hooks& hooks) const {
    TransferJob job;
    job.target_address = target_address;
    job.destination_label = destination_label;
    job.started_at = now_iso();

    auto cmd = command_line(target_address);
    platform::SpawnOptions opts;
    opts.env["SHARE_NAME"] = destination_label;
    opts.env["PYTHONUNBUFFERED"] = "1";

    std::vector<std::string> args(cmd.begin() + 1, cmd.end());
    platform::ProcessHandle proc = platform::spawn(cmd.front(), args, opts);
    if (!proc.valid()) {
        job.ended_at = now_iso();
        job.error_detail = fmt::format("could not start transfer client {}: {}",
                                       cmd.front(), std::strerror(errno));
        watch_log_error(job.error_detail);
        return job;
    }
    job.started = true;
    watch_log(fmt::format("Transfer client started (PID: {})", proc.native_handle()));
    if (hooks.on_started) hooks.on_started(proc.native_handle());

    auto emit = [&](std::vector<std::string>& lines) {
        for (auto& line : lines) {
            watch_log_output(line);
            if (hooks.on_line) hooks.on_line(line);
            job.output_lines.push_back(std::move(line));
        }
        lines.clear();
    };

    std::string pending;
    std::vector<std::string> lines;
    bool eof = false;

    while (!eof) {
        if (platform::termination_requested()) {
            job.aborted = true;
            break;
        }
        switch (proc.read_output(pending, OUTPUT_POLL_MS)) {
            case platform::ReadStatus::Data:
                drain_lines(pending, lines);
                emit(lines);
                break;
            case platform::ReadStatus::Timeout:
                break;
            case platform::ReadStatus::Eof:
            case platform::ReadStatus::Error:
                eof = true;
                break;
        }
    }

    // Output closed but the client may still be running.
    while (!job.aborted && proc.running()) {
        if (platform::termination_requested()) {
            job.aborted = true;
            break;
        }
        platform::sleep_ms(OUTPUT_POLL_MS);
    }

    if (!pending.empty()) {
        lines.push_back(pending);
        pending.clear();
        emit(lines);
    }

    if (job.aborted) {
        watch_log_warn(fmt::format("Termination requested, stopping transfer client (PID: {})",
                                   proc.native_handle()));
        proc.terminate(TERMINATE_GRACE_MS);
    }

    job.exit_status = proc.wait();
    job.ended_at = now_iso();

    if (!job.aborted && job.exit_status != 0) {
        std::string tail = output_tail(job.output_lines, ERROR_TAIL_LINES);
        job.error_detail = tail.empty()
            ? fmt::format("transfer client exited with status {}", job.exit_status)
            : tail;
    }
    return job;
}

bool apply_transfer_progress(const std::string& line, std::vector<CandidateFile>& files) {
    static const std::regex progress_re(R"re((Start|Done) sending "([^"]+)")re");

    std::smatch m;
    if (!std::regex_search(line, m, progress_re)) return false;

    bool done = m[1].str() == "Done";
    std::string name = fs::path(m[2].str()).filename().string();

    bool changed = false;
    for (auto& f : files) {
        if (f.name() != name) continue;
        FileStatus next = done ? FileStatus::Transferred : FileStatus::Queued;
        // Never step back from Transferred to Queued
        if (f.status == FileStatus::Transferred) continue;
        if (f.status != next) {
            f.status = next;
            changed = true;
        }
    }
    return changed;
}

std::string output_tail(const std::vector<std::string>& lines, int max_lines) {
    std::vector<std::string> tail;
    for (auto it = lines.rbegin(); it != lines.rend() && static_cast<int>(tail.size()) < max_lines; ++it) {
        std::string l = *it;
        trim(l);
        if (!l.empty()) tail.push_back(l);
    }
    std::string out;
    for (auto it = tail.rbegin(); it != tail.rend(); ++it) {
        if (!out.empty()) out += "\n";
        out += *it;
    }
    return out;
}
