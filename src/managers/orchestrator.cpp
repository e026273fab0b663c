#include "orchestrator.hpp"
#include "lock_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/signals.hpp>
#include <fmt/format.h>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

static const char* RULE = "========================================";

Orchestrator::Orchestrator(const Config& config, std::unique_ptr<MailTransport> transport)
    : config_(config),
      catalog_(config.paths().share_config),
      resolver_(catalog_, FALLBACK_SHARE_NAME),
      evaluator_(config.watch()),
      dispatcher_(config.device()),
      notifier_(config.mail(), std::move(transport)) {}

void Orchestrator::enter(RunState next) {
    state_ = next;
    if (listener_) listener_(next);
}

int Orchestrator::exit_status_for(const Run& run) {
    switch (run.outcome) {
        case RunOutcome::Success:
        case RunOutcome::SkippedNoFiles:
        case RunOutcome::SkippedAlreadyRunning:
            return 0;
        case RunOutcome::Failure:
        case RunOutcome::Aborted:
            return run.exit_status != 0 ? run.exit_status : EXIT_ORCHESTRATION_ERROR;
    }
    return EXIT_ORCHESTRATION_ERROR;
}

void Orchestrator::fail(Run& run, ErrorKind kind, const std::string& detail, int status) {
    run.outcome = RunOutcome::Failure;
    run.error_kind = kind;
    run.error_detail = detail;
    run.exit_status = (status > 0) ? status : EXIT_ORCHESTRATION_ERROR;
}

// Resolve, dispatch, monitor, classify. Runs with the lock held.
void Orchestrator::transfer(Run& run) {
    const auto& device = config_.device();

    ResolvedShare share = resolver_.resolve(run.watch_dir, device.share_name);
    run.destination_label = share.label;
    if (share.fallback) run.error_kind = ErrorKind::ResolutionFallback;

    if (platform::termination_requested()) {
        run.outcome = RunOutcome::Aborted;
        run.exit_status = 128 + platform::termination_signal();
        return;
    }

    watch_log(fmt::format("Using pyTivo share: {}", run.destination_label));
    watch_log(fmt::format("Starting transfer to TiVo ({}) using sequence: {}",
                          run.device_address, device.sequence));
    watch_log(RULE);

    enter(RunState::Dispatching);

    TransferDispatcher::Hooks hooks;
    hooks.on_started = [this](int) { enter(RunState::Monitoring); };
    hooks.on_line = [&run](const std::string& line) { apply_transfer_progress(line, run.files); };

    TransferJob job = dispatcher_.dispatch(run.device_address, run.destination_label, hooks);

    watch_log(RULE);
    watch_log(fmt::format("Transfer client finished after {}",
                          format_duration(job.started_at, job.ended_at)));

    if (job.aborted) {
        run.outcome = RunOutcome::Aborted;
        run.exit_status = 128 + platform::termination_signal();
        watch_log_warn("Transfer aborted by termination signal");
        return;
    }

    if (job.succeeded()) {
        run.outcome = RunOutcome::Success;
        if (run.error_kind != ErrorKind::ResolutionFallback) run.error_kind = ErrorKind::None;
        run.exit_status = 0;
        watch_log("Transfer completed successfully");
        return;
    }

    fail(run, ErrorKind::DispatchFailure, job.error_detail,
         job.started ? job.exit_status : EXIT_ORCHESTRATION_ERROR);
    watch_log_error(job.started
        ? fmt::format("Transfer failed with exit code: {}", job.exit_status)
        : fmt::format("Transfer failed: {}", job.error_detail));
}

void Orchestrator::remove_transferred(const Run& run) {
    for (const auto& f : run.files) {
        if (f.status != FileStatus::Transferred) continue;
        std::error_code ec;
        // remove() on a symlink deletes the link, not its target
        fs::remove(f.path, ec);
        if (ec) {
            watch_log_warn(fmt::format("Could not delete {}: {}", f.path.string(), ec.message()));
        } else {
            watch_log(fmt::format("Deleted transferred file: {}", f.path.string()));
        }
    }
}

Run Orchestrator::run_once() {
    Run run;
    run.start_time = now_iso();
    run.watch_dir = config_.watch().directory;
    run.device_address = config_.device().address;
    auto started = std::chrono::steady_clock::now();

    auto finish_duration = [&] {
        run.duration_secs = static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started).count());
    };

    LockManager lock(config_.paths().lock_file);

    try {
        enter(RunState::Scanning);
        watch_log(fmt::format("Checking watch directory: {}", run.watch_dir));
        run.files = evaluator_.scan();

        if (run.files.empty()) {
            watch_log(fmt::format("No files in {}, exiting", run.watch_dir));
            run.outcome = RunOutcome::SkippedNoFiles;
            run.error_kind = ErrorKind::NoWork;
            enter(RunState::NoFiles);
            enter(RunState::Idle);
            return run;
        }

        watch_log(fmt::format("Found {} file(s)", run.files.size()));
        for (const auto& f : run.files) {
            watch_log(fmt::format("  - {}", f.name()));
        }

        enter(RunState::Locking);
        auto acquired = lock.acquire();
        if (acquired.is_err()) {
            throw std::runtime_error(acquired.error);
        }
        if (acquired.value == LockStatus::Busy) {
            run.outcome = RunOutcome::SkippedAlreadyRunning;
            run.error_kind = ErrorKind::AlreadyRunning;
            enter(RunState::Busy);
            enter(RunState::Idle);
            return run;
        }

        transfer(run);

        if (run.outcome == RunOutcome::Success && config_.watch().remove_transferred) {
            remove_transferred(run);
        }
    } catch (const std::exception& e) {
        watch_log_error(fmt::format("Unexpected error during {}: {}", to_string(state_), e.what()));
        fail(run, ErrorKind::UnexpectedFault, e.what(), EXIT_ORCHESTRATION_ERROR);
    }

    finish_duration();

    if (run.outcome == RunOutcome::Aborted) {
        // No well-defined outcome to report
        lock.release();
        enter(RunState::Idle);
        return run;
    }

    enter(RunState::Notifying);
    run.notification = notifier_.notify(run);
    run.notified = true;
    // A lost report outranks the advisory share fallback
    if (run.notification == SendResult::DeliveryFailed &&
        (run.error_kind == ErrorKind::None || run.error_kind == ErrorKind::ResolutionFallback)) {
        run.error_kind = ErrorKind::NotificationFailure;
    }

    lock.release();
    enter(RunState::Idle);
    return run;
}

void Orchestrator::log_settings() const {
    const auto& d = config_.device();
    const auto& w = config_.watch();
    const auto& m = config_.mail();

    watch_log(RULE);
    watch_log("TiVo Watcher Service Starting");
    watch_log(RULE);
    watch_log(fmt::format("TiVo IP: {}", d.address));
    watch_log(fmt::format("Watch Directory: {}", w.directory));
    watch_log(fmt::format("Check Interval: {}s", w.check_interval));
    watch_log(fmt::format("Min File Age: {}s", w.min_file_age));
    watch_log(fmt::format("Sequence: {}", d.sequence));
    watch_log(fmt::format("Email Config: SMTP={}:{} FROM={} TO={}",
                          m.smtp_server, m.smtp_port, m.from,
                          m.enabled() ? m.to : "(disabled)"));
    watch_log(RULE);
}

int Orchestrator::run_forever() {
    log_settings();

    std::error_code ec;
    if (!fs::is_directory(config_.watch().directory, ec)) {
        watch_log_error(fmt::format("Watch directory does not exist: {}", config_.watch().directory));
        return 1;
    }

    const auto interval = std::chrono::seconds(config_.watch().check_interval);
    const auto slice = std::chrono::milliseconds(DAEMON_SLEEP_SLICE_MS);

    while (!platform::termination_requested()) {
        Run run = run_once();
        if (run.outcome != RunOutcome::SkippedNoFiles) {
            watch_log(fmt::format("Run finished: {} in {}", to_string(run.outcome),
                                  format_seconds(run.duration_secs)));
        }

        for (std::chrono::milliseconds slept{0};
             slept < interval && !platform::termination_requested(); slept += slice) {
            platform::sleep_ms(DAEMON_SLEEP_SLICE_MS);
        }
    }

    watch_log(fmt::format("Service stopped (signal {})", platform::termination_signal()));
    return 0;
}
