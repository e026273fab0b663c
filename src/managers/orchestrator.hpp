#pragma once

#include "run.hpp"
#include "notifier.hpp"
#include "share_resolver.hpp"
#include "transfer_dispatcher.hpp"
#include "watch_evaluator.hpp"
#include <core/config.hpp>
#include <functional>
#include <memory>

// Sequences one Run: scan → lock → resolve → dispatch/monitor → notify.
//
//   Idle → Scanning → NoFiles                                     (no work)
//                   → Locking → Busy                              (other owner)
//                             → Dispatching → Monitoring → Notifying → Idle
//
// The lock is scoped to the Run and released on every exit path. Any
// exception after scanning starts is classified as a Failure and reported.
// A termination signal stops the transfer client, skips the report, and
// still releases the lock.
class Orchestrator {
public:
    using StateListener = std::function<void(RunState)>;

    Orchestrator(const Config& config, std::unique_ptr<MailTransport> transport);

    // Fire-and-exit entry point.
    Run run_once();

    // Supervised loop: one Run every check_interval seconds until a
    // termination signal arrives. Returns the process exit status.
    int run_forever();

    void set_state_listener(StateListener listener) { listener_ = std::move(listener); }
    RunState state() const { return state_; }

    // 0 for Success and both Skipped outcomes; the client's status (or a
    // fixed orchestration code) for Failure; 128+signal for Aborted.
    static int exit_status_for(const Run& run);

private:
    const Config& config_;
    ShareCatalog catalog_;
    ShareResolver resolver_;
    WatchEvaluator evaluator_;
    TransferDispatcher dispatcher_;
    Notifier notifier_;
    RunState state_ = RunState::Idle;
    StateListener listener_;

    void enter(RunState next);
    void transfer(Run& run);
    void fail(Run& run, ErrorKind kind, const std::string& detail, int status);
    void remove_transferred(const Run& run);
    void log_settings() const;
};
