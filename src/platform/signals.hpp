#pragma once

namespace platform {

// Route SIGTERM, SIGINT and SIGHUP into a process-wide flag instead of the
// default action, so the current run can stop its child and clean up.
// SIGPIPE is ignored.
void install_termination_handlers();

// Restore the dispositions saved by install_termination_handlers().
void remove_termination_handlers();

bool termination_requested();

// Signal number that set the flag, 0 if none.
int termination_signal();

// Raise the flag without a real signal (tests, embedding).
void request_termination(int sig);

void clear_termination();

// RAII wrapper around install/remove.
struct TerminationGuard {
    TerminationGuard() { install_termination_handlers(); }
    ~TerminationGuard() { remove_termination_handlers(); }

    TerminationGuard(const TerminationGuard&) = delete;
    TerminationGuard& operator=(const TerminationGuard&) = delete;
};

} // namespace platform
