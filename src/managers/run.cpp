#include "run.hpp"

const char* to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Success:               return "Success";
        case RunOutcome::Failure:               return "Failure";
        case RunOutcome::SkippedNoFiles:        return "Skipped-No-Files";
        case RunOutcome::SkippedAlreadyRunning: return "Skipped-Already-Running";
        case RunOutcome::Aborted:               return "Aborted";
    }
    return "?";
}

const char* to_string(RunState state) {
    switch (state) {
        case RunState::Idle:        return "Idle";
        case RunState::Scanning:    return "Scanning";
        case RunState::NoFiles:     return "NoFiles";
        case RunState::Locking:     return "Locking";
        case RunState::Busy:        return "Busy";
        case RunState::Dispatching: return "Dispatching";
        case RunState::Monitoring:  return "Monitoring";
        case RunState::Notifying:   return "Notifying";
    }
    return "?";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                return "None";
        case ErrorKind::NoWork:              return "NoWork";
        case ErrorKind::AlreadyRunning:      return "AlreadyRunning";
        case ErrorKind::ResolutionFallback:  return "ResolutionFallback";
        case ErrorKind::DispatchFailure:     return "DispatchFailure";
        case ErrorKind::NotificationFailure: return "NotificationFailure";
        case ErrorKind::UnexpectedFault:     return "UnexpectedFault";
    }
    return "?";
}

const char* to_string(FileStatus status) {
    switch (status) {
        case FileStatus::Pending:     return "Pending";
        case FileStatus::Queued:      return "Queued";
        case FileStatus::Transferred: return "Transferred";
    }
    return "?";
}

const char* to_string(SendResult result) {
    switch (result) {
        case SendResult::Sent:           return "Sent";
        case SendResult::Suppressed:     return "Suppressed";
        case SendResult::DeliveryFailed: return "DeliveryFailed";
    }
    return "?";
}
