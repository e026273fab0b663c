#pragma once

#include <core/types.hpp>
#include <string>

enum class LockStatus { Owned, Busy };

// Single-instance lock backed by a pid file.
//
// The file holds the owner's pid on one line. A lock whose pid no longer
// names a live process is stale and is replaced; an empty file counts as
// live for a short grace period while its creator writes the pid. Liveness comes from
// kill(pid, 0), so a recycled pid (or a reboot that hands the old pid to an
// unrelated process) makes a stale lock look live until that process exits.
//
// Releasing is tied to this object's lifetime: the destructor deletes the
// file if this instance acquired it.
class LockManager {
public:
    explicit LockManager(const std::string& lock_path);
    ~LockManager();

    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    // Owned, Busy, or Err if the lock file could not be written.
    Result<LockStatus> acquire();

    // Delete the lock file. No-op unless acquire() returned Owned.
    void release();

    bool held() const { return held_; }
    const std::string& path() const { return lock_path_; }

    // pid recorded in the lock file, 0 if absent or unreadable.
    static int read_owner(const std::string& lock_path);

private:
    std::string lock_path_;
    bool held_ = false;

    Result<bool> publish();
};
