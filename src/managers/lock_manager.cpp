#include "lock_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

LockManager::LockManager(const std::string& lock_path)
    : lock_path_(lock_path) {}

LockManager::~LockManager() {
    release();
}

int LockManager::read_owner(const std::string& lock_path) {
    std::ifstream in(lock_path);
    if (!in) return 0;
    std::string line;
    std::getline(in, line);
    int pid = 0;
    if (!parse_int(line, pid) || pid <= 0) return 0;
    return pid;
}

// Empty and recently created: the O_EXCL fallback has the file open but has
// not written the pid yet.
static bool being_published(const std::string& path) {
    std::error_code ec;
    if (fs::file_size(path, ec) != 0 || ec) return false;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return false;
    return fs::file_time_type::clock::now() - mtime <
           std::chrono::seconds(LOCK_PUBLISH_GRACE_SECS);
}

static bool write_pid_file(const std::string& path, int pid, int flags) {
    int fd = open(path.c_str(), flags, 0644);
    if (fd < 0) return false;
    std::string content = std::to_string(pid) + "\n";
    bool ok = write(fd, content.data(), content.size()) ==
              static_cast<ssize_t>(content.size());
    ok = (fsync(fd) == 0) && ok;
    close(fd);
    if (!ok) unlink(path.c_str());
    return ok;
}

// Publish our pid at lock_path_ without ever exposing a partially written
// file. Returns true when published, false when someone else got there first.
Result<bool> LockManager::publish() {
    int pid = platform::current_pid();
    std::string tmp = platform::sibling_temp_path(lock_path_).string();

    if (!write_pid_file(tmp, pid, O_WRONLY | O_CREAT | O_EXCL)) {
        return Result<bool>::Err(fmt::format("cannot write {}: {}", tmp, std::strerror(errno)));
    }

    if (link(tmp.c_str(), lock_path_.c_str()) == 0) {
        unlink(tmp.c_str());
        return Result<bool>::Ok(true);
    }
    int err = errno;
    unlink(tmp.c_str());

    if (err == EEXIST) return Result<bool>::Ok(false);

    // No hard links on this filesystem: fall back to exclusive create.
    if (err == EPERM || err == ENOTSUP || err == EXDEV) {
        if (write_pid_file(lock_path_, pid, O_WRONLY | O_CREAT | O_EXCL)) {
            return Result<bool>::Ok(true);
        }
        if (errno == EEXIST) return Result<bool>::Ok(false);
        err = errno;
    }
    return Result<bool>::Err(fmt::format("cannot create lock {}: {}", lock_path_, std::strerror(err)));
}

Result<LockStatus> LockManager::acquire() {
    if (held_) return Result<LockStatus>::Ok(LockStatus::Owned);

    std::error_code ec;
    auto parent = fs::path(lock_path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    // Two rounds: a racer may publish between our stale check and our link.
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (fs::exists(lock_path_, ec)) {
            int owner = read_owner(lock_path_);
            if (owner > 0 && platform::process_exists(owner)) {
                watch_log(fmt::format("Another instance is running (PID: {}), exiting", owner));
                return Result<LockStatus>::Ok(LockStatus::Busy);
            }
            if (owner == 0 && being_published(lock_path_)) {
                watch_log("Lock file is being created by another instance, exiting");
                return Result<LockStatus>::Ok(LockStatus::Busy);
            }

            if (owner > 0) {
                watch_log(fmt::format("Stale lock file found (PID: {}), removing", owner));
            } else {
                watch_log("Unreadable lock file found, removing");
            }
            // Only remove what we judged stale; a fresh owner may have replaced it.
            if (read_owner(lock_path_) == owner) {
                fs::remove(lock_path_, ec);
            }
        }

        auto published = publish();
        if (published.is_err()) return Result<LockStatus>::Err(published.error);
        if (published.value) {
            held_ = true;
            return Result<LockStatus>::Ok(LockStatus::Owned);
        }
    }

    int owner = read_owner(lock_path_);
    watch_log(fmt::format("Lock {} taken concurrently (PID: {}), exiting", lock_path_, owner));
    return Result<LockStatus>::Ok(LockStatus::Busy);
}

void LockManager::release() {
    if (!held_) return;
    held_ = false;
    std::error_code ec;
    fs::remove(lock_path_, ec);
    if (ec) {
        watch_log_warn(fmt::format("Could not remove lock {}: {}", lock_path_, ec.message()));
    }
}
