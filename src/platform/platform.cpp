#include "platform.hpp"
#include <cerrno>
#include <ctime>
#include <random>

#include <unistd.h>
#include <signal.h>

namespace fs = std::filesystem;

namespace platform {

fs::path sibling_temp_path(const fs::path& base) {
    // Use pid + random for uniqueness
    static std::mt19937 rng(static_cast<unsigned>(std::time(nullptr)) ^
                            static_cast<unsigned>(getpid()));
    std::uniform_int_distribution<int> dist(10000, 99999);
    return base.parent_path() /
           (base.filename().string() + "." + std::to_string(getpid()) + "." +
            std::to_string(dist(rng)) + ".tmp");
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

int current_pid() {
    return static_cast<int>(getpid());
}

bool process_exists(int pid) {
    if (pid <= 0) return false;
    if (kill(static_cast<pid_t>(pid), 0) == 0) return true;
    // EPERM: it exists but belongs to someone else
    return errno == EPERM;
}

} // namespace platform
