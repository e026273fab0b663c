#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Creates a unique path (not the file) beside `base` for atomic publication.
std::filesystem::path sibling_temp_path(const std::filesystem::path& base);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Process id of the caller.
int current_pid();

// Best-effort liveness test for a process id on this host (kill(pid, 0)).
// A recycled pid reads as alive.
bool process_exists(int pid);

} // namespace platform
