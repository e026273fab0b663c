#pragma once

#include <string>

enum class LogLevel { Info, Warn, Error };

// Direct subsequent log lines to this file (created on demand, append mode).
// An empty path keeps stdout-only logging.
void set_log_file(const std::string& path);

// Echo every log line to stdout as well (on by default).
void set_log_echo(bool enabled);

// Append "YYYY-MM-DD HH:MM:SS - LEVEL - msg". Never throws.
void watch_log(const std::string& msg, LogLevel level = LogLevel::Info);

inline void watch_log_warn(const std::string& msg) { watch_log(msg, LogLevel::Warn); }
inline void watch_log_error(const std::string& msg) { watch_log(msg, LogLevel::Error); }

// One line of subordinate output, stamped when it was read: "YYYY-MM-DD HH:MM:SS - line".
void watch_log_output(const std::string& line);
