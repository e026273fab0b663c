#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace {

std::string g_log_path;
bool g_echo = true;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "INFO";
    }
}

void emit(const std::string& line) {
    if (g_echo) {
        std::cout << line << "\n" << std::flush;
    }
    if (g_log_path.empty()) return;

    std::error_code ec;
    auto parent = std::filesystem::path(g_log_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    std::ofstream out(g_log_path, std::ios::app);
    if (!out) return;
    out << line << "\n";
}

} // namespace

void set_log_file(const std::string& path) {
    g_log_path = path;
}

void set_log_echo(bool enabled) {
    g_echo = enabled;
}

void watch_log(const std::string& msg, LogLevel level) {
    try {
        emit(fmt::format("{} - {} - {}", format_local_time(), level_name(level), msg));
    } catch (const std::exception&) {
        // dropped line
    }
}

void watch_log_output(const std::string& line) {
    try {
        emit(fmt::format("{} - {}", format_local_time(), line));
    } catch (const std::exception&) {
    }
}
