#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct DeviceConfig {
    std::string address;            // network address of the receiving device
    std::string sequence;           // named navigation sequence / profile
    std::string share_name;         // explicit destination label ("" = auto-detect)
    std::string transfer_client;    // subordinate command
};

struct WatchConfig {
    std::string directory;
    std::vector<std::string> extensions;  // lower-case, leading dot (".mkv")
    int min_file_age = 60;                // seconds
    int check_interval = 300;             // seconds between runs in daemon mode
    bool remove_transferred = false;
};

struct MailConfig {
    std::string smtp_server;
    int smtp_port = 25;
    std::string smtp_user;
    std::string smtp_pass;
    std::string from;
    std::string to;                 // "" disables notification

    bool enabled() const { return !to.empty(); }
    bool authenticated() const { return !smtp_user.empty(); }
};

struct PathsConfig {
    std::string lock_file;
    std::string log_file;
    std::string share_config;       // media server configuration (INI)
};

// Environment lookup; returns nullopt when the key is unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
