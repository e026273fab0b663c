#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Start-up configuration. Built once, then passed by const reference; no
// component reads the environment on its own.
class Config {
public:
    // Built-in defaults only.
    static Config defaults();

    // Defaults, then the YAML file (if it exists), then the environment.
    // A missing file is not an error; a malformed one is.
    static Result<Config> load(const fs::path& config_file = default_config_path(),
                               const EnvLookup& env = process_env());

    // Overlay a YAML document onto this configuration.
    Result<void> apply_yaml(const std::string& yaml_text);

    // Overlay environment keys (TIVO_IP, WATCH_DIR, TO_EMAIL, ...).
    Result<void> apply_environment(const EnvLookup& env);

    // Positional CLI overrides.
    void set_device_address(const std::string& address) { device_.address = address; }
    void set_sequence(const std::string& sequence) { device_.sequence = sequence; }

    // Accessors
    const DeviceConfig& device() const { return device_; }
    const WatchConfig& watch() const { return watch_; }
    const MailConfig& mail() const { return mail_; }
    const PathsConfig& paths() const { return paths_; }
    const fs::path& source_file() const { return source_file_; }

    // Mutable access for tests and embedding.
    DeviceConfig& device() { return device_; }
    WatchConfig& watch() { return watch_; }
    MailConfig& mail() { return mail_; }
    PathsConfig& paths() { return paths_; }

    static fs::path default_config_path();
    static EnvLookup process_env();

public:
    Config() = default;

private:

    DeviceConfig device_;
    WatchConfig watch_;
    MailConfig mail_;
    PathsConfig paths_;
    fs::path source_file_;
};

// Normalise an extension list: lower-case, leading dot, no duplicates.
std::vector<std::string> normalize_extensions(const std::vector<std::string>& exts);
