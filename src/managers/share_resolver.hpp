#pragma once

#include <core/types.hpp>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct ShareEntry {
    std::string label;      // section name in the media server config
    std::string path;
};

// Read-only view of the media server's INI configuration: every section
// with a `path` key is a share. [Server] and [_tivo_*] sections are device
// settings, not shares.
class ShareCatalog {
public:
    explicit ShareCatalog(const std::string& config_path);

    Result<std::vector<ShareEntry>> list_shares() const;

    // Label of the single share whose path is `dir`.
    // Errors: unreadable config, no match, more than one match.
    Result<std::string> share_for_path(const fs::path& dir) const;

    static std::vector<ShareEntry> parse(std::istream& in);

    const std::string& config_path() const { return config_path_; }

private:
    std::string config_path_;
};

struct ResolvedShare {
    std::string label;
    bool fallback = false;  // default label used because resolution failed
    std::string reason;     // why resolution failed (fallback only)
};

// Maps the watch directory to the destination label the transfer client
// should use. Resolution is advisory: failures fall back to a fixed label.
class ShareResolver {
public:
    explicit ShareResolver(const ShareCatalog& catalog,
                           std::string fallback_label);

    ResolvedShare resolve(const std::string& watch_dir,
                          const std::string& explicit_override) const;

private:
    const ShareCatalog& catalog_;
    std::string fallback_label_;
};

// Lexical comparison key for share paths: absolute, normalised, no trailing '/'.
std::string normalize_share_path(const fs::path& p);
