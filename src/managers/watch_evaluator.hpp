#pragma once

#include "run.hpp"
#include <core/types.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Decides whether the watch directory holds work: media files (or symlinks
// to media files) directly inside it, old enough to be fully written.
class WatchEvaluator {
public:
    explicit WatchEvaluator(const WatchConfig& watch);

    // Eligible files sorted by name. Never fails: a missing or unreadable
    // directory yields an empty list.
    std::vector<CandidateFile> scan() const;
    std::vector<CandidateFile> scan(fs::file_time_type now) const;

    static std::vector<CandidateFile> scan(const fs::path& dir,
                                           const std::vector<std::string>& extensions,
                                           int min_age_secs,
                                           fs::file_time_type now = fs::file_time_type::clock::now());

    // Case-insensitive match of the file's extension against `extensions`
    // (lower-case, leading dot).
    static bool has_media_extension(const fs::path& path,
                                    const std::vector<std::string>& extensions);

private:
    fs::path dir_;
    std::vector<std::string> extensions_;
    int min_age_secs_;
};
