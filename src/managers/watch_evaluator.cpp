#include "watch_evaluator.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

WatchEvaluator::WatchEvaluator(const WatchConfig& watch)
    : dir_(watch.directory),
      extensions_(normalize_extensions(watch.extensions)),
      min_age_secs_(watch.min_file_age) {}

std::vector<CandidateFile> WatchEvaluator::scan() const {
    return scan(dir_, extensions_, min_age_secs_);
}

std::vector<CandidateFile> WatchEvaluator::scan(fs::file_time_type now) const {
    return scan(dir_, extensions_, min_age_secs_, now);
}

bool WatchEvaluator::has_media_extension(const fs::path& path,
                                         const std::vector<std::string>& extensions) {
    std::string ext = to_lower(path.extension().string());
    if (ext.empty()) return false;
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

static std::time_t to_time_t(fs::file_time_type ftime) {
    auto sys = std::chrono::system_clock::now() +
               std::chrono::duration_cast<std::chrono::system_clock::duration>(
                   ftime - fs::file_time_type::clock::now());
    return std::chrono::system_clock::to_time_t(sys);
}

std::vector<CandidateFile> WatchEvaluator::scan(const fs::path& dir,
                                                const std::vector<std::string>& extensions,
                                                int min_age_secs,
                                                fs::file_time_type now) {
    std::vector<CandidateFile> files;
    std::error_code ec;

    if (!fs::is_directory(dir, ec)) {
        return files;
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        watch_log_warn(fmt::format("Error scanning directory {}: {}", dir.string(), ec.message()));
        return files;
    }

    const auto min_age = std::chrono::seconds(min_age_secs);

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        std::error_code entry_ec;

        // status() follows symlinks: a link counts when its target is a regular file.
        if (!entry.is_regular_file(entry_ec) || entry_ec) continue;
        if (!has_media_extension(entry.path(), extensions)) continue;

        auto mtime = fs::last_write_time(entry.path(), entry_ec);
        if (entry_ec) continue;

        // Still being written
        if (now - mtime < min_age) continue;

        CandidateFile f;
        f.path = entry.path();
        f.mtime = to_time_t(mtime);
        files.push_back(std::move(f));
    }

    std::sort(files.begin(), files.end(),
              [](const CandidateFile& a, const CandidateFile& b) { return a.path < b.path; });
    return files;
}
