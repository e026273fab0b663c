#include "share_resolver.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>

ShareCatalog::ShareCatalog(const std::string& config_path)
    : config_path_(config_path) {}

static bool is_share_section(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "server") return false;
    if (lower.rfind("_tivo_", 0) == 0) return false;
    return !name.empty();
}

std::vector<ShareEntry> ShareCatalog::parse(std::istream& in) {
    std::vector<ShareEntry> shares;
    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            section = line.substr(1, line.size() - 2);
            trim(section);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        if (to_lower(key) != "path" || !is_share_section(section)) continue;

        // First path wins for a section
        bool seen = false;
        for (const auto& s : shares) {
            if (s.label == section) { seen = true; break; }
        }
        if (!seen) shares.push_back({section, value});
    }
    return shares;
}

Result<std::vector<ShareEntry>> ShareCatalog::list_shares() const {
    std::ifstream in(config_path_);
    if (!in) {
        return Result<std::vector<ShareEntry>>::Err(
            fmt::format("cannot read media server config {}", config_path_));
    }
    return Result<std::vector<ShareEntry>>::Ok(parse(in));
}

std::string normalize_share_path(const fs::path& p) {
    std::error_code ec;
    fs::path n = fs::weakly_canonical(fs::absolute(p, ec), ec);
    if (ec) n = p.lexically_normal();
    std::string s = n.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

Result<std::string> ShareCatalog::share_for_path(const fs::path& dir) const {
    auto shares = list_shares();
    if (shares.is_err()) return Result<std::string>::Err(shares.error);

    std::string wanted = normalize_share_path(dir);
    std::vector<std::string> matches;
    for (const auto& s : shares.value) {
        if (normalize_share_path(s.path) == wanted) {
            matches.push_back(s.label);
        }
    }

    if (matches.empty()) {
        return Result<std::string>::Err(fmt::format("no share configured for {}", wanted));
    }
    if (matches.size() > 1) {
        std::string names;
        for (const auto& m : matches) {
            if (!names.empty()) names += ", ";
            names += m;
        }
        return Result<std::string>::Err(
            fmt::format("ambiguous: {} shares configured for {} ({})", matches.size(), wanted, names));
    }
    return Result<std::string>::Ok(matches.front());
}

// ── ShareResolver ────────────────────────────────────────────

ShareResolver::ShareResolver(const ShareCatalog& catalog,
                             std::string fallback_label)
    : catalog_(catalog), fallback_label_(std::move(fallback_label)) {}

ResolvedShare ShareResolver::resolve(const std::string& watch_dir,
                                     const std::string& explicit_override) const {
    ResolvedShare out;
    if (!explicit_override.empty()) {
        out.label = explicit_override;
        return out;
    }

    auto found = catalog_.share_for_path(watch_dir);
    if (found.is_ok() && !found.value.empty()) {
        out.label = found.value;
        return out;
    }

    out.label = fallback_label_;
    out.fallback = true;
    out.reason = found.is_err() ? found.error : "empty share name";
    watch_log(fmt::format("Share detection failed ({}), using default share '{}'",
                          out.reason, fallback_label_));
    return out;
}
