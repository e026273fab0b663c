#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

std::vector<std::string> normalize_extensions(const std::vector<std::string>& exts) {
    std::vector<std::string> out;
    for (auto ext : exts) {
        trim(ext);
        if (ext.empty()) continue;
        ext = to_lower(ext);
        if (ext[0] != '.') ext.insert(ext.begin(), '.');
        if (std::find(out.begin(), out.end(), ext) == out.end()) {
            out.push_back(ext);
        }
    }
    return out;
}

fs::path Config::default_config_path() {
    return fs::path(DEFAULT_CONFIG_FILE);
}

EnvLookup Config::process_env() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

Config Config::defaults() {
    Config c;
    c.device_.address = DEFAULT_DEVICE_ADDRESS;
    c.device_.sequence = DEFAULT_SEQUENCE;
    c.device_.transfer_client = DEFAULT_TRANSFER_CLIENT;

    c.watch_.directory = DEFAULT_WATCH_DIR;
    for (const char* ext : DEFAULT_EXTENSIONS) c.watch_.extensions.push_back(ext);
    c.watch_.min_file_age = DEFAULT_MIN_FILE_AGE_SECS;
    c.watch_.check_interval = DEFAULT_CHECK_INTERVAL_SECS;

    c.mail_.smtp_server = DEFAULT_SMTP_SERVER;
    c.mail_.smtp_port = DEFAULT_SMTP_PORT;
    c.mail_.from = DEFAULT_FROM_EMAIL;

    c.paths_.lock_file = DEFAULT_LOCK_FILE;
    c.paths_.log_file = DEFAULT_LOG_FILE;
    c.paths_.share_config = DEFAULT_SHARE_CONFIG;
    return c;
}

// ── YAML overlay ─────────────────────────────────────────────

static void read_string(const YAML::Node& node, const char* key, std::string& out) {
    if (node[key] && node[key].IsScalar()) {
        out = node[key].as<std::string>();
    }
}

static Result<void> read_int(const YAML::Node& node, const char* section,
                             const char* key, int& out) {
    if (!node[key]) return Result<void>::Ok();
    if (!node[key].IsScalar() || !parse_int(node[key].as<std::string>(), out)) {
        return Result<void>::Err(fmt::format("{}.{}: expected an integer", section, key));
    }
    return Result<void>::Ok();
}

static void read_bool(const YAML::Node& node, const char* key, bool& out) {
    if (node[key] && node[key].IsScalar()) {
        out = parse_bool(node[key].as<std::string>(), out);
    }
}

Result<void> Config::apply_yaml(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(fmt::format("invalid YAML: {}", e.what()));
    }
    if (root.IsNull()) return Result<void>::Ok();
    if (!root.IsMap()) return Result<void>::Err("top level must be a mapping");

    if (auto d = root["device"]) {
        read_string(d, "address", device_.address);
        read_string(d, "sequence", device_.sequence);
        read_string(d, "share_name", device_.share_name);
        read_string(d, "transfer_client", device_.transfer_client);
    }

    if (auto w = root["watch"]) {
        read_string(w, "directory", watch_.directory);
        if (w["extensions"]) {
            std::vector<std::string> exts;
            if (w["extensions"].IsSequence()) {
                for (const auto& e : w["extensions"]) exts.push_back(e.as<std::string>());
            } else if (w["extensions"].IsScalar()) {
                exts = split_list(w["extensions"].as<std::string>(), ',');
            }
            watch_.extensions = normalize_extensions(exts);
        }
        auto r = read_int(w, "watch", "min_file_age", watch_.min_file_age);
        if (r.is_err()) return r;
        r = read_int(w, "watch", "check_interval", watch_.check_interval);
        if (r.is_err()) return r;
        read_bool(w, "remove_transferred", watch_.remove_transferred);
    }

    if (auto m = root["mail"]) {
        read_string(m, "smtp_server", mail_.smtp_server);
        auto r = read_int(m, "mail", "smtp_port", mail_.smtp_port);
        if (r.is_err()) return r;
        read_string(m, "smtp_user", mail_.smtp_user);
        read_string(m, "smtp_pass", mail_.smtp_pass);
        read_string(m, "from", mail_.from);
        read_string(m, "to", mail_.to);
    }

    if (auto p = root["paths"]) {
        read_string(p, "lock_file", paths_.lock_file);
        read_string(p, "log_file", paths_.log_file);
        read_string(p, "share_config", paths_.share_config);
    }

    return Result<void>::Ok();
}

// ── Environment overlay ──────────────────────────────────────

Result<void> Config::apply_environment(const EnvLookup& env) {
    auto str = [&](const char* key, std::string& out) {
        if (auto v = env(key)) out = *v;
    };
    auto num = [&](const char* key, int& out) -> Result<void> {
        auto v = env(key);
        if (!v || v->empty()) return Result<void>::Ok();
        if (!parse_int(*v, out)) {
            return Result<void>::Err(fmt::format("{}={}: expected an integer", key, *v));
        }
        return Result<void>::Ok();
    };

    str("TIVO_IP", device_.address);
    str("SEQUENCE", device_.sequence);
    str("SHARE_NAME", device_.share_name);
    str("TRANSFER_CLIENT", device_.transfer_client);

    str("WATCH_DIR", watch_.directory);
    if (auto v = env("VIDEO_EXTENSIONS")) {
        watch_.extensions = normalize_extensions(split_list(*v, ','));
    }
    auto r = num("MIN_FILE_AGE", watch_.min_file_age);
    if (r.is_err()) return r;
    r = num("CHECK_INTERVAL", watch_.check_interval);
    if (r.is_err()) return r;
    if (auto v = env("REMOVE_TRANSFERRED")) {
        watch_.remove_transferred = parse_bool(*v, watch_.remove_transferred);
    }

    str("SMTP_SERVER", mail_.smtp_server);
    r = num("SMTP_PORT", mail_.smtp_port);
    if (r.is_err()) return r;
    str("SMTP_USER", mail_.smtp_user);
    str("SMTP_PASS", mail_.smtp_pass);
    str("FROM_EMAIL", mail_.from);
    str("TO_EMAIL", mail_.to);

    str("LOCK_FILE", paths_.lock_file);
    str("LOG_FILE", paths_.log_file);
    str("PYTIVO_CONF", paths_.share_config);

    return Result<void>::Ok();
}

// ── load ─────────────────────────────────────────────────────

static Result<void> validate(const Config& c) {
    if (c.watch().min_file_age < 0) {
        return Result<void>::Err("min_file_age must not be negative");
    }
    if (c.watch().check_interval <= 0) {
        return Result<void>::Err("check_interval must be positive");
    }
    if (c.watch().check_interval > MAX_CHECK_INTERVAL_SECS) {
        return Result<void>::Err(fmt::format("check_interval must not exceed {} seconds",
                                             MAX_CHECK_INTERVAL_SECS));
    }
    if (c.mail().smtp_port <= 0 || c.mail().smtp_port > 65535) {
        return Result<void>::Err(fmt::format("smtp_port out of range: {}", c.mail().smtp_port));
    }
    if (c.watch().extensions.empty()) {
        return Result<void>::Err("no media extensions configured");
    }
    return Result<void>::Ok();
}

Result<Config> Config::load(const fs::path& config_file, const EnvLookup& env) {
    Config config = defaults();

    if (!config_file.empty() && fs::exists(config_file)) {
        std::ifstream in(config_file);
        if (!in) {
            return Result<Config>::Err("cannot read " + config_file.string());
        }
        std::stringstream buf;
        buf << in.rdbuf();
        auto r = config.apply_yaml(buf.str());
        if (r.is_err()) {
            return Result<Config>::Err(config_file.string() + ": " + r.error);
        }
        config.source_file_ = config_file;
    }

    if (env) {
        auto r = config.apply_environment(env);
        if (r.is_err()) return Result<Config>::Err(r.error);
    }

    auto v = validate(config);
    if (v.is_err()) return Result<Config>::Err(v.error);
    return Result<Config>::Ok(std::move(config));
}
