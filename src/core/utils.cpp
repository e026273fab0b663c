#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string format_local_time(std::time_t t) {
    if (t == 0) t = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

bool parse_int(const std::string& s, int& out) {
    std::string t = s;
    trim(t);
    if (t.empty()) return false;
    size_t pos = 0;
    try {
        int v = std::stoi(t, &pos);
        if (pos != t.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_bool(const std::string& s, bool fallback) {
    std::string t = to_lower(s);
    trim(t);
    if (t == "1" || t == "true" || t == "yes" || t == "on") return true;
    if (t == "0" || t == "false" || t == "no" || t == "off") return false;
    return fallback;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_list(const std::string& s, char delimiter) {
    std::vector<std::string> out;
    std::istringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}
