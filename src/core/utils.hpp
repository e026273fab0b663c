#pragma once

#include <string>
#include <vector>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Log-style local timestamp (YYYY-MM-DD HH:MM:SS). t = 0 means now.
std::string format_local_time(std::time_t t = 0);

// Strict integer parse: the whole string must be a number.
bool parse_int(const std::string& s, int& out);

// Interpret "1/true/yes/on" (any case) as true.
bool parse_bool(const std::string& s, bool fallback = false);

std::string to_lower(std::string s);

// Split on a delimiter, trimming each piece and dropping empty ones.
std::vector<std::string> split_list(const std::string& s, char delimiter);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
