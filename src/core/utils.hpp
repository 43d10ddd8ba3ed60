#pragma once

#include <string>
#include <chrono>
#include <ctime>

// Format a wall-clock time point as UTC ISO 8601 with milliseconds
// (YYYY-MM-DDTHH:MM:SS.mmmZ).
std::string to_iso_utc(std::chrono::system_clock::time_point tp);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Random 128-bit identifier rendered as a UUID v4 string.
std::string generate_uuid();

// Quote a path for a POSIX shell `cd`: wraps in double quotes, escapes '"' and '\'.
std::string shell_double_quote(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
