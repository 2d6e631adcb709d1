#pragma once

#include <string>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// ASCII lower-case copy.
std::string to_lower(const std::string& s);

bool ends_with(const std::string& s, const std::string& suffix);

// Non-overlapping occurrences of needle in s. Zero for an empty needle.
size_t count_occurrences(const std::string& s, const std::string& needle);

// Copy with trailing whitespace removed.
std::string rtrim_copy(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
