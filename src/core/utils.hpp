#pragma once

#include <string>
#include <cstdint>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);
int64_t safe_stoll(const std::string& s, int64_t fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);

// Case-insensitive suffix test ("scan.RTDC" ends with ".rtdc").
bool ends_with_ci(const std::string& s, const std::string& suffix);

// Human-readable byte count: "512 B", "3.2 MB", "1.4 GB".
std::string format_bytes(int64_t bytes);

// Lowercase hex encoding of raw bytes.
std::string to_hex(const unsigned char* data, size_t len);
