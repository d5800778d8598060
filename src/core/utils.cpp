#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

int64_t safe_stoll(const std::string& s, int64_t fallback) {
    try {
        return std::stoll(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (suffix.size() > s.size()) return false;
    return to_lower(s.substr(s.size() - suffix.size())) == to_lower(suffix);
}

std::string format_bytes(int64_t bytes) {
    if (bytes < 1024) return fmt::format("{} B", bytes);
    double v = static_cast<double>(bytes);
    if (bytes < 1024LL * 1024) return fmt::format("{:.1f} KB", v / 1024.0);
    if (bytes < 1024LL * 1024 * 1024) return fmt::format("{:.1f} MB", v / (1024.0 * 1024.0));
    return fmt::format("{:.2f} GB", v / (1024.0 * 1024.0 * 1024.0));
}

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}
