#include "platform.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

int64_t disk_free_bytes(const fs::path& path) {
    std::error_code ec;
    fs::path dir = path;
    while (!dir.empty() && !fs::exists(dir, ec)) {
        if (dir == dir.parent_path()) break;
        dir = dir.parent_path();
    }
    if (dir.empty()) dir = fs::current_path(ec);

    auto info = fs::space(dir, ec);
    if (ec) return -1;
    return static_cast<int64_t>(info.available);
}

void atomic_write_file(const fs::path& path, const std::string& contents) {
    fs::create_directories(path.parent_path());
    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write " + tmp.string());
        }
        out << contents;
        out.flush();
        if (!out) {
            throw std::runtime_error("Short write to " + tmp.string());
        }
    }

    fs::rename(tmp, path);
}

} // namespace platform
