#pragma once

#include <string>
#include <filesystem>
#include <cstdint>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Bytes available to unprivileged users on the file system holding `path`.
// Walks up to the nearest existing parent. Returns -1 if it cannot be determined.
int64_t disk_free_bytes(const std::filesystem::path& path);

// Write `contents` to `<path>.tmp`, flush, then rename over `path`.
// Readers observe either the old or the new file, never a torn one.
void atomic_write_file(const std::filesystem::path& path, const std::string& contents);

} // namespace platform
