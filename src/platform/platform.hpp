#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Write `data` to `path` (truncating) and flush it to stable storage.
// Returns false on any failure; errno-style detail goes to `error`.
bool write_file_durable(const std::filesystem::path& path, const std::string& data,
                        std::string& error);

// Flush directory metadata (entries created or renamed inside it).
// No-op where the platform has no equivalent.
bool sync_dir(const std::filesystem::path& dir);

} // namespace platform
