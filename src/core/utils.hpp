#pragma once

#include <string>
#include <cstdint>
#include <ctime>
#include <filesystem>

// Generate an ISO 8601 UTC timestamp with milliseconds
// (YYYY-MM-DDTHH:MM:SS.mmmZ). Timestamps in this format order lexicographically.
std::string now_iso();

// Parse an ISO 8601 timestamp (fractional seconds and a trailing Z are
// accepted and ignored) as UTC. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// 64-bit FNV-1a, chainable through `seed`.
constexpr std::uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
std::uint64_t fnv1a_64(const std::string& data, std::uint64_t seed = FNV_OFFSET_BASIS);

// Lowercase, zero-padded 16-digit hex.
std::string to_hex64(std::uint64_t v);

// Strict UTF-8 check: rejects overlong forms, surrogates and code points
// above U+10FFFF.
bool is_valid_utf8(const std::string& s);

// Expand a leading "~" to the user's home directory.
std::filesystem::path expand_user(const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
