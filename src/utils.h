#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <chrono>

// String utility functions
std::string to_lowercase(const std::string& str);
std::string trim_string(const std::string& str);

// Path utility functions
std::string normalize_path_separators(const std::string& path);
std::string format_file_size(uint64_t size_bytes);

// True for a relative path that stays below the directory it is resolved against
// (no root, no drive, no ".." escaping after normalization, not empty or ".")
bool is_contained_relative_path(const std::string& path);
// True for a single path component usable as a file name stem ([A-Za-z0-9_-] only)
bool is_plain_file_stem(const std::string& name);

// Sum of regular file sizes under path (the file size itself for a file).
// Unreadable entries are skipped with a warning.
uint64_t calculate_content_size(const std::filesystem::path& path);

// Time utility functions
// Wall clock truncated to milliseconds, the precision timestamps are stored with
std::chrono::system_clock::time_point current_timestamp();
// ISO-8601 UTC, e.g. 2024-05-01T13:45:12.250Z
std::string format_timestamp(const std::chrono::system_clock::time_point& time);
// Accepts the format above; fraction and zone designator are optional (no zone means UTC)
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text);
void safe_gmtime(std::tm* tm_buf, const std::time_t* time);
