#include "utils.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

// Function to convert string to lowercase for case-insensitive search
std::string to_lowercase(const std::string& str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

// Function to trim leading and trailing whitespace from string
std::string trim_string(const std::string& str) {
  if (str.empty()) {
    return str;
  }

  std::string result = str;

  // Trim leading whitespace
  result.erase(result.begin(), std::find_if(result.begin(), result.end(), [](unsigned char ch) {
    return !std::isspace(ch);
  }));

  // Trim trailing whitespace
  result.erase(std::find_if(result.rbegin(), result.rend(), [](unsigned char ch) {
    return !std::isspace(ch);
  }).base(), result.end());

  return result;
}

// Function to normalize path separators to forward slashes
std::string normalize_path_separators(const std::string& path) {
  std::string normalized = path;
  std::replace(normalized.begin(), normalized.end(), '\\', '/');
  return normalized;
}

bool is_contained_relative_path(const std::string& path) {
  if (path.empty()) {
    return false;
  }
  const fs::path candidate = fs::u8path(normalize_path_separators(path));
  if (candidate.has_root_path()) {
    return false;
  }

  // A normalized path only keeps ".." as leading components
  const fs::path normal = candidate.lexically_normal();
  if (normal.empty() || normal == ".") {
    return false;
  }
  return *normal.begin() != "..";
}

bool is_plain_file_stem(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_';
  });
}

std::string format_file_size(uint64_t size_bytes) {
  char buffer[32];
  if (size_bytes >= 1024ULL * 1024 * 1024) {
    double size_gb = static_cast<double>(size_bytes) / (1024.0 * 1024.0 * 1024.0);
    snprintf(buffer, sizeof(buffer), "%.2f GB", size_gb);
    return std::string(buffer);
  }
  else if (size_bytes >= 1024 * 1024) {
    double size_mb = static_cast<double>(size_bytes) / (1024.0 * 1024.0);
    snprintf(buffer, sizeof(buffer), "%.1f MB", size_mb);
    return std::string(buffer);
  }
  else if (size_bytes >= 1024) {
    double size_kb = static_cast<double>(size_bytes) / 1024.0;
    snprintf(buffer, sizeof(buffer), "%.1f KB", size_kb);
    return std::string(buffer);
  }
  else {
    return std::to_string(size_bytes) + " bytes";
  }
}

uint64_t calculate_content_size(const fs::path& path) {
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    uint64_t size = fs::file_size(path, ec);
    if (ec) {
      LOG_WARN("Failed to read size of {}: {}", path.u8string(), ec.message());
      return 0;
    }
    return size;
  }

  if (!fs::is_directory(path, ec)) {
    return 0;
  }

  uint64_t total_size = 0;
  fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    LOG_WARN("Failed to scan directory {}: {}", path.u8string(), ec.message());
    return 0;
  }

  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      LOG_WARN("Error while scanning {}: {}", path.u8string(), ec.message());
      break;
    }

    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec)) {
      uint64_t size = it->file_size(entry_ec);
      if (!entry_ec) {
        total_size += size;
      }
      else {
        LOG_WARN("Failed to read size of {}: {}", it->path().u8string(), entry_ec.message());
      }
    }
  }

  return total_size;
}

std::chrono::system_clock::time_point current_timestamp() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::string format_timestamp(const std::chrono::system_clock::time_point& time) {
  auto ms_since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
  auto seconds = ms_since_epoch / 1000;
  auto millis = ms_since_epoch % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::time_t time_t_value = static_cast<std::time_t>(seconds);
  std::tm tm_buf{};
  safe_gmtime(&tm_buf, &time_t_value);

  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
    << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text) {
  std::tm tm_buf{};
  std::istringstream ss(text);
  ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail()) {
    return std::nullopt;
  }

  // Optional fraction, only millisecond precision is kept
  int64_t millis = 0;
  if (ss.peek() == '.') {
    ss.get();
    int digits = 0;
    while (std::isdigit(ss.peek())) {
      char c = static_cast<char>(ss.get());
      if (digits < 3) {
        millis = millis * 10 + (c - '0');
      }
      digits++;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 3; digits++) {
      millis *= 10;
    }
  }

  // Optional zone designator
  int64_t offset_seconds = 0;
  int next = ss.peek();
  if (next == 'Z') {
    ss.get();
  }
  else if (next == '+' || next == '-') {
    char sign = static_cast<char>(ss.get());
    int hours = 0;
    int minutes = 0;
    char colon = 0;
    ss >> hours >> colon >> minutes;
    if (ss.fail() || colon != ':') {
      return std::nullopt;
    }
    offset_seconds = (hours * 3600 + minutes * 60) * (sign == '+' ? 1 : -1);
  }

  if (ss.peek() != std::char_traits<char>::eof()) {
    return std::nullopt;
  }

#ifdef _WIN32
  std::time_t utc_seconds = _mkgmtime(&tm_buf);
#else
  std::time_t utc_seconds = timegm(&tm_buf);
#endif
  if (utc_seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }

  auto since_epoch = std::chrono::seconds(static_cast<int64_t>(utc_seconds) - offset_seconds) +
    std::chrono::milliseconds(millis);
  return std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

void safe_gmtime(std::tm* tm_buf, const std::time_t* time) {
#ifdef _WIN32
  gmtime_s(tm_buf, time);
#else
  gmtime_r(time, tm_buf);
#endif
}
