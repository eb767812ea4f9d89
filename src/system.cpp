/**
 * @file system.cpp
 * @brief System and text utilities implementation
 */

#include "media_convert/system.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>

#include <unistd.h>

#include <fmt/core.h>

namespace media_convert {

// **---- Executables ----**

std::string find_executable(const std::string &name) {
  if (name.empty())
    return {};

  if (name.find('/') != std::string::npos) {
    return (access(name.c_str(), X_OK) == 0) ? name : std::string();
  }

  const char *path_env = std::getenv("PATH");
  std::string path_list = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

  size_t pos = 0;
  while (pos <= path_list.size()) {
    size_t end = path_list.find(':', pos);
    if (end == std::string::npos)
      end = path_list.size();

    /// Empty PATH entry means current directory
    std::string dir = path_list.substr(pos, end - pos);
    if (dir.empty())
      dir = ".";

    std::string candidate = (std::filesystem::path(dir) / name).string();
    if (access(candidate.c_str(), X_OK) == 0)
      return candidate;

    pos = end + 1;
  }
  return {};
}

// **---- Text ----**

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

std::string trim(const std::string &text) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto first = std::find_if_not(text.begin(), text.end(), is_space);
  auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  return (first < last) ? std::string(first, last) : std::string();
}

std::string extension_of(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  if (!ext.empty() && ext[0] == '.')
    ext.erase(0, 1);
  return to_lower(ext);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  /// Saturate before the cast: out-of-range double -> int64_t is undefined
  constexpr double kMaxSeconds = 9.0e18;
  int64_t total = 0;
  if (std::isfinite(seconds) && seconds > 0)
    total = static_cast<int64_t>(std::min(seconds, kMaxSeconds));

  int64_t h = total / 3600;
  int64_t m = (total % 3600) / 60;
  int64_t s = total % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace media_convert
