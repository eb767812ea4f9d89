/**
 * @file duration_resolver.cpp
 * @brief Progress denominator resolution
 */

#include "media_convert/duration_resolver.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <exception>

#include "media_convert/logging.hpp"
#include "media_convert/system.hpp"

namespace media_convert {

namespace {

/// Strict strtod: whole string must be a number
bool parse_number(const std::string &text, double &value) {
  if (text.empty())
    return false;
  char *end = nullptr;
  errno = 0;
  value = std::strtod(text.c_str(), &end);
  return errno == 0 && end != text.c_str() && *end == '\0' &&
         std::isfinite(value);
}

} // anonymous namespace

std::optional<int64_t> parse_duration_field(const std::string &text) {
  std::string t = trim(text);
  if (t.empty())
    return std::nullopt;

  double seconds = 0;
  size_t colon = t.find(':');
  if (colon == std::string::npos) {
    if (!parse_number(t, seconds))
      return std::nullopt;
  } else {
    /// HH:MM:SS(.fff) or MM:SS(.fff)
    double total = 0;
    size_t pos = 0;
    int fields = 0;
    while (pos <= t.size()) {
      size_t end = t.find(':', pos);
      if (end == std::string::npos)
        end = t.size();
      double part = 0;
      if (!parse_number(t.substr(pos, end - pos), part) || part < 0)
        return std::nullopt;
      total = total * 60.0 + part;
      ++fields;
      pos = end + 1;
    }
    if (fields > 3)
      return std::nullopt;
    seconds = total;
  }

  if (seconds <= 0)
    return std::nullopt;

  return static_cast<int64_t>(std::llround(seconds * 1000.0));
}

std::optional<int64_t> resolve_duration(const ConversionRequest &request,
                                        MediaEngine &engine) {
  if (request.clip) {
    double length = request.clip->end - request.clip->start;
    if (!(length > 0) || length > kMaxClipSeconds)
      return std::nullopt;
    return static_cast<int64_t>(std::llround(length * 1000.0));
  }

  MediaMetadata meta;
  bool probed = false;
  try {
    probed = engine.probe(request.input_path, meta);
  } catch (const std::exception &e) {
    LOG_WARN("Probe of {} threw: {}", request.input_path, e.what());
  }
  if (!probed) {
    LOG_WARN("Could not probe {}, progress disabled", request.input_path);
    return std::nullopt;
  }

  auto duration_ms = parse_duration_field(meta.duration);
  if (!duration_ms) {
    LOG_WARN("No usable duration for {} ('{}'), progress disabled",
             request.input_path, meta.duration);
    return std::nullopt;
  }
  return duration_ms;
}

} // namespace media_convert
