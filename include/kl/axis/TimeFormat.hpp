#pragma once
#include <cmath>
#include <cstdint>
#include <ctime>
#include <string>

namespace kl {

// strftime pattern suited to a tick interval given in milliseconds.
inline const char* chooseTimeFormat(double intervalMs) {
  if (intervalMs < 60000.0)       return "%H:%M:%S";  // 14:30:15
  if (intervalMs < 86400000.0)    return "%H:%M";     // 14:30
  if (intervalMs < 2592000000.0)  return "%b %d";     // Jan 15
  if (intervalMs < 31536000000.0) return "%b %Y";     // Jan 2024
  return "%Y";                                        // 2024
}

// struct tm (UTC) to epoch seconds.
inline std::time_t portableTimegm(std::tm* tm) {
#ifdef _WIN32
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

inline std::tm toCalendar(std::int64_t epochMs, bool utc = true) {
  auto epoch = static_cast<std::time_t>(std::floor(static_cast<double>(epochMs) / 1000.0));
  std::tm tm{};
  if (utc) {
#ifdef _WIN32
    gmtime_s(&tm, &epoch);
#else
    gmtime_r(&epoch, &tm);
#endif
  } else {
#ifdef _WIN32
    localtime_s(&tm, &epoch);
#else
    localtime_r(&epoch, &tm);
#endif
  }
  return tm;
}

// Format an epoch-milliseconds timestamp with strftime.
inline std::string formatTimestamp(std::int64_t epochMs, const char* fmt, bool utc = true) {
  std::tm tm = toCalendar(epochMs, utc);
  char buf[64];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

} // namespace kl
