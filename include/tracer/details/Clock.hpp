// The two clock queries Timestamp needs: broken-down UTC fields of an
// instant, and the local zone's offset at that instant.
#pragma once

#include <ctime>
#include <time.h>

#if !defined(_WIN32) && !defined(__linux__)
#error "Unsupported platform for time functions"
#endif

namespace tracer::details {

inline std::tm utcFields(std::time_t t) {
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm;
}

// Minutes east of UTC for the process time zone at `t`, DST included.
inline int localOffsetMinutes(std::time_t t) {
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &t);
  // Reading the local fields back as UTC leaves the offset as the difference.
  return static_cast<int>((_mkgmtime(&local) - t) / 60);
#else
  localtime_r(&t, &local);
  return static_cast<int>(local.tm_gmtoff / 60);
#endif
}

} // namespace tracer::details
