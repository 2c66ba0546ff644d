// Logger configuration: an aggregate of settings plus an optional overlay
// read from the process environment.
//   TRACER_LEVEL   debug|info|warn|error|fatal
//   TRACER_UTC     1|0|true|false|yes|no|on|off
//   TRACER_INDENT  same as TRACER_UTC
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "Types.hpp"

namespace tracer {

namespace details {

inline std::optional<bool> parseBool(std::string_view value) {
  std::string lowered(value);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on")
    return true;
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off")
    return false;
  return std::nullopt;
}

inline std::optional<std::string_view> getEnv(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr)
    return std::nullopt;
  return std::string_view{value};
}

} // namespace details

struct LoggerConfig {
  // Events below this level are dropped before any filter runs.
  Level minLevel{Level::Info};
  bool indentation{true};
  // Fixed for the lifetime of a Logger.
  TimeType timeType{TimeType::Local};

  // `base` with any recognised TRACER_* variables applied on top.
  // Unparseable values leave the corresponding field untouched.
  static LoggerConfig fromEnvironment(LoggerConfig base);
  static LoggerConfig fromEnvironment();
};

inline LoggerConfig LoggerConfig::fromEnvironment(LoggerConfig base) {
  if (auto value = details::getEnv("TRACER_LEVEL"))
    if (auto level = levelFromString(*value))
      base.minLevel = *level;

  if (auto value = details::getEnv("TRACER_UTC"))
    if (auto utc = details::parseBool(*value))
      base.timeType = *utc ? TimeType::Utc : TimeType::Local;

  if (auto value = details::getEnv("TRACER_INDENT"))
    if (auto indent = details::parseBool(*value))
      base.indentation = *indent;

  return base;
}

inline LoggerConfig LoggerConfig::fromEnvironment() {
  return fromEnvironment(LoggerConfig{});
}

} // namespace tracer
