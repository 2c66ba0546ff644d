// Defines common types and constants used throughout the tracer project.
// The severity levels form a closed set: rendering and gating both rely on
// every level having an entry in the level table below.

#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tracer {

enum class Level {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
  Fatal = 4,
  NumberOfLevels = 5
};

// Whether timestamps are captured in local time or forced to UTC.
enum class TimeType { Local, Utc };

struct LevelInfo {
  std::string_view m_name;
  int m_ansiColor;
  int m_importance;
  bool m_useStderr;
};

namespace details {

inline constexpr std::array<LevelInfo, 5> levelTable = {{
    {"Debug", 90, 0, false},
    {"Info", 94, 1, false},
    {"Warn", 93, 2, false},
    {"Error", 91, 3, true},
    {"Fatal", 91, 4, true},
}};

static_assert(levelTable.size() == static_cast<std::size_t>(Level::NumberOfLevels),
              "levelTable size must match number of Level entries");

inline constexpr std::size_t levelNameWidth = 5;

} // namespace details

constexpr const LevelInfo &levelInfo(Level level) {
  return details::levelTable[static_cast<std::size_t>(level)];
}

constexpr std::string_view levelToString(Level level) {
  return levelInfo(level).m_name;
}

constexpr int levelColor(Level level) { return levelInfo(level).m_ansiColor; }

constexpr int levelImportance(Level level) {
  return levelInfo(level).m_importance;
}

constexpr bool levelUsesStderr(Level level) {
  return levelInfo(level).m_useStderr;
}

// True if `level` is at least as severe as `threshold`. Compares importance
// ranks, not enumerator values.
constexpr bool isAtLeast(Level level, Level threshold) {
  return levelImportance(level) >= levelImportance(threshold);
}

// Centers the level name in a field of width 5. Odd padding puts the extra
// space on the right, e.g. "Info" -> "Info ".
inline std::string centeredLevelName(Level level) {
  const std::string_view name = levelToString(level);
  if (name.size() >= details::levelNameWidth)
    return std::string(name);

  const std::size_t totalPadding = details::levelNameWidth - name.size();
  const std::size_t padLeft = totalPadding / 2;
  const std::size_t padRight = totalPadding - padLeft;

  std::string result;
  result.reserve(details::levelNameWidth);
  result.append(padLeft, ' ');
  result.append(name);
  result.append(padRight, ' ');
  return result;
}

// Case-insensitive lookup by display name ("warn", "WARN", "Warn").
inline std::optional<Level> levelFromString(std::string_view name) {
  for (std::size_t i = 0; i < details::levelTable.size(); ++i) {
    const std::string_view candidate = details::levelTable[i].m_name;
    if (candidate.size() != name.size())
      continue;
    const bool equal = std::equal(
        candidate.begin(), candidate.end(), name.begin(), [](char a, char b) {
          return std::tolower(static_cast<unsigned char>(a)) ==
                 std::tolower(static_cast<unsigned char>(b));
        });
    if (equal)
      return static_cast<Level>(i);
  }
  return std::nullopt;
}

} // namespace tracer
