// Turns an Event into its colored and plain multi-line text. The plain form
// is never built on its own: it is always the colored form with the ANSI
// color sequences stripped, so the two cannot drift apart.
#pragma once

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include "Event.hpp"
#include "StackTrace.hpp"
#include "Types.hpp"
#include "details/StringUtil.hpp"

namespace tracer {

namespace details {

inline constexpr std::string_view timeFormat = "%Y-%m-%d %H:%M:%S";

inline std::string ansi(int code) { return "\x1B[" + std::to_string(code) + "m"; }

inline const std::string ansiReset = "\x1B[0m";

// "+HHMM"/"-HHMM". The sign follows the whole-hour part truncated toward
// zero, so offsets between -59 and -1 minutes come out with a '+'.
inline std::string toNumericUtcOffset(int offsetInMinutes) {
  const int hours = offsetInMinutes / 60;
  const int minutes = std::abs(offsetInMinutes % 60);
  const int absHours = std::abs(hours);

  std::string out;
  out.reserve(5);
  out.push_back(hours >= 0 ? '+' : '-');
  if (absHours < 10)
    out.push_back('0');
  out += std::to_string(absHours);
  if (minutes < 10)
    out.push_back('0');
  out += std::to_string(minutes);
  return out;
}

inline std::string toFormattedTime(const std::tm &tm, std::string_view fmt) {
  std::ostringstream oss;
  oss << std::put_time(&tm, std::string(fmt).c_str());
  return oss.str();
}

} // namespace details

// "yyyy-MM-dd HH:mm:ss +HHMM" in the timestamp's own offset.
inline std::string formatTimestamp(const Timestamp &timestamp) {
  return details::toFormattedTime(timestamp.wallClock(), details::timeFormat) +
         " " + details::toNumericUtcOffset(timestamp.m_utcOffsetMinutes);
}

// "yyyy-MM-dd", used for per-day file names.
inline std::string formatDate(const Timestamp &timestamp) {
  return details::toFormattedTime(timestamp.wallClock(), "%Y-%m-%d");
}

class LogFormatter {
public:
  LogFormatter() = default;
  explicit LogFormatter(FoldPredicate foldPredicate)
      : m_foldPredicate(std::move(foldPredicate)) {}

  [[nodiscard]] std::string formatColored(const Event &event) const {
    const std::string time = formatTimestamp(event.m_timestamp);
    const std::string color = details::ansi(levelColor(event.m_level));

    std::string text;
    text.reserve(128);
    text += details::ansiReset;
    text += '[';
    text += time;
    text += "] ";
    text += color;
    text += centeredLevelName(event.m_level);
    text += ": ";
    text += event.m_section;
    text += ": ";
    text += event.m_body;
    text += details::ansiReset;

    const std::string separator =
        event.m_indentation ? "\n" + std::string(time.size() + 3, ' ') + "|"
                            : std::string("\n|");

    if (event.m_description && !event.m_description->empty()) {
      text += separator;
      text += "> ";
      text += details::replaceAll(*event.m_description, "\n", separator + "  ");
    }

    if (event.m_error) {
      appendColoredBlock(text, event.m_error->text(), separator, color);
    }

    if (event.m_stack) {
      appendColoredBlock(text,
                         event.m_stack->fold(m_foldPredicate, true).toString(),
                         separator, color);
    }

    return text;
  }

  [[nodiscard]] std::string format(const Event &event) const {
    return details::stripAnsi(formatColored(event));
  }

private:
  // Appends "- " and the trimmed block in the level color, re-coloring each
  // continuation line. Blank blocks contribute nothing.
  static void appendColoredBlock(std::string &text, const std::string &block,
                                 const std::string &separator,
                                 const std::string &color) {
    const std::string trimmed = details::trim(block);
    if (trimmed.empty())
      return;

    text += separator;
    text += "- ";
    text += color;
    text += details::replaceAll(trimmed, "\n",
                                details::ansiReset + separator + "  " + color);
    text += details::ansiReset;
  }

  FoldPredicate m_foldPredicate{folds::KeepAll()};
};

// Rendered text contract consumed by handlers. Both strings are ready to
// write as-is.
inline std::string generatedMessageColored(const Event &event) {
  return LogFormatter{}.formatColored(event);
}

inline std::string generatedMessage(const Event &event) {
  return LogFormatter{}.format(event);
}

} // namespace tracer
