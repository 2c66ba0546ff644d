// An ordered, normalized stack trace attached to warn-and-above events.
// Frames are either captured from the running thread or parsed from the
// textual trace of some other source.
#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "details/BacktraceWrapper.hpp"
#include "details/StringUtil.hpp"

namespace tracer {

struct Frame {
  std::string m_location;
  std::string m_member;

  bool operator==(const Frame &) const = default;
};

// Decides whether a frame is internal and should be folded away.
using FoldPredicate = std::function<bool(const Frame &)>;

namespace folds {

// Keeps every frame distinguishable.
inline auto KeepAll() {
  return [](const Frame &) { return false; };
}

// Folds frames whose location starts with any of the given prefixes, e.g.
// "/usr/lib" for system libraries.
inline auto LocationPrefix(std::vector<std::string> prefixes) {
  return [prefixes = std::move(prefixes)](const Frame &frame) {
    return std::ranges::any_of(prefixes, [&](const std::string &prefix) {
      return frame.m_location.starts_with(prefix);
    });
  };
}

} // namespace folds

class StackTrace {
public:
  StackTrace() = default;
  explicit StackTrace(std::vector<Frame> frames) : m_frames(std::move(frames)) {}

  // Captures the calling thread. `skip` drops that many innermost frames
  // above the caller of current().
  static StackTrace current(std::size_t skip = 0) {
    std::vector<Frame> frames;
    for (auto &captured : details::captureFrames(skip + 1))
      frames.push_back(
          Frame{std::move(captured.location), std::move(captured.member)});
    return StackTrace{std::move(frames)};
  }

  // One frame per non-empty line. A leading "#3" or "3#" index is dropped
  // and the line is split on its last " at " into member and location;
  // lines without " at " become a location-only frame.
  static StackTrace parse(std::string_view text) {
    std::vector<Frame> frames;
    std::string_view::size_type start = 0;
    while (start <= text.size()) {
      auto end = text.find('\n', start);
      if (end == std::string_view::npos)
        end = text.size();
      std::string line = details::trim(text.substr(start, end - start));
      start = end + 1;
      if (line.empty())
        continue;

      line = stripFrameIndex(line);
      if (const auto at = line.rfind(" at "); at != std::string::npos) {
        frames.push_back(Frame{details::trim(line.substr(at + 4)),
                               details::trim(line.substr(0, at))});
      } else {
        frames.push_back(Frame{std::move(line), ""});
      }
    }
    return StackTrace{std::move(frames)};
  }

  // Collapses every run of consecutive frames matching `predicate` into a
  // single frame: the run's last location with the member cleared. In terse
  // mode frames with neither location nor member are removed as well.
  [[nodiscard]] StackTrace fold(const FoldPredicate &predicate,
                                bool terse = false) const {
    std::vector<Frame> result;
    bool inRun = false;
    for (const Frame &frame : m_frames) {
      if (terse && frame.m_location.empty() && frame.m_member.empty())
        continue;

      if (!predicate(frame)) {
        result.push_back(frame);
        inRun = false;
        continue;
      }
      if (inRun)
        result.back().m_location = frame.m_location;
      else
        result.push_back(Frame{frame.m_location, ""});
      inRun = true;
    }
    return StackTrace{std::move(result)};
  }

  // Locations padded to the longest one, then two spaces and the member.
  [[nodiscard]] std::string toString() const {
    std::size_t longest = 0;
    for (const Frame &frame : m_frames)
      longest = std::max(longest, frame.m_location.size());

    std::string out;
    for (const Frame &frame : m_frames) {
      out += frame.m_location;
      if (!frame.m_member.empty()) {
        out.append(longest - frame.m_location.size() + 2, ' ');
        out += frame.m_member;
      }
      out += '\n';
    }
    return out;
  }

  [[nodiscard]] const std::vector<Frame> &frames() const { return m_frames; }
  [[nodiscard]] bool empty() const { return m_frames.empty(); }
  [[nodiscard]] std::size_t size() const { return m_frames.size(); }

private:
  static std::string stripFrameIndex(const std::string &line) {
    std::size_t i = 0;
    if (i < line.size() && line[i] == '#')
      ++i;
    const std::size_t digitsStart = i;
    while (i < line.size() && line[i] >= '0' && line[i] <= '9')
      ++i;
    if (i == digitsStart)
      return line;
    if (line[0] != '#') {
      // "3# frame" form
      if (i >= line.size() || line[i] != '#')
        return line;
      ++i;
    }
    if (i < line.size() && line[i] != ' ' && line[i] != '\t')
      return line;
    return details::trim(std::string_view(line).substr(i));
  }

  std::vector<Frame> m_frames;
};

} // namespace tracer
