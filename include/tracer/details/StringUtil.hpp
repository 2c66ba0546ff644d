// Small string helpers shared by the event model and the renderer.
#pragma once

#include <string>
#include <string_view>

namespace tracer::details {

inline constexpr std::string_view whitespace = " \t\n\r\v\f";

inline std::string trim(std::string_view text) {
  const auto first = text.find_first_not_of(whitespace);
  if (first == std::string_view::npos)
    return {};
  const auto last = text.find_last_not_of(whitespace);
  return std::string(text.substr(first, last - first + 1));
}

inline std::string replaceAll(std::string_view text, std::string_view from,
                              std::string_view to) {
  std::string result;
  result.reserve(text.size());
  std::string_view::size_type pos = 0;
  while (true) {
    const auto hit = text.find(from, pos);
    if (hit == std::string_view::npos) {
      result.append(text.substr(pos));
      return result;
    }
    result.append(text.substr(pos, hit - pos));
    result.append(to);
    pos = hit + from.size();
  }
}

// Removes every "ESC[<digits>m" sequence. Any other escape sequence, or an
// unterminated one, is copied through unchanged.
inline std::string stripAnsi(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  std::string_view::size_type i = 0;
  while (i < text.size()) {
    if (text[i] == '\x1B' && i + 1 < text.size() && text[i + 1] == '[') {
      auto j = i + 2;
      while (j < text.size() && text[j] >= '0' && text[j] <= '9')
        ++j;
      if (j > i + 2 && j < text.size() && text[j] == 'm') {
        i = j + 1;
        continue;
      }
    }
    result.push_back(text[i]);
    ++i;
  }
  return result;
}

} // namespace tracer::details
