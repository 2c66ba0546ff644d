// Win32 stack capture (header-only). Symbol resolution needs DbgHelp and is
// left to the reader of the log; frames carry raw addresses only.
#pragma once

#ifndef _WIN32
#error "BacktraceWindows.hpp included on non-Windows platform"
#endif

#include <windows.h>

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace tracer::details {

struct CapturedFrame {
  std::string location;
  std::string member;
};

inline std::vector<CapturedFrame> captureFrames(std::size_t skip,
                                                std::size_t maxFrames = 64) {
  std::vector<void *> addresses(maxFrames);
  const USHORT count = ::CaptureStackBackTrace(
      static_cast<DWORD>(skip + 1), static_cast<DWORD>(addresses.size()),
      addresses.data(), nullptr);

  std::vector<CapturedFrame> frames;
  frames.reserve(count);
  for (USHORT i = 0; i < count; ++i) {
    char buffer[2 + sizeof(void *) * 2 + 1];
    std::snprintf(buffer, sizeof(buffer), "%p", addresses[i]);
    frames.push_back({buffer, ""});
  }
  return frames;
}

} // namespace tracer::details
