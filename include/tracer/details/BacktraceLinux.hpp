// glibc stack capture (header-only)
#pragma once

#if defined(_WIN32)
#error "BacktraceLinux.hpp included on Windows platform"
#endif

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <cxxabi.h>
#include <execinfo.h>

namespace tracer::details {

struct CapturedFrame {
  std::string location;
  std::string member;
};

inline std::string demangle(const std::string &symbol) {
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled{
      abi::__cxa_demangle(symbol.c_str(), nullptr, nullptr, &status),
      std::free};
  return (status == 0 && demangled) ? std::string(demangled.get()) : symbol;
}

// Splits a backtrace_symbols() line, "binary(symbol+0x1a) [0x4005d4]", into
// the binary plus address and the demangled symbol.
inline CapturedFrame splitSymbolLine(const std::string &line) {
  const auto open = line.find('(');
  const auto close = line.find(')', open == std::string::npos ? 0 : open);
  if (open == std::string::npos || close == std::string::npos)
    return {line, ""};

  std::string symbol = line.substr(open + 1, close - open - 1);
  if (const auto plus = symbol.find('+'); plus != std::string::npos)
    symbol.erase(plus);

  std::string location = line.substr(0, open);
  if (const auto bracket = line.find('[', close); bracket != std::string::npos)
    location += " " + line.substr(bracket);

  return {std::move(location), symbol.empty() ? "" : demangle(symbol)};
}

inline std::vector<CapturedFrame> captureFrames(std::size_t skip,
                                                std::size_t maxFrames = 64) {
  std::vector<void *> addresses(maxFrames + skip + 1);
  const int count = ::backtrace(addresses.data(),
                                static_cast<int>(addresses.size()));
  if (count <= 0)
    return {};

  std::unique_ptr<char *, void (*)(void *)> symbols{
      ::backtrace_symbols(addresses.data(), count), std::free};
  if (!symbols)
    return {};

  std::vector<CapturedFrame> frames;
  // Frame 0 is captureFrames itself.
  for (int i = static_cast<int>(skip) + 1; i < count; ++i)
    frames.push_back(splitSymbolLine(symbols.get()[i]));
  return frames;
}

} // namespace tracer::details
