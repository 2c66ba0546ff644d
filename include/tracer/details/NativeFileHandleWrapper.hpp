#pragma once

#if defined(_WIN32)
// Prevent Windows.h from defining min/max macros
#ifndef NOMINMAX
#define NOMINMAX
#endif
// Reduce size of Windows headers
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <tracer/details/NativeFileHandleWindows.hpp>

#elif defined(__linux__)
#include <tracer/details/NativeFileHandleLinux.hpp>

#else
#error "Unsupported platform for native file handle"
#endif

#include <filesystem>
#include <string>
#include <utility>

namespace tracer::details {

// Sole owner of an open native file and, optionally, its exclusive lock.
// Whatever was acquired is released on destruction, including when the
// constructor throws halfway through.
class ScopedFile {
public:
  ScopedFile() = default;

  ScopedFile(const std::filesystem::path &path, OpenMode mode, bool lock)
      : m_file{open_native(path, mode)} {
    if (!valid(m_file)) {
      throw ResourceError("FileHandler: Failed to open file " + path.string() +
                          " (" + errnoMessage() + ")");
    }
    if (lock) {
      if (!lock_exclusive(m_file)) {
        const std::string reason = errnoMessage();
        close_native(m_file);
        throw ResourceError("FileHandler: Failed to lock file " +
                            path.string() + " (" + reason + ")");
      }
      m_locked = true;
    }
  }

  ScopedFile(const ScopedFile &) = delete;
  ScopedFile &operator=(const ScopedFile &) = delete;

  ScopedFile(ScopedFile &&other) noexcept
      : m_file{std::exchange(other.m_file, NativeFile{})},
        m_locked{std::exchange(other.m_locked, false)} {}

  ScopedFile &operator=(ScopedFile &&other) noexcept {
    if (this != &other) {
      reset();
      m_file = std::exchange(other.m_file, NativeFile{});
      m_locked = std::exchange(other.m_locked, false);
    }
    return *this;
  }

  ~ScopedFile() { reset(); }

  void writeLine(const std::string &line) {
    if (!valid(m_file))
      throw ResourceError("FileHandler: write to closed file");
    write_line(m_file, line.data(), line.size());
  }

  // Best effort: unlock and close errors are not reported.
  void reset() noexcept {
    if (m_locked) {
      unlock(m_file);
      m_locked = false;
    }
    close_native(m_file);
  }

  [[nodiscard]] bool isOpen() const { return valid(m_file); }
  [[nodiscard]] bool isLocked() const { return m_locked; }

private:
  NativeFile m_file{};
  bool m_locked{false};
};

} // namespace tracer::details
