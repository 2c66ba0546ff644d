// Windows native file handle implementation (header-only)
#pragma once

#ifndef _WIN32
#error "NativeFileHandleWindows included on non-Windows platform"
#endif

#include <windows.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include "tracer/Errors.hpp"

namespace tracer::details {

enum class OpenMode { Append, Truncate };

struct NativeFile {
  HANDLE handle{INVALID_HANDLE_VALUE};
};

inline std::string errnoMessage() {
  return "error code " + std::to_string(::GetLastError());
}

inline NativeFile open_native(const std::filesystem::path &p, OpenMode mode) {
  NativeFile nf{};
  nf.handle = ::CreateFileW(
      p.wstring().c_str(), FILE_APPEND_DATA, FILE_SHARE_READ | FILE_SHARE_WRITE,
      nullptr, (mode == OpenMode::Truncate) ? CREATE_ALWAYS : OPEN_ALWAYS,
      FILE_ATTRIBUTE_NORMAL | FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
  return nf;
}

inline bool valid(const NativeFile &nf) {
  return nf.handle != INVALID_HANDLE_VALUE;
}

inline bool lock_exclusive(NativeFile &nf) {
  OVERLAPPED overlapped{};
  return ::LockFileEx(nf.handle,
                      LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY, 0,
                      MAXDWORD, MAXDWORD, &overlapped) != 0;
}

inline void unlock(NativeFile &nf) {
  if (nf.handle == INVALID_HANDLE_VALUE)
    return;
  OVERLAPPED overlapped{};
  ::UnlockFileEx(nf.handle, 0, MAXDWORD, MAXDWORD, &overlapped);
}

inline void close_native(NativeFile &nf) {
  if (nf.handle != INVALID_HANDLE_VALUE) {
    ::CloseHandle(nf.handle);
    nf.handle = INVALID_HANDLE_VALUE;
  }
}

inline void write_bytes(NativeFile &nf, const char *data, std::size_t len) {
  std::size_t total = 0;
  while (total < len) {
    DWORD written = 0;
    DWORD toWrite = static_cast<DWORD>(std::min<std::size_t>(
        len - total, static_cast<std::size_t>(UINT32_MAX)));
    if (!::WriteFile(nf.handle, data + total, toWrite, &written, nullptr)) {
      throw ResourceError("FileHandler: WriteFile failed: " + errnoMessage());
    }
    if (written == 0) {
      throw ResourceError("FileHandler: WriteFile wrote 0 bytes");
    }
    total += written;
  }
}

// Atomic append of message + '\n'. Build contiguous buffer safely.
inline void write_line(NativeFile &nf, const char *data, std::size_t len) {
  std::vector<char> tmp(len + 1);
  if (len)
    std::memcpy(tmp.data(), data, len);
  tmp[len] = '\n';
  write_bytes(nf, tmp.data(), tmp.size());
}

} // namespace tracer::details
