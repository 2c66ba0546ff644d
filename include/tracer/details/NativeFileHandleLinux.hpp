// POSIX native file handle implementation (header-only)
#pragma once

#if defined(_WIN32)
#error "NativeFileHandleLinux included on Windows platform"
#endif

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/uio.h>
#include <unistd.h>

#include "tracer/Errors.hpp"

namespace tracer::details {

enum class OpenMode { Append, Truncate };

struct NativeFile {
  int fd{-1};
};

inline std::string errnoMessage() { return std::strerror(errno); }

inline NativeFile open_native(const std::filesystem::path &p, OpenMode mode) {
  int flags = O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC;
  if (mode == OpenMode::Truncate)
    flags |= O_TRUNC;

  NativeFile nf{};
  do {
    nf.fd = ::open(p.string().c_str(), flags, 0644);
  } while (nf.fd == -1 && errno == EINTR);
  return nf;
}

inline bool valid(const NativeFile &nf) { return nf.fd != -1; }

// Non-blocking exclusive advisory lock. Returns false if another open file
// description already holds it.
inline bool lock_exclusive(NativeFile &nf) {
  int rc;
  do {
    rc = ::flock(nf.fd, LOCK_EX | LOCK_NB);
  } while (rc == -1 && errno == EINTR);
  return rc == 0;
}

inline void unlock(NativeFile &nf) {
  if (nf.fd != -1)
    ::flock(nf.fd, LOCK_UN);
}

inline void close_native(NativeFile &nf) {
  if (nf.fd != -1) {
    ::close(nf.fd);
    nf.fd = -1;
  }
}

inline void write_bytes(NativeFile &nf, const char *data, std::size_t len) {
  std::size_t total = 0;
  while (total < len) {
    ssize_t written = ::write(nf.fd, data + total, len - total);
    if (written < 0) {
      if (errno == EINTR)
        continue;
      throw ResourceError("FileHandler: write failed: " + errnoMessage());
    }
    if (written == 0)
      throw ResourceError("FileHandler: write returned 0");
    total += static_cast<std::size_t>(written);
  }
}

// Appends message + '\n' with a single writev where possible, so lines from
// concurrent writers to an O_APPEND file do not interleave.
inline void write_line(NativeFile &nf, const char *data, std::size_t len) {
  struct iovec vec[2]{{const_cast<char *>(data), len},
                      {const_cast<char *>("\n"), 1}};
  const std::size_t expected = len + 1;
  ssize_t written;
  do {
    written = ::writev(nf.fd, vec, 2);
  } while (written < 0 && errno == EINTR);

  if (written < 0)
    throw ResourceError("FileHandler: writev failed: " + errnoMessage());

  const std::size_t done = static_cast<std::size_t>(written);
  if (done == expected)
    return;

  // Partial write: finish the remainder of the message, then the newline.
  if (done < len)
    write_bytes(nf, data + done, len - done);
  write_bytes(nf, "\n", 1);
}

} // namespace tracer::details
