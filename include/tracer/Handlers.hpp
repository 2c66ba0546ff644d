// Ready-made handlers writing the rendered text of an event to the console
// or to files. They never re-format: each writes generatedMessage() or
// generatedMessageColored() followed by a newline.

#pragma once

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "Errors.hpp"
#include "Event.hpp"
#include "Handler.hpp"
#include "Renderer.hpp"
#include "details/NativeFileHandleWrapper.hpp"

namespace tracer {

// Writes every event to standard output, or to standard error for levels
// flagged useStderr when `useStderr` is enabled. Each line is flushed
// immediately so output from different streams stays in order.
class ConsoleHandler : public Handler {
public:
  explicit ConsoleHandler(bool useColors = true, bool useStderr = false)
      : m_useColors{useColors}, m_useStderr{useStderr} {}

  void handle(const Event &event) override {
    const std::string text = m_useColors ? generatedMessageColored(event)
                                         : generatedMessage(event);
    std::FILE *stream =
        (m_useStderr && levelUsesStderr(event.m_level)) ? stderr : stdout;

    std::lock_guard l{m_mutex};
    std::fwrite(text.data(), 1, text.size(), stream);
    std::fwrite("\n", 1, 1, stream);
    std::fflush(stream);
  }

  [[nodiscard]] bool usesColors() const { return m_useColors; }
  [[nodiscard]] bool usesStderr() const { return m_useStderr; }

private:
  std::mutex m_mutex;
  const bool m_useColors;
  const bool m_useStderr;
};

// Bare "level> body" lines on standard output, e.g. "warn > disk low".
class SimpleConsoleHandler : public Handler {
public:
  void handle(const Event &event) override {
    std::string line;
    for (const char c : levelToString(event.m_level))
      line.push_back(
          static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (line.size() < details::levelNameWidth)
      line.append(details::levelNameWidth - line.size(), ' ');
    line += "> ";
    line += event.m_body;
    line += '\n';

    std::lock_guard l{m_mutex};
    std::fwrite(line.data(), 1, line.size(), stdout);
    std::fflush(stdout);
  }

private:
  std::mutex m_mutex;
};

struct FileOptions {
  // false truncates the file when the handler opens it.
  bool append{true};
  // Hold an exclusive OS lock on the file until dispose.
  bool lock{false};
};

// Keeps a single file open (and optionally locked) for its whole lifetime.
class FileHandler : public Handler {
public:
  explicit FileHandler(std::filesystem::path filePath, FileOptions options = {})
      : m_filePath{std::move(filePath)}, m_options{options} {
    if (m_filePath.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(m_filePath.parent_path(), ec);
      if (ec)
        throw ResourceError("FileHandler: Failed to create directory " +
                            m_filePath.parent_path().string() + " (" +
                            ec.message() + ")");
    }
    m_file = details::ScopedFile{
        m_filePath,
        m_options.append ? details::OpenMode::Append
                         : details::OpenMode::Truncate,
        m_options.lock};
  }

  void handle(const Event &event) override {
    const std::string text = generatedMessage(event);
    std::lock_guard l{m_mutex};
    m_file.writeLine(text);
  }

  [[nodiscard]] const std::filesystem::path &path() const { return m_filePath; }

  [[nodiscard]] bool isLocked() const {
    std::lock_guard l{m_mutex};
    return m_file.isLocked();
  }

protected:
  void onDispose() noexcept override {
    std::lock_guard l{m_mutex};
    m_file.reset();
  }

private:
  mutable std::mutex m_mutex;
  const std::filesystem::path m_filePath;
  const FileOptions m_options;
  details::ScopedFile m_file;
};

struct DirectoryFileOptions {
  // false wipes the target file once, on the first handled event.
  bool append{true};
  // false prefixes the file name with "<section>.".
  bool shareFile{true};
  // true names files "yyyy-MM-dd.log" after the event date, else "latest.log".
  bool useDate{true};
  // Replaces the computed name entirely.
  std::optional<std::string> customName{};
  // Lock each file while writing to it.
  bool lock{false};
};

// Writes into a directory, one file per calendar day or a fixed file. The
// target is reopened per event so day boundaries are picked up.
class DirectoryFileHandler : public Handler {
public:
  explicit DirectoryFileHandler(std::filesystem::path directory,
                                DirectoryFileOptions options = {})
      : m_directory{std::move(directory)}, m_options{std::move(options)} {
    // A shared file is only ever appended to.
    if (m_options.shareFile && !m_options.append)
      throw ConfigurationError(
          "DirectoryFileHandler: append=false requires shareFile=false");

    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);
    if (ec)
      throw ResourceError("DirectoryFileHandler: Failed to create directory " +
                          m_directory.string() + " (" + ec.message() + ")");
  }

  [[nodiscard]] std::string fileNameFor(const Event &event) const {
    if (m_options.customName)
      return *m_options.customName;

    std::string name = m_options.useDate
                           ? formatDate(event.m_timestamp) + ".log"
                           : std::string("latest.log");
    if (!m_options.shareFile)
      name = event.m_section + "." + name;
    return name;
  }

  void handle(const Event &event) override {
    const std::string text = generatedMessage(event);
    const std::filesystem::path target = m_directory / fileNameFor(event);

    std::lock_guard l{m_mutex};
    const details::OpenMode mode = (!m_handledOverwrite && !m_options.append)
                                       ? details::OpenMode::Truncate
                                       : details::OpenMode::Append;
    details::ScopedFile file{target, mode, m_options.lock};
    m_handledOverwrite = true;
    file.writeLine(text);
  }

  [[nodiscard]] const std::filesystem::path &directory() const {
    return m_directory;
  }

private:
  std::mutex m_mutex;
  const std::filesystem::path m_directory;
  const DirectoryFileOptions m_options;
  bool m_handledOverwrite{false};
};

namespace handlers {

inline auto Console(bool useColors = true, bool useStderr = false) {
  return std::make_shared<ConsoleHandler>(useColors, useStderr);
}

inline auto SimpleConsole() { return std::make_shared<SimpleConsoleHandler>(); }

inline auto File(std::filesystem::path filePath, FileOptions options = {}) {
  return std::make_shared<FileHandler>(std::move(filePath), options);
}

inline auto Directory(std::filesystem::path directory,
                      DirectoryFileOptions options = {}) {
  return std::make_shared<DirectoryFileHandler>(std::move(directory),
                                                std::move(options));
}

} // namespace handlers

} // namespace tracer
