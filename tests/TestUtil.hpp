// Shared fixtures for the tracer tests.
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "tracer/Event.hpp"
#include "tracer/Handler.hpp"

namespace tracer::test {

// 2024-03-05 12:07:09 UTC
inline constexpr std::int64_t fixedEpochSeconds = 1709640429;

inline Timestamp fixedTimestamp(int offsetMinutes = 0) {
  return Timestamp{std::chrono::system_clock::time_point{
                       std::chrono::seconds{fixedEpochSeconds}},
                   offsetMinutes};
}

inline Event makeEvent(Level level, const std::string &body,
                       std::optional<std::string> description = {},
                       std::optional<ErrorValue> error = {},
                       std::optional<StackTrace> stack = {},
                       bool indentation = true, int offsetMinutes = 0) {
  return Event{"svc",
               level,
               fixedTimestamp(offsetMinutes),
               body,
               std::move(description),
               std::move(error),
               std::move(stack),
               indentation};
}

// Records every delivered body and dispose call.
class RecordingHandler : public Handler {
public:
  explicit RecordingHandler(std::vector<std::string> *journal = nullptr,
                            std::string name = {})
      : m_journal{journal}, m_name{std::move(name)} {}

  void handle(const Event &event) override {
    m_bodies.push_back(event.m_body);
    if (m_journal)
      m_journal->push_back(m_name + ":" + event.m_body);
  }

  std::vector<std::string> m_bodies;
  int m_disposeCount{0};

protected:
  void onDispose() noexcept override { ++m_disposeCount; }

private:
  std::vector<std::string> *m_journal;
  std::string m_name;
};

class ThrowingHandler : public Handler {
public:
  void handle(const Event &event) override {
    throw std::runtime_error("handler failed on " + event.m_body);
  }
};

inline std::string readFile(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

// Fresh scratch directory under the system temp dir, removed on destruction.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    m_path = std::filesystem::temp_directory_path() /
             ("tracer_test_" + std::to_string(rd()) + std::to_string(rd()));
    std::filesystem::create_directories(m_path);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
  }

  [[nodiscard]] const std::filesystem::path &path() const { return m_path; }

private:
  std::filesystem::path m_path;
};

} // namespace tracer::test
