// The session object of the library. A Logger owns one named section: it
// builds events for the five severity calls, gates them by level and by its
// filters, records the accepted ones and broadcasts them to its handlers.
#pragma once

#include <atomic>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Config.hpp"
#include "Errors.hpp"
#include "Event.hpp"
#include "FilterChain.hpp"
#include "Handler.hpp"
#include "HandlerRegistry.hpp"
#include "Renderer.hpp"
#include "StackTrace.hpp"
#include "Types.hpp"
#include "details/StringUtil.hpp"

namespace tracer {

// A section is an identifier: [A-Za-z_][A-Za-z0-9_]*
inline std::expected<void, std::string> validateSection(std::string_view section) {
  if (section.empty())
    return std::unexpected{std::string("Section must not be empty.")};

  const auto isWordChar = [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
  };
  if (section.front() >= '0' && section.front() <= '9')
    return std::unexpected{"Section '" + std::string(section) +
                           "' must not start with a digit."};
  for (const char c : section) {
    if (!isWordChar(c))
      return std::unexpected{"Section '" + std::string(section) +
                             "' may only contain letters, digits and '_'."};
  }
  return {};
}

class Logger {
public:
  // Throws ConfigurationError if the trimmed section is not an identifier or
  // if one of `handlers` cannot be attached. In that case none of `handlers`
  // is attached or disposed.
  explicit Logger(const std::string &section, LoggerConfig config = {},
                  std::vector<std::shared_ptr<Handler>> handlers = {},
                  std::vector<Filter> filters = {})
      : m_section{checkedSection(section)}, m_level{config.minLevel},
        m_indentation{config.indentation}, m_timeType{config.timeType},
        m_filters{std::move(filters)} {
    m_registry.attachAll(std::move(handlers));
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  ~Logger() { dispose(); }

  void debug(const std::string &body,
             std::optional<std::string> description = std::nullopt) {
    log(Level::Debug, body, std::move(description));
  }

  void info(const std::string &body,
            std::optional<std::string> description = std::nullopt) {
    log(Level::Info, body, std::move(description));
  }

  void warn(const std::string &body,
            std::optional<std::string> description = std::nullopt,
            std::optional<ErrorValue> error = std::nullopt,
            std::optional<StackTrace> stack = std::nullopt) {
    log(Level::Warn, body, std::move(description), std::move(error),
        std::move(stack));
  }

  void error(const std::string &body,
             std::optional<std::string> description = std::nullopt,
             std::optional<ErrorValue> error = std::nullopt,
             std::optional<StackTrace> stack = std::nullopt) {
    log(Level::Error, body, std::move(description), std::move(error),
        std::move(stack));
  }

  void fatal(const std::string &body,
             std::optional<std::string> description = std::nullopt,
             std::optional<ErrorValue> error = std::nullopt,
             std::optional<StackTrace> stack = std::nullopt) {
    log(Level::Fatal, body, std::move(description), std::move(error),
        std::move(stack));
  }

  // Shared path of the severity calls. Dropped events (below the minimum
  // level, rejected by a filter, or logged after dispose) leave no trace.
  // Handler failures surface as DeliveryError once all handlers ran.
  void log(Level level, const std::string &body,
           std::optional<std::string> description = std::nullopt,
           std::optional<ErrorValue> error = std::nullopt,
           std::optional<StackTrace> stack = std::nullopt) {
    std::lock_guard l{m_mutex};
    if (m_disposed)
      return;

    const Event event{m_section,
                      level,
                      Timestamp::now(m_timeType),
                      body,
                      std::move(description),
                      std::move(error),
                      std::move(stack),
                      m_indentation.load()};

    if (!isAtLeast(event.m_level, m_level.load()))
      return;

    if (!m_filters.evaluate(event))
      return;

    m_logs.push_back(event);
    m_logsGenerated += generatedMessage(event);
    m_logsGenerated += '\n';

    m_registry.dispatch(event);
  }

  Logger &attach(std::shared_ptr<Handler> handler) {
    std::lock_guard l{m_mutex};
    m_registry.attach(std::move(handler));
    return *this;
  }

  bool detach(const std::shared_ptr<Handler> &handler) {
    std::lock_guard l{m_mutex};
    return m_registry.detach(handler);
  }

  bool detachAt(std::size_t index) {
    std::lock_guard l{m_mutex};
    return m_registry.detachAt(index);
  }

  // Subscribes a bare callback. The returned handler is the token for
  // ignore().
  std::shared_ptr<CallbackHandler> listen(CallbackHandler::Callback callback) {
    auto handler = handlers::Callback(std::move(callback));
    attach(handler);
    return handler;
  }

  bool ignore(const std::shared_ptr<Handler> &handler) {
    return detach(handler);
  }

  Logger &addFilter(Filter filter) {
    std::lock_guard l{m_mutex};
    m_filters.add(std::move(filter));
    return *this;
  }

  Logger &setLogLevel(Level level) {
    m_level = level;
    return *this;
  }

  Logger &setIndentation(bool indentation) {
    m_indentation = indentation;
    return *this;
  }

  // Disposes and detaches every handler. Further log calls are ignored and
  // attach() throws. Safe to call more than once.
  void dispose() noexcept {
    std::lock_guard l{m_mutex};
    if (m_disposed)
      return;
    m_registry.disposeAll();
    m_disposed = true;
  }

  [[nodiscard]] bool isDisposed() const {
    std::lock_guard l{m_mutex};
    return m_disposed;
  }

  [[nodiscard]] const std::string &getSection() const {
    // Thread-safe, as it's access to immutable member variable
    return m_section;
  }

  [[nodiscard]] Level getLogLevel() const { return m_level; }
  [[nodiscard]] bool getIndentation() const { return m_indentation; }
  [[nodiscard]] TimeType getTimeType() const { return m_timeType; }
  [[nodiscard]] bool isUtcForced() const { return m_timeType == TimeType::Utc; }

  [[nodiscard]] std::vector<std::shared_ptr<Handler>> getHandlers() const {
    std::lock_guard l{m_mutex};
    return m_registry.handlers();
  }

  [[nodiscard]] std::size_t getFilterCount() const {
    std::lock_guard l{m_mutex};
    return m_filters.size();
  }

  // Every accepted event of this session, oldest first.
  [[nodiscard]] std::vector<Event> logs() const {
    std::lock_guard l{m_mutex};
    return m_logs;
  }

  // Plain rendering of logs(), one event per line group, each ending in '\n'.
  [[nodiscard]] std::string logsGenerated() const {
    std::lock_guard l{m_mutex};
    return m_logsGenerated;
  }

private:
  static std::string checkedSection(const std::string &section) {
    std::string trimmed = details::trim(section);
    if (auto valid = validateSection(trimmed); !valid)
      throw ConfigurationError("Logger: " + valid.error());
    return trimmed;
  }

  // Recursive so a handler may log through the logger that is calling it.
  mutable std::recursive_mutex m_mutex;

  const std::string m_section;
  std::atomic<Level> m_level;
  std::atomic<bool> m_indentation;
  const TimeType m_timeType;

  FilterChain m_filters;
  HandlerRegistry m_registry;

  std::vector<Event> m_logs;
  std::string m_logsGenerated;
  bool m_disposed{false};
};

} // namespace tracer
