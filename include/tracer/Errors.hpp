// Exception types thrown by the tracer core and its handlers.
#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tracer {

// Invalid setup: bad section identifier, double attach, attaching to a
// disposed logger or contradicting handler options.
class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// A backing file could not be opened, locked or written.
class ResourceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// One or more handlers threw while an event was being dispatched. Every
// handler still received the event; the original exceptions are kept in
// registration order.
class DeliveryError : public std::runtime_error {
public:
  struct Failure {
    std::size_t m_handlerIndex;
    std::exception_ptr m_exception;
    std::string m_message;
  };

  explicit DeliveryError(std::vector<Failure> failures)
      : std::runtime_error(describe(failures)),
        m_failures(std::move(failures)) {}

  [[nodiscard]] const std::vector<Failure> &failures() const {
    return m_failures;
  }

  // Rethrows the first handler exception, for callers that only care about
  // the underlying cause.
  [[noreturn]] void rethrowFirst() const {
    std::rethrow_exception(m_failures.front().m_exception);
  }

private:
  static std::string describe(const std::vector<Failure> &failures) {
    std::string message = "DeliveryError: " +
                          std::to_string(failures.size()) +
                          " handler(s) failed";
    if (failures.empty())
      return message;

    message += " (first at index " +
               std::to_string(failures.front().m_handlerIndex) +
               "): " + failures.front().m_message;
    return message;
  }

  std::vector<Failure> m_failures;
};

} // namespace tracer
