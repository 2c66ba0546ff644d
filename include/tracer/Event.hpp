// The immutable value describing one log occurrence, plus the timestamp and
// error types it carries.
#pragma once

#include <chrono>
#include <ctime>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "StackTrace.hpp"
#include "Types.hpp"
#include "details/StringUtil.hpp"
#include "details/Clock.hpp"

namespace tracer {

// A point in time together with the UTC offset it is to be displayed in.
struct Timestamp {
  std::chrono::system_clock::time_point m_timePoint{};
  int m_utcOffsetMinutes{0};

  static Timestamp now(TimeType timeType) {
    const auto tp = std::chrono::system_clock::now();
    if (timeType == TimeType::Utc)
      return {tp, 0};
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    return {tp, details::localOffsetMinutes(t)};
  }

  // Wall-clock fields as seen at m_utcOffsetMinutes. Independent of the
  // process time zone, so rendering is deterministic.
  [[nodiscard]] std::tm wallClock() const {
    const std::time_t t = std::chrono::system_clock::to_time_t(m_timePoint) +
                          static_cast<std::time_t>(m_utcOffsetMinutes) * 60;
    return details::utcFields(t);
  }
};

// Opaque error attachment. The core only ever looks at its text.
class ErrorValue {
public:
  template <typename E>
    requires std::is_base_of_v<std::exception, std::decay_t<E>>
  ErrorValue(E &&error) : m_text(error.what()) {
    using Stored = std::decay_t<E>;
    // A base-class reference to a derived exception would be sliced by a
    // copy; keep the in-flight exception instead when there is one.
    if (typeid(error) == typeid(Stored))
      m_exception = std::make_shared<Stored>(std::forward<E>(error));
    else
      m_pointer = std::current_exception();
  }

  ErrorValue(std::exception_ptr error) : m_pointer(std::move(error)) {
    if (!m_pointer)
      return;
    try {
      std::rethrow_exception(m_pointer);
    } catch (const std::exception &e) {
      m_text = e.what();
    } catch (const std::string &s) {
      m_text = s;
    } catch (const char *s) {
      m_text = s;
    } catch (...) {
      m_text = "unknown exception";
    }
  }

  ErrorValue(std::string message) : m_text(std::move(message)) {}
  ErrorValue(const char *message) : m_text(message) {}

  [[nodiscard]] const std::string &text() const { return m_text; }

  // The attached std::exception, if the value was built from one of its
  // exact dynamic type. Otherwise see pointer().
  [[nodiscard]] const std::exception *exception() const {
    return m_exception.get();
  }

  [[nodiscard]] const std::exception_ptr &pointer() const { return m_pointer; }

private:
  std::shared_ptr<const std::exception> m_exception;
  std::exception_ptr m_pointer;
  std::string m_text;
};

struct Event {
  Event(std::string section, Level level, Timestamp timestamp,
        const std::string &body, std::optional<std::string> description = {},
        std::optional<ErrorValue> error = {},
        std::optional<StackTrace> stack = {}, bool indentation = true)
      : m_section{std::move(section)}, m_level{level},
        m_timestamp{timestamp}, m_body{details::trim(body)},
        m_description{description ? std::optional<std::string>(
                                        details::trim(*description))
                                  : std::nullopt},
        m_error{std::move(error)}, m_stack{std::move(stack)},
        m_indentation{indentation} {}

  const std::string m_section;
  const Level m_level;
  const Timestamp m_timestamp;
  const std::string m_body;
  const std::optional<std::string> m_description;
  const std::optional<ErrorValue> m_error;
  const std::optional<StackTrace> m_stack;
  // Only affects rendering: continuation lines align under the timestamp.
  const bool m_indentation;
};

} // namespace tracer
