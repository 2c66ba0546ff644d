// Capabilities plugged into a Logger: handlers receive accepted events,
// filters decide beforehand whether an event is accepted at all.
#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "Event.hpp"

namespace tracer {

// Returns false to drop the event. Filters run in registration order and
// the first false stops the chain.
using Filter = std::function<bool(const Event &)>;

class HandlerRegistry;

// A unit of delivery. An instance may be attached to at most one registry
// at a time; the registry records itself as the owner on attach.
class Handler {
  friend class tracer::HandlerRegistry;

public:
  Handler() = default;
  Handler(const Handler &) = delete;
  Handler &operator=(const Handler &) = delete;
  virtual ~Handler() = default;

  virtual void handle(const Event &event) = 0;

  // Releases whatever the handler holds. Runs onDispose() at most once;
  // later calls do nothing.
  void dispose() noexcept {
    if (m_disposed.exchange(true))
      return;
    onDispose();
  }

  [[nodiscard]] bool isAttached() const { return m_owner.load() != nullptr; }
  [[nodiscard]] bool isDisposed() const { return m_disposed.load(); }

protected:
  virtual void onDispose() noexcept {}

private:
  std::atomic<const HandlerRegistry *> m_owner{nullptr};
  std::atomic<bool> m_disposed{false};
};

// Handler built from closures, for callers that do not want a subclass.
class CallbackHandler : public Handler {
public:
  using Callback = std::function<void(const Event &)>;
  using DisposeCallback = std::function<void()>;

  explicit CallbackHandler(Callback callback, DisposeCallback onDispose = {})
      : m_callback(std::move(callback)), m_onDispose(std::move(onDispose)) {}

  void handle(const Event &event) override {
    if (m_callback)
      m_callback(event);
  }

protected:
  void onDispose() noexcept override {
    if (!m_onDispose)
      return;
    try {
      m_onDispose();
    } catch (...) {
      // Dispose is best effort.
    }
  }

private:
  Callback m_callback;
  DisposeCallback m_onDispose;
};

namespace handlers {

inline auto Callback(CallbackHandler::Callback callback,
                     CallbackHandler::DisposeCallback onDispose = {}) {
  return std::make_shared<CallbackHandler>(std::move(callback),
                                           std::move(onDispose));
}

} // namespace handlers

namespace filters {

// Accepts events at or above `threshold`, independent of the logger minimum.
inline auto MinimumLevel(Level threshold) {
  return [threshold](const Event &event) {
    return isAtLeast(event.m_level, threshold);
  };
}

// Accepts events whose body contains `needle`.
inline auto BodyContains(std::string needle) {
  return [needle = std::move(needle)](const Event &event) {
    return event.m_body.find(needle) != std::string::npos;
  };
}

// Inverts another filter.
inline auto Not(Filter filter) {
  return [filter = std::move(filter)](const Event &event) {
    return !filter(event);
  };
}

} // namespace filters

} // namespace tracer
