// Ordered collection of attached handlers and the synchronous broadcast
// over them. Not synchronized on its own; the owning Logger serializes
// access.
#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "Event.hpp"
#include "Handler.hpp"

namespace tracer {

class HandlerRegistry {
public:
  HandlerRegistry() = default;
  HandlerRegistry(const HandlerRegistry &) = delete;
  HandlerRegistry &operator=(const HandlerRegistry &) = delete;

  ~HandlerRegistry() { disposeAll(); }

  // Appends `handler`. Throws ConfigurationError if it is null, disposed,
  // already attached anywhere, or if this registry has been closed.
  void attach(std::shared_ptr<Handler> handler) {
    if (!handler)
      throw ConfigurationError("HandlerRegistry: cannot attach a null handler");
    if (m_closed)
      throw ConfigurationError(
          "HandlerRegistry: cannot attach to a disposed logger");
    if (handler->isDisposed())
      throw ConfigurationError(
          "HandlerRegistry: cannot attach a disposed handler");

    const HandlerRegistry *expected = nullptr;
    if (!handler->m_owner.compare_exchange_strong(expected, this))
      throw ConfigurationError("HandlerRegistry: handler is already attached" +
                               std::string(expected == this
                                               ? " to this logger"
                                               : " to another logger"));

    m_handlers.push_back(std::move(handler));
  }

  // Attaches all of `handlers` or none of them. When one is rejected, the
  // ones this call already took are handed back undisposed and the
  // ConfigurationError propagates.
  void attachAll(std::vector<std::shared_ptr<Handler>> handlers) {
    const std::size_t before = m_handlers.size();
    try {
      for (auto &handler : handlers)
        attach(std::move(handler));
    } catch (const ConfigurationError &) {
      while (m_handlers.size() > before) {
        m_handlers.back()->m_owner.store(nullptr);
        m_handlers.pop_back();
      }
      throw;
    }
  }

  // Disposes and removes `handler`. Returns false, without error, when it is
  // not attached here.
  bool detach(const Handler *handler) {
    const auto it = std::ranges::find_if(
        m_handlers, [handler](const auto &h) { return h.get() == handler; });
    if (it == m_handlers.end())
      return false;
    return detachAt(static_cast<std::size_t>(it - m_handlers.begin()));
  }

  bool detach(const std::shared_ptr<Handler> &handler) {
    return detach(handler.get());
  }

  // Out-of-range indices are ignored so a racing removal is harmless.
  bool detachAt(std::size_t index) {
    if (index >= m_handlers.size())
      return false;

    std::shared_ptr<Handler> handler = std::move(m_handlers[index]);
    m_handlers.erase(m_handlers.begin() +
                     static_cast<std::ptrdiff_t>(index));
    release(*handler);
    return true;
  }

  // Delivers `event` to every handler in attachment order on the calling
  // thread. A throwing handler does not stop the ones after it; all
  // failures are reported together as a DeliveryError afterwards. Does
  // nothing once the registry is closed.
  void dispatch(const Event &event) {
    if (m_closed)
      return;

    // Detaching from inside a handler only takes effect for the next event.
    const std::vector<std::shared_ptr<Handler>> snapshot = m_handlers;

    std::vector<DeliveryError::Failure> failures;
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
      try {
        snapshot[i]->handle(event);
      } catch (const std::exception &e) {
        failures.push_back({i, std::current_exception(), e.what()});
      } catch (...) {
        failures.push_back({i, std::current_exception(), "unknown exception"});
      }
    }

    if (!failures.empty())
      throw DeliveryError(std::move(failures));
  }

  // Disposes and detaches every handler, then closes the registry for good.
  void disposeAll() noexcept {
    std::vector<std::shared_ptr<Handler>> handlers;
    handlers.swap(m_handlers);
    for (const auto &handler : handlers)
      release(*handler);
    m_closed = true;
  }

  [[nodiscard]] std::vector<std::shared_ptr<Handler>> handlers() const {
    return m_handlers;
  }

  [[nodiscard]] std::size_t size() const { return m_handlers.size(); }
  [[nodiscard]] bool empty() const { return m_handlers.empty(); }
  [[nodiscard]] bool isClosed() const { return m_closed; }

private:
  static void release(Handler &handler) noexcept {
    handler.dispose();
    handler.m_owner.store(nullptr);
  }

  std::vector<std::shared_ptr<Handler>> m_handlers;
  bool m_closed{false};
};

} // namespace tracer
