// Ordered predicates evaluated before an event is recorded or delivered.
#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "Event.hpp"
#include "Handler.hpp"

namespace tracer {

class FilterChain {
public:
  FilterChain() = default;
  explicit FilterChain(std::vector<Filter> filters)
      : m_filters(std::move(filters)) {}

  FilterChain &add(Filter filter) {
    m_filters.push_back(std::move(filter));
    return *this;
  }

  // True if every filter accepts `event`. Stops at the first rejection, so
  // later filters never see a rejected event. An empty chain accepts all.
  [[nodiscard]] bool evaluate(const Event &event) const {
    for (const auto &filter : m_filters) {
      if (!filter(event))
        return false;
    }
    return true;
  }

  [[nodiscard]] std::size_t size() const { return m_filters.size(); }
  [[nodiscard]] bool empty() const { return m_filters.empty(); }

private:
  std::vector<Filter> m_filters;
};

} // namespace tracer
