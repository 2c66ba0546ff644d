#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "TestUtil.hpp"
#include "tracer/FilterChain.hpp"

using namespace tracer;
using tracer::test::makeEvent;

TEST(FilterChainTest, EmptyChainAcceptsEverything) {
  const FilterChain chain;
  EXPECT_TRUE(chain.evaluate(makeEvent(Level::Debug, "anything")));
}

TEST(FilterChainTest, EvaluatesInOrderUntilFirstRejection) {
  std::vector<std::string> calls;
  FilterChain chain;
  chain
      .add([&](const Event &) {
        calls.push_back("f1");
        return true;
      })
      .add([&](const Event &) {
        calls.push_back("f2");
        return false;
      })
      .add([&](const Event &) {
        calls.push_back("f3");
        return true;
      });

  EXPECT_FALSE(chain.evaluate(makeEvent(Level::Info, "x")));
  EXPECT_EQ(calls, (std::vector<std::string>{"f1", "f2"}));
}

TEST(FilterChainTest, BuiltInFilters) {
  const FilterChain chain{{filters::MinimumLevel(Level::Warn),
                           filters::BodyContains("disk")}};
  EXPECT_TRUE(chain.evaluate(makeEvent(Level::Error, "disk full")));
  EXPECT_FALSE(chain.evaluate(makeEvent(Level::Info, "disk full")));
  EXPECT_FALSE(chain.evaluate(makeEvent(Level::Fatal, "cpu hot")));
  EXPECT_EQ(chain.size(), 2u);
}
